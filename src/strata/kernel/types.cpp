#include "types.h"

namespace strata
{
	namespace ledger
	{
		struct type_parser
		{
			std::string_view text;
			size_t offset = 0;
			size_t max_depth = 0;

			void skip_spaces()
			{
				while (offset < text.size() && isspace((uint8_t)text[offset]))
					++offset;
			}
			bool consume(const std::string_view& token)
			{
				skip_spaces();
				if (text.substr(offset, token.size()) != token)
					return false;

				offset += token.size();
				return true;
			}
			std::string_view identifier()
			{
				skip_spaces();
				size_t start = offset;
				while (offset < text.size() && (isalnum((uint8_t)text[offset]) || text[offset] == '_'))
					++offset;
				return text.substr(start, offset - start);
			}
			expects_vm<vector<type_tag>> arguments(size_t depth)
			{
				vector<type_tag> result;
				if (!consume("<"))
					return result;

				do
				{
					auto argument = next(depth + 1);
					if (!argument)
						return argument.error();

					result.push_back(std::move(*argument));
				} while (consume(","));
				if (!consume(">"))
					return vm_exception::type_mismatch(stringify::text("expected \">\" at offset %i", (int)offset));

				return result;
			}
			expects_vm<type_tag> next(size_t depth)
			{
				if (depth > max_depth)
					return vm_exception::type_too_deep(stringify::text("type nesting exceeds %i levels", (int)max_depth));

				auto name = identifier();
				if (name.empty())
					return vm_exception::type_mismatch(stringify::text("expected type at offset %i", (int)offset));
				else if (name == "bool")
					return type_tag::boolean();
				else if (name == "u8")
					return type_tag::u8();
				else if (name == "u64")
					return type_tag::u64();
				else if (name == "u128")
					return type_tag::u128();
				else if (name == "address")
					return type_tag::address();
				else if (name == "signer")
					return type_tag::signer();
				else if (name == "vector")
				{
					auto items = arguments(depth);
					if (!items)
						return items.error();
					else if (items->size() != 1)
						return vm_exception::type_arity_mismatch("vector takes exactly one type argument");

					return type_tag::vector_of(items->front());
				}
				else if (name.size() > 1 && name[0] == 'T' && name.substr(1).find_first_not_of("0123456789") == std::string::npos)
				{
					auto index = from_string<uint16_t>(name.substr(1), 10);
					if (!index)
						return vm_exception::type_mismatch(stringify::text("invalid type parameter \"%.*s\"", (int)name.size(), name.data()));

					return type_tag::parameter(*index);
				}

				auto address = algorithm::encoding::decode_address(name);
				if (!address || !stringify::starts_with(name, "0x"))
					return vm_exception::type_mismatch(stringify::text("unknown type \"%.*s\"", (int)name.size(), name.data()));
				else if (!consume("::"))
					return vm_exception::type_mismatch(stringify::text("expected \"::\" at offset %i", (int)offset));

				auto module_name = identifier();
				if (module_name.empty() || !consume("::"))
					return vm_exception::type_mismatch(stringify::text("expected module name at offset %i", (int)offset));

				auto struct_name = identifier();
				if (struct_name.empty())
					return vm_exception::type_mismatch(stringify::text("expected struct name at offset %i", (int)offset));

				auto items = arguments(depth);
				if (!items)
					return items.error();

				return type_tag::structure(module_id(*address, module_name), struct_name, std::move(*items));
			}
		};

		static string join_arguments(const vector<type_tag>& arguments)
		{
			if (arguments.empty())
				return string();

			string result = "<";
			for (size_t i = 0; i < arguments.size(); i++)
			{
				if (i > 0)
					result.append(", ");
				result.append(arguments[i].to_string());
			}
			result.append(1, '>');
			return result;
		}

		ability_set::ability_set(uint8_t new_bits) : bits(new_bits & 0x0f)
		{
		}
		ability_set::ability_set(std::initializer_list<ability> values)
		{
			for (auto& value : values)
				insert(value);
		}
		ability_set& ability_set::insert(ability value)
		{
			bits |= (uint8_t)value;
			return *this;
		}
		ability_set& ability_set::remove(ability value)
		{
			bits &= ~(uint8_t)value;
			return *this;
		}
		ability_set ability_set::intersect(const ability_set& other) const
		{
			return ability_set((uint8_t)(bits & other.bits));
		}
		bool ability_set::has(ability value) const
		{
			return (bits & (uint8_t)value) != 0;
		}
		bool ability_set::contains(const ability_set& other) const
		{
			return (bits & other.bits) == other.bits;
		}
		bool ability_set::empty() const
		{
			return bits == 0;
		}
		string ability_set::to_string() const
		{
			string result;
			for (auto value : { ability::copy, ability::drop, ability::store, ability::key })
			{
				if (!has(value))
					continue;

				if (!result.empty())
					result.append(", ");
				result.append(name_of(value));
			}
			return result;
		}
		bool ability_set::operator== (const ability_set& other) const
		{
			return bits == other.bits;
		}
		bool ability_set::operator!= (const ability_set& other) const
		{
			return bits != other.bits;
		}
		ability_set ability_set::all()
		{
			return ability_set({ ability::copy, ability::drop, ability::store, ability::key });
		}
		ability ability_set::requirement_of(ability value)
		{
			return value == ability::key ? ability::store : value;
		}
		std::string_view ability_set::name_of(ability value)
		{
			switch (value)
			{
				case ability::copy:
					return "copy";
				case ability::drop:
					return "drop";
				case ability::store:
					return "store";
				case ability::key:
					return "key";
				default:
					return "unknown";
			}
		}
		option<ability> ability_set::from_name(const std::string_view& name)
		{
			if (name == "copy")
				return ability::copy;
			else if (name == "drop")
				return ability::drop;
			else if (name == "store")
				return ability::store;
			else if (name == "key")
				return ability::key;
			return optional::none;
		}

		module_id::module_id(const algorithm::account_address& new_address, const std::string_view& new_name) : address(new_address), name(new_name)
		{
		}
		string module_id::to_string() const
		{
			return algorithm::encoding::encode_short_address(address).append("::").append(name);
		}
		string module_id::to_key() const
		{
			return string(address.view()).append(name);
		}
		bool module_id::operator== (const module_id& other) const
		{
			return address == other.address && name == other.name;
		}
		bool module_id::operator!= (const module_id& other) const
		{
			return !(*this == other);
		}
		bool module_id::operator< (const module_id& other) const
		{
			if (address != other.address)
				return address < other.address;

			return name < other.name;
		}

		type_tag::type_tag(type_kind new_kind) : kind(new_kind)
		{
		}
		const type_tag& type_tag::element() const
		{
			VI_ASSERT(kind == type_kind::vector && arguments.size() == 1, "type should be a vector");
			return arguments.front();
		}
		struct_tag type_tag::as_struct() const
		{
			VI_ASSERT(kind == type_kind::structure, "type should be a struct");
			return struct_tag(module, name, vector<type_tag>(arguments));
		}
		bool type_tag::is_primitive() const
		{
			switch (kind)
			{
				case type_kind::boolean:
				case type_kind::u8:
				case type_kind::u64:
				case type_kind::u128:
				case type_kind::address:
					return true;
				default:
					return false;
			}
		}
		bool type_tag::is_concrete() const
		{
			if (kind == type_kind::parameter)
				return false;

			for (auto& argument : arguments)
			{
				if (!argument.is_concrete())
					return false;
			}
			return true;
		}
		size_t type_tag::depth() const
		{
			size_t result = 0;
			for (auto& argument : arguments)
				result = std::max(result, argument.depth());
			return result + 1;
		}
		string type_tag::to_string() const
		{
			switch (kind)
			{
				case type_kind::boolean:
					return "bool";
				case type_kind::u8:
					return "u8";
				case type_kind::u64:
					return "u64";
				case type_kind::u128:
					return "u128";
				case type_kind::address:
					return "address";
				case type_kind::signer:
					return "signer";
				case type_kind::vector:
					return "vector" + join_arguments(arguments);
				case type_kind::structure:
					return module.to_string().append("::").append(name).append(join_arguments(arguments));
				case type_kind::parameter:
					return stringify::text("T%i", (int)index);
				default:
					return "unknown";
			}
		}
		bool type_tag::operator== (const type_tag& other) const
		{
			if (kind != other.kind)
				return false;

			switch (kind)
			{
				case type_kind::vector:
					return arguments == other.arguments;
				case type_kind::structure:
					return module == other.module && name == other.name && arguments == other.arguments;
				case type_kind::parameter:
					return index == other.index;
				default:
					return true;
			}
		}
		bool type_tag::operator!= (const type_tag& other) const
		{
			return !(*this == other);
		}
		bool type_tag::operator< (const type_tag& other) const
		{
			if (kind != other.kind)
				return kind < other.kind;
			else if (kind == type_kind::parameter)
				return index < other.index;
			else if (module != other.module)
				return module < other.module;
			else if (name != other.name)
				return name < other.name;

			return std::lexicographical_compare(arguments.begin(), arguments.end(), other.arguments.begin(), other.arguments.end());
		}
		type_tag type_tag::boolean()
		{
			return type_tag(type_kind::boolean);
		}
		type_tag type_tag::u8()
		{
			return type_tag(type_kind::u8);
		}
		type_tag type_tag::u64()
		{
			return type_tag(type_kind::u64);
		}
		type_tag type_tag::u128()
		{
			return type_tag(type_kind::u128);
		}
		type_tag type_tag::address()
		{
			return type_tag(type_kind::address);
		}
		type_tag type_tag::signer()
		{
			return type_tag(type_kind::signer);
		}
		type_tag type_tag::vector_of(const type_tag& element)
		{
			type_tag result = type_tag(type_kind::vector);
			result.arguments.push_back(element);
			return result;
		}
		type_tag type_tag::structure(const module_id& module, const std::string_view& name, vector<type_tag>&& arguments)
		{
			type_tag result = type_tag(type_kind::structure);
			result.module = module;
			result.name = name;
			result.arguments = std::move(arguments);
			return result;
		}
		type_tag type_tag::parameter(uint16_t index)
		{
			type_tag result = type_tag(type_kind::parameter);
			result.index = index;
			return result;
		}
		expects_vm<type_tag> type_tag::from_string(const std::string_view& text, size_t max_depth)
		{
			type_parser parser;
			parser.text = text;
			parser.max_depth = max_depth;

			auto result = parser.next(1);
			if (!result)
				return result.error();

			parser.skip_spaces();
			if (parser.offset != text.size())
				return vm_exception::type_mismatch(stringify::text("unexpected input at offset %i", (int)parser.offset));

			return result;
		}

		struct_tag::struct_tag(const module_id& new_module, const std::string_view& new_name, vector<type_tag>&& new_arguments) : module(new_module), name(new_name), arguments(std::move(new_arguments))
		{
		}
		type_tag struct_tag::as_type() const
		{
			return type_tag::structure(module, name, vector<type_tag>(arguments));
		}
		string struct_tag::to_string() const
		{
			return module.to_string().append("::").append(name).append(join_arguments(arguments));
		}
		bool struct_tag::operator== (const struct_tag& other) const
		{
			return module == other.module && name == other.name && arguments == other.arguments;
		}
		bool struct_tag::operator!= (const struct_tag& other) const
		{
			return !(*this == other);
		}
		bool struct_tag::operator< (const struct_tag& other) const
		{
			if (module != other.module)
				return module < other.module;
			else if (name != other.name)
				return name < other.name;

			return std::lexicographical_compare(arguments.begin(), arguments.end(), other.arguments.begin(), other.arguments.end());
		}

		option<size_t> struct_def::field_index(const std::string_view& field_name) const
		{
			for (size_t i = 0; i < fields.size(); i++)
			{
				if (fields[i].name == field_name)
					return i;
			}
			return optional::none;
		}
		struct_tag struct_def::as_tag(vector<type_tag>&& arguments) const
		{
			return struct_tag(module, name, std::move(arguments));
		}

		expects_vm<void> module_definition::validate() const
		{
			for (auto& [name, definition] : structs)
			{
				if (definition.name != name || definition.module != id)
					return vm_exception::invariant_violation(stringify::text("struct %s is misplaced in module %s", definition.name.c_str(), id.to_string().c_str()));

				unordered_set<string> names;
				for (auto& field : definition.fields)
				{
					if (!names.insert(field.name).second)
						return vm_exception::invariant_violation(stringify::text("struct %s::%s declares field %s twice", id.to_string().c_str(), name.c_str(), field.name.c_str()));

					vector<const type_tag*> queue = { &field.type };
					while (!queue.empty())
					{
						auto* next = queue.back();
						queue.pop_back();
						if (next->kind == type_kind::parameter && next->index >= definition.parameters.size())
							return vm_exception::invariant_violation(stringify::text("struct %s::%s field %s refers to undeclared parameter T%i", id.to_string().c_str(), name.c_str(), field.name.c_str(), (int)next->index));
						else if (next->kind == type_kind::signer)
							return vm_exception::invariant_violation(stringify::text("struct %s::%s field %s cannot hold a signer", id.to_string().c_str(), name.c_str(), field.name.c_str()));

						for (auto& argument : next->arguments)
							queue.push_back(&argument);
					}
				}
			}
			return expectation::met;
		}
		const struct_def* module_definition::find_struct(const std::string_view& name) const
		{
			auto it = structs.find(string(name));
			return it != structs.end() ? &it->second : nullptr;
		}

		const module_definition* type_cache::insert(module_definition&& definition)
		{
			auto key = definition.id.to_key();
			umutex<std::mutex> unique(mutex);
			auto it = modules.find(key);
			if (it != modules.end())
				return *it->second;

			auto* result = memory::init<module_definition>(std::move(definition));
			modules[key] = uptr<module_definition>(result);
			return result;
		}
		const module_definition* type_cache::find(const module_id& id)
		{
			auto key = id.to_key();
			umutex<std::mutex> unique(mutex);
			auto it = modules.find(key);
			return it != modules.end() ? *it->second : nullptr;
		}
		size_t type_cache::size()
		{
			umutex<std::mutex> unique(mutex);
			return modules.size();
		}
		void type_cache::clear()
		{
			umutex<std::mutex> unique(mutex);
			modules.clear();
		}

		type_resolver::type_resolver(module_provider* new_provider) : provider(new_provider), max_type_depth(protocol::now().limits.max_type_depth), max_type_arguments(protocol::now().limits.max_type_arguments)
		{
		}
		type_resolver::type_resolver(module_provider* new_provider, uint32_t new_max_type_depth, uint32_t new_max_type_arguments) : provider(new_provider), max_type_depth(new_max_type_depth), max_type_arguments(new_max_type_arguments)
		{
		}
		expects_vm<const module_definition*> type_resolver::load(const module_id& id)
		{
			auto* cache = type_cache::get();
			auto* result = cache->find(id);
			if (result != nullptr)
				return result;
			else if (!provider)
				return vm_exception::module_not_found(stringify::text("module %s is not loaded", id.to_string().c_str()));

			auto definition = provider->load_module(id);
			if (!definition)
			{
				VI_WARN("module %s not loaded: %s", id.to_string().c_str(), definition.error().what());
				return definition.error();
			}
			else if (definition->id != id)
				return vm_exception::module_not_found(stringify::text("provider returned module %s for %s", definition->id.to_string().c_str(), id.to_string().c_str()));

			auto validation = definition->validate();
			if (!validation)
			{
				VI_ERR("module %s rejected: %s", id.to_string().c_str(), validation.error().what());
				return validation.error();
			}

			result = cache->insert(std::move(*definition));
			VI_DEBUG("module %s cached (structs: %i)", id.to_string().c_str(), (int)result->structs.size());
			return result;
		}
		expects_vm<const struct_def*> type_resolver::resolve(const type_tag& tag)
		{
			if (tag.kind != type_kind::structure)
				return vm_exception::type_mismatch(stringify::text("type %s is not a struct", tag.to_string().c_str()));

			auto module = load(tag.module);
			if (!module)
				return module.error();

			auto* definition = (*module)->find_struct(tag.name);
			if (!definition)
				return vm_exception::module_not_found(stringify::text("struct %s::%s not found", tag.module.to_string().c_str(), tag.name.c_str()));
			else if (definition->parameters.size() != tag.arguments.size())
				return vm_exception::type_arity_mismatch(stringify::text("struct %s::%s expects %i type arguments, got %i", tag.module.to_string().c_str(), tag.name.c_str(), (int)definition->parameters.size(), (int)tag.arguments.size()));

			return definition;
		}
		expects_vm<const struct_def*> type_resolver::resolve(const struct_tag& tag)
		{
			return resolve(tag.as_type());
		}
		expects_vm<vector<type_tag>> type_resolver::instantiate(const struct_def& definition, const vector<type_tag>& type_arguments)
		{
			if (definition.parameters.size() != type_arguments.size())
				return vm_exception::type_arity_mismatch(stringify::text("struct %s::%s expects %i type arguments, got %i", definition.module.to_string().c_str(), definition.name.c_str(), (int)definition.parameters.size(), (int)type_arguments.size()));
			else if (type_arguments.size() > max_type_arguments)
				return vm_exception::type_arity_mismatch(stringify::text("struct %s::%s instantiated with %i type arguments (max: %i)", definition.module.to_string().c_str(), definition.name.c_str(), (int)type_arguments.size(), (int)max_type_arguments));

			for (auto& argument : type_arguments)
			{
				auto status = verify_type(argument, 2);
				if (!status)
					return status.error();
			}

			auto constraints = verify_constraints(definition, type_arguments);
			if (!constraints)
				return constraints.error();

			vector<type_tag> result;
			result.reserve(definition.fields.size());
			for (auto& field : definition.fields)
			{
				auto type = substitute(field.type, type_arguments, 2);
				if (!type && type.error().is(vm_status::type_too_deep))
				{
					VI_ERR("struct %s::%s field %s layout is too deep: %s", definition.module.to_string().c_str(), definition.name.c_str(), field.name.c_str(), type.error().what());
					return type.error().escalate();
				}
				else if (!type)
					return type.error();

				result.push_back(std::move(*type));
			}
			return result;
		}
		expects_vm<type_tag> type_resolver::substitute(const type_tag& type, const vector<type_tag>& type_arguments)
		{
			return substitute(type, type_arguments, 1);
		}
		expects_vm<type_tag> type_resolver::substitute(const type_tag& type, const vector<type_tag>& type_arguments, size_t depth)
		{
			if (depth > max_type_depth)
				return vm_exception::type_too_deep(stringify::text("type %s exceeds %i nesting levels", type.to_string().c_str(), (int)max_type_depth));

			if (type.kind == type_kind::parameter)
			{
				if (type.index >= type_arguments.size())
					return vm_exception::invariant_violation(stringify::text("type parameter T%i is out of range", (int)type.index));

				auto& argument = type_arguments[type.index];
				if (depth + argument.depth() - 1 > max_type_depth)
					return vm_exception::type_too_deep(stringify::text("type %s exceeds %i nesting levels", argument.to_string().c_str(), (int)max_type_depth));

				return argument;
			}
			else if (type.arguments.empty())
				return type;

			type_tag result = type;
			for (auto& argument : result.arguments)
			{
				auto next = substitute(argument, type_arguments, depth + 1);
				if (!next)
					return next.error();

				argument = std::move(*next);
			}
			return result;
		}
		expects_vm<ability_set> type_resolver::abilities_of(const type_tag& type)
		{
			return abilities_of(type, 1);
		}
		expects_vm<ability_set> type_resolver::abilities_of(const type_tag& type, size_t depth)
		{
			if (depth > max_type_depth)
				return vm_exception::type_too_deep(stringify::text("type %s exceeds %i nesting levels", type.to_string().c_str(), (int)max_type_depth));

			switch (type.kind)
			{
				case type_kind::boolean:
				case type_kind::u8:
				case type_kind::u64:
				case type_kind::u128:
				case type_kind::address:
					return ability_set::all();
				case type_kind::signer:
					return ability_set({ ability::drop });
				case type_kind::vector:
				{
					auto element = abilities_of(type.element(), depth + 1);
					if (!element)
						return element.error();

					return element->intersect(ability_set({ ability::copy, ability::drop, ability::store }));
				}
				case type_kind::structure:
				{
					auto definition = resolve(type);
					if (!definition)
						return definition.error();

					ability_set result = (*definition)->abilities;
					for (size_t i = 0; i < type.arguments.size(); i++)
					{
						if ((*definition)->parameters[i].phantom)
							continue;

						auto argument = abilities_of(type.arguments[i], depth + 1);
						if (!argument)
							return argument.error();

						for (auto value : { ability::copy, ability::drop, ability::store, ability::key })
						{
							if (!argument->has(ability_set::requirement_of(value)))
								result.remove(value);
						}
					}
					return result;
				}
				case type_kind::parameter:
				default:
					return vm_exception::type_mismatch(stringify::text("type %s is not concrete", type.to_string().c_str()));
			}
		}
		expects_vm<void> type_resolver::verify_abilities(const type_tag& type, const ability_set& expected)
		{
			auto actual = abilities_of(type);
			if (!actual)
				return actual.error();
			else if (*actual == expected)
				return expectation::met;

			auto error = vm_exception::ability_violation(stringify::text("type %s has abilities {%s}, verifier computed {%s}", type.to_string().c_str(), actual->to_string().c_str(), expected.to_string().c_str())).escalate();
			VI_ERR("%s", error.as_string().c_str());
			return error;
		}
		expects_vm<void> type_resolver::verify_type(const type_tag& type)
		{
			return verify_type(type, 1);
		}
		expects_vm<void> type_resolver::verify_type(const type_tag& type, size_t depth)
		{
			if (depth > max_type_depth)
				return vm_exception::type_too_deep(stringify::text("type %s exceeds %i nesting levels", type.to_string().c_str(), (int)max_type_depth));

			switch (type.kind)
			{
				case type_kind::parameter:
					return vm_exception::type_mismatch(stringify::text("type %s is not concrete", type.to_string().c_str()));
				case type_kind::vector:
					return verify_type(type.element(), depth + 1);
				case type_kind::structure:
				{
					if (type.arguments.size() > max_type_arguments)
						return vm_exception::type_arity_mismatch(stringify::text("type %s has too many type arguments (max: %i)", type.to_string().c_str(), (int)max_type_arguments));

					auto definition = resolve(type);
					if (!definition)
						return definition.error();

					for (auto& argument : type.arguments)
					{
						auto status = verify_type(argument, depth + 1);
						if (!status)
							return status;
					}
					return verify_constraints(**definition, type.arguments);
				}
				default:
					return expectation::met;
			}
		}
		expects_vm<void> type_resolver::verify_constraints(const struct_def& definition, const vector<type_tag>& type_arguments)
		{
			if (definition.parameters.size() != type_arguments.size())
				return vm_exception::type_arity_mismatch(stringify::text("struct %s::%s expects %i type arguments, got %i", definition.module.to_string().c_str(), definition.name.c_str(), (int)definition.parameters.size(), (int)type_arguments.size()));

			for (size_t i = 0; i < type_arguments.size(); i++)
			{
				auto& constraints = definition.parameters[i].constraints;
				if (constraints.empty())
					continue;

				auto abilities = abilities_of(type_arguments[i]);
				if (!abilities)
					return abilities.error();
				else if (!abilities->contains(constraints))
					return vm_exception::ability_violation(stringify::text("type %s does not satisfy {%s} required by %s::%s", type_arguments[i].to_string().c_str(), constraints.to_string().c_str(), definition.module.to_string().c_str(), definition.name.c_str()));
			}
			return expectation::met;
		}
		uint32_t type_resolver::get_max_type_depth() const
		{
			return max_type_depth;
		}
	}
}
