#include "values.h"

namespace strata
{
	namespace ledger
	{
		string location::to_key() const
		{
			format::wo_stream message;
			message.write_u8((uint8_t)kind);
			if (kind == location_kind::local)
			{
				message.write_u64(frame);
				message.write_u32(slot);
			}
			else
			{
				message.write_typeless(address.data, sizeof(address.data));
				message.write_bytes(resource.to_string());
			}
			return message.data;
		}
		string location::to_string() const
		{
			if (kind == location_kind::local)
				return stringify::text("local(frame: %" PRIu64 ", slot: %i)", frame, (int)slot);

			return stringify::text("global(%s, %s)", algorithm::encoding::encode_short_address(address).c_str(), resource.to_string().c_str());
		}
		bool location::operator== (const location& other) const
		{
			if (kind != other.kind)
				return false;
			else if (kind == location_kind::local)
				return frame == other.frame && slot == other.slot;

			return address == other.address && resource == other.resource;
		}
		bool location::operator!= (const location& other) const
		{
			return !(*this == other);
		}
		location location::local(uint64_t frame, uint32_t slot)
		{
			location result;
			result.kind = location_kind::local;
			result.frame = frame;
			result.slot = slot;
			return result;
		}
		location location::global(const algorithm::account_address& address, const struct_tag& resource)
		{
			location result;
			result.kind = location_kind::global;
			result.address = address;
			result.resource = resource;
			return result;
		}

		bool value::as_boolean() const
		{
			VI_ASSERT(kind == value_kind::boolean, "value should be a bool");
			return number != 0;
		}
		uint8_t value::as_u8() const
		{
			VI_ASSERT(kind == value_kind::u8, "value should be an u8");
			return (uint8_t)number.low();
		}
		uint64_t value::as_u64() const
		{
			VI_ASSERT(kind == value_kind::u64, "value should be an u64");
			return number.low();
		}
		const uint128_t& value::as_u128() const
		{
			VI_ASSERT(kind == value_kind::u128, "value should be an u128");
			return number;
		}
		const algorithm::account_address& value::as_address() const
		{
			VI_ASSERT(kind == value_kind::address || kind == value_kind::signer, "value should be an address or a signer");
			return address;
		}
		type_tag value::type_of() const
		{
			switch (kind)
			{
				case value_kind::boolean:
					return type_tag::boolean();
				case value_kind::u8:
					return type_tag::u8();
				case value_kind::u64:
					return type_tag::u64();
				case value_kind::u128:
					return type_tag::u128();
				case value_kind::address:
					return type_tag::address();
				case value_kind::signer:
					return type_tag::signer();
				case value_kind::vector:
					return type_tag::vector_of(type);
				case value_kind::structure:
				case value_kind::reference:
					return type;
				default:
					return type_tag();
			}
		}
		bool value::is_valid() const
		{
			return kind != value_kind::invalid;
		}
		bool value::is_reference() const
		{
			return kind == value_kind::reference;
		}
		size_t value::size_of() const
		{
			switch (kind)
			{
				case value_kind::boolean:
				case value_kind::u8:
					return 1;
				case value_kind::u64:
					return sizeof(uint64_t);
				case value_kind::u128:
					return sizeof(uint64_t) * 2;
				case value_kind::address:
				case value_kind::signer:
					return sizeof(address.data);
				case value_kind::vector:
				case value_kind::structure:
				{
					size_t size = kind == value_kind::vector ? format::util::get_uleb128_size((uint32_t)std::min<size_t>(items.size(), std::numeric_limits<uint32_t>::max())) : 0;
					for (auto& item : items)
						size += item.size_of();
					return size;
				}
				case value_kind::reference:
					return sizeof(uint64_t);
				default:
					return 0;
			}
		}
		uptr<schema> value::as_schema() const
		{
			switch (kind)
			{
				case value_kind::boolean:
					return var::set::boolean(number != 0);
				case value_kind::u8:
					return var::set::integer((int64_t)number.low());
				case value_kind::u64:
					return var::set::string(std::to_string(number.low()));
				case value_kind::u128:
					return var::set::string(number.to_string());
				case value_kind::address:
				case value_kind::signer:
					return var::set::string(algorithm::encoding::encode_short_address(address));
				case value_kind::vector:
				{
					if (type.kind == type_kind::u8)
					{
						string bytes;
						bytes.reserve(items.size());
						for (auto& item : items)
							bytes.push_back((char)item.number.low());
						return var::set::string(format::util::encode_0xhex(bytes));
					}

					uptr<schema> data = var::set::array();
					for (auto& item : items)
						data->push(item.as_schema().reset());
					return data;
				}
				case value_kind::structure:
				{
					uptr<schema> data = var::set::object();
					data->set("type", var::string(type.to_string()));
					auto* fields = data->set("fields", var::set::array());
					for (auto& item : items)
						fields->push(item.as_schema().reset());
					return data;
				}
				case value_kind::reference:
				{
					uptr<schema> data = var::set::object();
					data->set("reference", var::string(target.to_string()));
					data->set("type", var::string(type.to_string()));
					data->set("mutable", var::boolean(writable));
					return data;
				}
				default:
					return var::set::null();
			}
		}
		value value::boolean(bool data)
		{
			value result;
			result.kind = value_kind::boolean;
			result.number = data ? 1 : 0;
			return result;
		}
		value value::u8(uint8_t data)
		{
			value result;
			result.kind = value_kind::u8;
			result.number = data;
			return result;
		}
		value value::u64(uint64_t data)
		{
			value result;
			result.kind = value_kind::u64;
			result.number = data;
			return result;
		}
		value value::u128(const uint128_t& data)
		{
			value result;
			result.kind = value_kind::u128;
			result.number = data;
			return result;
		}
		value value::account(const algorithm::account_address& data)
		{
			value result;
			result.kind = value_kind::address;
			result.address = data;
			return result;
		}
		value value::signer(const algorithm::account_address& data)
		{
			value result;
			result.kind = value_kind::signer;
			result.address = data;
			return result;
		}
		value value::vector_of(const type_tag& element, vector<value>&& elements)
		{
			value result;
			result.kind = value_kind::vector;
			result.type = element;
			result.items = std::move(elements);
			return result;
		}
		value value::structure(const struct_tag& tag, vector<value>&& fields)
		{
			value result;
			result.kind = value_kind::structure;
			result.type = tag.as_type();
			result.items = std::move(fields);
			return result;
		}
		value value::reference(const location& target, const type_tag& referent, bool writable, uint64_t borrow_id)
		{
			value result;
			result.kind = value_kind::reference;
			result.type = referent;
			result.target = target;
			result.writable = writable;
			result.borrow_id = borrow_id;
			return result;
		}
		value value::clone() const
		{
			value result;
			result.kind = kind;
			result.number = number;
			result.address = address;
			result.type = type;
			result.target = target;
			result.writable = writable;
			result.borrow_id = borrow_id;
			result.items.reserve(items.size());
			for (auto& item : items)
				result.items.push_back(item.clone());
			return result;
		}

		value_ops::value_ops(type_resolver* new_resolver) : resolver(new_resolver), max_vector_length(protocol::now().limits.max_vector_length)
		{
			VI_ASSERT(resolver != nullptr, "resolver should be set");
		}
		value_ops::value_ops(type_resolver* new_resolver, uint64_t new_max_vector_length) : resolver(new_resolver), max_vector_length(new_max_vector_length)
		{
			VI_ASSERT(resolver != nullptr, "resolver should be set");
		}
		expects_vm<value> value_ops::pack(const struct_def& definition, const vector<type_tag>& type_arguments, vector<value>&& fields)
		{
			auto field_types = resolver->instantiate(definition, type_arguments);
			if (!field_types)
				return field_types.error();

			auto tag = definition.as_tag(vector<type_tag>(type_arguments));
			if (fields.size() != field_types->size())
				return vm_exception::field_mismatch(stringify::text("%s has %i fields, got %i", tag.to_string().c_str(), (int)field_types->size(), (int)fields.size()));

			for (size_t i = 0; i < fields.size(); i++)
			{
				auto& field = fields[i];
				auto& expected = field_types->at(i);
				if (!field.is_valid())
					return vm_exception::field_mismatch(stringify::text("%s field %s expects %s, got an empty value", tag.to_string().c_str(), definition.fields[i].name.c_str(), expected.to_string().c_str()));
				else if (field.is_reference() || field.type_of() != expected)
					return vm_exception::field_mismatch(stringify::text("%s field %s expects %s, got %s", tag.to_string().c_str(), definition.fields[i].name.c_str(), expected.to_string().c_str(), field.is_reference() ? "a reference" : field.type_of().to_string().c_str()));
			}

			return value::structure(tag, std::move(fields));
		}
		expects_vm<value> value_ops::pack(const struct_tag& tag, vector<value>&& fields)
		{
			auto definition = resolver->resolve(tag);
			if (!definition)
				return definition.error();

			return pack(**definition, tag.arguments, std::move(fields));
		}
		expects_vm<vector<value>> value_ops::unpack(value&& target, const struct_tag& expected)
		{
			if (target.kind != value_kind::structure || target.type != expected.as_type())
				return vm_exception::type_mismatch(stringify::text("expected %s, got %s", expected.to_string().c_str(), target.type_of().to_string().c_str()));

			vector<value> result = std::move(target.items);
			target = value();
			return result;
		}
		expects_vm<value> value_ops::copy_value(const value& target)
		{
			if (!target.is_valid())
				return vm_exception::invariant_violation("copy of an empty value");
			else if (target.is_reference())
				return vm_exception::invariant_violation("references are duplicated through the borrow tracker");

			auto type = target.type_of();
			auto abilities = resolver->abilities_of(type);
			if (!abilities)
				return abilities.error();
			else if (!abilities->has(ability::copy))
				return vm_exception::ability_violation(stringify::text("type %s cannot be copied", type.to_string().c_str()));

			return target.clone();
		}
		expects_vm<void> value_ops::drop_value(value&& target)
		{
			if (!target.is_valid())
				return expectation::met;
			else if (target.is_reference())
				return vm_exception::invariant_violation("references are released through the borrow tracker");

			auto type = target.type_of();
			auto abilities = resolver->abilities_of(type);
			if (!abilities)
				return abilities.error();
			else if (!abilities->has(ability::drop))
				return vm_exception::ability_violation(stringify::text("type %s cannot be dropped", type.to_string().c_str()));

			target = value();
			return expectation::met;
		}
		expects_vm<value> value_ops::pack_vector(const type_tag& element, vector<value>&& elements)
		{
			if (elements.size() > max_vector_length)
				return vm_exception::value_too_large(stringify::text("vector of %i elements exceeds %" PRIu64, (int)elements.size(), max_vector_length));

			for (auto& item : elements)
			{
				auto status = check_type(item, element);
				if (!status)
					return status.error();
			}

			return value::vector_of(element, std::move(elements));
		}
		expects_vm<vector<value>> value_ops::unpack_vector(value&& target, const type_tag& element, uint64_t expected_length)
		{
			auto status = check_vector(target, element);
			if (!status)
				return status.error();
			else if (target.items.size() != expected_length)
				return vm_exception::type_mismatch(stringify::text("expected vector of %" PRIu64 " elements, got %i", expected_length, (int)target.items.size()));

			vector<value> result = std::move(target.items);
			target = value();
			return result;
		}
		expects_vm<uint64_t> value_ops::vector_length(const value& target, const type_tag& element)
		{
			auto status = check_vector(target, element);
			if (!status)
				return status.error();

			return (uint64_t)target.items.size();
		}
		expects_vm<void> value_ops::vector_push_back(value& target, const type_tag& element, value&& item)
		{
			auto status = check_vector(target, element);
			if (!status)
				return status;

			status = check_type(item, element);
			if (!status)
				return status;
			else if (target.items.size() + 1 > max_vector_length)
				return vm_exception::value_too_large(stringify::text("vector exceeds %" PRIu64 " elements", max_vector_length));

			target.items.push_back(std::move(item));
			return expectation::met;
		}
		expects_vm<value> value_ops::vector_pop_back(value& target, const type_tag& element)
		{
			auto status = check_vector(target, element);
			if (!status)
				return status.error();
			else if (target.items.empty())
				return vm_exception::type_mismatch("pop from an empty vector");

			value result = std::move(target.items.back());
			target.items.pop_back();
			return result;
		}
		expects_vm<void> value_ops::vector_swap(value& target, const type_tag& element, uint64_t left, uint64_t right)
		{
			auto status = check_vector(target, element);
			if (!status)
				return status;
			else if (left >= target.items.size() || right >= target.items.size())
				return vm_exception::type_mismatch(stringify::text("swap index out of range (size: %i)", (int)target.items.size()));

			std::swap(target.items[(size_t)left], target.items[(size_t)right]);
			return expectation::met;
		}
		expects_vm<void> value_ops::vector_destroy_empty(value&& target, const type_tag& element)
		{
			auto status = check_vector(target, element);
			if (!status)
				return status;
			else if (!target.items.empty())
				return vm_exception::type_mismatch(stringify::text("destroy of a vector holding %i elements", (int)target.items.size()));

			target = value();
			return expectation::met;
		}
		expects_vm<void> value_ops::check_type(const value& target, const type_tag& expected)
		{
			if (!target.is_valid())
				return vm_exception::type_mismatch(stringify::text("expected %s, got an empty value", expected.to_string().c_str()));
			else if (target.is_reference())
				return vm_exception::type_mismatch(stringify::text("expected %s, got a reference", expected.to_string().c_str()));

			auto type = target.type_of();
			if (type != expected)
				return vm_exception::type_mismatch(stringify::text("expected %s, got %s", expected.to_string().c_str(), type.to_string().c_str()));

			return expectation::met;
		}
		type_resolver* value_ops::get_resolver()
		{
			return resolver;
		}
		bool value_ops::structural_equals(const value& left, const value& right)
		{
			if (left.kind != right.kind)
				return false;

			switch (left.kind)
			{
				case value_kind::boolean:
				case value_kind::u8:
				case value_kind::u64:
				case value_kind::u128:
					return left.number == right.number;
				case value_kind::address:
				case value_kind::signer:
					return left.address == right.address;
				case value_kind::vector:
				case value_kind::structure:
				{
					if (left.type != right.type || left.items.size() != right.items.size())
						return false;

					for (size_t i = 0; i < left.items.size(); i++)
					{
						if (!structural_equals(left.items[i], right.items[i]))
							return false;
					}
					return true;
				}
				case value_kind::reference:
					return left.target == right.target;
				default:
					return true;
			}
		}
		expects_vm<void> value_ops::check_vector(const value& target, const type_tag& element)
		{
			if (target.kind != value_kind::vector)
				return vm_exception::type_mismatch(stringify::text("expected vector<%s>, got %s", element.to_string().c_str(), target.type_of().to_string().c_str()));
			else if (target.type != element)
				return vm_exception::type_mismatch(stringify::text("expected vector<%s>, got vector<%s>", element.to_string().c_str(), target.type.to_string().c_str()));

			return expectation::met;
		}
	}
}
