#include "modules.h"

namespace strata
{
	namespace policy
	{
		expects_vm<ledger::module_definition> memory_module_provider::load_module(const ledger::module_id& id)
		{
			auto it = modules.find(id.to_key());
			if (it == modules.end())
				return vm_exception::module_not_found(stringify::text("module %s not found", id.to_string().c_str()));

			return it->second;
		}
		void memory_module_provider::add_module(ledger::module_definition&& definition)
		{
			auto key = definition.id.to_key();
			modules[key] = std::move(definition);
		}
		bool memory_module_provider::has_module(const ledger::module_id& id) const
		{
			return modules.find(id.to_key()) != modules.end();
		}
		size_t memory_module_provider::size() const
		{
			return modules.size();
		}

		expects_lr<size_t> schema_module_provider::load_document(const std::string_view& json)
		{
			auto possible_document = schema::from_json(json);
			if (!possible_document)
				return layer_exception(possible_document.what());

			auto document = uptr<schema>(possible_document);
			return load_schema(*document);
		}
		expects_lr<size_t> schema_module_provider::load_file(const std::string_view& path)
		{
			auto file = os::file::read_as_string(path);
			if (!file)
				return layer_exception(stringify::text("module file %.*s: %s", (int)path.size(), path.data(), file.what().c_str()));

			return load_document(*file);
		}
		expects_lr<size_t> schema_module_provider::load_schema(schema* data)
		{
			if (!data)
				return layer_exception("module document is empty");

			auto* list = data->value.is(var_type::array) ? data : data->get("modules");
			if (!list || !list->value.is(var_type::array))
				return layer_exception("module document must be an array of modules");

			size_t max_type_depth = protocol::bound() ? protocol::now().limits.max_type_depth : 64;
			size_t count = 0;
			for (auto& item : list->get_childs())
			{
				auto definition = parse_module(item, max_type_depth);
				if (!definition)
					return definition.error();

				add_module(std::move(*definition));
				++count;
			}
			return count;
		}
		expects_lr<ledger::module_definition> schema_module_provider::parse_module(schema* data, size_t max_type_depth)
		{
			if (!data || !data->value.is(var_type::object))
				return layer_exception("module must be an object");

			auto address = algorithm::encoding::decode_address(data->get_var("address").get_blob());
			if (!address)
				return layer_exception("module address is not valid");

			ledger::module_definition result;
			result.id = ledger::module_id(*address, data->get_var("name").get_blob());
			if (result.id.name.empty())
				return layer_exception("module name is empty");

			auto* structs = data->get("structs");
			if (structs != nullptr && structs->value.is(var_type::array))
			{
				for (auto& item : structs->get_childs())
				{
					auto definition = parse_struct(result.id, item, max_type_depth);
					if (!definition)
						return definition.error();
					else if (result.structs.find(definition->name) != result.structs.end())
						return layer_exception(stringify::text("module %s declares struct %s twice", result.id.to_string().c_str(), definition->name.c_str()));

					auto name = definition->name;
					result.structs[name] = std::move(*definition);
				}
			}

			auto validation = result.validate();
			if (!validation)
				return layer_exception(validation.error().as_string());

			return result;
		}
		expects_lr<ledger::struct_def> schema_module_provider::parse_struct(const ledger::module_id& module, schema* data, size_t max_type_depth)
		{
			if (!data || !data->value.is(var_type::object))
				return layer_exception("struct must be an object");

			ledger::struct_def result;
			result.module = module;
			result.name = data->get_var("name").get_blob();
			if (result.name.empty())
				return layer_exception(stringify::text("module %s has unnamed struct", module.to_string().c_str()));

			auto abilities = parse_abilities(data->get("abilities"));
			if (!abilities)
				return abilities.error();

			result.abilities = *abilities;
			auto* parameters = data->get("parameters");
			if (parameters != nullptr && parameters->value.is(var_type::array))
			{
				for (auto& item : parameters->get_childs())
				{
					auto constraints = parse_abilities(item->get("constraints"));
					if (!constraints)
						return constraints.error();

					ledger::type_parameter_def parameter;
					parameter.constraints = *constraints;
					parameter.phantom = item->get_var("phantom").get_boolean();
					result.parameters.push_back(parameter);
				}
			}

			auto* fields = data->get("fields");
			if (fields != nullptr && fields->value.is(var_type::array))
			{
				for (auto& item : fields->get_childs())
				{
					auto type = ledger::type_tag::from_string(item->get_var("type").get_blob(), max_type_depth);
					if (!type)
						return layer_exception(stringify::text("struct %s::%s field type: %s", module.to_string().c_str(), result.name.c_str(), type.error().what()));

					ledger::field_def field;
					field.name = item->get_var("name").get_blob();
					field.type = std::move(*type);
					result.fields.push_back(std::move(field));
				}
			}
			return result;
		}
		expects_lr<ledger::ability_set> schema_module_provider::parse_abilities(schema* data)
		{
			ledger::ability_set result;
			if (!data)
				return result;
			else if (!data->value.is(var_type::array))
				return layer_exception("abilities must be an array");

			for (auto& item : data->get_childs())
			{
				auto name = item->value.get_blob();
				auto value = ledger::ability_set::from_name(name);
				if (!value)
					return layer_exception(stringify::text("unknown ability \"%s\"", name.c_str()));

				result.insert(*value);
			}
			return result;
		}
		uptr<schema> schema_module_provider::serialize_module(const ledger::module_definition& definition)
		{
			uptr<schema> data = var::set::object();
			data->set("address", var::string(algorithm::encoding::encode_short_address(definition.id.address)));
			data->set("name", var::string(definition.id.name));

			auto* structs = data->set("structs", var::set::array());
			for (auto& [name, item] : definition.structs)
			{
				auto* next = structs->push(var::set::object());
				next->set("name", var::string(name));

				auto* abilities = next->set("abilities", var::set::array());
				for (auto value : { ledger::ability::copy, ledger::ability::drop, ledger::ability::store, ledger::ability::key })
				{
					if (item.abilities.has(value))
						abilities->push(var::string(ledger::ability_set::name_of(value)));
				}

				auto* parameters = next->set("parameters", var::set::array());
				for (auto& parameter : item.parameters)
				{
					auto* target = parameters->push(var::set::object());
					auto* constraints = target->set("constraints", var::set::array());
					for (auto value : { ledger::ability::copy, ledger::ability::drop, ledger::ability::store, ledger::ability::key })
					{
						if (parameter.constraints.has(value))
							constraints->push(var::string(ledger::ability_set::name_of(value)));
					}
					target->set("phantom", var::boolean(parameter.phantom));
				}

				auto* fields = next->set("fields", var::set::array());
				for (auto& field : item.fields)
				{
					auto* target = fields->push(var::set::object());
					target->set("name", var::string(field.name));
					target->set("type", var::string(field.type.to_string()));
				}
			}
			return data;
		}
	}
}
