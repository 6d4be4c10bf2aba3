#include "chain.h"
extern "C"
{
#include <sodium.h>
}

namespace strata
{
	template <typename t>
	static void configure_integer(schema* config, const std::string_view& name, t& target)
	{
		auto* value = config->fetch(name);
		if (value != nullptr && value->value.is(var_type::integer) && value->value.get_integer() >= 0)
			target = (t)value->value.get_integer();
	}

	layer_exception::layer_exception() : std::exception()
	{
	}
	layer_exception::layer_exception(string&& text) : std::exception(), error_message(std::move(text))
	{
	}
	const char* layer_exception::what() const noexcept
	{
		return error_message.c_str();
	}
	string&& layer_exception::message() noexcept
	{
		return std::move(error_message);
	}

	vm_exception::vm_exception(vm_status new_status, string&& text) : std::exception(), error_message(std::move(text)), error_status(new_status), invariant(new_status == vm_status::borrow_conflict || new_status == vm_status::invariant_violation)
	{
	}
	const char* vm_exception::what() const noexcept
	{
		return error_message.c_str();
	}
	string&& vm_exception::message() noexcept
	{
		return std::move(error_message);
	}
	const string& vm_exception::text() const noexcept
	{
		return error_message;
	}
	vm_status vm_exception::status() const noexcept
	{
		return error_status;
	}
	bool vm_exception::is(vm_status target) const noexcept
	{
		return error_status == target;
	}
	bool vm_exception::is_invariant_violation() const noexcept
	{
		return invariant;
	}
	vm_exception vm_exception::escalate() const
	{
		vm_exception result = *this;
		result.invariant = true;
		return result;
	}
	string vm_exception::as_string() const
	{
		auto name = status_name(error_status);
		return stringify::text("%.*s%s: %s", (int)name.size(), name.data(), invariant ? " (invariant)" : "", error_message.c_str());
	}
	std::string_view vm_exception::status_name(vm_status status)
	{
		switch (status)
		{
			case vm_status::ability_violation:
				return "ability_violation";
			case vm_status::type_mismatch:
				return "type_mismatch";
			case vm_status::field_mismatch:
				return "field_mismatch";
			case vm_status::module_not_found:
				return "module_not_found";
			case vm_status::type_arity_mismatch:
				return "type_arity_mismatch";
			case vm_status::type_too_deep:
				return "type_too_deep";
			case vm_status::resource_does_not_exist:
				return "resource_does_not_exist";
			case vm_status::resource_already_exists:
				return "resource_already_exists";
			case vm_status::out_of_gas:
				return "out_of_gas";
			case vm_status::deserialization_error:
				return "deserialization_error";
			case vm_status::borrow_conflict:
				return "borrow_conflict";
			case vm_status::call_stack_overflow:
				return "call_stack_overflow";
			case vm_status::value_too_large:
				return "value_too_large";
			case vm_status::invariant_violation:
				return "invariant_violation";
			default:
				return "unknown";
		}
	}
	vm_exception vm_exception::ability_violation(string&& text)
	{
		return vm_exception(vm_status::ability_violation, std::move(text));
	}
	vm_exception vm_exception::type_mismatch(string&& text)
	{
		return vm_exception(vm_status::type_mismatch, std::move(text));
	}
	vm_exception vm_exception::field_mismatch(string&& text)
	{
		return vm_exception(vm_status::field_mismatch, std::move(text));
	}
	vm_exception vm_exception::module_not_found(string&& text)
	{
		return vm_exception(vm_status::module_not_found, std::move(text));
	}
	vm_exception vm_exception::type_arity_mismatch(string&& text)
	{
		return vm_exception(vm_status::type_arity_mismatch, std::move(text));
	}
	vm_exception vm_exception::type_too_deep(string&& text)
	{
		return vm_exception(vm_status::type_too_deep, std::move(text));
	}
	vm_exception vm_exception::resource_does_not_exist(string&& text)
	{
		return vm_exception(vm_status::resource_does_not_exist, std::move(text));
	}
	vm_exception vm_exception::resource_already_exists(string&& text)
	{
		return vm_exception(vm_status::resource_already_exists, std::move(text));
	}
	vm_exception vm_exception::out_of_gas(string&& text)
	{
		return vm_exception(vm_status::out_of_gas, std::move(text));
	}
	vm_exception vm_exception::deserialization_error(string&& text)
	{
		return vm_exception(vm_status::deserialization_error, std::move(text));
	}
	vm_exception vm_exception::borrow_conflict(string&& text)
	{
		return vm_exception(vm_status::borrow_conflict, std::move(text));
	}
	vm_exception vm_exception::call_stack_overflow(string&& text)
	{
		return vm_exception(vm_status::call_stack_overflow, std::move(text));
	}
	vm_exception vm_exception::value_too_large(string&& text)
	{
		return vm_exception(vm_status::value_too_large, std::move(text));
	}
	vm_exception vm_exception::invariant_violation(string&& text)
	{
		return vm_exception(vm_status::invariant_violation, std::move(text));
	}

	gas_schedule::gas_schedule() noexcept
	{
		at(gas_operation::call) = { 5, 0 };
		at(gas_operation::ret) = { 1, 0 };
		at(gas_operation::move_local) = { 1, 0 };
		at(gas_operation::copy_local) = { 1, 1 };
		at(gas_operation::store_local) = { 1, 0 };
		at(gas_operation::pack) = { 2, 1 };
		at(gas_operation::unpack) = { 2, 1 };
		at(gas_operation::copy) = { 1, 1 };
		at(gas_operation::drop) = { 1, 0 };
		at(gas_operation::equality) = { 1, 1 };
		at(gas_operation::borrow_local) = { 1, 0 };
		at(gas_operation::borrow_global) = { 10, 0 };
		at(gas_operation::read_ref) = { 1, 1 };
		at(gas_operation::write_ref) = { 1, 1 };
		at(gas_operation::release_ref) = { 1, 0 };
		at(gas_operation::vector_pack) = { 2, 1 };
		at(gas_operation::vector_unpack) = { 2, 1 };
		at(gas_operation::vector_length) = { 1, 0 };
		at(gas_operation::vector_push_back) = { 2, 1 };
		at(gas_operation::vector_pop_back) = { 1, 0 };
		at(gas_operation::vector_swap) = { 1, 0 };
		at(gas_operation::vector_destroy_empty) = { 1, 0 };
		at(gas_operation::serialize) = { 3, 1 };
		at(gas_operation::deserialize) = { 3, 1 };
		at(gas_operation::hash) = { 10, 1 };
		at(gas_operation::exists) = { 10, 0 };
		at(gas_operation::move_from) = { 10, 4 };
		at(gas_operation::move_to) = { 10, 9 };
		at(gas_operation::resource_load) = { 0, 4 };
	}
	gas_schedule::entry& gas_schedule::at(gas_operation operation)
	{
		VI_ASSERT(operation < gas_operation::count, "operation should be valid");
		return costs[(size_t)operation];
	}
	const gas_schedule::entry& gas_schedule::at(gas_operation operation) const
	{
		VI_ASSERT(operation < gas_operation::count, "operation should be valid");
		return costs[(size_t)operation];
	}
	uptr<schema> gas_schedule::as_schema() const
	{
		schema* data = var::set::object();
		for (size_t i = 0; i < (size_t)gas_operation::count; i++)
		{
			auto& cost = costs[i];
			auto* cost_data = data->set(string(name_of((gas_operation)i)), var::set::object());
			cost_data->set("base", var::integer((int64_t)cost.base));
			cost_data->set("per_byte", var::integer((int64_t)cost.per_byte));
		}
		return data;
	}
	std::string_view gas_schedule::name_of(gas_operation operation)
	{
		switch (operation)
		{
			case gas_operation::call:
				return "call";
			case gas_operation::ret:
				return "ret";
			case gas_operation::move_local:
				return "move_local";
			case gas_operation::copy_local:
				return "copy_local";
			case gas_operation::store_local:
				return "store_local";
			case gas_operation::pack:
				return "pack";
			case gas_operation::unpack:
				return "unpack";
			case gas_operation::copy:
				return "copy";
			case gas_operation::drop:
				return "drop";
			case gas_operation::equality:
				return "equality";
			case gas_operation::borrow_local:
				return "borrow_local";
			case gas_operation::borrow_global:
				return "borrow_global";
			case gas_operation::read_ref:
				return "read_ref";
			case gas_operation::write_ref:
				return "write_ref";
			case gas_operation::release_ref:
				return "release_ref";
			case gas_operation::vector_pack:
				return "vector_pack";
			case gas_operation::vector_unpack:
				return "vector_unpack";
			case gas_operation::vector_length:
				return "vector_length";
			case gas_operation::vector_push_back:
				return "vector_push_back";
			case gas_operation::vector_pop_back:
				return "vector_pop_back";
			case gas_operation::vector_swap:
				return "vector_swap";
			case gas_operation::vector_destroy_empty:
				return "vector_destroy_empty";
			case gas_operation::serialize:
				return "serialize";
			case gas_operation::deserialize:
				return "deserialize";
			case gas_operation::hash:
				return "hash";
			case gas_operation::exists:
				return "exists";
			case gas_operation::move_from:
				return "move_from";
			case gas_operation::move_to:
				return "move_to";
			case gas_operation::resource_load:
				return "resource_load";
			default:
				return "unknown";
		}
	}
	option<gas_operation> gas_schedule::from_name(const std::string_view& name)
	{
		for (size_t i = 0; i < (size_t)gas_operation::count; i++)
		{
			if (name_of((gas_operation)i) == name)
				return (gas_operation)i;
		}
		return optional::none;
	}

	void protocol::logger::output(const std::string_view& message)
	{
		if (!resource || message.empty())
			return;

		time_t time = ::time(nullptr);
		umutex<std::recursive_mutex> unique(mutex);
		resource->write((uint8_t*)message.data(), message.size());
		if (message.back() != '\r' && message.back() != '\n')
			resource->write((uint8_t*)"\n", 1);

		if (!protocol::bound() || time - repack_time < (int64_t)protocol::now().user.logs.archive_repack_interval)
			return;

		auto state = os::file::get_properties(resource->virtual_name());
		size_t current_size = state ? state->size : 0;
		repack_time = time;
		if (current_size <= protocol::now().user.logs.archive_size)
			return;

		string path = string(resource->virtual_name());
		resource = os::file::open_archive(path, protocol::now().user.logs.archive_size).or_else(nullptr);
	}

	protocol::protocol(const inline_args& environment)
	{
		VI_PANIC(sodium_init() >= 0, "libsodium initialization failed");
		if (!environment.params.empty())
			path = environment.params.back();

		auto library = os::directory::get_module();
		if (!path.empty())
			path = os::path::resolve(path, *library, true).or_else(string(path));

		error_handling::set_flag(log_option::pretty, true);
		error_handling::set_flag(log_option::dated, true);
		error_handling::set_flag(log_option::active, true);

		auto config = uptr<schema>(path.empty() ? (schema*)nullptr : schema::from_json(os::file::read_as_string(path).or_else(string())));
		if (!environment.args.empty())
		{
			if (!config)
				config = var::set::object();
			for (auto& [key, value] : environment.args)
			{
				auto parent = *config;
				for (auto& name : stringify::split(key, '.'))
				{
					auto child = parent->get(name);
					parent = (child ? child : parent->set(name, var::set::object()));
				}
				parent->value = var::any(value);
			}
		}
		if (config)
		{
			auto* value = config->fetch("logs.info_path");
			if (value != nullptr && value->value.is(var_type::string))
				user.logs.info_path = value->value.get_blob();

			value = config->fetch("logs.error_path");
			if (value != nullptr && value->value.is(var_type::string))
				user.logs.error_path = value->value.get_blob();

			value = config->fetch("logs.execution_logging");
			if (value != nullptr && value->value.is(var_type::boolean))
				user.logs.execution_logging = value->value.get_boolean();

			configure_integer(*config, "logs.archive_size", user.logs.archive_size);
			configure_integer(*config, "logs.archive_repack_interval", user.logs.archive_repack_interval);
			configure_integer(*config, "limits.max_type_depth", limits.max_type_depth);
			configure_integer(*config, "limits.max_type_arguments", limits.max_type_arguments);
			configure_integer(*config, "limits.max_call_depth", limits.max_call_depth);
			configure_integer(*config, "limits.max_locals", limits.max_locals);
			configure_integer(*config, "limits.max_value_size", limits.max_value_size);
			configure_integer(*config, "limits.max_vector_length", limits.max_vector_length);
			configure_integer(*config, "gas.min_transaction_gas_units", gas.min_transaction_gas_units);
			configure_integer(*config, "gas.large_transaction_cutoff", gas.large_transaction_cutoff);
			configure_integer(*config, "gas.intrinsic_gas_per_byte", gas.intrinsic_gas_per_byte);
			configure_integer(*config, "gas.maximum_number_of_gas_units", gas.maximum_number_of_gas_units);
			configure_integer(*config, "gas.max_transaction_size", gas.max_transaction_size);

			value = config->fetch("gas.schedule");
			if (value != nullptr && value->value.get_type() == var_type::object)
			{
				for (auto& cost : value->get_childs())
				{
					auto operation = gas_schedule::from_name(cost->key);
					if (!operation)
					{
						VI_WARN("[protocol] unknown gas operation \"%s\" in schedule", cost->key.c_str());
						continue;
					}

					auto& entry = gas.schedule.at(*operation);
					configure_integer(cost, "base", entry.base);
					configure_integer(cost, "per_byte", entry.per_byte);
				}
			}
		}
		else
			path.clear();

		if (!user.logs.info_path.empty())
		{
			auto log_path = os::path::resolve(user.logs.info_path, *library, true).or_else(user.logs.info_path);
			os::directory::patch(os::path::get_directory(log_path));
			logs.info.resource = os::file::open_archive(log_path, user.logs.archive_size).or_else(nullptr);
		}

		if (!user.logs.error_path.empty())
		{
			auto log_path = os::path::resolve(user.logs.error_path, *library, true).or_else(user.logs.error_path);
			os::directory::patch(os::path::get_directory(log_path));
			logs.error.resource = os::file::open_archive(log_path, user.logs.archive_size).or_else(nullptr);
		}

		if (logs.info.resource || logs.error.resource)
		{
			error_handling::set_callback([this](error_handling::details& data)
			{
				if (data.type.level == log_level::error || data.type.level == log_level::warning || data.type.fatal)
				{
					if (logs.error.resource)
						logs.error.output(error_handling::get_message_text(data));
				}
				else if (logs.info.resource)
					logs.info.output(error_handling::get_message_text(data));
			});
		}

		instance = this;
	}
	protocol::~protocol()
	{
		error_handling::set_callback(nullptr);
		if (instance == this)
			instance = nullptr;
	}
	bool protocol::bound()
	{
		return instance != nullptr;
	}
	const protocol& protocol::now()
	{
		VI_ASSERT(instance != nullptr, "protocol parameters are not set!");
		return *instance;
	}
	protocol* protocol::instance = nullptr;
}
