#include "gas.h"

namespace strata
{
	namespace ledger
	{
		gas_meter::gas_meter(uint64_t limit) : gas_meter(protocol::now().gas, limit)
		{
		}
		gas_meter::gas_meter(const protocol::protocol_gas_config& new_config, uint64_t limit) : config(new_config), gas_limit(limit), gas_used(0), exhausted(false)
		{
		}
		expects_vm<void> gas_meter::charge(gas_operation operation, uint64_t operand_size)
		{
			if (operation >= gas_operation::count)
				return vm_exception::invariant_violation("unknown gas operation");

			return charge_units(cost_of(operation, operand_size));
		}
		expects_vm<void> gas_meter::charge_units(const uint256_t& units)
		{
			if (exhausted)
				return vm_exception::out_of_gas("gas budget is exhausted");

			gas_used += units;
			if (gas_used <= gas_limit)
				return expectation::met;

			gas_used = gas_limit;
			exhausted = true;
			return vm_exception::out_of_gas(stringify::text("ran out of gas (limit: %s)", gas_limit.to_string().c_str()));
		}
		uint256_t gas_meter::cost_of(gas_operation operation, uint64_t operand_size) const
		{
			auto& cost = config.schedule.at(operation);
			return uint256_t(cost.base) + uint256_t(cost.per_byte) * uint256_t(operand_size);
		}
		uint64_t gas_meter::get_gas_used() const
		{
			return (uint64_t)gas_used;
		}
		uint64_t gas_meter::get_gas_left() const
		{
			return (uint64_t)(gas_limit - gas_used);
		}
		uint64_t gas_meter::get_gas_limit() const
		{
			return (uint64_t)gas_limit;
		}
		bool gas_meter::is_exhausted() const
		{
			return exhausted;
		}
		const gas_schedule& gas_meter::get_schedule() const
		{
			return config.schedule;
		}
		uptr<schema> gas_meter::as_schema() const
		{
			schema* data = var::set::object();
			data->set("gas_limit", var::integer((int64_t)get_gas_limit()));
			data->set("gas_used", var::integer((int64_t)get_gas_used()));
			data->set("gas_left", var::integer((int64_t)get_gas_left()));
			data->set("exhausted", var::boolean(exhausted));
			return data;
		}
		expects_vm<uint64_t> gas_meter::calculate_intrinsic_gas(const protocol::protocol_gas_config& config, uint64_t transaction_size)
		{
			if (transaction_size > config.max_transaction_size)
				return vm_exception::value_too_large(stringify::text("transaction of %" PRIu64 " bytes exceeds %" PRIu64 " bytes", transaction_size, config.max_transaction_size));

			uint256_t result = uint256_t(config.min_transaction_gas_units);
			if (transaction_size > config.large_transaction_cutoff)
				result += uint256_t(transaction_size - config.large_transaction_cutoff) * uint256_t(config.intrinsic_gas_per_byte);
			if (result > uint256_t(std::numeric_limits<uint64_t>::max()))
				return vm_exception::invariant_violation("intrinsic gas overflows");

			return (uint64_t)result;
		}
		expects_vm<void> gas_meter::validate_budget(const protocol::protocol_gas_config& config, uint64_t limit, uint64_t transaction_size)
		{
			if (limit > config.maximum_number_of_gas_units)
				return vm_exception::value_too_large(stringify::text("gas budget %" PRIu64 " exceeds %" PRIu64 " units", limit, config.maximum_number_of_gas_units));

			auto intrinsic = calculate_intrinsic_gas(config, transaction_size);
			if (!intrinsic)
				return intrinsic.error();
			else if (limit < *intrinsic)
				return vm_exception::out_of_gas(stringify::text("gas budget %" PRIu64 " is below the intrinsic cost %" PRIu64, limit, *intrinsic));

			return expectation::met;
		}
	}
}
