#ifndef STRATA_KERNEL_GAS_H
#define STRATA_KERNEL_GAS_H
#include "chain.h"

namespace strata
{
	namespace ledger
	{
		class gas_meter
		{
		private:
			protocol::protocol_gas_config config;
			uint256_t gas_limit;
			uint256_t gas_used;
			bool exhausted;

		public:
			gas_meter(uint64_t limit);
			gas_meter(const protocol::protocol_gas_config& new_config, uint64_t limit);
			expects_vm<void> charge(gas_operation operation, uint64_t operand_size);
			expects_vm<void> charge_units(const uint256_t& units);
			uint256_t cost_of(gas_operation operation, uint64_t operand_size) const;
			uint64_t get_gas_used() const;
			uint64_t get_gas_left() const;
			uint64_t get_gas_limit() const;
			bool is_exhausted() const;
			const gas_schedule& get_schedule() const;
			uptr<schema> as_schema() const;

		public:
			static expects_vm<uint64_t> calculate_intrinsic_gas(const protocol::protocol_gas_config& config, uint64_t transaction_size);
			static expects_vm<void> validate_budget(const protocol::protocol_gas_config& config, uint64_t limit, uint64_t transaction_size);
		};
	}
}
#endif
