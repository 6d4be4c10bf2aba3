#ifndef STRATA_KERNEL_SESSION_H
#define STRATA_KERNEL_SESSION_H
#include "borrow.h"
#include "gas.h"

namespace strata
{
	namespace ledger
	{
		enum class execution_status : uint8_t
		{
			executing,
			success,
			failed,
			faulted
		};

		struct execution_result
		{
			execution_status status = execution_status::executing;
			option<vm_exception> error = optional::none;
			uint64_t gas_used = 0;
			storage::write_set changes;

			uptr<schema> as_schema() const;
			static std::string_view status_name(execution_status status);
		};

		/*
		* One transaction execution: resolver, values, codec, gas, call stack and global state.
		* Every operation is charged before it runs. The first error aborts the execution,
		* pending writes are dropped and gas spent so far stays charged.
		*/
		class transaction_session
		{
		private:
			protocol::protocol_limits_config limits;
			type_resolver resolver;
			value_ops ops;
			value_codec codec;
			gas_meter meter;
			storage::global_state state;
			borrow_tracker borrows;
			execution_status status;
			option<vm_exception> error;
			bool logging;

		public:
			transaction_session(module_provider* provider, storage::state_view* store, uint64_t gas_limit);
			transaction_session(const transaction_session&) = delete;
			transaction_session& operator= (const transaction_session&) = delete;
			expects_vm<void> charge_intrinsic(uint64_t transaction_size);
			expects_vm<ability_set> load_type(const type_tag& type);
			expects_vm<value> pack(const struct_tag& tag, vector<value>&& fields);
			expects_vm<vector<value>> unpack(value&& target, const struct_tag& expected);
			expects_vm<value> copy_value(const value& target);
			expects_vm<void> drop_value(value&& target);
			expects_vm<bool> equals(const value& left, const value& right);
			expects_vm<value> pack_vector(const type_tag& element, vector<value>&& elements);
			expects_vm<vector<value>> unpack_vector(value&& target, const type_tag& element, uint64_t expected_length);
			expects_vm<uint64_t> vector_length(const value& reference, const type_tag& element);
			expects_vm<void> vector_push_back(const value& reference, const type_tag& element, value&& item);
			expects_vm<value> vector_pop_back(const value& reference, const type_tag& element);
			expects_vm<void> vector_swap(const value& reference, const type_tag& element, uint64_t left, uint64_t right);
			expects_vm<void> vector_destroy_empty(value&& target, const type_tag& element);
			expects_vm<uint64_t> call(const std::string_view& name, vector<value>&& locals);
			expects_vm<void> ret();
			expects_vm<value> move_local(uint32_t slot);
			expects_vm<value> copy_local(uint32_t slot);
			expects_vm<void> store_local(uint32_t slot, value&& data);
			expects_vm<value> borrow_local(uint32_t slot, bool writable);
			expects_vm<value> borrow_global(const algorithm::account_address& address, const struct_tag& tag, bool writable);
			expects_vm<value> read_ref(const value& reference);
			expects_vm<void> write_ref(const value& reference, value&& data);
			expects_vm<void> release_ref(value&& reference);
			expects_vm<string> serialize(const value& target, const type_tag& type);
			expects_vm<value> deserialize(const std::string_view& data, const type_tag& type);
			expects_vm<algorithm::digest256> hash(const value& target, const type_tag& type);
			expects_vm<bool> exists(const algorithm::account_address& address, const struct_tag& tag);
			expects_vm<const value*> get_resource(const algorithm::account_address& address, const struct_tag& tag);
			expects_vm<void> move_to(const algorithm::account_address& address, const struct_tag& tag, value&& data);
			expects_vm<value> move_from(const algorithm::account_address& address, const struct_tag& tag);
			expects_vm<void> set_resource(const algorithm::account_address& address, const struct_tag& tag, value&& data);
			expects_vm<void> delete_resource(const algorithm::account_address& address, const struct_tag& tag);
			execution_result finish();
			void abort(const vm_exception& reason);
			execution_status get_status() const;
			const option<vm_exception>& get_error() const;
			gas_meter& get_gas();
			type_resolver& get_resolver();
			value_ops& get_ops();
			borrow_tracker& get_borrows();

		private:
			expects_vm<void> begin(gas_operation operation, uint64_t operand_size);
			expects_vm<void> load(const algorithm::account_address& address, const struct_tag& tag);
			expects_vm<void> ensure_unborrowed(const algorithm::account_address& address, const struct_tag& tag);
			template <typename t>
			expects_vm<t> complete(expects_vm<t>&& result)
			{
				if (!result)
					abort(result.error());
				return std::move(result);
			}
		};
	}
}
#endif
