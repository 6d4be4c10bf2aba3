#include "session.h"

namespace strata
{
	namespace ledger
	{
		uptr<schema> execution_result::as_schema() const
		{
			schema* data = var::set::object();
			data->set("status", var::string(status_name(status)));
			data->set("gas_used", var::integer((int64_t)gas_used));
			if (error)
			{
				auto* reason = data->set("error", var::set::object());
				reason->set("status", var::string(vm_exception::status_name(error->status())));
				reason->set("message", var::string(error->text()));
				reason->set("invariant", var::boolean(error->is_invariant_violation()));
			}
			else
				data->set("error", var::null());
			data->set("changes", changes.as_schema().reset());
			data->set("changes_hash", var::string(format::util::encode_0xhex(changes.as_hash().view())));
			return data;
		}
		std::string_view execution_result::status_name(execution_status status)
		{
			switch (status)
			{
				case execution_status::executing:
					return "executing";
				case execution_status::success:
					return "success";
				case execution_status::failed:
					return "failed";
				case execution_status::faulted:
					return "faulted";
				default:
					return "unknown";
			}
		}

		transaction_session::transaction_session(module_provider* provider, storage::state_view* store, uint64_t gas_limit) :
			limits(protocol::now().limits),
			resolver(provider, limits.max_type_depth, limits.max_type_arguments),
			ops(&resolver, limits.max_vector_length),
			codec(&resolver, limits.max_value_size, limits.max_vector_length),
			meter(protocol::now().gas, gas_limit),
			state(store, &codec, &resolver),
			borrows(&ops, &state, limits.max_call_depth, limits.max_locals),
			status(execution_status::executing),
			error(optional::none),
			logging(protocol::now().user.logs.execution_logging)
		{
		}
		expects_vm<void> transaction_session::charge_intrinsic(uint64_t transaction_size)
		{
			auto& config = protocol::now().gas;
			auto budget = gas_meter::validate_budget(config, meter.get_gas_limit(), transaction_size);
			if (!budget)
				return complete(std::move(budget));

			auto intrinsic = gas_meter::calculate_intrinsic_gas(config, transaction_size);
			if (!intrinsic)
				return complete(expects_vm<void>(intrinsic.error()));

			return complete(meter.charge_units(uint256_t(*intrinsic)));
		}
		expects_vm<ability_set> transaction_session::load_type(const type_tag& type)
		{
			auto charge = begin(gas_operation::call, 0);
			if (!charge)
				return charge.error();

			auto verification = resolver.verify_type(type);
			if (!verification)
				return complete(expects_vm<ability_set>(verification.error()));

			return complete(resolver.abilities_of(type));
		}
		expects_vm<value> transaction_session::pack(const struct_tag& tag, vector<value>&& fields)
		{
			uint64_t size = 0;
			for (auto& field : fields)
				size += field.size_of();

			auto charge = begin(gas_operation::pack, size);
			if (!charge)
				return charge.error();

			return complete(ops.pack(tag, std::move(fields)));
		}
		expects_vm<vector<value>> transaction_session::unpack(value&& target, const struct_tag& expected)
		{
			auto charge = begin(gas_operation::unpack, target.size_of());
			if (!charge)
				return charge.error();

			return complete(ops.unpack(std::move(target), expected));
		}
		expects_vm<value> transaction_session::copy_value(const value& target)
		{
			auto charge = begin(gas_operation::copy, target.size_of());
			if (!charge)
				return charge.error();

			return complete(ops.copy_value(target));
		}
		expects_vm<void> transaction_session::drop_value(value&& target)
		{
			auto charge = begin(gas_operation::drop, 0);
			if (!charge)
				return charge;

			if (target.is_reference())
				return complete(borrows.release(std::move(target)));

			return complete(ops.drop_value(std::move(target)));
		}
		expects_vm<bool> transaction_session::equals(const value& left, const value& right)
		{
			auto charge = begin(gas_operation::equality, left.size_of() + right.size_of());
			if (!charge)
				return charge.error();

			return value_ops::structural_equals(left, right);
		}
		expects_vm<value> transaction_session::pack_vector(const type_tag& element, vector<value>&& elements)
		{
			uint64_t size = 0;
			for (auto& item : elements)
				size += item.size_of();

			auto charge = begin(gas_operation::vector_pack, size);
			if (!charge)
				return charge.error();

			return complete(ops.pack_vector(element, std::move(elements)));
		}
		expects_vm<vector<value>> transaction_session::unpack_vector(value&& target, const type_tag& element, uint64_t expected_length)
		{
			auto charge = begin(gas_operation::vector_unpack, target.size_of());
			if (!charge)
				return charge.error();

			return complete(ops.unpack_vector(std::move(target), element, expected_length));
		}
		expects_vm<uint64_t> transaction_session::vector_length(const value& reference, const type_tag& element)
		{
			auto charge = begin(gas_operation::vector_length, 0);
			if (!charge)
				return charge.error();

			auto target = borrows.view_ref(reference);
			if (!target)
				return complete(expects_vm<uint64_t>(target.error()));

			return complete(ops.vector_length(**target, element));
		}
		expects_vm<void> transaction_session::vector_push_back(const value& reference, const type_tag& element, value&& item)
		{
			auto charge = begin(gas_operation::vector_push_back, item.size_of());
			if (!charge)
				return charge;

			auto target = borrows.mutate_ref(reference);
			if (!target)
				return complete(expects_vm<void>(target.error()));

			return complete(ops.vector_push_back(**target, element, std::move(item)));
		}
		expects_vm<value> transaction_session::vector_pop_back(const value& reference, const type_tag& element)
		{
			auto charge = begin(gas_operation::vector_pop_back, 0);
			if (!charge)
				return charge.error();

			auto target = borrows.mutate_ref(reference);
			if (!target)
				return complete(expects_vm<value>(target.error()));

			return complete(ops.vector_pop_back(**target, element));
		}
		expects_vm<void> transaction_session::vector_swap(const value& reference, const type_tag& element, uint64_t left, uint64_t right)
		{
			auto charge = begin(gas_operation::vector_swap, 0);
			if (!charge)
				return charge;

			auto target = borrows.mutate_ref(reference);
			if (!target)
				return complete(expects_vm<void>(target.error()));

			return complete(ops.vector_swap(**target, element, left, right));
		}
		expects_vm<void> transaction_session::vector_destroy_empty(value&& target, const type_tag& element)
		{
			auto charge = begin(gas_operation::vector_destroy_empty, 0);
			if (!charge)
				return charge;

			return complete(ops.vector_destroy_empty(std::move(target), element));
		}
		expects_vm<uint64_t> transaction_session::call(const std::string_view& name, vector<value>&& locals)
		{
			auto charge = begin(gas_operation::call, 0);
			if (!charge)
				return charge.error();

			return complete(borrows.push_frame(name, std::move(locals)));
		}
		expects_vm<void> transaction_session::ret()
		{
			auto charge = begin(gas_operation::ret, 0);
			if (!charge)
				return charge;

			return complete(borrows.pop_frame());
		}
		expects_vm<value> transaction_session::move_local(uint32_t slot)
		{
			auto charge = begin(gas_operation::move_local, 0);
			if (!charge)
				return charge.error();

			return complete(borrows.move_local(slot));
		}
		expects_vm<value> transaction_session::copy_local(uint32_t slot)
		{
			auto* frame = borrows.get_frame();
			auto size = frame != nullptr && slot < frame->locals.size() ? frame->locals[slot].size_of() : 0;
			auto charge = begin(gas_operation::copy_local, size);
			if (!charge)
				return charge.error();

			return complete(borrows.copy_local(slot));
		}
		expects_vm<void> transaction_session::store_local(uint32_t slot, value&& data)
		{
			auto charge = begin(gas_operation::store_local, 0);
			if (!charge)
				return charge;

			return complete(borrows.store_local(slot, std::move(data)));
		}
		expects_vm<value> transaction_session::borrow_local(uint32_t slot, bool writable)
		{
			auto charge = begin(gas_operation::borrow_local, 0);
			if (!charge)
				return charge.error();

			auto* frame = borrows.get_frame();
			if (!frame)
				return complete(expects_vm<value>(vm_exception::invariant_violation("call stack is empty")));

			return complete(borrows.borrow_local(frame->id, slot, writable));
		}
		expects_vm<value> transaction_session::borrow_global(const algorithm::account_address& address, const struct_tag& tag, bool writable)
		{
			auto charge = begin(gas_operation::borrow_global, 0);
			if (!charge)
				return charge.error();

			auto loading = load(address, tag);
			if (!loading)
				return loading.error();

			return complete(borrows.borrow_global(address, tag, writable));
		}
		expects_vm<value> transaction_session::read_ref(const value& reference)
		{
			auto target = borrows.view_ref(reference);
			auto charge = begin(gas_operation::read_ref, target ? (*target)->size_of() : 0);
			if (!charge)
				return charge.error();

			return complete(borrows.read_ref(reference));
		}
		expects_vm<void> transaction_session::write_ref(const value& reference, value&& data)
		{
			auto charge = begin(gas_operation::write_ref, data.size_of());
			if (!charge)
				return charge;

			return complete(borrows.write_ref(reference, std::move(data)));
		}
		expects_vm<void> transaction_session::release_ref(value&& reference)
		{
			auto charge = begin(gas_operation::release_ref, 0);
			if (!charge)
				return charge;

			return complete(borrows.release(std::move(reference)));
		}
		expects_vm<string> transaction_session::serialize(const value& target, const type_tag& type)
		{
			auto charge = begin(gas_operation::serialize, target.size_of());
			if (!charge)
				return charge.error();

			return complete(codec.encode(target, type));
		}
		expects_vm<value> transaction_session::deserialize(const std::string_view& data, const type_tag& type)
		{
			auto charge = begin(gas_operation::deserialize, data.size());
			if (!charge)
				return charge.error();

			return complete(codec.decode(data, type));
		}
		expects_vm<algorithm::digest256> transaction_session::hash(const value& target, const type_tag& type)
		{
			auto charge = begin(gas_operation::hash, target.size_of());
			if (!charge)
				return charge.error();

			return complete(codec.hash(target, type));
		}
		expects_vm<bool> transaction_session::exists(const algorithm::account_address& address, const struct_tag& tag)
		{
			auto charge = begin(gas_operation::exists, 0);
			if (!charge)
				return charge.error();

			auto loading = load(address, tag);
			if (!loading)
				return loading.error();

			return complete(state.exists(address, tag));
		}
		expects_vm<const value*> transaction_session::get_resource(const algorithm::account_address& address, const struct_tag& tag)
		{
			auto charge = begin(gas_operation::borrow_global, 0);
			if (!charge)
				return charge.error();

			auto loading = load(address, tag);
			if (!loading)
				return loading.error();

			return complete(state.get_resource(address, tag));
		}
		expects_vm<void> transaction_session::move_to(const algorithm::account_address& address, const struct_tag& tag, value&& data)
		{
			auto charge = begin(gas_operation::move_to, data.size_of());
			if (!charge)
				return charge;

			auto loading = load(address, tag);
			if (!loading)
				return loading;

			auto present = state.exists(address, tag);
			if (!present)
				return complete(expects_vm<void>(present.error()));
			else if (*present)
				return complete(expects_vm<void>(vm_exception::resource_already_exists(stringify::text("resource %s already exists at %s", tag.to_string().c_str(), algorithm::encoding::encode_short_address(address).c_str()))));

			return complete(state.set_resource(address, tag, std::move(data)));
		}
		expects_vm<value> transaction_session::move_from(const algorithm::account_address& address, const struct_tag& tag)
		{
			auto loading = load(address, tag);
			if (!loading)
				return loading.error();

			auto resource = state.get_resource(address, tag);
			auto charge = begin(gas_operation::move_from, resource ? (*resource)->size_of() : 0);
			if (!charge)
				return charge.error();

			auto borrowed = ensure_unborrowed(address, tag);
			if (!borrowed)
				return borrowed.error();

			return complete(state.move_from(address, tag));
		}
		expects_vm<void> transaction_session::set_resource(const algorithm::account_address& address, const struct_tag& tag, value&& data)
		{
			auto charge = begin(gas_operation::move_to, data.size_of());
			if (!charge)
				return charge;

			auto loading = load(address, tag);
			if (!loading)
				return loading;

			auto borrowed = ensure_unborrowed(address, tag);
			if (!borrowed)
				return borrowed;

			return complete(state.set_resource(address, tag, std::move(data)));
		}
		expects_vm<void> transaction_session::delete_resource(const algorithm::account_address& address, const struct_tag& tag)
		{
			auto charge = begin(gas_operation::move_from, 0);
			if (!charge)
				return charge;

			auto loading = load(address, tag);
			if (!loading)
				return loading;

			auto borrowed = ensure_unborrowed(address, tag);
			if (!borrowed)
				return borrowed;

			return complete(state.delete_resource(address, tag));
		}
		execution_result transaction_session::finish()
		{
			if (status == execution_status::executing)
			{
				auto changes = state.finalize();
				if (changes)
				{
					status = execution_status::success;
					execution_result result;
					result.status = status;
					result.gas_used = meter.get_gas_used();
					result.changes = std::move(*changes);
					if (logging)
						VI_DEBUG("session finished (gas: %" PRIu64 ", changes: %i)", result.gas_used, (int)result.changes.size());
					return result;
				}

				abort(changes.error());
			}
			else if (status == execution_status::success)
			{
				status = execution_status::faulted;
				error = vm_exception::invariant_violation("session was already finished");
				VI_ERR("%s", error->as_string().c_str());
			}

			execution_result result;
			result.status = status;
			result.error = error;
			result.gas_used = meter.get_gas_used();
			return result;
		}
		void transaction_session::abort(const vm_exception& reason)
		{
			if (status != execution_status::executing)
				return;

			error = reason;
			status = reason.is_invariant_violation() ? execution_status::faulted : execution_status::failed;
			state.discard();
			if (status == execution_status::faulted)
				VI_ERR("session faulted: %s", reason.as_string().c_str());
			else if (logging)
				VI_DEBUG("session failed: %s (gas: %" PRIu64 ")", reason.as_string().c_str(), meter.get_gas_used());
		}
		execution_status transaction_session::get_status() const
		{
			return status;
		}
		const option<vm_exception>& transaction_session::get_error() const
		{
			return error;
		}
		gas_meter& transaction_session::get_gas()
		{
			return meter;
		}
		type_resolver& transaction_session::get_resolver()
		{
			return resolver;
		}
		value_ops& transaction_session::get_ops()
		{
			return ops;
		}
		borrow_tracker& transaction_session::get_borrows()
		{
			return borrows;
		}
		expects_vm<void> transaction_session::begin(gas_operation operation, uint64_t operand_size)
		{
			if (status != execution_status::executing)
				return error ? *error : vm_exception::invariant_violation("session is not executing");

			return complete(meter.charge(operation, operand_size));
		}
		expects_vm<void> transaction_session::load(const algorithm::account_address& address, const struct_tag& tag)
		{
			if (status != execution_status::executing)
				return error ? *error : vm_exception::invariant_violation("session is not executing");

			auto bytes_read = state.prefetch(address, tag);
			if (!bytes_read)
				return complete(expects_vm<void>(bytes_read.error()));
			else if (!*bytes_read)
				return expectation::met;

			return complete(meter.charge(gas_operation::resource_load, *bytes_read));
		}
		expects_vm<void> transaction_session::ensure_unborrowed(const algorithm::account_address& address, const struct_tag& tag)
		{
			if (!borrows.is_borrowed(location::global(address, tag)))
				return expectation::met;

			return complete(expects_vm<void>(vm_exception::borrow_conflict(stringify::text("resource %s at %s is borrowed", tag.to_string().c_str(), algorithm::encoding::encode_short_address(address).c_str()))));
		}
	}
}
