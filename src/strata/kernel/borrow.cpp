#include "borrow.h"

namespace strata
{
	namespace ledger
	{
		borrow_tracker::borrow_tracker(value_ops* new_ops, storage::global_state* new_state) : borrow_tracker(new_ops, new_state, protocol::now().limits.max_call_depth, protocol::now().limits.max_locals)
		{
		}
		borrow_tracker::borrow_tracker(value_ops* new_ops, storage::global_state* new_state, uint32_t new_max_call_depth, uint32_t new_max_locals) : ops(new_ops), state(new_state), next_frame_id(1), next_borrow_id(1), max_call_depth(new_max_call_depth), max_locals(new_max_locals)
		{
			VI_ASSERT(ops != nullptr, "value ops should be set");
		}
		expects_vm<uint64_t> borrow_tracker::push_frame(const std::string_view& name, vector<value>&& locals)
		{
			if (frames.size() >= max_call_depth)
				return vm_exception::call_stack_overflow(stringify::text("call to %.*s exceeds %i frames", (int)name.size(), name.data(), (int)max_call_depth));
			else if (locals.size() > max_locals)
				return vm_exception::invariant_violation(stringify::text("call to %.*s declares %i locals (max: %i)", (int)name.size(), name.data(), (int)locals.size(), (int)max_locals));

			call_frame frame;
			frame.id = next_frame_id++;
			frame.name = string(name);
			frame.locals = std::move(locals);
			frames.push_back(std::move(frame));
			return frames.back().id;
		}
		expects_vm<void> borrow_tracker::pop_frame()
		{
			if (frames.empty())
				return vm_exception::invariant_violation("pop of an empty call stack");

			auto& frame = frames.back();
			for (size_t i = 0; i < frame.locals.size(); i++)
			{
				auto& local = frame.locals[i];
				if (!local.is_valid() || local.is_reference())
					continue;

				auto type = local.type_of();
				auto abilities = ops->get_resolver()->abilities_of(type);
				if (!abilities)
					return abilities.error();
				else if (!abilities->has(ability::drop))
					return vm_exception::ability_violation(stringify::text("frame %s leaves local %i of type %s without drop", frame.name.c_str(), (int)i, type.to_string().c_str()));
			}

			for (auto& local : frame.locals)
			{
				if (local.is_reference() && borrows.find(local.borrow_id) != borrows.end())
					unlink(local.borrow_id);
			}

			vector<uint64_t> invalidated;
			for (auto& [id, record] : borrows)
			{
				if (record.target.kind == location_kind::local && record.target.frame == frame.id)
					invalidated.push_back(id);
			}
			for (auto& id : invalidated)
				unlink(id);

			frames.pop_back();
			return expectation::met;
		}
		expects_vm<value> borrow_tracker::borrow_local(uint64_t frame, uint32_t slot, bool writable)
		{
			auto* target = find_frame(frame);
			if (!target)
				return vm_exception::borrow_conflict(stringify::text("frame %" PRIu64 " is not active", frame));
			else if (slot >= target->locals.size())
				return vm_exception::invariant_violation(stringify::text("local %i is out of range", (int)slot));

			auto& local = target->locals[slot];
			if (!local.is_valid())
				return vm_exception::borrow_conflict(stringify::text("local %i of frame %s is empty", (int)slot, target->name.c_str()));
			else if (local.is_reference())
				return vm_exception::invariant_violation(stringify::text("local %i of frame %s holds a reference", (int)slot, target->name.c_str()));

			return acquire(location::local(frame, slot), local.type_of(), writable);
		}
		expects_vm<value> borrow_tracker::borrow_global(const algorithm::account_address& address, const struct_tag& tag, bool writable)
		{
			if (!state)
				return vm_exception::invariant_violation("global state is not attached");

			auto resource = state->borrow_resource(address, tag);
			if (!resource)
				return resource.error();

			return acquire(location::global(address, tag), tag.as_type(), writable);
		}
		expects_vm<value> borrow_tracker::read_ref(const value& reference)
		{
			auto target = view_ref(reference);
			if (!target)
				return target.error();

			return ops->copy_value(**target);
		}
		expects_vm<const value*> borrow_tracker::view_ref(const value& reference)
		{
			auto record = validate(reference);
			if (!record)
				return record.error();

			auto target = locate(**record);
			if (!target)
				return target.error();

			return (const value*)*target;
		}
		expects_vm<value*> borrow_tracker::mutate_ref(const value& reference)
		{
			auto record = validate(reference);
			if (!record)
				return record.error();
			else if (!(*record)->writable)
				return vm_exception::borrow_conflict(stringify::text("write through a shared reference to %s", (*record)->target.to_string().c_str()));

			auto it = slots.find((*record)->target.to_key());
			if (it == slots.end() || !it->second.exclusive)
				return vm_exception::borrow_conflict(stringify::text("reference to %s is not exclusive", (*record)->target.to_string().c_str()));

			if ((*record)->target.kind == location_kind::global)
			{
				auto status = state->touch_resource((*record)->target.address, (*record)->target.resource);
				if (!status)
					return status.error();
			}

			return locate(**record);
		}
		expects_vm<void> borrow_tracker::write_ref(const value& reference, value&& data)
		{
			auto target = mutate_ref(reference);
			if (!target)
				return target.error();

			auto status = ops->check_type(data, reference.type);
			if (!status)
				return status;

			status = ops->drop_value(std::move(**target));
			if (!status)
				return status;

			**target = std::move(data);
			return expectation::met;
		}
		expects_vm<value> borrow_tracker::copy_ref(const value& reference)
		{
			auto record = validate(reference);
			if (!record)
				return record.error();
			else if ((*record)->writable)
				return vm_exception::borrow_conflict(stringify::text("exclusive reference to %s cannot be duplicated", (*record)->target.to_string().c_str()));

			auto& entry = slots[(*record)->target.to_key()];
			++entry.shared;

			borrow_record next;
			next.target = (*record)->target;
			next.writable = false;

			uint64_t id = next_borrow_id++;
			borrows[id] = next;
			return value::reference(next.target, reference.type, false, id);
		}
		expects_vm<void> borrow_tracker::release(value&& reference)
		{
			auto record = validate(reference);
			if (!record)
				return record.error();

			unlink(reference.borrow_id);
			reference = value();
			return expectation::met;
		}
		expects_vm<value> borrow_tracker::move_local(uint32_t slot)
		{
			auto* frame = get_frame();
			if (!frame)
				return vm_exception::invariant_violation("call stack is empty");
			else if (slot >= frame->locals.size())
				return vm_exception::invariant_violation(stringify::text("local %i is out of range", (int)slot));

			auto& local = frame->locals[slot];
			if (!local.is_valid())
				return vm_exception::invariant_violation(stringify::text("local %i of frame %s was already moved", (int)slot, frame->name.c_str()));
			else if (is_borrowed(location::local(frame->id, slot)))
				return vm_exception::borrow_conflict(stringify::text("move of borrowed local %i of frame %s", (int)slot, frame->name.c_str()));

			value result = std::move(local);
			local = value();
			return result;
		}
		expects_vm<value> borrow_tracker::copy_local(uint32_t slot)
		{
			auto* frame = get_frame();
			if (!frame)
				return vm_exception::invariant_violation("call stack is empty");
			else if (slot >= frame->locals.size())
				return vm_exception::invariant_violation(stringify::text("local %i is out of range", (int)slot));

			auto& local = frame->locals[slot];
			if (!local.is_valid())
				return vm_exception::invariant_violation(stringify::text("local %i of frame %s was already moved", (int)slot, frame->name.c_str()));
			else if (get_state(location::local(frame->id, slot)) == borrow_state::exclusive)
				return vm_exception::borrow_conflict(stringify::text("copy of exclusively borrowed local %i of frame %s", (int)slot, frame->name.c_str()));
			else if (local.is_reference())
				return copy_ref(local);

			return ops->copy_value(local);
		}
		expects_vm<void> borrow_tracker::store_local(uint32_t slot, value&& data)
		{
			auto* frame = get_frame();
			if (!frame)
				return vm_exception::invariant_violation("call stack is empty");
			else if (slot >= frame->locals.size())
				return vm_exception::invariant_violation(stringify::text("local %i is out of range", (int)slot));
			else if (is_borrowed(location::local(frame->id, slot)))
				return vm_exception::borrow_conflict(stringify::text("store into borrowed local %i of frame %s", (int)slot, frame->name.c_str()));

			auto& local = frame->locals[slot];
			if (local.is_reference())
			{
				auto status = release(std::move(local));
				if (!status)
					return status;
			}
			else if (local.is_valid())
			{
				auto status = ops->drop_value(std::move(local));
				if (!status)
					return status;
			}

			local = std::move(data);
			return expectation::met;
		}
		borrow_state borrow_tracker::get_state(const location& target) const
		{
			auto it = slots.find(target.to_key());
			if (it == slots.end())
				return borrow_state::free;
			else if (it->second.exclusive)
				return borrow_state::exclusive;
			else if (it->second.shared > 0)
				return borrow_state::shared;

			return borrow_state::free;
		}
		bool borrow_tracker::is_borrowed(const location& target) const
		{
			return get_state(target) != borrow_state::free;
		}
		call_frame* borrow_tracker::get_frame()
		{
			return frames.empty() ? nullptr : &frames.back();
		}
		size_t borrow_tracker::get_depth() const
		{
			return frames.size();
		}
		size_t borrow_tracker::get_live_borrows() const
		{
			return borrows.size();
		}
		call_frame* borrow_tracker::find_frame(uint64_t id)
		{
			for (auto it = frames.rbegin(); it != frames.rend(); ++it)
			{
				if (it->id == id)
					return &*it;
			}
			return nullptr;
		}
		expects_vm<value*> borrow_tracker::locate(const borrow_record& record)
		{
			if (record.target.kind == location_kind::global)
			{
				if (!state)
					return vm_exception::invariant_violation("global state is not attached");

				return state->borrow_resource(record.target.address, record.target.resource);
			}

			auto* frame = find_frame(record.target.frame);
			if (!frame || record.target.slot >= frame->locals.size())
				return vm_exception::borrow_conflict(stringify::text("reference to %s outlived its frame", record.target.to_string().c_str()));

			auto& local = frame->locals[record.target.slot];
			if (!local.is_valid())
				return vm_exception::borrow_conflict(stringify::text("reference to %s points to a moved value", record.target.to_string().c_str()));

			return &local;
		}
		expects_vm<const borrow_tracker::borrow_record*> borrow_tracker::validate(const value& reference)
		{
			if (!reference.is_reference())
				return vm_exception::type_mismatch(stringify::text("expected a reference, got %s", reference.type_of().to_string().c_str()));

			auto it = borrows.find(reference.borrow_id);
			if (it == borrows.end())
				return vm_exception::borrow_conflict(stringify::text("reference to %s is no longer valid", reference.target.to_string().c_str()));
			else if (it->second.target != reference.target || it->second.writable != reference.writable)
				return vm_exception::invariant_violation(stringify::text("reference to %s does not match its borrow", reference.target.to_string().c_str()));

			return (const borrow_record*)&it->second;
		}
		expects_vm<value> borrow_tracker::acquire(const location& target, const type_tag& referent, bool writable)
		{
			auto key = target.to_key();
			auto& entry = slots[key];
			if (entry.exclusive)
				return vm_exception::borrow_conflict(stringify::text("%s is exclusively borrowed", target.to_string().c_str()));
			else if (writable && entry.shared > 0)
				return vm_exception::borrow_conflict(stringify::text("%s has %i shared borrows", target.to_string().c_str(), (int)entry.shared));

			if (writable)
				entry.exclusive = true;
			else
				++entry.shared;

			borrow_record record;
			record.target = target;
			record.writable = writable;

			uint64_t id = next_borrow_id++;
			borrows[id] = record;
			return value::reference(target, referent, writable, id);
		}
		void borrow_tracker::unlink(uint64_t borrow_id)
		{
			auto it = borrows.find(borrow_id);
			if (it == borrows.end())
				return;

			auto key = it->second.target.to_key();
			auto entry = slots.find(key);
			if (entry != slots.end())
			{
				if (it->second.writable)
					entry->second.exclusive = false;
				else if (entry->second.shared > 0)
					--entry->second.shared;

				if (!entry->second.exclusive && !entry->second.shared)
					slots.erase(entry);
			}
			borrows.erase(it);
		}
	}
}
