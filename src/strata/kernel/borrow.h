#ifndef STRATA_KERNEL_BORROW_H
#define STRATA_KERNEL_BORROW_H
#include "../storage/state.h"

namespace strata
{
	namespace ledger
	{
		enum class borrow_state : uint8_t
		{
			free,
			shared,
			exclusive
		};

		struct call_frame
		{
			uint64_t id = 0;
			string name;
			vector<value> locals;
		};

		class borrow_tracker
		{
		private:
			struct slot_entry
			{
				uint32_t shared = 0;
				bool exclusive = false;
			};

			struct borrow_record
			{
				location target;
				bool writable = false;
			};

		private:
			vector<call_frame> frames;
			unordered_map<string, slot_entry> slots;
			unordered_map<uint64_t, borrow_record> borrows;
			value_ops* ops;
			storage::global_state* state;
			uint64_t next_frame_id;
			uint64_t next_borrow_id;
			uint32_t max_call_depth;
			uint32_t max_locals;

		public:
			borrow_tracker(value_ops* new_ops, storage::global_state* new_state);
			borrow_tracker(value_ops* new_ops, storage::global_state* new_state, uint32_t new_max_call_depth, uint32_t new_max_locals);
			expects_vm<uint64_t> push_frame(const std::string_view& name, vector<value>&& locals);
			expects_vm<void> pop_frame();
			expects_vm<value> borrow_local(uint64_t frame, uint32_t slot, bool writable);
			expects_vm<value> borrow_global(const algorithm::account_address& address, const struct_tag& tag, bool writable);
			expects_vm<value> read_ref(const value& reference);
			expects_vm<const value*> view_ref(const value& reference);
			expects_vm<value*> mutate_ref(const value& reference);
			expects_vm<void> write_ref(const value& reference, value&& data);
			expects_vm<value> copy_ref(const value& reference);
			expects_vm<void> release(value&& reference);
			expects_vm<value> move_local(uint32_t slot);
			expects_vm<value> copy_local(uint32_t slot);
			expects_vm<void> store_local(uint32_t slot, value&& data);
			borrow_state get_state(const location& target) const;
			bool is_borrowed(const location& target) const;
			call_frame* get_frame();
			size_t get_depth() const;
			size_t get_live_borrows() const;

		private:
			call_frame* find_frame(uint64_t id);
			expects_vm<value*> locate(const borrow_record& record);
			expects_vm<const borrow_record*> validate(const value& reference);
			expects_vm<value> acquire(const location& target, const type_tag& referent, bool writable);
			void unlink(uint64_t borrow_id);
		};
	}
}
#endif
