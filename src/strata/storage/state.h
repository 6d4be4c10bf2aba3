#ifndef STRATA_STORAGE_STATE_H
#define STRATA_STORAGE_STATE_H
#include "../kernel/codec.h"

namespace strata
{
	namespace storage
	{
		enum class write_kind : uint8_t
		{
			create,
			modify,
			erase
		};

		struct resource_key
		{
			algorithm::account_address address;
			ledger::struct_tag tag;

			resource_key() = default;
			resource_key(const algorithm::account_address& new_address, const ledger::struct_tag& new_tag);
			string to_key() const;
			string to_string() const;
			bool operator== (const resource_key& other) const;
			bool operator< (const resource_key& other) const;
		};

		struct write_op
		{
			resource_key key;
			write_kind kind = write_kind::modify;
			string data;

			uptr<schema> as_schema() const;
			static std::string_view kind_name(write_kind kind);
		};

		struct write_set
		{
			vector<write_op> ops;

			const write_op* find(const resource_key& key) const;
			algorithm::digest256 as_hash() const;
			uptr<schema> as_schema() const;
			size_t size() const;
			bool empty() const;
		};

		class state_view
		{
		public:
			state_view() = default;
			virtual ~state_view() = default;
			virtual expects_lr<option<string>> get(const resource_key& key) = 0;
		};

		class memory_state_view : public state_view
		{
		private:
			ordered_map<string, string> resources;
			size_t reads = 0;

		public:
			memory_state_view() = default;
			virtual ~memory_state_view() override = default;
			expects_lr<option<string>> get(const resource_key& key) override;
			void set(const resource_key& key, const std::string_view& data);
			void erase(const resource_key& key);
			void apply(const write_set& changes);
			bool has(const resource_key& key) const;
			size_t get_reads() const;
		};

		class global_state
		{
		private:
			struct cache_entry
			{
				resource_key key;
				ledger::value data;
				option<write_kind> op = optional::none;
				bool exists = false;
				bool seen = false;
			};

		private:
			ordered_map<string, cache_entry> cache;
			state_view* store;
			ledger::value_codec* codec;
			ledger::type_resolver* resolver;
			bool finalized;

		public:
			global_state(state_view* new_store, ledger::value_codec* new_codec, ledger::type_resolver* new_resolver);
			global_state(const global_state&) = delete;
			global_state& operator= (const global_state&) = delete;
			expects_vm<const ledger::value*> get_resource(const algorithm::account_address& address, const ledger::struct_tag& tag);
			expects_vm<ledger::value*> borrow_resource(const algorithm::account_address& address, const ledger::struct_tag& tag);
			expects_vm<void> set_resource(const algorithm::account_address& address, const ledger::struct_tag& tag, ledger::value&& data);
			expects_vm<void> delete_resource(const algorithm::account_address& address, const ledger::struct_tag& tag);
			expects_vm<void> touch_resource(const algorithm::account_address& address, const ledger::struct_tag& tag);
			expects_vm<ledger::value> move_from(const algorithm::account_address& address, const ledger::struct_tag& tag);
			expects_vm<bool> exists(const algorithm::account_address& address, const ledger::struct_tag& tag);
			expects_vm<uint64_t> prefetch(const algorithm::account_address& address, const ledger::struct_tag& tag);
			expects_vm<write_set> finalize();
			void discard();
			bool is_finalized() const;

		private:
			expects_vm<cache_entry*> load(const resource_key& key, uint64_t* bytes_read = nullptr);
		};
	}
}
#endif
