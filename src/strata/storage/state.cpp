#include "state.h"

namespace strata
{
	namespace storage
	{
		resource_key::resource_key(const algorithm::account_address& new_address, const ledger::struct_tag& new_tag) : address(new_address), tag(new_tag)
		{
		}
		string resource_key::to_key() const
		{
			format::wo_stream message;
			message.write_typeless(address.data, sizeof(address.data));
			message.write_bytes(tag.to_string());
			return message.data;
		}
		string resource_key::to_string() const
		{
			return algorithm::encoding::encode_short_address(address).append("/").append(tag.to_string());
		}
		bool resource_key::operator== (const resource_key& other) const
		{
			return address == other.address && tag == other.tag;
		}
		bool resource_key::operator< (const resource_key& other) const
		{
			return to_key() < other.to_key();
		}

		uptr<schema> write_op::as_schema() const
		{
			schema* result = var::set::object();
			result->set("address", var::string(algorithm::encoding::encode_short_address(key.address)));
			result->set("type", var::string(key.tag.to_string()));
			result->set("kind", var::string(kind_name(kind)));
			result->set("data", kind == write_kind::erase ? var::null() : var::string(format::util::encode_0xhex(data)));
			return result;
		}
		std::string_view write_op::kind_name(write_kind kind)
		{
			switch (kind)
			{
				case write_kind::create:
					return "create";
				case write_kind::modify:
					return "modify";
				case write_kind::erase:
					return "delete";
				default:
					return "unknown";
			}
		}

		const write_op* write_set::find(const resource_key& key) const
		{
			for (auto& op : ops)
			{
				if (op.key == key)
					return &op;
			}
			return nullptr;
		}
		algorithm::digest256 write_set::as_hash() const
		{
			format::wo_stream message;
			message.write_uleb128((uint32_t)ops.size());
			for (auto& op : ops)
			{
				message.write_bytes(op.key.to_key());
				message.write_u8((uint8_t)op.kind);
				if (op.kind != write_kind::erase)
					message.write_bytes(op.data);
			}
			return algorithm::hashing::hash256(message.data);
		}
		uptr<schema> write_set::as_schema() const
		{
			schema* result = var::set::array();
			for (auto& op : ops)
				result->push(op.as_schema().reset());
			return result;
		}
		size_t write_set::size() const
		{
			return ops.size();
		}
		bool write_set::empty() const
		{
			return ops.empty();
		}

		expects_lr<option<string>> memory_state_view::get(const resource_key& key)
		{
			++reads;
			auto it = resources.find(key.to_key());
			if (it == resources.end())
				return option<string>(optional::none);

			return option<string>(it->second);
		}
		void memory_state_view::set(const resource_key& key, const std::string_view& data)
		{
			resources[key.to_key()] = string(data);
		}
		void memory_state_view::erase(const resource_key& key)
		{
			resources.erase(key.to_key());
		}
		void memory_state_view::apply(const write_set& changes)
		{
			for (auto& op : changes.ops)
			{
				if (op.kind == write_kind::erase)
					erase(op.key);
				else
					set(op.key, op.data);
			}
		}
		bool memory_state_view::has(const resource_key& key) const
		{
			return resources.find(key.to_key()) != resources.end();
		}
		size_t memory_state_view::get_reads() const
		{
			return reads;
		}

		global_state::global_state(state_view* new_store, ledger::value_codec* new_codec, ledger::type_resolver* new_resolver) : store(new_store), codec(new_codec), resolver(new_resolver), finalized(false)
		{
			VI_ASSERT(codec != nullptr, "codec should be set");
			VI_ASSERT(resolver != nullptr, "resolver should be set");
		}
		expects_vm<const ledger::value*> global_state::get_resource(const algorithm::account_address& address, const ledger::struct_tag& tag)
		{
			auto entry = load(resource_key(address, tag));
			if (!entry)
				return entry.error();
			else if (!(*entry)->exists)
				return vm_exception::resource_does_not_exist(stringify::text("resource %s does not exist", (*entry)->key.to_string().c_str()));

			return (const ledger::value*)&(*entry)->data;
		}
		expects_vm<ledger::value*> global_state::borrow_resource(const algorithm::account_address& address, const ledger::struct_tag& tag)
		{
			auto entry = load(resource_key(address, tag));
			if (!entry)
				return entry.error();
			else if (!(*entry)->exists)
				return vm_exception::resource_does_not_exist(stringify::text("resource %s does not exist", (*entry)->key.to_string().c_str()));

			return &(*entry)->data;
		}
		expects_vm<void> global_state::set_resource(const algorithm::account_address& address, const ledger::struct_tag& tag, ledger::value&& data)
		{
			if (finalized)
				return vm_exception::invariant_violation("write to a finalized state");

			auto type = tag.as_type();
			auto abilities = resolver->abilities_of(type);
			if (!abilities)
				return abilities.error();
			else if (!abilities->has(ledger::ability::key))
				return vm_exception::ability_violation(stringify::text("type %s cannot be stored globally", type.to_string().c_str()));
			else if (data.is_reference() || data.type_of() != type)
				return vm_exception::type_mismatch(stringify::text("expected %s, got %s", type.to_string().c_str(), data.is_reference() ? "a reference" : data.type_of().to_string().c_str()));

			auto entry = load(resource_key(address, tag));
			if (!entry)
				return entry.error();

			auto* target = *entry;
			target->op = target->seen ? write_kind::modify : write_kind::create;
			target->data = std::move(data);
			target->exists = true;
			target->seen = true;
			return expectation::met;
		}
		expects_vm<void> global_state::delete_resource(const algorithm::account_address& address, const ledger::struct_tag& tag)
		{
			if (finalized)
				return vm_exception::invariant_violation("write to a finalized state");

			auto entry = load(resource_key(address, tag));
			if (!entry)
				return entry.error();

			auto* target = *entry;
			if (!target->exists)
				return vm_exception::resource_does_not_exist(stringify::text("resource %s does not exist", target->key.to_string().c_str()));

			target->op = write_kind::erase;
			target->data = ledger::value();
			target->exists = false;
			return expectation::met;
		}
		expects_vm<void> global_state::touch_resource(const algorithm::account_address& address, const ledger::struct_tag& tag)
		{
			if (finalized)
				return vm_exception::invariant_violation("write to a finalized state");

			auto entry = load(resource_key(address, tag));
			if (!entry)
				return entry.error();

			auto* target = *entry;
			if (!target->exists)
				return vm_exception::resource_does_not_exist(stringify::text("resource %s does not exist", target->key.to_string().c_str()));
			else if (!target->op)
				target->op = write_kind::modify;

			return expectation::met;
		}
		expects_vm<ledger::value> global_state::move_from(const algorithm::account_address& address, const ledger::struct_tag& tag)
		{
			if (finalized)
				return vm_exception::invariant_violation("write to a finalized state");

			auto entry = load(resource_key(address, tag));
			if (!entry)
				return entry.error();

			auto* target = *entry;
			if (!target->exists)
				return vm_exception::resource_does_not_exist(stringify::text("resource %s does not exist", target->key.to_string().c_str()));

			ledger::value result = std::move(target->data);
			target->data = ledger::value();
			target->op = write_kind::erase;
			target->exists = false;
			return result;
		}
		expects_vm<bool> global_state::exists(const algorithm::account_address& address, const ledger::struct_tag& tag)
		{
			auto entry = load(resource_key(address, tag));
			if (!entry)
				return entry.error();

			return (*entry)->exists;
		}
		expects_vm<uint64_t> global_state::prefetch(const algorithm::account_address& address, const ledger::struct_tag& tag)
		{
			uint64_t bytes_read = 0;
			auto entry = load(resource_key(address, tag), &bytes_read);
			if (!entry)
				return entry.error();

			return bytes_read;
		}
		expects_vm<write_set> global_state::finalize()
		{
			if (finalized)
				return vm_exception::invariant_violation("write set was already finalized");

			finalized = true;
			write_set result;
			for (auto& [key, entry] : cache)
			{
				if (!entry.op)
					continue;

				write_op op;
				op.key = entry.key;
				op.kind = *entry.op;
				if (op.kind != write_kind::erase)
				{
					auto data = codec->encode(entry.data, entry.key.tag.as_type());
					if (!data)
						return data.error();

					op.data = std::move(*data);
				}
				result.ops.push_back(std::move(op));
			}
			return result;
		}
		void global_state::discard()
		{
			cache.clear();
		}
		bool global_state::is_finalized() const
		{
			return finalized;
		}
		expects_vm<global_state::cache_entry*> global_state::load(const resource_key& key, uint64_t* bytes_read)
		{
			auto index = key.to_key();
			auto it = cache.find(index);
			if (it != cache.end())
				return &it->second;

			cache_entry entry;
			entry.key = key;
			if (store != nullptr)
			{
				auto data = store->get(key);
				if (!data)
				{
					VI_ERR("resource %s load failed: %s", key.to_string().c_str(), data.error().what());
					return vm_exception::invariant_violation(stringify::text("storage failure on %s: %s", key.to_string().c_str(), data.error().what())).escalate();
				}
				else if (*data)
				{
					auto decoded = codec->decode(**data, key.tag.as_type());
					if (!decoded)
					{
						VI_ERR("resource %s is not canonical in storage: %s", key.to_string().c_str(), decoded.error().what());
						return decoded.error().escalate();
					}

					if (bytes_read != nullptr)
						*bytes_read = (uint64_t)(*data)->size();
					entry.data = std::move(*decoded);
					entry.exists = true;
					entry.seen = true;
				}
			}

			auto* result = &cache.emplace(index, std::move(entry)).first->second;
			return result;
		}
	}
}
