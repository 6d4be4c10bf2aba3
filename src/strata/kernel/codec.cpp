#include "codec.h"

namespace strata
{
	namespace ledger
	{
		static const uint32_t max_sequence_length = 0x7fffffff;

		value_codec::value_codec(type_resolver* new_resolver) : resolver(new_resolver), max_value_size(protocol::now().limits.max_value_size), max_vector_length(protocol::now().limits.max_vector_length)
		{
			VI_ASSERT(resolver != nullptr, "resolver should be set");
		}
		value_codec::value_codec(type_resolver* new_resolver, uint64_t new_max_value_size, uint64_t new_max_vector_length) : resolver(new_resolver), max_value_size(new_max_value_size), max_vector_length(new_max_vector_length)
		{
			VI_ASSERT(resolver != nullptr, "resolver should be set");
		}
		expects_vm<string> value_codec::encode(const value& target, const type_tag& type)
		{
			format::wo_stream message;
			auto status = encode_value(message, target, type, 1);
			if (!status)
				return status.error();
			else if (message.data.size() > max_value_size)
				return vm_exception::value_too_large(stringify::text("encoding of %s takes %i bytes (max: %" PRIu64 ")", type.to_string().c_str(), (int)message.data.size(), max_value_size));

			return std::move(message.data);
		}
		expects_vm<value> value_codec::decode(const std::string_view& data, const type_tag& type)
		{
			if (data.size() > max_value_size)
				return vm_exception::deserialization_error(stringify::text("input of %i bytes exceeds %" PRIu64 " bytes", (int)data.size(), max_value_size));

			format::ro_stream message = format::ro_stream(data);
			auto result = decode_value(message, type, 1);
			if (!result)
				return result;
			else if (!message.is_eof())
				return vm_exception::deserialization_error(stringify::text("%i trailing bytes after %s", (int)message.remaining(), type.to_string().c_str()));

			return result;
		}
		expects_vm<algorithm::digest256> value_codec::hash(const value& target, const type_tag& type)
		{
			auto data = encode(target, type);
			if (!data)
				return data.error();

			return algorithm::hashing::hash256(*data);
		}
		expects_vm<void> value_codec::encode_value(format::wo_stream& message, const value& target, const type_tag& type, size_t depth)
		{
			if (depth > resolver->get_max_type_depth())
				return vm_exception::type_too_deep(stringify::text("type %s exceeds %i nesting levels", type.to_string().c_str(), (int)resolver->get_max_type_depth()));
			else if (target.is_reference())
				return vm_exception::type_mismatch("references cannot be serialized");

			switch (type.kind)
			{
				case type_kind::boolean:
					if (target.kind != value_kind::boolean)
						break;

					message.write_boolean(target.as_boolean());
					return expectation::met;
				case type_kind::u8:
					if (target.kind != value_kind::u8)
						break;

					message.write_u8(target.as_u8());
					return expectation::met;
				case type_kind::u64:
					if (target.kind != value_kind::u64)
						break;

					message.write_u64(target.as_u64());
					return expectation::met;
				case type_kind::u128:
					if (target.kind != value_kind::u128)
						break;

					message.write_u128(target.as_u128());
					return expectation::met;
				case type_kind::address:
				case type_kind::signer:
					if (target.kind != (type.kind == type_kind::address ? value_kind::address : value_kind::signer))
						break;

					message.write_typeless(target.address.data, sizeof(target.address.data));
					return expectation::met;
				case type_kind::vector:
				{
					if (target.kind != value_kind::vector || target.type != type.element())
						break;
					else if (target.items.size() > max_sequence_length || target.items.size() > max_vector_length)
						return vm_exception::value_too_large(stringify::text("vector of %i elements is too long", (int)target.items.size()));

					message.write_uleb128((uint32_t)target.items.size());
					for (auto& item : target.items)
					{
						auto status = encode_value(message, item, type.element(), depth + 1);
						if (!status)
							return status;
					}
					return expectation::met;
				}
				case type_kind::structure:
				{
					if (target.kind != value_kind::structure || target.type != type)
						break;

					auto definition = resolver->resolve(type);
					if (!definition)
						return definition.error();

					auto field_types = resolver->instantiate(**definition, type.arguments);
					if (!field_types)
						return field_types.error();
					else if (field_types->size() != target.items.size())
						return vm_exception::field_mismatch(stringify::text("%s has %i fields, value holds %i", type.to_string().c_str(), (int)field_types->size(), (int)target.items.size()));

					for (size_t i = 0; i < target.items.size(); i++)
					{
						auto status = encode_value(message, target.items[i], field_types->at(i), depth + 1);
						if (!status)
							return status;
					}
					return expectation::met;
				}
				default:
					return vm_exception::type_mismatch(stringify::text("type %s is not serializable", type.to_string().c_str()));
			}

			return vm_exception::type_mismatch(stringify::text("value of type %s cannot be encoded as %s", target.type_of().to_string().c_str(), type.to_string().c_str()));
		}
		expects_vm<value> value_codec::decode_value(format::ro_stream& message, const type_tag& type, size_t depth)
		{
			if (depth > resolver->get_max_type_depth())
				return vm_exception::type_too_deep(stringify::text("type %s exceeds %i nesting levels", type.to_string().c_str(), (int)resolver->get_max_type_depth()));

			switch (type.kind)
			{
				case type_kind::boolean:
				{
					bool data;
					if (!message.read_boolean(&data))
						return vm_exception::deserialization_error(stringify::text("invalid bool at offset %i", (int)message.seek));

					return value::boolean(data);
				}
				case type_kind::u8:
				{
					uint8_t data;
					if (!message.read_u8(&data))
						return vm_exception::deserialization_error(stringify::text("truncated u8 at offset %i", (int)message.seek));

					return value::u8(data);
				}
				case type_kind::u64:
				{
					uint64_t data;
					if (!message.read_u64(&data))
						return vm_exception::deserialization_error(stringify::text("truncated u64 at offset %i", (int)message.seek));

					return value::u64(data);
				}
				case type_kind::u128:
				{
					uint128_t data;
					if (!message.read_u128(&data))
						return vm_exception::deserialization_error(stringify::text("truncated u128 at offset %i", (int)message.seek));

					return value::u128(data);
				}
				case type_kind::address:
				case type_kind::signer:
				{
					algorithm::account_address data;
					if (!message.read_typeless(data.data, sizeof(data.data)))
						return vm_exception::deserialization_error(stringify::text("truncated address at offset %i", (int)message.seek));

					return type.kind == type_kind::address ? value::account(data) : value::signer(data);
				}
				case type_kind::vector:
				{
					uint32_t size;
					if (!message.read_uleb128(&size))
						return vm_exception::deserialization_error(stringify::text("invalid length prefix at offset %i", (int)message.seek));
					else if (size > max_sequence_length || size > max_vector_length)
						return vm_exception::deserialization_error(stringify::text("vector length %u exceeds the limit", size));

					vector<value> items;
					items.reserve(std::min<size_t>(size, message.remaining()));
					for (uint32_t i = 0; i < size; i++)
					{
						auto item = decode_value(message, type.element(), depth + 1);
						if (!item)
							return item;

						items.push_back(std::move(*item));
					}
					return value::vector_of(type.element(), std::move(items));
				}
				case type_kind::structure:
				{
					auto definition = resolver->resolve(type);
					if (!definition)
						return definition.error();

					auto field_types = resolver->instantiate(**definition, type.arguments);
					if (!field_types)
						return field_types.error();

					vector<value> fields;
					fields.reserve(field_types->size());
					for (auto& field_type : *field_types)
					{
						auto item = decode_value(message, field_type, depth + 1);
						if (!item)
							return item;

						fields.push_back(std::move(*item));
					}
					return value::structure(type.as_struct(), std::move(fields));
				}
				default:
					return vm_exception::deserialization_error(stringify::text("type %s is not deserializable", type.to_string().c_str()));
			}
		}
	}
}
