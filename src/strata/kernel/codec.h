#ifndef STRATA_KERNEL_CODEC_H
#define STRATA_KERNEL_CODEC_H
#include "values.h"

namespace strata
{
	namespace ledger
	{
		/*
		* Canonical value encoding: little endian fixed width scalars, 16 byte addresses,
		* ULEB128 length prefixed vectors, structs as their fields in declared order.
		* Decoding accepts only the unique encoding of a value.
		*/
		class value_codec
		{
		private:
			type_resolver* resolver;
			uint64_t max_value_size;
			uint64_t max_vector_length;

		public:
			value_codec(type_resolver* new_resolver);
			value_codec(type_resolver* new_resolver, uint64_t new_max_value_size, uint64_t new_max_vector_length);
			expects_vm<string> encode(const value& target, const type_tag& type);
			expects_vm<value> decode(const std::string_view& data, const type_tag& type);
			expects_vm<algorithm::digest256> hash(const value& target, const type_tag& type);

		private:
			expects_vm<void> encode_value(format::wo_stream& message, const value& target, const type_tag& type, size_t depth);
			expects_vm<value> decode_value(format::ro_stream& message, const type_tag& type, size_t depth);
		};
	}
}
#endif
