#ifndef STRATA_LAYER_SERIALIZATION_H
#define STRATA_LAYER_SERIALIZATION_H
#include "../kernel/chain.h"

namespace strata
{
	namespace format
	{
		struct wo_stream
		{
			string data;

			wo_stream();
			explicit wo_stream(const std::string_view& new_data);
			explicit wo_stream(string&& new_data);
			wo_stream(const wo_stream&) = default;
			wo_stream(wo_stream&&) noexcept = default;
			wo_stream& operator= (const wo_stream&) = default;
			wo_stream& operator= (wo_stream&&) noexcept = default;
			wo_stream& write_u8(uint8_t value);
			wo_stream& write_u32(uint32_t value);
			wo_stream& write_u64(uint64_t value);
			wo_stream& write_u128(const uint128_t& value);
			wo_stream& write_boolean(bool value);
			wo_stream& write_uleb128(uint32_t value);
			wo_stream& write_bytes(const std::string_view& value);
			wo_stream& write_typeless(const void* data, size_t size);

		private:
			void write(const void* value, size_t size);
		};

		struct ro_stream
		{
			std::string_view data;
			size_t seek;

			ro_stream();
			explicit ro_stream(const std::string_view& new_data);
			ro_stream(const ro_stream&) = default;
			ro_stream(ro_stream&&) noexcept = default;
			ro_stream& operator= (const ro_stream&) = default;
			ro_stream& operator= (ro_stream&&) noexcept = default;
			bool read_u8(uint8_t* value);
			bool read_u64(uint64_t* value);
			bool read_u128(uint128_t* value);
			bool read_boolean(bool* value);
			bool read_uleb128(uint32_t* value);
			bool read_typeless(void* value, size_t size);
			size_t remaining() const;
			bool is_eof() const;

		private:
			size_t read(void* value, size_t size);
		};

		class util
		{
		public:
			static string encode_0xhex(const std::string_view& data);
			static string decode_0xhex(const std::string_view& data);
			static string assign_0xhex(const std::string_view& data);
			static bool is_hex_encoding(const std::string_view& data);
			static size_t get_uleb128_size(uint32_t value);
		};
	}
}
#endif
