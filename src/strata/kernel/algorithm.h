#ifndef STRATA_KERNEL_ALGORITHM_H
#define STRATA_KERNEL_ALGORITHM_H
#include "../layer/serialization.h"

namespace strata
{
	namespace algorithm
	{
		template <typename t, size_t s>
		struct storage_type
		{
			t data[s] = { 0 };

			storage_type() = default;
			storage_type(std::nullptr_t) = delete;
			storage_type(const t new_data[s])
			{
				if (new_data != nullptr)
					memcpy(data, new_data, sizeof(data));
			}
			storage_type(const t* new_data, size_t new_size)
			{
				if (new_data != nullptr)
					memcpy(data, new_data, std::min(new_size, sizeof(data)));
			}
			storage_type(const std::string_view& new_data)
			{
				memcpy(data, new_data.data(), std::min(new_data.size(), sizeof(data)));
			}
			storage_type(const storage_type&) = default;
			storage_type(storage_type&&) noexcept = default;
			storage_type& operator=(const storage_type&) = default;
			storage_type& operator=(storage_type&&) noexcept = default;
			void clear()
			{
				memset(data, 0, sizeof(data));
			}
			bool equals(const storage_type& other) const
			{
				return !memcmp(other.data, data, sizeof(data));
			}
			bool empty() const
			{
				t null[s] = { 0 };
				return !memcmp(data, null, sizeof(null));
			}
			std::string_view view() const
			{
				return std::string_view((char*)data, sizeof(data));
			}
			bool operator== (const storage_type& other) const
			{
				return equals(other);
			}
			bool operator!= (const storage_type& other) const
			{
				return !equals(other);
			}
			bool operator< (const storage_type& other) const
			{
				return memcmp(data, other.data, sizeof(data)) < 0;
			}
		};

		using account_address = storage_type<uint8_t, 16>;
		using digest256 = storage_type<uint8_t, 32>;

		class encoding
		{
		public:
			static bool decode_bytes(const std::string_view& value, uint8_t* data, size_t data_size);
			static option<account_address> decode_address(const std::string_view& data);
			static string encode_short_address(const account_address& data);
		};

		class hashing
		{
		public:
			static void hash256(const uint8_t* buffer, size_t size, uint8_t out_buffer[32]);
			static digest256 hash256(const std::string_view& data);
		};
	}
}
#endif
