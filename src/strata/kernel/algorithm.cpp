#include "algorithm.h"
extern "C"
{
#include <sodium.h>
}

namespace strata
{
	namespace algorithm
	{
		bool encoding::decode_bytes(const std::string_view& value, uint8_t* data, size_t data_size)
		{
			VI_ASSERT(data != nullptr, "data should be set");
			if (value.size() > data_size)
				return false;

			memset(data, 0, data_size);
			memcpy(data + (data_size - value.size()), value.data(), value.size());
			return true;
		}
		option<account_address> encoding::decode_address(const std::string_view& data)
		{
			static std::string_view alphabet = "0123456789abcdefABCDEF";
			auto text = stringify::starts_with(data, "0x") ? data.substr(2) : data;
			if (text.empty() || text.size() > sizeof(account_address::data) * 2 || text.find_first_not_of(alphabet) != std::string::npos)
				return optional::none;

			string digits = text.size() % 2 != 0 ? string("0").append(text) : string(text);
			account_address result;
			if (!decode_bytes(codec::hex_decode(digits), result.data, sizeof(result.data)))
				return optional::none;

			return result;
		}
		string encoding::encode_short_address(const account_address& data)
		{
			string text = codec::hex_encode(data.view());
			size_t offset = text.find_first_not_of('0');
			return offset == std::string::npos ? string("0x0") : string("0x").append(text.substr(offset));
		}

		void hashing::hash256(const uint8_t* buffer, size_t size, uint8_t out_buffer[32])
		{
			crypto_generichash(out_buffer, sizeof(digest256::data), buffer, (unsigned long long)size, nullptr, 0);
		}
		digest256 hashing::hash256(const std::string_view& data)
		{
			digest256 result;
			hash256((uint8_t*)data.data(), data.size(), result.data);
			return result;
		}
	}
}
