#include "serialization.h"

namespace strata
{
	namespace format
	{
		wo_stream::wo_stream()
		{
		}
		wo_stream::wo_stream(const std::string_view& new_data) : data(new_data)
		{
		}
		wo_stream::wo_stream(string&& new_data) : data(std::move(new_data))
		{
		}
		void wo_stream::write(const void* value, size_t size)
		{
			if (size > 0 && value != nullptr)
			{
				size_t index = data.size();
				data.resize(data.size() + size);
				memcpy((char*)data.data() + index, value, size);
			}
		}
		wo_stream& wo_stream::write_u8(uint8_t value)
		{
			write(&value, sizeof(uint8_t));
			return *this;
		}
		wo_stream& wo_stream::write_u32(uint32_t value)
		{
			value = os::hw::to_endianness(os::hw::endian::little, value);
			write(&value, sizeof(uint32_t));
			return *this;
		}
		wo_stream& wo_stream::write_u64(uint64_t value)
		{
			value = os::hw::to_endianness(os::hw::endian::little, value);
			write(&value, sizeof(uint64_t));
			return *this;
		}
		wo_stream& wo_stream::write_u128(const uint128_t& value)
		{
			write_u64(value.low());
			write_u64(value.high());
			return *this;
		}
		wo_stream& wo_stream::write_boolean(bool value)
		{
			uint8_t type = value ? 1 : 0;
			write(&type, sizeof(uint8_t));
			return *this;
		}
		wo_stream& wo_stream::write_uleb128(uint32_t value)
		{
			do
			{
				uint8_t byte = (uint8_t)(value & 0x7f);
				value >>= 7;
				if (value > 0)
					byte |= 0x80;
				write(&byte, sizeof(uint8_t));
			} while (value > 0);
			return *this;
		}
		wo_stream& wo_stream::write_bytes(const std::string_view& value)
		{
			write_uleb128((uint32_t)value.size());
			write(value.data(), value.size());
			return *this;
		}
		wo_stream& wo_stream::write_typeless(const void* value, size_t size)
		{
			write(value, size);
			return *this;
		}

		ro_stream::ro_stream() : seek(0)
		{
		}
		ro_stream::ro_stream(const std::string_view& new_data) : data(new_data), seek(0)
		{
		}
		size_t ro_stream::read(void* value, size_t size)
		{
			if (!value || !size || size > data.size() - seek)
				return 0;

			memcpy(value, data.data() + seek, size);
			seek += size;
			return size;
		}
		bool ro_stream::read_u8(uint8_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			return read(value, sizeof(uint8_t)) == sizeof(uint8_t);
		}
		bool ro_stream::read_u64(uint64_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			if (read(value, sizeof(uint64_t)) != sizeof(uint64_t))
				return false;

			*value = os::hw::to_endianness(os::hw::endian::little, *value);
			return true;
		}
		bool ro_stream::read_u128(uint128_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			uint64_t low, high;
			if (!read_u64(&low) || !read_u64(&high))
				return false;

			value->low() = low;
			value->high() = high;
			return true;
		}
		bool ro_stream::read_boolean(bool* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			uint8_t type;
			if (!read_u8(&type) || type > 1)
				return false;

			*value = (type == 1);
			return true;
		}
		bool ro_stream::read_uleb128(uint32_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			uint64_t result = 0;
			for (uint32_t shift = 0; shift < 32; shift += 7)
			{
				uint8_t byte;
				if (!read_u8(&byte))
					return false;

				uint64_t digit = byte & 0x7f;
				result |= digit << shift;
				if (!(byte & 0x80))
				{
					if (shift > 0 && digit == 0)
						return false;
					else if (result > std::numeric_limits<uint32_t>::max())
						return false;

					*value = (uint32_t)result;
					return true;
				}
			}
			return false;
		}
		bool ro_stream::read_typeless(void* value, size_t size)
		{
			return read(value, size) == size;
		}
		size_t ro_stream::remaining() const
		{
			return seek < data.size() ? data.size() - seek : 0;
		}
		bool ro_stream::is_eof() const
		{
			return seek >= data.size();
		}

		string util::encode_0xhex(const std::string_view& data)
		{
			return assign_0xhex(codec::hex_encode(data));
		}
		string util::decode_0xhex(const std::string_view& data)
		{
			return codec::hex_decode(stringify::starts_with(data, "0x") ? data.substr(2) : data);
		}
		string util::assign_0xhex(const std::string_view& data)
		{
			string result = stringify::starts_with(data, "0x") ? string() : string("0x");
			return result.append(data);
		}
		bool util::is_hex_encoding(const std::string_view& data)
		{
			static std::string_view alphabet = "0123456789abcdefABCDEF";
			if (data.empty() || data.size() % 2 != 0)
				return false;

			auto text = (data.size() < 2 || data[0] != '0' || data[1] != 'x' ? data : data.substr(2));
			return text.find_first_not_of(alphabet) == std::string::npos;
		}
		size_t util::get_uleb128_size(uint32_t value)
		{
			size_t size = 1;
			while (value >= 0x80)
			{
				value >>= 7;
				++size;
			}
			return size;
		}
	}
}
