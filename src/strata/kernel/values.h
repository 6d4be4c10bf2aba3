#ifndef STRATA_KERNEL_VALUES_H
#define STRATA_KERNEL_VALUES_H
#include "types.h"

namespace strata
{
	namespace ledger
	{
		enum class value_kind : uint8_t
		{
			invalid,
			boolean,
			u8,
			u64,
			u128,
			address,
			signer,
			vector,
			structure,
			reference
		};

		enum class location_kind : uint8_t
		{
			local,
			global
		};

		struct location
		{
			location_kind kind = location_kind::local;
			uint64_t frame = 0;
			uint32_t slot = 0;
			algorithm::account_address address;
			struct_tag resource;

			string to_key() const;
			string to_string() const;
			bool operator== (const location& other) const;
			bool operator!= (const location& other) const;
			static location local(uint64_t frame, uint32_t slot);
			static location global(const algorithm::account_address& address, const struct_tag& resource);
		};

		class value
		{
			friend class value_ops;

		public:
			value_kind kind = value_kind::invalid;
			uint128_t number = 0;
			algorithm::account_address address;
			type_tag type;
			vector<value> items;
			location target;
			bool writable = false;
			uint64_t borrow_id = 0;

		public:
			value() = default;
			value(const value&) = delete;
			value(value&&) noexcept = default;
			value& operator= (const value&) = delete;
			value& operator= (value&&) noexcept = default;
			bool as_boolean() const;
			uint8_t as_u8() const;
			uint64_t as_u64() const;
			const uint128_t& as_u128() const;
			const algorithm::account_address& as_address() const;
			type_tag type_of() const;
			bool is_valid() const;
			bool is_reference() const;
			size_t size_of() const;
			uptr<schema> as_schema() const;

		public:
			static value boolean(bool data);
			static value u8(uint8_t data);
			static value u64(uint64_t data);
			static value u128(const uint128_t& data);
			static value account(const algorithm::account_address& data);
			static value signer(const algorithm::account_address& data);
			static value vector_of(const type_tag& element, vector<value>&& elements);
			static value structure(const struct_tag& tag, vector<value>&& fields);
			static value reference(const location& target, const type_tag& referent, bool writable, uint64_t borrow_id);

		private:
			value clone() const;
		};

		class value_ops
		{
		private:
			type_resolver* resolver;
			uint64_t max_vector_length;

		public:
			value_ops(type_resolver* new_resolver);
			value_ops(type_resolver* new_resolver, uint64_t new_max_vector_length);
			expects_vm<value> pack(const struct_def& definition, const vector<type_tag>& type_arguments, vector<value>&& fields);
			expects_vm<value> pack(const struct_tag& tag, vector<value>&& fields);
			expects_vm<vector<value>> unpack(value&& target, const struct_tag& expected);
			expects_vm<value> copy_value(const value& target);
			expects_vm<void> drop_value(value&& target);
			expects_vm<value> pack_vector(const type_tag& element, vector<value>&& elements);
			expects_vm<vector<value>> unpack_vector(value&& target, const type_tag& element, uint64_t expected_length);
			expects_vm<uint64_t> vector_length(const value& target, const type_tag& element);
			expects_vm<void> vector_push_back(value& target, const type_tag& element, value&& item);
			expects_vm<value> vector_pop_back(value& target, const type_tag& element);
			expects_vm<void> vector_swap(value& target, const type_tag& element, uint64_t left, uint64_t right);
			expects_vm<void> vector_destroy_empty(value&& target, const type_tag& element);
			expects_vm<void> check_type(const value& target, const type_tag& expected);
			type_resolver* get_resolver();

		public:
			static bool structural_equals(const value& left, const value& right);

		private:
			expects_vm<void> check_vector(const value& target, const type_tag& element);
		};
	}
}
#endif
