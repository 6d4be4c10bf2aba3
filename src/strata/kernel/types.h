#ifndef STRATA_KERNEL_TYPES_H
#define STRATA_KERNEL_TYPES_H
#include "algorithm.h"

namespace strata
{
	namespace ledger
	{
		enum class ability : uint8_t
		{
			copy = 1 << 0,
			drop = 1 << 1,
			store = 1 << 2,
			key = 1 << 3
		};

		enum class type_kind : uint8_t
		{
			boolean,
			u8,
			u64,
			u128,
			address,
			signer,
			vector,
			structure,
			parameter
		};

		struct ability_set
		{
			uint8_t bits = 0;

			ability_set() = default;
			explicit ability_set(uint8_t new_bits);
			ability_set(std::initializer_list<ability> values);
			ability_set& insert(ability value);
			ability_set& remove(ability value);
			ability_set intersect(const ability_set& other) const;
			bool has(ability value) const;
			bool contains(const ability_set& other) const;
			bool empty() const;
			string to_string() const;
			bool operator== (const ability_set& other) const;
			bool operator!= (const ability_set& other) const;
			static ability_set all();
			static ability requirement_of(ability value);
			static std::string_view name_of(ability value);
			static option<ability> from_name(const std::string_view& name);
		};

		struct module_id
		{
			algorithm::account_address address;
			string name;

			module_id() = default;
			module_id(const algorithm::account_address& new_address, const std::string_view& new_name);
			string to_string() const;
			string to_key() const;
			bool operator== (const module_id& other) const;
			bool operator!= (const module_id& other) const;
			bool operator< (const module_id& other) const;
		};

		struct struct_tag;

		struct type_tag
		{
			type_kind kind = type_kind::boolean;
			uint16_t index = 0;
			module_id module;
			string name;
			vector<type_tag> arguments;

			type_tag() = default;
			explicit type_tag(type_kind new_kind);
			type_tag(const type_tag&) = default;
			type_tag(type_tag&&) noexcept = default;
			type_tag& operator= (const type_tag&) = default;
			type_tag& operator= (type_tag&&) noexcept = default;
			const type_tag& element() const;
			struct_tag as_struct() const;
			bool is_primitive() const;
			bool is_concrete() const;
			size_t depth() const;
			string to_string() const;
			bool operator== (const type_tag& other) const;
			bool operator!= (const type_tag& other) const;
			bool operator< (const type_tag& other) const;
			static type_tag boolean();
			static type_tag u8();
			static type_tag u64();
			static type_tag u128();
			static type_tag address();
			static type_tag signer();
			static type_tag vector_of(const type_tag& element);
			static type_tag structure(const module_id& module, const std::string_view& name, vector<type_tag>&& arguments = { });
			static type_tag parameter(uint16_t index);
			static expects_vm<type_tag> from_string(const std::string_view& text, size_t max_depth);
		};

		struct struct_tag
		{
			module_id module;
			string name;
			vector<type_tag> arguments;

			struct_tag() = default;
			struct_tag(const module_id& new_module, const std::string_view& new_name, vector<type_tag>&& new_arguments = { });
			type_tag as_type() const;
			string to_string() const;
			bool operator== (const struct_tag& other) const;
			bool operator!= (const struct_tag& other) const;
			bool operator< (const struct_tag& other) const;
		};

		struct field_def
		{
			string name;
			type_tag type;
		};

		struct type_parameter_def
		{
			ability_set constraints;
			bool phantom = false;
		};

		struct struct_def
		{
			module_id module;
			string name;
			ability_set abilities;
			vector<type_parameter_def> parameters;
			vector<field_def> fields;

			option<size_t> field_index(const std::string_view& field_name) const;
			struct_tag as_tag(vector<type_tag>&& arguments = { }) const;
		};

		struct module_definition
		{
			module_id id;
			ordered_map<string, struct_def> structs;

			expects_vm<void> validate() const;
			const struct_def* find_struct(const std::string_view& name) const;
		};

		class module_provider
		{
		public:
			module_provider() = default;
			virtual ~module_provider() = default;
			virtual expects_vm<module_definition> load_module(const module_id& id) = 0;
		};

		/*
		* Process wide module cache, populated on first load of a module id.
		* Definitions are immutable after insertion, returned pointers stay valid until cleanup.
		*/
		class type_cache : public singleton<type_cache>
		{
		private:
			ordered_map<string, uptr<module_definition>> modules;
			std::mutex mutex;

		public:
			type_cache() = default;
			virtual ~type_cache() = default;
			const module_definition* insert(module_definition&& definition);
			const module_definition* find(const module_id& id);
			size_t size();
			void clear();
		};

		class type_resolver
		{
		private:
			module_provider* provider;
			uint32_t max_type_depth;
			uint32_t max_type_arguments;

		public:
			type_resolver(module_provider* new_provider);
			type_resolver(module_provider* new_provider, uint32_t new_max_type_depth, uint32_t new_max_type_arguments);
			expects_vm<const module_definition*> load(const module_id& id);
			expects_vm<const struct_def*> resolve(const type_tag& tag);
			expects_vm<const struct_def*> resolve(const struct_tag& tag);
			expects_vm<vector<type_tag>> instantiate(const struct_def& definition, const vector<type_tag>& type_arguments);
			expects_vm<type_tag> substitute(const type_tag& type, const vector<type_tag>& type_arguments);
			expects_vm<ability_set> abilities_of(const type_tag& type);
			expects_vm<void> verify_abilities(const type_tag& type, const ability_set& expected);
			expects_vm<void> verify_type(const type_tag& type);
			expects_vm<void> verify_constraints(const struct_def& definition, const vector<type_tag>& type_arguments);
			uint32_t get_max_type_depth() const;

		private:
			expects_vm<type_tag> substitute(const type_tag& type, const vector<type_tag>& type_arguments, size_t depth);
			expects_vm<ability_set> abilities_of(const type_tag& type, size_t depth);
			expects_vm<void> verify_type(const type_tag& type, size_t depth);
		};
	}
}
#endif
