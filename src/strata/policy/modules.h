#ifndef STRATA_POLICY_MODULES_H
#define STRATA_POLICY_MODULES_H
#include "../kernel/types.h"

namespace strata
{
	namespace policy
	{
		class memory_module_provider : public ledger::module_provider
		{
		protected:
			ordered_map<string, ledger::module_definition> modules;

		public:
			memory_module_provider() = default;
			virtual ~memory_module_provider() override = default;
			expects_vm<ledger::module_definition> load_module(const ledger::module_id& id) override;
			void add_module(ledger::module_definition&& definition);
			bool has_module(const ledger::module_id& id) const;
			size_t size() const;
		};

		class schema_module_provider : public memory_module_provider
		{
		public:
			schema_module_provider() = default;
			virtual ~schema_module_provider() override = default;
			expects_lr<size_t> load_document(const std::string_view& json);
			expects_lr<size_t> load_file(const std::string_view& path);
			expects_lr<size_t> load_schema(schema* data);

		public:
			static expects_lr<ledger::module_definition> parse_module(schema* data, size_t max_type_depth);
			static expects_lr<ledger::struct_def> parse_struct(const ledger::module_id& module, schema* data, size_t max_type_depth);
			static expects_lr<ledger::ability_set> parse_abilities(schema* data);
			static uptr<schema> serialize_module(const ledger::module_definition& definition);
		};
	}
}
#endif
