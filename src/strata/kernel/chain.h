#ifndef STRATA_KERNEL_CHAIN_H
#define STRATA_KERNEL_CHAIN_H
#include <vitex/compute.h>
#include <vitex/layer.h>
#include <vitex/vitex.h>
#include <array>

namespace strata
{
    using namespace vitex::core;
    using namespace vitex::compute;
    using namespace vitex::layer;

    enum class vm_status : uint8_t
    {
        ability_violation,
        type_mismatch,
        field_mismatch,
        module_not_found,
        type_arity_mismatch,
        type_too_deep,
        resource_does_not_exist,
        resource_already_exists,
        out_of_gas,
        deserialization_error,
        borrow_conflict,
        call_stack_overflow,
        value_too_large,
        invariant_violation
    };

    enum class gas_operation : uint8_t
    {
        call,
        ret,
        move_local,
        copy_local,
        store_local,
        pack,
        unpack,
        copy,
        drop,
        equality,
        borrow_local,
        borrow_global,
        read_ref,
        write_ref,
        release_ref,
        vector_pack,
        vector_unpack,
        vector_length,
        vector_push_back,
        vector_pop_back,
        vector_swap,
        vector_destroy_empty,
        serialize,
        deserialize,
        hash,
        exists,
        move_from,
        move_to,
        resource_load,
        count
    };

    class layer_exception : public std::exception
    {
    private:
        string error_message;

    public:
        layer_exception();
        layer_exception(string&& text);
        const char* what() const noexcept override;
        string&& message() noexcept;
    };

    class vm_exception : public std::exception
    {
    private:
        string error_message;
        vm_status error_status;
        bool invariant;

    public:
        vm_exception(vm_status new_status, string&& text);
        const char* what() const noexcept override;
        string&& message() noexcept;
        const string& text() const noexcept;
        vm_status status() const noexcept;
        bool is(vm_status target) const noexcept;
        bool is_invariant_violation() const noexcept;
        vm_exception escalate() const;
        string as_string() const;

    public:
        static std::string_view status_name(vm_status status);
        static vm_exception ability_violation(string&& text);
        static vm_exception type_mismatch(string&& text);
        static vm_exception field_mismatch(string&& text);
        static vm_exception module_not_found(string&& text);
        static vm_exception type_arity_mismatch(string&& text);
        static vm_exception type_too_deep(string&& text);
        static vm_exception resource_does_not_exist(string&& text);
        static vm_exception resource_already_exists(string&& text);
        static vm_exception out_of_gas(string&& text);
        static vm_exception deserialization_error(string&& text);
        static vm_exception borrow_conflict(string&& text);
        static vm_exception call_stack_overflow(string&& text);
        static vm_exception value_too_large(string&& text);
        static vm_exception invariant_violation(string&& text);
    };

    template <typename v>
    using expects_lr = expects<v, layer_exception>;

    template <typename v>
    using expects_vm = expects<v, vm_exception>;

    struct gas_schedule
    {
        struct entry
        {
            uint64_t base = 0;
            uint64_t per_byte = 0;
        };

        std::array<entry, (size_t)gas_operation::count> costs;

        gas_schedule() noexcept;
        entry& at(gas_operation operation);
        const entry& at(gas_operation operation) const;
        uptr<schema> as_schema() const;
        static std::string_view name_of(gas_operation operation);
        static option<gas_operation> from_name(const std::string_view& name);
    };

    class protocol
    {
    private:
        static protocol* instance;

    public:
        struct logger
        {
            std::recursive_mutex mutex;
            uptr<stream> resource;
            int64_t repack_time = 0;

            void output(const std::string_view& message);
        };

    public:
        struct user_dynamic_config
        {
            struct
            {
                string info_path;
                string error_path;
                uint64_t archive_size = 8 * 1024 * 1024;
                uint64_t archive_repack_interval = 1800;
                bool execution_logging = false;
            } logs;
        } user;
        struct protocol_limits_config
        {
            uint32_t max_type_depth = 64;
            uint32_t max_type_arguments = 32;
            uint32_t max_call_depth = 1024;
            uint32_t max_locals = 255;
            uint64_t max_value_size = 1024 * 1024;
            uint64_t max_vector_length = 1024 * 1024;
        } limits;
        struct protocol_gas_config
        {
            gas_schedule schedule;
            uint64_t min_transaction_gas_units = 600;
            uint64_t large_transaction_cutoff = 600;
            uint64_t intrinsic_gas_per_byte = 8;
            uint64_t maximum_number_of_gas_units = 4000000;
            uint64_t max_transaction_size = 4096;
        } gas;

    private:
        struct
        {
            logger info;
            logger error;
        } logs;
        string path;

    public:
        protocol(const inline_args& environment);
        virtual ~protocol();

    public:
        static bool bound();
        static const protocol& now();
    };
}
#endif
