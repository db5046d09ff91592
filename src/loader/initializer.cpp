//! # Module Initialization Protocol Implementation

#include "modload/loader/initializer.hpp"

#include "modload/abi.h"
#include "modload/log/log.hpp"

namespace modload::loader {

ModuleInitializer::ModuleInitializer(NativeBinding& native) : native_(native) {}

auto ModuleInitializer::run(NativeHandle handle, std::string_view fallback_id)
    -> Result<InitializedModule, LoadError> {
    // 1. Export table
    void* table_entry = native_.resolve(handle, MODLOAD_EXPORT_TABLE_SYMBOL);
    if (!table_entry) {
        return LoadError::load_failed("not a loadable module: no " +
                                      std::string(MODLOAD_EXPORT_TABLE_SYMBOL) + " entry point");
    }
    auto exports_fn = reinterpret_cast<ModloadExportsFn>(table_entry);
    const ModloadExportTable* table = exports_fn();
    if (!table) {
        return LoadError::load_failed("not a loadable module: " +
                                      std::string(MODLOAD_EXPORT_TABLE_SYMBOL) +
                                      " returned no export table");
    }
    if (table->abi_version != MODLOAD_ABI_VERSION) {
        return LoadError::load_failed("module ABI version mismatch: host " +
                                      std::to_string(MODLOAD_ABI_VERSION) + ", module " +
                                      std::to_string(table->abi_version));
    }
    if (table->count > 0 && !table->exports) {
        return LoadError::load_failed("malformed export table: " + std::to_string(table->count) +
                                      " exports declared but none provided");
    }

    // 2. Module identifier
    InitializedModule result;
    result.id = (table->module_id && *table->module_id) ? std::string(table->module_id)
                                                        : std::string(fallback_id);
    result.declared_exports = table->count;
    const std::string prefix = result.id + ".";

    // 3. Initializer
    const std::string init_name = result.id + MODLOAD_INIT_SUFFIX;
    if (void* init_entry = native_.resolve(handle, init_name)) {
        MODLOAD_LOG_DEBUG("loader", "running " << init_name);
        auto init_fn = reinterpret_cast<ModloadInitFn>(init_entry);
        init_fn();
        result.ran_initializer = true;
    }

    // 4 + 5. Resolve and materialize every declared export
    for (uint32_t i = 0; i < table->count; ++i) {
        const ModloadExport& decl = table->exports[i];
        if (!decl.name || !*decl.name) {
            return LoadError::load_failed("malformed export table: entry " + std::to_string(i) +
                                          " has no name");
        }
        std::string full_name = decl.name;

        void* address = native_.resolve(handle, full_name);
        if (!address) {
            LoadError missing = LoadError::symbol_missing(
                full_name, "declared in the export table but not exported by the image");
            missing.platform_code = native_.last_error();
            return missing;
        }

        std::string key = full_name.starts_with(prefix) ? full_name.substr(prefix.size())
                                                        : full_name;
        std::string type = decl.type_descriptor ? decl.type_descriptor : "";

        switch (decl.kind) {
        case MODLOAD_EXPORT_CALLABLE:
            result.symbols.insert_or_assign(
                key, Symbol::callable(key, reinterpret_cast<RawFunction>(address), std::move(type)));
            break;
        case MODLOAD_EXPORT_DATA:
            result.symbols.insert_or_assign(key, Symbol::data(key, address, std::move(type)));
            break;
        default:
            return LoadError::load_failed("malformed export table: " + full_name +
                                          " has unknown kind " + std::to_string(decl.kind));
        }
        MODLOAD_LOG_TRACE("loader", "materialized " << full_name << " as " << key << " at "
                                                    << address);
    }

    return result;
}

} // namespace modload::loader
