//! # Module Initialization Protocol
//!
//! Runs once per module, on the loading thread, outside every lock:
//!
//! ```text
//! 1. modload_module_exports()  → export table (ABI version checked)
//! 2. module id                 → table's module_id, else the file-derived name
//! 3. <id>.init                 → invoked if exported
//! 4. every declared export     → resolved; any miss fails the whole module
//! 5. materialize               → data / callable Symbols keyed without "<id>."
//! ```
//!
//! This is the only place where addresses returned by the dynamic linker
//! are turned into typed handles.

#pragma once

#include "modload/common.hpp"
#include "modload/loader/error.hpp"
#include "modload/loader/native.hpp"
#include "modload/loader/symbol.hpp"

#include <string>
#include <string_view>

namespace modload::loader {

/// Outcome of a successful initialization.
struct InitializedModule {
    std::string id;
    SymbolDirectory symbols;
    size_t declared_exports = 0;
    bool ran_initializer = false;
};

class ModuleInitializer {
public:
    explicit ModuleInitializer(NativeBinding& native);

    /// Initializes the image behind `handle`.
    ///
    /// @param fallback_id  Identifier used when the table declares none
    /// Errors carry no reference; the registry attaches it.
    auto run(NativeHandle handle, std::string_view fallback_id)
        -> Result<InitializedModule, LoadError>;

private:
    NativeBinding& native_;
};

} // namespace modload::loader
