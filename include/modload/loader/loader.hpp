//! # modload Public Interface
//!
//! Two entry points over the process-wide registry:
//!
//! ```cpp
//! auto module = modload::open("math");
//! if (is_err(module)) {
//!     std::cerr << unwrap_err(module).message() << "\n";
//!     return 1;
//! }
//! auto add = modload::lookup(unwrap(module), "Add");
//! ```
//!
//! Both are safe to call from any number of threads.

#pragma once

#include "modload/common.hpp"
#include "modload/loader/error.hpp"
#include "modload/loader/module.hpp"
#include "modload/loader/registry.hpp"
#include "modload/loader/symbol.hpp"

#include <string_view>

namespace modload {

using loader::LoadError;
using loader::ModuleHandle;
using loader::Symbol;

/// Loads and initializes the module behind `reference` at most once per
/// process; every later call returns the same module or the same failure.
auto open(std::string_view reference) -> Result<ModuleHandle, LoadError>;

/// Looks up an export of a Loaded module. Never touches the filesystem or
/// the dynamic linker.
auto lookup(const ModuleHandle& module, std::string_view name) -> Result<Symbol, LoadError>;

} // namespace modload
