//! # modload Public Interface Implementation

#include "modload/loader/loader.hpp"

namespace modload {

auto open(std::string_view reference) -> Result<ModuleHandle, LoadError> {
    return loader::ModuleRegistry::global().open(reference);
}

auto lookup(const ModuleHandle& module, std::string_view name) -> Result<Symbol, LoadError> {
    if (!module) {
        return LoadError::not_in_directory(name, "<null module>");
    }
    return module->lookup(name);
}

} // namespace modload
