#include "modload/loader/symbol.hpp"

namespace modload::loader {

auto symbol_kind_name(SymbolKind kind) -> const char* {
    switch (kind) {
    case SymbolKind::Data:
        return "data";
    case SymbolKind::Callable:
        return "callable";
    }
    return "unknown";
}

Symbol::Symbol(std::string name, std::variant<void*, RawFunction> target,
               std::string type_descriptor)
    : name_(std::move(name)), target_(target), type_descriptor_(std::move(type_descriptor)) {}

auto Symbol::data(std::string name, void* address, std::string type_descriptor) -> Symbol {
    return Symbol(std::move(name), std::variant<void*, RawFunction>(std::in_place_index<0>, address),
                  std::move(type_descriptor));
}

auto Symbol::callable(std::string name, RawFunction entry, std::string type_descriptor)
    -> Symbol {
    return Symbol(std::move(name), std::variant<void*, RawFunction>(std::in_place_index<1>, entry),
                  std::move(type_descriptor));
}

auto Symbol::address() const -> const void* {
    if (const auto* address = std::get_if<void*>(&target_)) {
        return *address;
    }
    return reinterpret_cast<const void*>(std::get<RawFunction>(target_));
}

} // namespace modload::loader
