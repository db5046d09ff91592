//! # Symbols
//!
//! A `Symbol` is a resolved export: either the address of a data object or
//! the entry point of a function, tagged with the producer's type
//! descriptor. Symbols are created only by the initialization protocol and
//! never change afterwards.
//!
//! ## Usage
//!
//! ```cpp
//! auto sym = unwrap(modload::lookup(module, "Add"));
//! if (auto* add = sym.as_function<int32_t(int32_t, int32_t)>()) {
//!     int32_t three = add(1, 2);
//! }
//! ```

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>

namespace modload::loader {

enum class SymbolKind : uint8_t {
    Data,
    Callable,
};

[[nodiscard]] auto symbol_kind_name(SymbolKind kind) -> const char*;

/// Generic function pointer. Converting back to the original function type
/// before calling is the only valid use.
using RawFunction = void (*)();

class Symbol {
public:
    static auto data(std::string name, void* address, std::string type_descriptor) -> Symbol;
    static auto callable(std::string name, RawFunction entry, std::string type_descriptor)
        -> Symbol;

    [[nodiscard]] auto kind() const -> SymbolKind {
        return target_.index() == 0 ? SymbolKind::Data : SymbolKind::Callable;
    }
    [[nodiscard]] bool is_data() const {
        return kind() == SymbolKind::Data;
    }
    [[nodiscard]] bool is_callable() const {
        return kind() == SymbolKind::Callable;
    }

    /// Directory name (without the module prefix).
    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto type_descriptor() const -> const std::string& {
        return type_descriptor_;
    }

    /// Typed pointer to a data export; nullptr for callables.
    template <typename T> [[nodiscard]] auto as_data() const -> T* {
        static_assert(!std::is_function_v<T>, "use as_function<> for callables");
        if (const auto* address = std::get_if<void*>(&target_)) {
            return static_cast<T*>(*address);
        }
        return nullptr;
    }

    /// Typed pointer to a callable export; nullptr for data.
    ///
    /// The caller asserts that `Signature` matches the export's real type;
    /// `type_descriptor()` is the producer's statement of that type.
    template <typename Signature> [[nodiscard]] auto as_function() const -> Signature* {
        static_assert(std::is_function_v<Signature>, "Signature must be a function type");
        if (const auto* entry = std::get_if<RawFunction>(&target_)) {
            return reinterpret_cast<Signature*>(*entry);
        }
        return nullptr;
    }

    /// Address of the export, for display.
    [[nodiscard]] auto address() const -> const void*;

private:
    Symbol(std::string name, std::variant<void*, RawFunction> target, std::string type_descriptor);

    std::string name_;
    std::variant<void*, RawFunction> target_;
    std::string type_descriptor_;
};

/// Exported name -> symbol. Ordered so listings are stable; `std::less<>`
/// allows lookups by `std::string_view`.
using SymbolDirectory = std::map<std::string, Symbol, std::less<>>;

} // namespace modload::loader
