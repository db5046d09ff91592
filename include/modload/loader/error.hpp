//! # Loader Errors
//!
//! A single error value describes every way `open()` and `lookup()` can
//! fail. The taxonomy is small and stable:
//!
//! | Kind              | Raised when                                           |
//! |-------------------|-------------------------------------------------------|
//! | `Resolution`      | the reference cannot be canonicalized                 |
//! | `Load`            | the dynamic linker or the module itself was rejected  |
//! | `SymbolNotFound`  | a declared or requested export is absent              |
//! | `PreviousFailure` | a cached failure is re-surfaced                       |
//! | `RecursiveLoad`   | a module's initializer re-opens its own path          |

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace modload::loader {

enum class ErrorKind : uint8_t {
    Resolution,
    Load,
    SymbolNotFound,
    PreviousFailure,
    RecursiveLoad,
};

/// Stable translation of OS path errors.
enum class ResolutionCode : uint8_t {
    NotFound,
    NotADirectory,
    AccessDenied,
    OtherIo,
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;
[[nodiscard]] auto resolution_code_name(ResolutionCode code) -> const char*;

/// Maps an OS error to the resolution taxonomy.
[[nodiscard]] auto classify_resolution(const std::error_code& ec) -> ResolutionCode;

/// Failure of a load or lookup.
struct LoadError {
    ErrorKind kind = ErrorKind::Load;
    std::string reference;   ///< Caller-supplied module reference
    std::string module_path; ///< Canonical path, when known
    std::string symbol;      ///< Missing symbol (SymbolNotFound)
    std::string detail;      ///< Human-readable cause
    ResolutionCode resolution = ResolutionCode::OtherIo;
    ErrorKind cause = ErrorKind::Load; ///< Original kind (PreviousFailure)
    int platform_code = 0;

    /// One-line description, e.g. `open("math"): could not find symbol math.Add`.
    [[nodiscard]] auto message() const -> std::string;

    // ========================================================================
    // Constructors
    // ========================================================================

    static auto resolution_failed(std::string_view reference, const std::error_code& ec)
        -> LoadError;
    static auto load_failed(std::string detail, int platform_code = 0) -> LoadError;
    static auto symbol_missing(std::string symbol, std::string detail = {}) -> LoadError;
    static auto not_in_directory(std::string_view symbol, std::string_view module_path)
        -> LoadError;
    static auto recursive(std::string_view reference, std::string_view module_path) -> LoadError;

    /// Re-surfaces a cached failure for a later caller.
    [[nodiscard]] auto as_previous_failure(std::string_view reference) const -> LoadError;
};

} // namespace modload::loader
