//! # Common Definitions
//!
//! Version constants and the `Result` type shared by every part of the
//! loader.
//!
//! ## Error Handling
//!
//! modload does not throw across its public API. Every operation that can
//! fail returns `Result<T, E>`; callers check it with `is_ok` / `is_err` and
//! extract the payload with `unwrap` / `unwrap_err`.

#ifndef MODLOAD_COMMON_HPP
#define MODLOAD_COMMON_HPP

#include <string>
#include <variant>

namespace modload {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = modload::open("math");
/// if (is_err(result)) {
///     std::cerr << unwrap_err(result).message() << "\n";
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace modload

#endif // MODLOAD_COMMON_HPP
