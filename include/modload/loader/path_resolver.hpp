//! # Path Resolver
//!
//! Turns a caller-supplied module reference into the canonical path that
//! keys the registry.
//!
//! ## Candidate Order
//!
//! For every base (the reference itself, then `<dir>/<reference>` for each
//! search directory when the reference is a bare name):
//!
//! ```text
//! 1. <base>
//! 2. <base><suffix>        (unless base already ends in the suffix)
//! 3. <base><suffix>.zst    (compressed artifact)
//! ```
//!
//! The first candidate that exists and is not a directory wins.

#pragma once

#include "modload/common.hpp"
#include "modload/loader/config.hpp"
#include "modload/loader/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace modload::loader {

/// A successfully canonicalized reference.
struct ResolvedPath {
    fs::path canonical; ///< Absolute, symlink-free
    bool compressed = false;
};

class PathResolver {
public:
    explicit PathResolver(const LoaderConfig& config);

    /// Canonicalizes `reference`. Read-only filesystem probe.
    [[nodiscard]] auto resolve(std::string_view reference) const
        -> Result<ResolvedPath, LoadError>;

    /// File name of `reference` with ".zst" and the library suffix stripped.
    [[nodiscard]] auto module_name(std::string_view reference) const -> std::string;

    /// Candidate paths for `reference`, in probe order.
    [[nodiscard]] auto candidates(std::string_view reference) const -> std::vector<fs::path>;

private:
    std::vector<fs::path> search_paths_;
    std::string suffix_;
};

} // namespace modload::loader
