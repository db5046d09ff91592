//! # Module Decompression Cache
//!
//! Modules may ship zstd-compressed (`math.so.zst`). Before the native
//! load, the compressed artifact is decompressed into the cache directory
//! and the cached library is loaded instead.
//!
//! ## Layout
//!
//! ```text
//! <cache_dir>/math-<crc of source path>.so        decompressed library
//! <cache_dir>/math-<crc of source path>.so.hash   CRC32C of the .zst file
//! ```
//!
//! A cached library is reused while its `.hash` sidecar matches the
//! compressed file. Writes go through a temporary file renamed into place,
//! so a concurrent reader never sees a half-written library.

#pragma once

#include "modload/common.hpp"
#include "modload/loader/error.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace modload::loader {

class ModuleCache {
public:
    /// @param cache_dir   Created on first use
    /// @param suffix      Library suffix given to decompressed files
    ModuleCache(fs::path cache_dir, std::string suffix);

    /// Path of a loadable library for `compressed`, decompressing if the
    /// cache is missing or stale.
    [[nodiscard]] auto materialize(const fs::path& compressed) const -> Result<fs::path, LoadError>;

    /// Where `compressed` is (or would be) cached.
    [[nodiscard]] auto cache_path(const fs::path& compressed) const -> fs::path;

    /// True if the cached copy of `compressed` is present and current.
    [[nodiscard]] auto is_current(const fs::path& compressed) const -> bool;

    [[nodiscard]] auto cache_dir() const -> const fs::path& {
        return cache_dir_;
    }

private:
    fs::path cache_dir_;
    std::string suffix_;

    auto decompress(const fs::path& compressed, const fs::path& target) const
        -> Result<bool, LoadError>;
};

} // namespace modload::loader
