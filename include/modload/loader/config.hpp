//! # Loader Configuration
//!
//! Search directories, the decompression cache location and dynamic-linker
//! flags. Values come from defaults, then the environment, then the command
//! line (later sources win).
//!
//! ## Environment
//!
//! | Variable            | Effect                                          |
//! |---------------------|-------------------------------------------------|
//! | `MODLOAD_PATH`      | search directories (`:`-separated, `;` on Win)  |
//! | `MODLOAD_CACHE_DIR` | decompression cache directory                   |
//! | `MODLOAD_BIND_NOW`  | `1` resolves all symbols at load time           |
//! | `MODLOAD_GLOBAL`    | `1` makes module symbols globally visible       |

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace modload::loader {

struct LoaderConfig {
    /// Directories searched for bare references ("math").
    std::vector<fs::path> search_paths;

    /// Where compressed modules are decompressed to.
    fs::path cache_dir;

    /// Platform library extension, appended when a reference omits it.
    std::string library_suffix = default_library_suffix();

    /// RTLD_NOW instead of RTLD_LAZY.
    bool bind_now = false;

    /// RTLD_GLOBAL instead of RTLD_LOCAL.
    bool global_symbols = false;

    /// Defaults: no search paths, cache under the system temp directory.
    static auto defaults() -> LoaderConfig;

    /// Defaults overridden by the MODLOAD_* environment variables.
    static auto from_environment() -> LoaderConfig;

    static auto default_library_suffix() -> const char*;
};

/// True if `name` ends with `suffix`, ignoring ASCII case when `ignore_case` is set.
[[nodiscard]] bool ends_with_suffix(std::string_view name, std::string_view suffix,
                                    bool ignore_case);

/// True if `name` ends with the library suffix `suffix`. File names are
/// case-insensitive on Windows, so `MATH.DLL` matches `.dll` there.
[[nodiscard]] bool has_library_suffix(std::string_view name, std::string_view suffix);

/// Splits a search-path list on the platform separator. Empty entries are dropped.
auto parse_search_path(std::string_view list) -> std::vector<fs::path>;

/// Applies --search-path=, --cache-dir=, --bind-now and --global from argv.
void apply_loader_options(LoaderConfig& config, int argc, char* argv[]);

/// True if `arg` is one of the options `apply_loader_options` consumes.
bool is_loader_option(std::string_view arg);

} // namespace modload::loader
