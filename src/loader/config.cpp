//! # Loader Configuration

#include "modload/loader/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>

namespace modload::loader {

#ifdef _WIN32
static constexpr char PATH_LIST_SEPARATOR = ';';
#else
static constexpr char PATH_LIST_SEPARATOR = ':';
#endif

static auto read_env(const char* name) -> std::optional<std::string> {
#ifdef _MSC_VER
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || !buf) {
        return std::nullopt;
    }
    std::string value = buf;
    free(buf);
    return value;
#else
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

static bool is_truthy(std::string_view value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

auto LoaderConfig::default_library_suffix() -> const char* {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

bool ends_with_suffix(std::string_view name, std::string_view suffix, bool ignore_case) {
    if (suffix.size() > name.size()) {
        return false;
    }
    auto tail = name.substr(name.size() - suffix.size());
    if (!ignore_case) {
        return tail == suffix;
    }
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

bool has_library_suffix(std::string_view name, std::string_view suffix) {
#ifdef _WIN32
    return ends_with_suffix(name, suffix, true);
#else
    return ends_with_suffix(name, suffix, false);
#endif
}

auto LoaderConfig::defaults() -> LoaderConfig {
    LoaderConfig config;
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = fs::current_path(ec);
    }
    config.cache_dir = tmp / "modload-cache";
    return config;
}

auto LoaderConfig::from_environment() -> LoaderConfig {
    auto config = defaults();

    if (auto paths = read_env("MODLOAD_PATH")) {
        config.search_paths = parse_search_path(*paths);
    }
    if (auto cache = read_env("MODLOAD_CACHE_DIR"); cache && !cache->empty()) {
        config.cache_dir = fs::path(*cache);
    }
    if (auto bind_now = read_env("MODLOAD_BIND_NOW")) {
        config.bind_now = is_truthy(*bind_now);
    }
    if (auto global = read_env("MODLOAD_GLOBAL")) {
        config.global_symbols = is_truthy(*global);
    }

    return config;
}

auto parse_search_path(std::string_view list) -> std::vector<fs::path> {
    std::vector<fs::path> paths;
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t sep = list.find(PATH_LIST_SEPARATOR, pos);
        if (sep == std::string_view::npos) {
            sep = list.size();
        }
        auto entry = list.substr(pos, sep - pos);
        if (!entry.empty()) {
            paths.emplace_back(entry);
        }
        pos = sep + 1;
    }
    return paths;
}

bool is_loader_option(std::string_view arg) {
    return arg.starts_with("--search-path=") || arg.starts_with("--cache-dir=") ||
           arg == "--bind-now" || arg == "--global";
}

void apply_loader_options(LoaderConfig& config, int argc, char* argv[]) {
    bool search_path_seen = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--search-path=")) {
            // The first CLI search path replaces MODLOAD_PATH, later ones append.
            if (!search_path_seen) {
                config.search_paths.clear();
                search_path_seen = true;
            }
            for (auto& path : parse_search_path(arg.substr(14))) {
                config.search_paths.push_back(std::move(path));
            }
        } else if (arg.starts_with("--cache-dir=")) {
            config.cache_dir = fs::path(arg.substr(12));
        } else if (arg == "--bind-now") {
            config.bind_now = true;
        } else if (arg == "--global") {
            config.global_symbols = true;
        }
    }
}

} // namespace modload::loader
