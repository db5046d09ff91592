//! # Module Registry
//!
//! Process-wide map from canonical path to module record. Guarantees that
//! each path is loaded and initialized at most once, however many threads
//! ask for it.
//!
//! ## Open Flow
//!
//! ```text
//! open(ref)
//!   ├─ resolve(ref)            → ResolutionError (not cached)
//!   ├─ lock; find/insert; unlock
//!   ├─ existing record         → wait → Loaded | PreviousFailure
//!   │                          → RecursiveLoad if this thread is loading it
//!   └─ new record (owner)
//!        ├─ decompress (.zst)
//!        ├─ native load
//!        ├─ initialization protocol
//!        └─ publish Loaded / Failed, wake waiters
//! ```
//!
//! The registry lock covers only the map. Native loads and initializers
//! run unlocked, so unrelated modules load in parallel and an initializer
//! may open other modules.

#pragma once

#include "modload/common.hpp"
#include "modload/loader/config.hpp"
#include "modload/loader/error.hpp"
#include "modload/loader/module.hpp"
#include "modload/loader/module_cache.hpp"
#include "modload/loader/native.hpp"
#include "modload/loader/path_resolver.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fs = std::filesystem;

namespace modload::loader {

class ModuleRegistry {
public:
    /// Registry backed by the system dynamic linker.
    explicit ModuleRegistry(LoaderConfig config);

    /// Registry backed by an arbitrary binding (tests inject a fake).
    ModuleRegistry(LoaderConfig config, std::unique_ptr<NativeBinding> native);

    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    /// The process-wide registry. Created on first use from
    /// `LoaderConfig::from_environment()`; never destroyed before exit.
    static auto global() -> ModuleRegistry&;

    /// Loads (once) and returns the module behind `reference`.
    auto open(std::string_view reference) -> Result<ModuleHandle, LoadError>;

    /// The Loaded module at `canonical_path`, or nullptr.
    [[nodiscard]] auto find(const fs::path& canonical_path) const -> ModuleHandle;

    /// Registry counters.
    struct Stats {
        size_t total = 0;
        size_t pending = 0;
        size_t loaded = 0;
        size_t failed = 0;
    };

    [[nodiscard]] auto stats() const -> Stats;

    [[nodiscard]] auto config() const -> const LoaderConfig& {
        return config_;
    }

    [[nodiscard]] auto resolver() const -> const PathResolver& {
        return resolver_;
    }

private:
    /// Owner path: performs the one-shot load and publishes the outcome.
    auto load(const std::shared_ptr<Module>& record, const ResolvedPath& resolved,
              std::string_view reference) -> Result<ModuleHandle, LoadError>;

    /// Non-owner path: waits for the record to settle.
    auto join(const std::shared_ptr<Module>& record, std::string_view reference)
        -> Result<ModuleHandle, LoadError>;

    LoaderConfig config_;
    std::unique_ptr<NativeBinding> native_;
    PathResolver resolver_;
    ModuleCache cache_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Module>> modules_;
};

} // namespace modload::loader
