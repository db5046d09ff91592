//! # Module Record
//!
//! One record per canonical path, owned by the registry for the life of
//! the process.
//!
//! ## Lifecycle
//!
//! ```text
//!            publish_loaded()
//! Pending ──────────────────▶ Loaded
//!    │
//!    └──────────────────────▶ Failed
//!            publish_failed()
//! ```
//!
//! The loading thread writes the identifier, directory, handle and error
//! exactly once, then publishes the state with a release store under the
//! record mutex and wakes every waiter. A reader that observes Loaded or
//! Failed through `state()` (acquire) sees those fields fully written and
//! needs no lock afterwards.

#pragma once

#include "modload/common.hpp"
#include "modload/loader/error.hpp"
#include "modload/loader/native.hpp"
#include "modload/loader/symbol.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace modload::loader {

enum class ModuleState : uint8_t {
    Pending,
    Loaded,
    Failed,
};

[[nodiscard]] auto module_state_name(ModuleState state) -> const char*;

class Module {
public:
    Module(fs::path canonical_path, std::string reference);

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    [[nodiscard]] auto path() const -> const fs::path& {
        return path_;
    }

    /// Reference that first requested this module.
    [[nodiscard]] auto reference() const -> const std::string& {
        return reference_;
    }

    [[nodiscard]] auto state() const -> ModuleState {
        return state_.load(std::memory_order_acquire);
    }

    /// Module identifier. Empty until Loaded.
    [[nodiscard]] auto id() const -> const std::string&;

    /// Symbol directory. Empty unless Loaded.
    [[nodiscard]] auto symbols() const -> const SymbolDirectory&;

    /// Cached failure. nullptr unless Failed.
    [[nodiscard]] auto failure() const -> const LoadError*;

    /// Native handle. nullptr unless Loaded.
    [[nodiscard]] auto native_handle() const -> NativeHandle;

    /// Looks up an export by directory name.
    [[nodiscard]] auto lookup(std::string_view name) const -> Result<Symbol, LoadError>;

    /// Blocks until the record leaves Pending. Returns the settled state.
    auto wait() const -> ModuleState;

private:
    friend class ModuleRegistry;

    void publish_loaded(std::string id, NativeHandle handle, SymbolDirectory symbols);
    void publish_failed(LoadError error);

    const fs::path path_;
    const std::string reference_;

    // Written once by the loading thread before the state leaves Pending.
    std::string id_;
    NativeHandle handle_ = nullptr;
    SymbolDirectory symbols_;
    std::optional<LoadError> failure_;

    std::atomic<ModuleState> state_{ModuleState::Pending};
    mutable std::mutex mutex_;
    mutable std::condition_variable settled_;
};

/// Shared read-only reference to a Loaded module.
using ModuleHandle = std::shared_ptr<const Module>;

} // namespace modload::loader
