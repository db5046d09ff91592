//! # Module Record Implementation

#include "modload/loader/module.hpp"

namespace modload::loader {

namespace {
const std::string EMPTY_ID;
const SymbolDirectory EMPTY_DIRECTORY;
} // namespace

auto module_state_name(ModuleState state) -> const char* {
    switch (state) {
    case ModuleState::Pending:
        return "pending";
    case ModuleState::Loaded:
        return "loaded";
    case ModuleState::Failed:
        return "failed";
    }
    return "unknown";
}

Module::Module(fs::path canonical_path, std::string reference)
    : path_(std::move(canonical_path)), reference_(std::move(reference)) {}

auto Module::id() const -> const std::string& {
    return state() == ModuleState::Loaded ? id_ : EMPTY_ID;
}

auto Module::symbols() const -> const SymbolDirectory& {
    return state() == ModuleState::Loaded ? symbols_ : EMPTY_DIRECTORY;
}

auto Module::failure() const -> const LoadError* {
    return state() == ModuleState::Failed ? &*failure_ : nullptr;
}

auto Module::native_handle() const -> NativeHandle {
    return state() == ModuleState::Loaded ? handle_ : nullptr;
}

auto Module::lookup(std::string_view name) const -> Result<Symbol, LoadError> {
    const auto& directory = symbols();
    if (auto it = directory.find(name); it != directory.end()) {
        return it->second;
    }
    return LoadError::not_in_directory(name, path_.string());
}

auto Module::wait() const -> ModuleState {
    auto current = state();
    if (current != ModuleState::Pending) {
        return current;
    }
    std::unique_lock lock(mutex_);
    settled_.wait(lock, [this] { return state() != ModuleState::Pending; });
    return state();
}

void Module::publish_loaded(std::string id, NativeHandle handle, SymbolDirectory symbols) {
    id_ = std::move(id);
    handle_ = handle;
    symbols_ = std::move(symbols);
    {
        std::lock_guard lock(mutex_);
        state_.store(ModuleState::Loaded, std::memory_order_release);
    }
    settled_.notify_all();
}

void Module::publish_failed(LoadError error) {
    error.module_path = path_.string();
    failure_ = std::move(error);
    {
        std::lock_guard lock(mutex_);
        state_.store(ModuleState::Failed, std::memory_order_release);
    }
    settled_.notify_all();
}

} // namespace modload::loader
