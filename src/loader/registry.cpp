//! # Module Registry Implementation

#include "modload/loader/registry.hpp"

#include "modload/loader/initializer.hpp"
#include "modload/log/log.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <vector>

namespace modload::loader {

namespace {

/// Records whose load is running on this thread, innermost last.
thread_local std::vector<const Module*> tls_active_loads;

class ActiveLoadScope {
public:
    explicit ActiveLoadScope(const Module* record) {
        tls_active_loads.push_back(record);
    }
    ~ActiveLoadScope() {
        tls_active_loads.pop_back();
    }
    ActiveLoadScope(const ActiveLoadScope&) = delete;
    ActiveLoadScope& operator=(const ActiveLoadScope&) = delete;

    static bool contains(const Module* record) {
        return std::find(tls_active_loads.begin(), tls_active_loads.end(), record) !=
               tls_active_loads.end();
    }
};

struct LoadedImage {
    NativeHandle handle = nullptr;
    InitializedModule module;
};

auto native_failure_error(const NativeFailure& failure) -> LoadError {
    std::string detail = failure.message;
    if (detail.empty() && failure.code != 0) {
        detail = std::generic_category().message(failure.code);
    }
    if (detail.empty()) {
        detail = "dynamic linker rejected the image";
    }
    return LoadError::load_failed(std::move(detail), failure.code);
}

auto load_image(NativeBinding& native, const ModuleCache& cache, const ResolvedPath& resolved,
                const std::string& fallback_id) -> Result<LoadedImage, LoadError> {
    fs::path load_path = resolved.canonical;
    if (resolved.compressed) {
        auto materialized = cache.materialize(resolved.canonical);
        if (is_err(materialized)) {
            return unwrap_err(materialized);
        }
        load_path = unwrap(materialized);
    }

    auto loaded = native.load(load_path);
    if (is_err(loaded)) {
        return native_failure_error(unwrap_err(loaded));
    }

    LoadedImage image;
    image.handle = unwrap(loaded);

    ModuleInitializer initializer(native);
    Result<InitializedModule, LoadError> initialized = LoadError{};
    try {
        initialized = initializer.run(image.handle, fallback_id);
    } catch (const std::exception& e) {
        return LoadError::load_failed(std::string("module initializer threw: ") + e.what());
    }
    if (is_err(initialized)) {
        return unwrap_err(initialized);
    }
    image.module = std::move(unwrap(initialized));
    return image;
}

} // namespace

ModuleRegistry::ModuleRegistry(LoaderConfig config)
    : ModuleRegistry(config, std::make_unique<SystemBinding>(
                                 NativeFlags{config.bind_now, config.global_symbols})) {}

ModuleRegistry::ModuleRegistry(LoaderConfig config, std::unique_ptr<NativeBinding> native)
    : config_(std::move(config)), native_(std::move(native)), resolver_(config_),
      cache_(config_.cache_dir, config_.library_suffix) {}

auto ModuleRegistry::global() -> ModuleRegistry& {
    static ModuleRegistry registry(LoaderConfig::from_environment());
    return registry;
}

auto ModuleRegistry::open(std::string_view reference) -> Result<ModuleHandle, LoadError> {
    auto resolved = resolver_.resolve(reference);
    if (is_err(resolved)) {
        return unwrap_err(resolved);
    }
    const ResolvedPath& path = unwrap(resolved);

    std::shared_ptr<Module> record;
    bool owner = false;
    {
        std::lock_guard lock(mutex_);
        std::string key = path.canonical.string();
        auto it = modules_.find(key);
        if (it == modules_.end()) {
            // Published before the load starts so that re-entrant opens
            // from an initializer find it.
            auto fresh = std::make_shared<Module>(path.canonical, std::string(reference));
            it = modules_.emplace(std::move(key), std::move(fresh)).first;
            owner = true;
        }
        record = it->second;
    }

    if (!owner) {
        return join(record, reference);
    }
    return load(record, path, reference);
}

auto ModuleRegistry::join(const std::shared_ptr<Module>& record, std::string_view reference)
    -> Result<ModuleHandle, LoadError> {
    if (ActiveLoadScope::contains(record.get())) {
        MODLOAD_LOG_WARN("loader", "recursive open of " << record->path().string()
                                                        << " from its own initializer");
        return LoadError::recursive(reference, record->path().string());
    }

    if (record->state() == ModuleState::Pending) {
        MODLOAD_LOG_DEBUG("loader", "waiting for in-flight load of " << record->path().string());
    }

    ModuleState settled = record->wait();
    MODLOAD_LOG_TRACE("loader", "joined " << record->path().string() << " ("
                                          << module_state_name(settled) << ")");
    switch (settled) {
    case ModuleState::Loaded:
        return ModuleHandle(record);
    case ModuleState::Failed:
        return record->failure()->as_previous_failure(reference);
    case ModuleState::Pending:
        break;
    }
    return LoadError::load_failed("module record left pending");
}

auto ModuleRegistry::load(const std::shared_ptr<Module>& record, const ResolvedPath& resolved,
                          std::string_view reference) -> Result<ModuleHandle, LoadError> {
    ActiveLoadScope scope(record.get());
    MODLOAD_LOG_DEBUG("loader", "loading " << resolved.canonical.string()
                                           << (resolved.compressed ? " (compressed)" : ""));

    Result<LoadedImage, LoadError> outcome = LoadError{};
    try {
        outcome = load_image(*native_, cache_, resolved, resolver_.module_name(reference));
    } catch (const std::exception& e) {
        outcome = LoadError::load_failed("loading " + resolved.canonical.string() +
                                         " raised: " + e.what());
    } catch (...) {
        // Waiters must never stay blocked; the exception still reaches the caller.
        record->publish_failed(
            LoadError::load_failed("module initializer raised a non-standard exception"));
        throw;
    }

    if (is_err(outcome)) {
        LoadError error = std::move(unwrap_err(outcome));
        error.reference = std::string(reference);
        record->publish_failed(error);
        MODLOAD_LOG_WARN("loader", error.message());
        return *record->failure();
    }

    LoadedImage& image = unwrap(outcome);
    size_t symbol_count = image.module.symbols.size();
    record->publish_loaded(std::move(image.module.id), image.handle,
                           std::move(image.module.symbols));
    MODLOAD_LOG_INFO("loader", "loaded " << record->id() << " from " << record->path().string()
                                         << " (" << symbol_count << " symbols, handle "
                                         << record->native_handle() << ")");
    return ModuleHandle(record);
}

auto ModuleRegistry::find(const fs::path& canonical_path) const -> ModuleHandle {
    std::lock_guard lock(mutex_);
    auto it = modules_.find(canonical_path.string());
    if (it == modules_.end() || it->second->state() != ModuleState::Loaded) {
        return nullptr;
    }
    return it->second;
}

auto ModuleRegistry::stats() const -> Stats {
    std::lock_guard lock(mutex_);
    Stats stats;
    stats.total = modules_.size();
    for (const auto& [_, record] : modules_) {
        switch (record->state()) {
        case ModuleState::Pending:
            ++stats.pending;
            break;
        case ModuleState::Loaded:
            ++stats.loaded;
            break;
        case ModuleState::Failed:
            ++stats.failed;
            break;
        }
    }
    return stats;
}

} // namespace modload::loader
