//! # In-Memory Native Binding
//!
//! Test double for `NativeBinding`. Images are registered by path with a
//! symbol table of real in-process addresses, so the initializer and the
//! registry run unchanged on top of it. Registry tests still need a file
//! at each path because resolution canonicalizes through the filesystem;
//! `TempModuleDir` creates those.

#pragma once

#include "modload/abi.h"
#include "modload/loader/native.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace modload::test {

using loader::NativeFailure;
using loader::NativeHandle;

/// One fake image.
struct FakeImage {
    /// Symbol name -> address, as the dynamic linker would return it.
    std::map<std::string, void*> symbols;

    /// When set, `load()` fails with this instead of returning a handle.
    std::optional<NativeFailure> failure;

    /// Runs inside `load()` before the handle is returned.
    std::function<void()> on_load;

    std::atomic<int> loads{0};
};

template <typename Fn> void* fn_address(Fn* fn) {
    return reinterpret_cast<void*>(fn);
}

class FakeNativeBinding : public loader::NativeBinding {
public:
    /// Registers an image under the canonical form of `path`.
    FakeImage& add_image(const fs::path& path) {
        std::lock_guard lock(mutex_);
        auto& slot = images_[key(path)];
        slot = std::make_unique<FakeImage>();
        return *slot;
    }

    auto load(const fs::path& path) -> Result<NativeHandle, NativeFailure> override {
        total_loads_.fetch_add(1);
        FakeImage* image = nullptr;
        {
            std::lock_guard lock(mutex_);
            auto it = images_.find(key(path));
            if (it != images_.end()) {
                image = it->second.get();
            }
        }
        if (!image) {
            last_error_ = ENOENT;
            return NativeFailure{path.string() + ": cannot open shared object file: "
                                                 "No such file or directory",
                                 ENOENT};
        }
        image->loads.fetch_add(1);
        if (image->on_load) {
            image->on_load();
        }
        if (image->failure) {
            last_error_ = image->failure->code;
            return *image->failure;
        }
        return static_cast<NativeHandle>(image);
    }

    auto resolve(NativeHandle handle, const std::string& name) -> void* override {
        auto* image = static_cast<FakeImage*>(handle);
        auto it = image->symbols.find(name);
        if (it == image->symbols.end()) {
            last_error_ = ENOENT;
            return nullptr;
        }
        return it->second;
    }

    auto last_error() const -> int override {
        return last_error_;
    }

    int loads_of(const fs::path& path) const {
        std::lock_guard lock(mutex_);
        auto it = images_.find(key(path));
        return it == images_.end() ? 0 : it->second->loads.load();
    }

    int total_loads() const {
        return total_loads_.load();
    }

private:
    static std::string key(const fs::path& path) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(path, ec);
        return ec ? path.string() : canonical.string();
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<FakeImage>> images_;
    std::atomic<int> total_loads_{0};
    static inline thread_local int last_error_ = 0;
};

/// Scratch directory of placeholder module files, removed on destruction.
class TempModuleDir {
public:
    explicit TempModuleDir(const std::string& tag) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("modload_test_" + tag + "_" +
                 std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + "_" +
                 std::to_string(stamp));
        fs::create_directories(root_);
    }

    ~TempModuleDir() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempModuleDir(const TempModuleDir&) = delete;
    TempModuleDir& operator=(const TempModuleDir&) = delete;

    /// Creates `<root>/<name>` with placeholder content; returns its canonical path.
    fs::path touch(const std::string& name, const std::string& content = "fake module\n") {
        auto path = root_ / name;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        out.close();
        return fs::canonical(path);
    }

    const fs::path& root() const {
        return root_;
    }

private:
    fs::path root_;
};

} // namespace modload::test
