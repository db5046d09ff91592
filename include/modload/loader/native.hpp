//! # Native Loader Binding
//!
//! Capability interface over the operating system's dynamic linker. The
//! registry only talks to the linker through `NativeBinding`, so tests can
//! substitute an in-memory fake.
//!
//! Failures are passed through untouched: the binding reports the linker's
//! own message and code, it never interprets or retries.

#pragma once

#include "modload/common.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace modload::loader {

/// Opaque handle of a loaded image (`void*` from dlopen, `HMODULE` on Windows).
using NativeHandle = void*;

/// The dynamic linker rejected an image.
struct NativeFailure {
    std::string message; ///< Platform message (dlerror / FormatMessage)
    int code = 0;        ///< errno / GetLastError(), 0 if unknown
};

class NativeBinding {
public:
    virtual ~NativeBinding() = default;

    /// Loads the image at `path`.
    virtual auto load(const fs::path& path) -> Result<NativeHandle, NativeFailure> = 0;

    /// Address of `name` in `handle`, or nullptr if the image does not export it.
    virtual auto resolve(NativeHandle handle, const std::string& name) -> void* = 0;

    /// Platform error code of the calling thread's last failed call.
    virtual auto last_error() const -> int = 0;
};

/// Dynamic-linker flags.
struct NativeFlags {
    bool bind_now = false;       ///< RTLD_NOW instead of RTLD_LAZY
    bool global_symbols = false; ///< RTLD_GLOBAL instead of RTLD_LOCAL
};

/// Binding to dlopen/dlsym (POSIX) or LoadLibrary/GetProcAddress (Windows).
/// Images are never closed.
class SystemBinding : public NativeBinding {
public:
    explicit SystemBinding(NativeFlags flags = {});

    auto load(const fs::path& path) -> Result<NativeHandle, NativeFailure> override;
    auto resolve(NativeHandle handle, const std::string& name) -> void* override;
    auto last_error() const -> int override;

private:
    NativeFlags flags_;
};

} // namespace modload::loader
