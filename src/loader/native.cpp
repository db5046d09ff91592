//! # System Dynamic-Linker Binding

#include "modload/loader/native.hpp"

#include "modload/log/log.hpp"

#include <cerrno>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace modload::loader {

namespace {

#ifdef _WIN32
auto format_windows_error(DWORD err) -> std::string {
    if (err == 0)
        return "";
    LPSTR buf = nullptr;
    DWORD len = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                   FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr, err, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                               reinterpret_cast<LPSTR>(&buf), 0, nullptr);
    std::string msg = (len > 0 && buf) ? std::string(buf, len) : "unknown error";
    LocalFree(buf);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.pop_back();
    }
    return msg + " (error " + std::to_string(err) + ")";
}
#endif

/// Last platform code of the calling thread.
thread_local int tls_last_error = 0;

} // namespace

SystemBinding::SystemBinding(NativeFlags flags) : flags_(flags) {}

auto SystemBinding::load(const fs::path& path) -> Result<NativeHandle, NativeFailure> {
#ifdef _WIN32
    HMODULE module = LoadLibraryW(path.wstring().c_str());
    if (!module) {
        DWORD err = GetLastError();
        tls_last_error = static_cast<int>(err);
        return NativeFailure{format_windows_error(err), static_cast<int>(err)};
    }
    return static_cast<NativeHandle>(module);
#else
    int mode = (flags_.bind_now ? RTLD_NOW : RTLD_LAZY) |
               (flags_.global_symbols ? RTLD_GLOBAL : RTLD_LOCAL);

    errno = 0;
    dlerror();
    void* handle = dlopen(path.c_str(), mode);
    if (!handle) {
        int code = errno;
        tls_last_error = code;
        const char* err = dlerror();
        return NativeFailure{err ? err : "dlopen failed", code};
    }
    MODLOAD_LOG_TRACE("native", "dlopen " << path.string() << " -> " << handle);
    return handle;
#endif
}

auto SystemBinding::resolve(NativeHandle handle, const std::string& name) -> void* {
#ifdef _WIN32
    auto proc = GetProcAddress(static_cast<HMODULE>(handle), name.c_str());
    if (!proc) {
        tls_last_error = static_cast<int>(GetLastError());
    }
    return reinterpret_cast<void*>(proc);
#else
    dlerror();
    void* address = dlsym(handle, name.c_str());
    if (!address) {
        if (const char* err = dlerror()) {
            MODLOAD_LOG_TRACE("native", "dlsym " << name << ": " << err);
        }
        tls_last_error = ENOENT;
    }
    return address;
#endif
}

auto SystemBinding::last_error() const -> int {
    return tls_last_error;
}

} // namespace modload::loader
