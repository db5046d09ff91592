//! # Module Decompression Cache Implementation

#include "modload/loader/module_cache.hpp"

#include "modload/common/crc32c.hpp"
#include "modload/loader/config.hpp"
#include "modload/log/log.hpp"

#include <chrono>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

#include <zstd.h>

namespace modload::loader {

namespace {

struct DCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const {
        ZSTD_freeDCtx(ctx);
    }
};

/// Upper bound on a decompressed module. Frame headers are not trusted.
constexpr size_t MAX_MODULE_SIZE = size_t{1} << 30;

auto read_file(const fs::path& path, std::vector<char>& out) -> bool {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec || size > MAX_MODULE_SIZE)
        return false;
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    out.resize(static_cast<size_t>(size));
    in.read(out.data(), static_cast<std::streamsize>(size));
    return static_cast<size_t>(in.gcount()) == size;
}

auto read_sidecar(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::string line;
    if (in) {
        std::getline(in, line);
    }
    return line;
}

/// Decompresses every frame of `input`. Output grows chunk by chunk, so a
/// content size claimed by a frame header is never used to allocate.
auto decompress_frames(const std::vector<char>& input, std::vector<char>& output)
    -> std::string {
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> ctx(ZSTD_createDCtx());
    if (!ctx)
        return "cannot allocate zstd context";

    std::vector<char> chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer in{input.data(), input.size(), 0};
    size_t last = 0;
    while (true) {
        ZSTD_outBuffer out{chunk.data(), chunk.size(), 0};
        last = ZSTD_decompressStream(ctx.get(), &out, &in);
        if (ZSTD_isError(last))
            return ZSTD_getErrorName(last);
        if (output.size() + out.pos > MAX_MODULE_SIZE)
            return "decompressed size exceeds " + std::to_string(MAX_MODULE_SIZE) + " bytes";
        output.insert(output.end(), chunk.data(), chunk.data() + out.pos);

        // A full output chunk may leave decoded bytes buffered in the context.
        if (in.pos == in.size && out.pos < out.size)
            break;
    }
    if (last != 0)
        return "truncated zstd stream";
    return "";
}

auto unique_temp_name(const fs::path& target) -> fs::path {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tmp = target;
    tmp += ".part-" + std::to_string(tid) + "-" + std::to_string(stamp);
    return tmp;
}

} // namespace

ModuleCache::ModuleCache(fs::path cache_dir, std::string suffix)
    : cache_dir_(std::move(cache_dir)), suffix_(std::move(suffix)) {}

auto ModuleCache::cache_path(const fs::path& compressed) const -> fs::path {
    // math.so.zst -> math ; two modules with the same file name from
    // different directories get distinct entries via the path hash.
    std::string stem = compressed.filename().string();
    if (stem.ends_with(".zst")) {
        stem.resize(stem.size() - 4);
    }
    if (!suffix_.empty() && stem.size() > suffix_.size() && has_library_suffix(stem, suffix_)) {
        stem.resize(stem.size() - suffix_.size());
    }
    return cache_dir_ / (stem + "-" + hex32(crc32c(compressed.string())) + suffix_);
}

auto ModuleCache::is_current(const fs::path& compressed) const -> bool {
    auto cached = cache_path(compressed);
    std::error_code ec;
    if (!fs::exists(cached, ec)) {
        return false;
    }

    fs::path hash_path = cached;
    hash_path += ".hash";
    std::string stored = read_sidecar(hash_path);
    if (stored.empty()) {
        return false;
    }
    std::string current = crc32c_file(compressed.string());
    return !current.empty() && current == stored;
}

auto ModuleCache::materialize(const fs::path& compressed) const -> Result<fs::path, LoadError> {
    auto cached = cache_path(compressed);

    if (is_current(compressed)) {
        MODLOAD_LOG_DEBUG("cache", "hit " << compressed.string() << " -> " << cached.string());
        return cached;
    }

    MODLOAD_LOG_DEBUG("cache", "miss " << compressed.string() << ", decompressing");
    auto result = decompress(compressed, cached);
    if (is_err(result)) {
        return unwrap_err(result);
    }
    return cached;
}

auto ModuleCache::decompress(const fs::path& compressed, const fs::path& target) const
    -> Result<bool, LoadError> {
    std::vector<char> input;
    if (!read_file(compressed, input)) {
        return LoadError::load_failed("cannot read compressed module " + compressed.string());
    }

    if (ZSTD_getFrameContentSize(input.data(), input.size()) == ZSTD_CONTENTSIZE_ERROR) {
        return LoadError::load_failed(compressed.string() + " is not a zstd frame");
    }

    std::vector<char> output;
    auto err = decompress_frames(input, output);
    if (!err.empty()) {
        return LoadError::load_failed("zstd decompression of " + compressed.string() +
                                      " failed: " + err);
    }

    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        return LoadError::load_failed("cannot create module cache " + cache_dir_.string() + ": " +
                                      ec.message(),
                                      ec.value());
    }

    auto tmp = unique_temp_name(target);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out.write(output.data(), static_cast<std::streamsize>(output.size()));
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return LoadError::load_failed("cannot write " + tmp.string());
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return LoadError::load_failed("cannot move decompressed module into " + target.string() +
                                          ": " + ec.message(),
                                      ec.value());
    }

    std::string hash = crc32c_file(compressed.string());
    if (!hash.empty()) {
        fs::path hash_path = target;
        hash_path += ".hash";
        std::ofstream hf(hash_path, std::ios::trunc);
        hf << hash << "\n";
        if (!hf) {
            MODLOAD_LOG_WARN("cache", "cannot write " << hash_path.string()
                                                      << "; entry will be rebuilt next time");
        }
    }

    MODLOAD_LOG_INFO("cache", "decompressed " << compressed.string() << " (" << input.size()
                                              << " -> " << output.size() << " bytes)");
    return true;
}

} // namespace modload::loader
