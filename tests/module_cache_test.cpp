// Module decompression cache tests
//
// Uses arbitrary payloads: the cache never looks inside the library.

#include "fake_native.hpp"

#include "modload/loader/module_cache.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include <zstd.h>

using namespace modload;
using namespace modload::loader;
using modload::test::TempModuleDir;

class ModuleCacheTest : public ::testing::Test {
protected:
    fs::path write_zst(const std::string& name, const std::string& payload) {
        std::vector<char> out(ZSTD_compressBound(payload.size()));
        size_t size = ZSTD_compress(out.data(), out.size(), payload.data(), payload.size(), 1);
        EXPECT_FALSE(ZSTD_isError(size));
        return dir_.touch(name, std::string(out.data(), size));
    }

    /// Frame without a recorded content size, as produced by streaming compressors.
    fs::path write_streamed_zst(const std::string& name, const std::string& payload) {
        ZSTD_CCtx* ctx = ZSTD_createCCtx();
        ZSTD_CCtx_setParameter(ctx, ZSTD_c_contentSizeFlag, 0);
        std::vector<char> out(ZSTD_compressBound(payload.size()) + 64);
        ZSTD_inBuffer in{payload.data(), payload.size(), 0};
        ZSTD_outBuffer buf{out.data(), out.size(), 0};
        size_t remaining = ZSTD_compressStream2(ctx, &buf, &in, ZSTD_e_end);
        ZSTD_freeCCtx(ctx);
        EXPECT_EQ(remaining, 0u);
        return dir_.touch(name, std::string(out.data(), buf.pos));
    }

    /// Independently compressed payloads, concatenated as `cat a.zst b.zst` would.
    fs::path write_multi_frame_zst(const std::string& name,
                                   const std::vector<std::string>& payloads) {
        std::string joined;
        for (const auto& payload : payloads) {
            std::vector<char> out(ZSTD_compressBound(payload.size()));
            size_t size =
                ZSTD_compress(out.data(), out.size(), payload.data(), payload.size(), 1);
            EXPECT_FALSE(ZSTD_isError(size));
            joined.append(out.data(), size);
        }
        return dir_.touch(name, joined);
    }

    static std::string read(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    TempModuleDir dir_{"cache"};
    ModuleCache cache_{dir_.root() / "cache", ".so"};
};

TEST_F(ModuleCacheTest, DecompressesOnMiss) {
    auto compressed = write_zst("math.so.zst", "pretend library bytes");
    EXPECT_FALSE(cache_.is_current(compressed));

    auto result = cache_.materialize(compressed);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message();
    const auto& cached = unwrap(result);

    EXPECT_EQ(cached, cache_.cache_path(compressed));
    EXPECT_EQ(cached.parent_path(), dir_.root() / "cache");
    EXPECT_EQ(cached.extension(), ".so");
    EXPECT_EQ(cached.filename().string().rfind("math-", 0), 0u);
    EXPECT_EQ(read(cached), "pretend library bytes");
    EXPECT_TRUE(cache_.is_current(compressed));

    fs::path sidecar = cached;
    sidecar += ".hash";
    EXPECT_TRUE(fs::exists(sidecar));
}

TEST_F(ModuleCacheTest, ReusesCurrentEntry) {
    auto compressed = write_zst("math.so.zst", "original");
    auto first = cache_.materialize(compressed);
    ASSERT_TRUE(is_ok(first));

    auto stamp = fs::last_write_time(unwrap(first));
    auto second = cache_.materialize(compressed);
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(second), unwrap(first));
    EXPECT_EQ(fs::last_write_time(unwrap(second)), stamp);
}

TEST_F(ModuleCacheTest, RebuildsStaleEntry) {
    auto compressed = write_zst("math.so.zst", "version one");
    ASSERT_TRUE(is_ok(cache_.materialize(compressed)));

    write_zst("math.so.zst", "version two, longer");
    EXPECT_FALSE(cache_.is_current(compressed));

    auto result = cache_.materialize(compressed);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(read(unwrap(result)), "version two, longer");
}

TEST_F(ModuleCacheTest, SameNameDifferentDirectories) {
    auto a = write_zst("a/math.so.zst", "from a");
    auto b = write_zst("b/math.so.zst", "from b");

    EXPECT_NE(cache_.cache_path(a), cache_.cache_path(b));

    auto ra = cache_.materialize(a);
    auto rb = cache_.materialize(b);
    ASSERT_TRUE(is_ok(ra));
    ASSERT_TRUE(is_ok(rb));
    EXPECT_EQ(read(unwrap(ra)), "from a");
    EXPECT_EQ(read(unwrap(rb)), "from b");
}

TEST_F(ModuleCacheTest, StreamedFrameWithoutContentSize) {
    std::string payload(200000, 'x');
    auto compressed = write_streamed_zst("big.so.zst", payload);

    auto result = cache_.materialize(compressed);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message();
    EXPECT_EQ(read(unwrap(result)), payload);
}

TEST_F(ModuleCacheTest, CorruptArchiveIsLoadError) {
    auto compressed = dir_.touch("junk.so.zst", "not zstd at all");

    auto result = cache_.materialize(compressed);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Load);
    EXPECT_NE(unwrap_err(result).message().find("junk.so.zst"), std::string::npos);
    EXPECT_FALSE(fs::exists(cache_.cache_path(compressed)));
}

TEST_F(ModuleCacheTest, MultiFrameArchive) {
    std::string first(100000, 'a');
    std::string second(100000, 'b');
    auto compressed = write_multi_frame_zst("multi.so.zst", {first, second});

    auto result = cache_.materialize(compressed);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).message();
    EXPECT_EQ(read(unwrap(result)), first + second);
}

TEST_F(ModuleCacheTest, ForgedContentSizeIsLoadError) {
    // Magic, single-segment header with an 8-byte content size of 2^62, one
    // empty raw block and nothing else.
    const unsigned char header[] = {0x28, 0xB5, 0x2F, 0xFD, 0xE0, 0x00, 0x00, 0x00,
                                    0x00, 0x00, 0x00, 0x00, 0x40, 0x00, 0x00, 0x00};
    auto compressed = dir_.touch(
        "forged.so.zst", std::string(reinterpret_cast<const char*>(header), sizeof(header)));

    auto result = cache_.materialize(compressed);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Load);
    EXPECT_NE(unwrap_err(result).message().find("forged.so.zst"), std::string::npos);
    EXPECT_FALSE(fs::exists(cache_.cache_path(compressed)));
}

TEST_F(ModuleCacheTest, CachePathStripsSuffixes) {
    auto cached = cache_.cache_path(dir_.root() / "math.so.zst");
    EXPECT_EQ(cached.filename().string().rfind("math-", 0), 0u);
    EXPECT_EQ(cached.extension(), ".so");
}
