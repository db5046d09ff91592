// Loader configuration tests

#include "modload/loader/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace modload::loader;

namespace {

void apply(LoaderConfig& config, std::vector<std::string> args) {
    args.insert(args.begin(), "modload");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    apply_loader_options(config, static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(LoaderConfigTest, Defaults) {
    auto config = LoaderConfig::defaults();

    EXPECT_TRUE(config.search_paths.empty());
    EXPECT_EQ(config.cache_dir.filename(), "modload-cache");
    EXPECT_FALSE(config.bind_now);
    EXPECT_FALSE(config.global_symbols);
#if defined(_WIN32)
    EXPECT_EQ(config.library_suffix, ".dll");
#elif defined(__APPLE__)
    EXPECT_EQ(config.library_suffix, ".dylib");
#else
    EXPECT_EQ(config.library_suffix, ".so");
#endif
}

#ifndef _WIN32
TEST(LoaderConfigTest, Environment) {
    setenv("MODLOAD_PATH", "/opt/a::/opt/b", 1);
    setenv("MODLOAD_CACHE_DIR", "/var/cache/modload", 1);
    setenv("MODLOAD_BIND_NOW", "1", 1);
    setenv("MODLOAD_GLOBAL", "0", 1);

    auto config = LoaderConfig::from_environment();

    unsetenv("MODLOAD_PATH");
    unsetenv("MODLOAD_CACHE_DIR");
    unsetenv("MODLOAD_BIND_NOW");
    unsetenv("MODLOAD_GLOBAL");

    ASSERT_EQ(config.search_paths.size(), 2u);
    EXPECT_EQ(config.search_paths[0], fs::path("/opt/a"));
    EXPECT_EQ(config.search_paths[1], fs::path("/opt/b"));
    EXPECT_EQ(config.cache_dir, fs::path("/var/cache/modload"));
    EXPECT_TRUE(config.bind_now);
    EXPECT_FALSE(config.global_symbols);
}

TEST(LoaderConfigTest, ParseSearchPathDropsEmptyEntries) {
    auto paths = parse_search_path(":/a::/b:");
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], fs::path("/a"));
    EXPECT_EQ(paths[1], fs::path("/b"));
    EXPECT_TRUE(parse_search_path("").empty());
}
#endif

TEST(LoaderConfigTest, CommandLineReplacesThenAppendsSearchPaths) {
    auto config = LoaderConfig::defaults();
    config.search_paths = {"/from/env"};

    apply(config, {"--search-path=/cli/one", "math", "--search-path=/cli/two", "--bind-now",
                   "--global", "--cache-dir=/tmp/mc"});

    ASSERT_EQ(config.search_paths.size(), 2u);
    EXPECT_EQ(config.search_paths[0], fs::path("/cli/one"));
    EXPECT_EQ(config.search_paths[1], fs::path("/cli/two"));
    EXPECT_EQ(config.cache_dir, fs::path("/tmp/mc"));
    EXPECT_TRUE(config.bind_now);
    EXPECT_TRUE(config.global_symbols);
}

TEST(LoaderConfigTest, RecognizesLoaderOptions) {
    EXPECT_TRUE(is_loader_option("--search-path=lib"));
    EXPECT_TRUE(is_loader_option("--cache-dir=/tmp"));
    EXPECT_TRUE(is_loader_option("--bind-now"));
    EXPECT_TRUE(is_loader_option("--global"));
    EXPECT_FALSE(is_loader_option("--call=Run"));
    EXPECT_FALSE(is_loader_option("math"));
}

TEST(LoaderConfigTest, SuffixMatching) {
    EXPECT_TRUE(ends_with_suffix("math.dll", ".dll", false));
    EXPECT_FALSE(ends_with_suffix("MATH.DLL", ".dll", false));
    EXPECT_TRUE(ends_with_suffix("MATH.DLL", ".dll", true));
    EXPECT_TRUE(ends_with_suffix("Math.Dll", ".dll", true));
    EXPECT_FALSE(ends_with_suffix("math.so", ".dll", true));
    EXPECT_FALSE(ends_with_suffix("so", ".so", true));

#ifdef _WIN32
    EXPECT_TRUE(has_library_suffix("MATH.DLL", ".dll"));
#else
    EXPECT_FALSE(has_library_suffix("MATH.SO", ".so"));
    EXPECT_TRUE(has_library_suffix("math.so", ".so"));
#endif
}
