//! # Response Cache Tests

#include "build/response_cache.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <functional>
#include <thread>
#include <vector>

using namespace forge::build;
using forge::generate::ModuleSpecContext;
using forge::test::TempDir;

namespace {

ModuleSpecContext sample_context() {
    ModuleSpecContext ctx;
    ctx.spec_module = "pkg.mod";
    ctx.generated_module = "pkg.__generated__.mod";
    ctx.expected_names = {"f"};
    ctx.spec_sources = {{"pkg.mod:f", "def f(): ..."}};
    return ctx;
}

CacheEntry sample_entry() {
    CacheEntry entry;
    entry.source = "def f():\n    return 1\n";
    entry.prompt_tokens = 120;
    entry.completion_tokens = 30;
    entry.model = "gpt-4.1";
    entry.provider = "command";
    entry.cached_at = 1700000000.5;
    return entry;
}

} // namespace

TEST(CacheKeyTest, DeterministicHex) {
    auto key = cache_key_from_context(sample_context(), "gpt-4.1", "command");

    EXPECT_EQ(key.size(), 64u);
    EXPECT_EQ(key, cache_key_from_context(sample_context(), "gpt-4.1", "command"));
}

TEST(CacheKeyTest, CoversModelAndProvider) {
    auto base = cache_key_from_context(sample_context(), "gpt-4.1", "command");

    EXPECT_NE(base, cache_key_from_context(sample_context(), "gpt-5", "command"));
    EXPECT_NE(base, cache_key_from_context(sample_context(), "gpt-4.1", "other"));
}

TEST(CacheKeyTest, CoversEveryContextField) {
    using Mutator = std::function<void(ModuleSpecContext&)>;
    const std::vector<std::pair<const char*, Mutator>> mutators = {
        {"kind", [](auto& c) { c.kind = forge::generate::ContextKind::Test; }},
        {"spec_module", [](auto& c) { c.spec_module = "pkg.other"; }},
        {"generated_module", [](auto& c) { c.generated_module = "pkg._gen.mod"; }},
        {"expected_names", [](auto& c) { c.expected_names.push_back("g"); }},
        {"spec_sources", [](auto& c) { c.spec_sources["pkg.mod:f"] = "def f(x): ..."; }},
        {"spec_prompts", [](auto& c) { c.spec_prompts["pkg.mod:f"] = "be brief"; }},
        {"dependency_apis", [](auto& c) { c.dependency_apis["pkg.util:g"] = "def g(): ..."; }},
        {"dependency_generated", [](auto& c) { c.dependency_generated["pkg.util"] = "def g(): ..."; }},
        {"shared_guidance", [](auto& c) { c.shared_guidance = "prefer stdlib"; }},
    };
    auto base = cache_key_from_context(sample_context(), "gpt-4.1", "command");

    for (const auto& [field, mutate] : mutators) {
        auto ctx = sample_context();
        mutate(ctx);
        EXPECT_NE(base, cache_key_from_context(ctx, "gpt-4.1", "command")) << field;
    }
}

TEST(ResponseCacheTest, MissThenHit) {
    TempDir dir;
    ResponseCache cache(dir.path() / "cache");
    auto key = cache_key_from_context(sample_context(), "gpt-4.1", "command");

    EXPECT_FALSE(cache.get(key).has_value());
    cache.put(key, sample_entry());
    auto entry = cache.get(key);

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, sample_entry().source);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(ResponseCacheTest, PersistsAcrossInstances) {
    TempDir dir;
    auto key = cache_key_from_context(sample_context(), "gpt-4.1", "command");
    {
        ResponseCache cache(dir.path() / "cache");
        cache.put(key, sample_entry());
    }

    ResponseCache reopened(dir.path() / "cache");
    auto entry = reopened.get(key);

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->prompt_tokens, 120);
    EXPECT_EQ(entry->completion_tokens, 30);
    EXPECT_EQ(entry->model, "gpt-4.1");
    EXPECT_EQ(entry->provider, "command");
    EXPECT_DOUBLE_EQ(entry->cached_at, 1700000000.5);
    EXPECT_TRUE(fs::exists(reopened.entry_path(key)));
    EXPECT_EQ(reopened.entry_path(key).parent_path().filename(), key.substr(0, 2));
}

TEST(ResponseCacheTest, CorruptEntryIsMiss) {
    TempDir dir;
    ResponseCache cache(dir.path() / "cache");
    std::string key(64, 'a');
    fs::create_directories(cache.entry_path(key).parent_path());
    {
        std::ofstream out(cache.entry_path(key));
        out << "{not json";
    }

    EXPECT_FALSE(cache.get(key).has_value());
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), 0u);
}

TEST(ResponseCacheTest, EntryWithoutSourceIsMiss) {
    TempDir dir;
    ResponseCache cache(dir.path() / "cache");
    std::string key(64, 'b');
    fs::create_directories(cache.entry_path(key).parent_path());
    {
        std::ofstream out(cache.entry_path(key));
        out << R"({"model": "gpt-4.1"})";
    }

    EXPECT_FALSE(cache.get(key).has_value());
}

TEST(ResponseCacheTest, DisabledCacheStoresNothing) {
    TempDir dir;
    ResponseCache cache(dir.path() / "cache", false);
    std::string key(64, 'c');

    cache.put(key, sample_entry());

    EXPECT_FALSE(cache.get(key).has_value());
    EXPECT_FALSE(fs::exists(dir.path() / "cache"));
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(ResponseCacheTest, InfoAndClear) {
    TempDir dir;
    ResponseCache cache(dir.path() / "cache");
    cache.put(std::string(64, 'a'), sample_entry());
    cache.put(std::string(64, 'b'), sample_entry());

    auto info = cache.info();
    EXPECT_EQ(info.entries, 2u);
    EXPECT_GT(info.size_bytes, 0u);
    EXPECT_EQ(info.path, dir.path() / "cache");

    EXPECT_EQ(cache.clear_all(), 2u);
    EXPECT_EQ(cache.info().entries, 0u);
    EXPECT_FALSE(cache.get(std::string(64, 'a')).has_value());
}

TEST(ResponseCacheTest, InfoOnMissingDirectory) {
    TempDir dir;
    ResponseCache cache(dir.path() / "nowhere");

    EXPECT_EQ(cache.info().entries, 0u);
    EXPECT_EQ(cache.clear_all(), 0u);
}

TEST(ResponseCacheTest, ConcurrentPutAndGet) {
    TempDir dir;
    ResponseCache cache(dir.path() / "cache");

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t] {
            std::string key = std::string(62, 'a') + std::to_string(10 + t);
            cache.put(key, sample_entry());
            EXPECT_TRUE(cache.get(key).has_value());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(cache.hits(), 8u);
    EXPECT_EQ(cache.info().entries, 8u);
}
