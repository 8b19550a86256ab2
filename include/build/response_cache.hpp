//! # Response Cache
//!
//! Content-addressed store of previous generation results, keyed by a
//! SHA-256 over the full generation context plus model and provider.
//!
//! Entries live at `<cache_dir>/<key[0:2]>/<key>.json` with an in-process
//! memo in front. Reads never fail: a missing, unreadable or corrupt entry
//! is a miss. Writes are best-effort.
//!
//! Safe for concurrent use from generation workers: the memo is guarded by
//! a `std::shared_mutex` and the hit/miss counters are atomic.

#pragma once

#include "generate/context.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace forge::build {

namespace fs = std::filesystem;

struct CacheEntry {
    std::string source;
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    std::string model;
    std::string provider;
    double cached_at = 0.0; ///< Seconds since the epoch
};

/// Deterministic key over provider, model, context kind, spec module,
/// generated module, expected names, spec sources, prompts, dependency APIs,
/// dependency generated sources and the shared guidance block.
[[nodiscard]] auto cache_key_from_context(const generate::ModuleSpecContext& ctx,
                                          const std::string& model, const std::string& provider)
    -> std::string;

class ResponseCache {
public:
    explicit ResponseCache(fs::path cache_dir, bool enabled = true);

    /// Memo first, then disk. Counts a hit or a miss.
    [[nodiscard]] std::optional<CacheEntry> get(const std::string& key);

    /// Stores in the memo and writes the entry file; write failures are
    /// logged and otherwise ignored.
    void put(const std::string& key, const CacheEntry& entry);

    struct Info {
        size_t entries = 0;
        uintmax_t size_bytes = 0;
        fs::path path;
    };

    [[nodiscard]] Info info() const;

    /// Removes every entry. Returns how many entry files were removed.
    size_t clear_all();

    [[nodiscard]] size_t hits() const {
        return hits_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t misses() const {
        return misses_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool enabled() const {
        return enabled_;
    }

    [[nodiscard]] const fs::path& cache_dir() const {
        return cache_dir_;
    }

    [[nodiscard]] fs::path entry_path(const std::string& key) const;

private:
    fs::path cache_dir_;
    bool enabled_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CacheEntry> memo_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
};

} // namespace forge::build
