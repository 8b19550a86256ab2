#include "build/response_cache.hpp"

#include "build/artifact_writer.hpp"
#include "build/digest.hpp"
#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <fstream>
#include <mutex>
#include <sstream>

namespace forge::build {

namespace {

auto mapping_json(const std::map<std::string, std::string>& mapping) -> std::string {
    json::JsonObject obj;
    for (const auto& [key, value] : mapping) {
        obj[key] = json::JsonValue(value);
    }
    return json::JsonValue(std::move(obj)).to_string();
}

auto short_key(const std::string& key) -> std::string {
    return key.substr(0, 12);
}

auto entry_from_json(const json::JsonValue& data) -> std::optional<CacheEntry> {
    auto source = data.get_string("source");
    if (!source) {
        return std::nullopt;
    }
    CacheEntry entry;
    entry.source = std::move(*source);
    entry.prompt_tokens = data.get_i64("prompt_tokens").value_or(0);
    entry.completion_tokens = data.get_i64("completion_tokens").value_or(0);
    entry.model = data.get_string("model").value_or("");
    entry.provider = data.get_string("provider").value_or("");
    entry.cached_at = data.get_f64("cached_at").value_or(0.0);
    return entry;
}

auto entry_to_json(const CacheEntry& entry) -> json::JsonValue {
    json::JsonValue data = json::json_object();
    data.set("source", json::JsonValue(entry.source));
    data.set("prompt_tokens", json::JsonValue(entry.prompt_tokens));
    data.set("completion_tokens", json::JsonValue(entry.completion_tokens));
    data.set("model", json::JsonValue(entry.model));
    data.set("provider", json::JsonValue(entry.provider));
    data.set("cached_at", json::JsonValue(entry.cached_at));
    return data;
}

} // namespace

auto cache_key_from_context(const generate::ModuleSpecContext& ctx, const std::string& model,
                            const std::string& provider) -> std::string {
    return sha256_fields({
        provider,
        model,
        generate::context_kind_name(ctx.kind),
        ctx.spec_module,
        ctx.generated_module,
        json::json_string_array(ctx.expected_names).to_string(),
        mapping_json(ctx.spec_sources),
        mapping_json(ctx.spec_prompts),
        mapping_json(ctx.dependency_apis),
        mapping_json(ctx.dependency_generated),
        ctx.shared_guidance,
    });
}

// ============================================================================
// ResponseCache
// ============================================================================

ResponseCache::ResponseCache(fs::path cache_dir, bool enabled)
    : cache_dir_(std::move(cache_dir)), enabled_(enabled) {}

fs::path ResponseCache::entry_path(const std::string& key) const {
    return cache_dir_ / key.substr(0, 2) / (key + ".json");
}

std::optional<CacheEntry> ResponseCache::get(const std::string& key) {
    if (!enabled_) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    {
        std::shared_lock lock(mutex_);
        auto it = memo_.find(key);
        if (it != memo_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    fs::path path = entry_path(key);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    std::optional<CacheEntry> entry;
    if (file) {
        auto parsed = json::parse_json(oss.str());
        if (is_ok(parsed)) {
            entry = entry_from_json(unwrap(parsed));
        }
    }
    if (!entry) {
        FORGE_LOG_DEBUG("cache", "Cache read failed for key " << short_key(key));
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    {
        std::unique_lock lock(mutex_);
        memo_[key] = *entry;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return entry;
}

void ResponseCache::put(const std::string& key, const CacheEntry& entry) {
    if (!enabled_) {
        return;
    }
    {
        std::unique_lock lock(mutex_);
        memo_[key] = entry;
    }

    fs::path path = entry_path(key);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        FORGE_LOG_DEBUG("cache", "Cache write failed for key " << short_key(key) << ": "
                                                               << ec.message());
        return;
    }
    if (auto err = atomic_write_file(path, entry_to_json(entry).to_string())) {
        FORGE_LOG_DEBUG("cache",
                        "Cache write failed for key " << short_key(key) << ": " << err->message);
        return;
    }
    FORGE_LOG_TRACE("cache", "Stored " << short_key(key));
}

ResponseCache::Info ResponseCache::info() const {
    Info info;
    info.path = cache_dir_;
    std::error_code ec;
    if (!fs::is_directory(cache_dir_, ec)) {
        return info;
    }
    for (auto it = fs::recursive_directory_iterator(cache_dir_, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec) || it->path().extension() != ".json") {
            continue;
        }
        ++info.entries;
        auto size = it->file_size(ec);
        if (!ec) {
            info.size_bytes += size;
        }
        ec.clear();
    }
    return info;
}

size_t ResponseCache::clear_all() {
    {
        std::unique_lock lock(mutex_);
        memo_.clear();
    }
    size_t count = info().entries;
    std::error_code ec;
    fs::remove_all(cache_dir_, ec);
    if (ec) {
        FORGE_LOG_WARN("cache", "Failed to remove " << cache_dir_.string() << ": " << ec.message());
    }
    return count;
}

} // namespace forge::build
