//! # Cost Tracker
//!
//! Accumulates token usage for one build and estimates spend from a
//! per-model-prefix rate table (USD per 1M tokens).
//!
//! | Model prefix | Prompt | Completion |
//! |--------------|--------|------------|
//! | `gpt-4.1` | 2.00 | 8.00 |
//! | `gpt-4.1-mini` | 0.40 | 1.60 |
//! | `gpt-4.1-nano` | 0.10 | 0.40 |
//! | `gpt-5` | 2.00 | 8.00 |
//! | `o3` | 2.00 | 8.00 |
//! | `o4-mini` | 1.10 | 4.40 |
//! | `claude-sonnet` | 3.00 | 15.00 |
//! | `claude-opus` | 15.00 | 75.00 |
//! | `claude-haiku` | 0.25 | 1.25 |
//! | `llama-4` | 0.60 | 0.60 |
//! | `llama3.3-70b` | 0.60 | 0.60 |
//! | `llama3.1-8b` | 0.10 | 0.10 |
//!
//! The longest matching prefix wins; unknown models cost nothing.

#ifndef FORGE_BUILD_COST_TRACKER_HPP
#define FORGE_BUILD_COST_TRACKER_HPP

#include "build/errors.hpp"
#include "generate/context.hpp"
#include "json/json_value.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace forge::build {

/// Estimated USD cost of one call.
[[nodiscard]] auto estimate_cost(const std::string& model, int64_t prompt_tokens,
                                 int64_t completion_tokens) -> double;

/// Thread-safe: generation workers record usage concurrently.
class CostTracker {
public:
    explicit CostTracker(std::optional<double> max_cost = std::nullopt) : max_cost_(max_cost) {}

    void record(const std::string& module, const generate::TokenUsage& usage);
    void record_cache_hit();

    [[nodiscard]] int64_t total_prompt_tokens() const;
    [[nodiscard]] int64_t total_completion_tokens() const;
    [[nodiscard]] int64_t total_tokens() const;
    [[nodiscard]] size_t api_calls() const;
    [[nodiscard]] size_t cache_hits() const;
    [[nodiscard]] double estimated_cost() const;

    [[nodiscard]] std::optional<double> max_cost() const {
        return max_cost_;
    }

    /// Error when the estimated cost is strictly greater than the ceiling.
    [[nodiscard]] std::optional<BudgetExceededError> check_budget() const;

    /// {api_calls, cache_hits, prompt_tokens, completion_tokens,
    ///  total_tokens, estimated_cost_usd}
    [[nodiscard]] json::JsonValue summary_json() const;

    /// Multi-line human-readable summary for stderr.
    [[nodiscard]] std::string format_summary() const;

private:
    std::optional<double> max_cost_;
    std::vector<std::pair<std::string, generate::TokenUsage>> records_;
    size_t cache_hits_ = 0;
    mutable std::mutex mutex_;
};

} // namespace forge::build

#endif // FORGE_BUILD_COST_TRACKER_HPP
