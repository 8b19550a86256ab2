#include "build/cost_tracker.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace forge::build {

namespace {

struct ModelRate {
    const char* prefix;
    double prompt_per_million;
    double completion_per_million;
};

constexpr ModelRate COST_TABLE[] = {
    {"gpt-4.1", 2.00, 8.00},        {"gpt-4.1-mini", 0.40, 1.60}, {"gpt-4.1-nano", 0.10, 0.40},
    {"gpt-5", 2.00, 8.00},          {"o3", 2.00, 8.00},           {"o4-mini", 1.10, 4.40},
    {"claude-sonnet", 3.00, 15.00}, {"claude-opus", 15.00, 75.00}, {"claude-haiku", 0.25, 1.25},
    {"llama-4", 0.60, 0.60},        {"llama3.3-70b", 0.60, 0.60}, {"llama3.1-8b", 0.10, 0.10},
};

/// 1234567 -> "1,234,567"
auto with_thousands(int64_t value) -> std::string {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.insert(out.begin(), ',');
        }
        out.insert(out.begin(), *it);
        ++count;
    }
    return value < 0 ? "-" + out : out;
}

auto dollars(double value) -> std::string {
    std::ostringstream oss;
    oss << "$" << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

} // namespace

auto estimate_cost(const std::string& model, int64_t prompt_tokens, int64_t completion_tokens)
    -> double {
    const ModelRate* best = nullptr;
    size_t best_len = 0;
    for (const auto& rate : COST_TABLE) {
        std::string_view prefix = rate.prefix;
        if (model.starts_with(prefix) && prefix.size() > best_len) {
            best = &rate;
            best_len = prefix.size();
        }
    }
    if (best == nullptr) {
        return 0.0;
    }
    return (static_cast<double>(prompt_tokens) * best->prompt_per_million +
            static_cast<double>(completion_tokens) * best->completion_per_million) /
           1'000'000.0;
}

void CostTracker::record(const std::string& module, const generate::TokenUsage& usage) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.emplace_back(module, usage);
}

void CostTracker::record_cache_hit() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cache_hits_;
}

int64_t CostTracker::total_prompt_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t total = 0;
    for (const auto& [module, usage] : records_) {
        total += usage.prompt_tokens;
    }
    return total;
}

int64_t CostTracker::total_completion_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t total = 0;
    for (const auto& [module, usage] : records_) {
        total += usage.completion_tokens;
    }
    return total;
}

int64_t CostTracker::total_tokens() const {
    return total_prompt_tokens() + total_completion_tokens();
}

size_t CostTracker::api_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t CostTracker::cache_hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_hits_;
}

double CostTracker::estimated_cost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& [module, usage] : records_) {
        total += estimate_cost(usage.model, usage.prompt_tokens, usage.completion_tokens);
    }
    return total;
}

std::optional<BudgetExceededError> CostTracker::check_budget() const {
    if (!max_cost_) {
        return std::nullopt;
    }
    double cost = estimated_cost();
    if (cost > *max_cost_) {
        return BudgetExceededError{cost, *max_cost_};
    }
    return std::nullopt;
}

json::JsonValue CostTracker::summary_json() const {
    json::JsonValue summary = json::json_object();
    summary.set("api_calls", json::JsonValue(static_cast<int64_t>(api_calls())));
    summary.set("cache_hits", json::JsonValue(static_cast<int64_t>(cache_hits())));
    summary.set("prompt_tokens", json::JsonValue(total_prompt_tokens()));
    summary.set("completion_tokens", json::JsonValue(total_completion_tokens()));
    summary.set("total_tokens", json::JsonValue(total_tokens()));
    summary.set("estimated_cost_usd",
                json::JsonValue(std::round(estimated_cost() * 1e6) / 1e6));
    return summary;
}

std::string CostTracker::format_summary() const {
    std::ostringstream oss;
    oss << "Cost: " << api_calls() << " API call(s), " << cache_hits() << " cache hit(s)\n"
        << "  Tokens: " << with_thousands(total_prompt_tokens()) << " prompt + "
        << with_thousands(total_completion_tokens()) << " completion = "
        << with_thousands(total_tokens()) << " total\n"
        << "  Estimated cost: " << dollars(estimated_cost());
    if (max_cost_) {
        oss << "\n  Budget limit: " << dollars(*max_cost_);
    }
    return oss.str();
}

} // namespace forge::build
