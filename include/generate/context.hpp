//! # Generation Context
//!
//! Value types exchanged between the scheduler and generation backends.

#ifndef FORGE_GENERATE_CONTEXT_HPP
#define FORGE_GENERATE_CONTEXT_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace forge::generate {

enum class ContextKind { Build, Test };

inline const char* context_kind_name(ContextKind kind) {
    return kind == ContextKind::Build ? "build" : "test";
}

/// Everything a backend needs to generate one module. Built once per module
/// and never modified afterwards.
struct ModuleSpecContext {
    ContextKind kind = ContextKind::Build;
    std::string spec_module;
    std::string generated_module;
    std::vector<std::string> expected_names;
    std::map<std::string, std::string> spec_sources;          ///< spec ref -> source
    std::map<std::string, std::string> spec_prompts;          ///< spec ref -> guidance
    std::map<std::string, std::string> dependency_apis;       ///< dep spec ref -> source
    std::map<std::string, std::string> dependency_generated;  ///< dep module -> generated source
    std::string shared_guidance;
};

struct TokenUsage {
    int64_t prompt_tokens = 0;
    int64_t completion_tokens = 0;
    std::string model;
    std::string provider;
};

struct GenerationResult {
    int attempts = 0;
    std::optional<std::string> source;
    std::vector<std::string> errors;
    std::optional<TokenUsage> usage;
};

/// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() {
        flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace forge::generate

#endif // FORGE_GENERATE_CONTEXT_HPP
