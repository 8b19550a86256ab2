#include "generate/backend.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace forge::generate {

auto GeneratorBackend::generate_with_retry(const ModuleSpecContext& ctx, int max_attempts,
                                           const Validator& extra_validator,
                                           const CancellationToken& cancel) -> GenerationResult {
    max_attempts = std::max(max_attempts, 1);

    GenerationResult result;
    std::vector<std::string> extra_context;
    int64_t total_prompt = 0;
    int64_t total_completion = 0;

    auto aggregate_usage = [&]() -> std::optional<TokenUsage> {
        if (total_prompt == 0 && total_completion == 0) {
            return std::nullopt;
        }
        return TokenUsage{total_prompt, total_completion, model_name(), provider_name()};
    };

    while (result.attempts < max_attempts) {
        if (cancel.is_cancelled()) {
            result.source.reset();
            result.errors = {"Generation cancelled."};
            break;
        }

        ++result.attempts;
        FORGE_LOG_DEBUG("generate", "Generating " << ctx.spec_module << " (attempt "
                                                  << result.attempts << "/" << max_attempts
                                                  << ")");

        auto generated = generate_module(ctx, extra_context, cancel);
        if (is_err(generated)) {
            result.source.reset();
            result.errors = {unwrap_err(generated).message};
            break;
        }

        auto& [source, usage] = unwrap(generated);
        if (usage) {
            total_prompt += usage->prompt_tokens;
            total_completion += usage->completion_tokens;
        }

        result.errors = validate_generated_source(source, ctx.expected_names);
        if (result.errors.empty() && extra_validator) {
            result.errors = extra_validator(source);
        }
        result.source = std::move(source);

        if (result.errors.empty()) {
            break;
        }
        if (result.attempts >= max_attempts) {
            break;
        }

        FORGE_LOG_INFO("generate", ctx.spec_module << ": attempt " << result.attempts
                                                   << " failed validation, retrying");
        for (const auto& error : result.errors) {
            extra_context.push_back("previous output errors: " + error);
        }
    }

    result.usage = aggregate_usage();
    return result;
}

} // namespace forge::generate
