//! # Generate/Validate/Retry Loop Tests

#include "generate/backend.hpp"

#include <gtest/gtest.h>

#include <deque>

using namespace forge;
using namespace forge::generate;

namespace {

/// Replays scripted responses and records the feedback each call received.
class ScriptedBackend : public GeneratorBackend {
public:
    std::deque<Result<GeneratedModule, build::GenerationError>> responses;
    std::vector<std::vector<std::string>> seen_context;

    std::string model_name() const override {
        return "gpt-4.1";
    }

    std::string provider_name() const override {
        return "scripted";
    }

    Result<GeneratedModule, build::GenerationError>
    generate_module(const ModuleSpecContext& ctx, const std::vector<std::string>& extra_error_context,
                    const CancellationToken&) override {
        seen_context.push_back(extra_error_context);
        if (responses.empty()) {
            return build::GenerationError{ctx.spec_module, "script exhausted"};
        }
        auto next = std::move(responses.front());
        responses.pop_front();
        return next;
    }

    void push_source(const std::string& source, int64_t prompt = 10, int64_t completion = 5) {
        responses.emplace_back(
            GeneratedModule{source, TokenUsage{prompt, completion, "gpt-4.1", "scripted"}});
    }
};

ModuleSpecContext context() {
    ModuleSpecContext ctx;
    ctx.spec_module = "pkg.mod";
    ctx.generated_module = "pkg.__generated__.mod";
    ctx.expected_names = {"f"};
    return ctx;
}

} // namespace

TEST(GenerateRetryTest, FirstAttemptSucceeds) {
    ScriptedBackend backend;
    backend.push_source("def f(): ...\n");

    auto result = backend.generate_with_retry(context(), 2, nullptr, CancellationToken());

    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.source, "def f(): ...\n");
    EXPECT_TRUE(result.errors.empty());
    ASSERT_TRUE(result.usage.has_value());
    EXPECT_EQ(result.usage->prompt_tokens, 10);
    EXPECT_EQ(backend.seen_context.size(), 1u);
    EXPECT_TRUE(backend.seen_context[0].empty());
}

TEST(GenerateRetryTest, RetriesWithFeedback) {
    ScriptedBackend backend;
    backend.push_source("def g(): ...\n", 10, 5);
    backend.push_source("def f(): ...\n", 20, 7);

    auto result = backend.generate_with_retry(context(), 2, nullptr, CancellationToken());

    EXPECT_EQ(result.attempts, 2);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(backend.seen_context.size(), 2u);
    EXPECT_TRUE(backend.seen_context[0].empty());
    EXPECT_EQ(backend.seen_context[1],
              (std::vector<std::string>{"previous output errors: Missing top-level definition: f"}));
    ASSERT_TRUE(result.usage.has_value());
    EXPECT_EQ(result.usage->prompt_tokens, 30);
    EXPECT_EQ(result.usage->completion_tokens, 12);
    EXPECT_EQ(result.usage->model, "gpt-4.1");
    EXPECT_EQ(result.usage->provider, "scripted");
}

TEST(GenerateRetryTest, ExhaustedAttemptsKeepLastSource) {
    ScriptedBackend backend;
    backend.push_source("def g(): ...\n");
    backend.push_source("def h(): ...\n");

    auto result = backend.generate_with_retry(context(), 2, nullptr, CancellationToken());

    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.source, "def h(): ...\n");
    EXPECT_EQ(result.errors, (std::vector<std::string>{"Missing top-level definition: f"}));
}

TEST(GenerateRetryTest, ExtraValidatorRunsAfterStructuralChecks) {
    ScriptedBackend backend;
    backend.push_source("def f(): ...\n");
    backend.push_source("def f() -> int: ...\n");
    int calls = 0;
    Validator validator = [&calls](const std::string& source) -> std::vector<std::string> {
        ++calls;
        if (source.find("-> int") == std::string::npos) {
            return {"missing return annotation"};
        }
        return {};
    };

    auto result = backend.generate_with_retry(context(), 3, validator, CancellationToken());

    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(backend.seen_context[1],
              (std::vector<std::string>{"previous output errors: missing return annotation"}));
}

TEST(GenerateRetryTest, BackendErrorStopsLoop) {
    ScriptedBackend backend;
    backend.responses.emplace_back(build::GenerationError{"pkg.mod", "rate limited"});
    backend.push_source("def f(): ...\n");

    auto result = backend.generate_with_retry(context(), 3, nullptr, CancellationToken());

    EXPECT_EQ(result.attempts, 1);
    EXPECT_FALSE(result.source.has_value());
    EXPECT_EQ(result.errors, (std::vector<std::string>{"rate limited"}));
    EXPECT_FALSE(result.usage.has_value());
}

TEST(GenerateRetryTest, CancelledBeforeFirstAttempt) {
    ScriptedBackend backend;
    backend.push_source("def f(): ...\n");
    CancellationToken cancel;
    cancel.cancel();

    auto result = backend.generate_with_retry(context(), 2, nullptr, cancel);

    EXPECT_EQ(result.attempts, 0);
    EXPECT_FALSE(result.source.has_value());
    EXPECT_EQ(result.errors, (std::vector<std::string>{"Generation cancelled."}));
    EXPECT_TRUE(backend.seen_context.empty());
}

TEST(GenerateRetryTest, ZeroUsageIsAbsent) {
    ScriptedBackend backend;
    backend.responses.emplace_back(GeneratedModule{"def f(): ...\n", std::nullopt});

    auto result = backend.generate_with_retry(context(), 0, nullptr, CancellationToken());

    EXPECT_EQ(result.attempts, 1);
    EXPECT_FALSE(result.usage.has_value());
}
