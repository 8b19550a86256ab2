//! # Command Backend Tests

#include "generate/command_backend.hpp"
#include "generate/subprocess.hpp"

#include "json/json_parser.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace forge;
using namespace forge::generate;
using forge::test::TempDir;

namespace {

ModuleSpecContext context() {
    ModuleSpecContext ctx;
    ctx.spec_module = "pkg.mod";
    ctx.generated_module = "pkg.__generated__.mod";
    ctx.expected_names = {"f"};
    ctx.spec_sources = {{"pkg.mod:f", "def f(): ..."}};
    ctx.dependency_generated = {{"pkg.util", "def g(): ..."}};
    return ctx;
}

CommandBackend backend_for(const std::string& script, double timeout = 10.0) {
    CommandBackendOptions options;
    options.command = {"sh", "-c", script};
    options.model = "gpt-4.1";
    options.timeout_seconds = timeout;
    return CommandBackend(std::move(options));
}

} // namespace

TEST(StripCodeFencesTest, RemovesFences) {
    EXPECT_EQ(strip_code_fences("```python\ndef f(): ...\n```\n"), "def f(): ...\n");
    EXPECT_EQ(strip_code_fences("```\nx = 1\n```"), "x = 1\n");
}

TEST(StripCodeFencesTest, LeavesPlainText) {
    EXPECT_EQ(strip_code_fences("def f(): ...\n"), "def f(): ...\n");
    EXPECT_EQ(strip_code_fences("```python"), "```python");
}

TEST(ParseBackendOutputTest, JsonWithUsage) {
    auto [source, usage] = parse_backend_output(
        R"({"source": "def f(): ...\n", "usage": {"prompt_tokens": 12, "completion_tokens": 3}})",
        "gpt-4.1", "command");

    EXPECT_EQ(source, "def f(): ...\n");
    ASSERT_TRUE(usage.has_value());
    EXPECT_EQ(usage->prompt_tokens, 12);
    EXPECT_EQ(usage->completion_tokens, 3);
    EXPECT_EQ(usage->model, "gpt-4.1");
    EXPECT_EQ(usage->provider, "command");
}

TEST(ParseBackendOutputTest, UsageModelOverride) {
    auto [source, usage] = parse_backend_output(
        R"({"source": "x = 1", "usage": {"prompt_tokens": 1, "model": "gpt-5"}})", "gpt-4.1",
        "command");

    ASSERT_TRUE(usage.has_value());
    EXPECT_EQ(usage->model, "gpt-5");
}

TEST(ParseBackendOutputTest, PlainTextOutput) {
    auto [source, usage] = parse_backend_output("```python\nx = 1\n```\n", "m", "command");

    EXPECT_EQ(source, "x = 1\n");
    EXPECT_FALSE(usage.has_value());
}

TEST(ParseBackendOutputTest, JsonWithoutSourceIsText) {
    std::string output = R"({"text": "x = 1"})";

    auto [source, usage] = parse_backend_output(output, "m", "command");

    EXPECT_EQ(source, output);
    EXPECT_FALSE(usage.has_value());
}

TEST(ContextToJsonTest, RequestFields) {
    auto request = context_to_json(context(), "gpt-4.1", {"previous output errors: x"});

    EXPECT_EQ(request.get_string("kind"), "build");
    EXPECT_EQ(request.get_string("model"), "gpt-4.1");
    EXPECT_EQ(request.get_string("spec_module"), "pkg.mod");
    EXPECT_EQ(request.get_string("generated_module"), "pkg.__generated__.mod");
    const auto* deps = request.get("dependency_generated");
    ASSERT_NE(deps, nullptr);
    EXPECT_EQ(deps->get_string("pkg.util"), "def g(): ...");
    const auto* extra = request.get("extra_error_context");
    ASSERT_NE(extra, nullptr);
    ASSERT_TRUE(extra->is_array());
    EXPECT_EQ(extra->as_array().size(), 1u);
}

TEST(CommandBackendTest, ReadsRequestAndReturnsSource) {
    TempDir dir;
    std::string request_file = (dir.path() / "request.json").string();
    auto backend = backend_for("cat > " + request_file +
                               R"(; printf '{"source": "def f(): ...", "usage": {"prompt_tokens": 7, "completion_tokens": 2}}')");

    auto result = backend.generate_module(context(), {}, CancellationToken());

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).first, "def f(): ...");
    ASSERT_TRUE(unwrap(result).second.has_value());
    EXPECT_EQ(unwrap(result).second->prompt_tokens, 7);

    auto request = json::parse_json(dir.read("request.json"));
    ASSERT_TRUE(is_ok(request));
    EXPECT_EQ(unwrap(request).get_string("spec_module"), "pkg.mod");
}

TEST(CommandBackendTest, NonZeroExitIsError) {
    auto backend = backend_for("echo 'quota exhausted' >&2; exit 3");

    auto result = backend.generate_module(context(), {}, CancellationToken());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).module, "pkg.mod");
    EXPECT_EQ(unwrap_err(result).message, "Generation command exited with status 3: quota exhausted");
}

TEST(CommandBackendTest, Timeout) {
    auto backend = backend_for("sleep 5", 0.2);

    auto result = backend.generate_module(context(), {}, CancellationToken());

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("timed out"), std::string::npos);
}

TEST(CommandBackendTest, Cancelled) {
    auto backend = backend_for("sleep 5");
    CancellationToken cancel;
    cancel.cancel();

    auto result = backend.generate_module(context(), {}, cancel);

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Generation cancelled.");
}

TEST(CommandBackendTest, MissingCommand) {
    CommandBackend backend(CommandBackendOptions{});

    auto result = backend.generate_module(context(), {}, CancellationToken());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "No generation command configured.");
}

TEST(SubprocessTest, StdinReachesEofWhileSiblingChildRuns) {
    SubprocessOptions reader_options;
    reader_options.stdin_data = std::string(200 * 1024, 'x');
    reader_options.timeout_seconds = 3.0;
    SubprocessResult reader;

    std::thread reader_thread([&] {
        reader = run_subprocess({"sh", "-c", "sleep 0.3; cat >/dev/null; echo done"},
                                reader_options);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    SubprocessOptions sibling_options;
    sibling_options.timeout_seconds = 2.0;
    auto sibling = run_subprocess({"sleep", "1.5"}, sibling_options);
    reader_thread.join();

    EXPECT_TRUE(sibling.success());
    EXPECT_TRUE(reader.success()) << reader.stderr_output;
    EXPECT_FALSE(reader.timed_out);
    EXPECT_EQ(reader.stdout_output, "done\n");
    EXPECT_LT(reader.duration_us, 1500000);
}
