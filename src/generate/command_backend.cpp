#include "generate/command_backend.hpp"

#include "generate/subprocess.hpp"
#include "json/json_parser.hpp"
#include "log/log.hpp"

namespace forge::generate {

namespace {

constexpr size_t STDERR_TAIL_BYTES = 2000;

auto mapping_to_json(const std::map<std::string, std::string>& mapping) -> json::JsonValue {
    json::JsonObject obj;
    for (const auto& [key, value] : mapping) {
        obj[key] = json::JsonValue(value);
    }
    return json::JsonValue(std::move(obj));
}

auto trim(const std::string& s) -> std::string {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

auto tail(const std::string& s, size_t max_bytes) -> std::string {
    std::string trimmed = trim(s);
    if (trimmed.size() <= max_bytes) {
        return trimmed;
    }
    return "..." + trimmed.substr(trimmed.size() - max_bytes);
}

} // namespace

auto context_to_json(const ModuleSpecContext& ctx, const std::string& model,
                     const std::vector<std::string>& extra_error_context) -> json::JsonValue {
    json::JsonValue request = json::json_object();
    request.set("kind", json::JsonValue(context_kind_name(ctx.kind)));
    request.set("model", json::JsonValue(model));
    request.set("spec_module", json::JsonValue(ctx.spec_module));
    request.set("generated_module", json::JsonValue(ctx.generated_module));
    request.set("expected_names", json::json_string_array(ctx.expected_names));
    request.set("spec_sources", mapping_to_json(ctx.spec_sources));
    request.set("spec_prompts", mapping_to_json(ctx.spec_prompts));
    request.set("dependency_apis", mapping_to_json(ctx.dependency_apis));
    request.set("dependency_generated", mapping_to_json(ctx.dependency_generated));
    request.set("shared_guidance", json::JsonValue(ctx.shared_guidance));
    request.set("extra_error_context", json::json_string_array(extra_error_context));
    return request;
}

auto strip_code_fences(const std::string& text) -> std::string {
    std::string trimmed = trim(text);
    if (!trimmed.starts_with("```")) {
        return text;
    }
    size_t first_newline = trimmed.find('\n');
    if (first_newline == std::string::npos) {
        return text;
    }
    size_t closing = trimmed.rfind("```");
    if (closing <= first_newline) {
        return text;
    }
    return trimmed.substr(first_newline + 1, closing - first_newline - 1);
}

auto parse_backend_output(const std::string& output, const std::string& model,
                          const std::string& provider) -> GeneratedModule {
    std::string trimmed = trim(output);
    if (trimmed.starts_with("{")) {
        auto parsed = json::parse_json(trimmed);
        if (is_ok(parsed)) {
            const auto& value = unwrap(parsed);
            if (auto source = value.get_string("source")) {
                std::optional<TokenUsage> usage;
                if (const auto* u = value.get("usage"); u != nullptr && u->is_object()) {
                    TokenUsage tokens;
                    tokens.prompt_tokens = u->get_i64("prompt_tokens").value_or(0);
                    tokens.completion_tokens = u->get_i64("completion_tokens").value_or(0);
                    tokens.model = u->get_string("model").value_or(model);
                    tokens.provider = provider;
                    usage = tokens;
                }
                return {strip_code_fences(*source), usage};
            }
        }
    }
    return {strip_code_fences(output), std::nullopt};
}

auto CommandBackend::generate_module(const ModuleSpecContext& ctx,
                                     const std::vector<std::string>& extra_error_context,
                                     const CancellationToken& cancel)
    -> Result<GeneratedModule, build::GenerationError> {
    if (options_.command.empty()) {
        return build::GenerationError{ctx.spec_module, "No generation command configured."};
    }

    SubprocessOptions sub;
    sub.stdin_data = context_to_json(ctx, options_.model, extra_error_context).to_string();
    sub.timeout_seconds = options_.timeout_seconds;
    sub.working_dir = options_.working_dir;
    sub.should_cancel = [cancel] { return cancel.is_cancelled(); };

    FORGE_LOG_DEBUG("generate",
                    "Running " << format_command(options_.command) << " for " << ctx.spec_module);
    auto result = run_subprocess(options_.command, sub);

    if (!result.launched) {
        return build::GenerationError{ctx.spec_module,
                                      "Failed to start generation command: " + result.error};
    }
    if (result.cancelled) {
        return build::GenerationError{ctx.spec_module, "Generation cancelled."};
    }
    if (result.timed_out) {
        return build::GenerationError{ctx.spec_module,
                                      "Generation command timed out after " +
                                          std::to_string(static_cast<int>(options_.timeout_seconds)) +
                                          "s."};
    }
    if (result.exit_code != 0) {
        std::string msg = "Generation command exited with status " +
                          std::to_string(result.exit_code);
        std::string err = tail(result.stderr_output, STDERR_TAIL_BYTES);
        if (!err.empty()) {
            msg += ": " + err;
        }
        return build::GenerationError{ctx.spec_module, msg};
    }

    return parse_backend_output(result.stdout_output, options_.model, options_.provider);
}

} // namespace forge::generate
