//! # Command Backend
//!
//! A `GeneratorBackend` that delegates generation to an external program,
//! so any provider can be plugged in with a script.
//!
//! ## Protocol
//!
//! The request is written to the program's stdin as one JSON object:
//!
//! ```json
//! {"kind": "build", "model": "gpt-5", "spec_module": "pkg.a",
//!  "generated_module": "pkg.__generated__.a", "expected_names": ["A"],
//!  "spec_sources": {...}, "spec_prompts": {...}, "dependency_apis": {...},
//!  "dependency_generated": {...}, "shared_guidance": "",
//!  "extra_error_context": ["previous output errors: ..."]}
//! ```
//!
//! stdout is either a JSON object
//! `{"source": "...", "usage": {"prompt_tokens": 1, "completion_tokens": 2}}`
//! or the raw module source. A surrounding markdown code fence is removed.
//! A non-zero exit status is a generation error carrying the stderr tail.

#ifndef FORGE_GENERATE_COMMAND_BACKEND_HPP
#define FORGE_GENERATE_COMMAND_BACKEND_HPP

#include "generate/backend.hpp"
#include "json/json_value.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace forge::generate {

struct CommandBackendOptions {
    std::vector<std::string> command;
    std::string model;
    std::string provider = "command";
    double timeout_seconds = 300.0;
    std::filesystem::path working_dir;
};

class CommandBackend : public GeneratorBackend {
public:
    explicit CommandBackend(CommandBackendOptions options) : options_(std::move(options)) {}

    [[nodiscard]] std::string model_name() const override {
        return options_.model;
    }

    [[nodiscard]] std::string provider_name() const override {
        return options_.provider;
    }

    [[nodiscard]] auto generate_module(const ModuleSpecContext& ctx,
                                       const std::vector<std::string>& extra_error_context,
                                       const CancellationToken& cancel)
        -> Result<GeneratedModule, build::GenerationError> override;

private:
    CommandBackendOptions options_;
};

/// The request object sent on stdin.
[[nodiscard]] auto context_to_json(const ModuleSpecContext& ctx, const std::string& model,
                                   const std::vector<std::string>& extra_error_context)
    -> json::JsonValue;

/// Interprets program output as described above.
[[nodiscard]] auto parse_backend_output(const std::string& output, const std::string& model,
                                        const std::string& provider) -> GeneratedModule;

/// Removes a leading ```lang line and a trailing ``` line, if both exist.
[[nodiscard]] auto strip_code_fences(const std::string& text) -> std::string;

} // namespace forge::generate

#endif // FORGE_GENERATE_COMMAND_BACKEND_HPP
