//! # Generator Backend
//!
//! The capability that turns a `ModuleSpecContext` into generated source.
//! Concrete backends implement `generate_module`; the retry loop in
//! `generate_with_retry` is shared by all of them.
//!
//! ## Retry Loop
//!
//! | Attempt | Extra error context |
//! |---------|---------------------|
//! | 1 | none |
//! | 2 | `previous output errors: <e>` for each error of attempt 1 |
//! | n | context of attempt n-1 plus the errors of attempt n-1 |
//!
//! Each candidate is checked with `validate_generated_source` and then, only
//! if that passes, with the optional extra validator.

#ifndef FORGE_GENERATE_BACKEND_HPP
#define FORGE_GENERATE_BACKEND_HPP

#include "build/errors.hpp"
#include "common.hpp"
#include "generate/context.hpp"
#include "generate/validation.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace forge::generate {

using GeneratedModule = std::pair<std::string, std::optional<TokenUsage>>;

class GeneratorBackend {
public:
    virtual ~GeneratorBackend() = default;

    [[nodiscard]] virtual std::string model_name() const = 0;
    [[nodiscard]] virtual std::string provider_name() const = 0;

    /// One generation call. `extra_error_context` carries feedback about
    /// earlier attempts. Implementations should return promptly once
    /// `cancel` is set. Called concurrently from build worker threads.
    [[nodiscard]] virtual auto generate_module(const ModuleSpecContext& ctx,
                                               const std::vector<std::string>& extra_error_context,
                                               const CancellationToken& cancel)
        -> Result<GeneratedModule, build::GenerationError> = 0;

    /// Deterministic generate/validate/retry loop, at most `max_attempts`
    /// calls. Usage is summed over attempts and absent when zero. A backend
    /// error or cancellation ends the loop with that error and no source.
    [[nodiscard]] auto generate_with_retry(const ModuleSpecContext& ctx, int max_attempts,
                                           const Validator& extra_validator,
                                           const CancellationToken& cancel) -> GenerationResult;
};

} // namespace forge::generate

#endif // FORGE_GENERATE_BACKEND_HPP
