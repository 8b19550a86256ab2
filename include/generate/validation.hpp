//! # Generated Source Validation
//!
//! Two validators run on every candidate source, in order:
//!
//! 1. `validate_generated_source`: structural checks (non-empty, balanced
//!    brackets, terminated string literals) and that every expected name is
//!    defined at top level.
//! 2. `ExternalChecker` (optional): an external type checker run on the
//!    candidate in an isolated temp tree.
//!
//! Validators return a list of human-readable errors; empty means valid.

#ifndef FORGE_GENERATE_VALIDATION_HPP
#define FORGE_GENERATE_VALIDATION_HPP

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace forge::generate {

using Validator = std::function<std::vector<std::string>(const std::string& source)>;

[[nodiscard]] auto validate_generated_source(const std::string& source,
                                             const std::vector<std::string>& expected_names)
    -> std::vector<std::string>;

/// Names bound at top level: `def`, `async def`, `class`, assignments and
/// annotated names starting at column 0.
[[nodiscard]] auto top_level_names(const std::string& source) -> std::set<std::string>;

/// Runs `command... <file>` on the candidate source with a timeout.
///
/// Exit status 0 is valid. Output whose `error[<code>]` diagnostics are all
/// `unresolved-import` is also valid, since the temp tree does not contain
/// the project's other modules.
class ExternalChecker {
public:
    static constexpr size_t MAX_REPORTED_LINES = 16;

    ExternalChecker(std::vector<std::string> command, double timeout_seconds,
                    std::filesystem::path working_dir = {})
        : command_(std::move(command)), timeout_seconds_(timeout_seconds),
          working_dir_(std::move(working_dir)) {}

    /// `generated_relpath` places the file in the temp tree the same way it
    /// will be placed in the package.
    [[nodiscard]] auto check(const std::string& source, const std::string& module_name,
                             const std::filesystem::path& generated_relpath) const
        -> std::vector<std::string>;

    [[nodiscard]] const std::vector<std::string>& command() const {
        return command_;
    }

    [[nodiscard]] double timeout_seconds() const {
        return timeout_seconds_;
    }

private:
    std::vector<std::string> command_;
    double timeout_seconds_;
    std::filesystem::path working_dir_; ///< Where the checker runs (the package dir)
};

/// Error codes named in `error[<code>]` diagnostics.
[[nodiscard]] auto diagnostic_error_codes(const std::string& output) -> std::set<std::string>;

} // namespace forge::generate

#endif // FORGE_GENERATE_VALIDATION_HPP
