//! # Subprocess Execution
//!
//! Runs an external command with captured stdout/stderr, optional stdin
//! data, a hard timeout and cooperative cancellation. Used by the command
//! backend and the external checker.
//!
//! The child runs in its own process group; on timeout or cancellation the
//! whole group receives SIGKILL and is reaped before returning.

#ifndef FORGE_GENERATE_SUBPROCESS_HPP
#define FORGE_GENERATE_SUBPROCESS_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace forge::generate {

struct SubprocessOptions {
    std::string stdin_data;
    double timeout_seconds = 60.0; ///< <= 0 means no timeout
    std::filesystem::path working_dir;
    std::function<bool()> should_cancel; ///< Polled while the child runs
    /// Variables set on top of the parent environment.
    std::vector<std::pair<std::string, std::string>> env;
};

struct SubprocessResult {
    bool launched = false;
    bool timed_out = false;
    bool cancelled = false;
    int exit_code = -1; ///< -1 when killed by a signal or not launched
    std::string stdout_output;
    std::string stderr_output;
    std::string error; ///< Launch failure description
    int64_t duration_us = 0;

    [[nodiscard]] bool success() const {
        return launched && !timed_out && !cancelled && exit_code == 0;
    }
};

/// `argv[0]` is looked up on PATH.
[[nodiscard]] auto run_subprocess(const std::vector<std::string>& argv,
                                  const SubprocessOptions& options = {}) -> SubprocessResult;

/// "a b 'c d'" style rendering for log messages.
[[nodiscard]] auto format_command(const std::vector<std::string>& argv) -> std::string;

} // namespace forge::generate

#endif // FORGE_GENERATE_SUBPROCESS_HPP
