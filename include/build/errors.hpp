//! # Build Error Types
//!
//! Error values returned by the build pipeline. forge does not throw across
//! its internal API; these structs travel inside `Result<T, E>` or
//! `std::optional<E>`.
//!
//! | Error | Raised by | Effect |
//! |-------|-----------|--------|
//! | `DependencyCycleError` | graph validation, deadlock detection | aborts the build |
//! | `GenerationError` | backends, scheduler | fails one module |
//! | `BudgetExceededError` | `CostTracker::check_budget` | cancels remaining work |
//! | `ConfigError` | config and manifest loading | aborts before scheduling |
//! | `WriteError` | artifact writer | fails one module |

#ifndef FORGE_BUILD_ERRORS_HPP
#define FORGE_BUILD_ERRORS_HPP

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace forge::build {

/// A dependency cycle; `participants` are in cycle order.
struct DependencyCycleError {
    std::vector<std::string> participants;
    std::string detail; ///< Optional extra context (e.g. "scheduling deadlock")

    [[nodiscard]] auto message() const -> std::string {
        std::string msg = "Dependency cycle detected: ";
        for (size_t i = 0; i < participants.size(); ++i) {
            if (i > 0) {
                msg += " -> ";
            }
            msg += participants[i];
        }
        if (!participants.empty()) {
            msg += " -> " + participants.front();
        }
        if (!detail.empty()) {
            msg += " (" + detail + ")";
        }
        return msg;
    }
};

struct GenerationError {
    std::string module;
    std::string message;
};

struct BudgetExceededError {
    double estimated_cost = 0.0;
    double max_cost = 0.0;

    [[nodiscard]] auto message() const -> std::string {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4) << "Build cost $" << estimated_cost
            << " exceeds budget limit $" << max_cost << ". Aborting.";
        return oss.str();
    }
};

struct ConfigError {
    std::string path;
    size_t line = 0; ///< 0 when not tied to a line
    std::string message;

    [[nodiscard]] auto to_string() const -> std::string {
        std::string out;
        if (!path.empty()) {
            out += path;
            if (line > 0) {
                out += ":" + std::to_string(line);
            }
            out += ": ";
        }
        return out + message;
    }
};

struct WriteError {
    std::string path;
    std::string message;
};

} // namespace forge::build

#endif // FORGE_BUILD_ERRORS_HPP
