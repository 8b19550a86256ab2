//! # Build Scheduler
//!
//! Regenerates stale modules concurrently in dependency order.
//!
//! ## Components
//!
//! | Class | Description |
//! |-------|-------------|
//! | `BuildReport` | Outcome per module |
//! | `ProgressReporter` | Optional progress callbacks |
//! | `ConsoleProgress` | `[k/n] ok|FAIL module` lines on stderr |
//! | `CompletionQueue` | Worker -> control thread hand-off |
//! | `BuildScheduler` | The scheduling loop |
//!
//! ## Pipeline
//!
//! ```text
//! stale set → expand over dependents → ∩ modules with specs → induced subgraph
//!   → cycle check → critical-path priorities → bounded parallel execution
//! ```
//!
//! ## Threading
//!
//! The thread calling `run()` is the only thread that touches scheduler
//! state (ready set, pending counts, report buckets, generated-source memo).
//! Each launched module runs on its own worker thread, which posts its
//! outcome to the `CompletionQueue`. At most `jobs` workers exist at once.
//!
//! ## Budget
//!
//! The cost budget is checked after each batch of completions. On overrun
//! the scheduler cancels and joins in-flight workers, discards their
//! outcomes, and fails every unfinished module with "Budget limit exceeded.".
//! Work already in flight can overshoot the budget by up to one batch.

#ifndef FORGE_BUILD_BUILD_SCHEDULER_HPP
#define FORGE_BUILD_BUILD_SCHEDULER_HPP

#include "build/cost_tracker.hpp"
#include "build/digest.hpp"
#include "build/errors.hpp"
#include "build/graph.hpp"
#include "build/response_cache.hpp"
#include "build/spec.hpp"
#include "common.hpp"
#include "generate/backend.hpp"
#include "generate/validation.hpp"
#include "json/json_value.hpp"

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace forge::build {

namespace fs = std::filesystem;

// ============================================================================
// Report
// ============================================================================

struct BuildReport {
    std::set<std::string> generated;
    std::set<std::string> skipped;
    std::map<std::string, std::vector<std::string>> failed;
    std::optional<BudgetExceededError> budget_exceeded;

    [[nodiscard]] bool ok() const {
        return failed.empty() && !budget_exceeded;
    }

    [[nodiscard]] json::JsonValue to_json() const;
};

// ============================================================================
// Progress
// ============================================================================

class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void advance(const std::string& module, bool ok) = 0;
    virtual void finish() = 0;
};

class ConsoleProgress : public ProgressReporter {
public:
    explicit ConsoleProgress(size_t total, std::ostream& out = std::cerr)
        : total_(total), out_(out) {}

    void advance(const std::string& module, bool ok) override;
    void finish() override;

private:
    size_t total_;
    size_t done_ = 0;
    size_t failed_ = 0;
    std::ostream& out_;
};

// ============================================================================
// Inputs
// ============================================================================

struct BuildInputs {
    fs::path package_dir;
    std::string generated_dir = "__generated__";
    std::map<std::string, std::vector<SpecEntry>> module_specs;
    std::map<SpecRef, SpecEntry> specs;
    SpecGraph spec_graph;
    Graph module_dag;
    std::set<std::string> stale_modules;
};

/// Collaborators are borrowed and must outlive the build.
struct BuildOptions {
    int jobs = 4;                         ///< Clamped to >= 1
    int check_retry_attempts = 0;         ///< Extra attempts when `checker` is set
    std::string shared_guidance;
    std::string tool_version;             ///< Defaults to forge::VERSION
    ResponseCache* cache = nullptr;
    CostTracker* cost_tracker = nullptr;
    ProgressReporter* progress = nullptr;
    const generate::ExternalChecker* checker = nullptr;
};

// ============================================================================
// Completion Queue
// ============================================================================

/// Outcome of one module's generation procedure.
struct ModuleOutcome {
    std::string module;
    bool ok = false;
    std::vector<std::string> errors;
    std::string source; ///< Generated source on success
};

class CompletionQueue {
public:
    void push(ModuleOutcome outcome);

    /// Blocks until at least one outcome is queued, then takes all of them.
    std::vector<ModuleOutcome> wait_batch();

    /// Takes whatever is queued without blocking.
    std::vector<ModuleOutcome> drain();

private:
    std::deque<ModuleOutcome> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

// ============================================================================
// Scheduler
// ============================================================================

class BuildScheduler {
public:
    BuildScheduler(const BuildInputs& inputs, generate::GeneratorBackend& backend,
                   BuildOptions options);
    ~BuildScheduler();

    BuildScheduler(const BuildScheduler&) = delete;
    BuildScheduler& operator=(const BuildScheduler&) = delete;

    /// Runs the build once. A dependency cycle among the modules to build is
    /// the only whole-build error; everything else is in the report.
    [[nodiscard]] auto run() -> Result<BuildReport, DependencyCycleError>;

private:
    /// Ready order: higher priority first, then name.
    struct ReadyOrder {
        bool operator()(const std::pair<int, std::string>& a,
                        const std::pair<int, std::string>& b) const {
            if (a.first != b.first) {
                return a.first > b.first;
            }
            return a.second < b.second;
        }
    };

    struct LaunchPlan {
        std::string module;
        generate::ModuleSpecContext ctx;
        std::string digest;
        std::vector<std::string> spec_refs;
    };

    const BuildInputs& inputs_;
    generate::GeneratorBackend& backend_;
    BuildOptions options_;

    std::set<std::string> stale_;
    Graph stale_deps_;
    Graph stale_dependents_;
    std::map<std::string, int> priority_;
    std::map<std::string, size_t> pending_;
    std::set<std::pair<int, std::string>, ReadyOrder> ready_;
    std::set<std::string> completed_;
    std::map<std::string, std::string> generated_sources_;
    std::map<std::string, std::thread> in_flight_;
    CompletionQueue completions_;
    generate::CancellationToken cancel_;
    BuildReport report_;

    auto plan_module(const std::string& module) const -> LaunchPlan;
    void launch(const std::string& module);
    auto build_one(const LaunchPlan& plan) const -> ModuleOutcome;
    void handle_outcome(ModuleOutcome outcome);
    void propagate_completion(const std::string& module);
    void notify_progress(const std::string& module, bool ok);
    void finish_progress();
    /// Cancels and joins every worker; returns the outcomes they queued.
    auto cancel_in_flight() -> std::vector<ModuleOutcome>;
};

/// Convenience wrapper: `BuildScheduler(inputs, backend, options).run()`.
[[nodiscard]] auto run_build(const BuildInputs& inputs, generate::GeneratorBackend& backend,
                             const BuildOptions& options)
    -> Result<BuildReport, DependencyCycleError>;

} // namespace forge::build

#endif // FORGE_BUILD_BUILD_SCHEDULER_HPP
