//! # Build Scheduler
//!
//! Control loop, per-module generation procedure and dependency-failure
//! propagation. See `build/build_scheduler.hpp` for the threading model.

#include "build/build_scheduler.hpp"

#include "build/artifact_writer.hpp"
#include "build/header.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace forge::build {

namespace {

constexpr const char* BUDGET_EXCEEDED_MESSAGE = "Budget limit exceeded.";
constexpr const char* CANCELLED_MESSAGE = "Generation cancelled.";

auto now_seconds() -> double {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

// ============================================================================
// BuildReport
// ============================================================================

json::JsonValue BuildReport::to_json() const {
    json::JsonValue out = json::json_object();
    out.set("generated",
            json::json_string_array(std::vector<std::string>(generated.begin(), generated.end())));
    out.set("skipped",
            json::json_string_array(std::vector<std::string>(skipped.begin(), skipped.end())));

    json::JsonValue failures = json::json_object();
    for (const auto& [module, errors] : failed) {
        failures.set(module, json::json_string_array(errors));
    }
    out.set("failed", std::move(failures));

    if (budget_exceeded) {
        out.set("budget_exceeded", json::JsonValue(budget_exceeded->message()));
    } else {
        out.set("budget_exceeded", json::JsonValue());
    }
    return out;
}

// ============================================================================
// ConsoleProgress
// ============================================================================

void ConsoleProgress::advance(const std::string& module, bool ok) {
    ++done_;
    if (!ok) {
        ++failed_;
    }
    out_ << "[" << done_ << "/" << total_ << "] " << (ok ? "ok   " : "FAIL ") << module << "\n";
}

void ConsoleProgress::finish() {
    out_ << "Built " << (done_ - failed_) << " of " << total_ << " module(s)";
    if (failed_ > 0) {
        out_ << ", " << failed_ << " failed";
    }
    out_ << "\n";
    out_.flush();
}

// ============================================================================
// CompletionQueue
// ============================================================================

void CompletionQueue::push(ModuleOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(outcome));
    }
    cv_.notify_one();
}

std::vector<ModuleOutcome> CompletionQueue::wait_batch() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty(); });
    std::vector<ModuleOutcome> batch(std::make_move_iterator(queue_.begin()),
                                     std::make_move_iterator(queue_.end()));
    queue_.clear();
    return batch;
}

std::vector<ModuleOutcome> CompletionQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ModuleOutcome> batch(std::make_move_iterator(queue_.begin()),
                                     std::make_move_iterator(queue_.end()));
    queue_.clear();
    return batch;
}

// ============================================================================
// BuildScheduler
// ============================================================================

BuildScheduler::BuildScheduler(const BuildInputs& inputs, generate::GeneratorBackend& backend,
                               BuildOptions options)
    : inputs_(inputs), backend_(backend), options_(std::move(options)) {
    options_.jobs = std::max(options_.jobs, 1);
    options_.check_retry_attempts = std::max(options_.check_retry_attempts, 0);
    if (options_.tool_version.empty()) {
        options_.tool_version = VERSION;
    }
}

BuildScheduler::~BuildScheduler() {
    if (!in_flight_.empty()) {
        auto abandoned = cancel_in_flight();
        FORGE_LOG_DEBUG("scheduler", "Abandoned " << abandoned.size() << " outcome(s)");
    }
}

auto BuildScheduler::run() -> Result<BuildReport, DependencyCycleError> {
    std::set<std::string> with_specs;
    for (const auto& [module, entries] : inputs_.module_specs) {
        with_specs.insert(module);
    }

    for (const auto& module : expand_stale_modules(inputs_.module_dag, inputs_.stale_modules)) {
        if (with_specs.count(module) > 0) {
            stale_.insert(module);
        }
    }
    for (const auto& module : with_specs) {
        if (stale_.count(module) == 0) {
            report_.skipped.insert(module);
        }
    }

    if (stale_.empty()) {
        FORGE_LOG_INFO("scheduler", "Nothing to build; " << report_.skipped.size()
                                                         << " module(s) up to date");
        return report_;
    }

    stale_deps_ = induced_subgraph(inputs_.module_dag, stale_);
    auto order = topological_order(stale_deps_);
    if (is_err(order)) {
        FORGE_LOG_ERROR("scheduler", unwrap_err(order).message());
        return unwrap_err(order);
    }

    priority_ = critical_path_lengths(stale_, inputs_.module_dag);
    stale_dependents_ = invert(stale_deps_);

    for (const auto& module : stale_) {
        pending_[module] = stale_deps_[module].size();
        if (pending_[module] == 0) {
            ready_.emplace(priority_[module], module);
        }
    }

    FORGE_LOG_INFO("scheduler", "Building " << stale_.size() << " module(s) with "
                                            << options_.jobs << " job(s), "
                                            << report_.skipped.size() << " skipped");

    while (!ready_.empty() || !in_flight_.empty()) {
        while (!ready_.empty() && in_flight_.size() < static_cast<size_t>(options_.jobs)) {
            auto [prio, module] = *ready_.begin();
            ready_.erase(ready_.begin());
            if (completed_.count(module) > 0) {
                continue;
            }
            FORGE_LOG_DEBUG("scheduler", "Launching " << module << " (priority " << prio << ")");
            launch(module);
        }

        if (in_flight_.empty()) {
            break;
        }

        for (auto& outcome : completions_.wait_batch()) {
            handle_outcome(std::move(outcome));
        }

        if (options_.cost_tracker != nullptr) {
            if (auto budget = options_.cost_tracker->check_budget()) {
                FORGE_LOG_ERROR("cost", budget->message());
                // Workers that finished wrote their artifact; keep them
                for (auto& outcome : cancel_in_flight()) {
                    if (outcome.ok) {
                        handle_outcome(std::move(outcome));
                    }
                }
                for (const auto& module : stale_) {
                    if (completed_.insert(module).second) {
                        report_.failed[module] = {BUDGET_EXCEEDED_MESSAGE};
                    }
                }
                ready_.clear();
                report_.budget_exceeded = *budget;
                break;
            }
        }
    }

    std::set<std::string> remaining;
    for (const auto& module : stale_) {
        if (completed_.count(module) == 0) {
            remaining.insert(module);
        }
    }
    if (!remaining.empty()) {
        // Modules that never became ready: a cycle the up-front check missed
        auto residual = topological_order(induced_subgraph(stale_deps_, remaining));
        DependencyCycleError error =
            is_err(residual)
                ? unwrap_err(residual)
                : DependencyCycleError{std::vector<std::string>(remaining.begin(), remaining.end()),
                                       ""};
        error.detail = "scheduling deadlock";
        FORGE_LOG_ERROR("scheduler", error.message());
        return error;
    }

    finish_progress();
    FORGE_LOG_INFO("scheduler", "Build finished: " << report_.generated.size() << " generated, "
                                                   << report_.failed.size() << " failed, "
                                                   << report_.skipped.size() << " skipped");
    return report_;
}

auto BuildScheduler::plan_module(const std::string& module) const -> LaunchPlan {
    static const std::vector<SpecEntry> no_entries;
    auto entries_it = inputs_.module_specs.find(module);
    const auto& entries = entries_it == inputs_.module_specs.end() ? no_entries : entries_it->second;

    LaunchPlan plan;
    plan.module = module;

    auto& ctx = plan.ctx;
    ctx.kind = generate::ContextKind::Build;
    ctx.spec_module = module;
    ctx.generated_module = spec_module_to_generated_module(module, inputs_.generated_dir);
    ctx.shared_guidance = options_.shared_guidance;
    for (const auto& entry : entries) {
        ctx.expected_names.push_back(entry.qualname);
        ctx.spec_sources[entry.spec_ref] = entry.source;
        if (!entry.prompt.empty()) {
            ctx.spec_prompts[entry.spec_ref] = entry.prompt;
        }
        plan.spec_refs.push_back(entry.spec_ref);
    }

    // Dependency context comes from the full DAG, not just the stale part
    auto deps_it = inputs_.module_dag.find(module);
    if (deps_it != inputs_.module_dag.end()) {
        for (const auto& dep : deps_it->second) {
            auto dep_entries = inputs_.module_specs.find(dep);
            if (dep_entries != inputs_.module_specs.end()) {
                for (const auto& entry : dep_entries->second) {
                    ctx.dependency_apis[entry.spec_ref] = entry.source;
                }
            }

            auto memo = generated_sources_.find(dep);
            if (memo != generated_sources_.end()) {
                ctx.dependency_generated[dep] = memo->second;
            } else if (auto on_disk =
                           read_generated_module(inputs_.package_dir, inputs_.generated_dir, dep)) {
                ctx.dependency_generated[dep] = std::move(*on_disk);
            }
        }
    }

    plan.digest = module_digest(module, entries, inputs_.specs, inputs_.spec_graph);
    return plan;
}

void BuildScheduler::launch(const std::string& module) {
    LaunchPlan plan = plan_module(module);
    in_flight_.emplace(module, std::thread([this, plan = std::move(plan)]() {
                           ModuleOutcome outcome;
                           try {
                               outcome = build_one(plan);
                           } catch (const std::exception& e) {
                               outcome = ModuleOutcome{plan.module,
                                                       false,
                                                       {std::string("Unhandled error: ") + e.what()},
                                                       ""};
                           } catch (...) {
                               outcome = ModuleOutcome{
                                   plan.module, false, {"Unhandled error: unknown exception"}, ""};
                           }
                           completions_.push(std::move(outcome));
                       }));
}

auto BuildScheduler::build_one(const LaunchPlan& plan) const -> ModuleOutcome {
    const auto& module = plan.module;
    const auto& ctx = plan.ctx;
    auto fail = [&module](std::vector<std::string> errors) {
        return ModuleOutcome{module, false, std::move(errors), ""};
    };

    fs::path relpath = generated_relpath(module, inputs_.generated_dir);
    const generate::ExternalChecker* checker = options_.checker;

    generate::Validator checker_validator;
    if (checker != nullptr) {
        checker_validator = [checker, &module, &relpath](const std::string& source) {
            return checker->check(source, module, relpath);
        };
    }

    auto validate_candidate = [&](const std::string& source) -> std::vector<std::string> {
        auto errors = generate::validate_generated_source(source, ctx.expected_names);
        if (!errors.empty() || !checker_validator) {
            return errors;
        }
        return checker_validator(source);
    };

    std::optional<std::string> source;
    std::string cache_key;

    if (options_.cache != nullptr) {
        cache_key = cache_key_from_context(ctx, backend_.model_name(), backend_.provider_name());
        if (auto cached = options_.cache->get(cache_key)) {
            auto errors = validate_candidate(cached->source);
            if (errors.empty()) {
                FORGE_LOG_DEBUG("cache", "Cache hit for " << module);
                source = std::move(cached->source);
                if (options_.cost_tracker != nullptr) {
                    options_.cost_tracker->record_cache_hit();
                }
            } else {
                FORGE_LOG_INFO("cache", "Cached source for " << module
                                                             << " no longer validates; regenerating");
            }
        }
    }

    if (!source) {
        if (cancel_.is_cancelled()) {
            return fail({CANCELLED_MESSAGE});
        }

        int max_attempts = checker != nullptr ? 2 + options_.check_retry_attempts : 2;
        auto result = backend_.generate_with_retry(ctx, max_attempts, checker_validator, cancel_);
        if (!result.source) {
            return fail(result.errors.empty() ? std::vector<std::string>{"No source returned."}
                                              : result.errors);
        }
        if (!result.errors.empty()) {
            return fail(result.errors);
        }

        if (options_.cost_tracker != nullptr && result.usage) {
            options_.cost_tracker->record(module, *result.usage);
        }
        if (options_.cache != nullptr) {
            CacheEntry entry;
            entry.source = *result.source;
            if (result.usage) {
                entry.prompt_tokens = result.usage->prompt_tokens;
                entry.completion_tokens = result.usage->completion_tokens;
                entry.model = result.usage->model;
                entry.provider = result.usage->provider;
            }
            entry.cached_at = now_seconds();
            options_.cache->put(cache_key, entry);
        }
        source = std::move(result.source);
    }

    if (cancel_.is_cancelled()) {
        return fail({CANCELLED_MESSAGE});
    }

    HeaderFields header;
    header.tool_version = options_.tool_version;
    header.kind = "build";
    header.source_module = module;
    header.module_digest = plan.digest;
    header.spec_refs = plan.spec_refs;

    auto written =
        write_generated_module(inputs_.package_dir, inputs_.generated_dir, module, *source, header);
    if (is_err(written)) {
        return fail({"Failed to write generated module: " + unwrap_err(written).message});
    }

    return ModuleOutcome{module, true, {}, std::move(*source)};
}

void BuildScheduler::handle_outcome(ModuleOutcome outcome) {
    const std::string module = outcome.module;

    auto thread_it = in_flight_.find(module);
    if (thread_it != in_flight_.end()) {
        if (thread_it->second.joinable()) {
            thread_it->second.join();
        }
        in_flight_.erase(thread_it);
    }

    completed_.insert(module);
    if (outcome.ok) {
        FORGE_LOG_INFO("scheduler", "Generated " << module);
        report_.generated.insert(module);
        generated_sources_[module] = std::move(outcome.source);
    } else {
        if (outcome.errors.empty()) {
            outcome.errors.push_back("Unknown error.");
        }
        FORGE_LOG_WARN("scheduler", "Failed " << module << ": " << outcome.errors.front());
        report_.failed[module] = std::move(outcome.errors);
    }

    notify_progress(module, outcome.ok);
    propagate_completion(module);
}

void BuildScheduler::propagate_completion(const std::string& module) {
    std::vector<std::string> stack{module};
    while (!stack.empty()) {
        std::string current = std::move(stack.back());
        stack.pop_back();

        // Reverse so the smallest name is handled first when popped
        const auto& dependents = stale_dependents_[current];
        for (auto it = dependents.rbegin(); it != dependents.rend(); ++it) {
            const std::string& dependent = *it;
            if (completed_.count(dependent) > 0) {
                continue;
            }
            if (--pending_[dependent] != 0) {
                continue;
            }

            std::vector<std::string> errors;
            for (const auto& dep : stale_deps_[dependent]) {
                if (report_.failed.count(dep) > 0) {
                    errors.push_back("Dependency failed: " + dep);
                }
            }

            if (errors.empty()) {
                ready_.emplace(priority_[dependent], dependent);
                continue;
            }

            FORGE_LOG_WARN("scheduler", "Skipping " << dependent << ": " << errors.front());
            report_.failed[dependent] = std::move(errors);
            completed_.insert(dependent);
            notify_progress(dependent, false);
            stack.push_back(dependent);
        }
    }
}

void BuildScheduler::notify_progress(const std::string& module, bool ok) {
    if (options_.progress == nullptr) {
        return;
    }
    try {
        options_.progress->advance(module, ok);
    } catch (const std::exception& e) {
        FORGE_LOG_DEBUG("scheduler", "Progress reporter failed: " << e.what());
    } catch (...) {
        FORGE_LOG_DEBUG("scheduler", "Progress reporter failed with a non-standard exception");
    }
}

void BuildScheduler::finish_progress() {
    if (options_.progress == nullptr) {
        return;
    }
    try {
        options_.progress->finish();
    } catch (const std::exception& e) {
        FORGE_LOG_DEBUG("scheduler", "Progress reporter failed: " << e.what());
    } catch (...) {
        FORGE_LOG_DEBUG("scheduler", "Progress reporter failed with a non-standard exception");
    }
}

auto BuildScheduler::cancel_in_flight() -> std::vector<ModuleOutcome> {
    cancel_.cancel();
    for (auto& [module, thread] : in_flight_) {
        FORGE_LOG_DEBUG("scheduler", "Cancelling " << module);
        if (thread.joinable()) {
            thread.join();
        }
    }
    in_flight_.clear();
    return completions_.drain();
}

auto run_build(const BuildInputs& inputs, generate::GeneratorBackend& backend,
               const BuildOptions& options) -> Result<BuildReport, DependencyCycleError> {
    BuildScheduler scheduler(inputs, backend, options);
    return scheduler.run();
}

} // namespace forge::build
