//! # Build and Status Commands
//!
//! ## Build Flow
//!
//! ```text
//! load_project()
//!   → find_cycles(spec graph)        exit 2 with every cycle listed
//!   → detect_stale_modules()
//!   → --target restriction (dependency closure)
//!   → run_build()                    bounded parallel generation
//!   → failures + cost summary        exit 3 if anything failed
//! ```
//!
//! ## JSON Output
//!
//! With `--json` the only stdout output is one JSON document:
//!
//! ```json
//! {"command": "build", "ok": true, "generated": [...], "skipped": [...],
//!  "failed": {}, "budget_exceeded": null, "cost": {...},
//!  "cache": {"hits": 0, "misses": 2}}
//! ```

#include "cmd_build.hpp"

#include "build/build_scheduler.hpp"
#include "build/cost_tracker.hpp"
#include "build/response_cache.hpp"
#include "build/staleness.hpp"
#include "cli/utils.hpp"
#include "generate/command_backend.hpp"
#include "generate/validation.hpp"
#include "log/log.hpp"

#include <iostream>
#include <memory>

namespace forge::cli {

namespace {

/// Prints every cycle of the spec graph; true if there was one.
bool report_cycles(const build::SpecGraph& spec_graph, std::string& message) {
    auto cycles = build::find_cycles(spec_graph);
    if (cycles.empty()) {
        return false;
    }

    std::cerr << "error: dependency cycle(s) detected\n";
    message = "Dependency cycle detected: ";
    for (size_t i = 0; i < cycles.size(); ++i) {
        const auto& cycle = cycles[i];
        std::string path;
        for (const auto& ref : cycle) {
            path += ref + " -> ";
        }
        path += cycle.front();
        std::cerr << "  " << path << "\n";
        if (i > 0) {
            message += ", ";
        }
        message += path;
    }
    std::cerr << "hint: break the cycle by removing a dep from one of these specs\n";
    return true;
}

/// Modules the build is allowed to touch: all of them, or the target closure.
Result<std::set<std::string>, build::ConfigError> allowed_modules(const CommandOptions& options,
                                                                  const Project& project) {
    if (options.targets.empty()) {
        std::set<std::string> all;
        for (const auto& [module, entries] : project.module_specs) {
            all.insert(module);
        }
        return all;
    }
    return build::resolve_targets(options.targets, project.registry, project.module_dag);
}

json::JsonValue sorted_array(const std::set<std::string>& items) {
    return json::json_string_array(std::vector<std::string>(items.begin(), items.end()));
}

} // namespace

int run_build_command(const CommandOptions& options) {
    auto loaded = load_project(options);
    if (is_err(loaded)) {
        return report_command_error("build", options.json, unwrap_err(loaded).to_string(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }
    auto& project = unwrap(loaded);
    const auto& config = project.config;

    if (project.registry.specs.empty()) {
        FORGE_LOG_INFO("cli", "No specs discovered; nothing to build");
        if (options.json) {
            build::BuildReport empty;
            auto doc = empty.to_json();
            doc.set("command", json::JsonValue("build"));
            doc.set("ok", json::JsonValue(true));
            emit_json(doc);
        }
        return EXIT_OK;
    }

    std::string cycle_message;
    if (report_cycles(project.spec_graph, cycle_message)) {
        return report_command_error("build", options.json, cycle_message,
                                    EXIT_CONFIG_OR_DISCOVERY);
    }

    auto stale = build::detect_stale_modules(project.package_dir, config.paths.generated_dir,
                                             project.module_specs, project.registry.specs,
                                             project.spec_graph, options.force);

    auto allowed = allowed_modules(options, project);
    if (is_err(allowed)) {
        return report_command_error("build", options.json, unwrap_err(allowed).to_string(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }
    if (!options.targets.empty()) {
        std::set<std::string> restricted;
        for (const auto& module : stale) {
            if (unwrap(allowed).count(module) > 0) {
                restricted.insert(module);
            }
        }
        stale = std::move(restricted);
    }
    stale = build::expand_stale_modules(project.module_dag, stale);

    build::ResponseCache cache(cache_dir_for(config), !options.no_cache);
    build::CostTracker cost_tracker(config.llm.max_cost_per_build);

    generate::CommandBackendOptions backend_options;
    backend_options.command = config.llm.command;
    backend_options.model = config.llm.model;
    backend_options.provider = config.llm.provider;
    backend_options.timeout_seconds = config.llm.timeout_seconds;
    backend_options.working_dir = config.root;
    generate::CommandBackend backend(std::move(backend_options));

    std::unique_ptr<generate::ExternalChecker> checker;
    if (!config.build.check_command.empty()) {
        checker = std::make_unique<generate::ExternalChecker>(
            config.build.check_command, config.build.check_timeout_seconds, project.package_dir);
    }

    size_t total = 0;
    for (const auto& module : stale) {
        total += project.module_specs.count(module);
    }
    std::unique_ptr<build::ConsoleProgress> progress;
    if (total > 0 && !options.json && !options.no_progress && stderr_is_terminal()) {
        progress = std::make_unique<build::ConsoleProgress>(total);
    }

    build::BuildInputs inputs;
    inputs.package_dir = project.package_dir;
    inputs.generated_dir = config.paths.generated_dir;
    inputs.module_specs = project.module_specs;
    inputs.specs = project.registry.specs;
    inputs.spec_graph = project.spec_graph;
    inputs.module_dag = project.module_dag;
    inputs.stale_modules = stale;

    build::BuildOptions build_options;
    build_options.jobs = options.jobs.value_or(config.build.jobs);
    build_options.check_retry_attempts = config.build.check_retry_attempts;
    build_options.shared_guidance = project.shared_guidance;
    build_options.cache = &cache;
    build_options.cost_tracker = &cost_tracker;
    build_options.progress = progress.get();
    build_options.checker = checker.get();

    auto result = build::run_build(inputs, backend, build_options);
    if (is_err(result)) {
        return report_command_error("build", options.json, unwrap_err(result).message(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }
    const auto& report = unwrap(result);

    if (!options.json) {
        if (report.budget_exceeded) {
            std::cerr << "error: " << report.budget_exceeded->message() << "\n";
        }
        if (!report.failed.empty()) {
            std::cerr << format_build_failures(report.failed) << "\n";
        }
        if (cost_tracker.api_calls() > 0 || cost_tracker.cache_hits() > 0) {
            std::cerr << cost_tracker.format_summary() << "\n";
        }
    } else {
        auto doc = report.to_json();
        doc.set("command", json::JsonValue("build"));
        doc.set("ok", json::JsonValue(report.ok()));
        doc.set("cost", cost_tracker.summary_json());
        json::JsonValue cache_stats = json::json_object();
        cache_stats.set("hits", json::JsonValue(static_cast<int64_t>(cache.hits())));
        cache_stats.set("misses", json::JsonValue(static_cast<int64_t>(cache.misses())));
        doc.set("cache", std::move(cache_stats));
        emit_json(doc);
    }

    return report.ok() ? EXIT_OK : EXIT_GENERATION_ERROR;
}

int run_status_command(const CommandOptions& options) {
    auto loaded = load_project(options);
    if (is_err(loaded)) {
        return report_command_error("status", options.json, unwrap_err(loaded).to_string(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }
    auto& project = unwrap(loaded);

    if (project.registry.specs.empty()) {
        if (options.json) {
            json::JsonValue doc = json::json_object();
            doc.set("command", json::JsonValue("status"));
            doc.set("ok", json::JsonValue(true));
            doc.set("stale", json::json_array());
            doc.set("fresh", json::json_array());
            emit_json(doc);
        } else {
            std::cout << "Status: 0 module(s) total\n";
            std::cout << "No specs discovered.\n";
        }
        return EXIT_OK;
    }

    auto allowed = allowed_modules(options, project);
    if (is_err(allowed)) {
        return report_command_error("status", options.json, unwrap_err(allowed).to_string(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }

    std::set<std::string> all_modules;
    for (const auto& [module, entries] : project.module_specs) {
        if (unwrap(allowed).count(module) > 0) {
            all_modules.insert(module);
        }
    }

    auto detected = build::detect_stale_modules(
        project.package_dir, project.config.paths.generated_dir, project.module_specs,
        project.registry.specs, project.spec_graph, options.force);

    std::set<std::string> stale;
    std::set<std::string> fresh;
    for (const auto& module : all_modules) {
        if (detected.count(module) > 0) {
            stale.insert(module);
        } else {
            fresh.insert(module);
        }
    }

    if (options.json) {
        json::JsonValue doc = json::json_object();
        doc.set("command", json::JsonValue("status"));
        doc.set("ok", json::JsonValue(true));
        doc.set("stale", sorted_array(stale));
        doc.set("fresh", sorted_array(fresh));
        emit_json(doc);
        return EXIT_OK;
    }

    std::cout << "Status: " << all_modules.size() << " module(s) total\n";
    std::cout << "Stale (" << stale.size() << "):\n";
    for (const auto& module : stale) {
        std::cout << "- " << module << "\n";
    }
    std::cout << "Fresh (" << fresh.size() << "):\n";
    for (const auto& module : fresh) {
        std::cout << "- " << module << "\n";
    }
    return EXIT_OK;
}

} // namespace forge::cli
