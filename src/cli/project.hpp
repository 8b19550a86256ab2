//! # Project Loading Interface
//!
//! Command-line options shared by every command, and the discovery pass
//! that turns a project root into the inputs of a build.
//!
//! ## Pipeline
//!
//! ```text
//! --root / --config / cwd → forge.toml → ForgeConfig
//!   → spec manifest → SpecRegistry → spec graph → module DAG
//! ```

#ifndef FORGE_CLI_PROJECT_HPP
#define FORGE_CLI_PROJECT_HPP

#include "build/digest.hpp"
#include "build/errors.hpp"
#include "build/graph.hpp"
#include "build/spec.hpp"
#include "cli/config.hpp"
#include "common.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace forge::cli {

/**
 * Parsed command line (after the logging options are removed)
 */
struct CommandOptions {
    std::string command;
    std::string subcommand; // `cache info|clear`

    std::optional<fs::path> root;
    std::optional<fs::path> config;
    bool json = false;

    std::optional<int> jobs;
    bool force = false;
    std::vector<std::string> targets;
    bool no_infer_deps = false;
    bool no_progress = false;
    bool no_cache = false;

    bool dry_run = false;
};

/// Parses `argv[1..]`; the error is a usage message.
Result<CommandOptions, std::string> parse_command_options(int argc, char* argv[]);

/**
 * Everything discovery produces for one project
 */
struct Project {
    ForgeConfig config;
    build::SpecRegistry registry;
    build::SpecGraph spec_graph;
    build::Graph module_dag;
    std::map<std::string, std::vector<build::SpecEntry>> module_specs;
    fs::path package_dir; // First existing source root
    std::string shared_guidance; // Contents of [build] guidance_files
};

/// Resolves the project root and loads forge.toml.
Result<ForgeConfig, build::ConfigError> load_config(const CommandOptions& options);

/// load_config() plus spec discovery and graph construction.
Result<Project, build::ConfigError> load_project(const CommandOptions& options);

/// `<root>/.forge/cache`
fs::path cache_dir_for(const ForgeConfig& config);

} // namespace forge::cli

#endif // FORGE_CLI_PROJECT_HPP
