#include "cli/project.hpp"

#include "log/log.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace forge::cli {

using build::ConfigError;

namespace {

/// Accepts both `--opt value` and `--opt=value`.
bool take_value(const std::string& arg, const std::string& name, int argc, char* argv[], int& i,
                std::optional<std::string>& out) {
    if (arg == name) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else {
            out = std::nullopt;
        }
        return true;
    }
    if (arg.starts_with(name + "=")) {
        out = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

/// Each file as "# <path>\n<text>", joined by blank lines.
Result<std::string, ConfigError> read_guidance(const ForgeConfig& config) {
    std::string out;
    for (const auto& name : config.build.guidance_files) {
        std::ifstream in(config.root / name, std::ios::binary);
        if (!in) {
            return ConfigError{config.config_path.string(), 0,
                               "Cannot read guidance file '" + name + "'"};
        }
        std::ostringstream text;
        text << in.rdbuf();
        std::string body = text.str();
        while (!body.empty() && std::isspace(static_cast<unsigned char>(body.back()))) {
            body.pop_back();
        }
        if (!out.empty()) {
            out += "\n";
        }
        out += "# " + name + "\n" + body + "\n";
    }
    return out;
}

} // namespace

Result<CommandOptions, std::string> parse_command_options(int argc, char* argv[]) {
    CommandOptions options;
    if (argc < 2) {
        return std::string("missing command");
    }
    options.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> value;

        if (log::is_log_option(arg)) {
            continue;
        }

        if (take_value(arg, "--root", argc, argv, i, value)) {
            if (!value) {
                return std::string("--root requires a directory");
            }
            options.root = fs::path(*value);
        } else if (take_value(arg, "--config", argc, argv, i, value)) {
            if (!value) {
                return std::string("--config requires a file");
            }
            options.config = fs::path(*value);
        } else if (take_value(arg, "--jobs", argc, argv, i, value) ||
                   take_value(arg, "-j", argc, argv, i, value)) {
            if (!value) {
                return std::string("--jobs requires a number");
            }
            char* end = nullptr;
            long jobs = std::strtol(value->c_str(), &end, 10);
            if (value->empty() || *end != '\0' || jobs < 1) {
                return "--jobs must be a positive integer, got '" + *value + "'";
            }
            options.jobs = static_cast<int>(jobs);
        } else if (take_value(arg, "--target", argc, argv, i, value)) {
            if (!value) {
                return std::string("--target requires MODULE[:QUALNAME]");
            }
            options.targets.push_back(*value);
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--no-infer-deps") {
            options.no_infer_deps = true;
        } else if (arg == "--no-progress") {
            options.no_progress = true;
        } else if (arg == "--no-cache") {
            options.no_cache = true;
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (!arg.starts_with("-") && options.subcommand.empty()) {
            options.subcommand = arg;
        } else {
            return "unknown option '" + arg + "'";
        }
    }

    return options;
}

Result<ForgeConfig, ConfigError> load_config(const CommandOptions& options) {
    fs::path config_path;
    if (options.config) {
        config_path = fs::absolute(*options.config);
    } else if (options.root) {
        config_path = fs::absolute(*options.root) / CONFIG_FILE_NAME;
    } else {
        auto found = ForgeConfig::find_root(fs::current_path());
        if (!found) {
            return ConfigError{"", 0,
                               std::string("Could not find ") + CONFIG_FILE_NAME + " in " +
                                   fs::current_path().string() + " or any parent directory"};
        }
        config_path = *found / CONFIG_FILE_NAME;
    }

    auto loaded = ForgeConfig::load(config_path);
    if (is_err(loaded)) {
        return loaded;
    }
    auto& config = unwrap(loaded);
    if (options.root) {
        config.root = fs::absolute(*options.root);
    }
    FORGE_LOG_INFO("config", "Project root " << config.root.string());
    return loaded;
}

Result<Project, ConfigError> load_project(const CommandOptions& options) {
    auto loaded = load_config(options);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }

    Project project;
    project.config = std::move(unwrap(loaded));
    const auto& config = project.config;

    auto registry = build::load_spec_manifest(config.manifest_path(), config.root);
    if (is_err(registry)) {
        return unwrap_err(registry);
    }
    project.registry = std::move(unwrap(registry));

    bool infer = config.build.infer_deps && !options.no_infer_deps;
    project.spec_graph = build::build_spec_graph(project.registry, infer);
    project.module_dag = build::collapse_to_module_dag(project.spec_graph, project.registry);
    project.module_specs = project.registry.by_module();

    std::error_code ec;
    for (const auto& dir : config.source_root_paths()) {
        if (fs::is_directory(dir, ec)) {
            project.package_dir = dir;
            break;
        }
    }
    if (project.package_dir.empty()) {
        return ConfigError{config.config_path.string(), 0,
                           "No existing source_roots to build into."};
    }

    auto guidance = read_guidance(config);
    if (is_err(guidance)) {
        return unwrap_err(guidance);
    }
    project.shared_guidance = std::move(unwrap(guidance));

    FORGE_LOG_INFO("specs", "Discovered " << project.registry.specs.size() << " spec(s) in "
                                          << project.module_specs.size() << " module(s)");
    return project;
}

fs::path cache_dir_for(const ForgeConfig& config) {
    return config.root / ".forge" / "cache";
}

} // namespace forge::cli
