#include "cmd_init.hpp"

#include "build/artifact_writer.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>

namespace forge::cli {

const char* const INIT_CONFIG_TEMPLATE = R"([paths]
source_roots = ["src"]
generated_dir = "__generated__"
spec_manifest = "forge-specs.json"

[build]
jobs = 4
infer_deps = true
# check_command = ["ty", "check"]
# check_retry_attempts = 1
# guidance_files = ["docs/codegen.md"]

[llm]
model = "gpt-4.1"
# The command reads one JSON request on stdin and prints the module source
# (or {"source": ..., "usage": {...}}) on stdout.
command = ["./generate.sh"]
# max_cost_per_build = 2.0
)";

namespace {

constexpr const char* EMPTY_MANIFEST = "{\"specs\": []}\n";

} // namespace

int run_init_command(const CommandOptions& options) {
    fs::path root = fs::absolute(options.root.value_or(fs::current_path())).lexically_normal();
    fs::path config_path = root / CONFIG_FILE_NAME;

    std::error_code ec;
    if (fs::exists(config_path, ec) && !options.force) {
        return report_command_error("init", options.json,
                                    std::string(CONFIG_FILE_NAME) + " already exists at " +
                                        config_path.string() + ". Use --force to overwrite.",
                                    EXIT_CONFIG_OR_DISCOVERY);
    }

    for (const char* dir : {"src", "tests"}) {
        fs::create_directories(root / dir, ec);
        if (ec) {
            return report_command_error("init", options.json,
                                        "Cannot create " + (root / dir).string() + ": " +
                                            ec.message(),
                                        EXIT_CONFIG_OR_DISCOVERY);
        }
    }

    if (auto err = build::atomic_write_file(config_path, INIT_CONFIG_TEMPLATE)) {
        return report_command_error("init", options.json, err->path + ": " + err->message,
                                    EXIT_CONFIG_OR_DISCOVERY);
    }

    // An existing manifest holds the user's specs; never replace it
    fs::path manifest = root / "forge-specs.json";
    if (!fs::exists(manifest, ec)) {
        if (auto err = build::atomic_write_file(manifest, EMPTY_MANIFEST)) {
            return report_command_error("init", options.json, err->path + ": " + err->message,
                                        EXIT_CONFIG_OR_DISCOVERY);
        }
    }

    FORGE_LOG_INFO("cli", "Initialized forge project in " << root.string());
    if (options.json) {
        json::JsonValue doc = json::json_object();
        doc.set("command", json::JsonValue("init"));
        doc.set("ok", json::JsonValue(true));
        doc.set("path", json::JsonValue(config_path.string()));
        emit_json(doc);
    } else {
        std::cout << "Wrote " << config_path.string() << "\n";
    }
    return EXIT_OK;
}

} // namespace forge::cli
