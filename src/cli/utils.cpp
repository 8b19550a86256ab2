//! # CLI Utilities
//!
//! Help text, version output and formatting helpers shared by the commands.

#include "cli/utils.hpp"

#include "common.hpp"

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace forge::cli {

void print_usage() {
    std::cout << "forge " << VERSION << " - incremental, dependency-aware code generation\n\n";
    std::cout << "Usage: forge <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  init                Create forge.toml, src/ and tests/\n";
    std::cout << "  build               Regenerate stale modules\n";
    std::cout << "  status              List stale and fresh modules\n";
    std::cout << "  watch               Rebuild whenever sources or specs change\n";
    std::cout << "  clean               Remove generated directories\n";
    std::cout << "  cache info|clear    Inspect or clear the response cache\n\n";
    std::cout << "Project options:\n";
    std::cout << "  --root <dir>        Project root (default: search upward for forge.toml)\n";
    std::cout << "  --config <file>     Config file (default: <root>/forge.toml)\n";
    std::cout << "  --json              Machine-readable output on stdout\n\n";
    std::cout << "Build options:\n";
    std::cout << "  --jobs <n>, -j <n>  Concurrent generations (default: [build] jobs)\n";
    std::cout << "  --force             Treat every module as stale\n";
    std::cout << "  --target <m[:q]>    Restrict to a module and its dependencies (repeatable)\n";
    std::cout << "  --no-infer-deps     Only use declared dependencies\n";
    std::cout << "  --no-progress       Do not print per-module progress\n";
    std::cout << "  --no-cache          Bypass the response cache\n\n";
    std::cout << "Init options:\n";
    std::cout << "  --force             Overwrite an existing forge.toml\n\n";
    std::cout << "Clean options:\n";
    std::cout << "  --dry-run           List directories without removing them\n\n";
    std::cout << "Logging:\n";
    std::cout << "  -v, -vv, -vvv       Info, debug, trace logging\n";
    std::cout << "  -q, --quiet         Errors only\n";
    std::cout << "  --log-level=<lvl>   trace|debug|info|warn|error|off\n";
    std::cout << "  --log-filter=<spec> e.g. scheduler=debug,cache=trace\n";
    std::cout << "  --log-file=<path>   Also write logs to a file\n";
    std::cout << "  --log-format=json   JSON-lines log output\n\n";
    std::cout << "Exit codes: 0 ok, 2 config/discovery/cycle error, 3 generation failure\n";
}

void print_version() {
    std::cout << "forge " << VERSION << "\n";
}

void emit_json(const json::JsonValue& value) {
    std::cout << value.to_string_pretty() << "\n";
}

std::string format_size(uintmax_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 3) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string format_build_failures(const std::map<std::string, std::vector<std::string>>& failed) {
    std::ostringstream oss;
    oss << "error: " << failed.size() << " module(s) failed to build";
    for (const auto& [module, errors] : failed) {
        oss << "\n  " << module << ":";
        for (const auto& error : errors) {
            oss << "\n    - " << error;
        }
    }
    return oss.str();
}

int report_command_error(const std::string& command, bool json_mode, const std::string& message,
                         int exit_code) {
    std::cerr << "error: " << message << "\n";
    if (json_mode) {
        json::JsonValue doc = json::json_object();
        doc.set("command", json::JsonValue(command));
        doc.set("ok", json::JsonValue(false));
        doc.set("error", json::JsonValue(message));
        emit_json(doc);
    }
    return exit_code;
}

bool stderr_is_terminal() {
    return isatty(fileno(stderr)) != 0;
}

} // namespace forge::cli
