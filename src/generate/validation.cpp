//! # Generated Source Validation
//!
//! A single-pass scanner tracks string literals, comments and bracket
//! nesting. It reports structural errors and records the lines that start
//! at column 0 outside any bracket or string; those lines are then matched
//! for top-level definitions.

#include "generate/validation.hpp"

#include "generate/subprocess.hpp"
#include "log/log.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace forge::generate {

namespace {

struct ScanResult {
    std::vector<std::string> errors;
    std::vector<std::string_view> top_level_lines;
};

auto matching_open(char close) -> char {
    switch (close) {
    case ')':
        return '(';
    case ']':
        return '[';
    default:
        return '{';
    }
}

auto scan_source(std::string_view src) -> ScanResult {
    ScanResult result;
    std::vector<std::pair<char, size_t>> brackets; // (bracket, line)
    size_t line = 1;
    size_t i = 0;
    bool line_start = true;

    while (i < src.size()) {
        char c = src[i];

        if (line_start) {
            line_start = false;
            if (brackets.empty() && c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '#') {
                size_t end = src.find('\n', i);
                result.top_level_lines.push_back(
                    src.substr(i, end == std::string_view::npos ? std::string_view::npos : end - i));
            }
        }

        if (c == '\n') {
            ++line;
            line_start = true;
            ++i;
            continue;
        }

        if (c == '#') {
            while (i < src.size() && src[i] != '\n') {
                ++i;
            }
            continue;
        }

        if (c == '"' || c == '\'') {
            size_t start_line = line;
            bool triple = src.substr(i, 3) == std::string_view(std::string(3, c));
            i += triple ? 3 : 1;
            bool closed = false;
            while (i < src.size()) {
                char s = src[i];
                if (s == '\\') {
                    if (i + 1 < src.size() && src[i + 1] == '\n') {
                        ++line;
                    }
                    i += 2;
                    continue;
                }
                if (s == '\n') {
                    if (!triple) {
                        break;
                    }
                    ++line;
                    ++i;
                    continue;
                }
                if (s == c && (!triple || src.substr(i, 3) == std::string_view(std::string(3, c)))) {
                    i += triple ? 3 : 1;
                    closed = true;
                    break;
                }
                ++i;
            }
            if (!closed) {
                result.errors.push_back("Unterminated string literal starting on line " +
                                        std::to_string(start_line) + ".");
                return result;
            }
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            brackets.emplace_back(c, line);
        } else if (c == ')' || c == ']' || c == '}') {
            if (brackets.empty()) {
                result.errors.push_back(std::string("Unmatched closing bracket '") + c +
                                        "' on line " + std::to_string(line) + ".");
                return result;
            }
            if (brackets.back().first != matching_open(c)) {
                result.errors.push_back(std::string("Mismatched bracket '") + c + "' on line " +
                                        std::to_string(line) + " (opened '" +
                                        brackets.back().first + "' on line " +
                                        std::to_string(brackets.back().second) + ").");
                return result;
            }
            brackets.pop_back();
        }
        ++i;
    }

    if (!brackets.empty()) {
        result.errors.push_back(std::string("Unclosed bracket '") + brackets.back().first +
                                "' opened on line " + std::to_string(brackets.back().second) + ".");
    }
    return result;
}

auto is_ident_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Reads an identifier at `pos`, advancing past it.
auto read_ident(std::string_view line, size_t& pos) -> std::string_view {
    size_t start = pos;
    if (pos >= line.size() || !is_ident_start(line[pos])) {
        return {};
    }
    while (pos < line.size() && is_ident_char(line[pos])) {
        ++pos;
    }
    return line.substr(start, pos - start);
}

void skip_spaces(std::string_view line, size_t& pos) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
    }
}

auto consume_keyword(std::string_view line, size_t& pos, std::string_view keyword) -> bool {
    if (line.substr(pos, keyword.size()) != keyword) {
        return false;
    }
    size_t after = pos + keyword.size();
    if (after < line.size() && line[after] != ' ' && line[after] != '\t') {
        return false;
    }
    pos = after;
    skip_spaces(line, pos);
    return true;
}

void collect_names(std::string_view line, std::set<std::string>& names) {
    size_t pos = 0;
    if (consume_keyword(line, pos, "async")) {
        if (!consume_keyword(line, pos, "def")) {
            return;
        }
        auto name = read_ident(line, pos);
        if (!name.empty()) {
            names.emplace(name);
        }
        return;
    }
    if (consume_keyword(line, pos, "def") || consume_keyword(line, pos, "class")) {
        auto name = read_ident(line, pos);
        if (!name.empty()) {
            names.emplace(name);
        }
        return;
    }

    // NAME = ..., NAME: T = ..., A, B = ...
    std::vector<std::string_view> targets;
    while (true) {
        auto name = read_ident(line, pos);
        if (name.empty()) {
            return;
        }
        targets.push_back(name);
        skip_spaces(line, pos);
        if (pos < line.size() && line[pos] == ',') {
            ++pos;
            skip_spaces(line, pos);
            continue;
        }
        break;
    }
    if (pos >= line.size()) {
        return;
    }
    bool assignment = line[pos] == '=' && (pos + 1 >= line.size() || line[pos + 1] != '=');
    bool annotation = line[pos] == ':' && targets.size() == 1;
    if (assignment || annotation) {
        for (auto name : targets) {
            names.emplace(name);
        }
    }
}

auto leading_component(const std::string& name) -> std::string {
    return name.substr(0, name.find('.'));
}

} // namespace

auto top_level_names(const std::string& source) -> std::set<std::string> {
    std::set<std::string> names;
    for (auto line : scan_source(source).top_level_lines) {
        collect_names(line, names);
    }
    return names;
}

auto validate_generated_source(const std::string& source,
                               const std::vector<std::string>& expected_names)
    -> std::vector<std::string> {
    bool blank = true;
    for (char c : source) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            blank = false;
            break;
        }
    }
    if (blank) {
        return {"Generated source is empty."};
    }

    auto scan = scan_source(source);
    if (!scan.errors.empty()) {
        return scan.errors;
    }

    std::set<std::string> defined;
    for (auto line : scan.top_level_lines) {
        collect_names(line, defined);
    }

    std::vector<std::string> errors;
    std::set<std::string> reported;
    for (const auto& expected : expected_names) {
        std::string name = leading_component(expected);
        if (defined.count(name) == 0 && reported.insert(name).second) {
            errors.push_back("Missing top-level definition: " + name);
        }
    }
    return errors;
}

// ============================================================================
// External Checker
// ============================================================================

auto diagnostic_error_codes(const std::string& output) -> std::set<std::string> {
    std::set<std::string> codes;
    const std::string marker = "error[";
    size_t pos = 0;
    while ((pos = output.find(marker, pos)) != std::string::npos) {
        size_t start = pos + marker.size();
        size_t end = output.find(']', start);
        if (end == std::string::npos) {
            break;
        }
        if (end > start && output.find('\n', start) > end) {
            codes.insert(output.substr(start, end - start));
        }
        pos = end;
    }
    return codes;
}

namespace {

/// Temp tree first, then the package dir, then the inherited entries.
auto checker_python_path(const std::filesystem::path& tmp_root,
                         const std::filesystem::path& package_dir) -> std::string {
    std::vector<std::string> parts{tmp_root.string()};
    if (!package_dir.empty()) {
        parts.push_back(std::filesystem::absolute(package_dir).string());
    }
    if (const char* current = std::getenv("PYTHONPATH")) {
        std::istringstream in(current);
        std::string part;
        while (std::getline(in, part, ':')) {
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
    }

    std::string joined;
    std::set<std::string> seen;
    for (const auto& part : parts) {
        if (!seen.insert(part).second) {
            continue;
        }
        if (!joined.empty()) {
            joined += ':';
        }
        joined += part;
    }
    return joined;
}

} // namespace

auto ExternalChecker::check(const std::string& source, const std::string& module_name,
                            const std::filesystem::path& generated_relpath) const
    -> std::vector<std::string> {
    namespace fs = std::filesystem;

    std::string tmpl = (fs::temp_directory_path() / "forge-check-XXXXXX").string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return {"check failed for " + module_name + ": cannot create temp directory"};
    }
    fs::path tmp_root(buffer.data());

    auto cleanup = [&tmp_root] {
        std::error_code ec;
        fs::remove_all(tmp_root, ec);
    };

    fs::path file_path = tmp_root / generated_relpath;
    std::error_code ec;
    fs::create_directories(file_path.parent_path(), ec);
    fs::path dir = tmp_root;
    for (const auto& part : generated_relpath.parent_path()) {
        dir /= part;
        std::ofstream(dir / "__init__.py", std::ios::app);
    }
    {
        std::string body = source;
        while (!body.empty() && std::isspace(static_cast<unsigned char>(body.back()))) {
            body.pop_back();
        }
        std::ofstream out(file_path, std::ios::binary);
        out << body << '\n';
        if (!out) {
            cleanup();
            return {"check failed for " + module_name + ": cannot write candidate source"};
        }
    }

    std::vector<std::string> argv = command_;
    argv.push_back(file_path.string());

    SubprocessOptions options;
    options.timeout_seconds = timeout_seconds_;
    options.working_dir = working_dir_;
    options.env.emplace_back("PYTHONPATH", checker_python_path(tmp_root, working_dir_));

    FORGE_LOG_DEBUG("check", "Running " << format_command(argv));
    auto result = run_subprocess(argv, options);
    cleanup();

    std::string cmd_name = command_.empty() ? "check" : format_command(command_);

    if (!result.launched) {
        return {cmd_name + " could not be started for " + module_name + ": " + result.error};
    }

    if (result.timed_out) {
        std::ostringstream msg;
        std::string err = result.stderr_output;
        while (!err.empty() && std::isspace(static_cast<unsigned char>(err.back()))) {
            err.pop_back();
        }
        if (!err.empty()) {
            msg << err << "\n";
        }
        msg << cmd_name << " timed out for " << module_name << " after " << std::fixed
            << std::setprecision(1) << timeout_seconds_ << "s.";
        return {msg.str()};
    }

    if (result.exit_code == 0) {
        return {};
    }

    std::string raw = result.stdout_output + "\n" + result.stderr_output;
    auto codes = diagnostic_error_codes(raw);
    if (!codes.empty() && codes.size() == 1 && codes.count("unresolved-import") == 1) {
        FORGE_LOG_DEBUG("check", "Ignoring unresolved-import diagnostics for " << module_name);
        return {};
    }

    std::vector<std::string> lines;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line) && lines.size() < MAX_REPORTED_LINES) {
        bool blank = true;
        for (char c : line) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                blank = false;
                break;
            }
        }
        if (!blank) {
            lines.push_back(line);
        }
    }

    std::string snippet;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            snippet += '\n';
        }
        snippet += lines[i];
    }
    if (snippet.empty()) {
        snippet = cmd_name + " exited with status " + std::to_string(result.exit_code);
    }
    return {"check failed for " + module_name + ": " + snippet};
}

} // namespace forge::generate
