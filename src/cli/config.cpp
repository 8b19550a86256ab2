//! # Project Configuration
//!
//! Implements `forge.toml` loading on top of `SimpleTomlParser`.
//!
//! ## Key Handling
//!
//! | Case | Result |
//! |------|--------|
//! | Unknown section or key | warning log, ignored |
//! | Wrong value type | `ConfigError` naming the key and line |
//! | Duplicate key | `ConfigError` |
//! | Integer where a float is expected | accepted |

#include "cli/config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace forge::cli {

using build::ConfigError;

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content) : content_(content) {}

char SimpleTomlParser::advance() {
    char c = content_[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void SimpleTomlParser::skip_whitespace_and_newlines() {
    while (!is_eof()) {
        skip_whitespace();
        skip_comment();
        if (peek() == '\n') {
            advance();
            continue;
        }
        break;
    }
}

bool SimpleTomlParser::expect_line_end() {
    skip_whitespace();
    skip_comment();
    if (is_eof()) {
        return true;
    }
    if (peek() != '\n') {
        set_error(std::string("Unexpected character '") + peek() + "' after value");
        return false;
    }
    advance();
    return true;
}

void SimpleTomlParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = message;
        error_line_ = line_;
    }
}

std::optional<std::string> SimpleTomlParser::parse_key() {
    if (peek() == '"') {
        return parse_string();
    }
    std::string key;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            key += advance();
        } else {
            break;
        }
    }
    if (key.empty()) {
        set_error("Expected a key");
        return std::nullopt;
    }
    return key;
}

std::optional<std::string> SimpleTomlParser::parse_section_header() {
    advance(); // [
    if (peek() == '[') {
        set_error("Arrays of tables are not supported");
        return std::nullopt;
    }
    std::string name;
    while (true) {
        skip_whitespace();
        auto part = parse_key();
        if (!part) {
            return std::nullopt;
        }
        name += *part;
        skip_whitespace();
        if (peek() == '.') {
            advance();
            name += '.';
            continue;
        }
        break;
    }
    if (peek() != ']') {
        set_error("Expected ']' to close section header");
        return std::nullopt;
    }
    advance();
    if (!expect_line_end()) {
        return std::nullopt;
    }
    return name;
}

std::optional<std::string> SimpleTomlParser::parse_string() {
    char quote = advance();
    std::string out;
    while (true) {
        if (is_eof() || peek() == '\n') {
            set_error("Unterminated string");
            return std::nullopt;
        }
        char c = advance();
        if (c == quote) {
            break;
        }
        if (c == '\\' && quote == '"') {
            if (is_eof()) {
                set_error("Unterminated string");
                return std::nullopt;
            }
            char esc = advance();
            switch (esc) {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case 'r':
                out += '\r';
                break;
            case '"':
                out += '"';
                break;
            case '\\':
                out += '\\';
                break;
            default:
                set_error(std::string("Unsupported escape sequence '\\") + esc + "'");
                return std::nullopt;
            }
            continue;
        }
        out += c;
    }
    return out;
}

std::optional<TomlValue> SimpleTomlParser::parse_number() {
    std::string text;
    bool is_float = false;
    while (!is_eof()) {
        char c = peek();
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-') {
            text += advance();
        } else if (c == '.' || c == 'e' || c == 'E') {
            is_float = true;
            text += advance();
        } else if (c == '_') {
            advance();
        } else {
            break;
        }
    }

    if (text.empty()) {
        set_error("Expected a value");
        return std::nullopt;
    }

    std::istringstream iss(text);
    if (is_float) {
        double value = 0.0;
        iss >> value;
        if (iss.fail() || !iss.eof()) {
            set_error("Invalid number '" + text + "'");
            return std::nullopt;
        }
        return TomlValue(value);
    }
    int64_t value = 0;
    iss >> value;
    if (iss.fail() || !iss.eof()) {
        set_error("Invalid integer '" + text + "'");
        return std::nullopt;
    }
    return TomlValue(value);
}

std::optional<std::vector<std::string>> SimpleTomlParser::parse_string_array() {
    advance(); // [
    std::vector<std::string> items;
    while (true) {
        skip_whitespace_and_newlines();
        if (is_eof()) {
            set_error("Unterminated array");
            return std::nullopt;
        }
        if (peek() == ']') {
            advance();
            return items;
        }
        if (peek() != '"' && peek() != '\'') {
            set_error("Only arrays of strings are supported");
            return std::nullopt;
        }
        auto item = parse_string();
        if (!item) {
            return std::nullopt;
        }
        items.push_back(std::move(*item));

        skip_whitespace_and_newlines();
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            set_error("Expected ',' or ']' in array");
            return std::nullopt;
        }
    }
}

std::optional<TomlValue> SimpleTomlParser::parse_value() {
    char c = peek();
    if (c == '"' || c == '\'') {
        auto s = parse_string();
        if (!s) {
            return std::nullopt;
        }
        return TomlValue(std::move(*s));
    }
    if (c == '[') {
        auto items = parse_string_array();
        if (!items) {
            return std::nullopt;
        }
        return TomlValue(std::move(*items));
    }
    if (content_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        return TomlValue(true);
    }
    if (content_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        return TomlValue(false);
    }
    return parse_number();
}

std::optional<TomlDocument> SimpleTomlParser::parse() {
    TomlDocument doc;
    std::string section;
    doc[section];

    while (true) {
        skip_whitespace_and_newlines();
        if (is_eof()) {
            break;
        }

        if (peek() == '[') {
            auto name = parse_section_header();
            if (!name) {
                return std::nullopt;
            }
            section = *name;
            doc[section];
            continue;
        }

        size_t key_line = line_;
        auto key = parse_key();
        if (!key) {
            return std::nullopt;
        }
        skip_whitespace();
        if (peek() != '=') {
            set_error("Expected '=' after key '" + *key + "'");
            return std::nullopt;
        }
        advance();
        skip_whitespace();

        auto value = parse_value();
        if (!value) {
            return std::nullopt;
        }
        if (!expect_line_end()) {
            return std::nullopt;
        }

        auto& table = doc[section];
        if (table.count(*key) > 0) {
            error_message_ = "Duplicate key '" + *key + "'";
            error_line_ = key_line;
            return std::nullopt;
        }
        table[*key] = TomlEntry{std::move(*value), key_line};
    }

    return doc;
}

const char* toml_type_name(const TomlValue& value) {
    switch (value.index()) {
    case 0:
        return "string";
    case 1:
        return "integer";
    case 2:
        return "float";
    case 3:
        return "boolean";
    default:
        return "array";
    }
}

// ============================================================================
// ForgeConfig
// ============================================================================

namespace {

/// Typed reads from one section; each setter reports a type mismatch.
class SectionReader {
public:
    SectionReader(const std::string& origin, const std::string& section,
                  const std::map<std::string, TomlEntry>& entries)
        : origin_(origin), section_(section), entries_(entries) {}

    std::optional<ConfigError> read_string(const std::string& key, std::string& out) {
        return read(key, [&out](const TomlValue& v) {
            if (auto* s = std::get_if<std::string>(&v)) {
                out = *s;
                return true;
            }
            return false;
        }, "a string");
    }

    std::optional<ConfigError> read_int(const std::string& key, int& out) {
        return read(key, [&out](const TomlValue& v) {
            if (auto* i = std::get_if<int64_t>(&v)) {
                out = static_cast<int>(*i);
                return true;
            }
            return false;
        }, "an integer");
    }

    std::optional<ConfigError> read_bool(const std::string& key, bool& out) {
        return read(key, [&out](const TomlValue& v) {
            if (auto* b = std::get_if<bool>(&v)) {
                out = *b;
                return true;
            }
            return false;
        }, "a boolean");
    }

    std::optional<ConfigError> read_double(const std::string& key, double& out) {
        return read(key, [&out](const TomlValue& v) {
            if (auto* d = std::get_if<double>(&v)) {
                out = *d;
                return true;
            }
            if (auto* i = std::get_if<int64_t>(&v)) {
                out = static_cast<double>(*i);
                return true;
            }
            return false;
        }, "a number");
    }

    std::optional<ConfigError> read_optional_double(const std::string& key,
                                                    std::optional<double>& out) {
        if (entries_.count(key) == 0) {
            return std::nullopt;
        }
        double value = 0.0;
        if (auto err = read_double(key, value)) {
            return err;
        }
        out = value;
        return std::nullopt;
    }

    std::optional<ConfigError> read_string_array(const std::string& key,
                                                 std::vector<std::string>& out) {
        return read(key, [&out](const TomlValue& v) {
            if (auto* a = std::get_if<std::vector<std::string>>(&v)) {
                out = *a;
                return true;
            }
            return false;
        }, "an array of strings");
    }

    /// Logs keys that no read_* call asked for.
    void warn_unknown() const {
        for (const auto& [key, entry] : entries_) {
            if (seen_.count(key) == 0) {
                FORGE_LOG_WARN("config", origin_ << ":" << entry.line << ": unknown key '"
                                                 << section_ << "." << key << "' ignored");
            }
        }
    }

private:
    template <typename F>
    std::optional<ConfigError> read(const std::string& key, F assign, const char* expected) {
        seen_.insert(key);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (!assign(it->second.value)) {
            return ConfigError{origin_, it->second.line,
                               "'" + section_ + "." + key + "' must be " + expected + ", got " +
                                   toml_type_name(it->second.value)};
        }
        return std::nullopt;
    }

    const std::string& origin_;
    std::string section_;
    const std::map<std::string, TomlEntry>& entries_;
    std::set<std::string> seen_;
};

} // namespace

Result<ForgeConfig, ConfigError> ForgeConfig::load(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ConfigError{path.string(), 0, "Cannot read config file"};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    fs::path root = path.parent_path();
    if (root.empty()) {
        root = fs::current_path();
    }

    auto parsed = parse(buffer.str(), fs::absolute(root), path.string());
    if (is_err(parsed)) {
        return parsed;
    }
    auto& config = unwrap(parsed);
    config.config_path = path;

    if (auto err = config.validate()) {
        err->path = path.string();
        return *err;
    }

    FORGE_LOG_DEBUG("config", "Loaded " << path.string() << " (jobs=" << config.build.jobs
                                        << ", model=" << config.llm.model << ")");
    return config;
}

Result<ForgeConfig, ConfigError> ForgeConfig::parse(const std::string& content,
                                                    const fs::path& root,
                                                    const std::string& origin) {
    SimpleTomlParser parser(content);
    auto doc = parser.parse();
    if (!doc) {
        return ConfigError{origin, parser.get_error_line(), parser.get_error()};
    }

    ForgeConfig config;
    config.root = root;

    static const std::map<std::string, TomlEntry> empty_section;
    auto section = [&doc](const std::string& name) -> const std::map<std::string, TomlEntry>& {
        auto it = doc->find(name);
        return it == doc->end() ? empty_section : it->second;
    };

    SectionReader paths(origin, "paths", section("paths"));
    SectionReader build(origin, "build", section("build"));
    SectionReader llm(origin, "llm", section("llm"));

    std::optional<ConfigError> err;
    if ((err = paths.read_string_array("source_roots", config.paths.source_roots)) ||
        (err = paths.read_string("generated_dir", config.paths.generated_dir)) ||
        (err = paths.read_string("spec_manifest", config.paths.spec_manifest)) ||
        (err = build.read_int("jobs", config.build.jobs)) ||
        (err = build.read_bool("infer_deps", config.build.infer_deps)) ||
        (err = build.read_string_array("check_command", config.build.check_command)) ||
        (err = build.read_int("check_retry_attempts", config.build.check_retry_attempts)) ||
        (err = build.read_double("check_timeout_seconds", config.build.check_timeout_seconds)) ||
        (err = build.read_string_array("guidance_files", config.build.guidance_files)) ||
        (err = llm.read_string("provider", config.llm.provider)) ||
        (err = llm.read_string("model", config.llm.model)) ||
        (err = llm.read_string_array("command", config.llm.command)) ||
        (err = llm.read_optional_double("max_cost_per_build", config.llm.max_cost_per_build)) ||
        (err = llm.read_double("timeout_seconds", config.llm.timeout_seconds))) {
        return *err;
    }

    paths.warn_unknown();
    build.warn_unknown();
    llm.warn_unknown();
    for (const auto& [name, entries] : *doc) {
        if (name == "paths" || name == "build" || name == "llm") {
            continue;
        }
        if (name.empty() && entries.empty()) {
            continue;
        }
        FORGE_LOG_WARN("config", origin << ": unknown section '"
                                        << (name.empty() ? "<top level>" : name) << "' ignored");
    }

    return config;
}

std::optional<fs::path> ForgeConfig::find_root(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }
    while (true) {
        if (fs::is_regular_file(dir / CONFIG_FILE_NAME, ec)) {
            return dir;
        }
        fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir) {
            return std::nullopt;
        }
        dir = parent;
    }
}

std::optional<ConfigError> ForgeConfig::validate() const {
    std::string origin = config_path.string();
    if (paths.source_roots.empty()) {
        return ConfigError{origin, 0, "paths.source_roots must not be empty"};
    }
    const auto& gen = paths.generated_dir;
    if (gen.empty() || gen == "." || gen == ".." ||
        gen.find_first_of("/\\") != std::string::npos) {
        return ConfigError{origin, 0,
                           "paths.generated_dir must be a plain directory name, got '" + gen + "'"};
    }
    if (paths.spec_manifest.empty()) {
        return ConfigError{origin, 0, "paths.spec_manifest must not be empty"};
    }
    if (build.jobs < 1) {
        return ConfigError{origin, 0, "build.jobs must be >= 1"};
    }
    if (build.check_retry_attempts < 0) {
        return ConfigError{origin, 0, "build.check_retry_attempts must be >= 0"};
    }
    if (build.check_timeout_seconds <= 0.0) {
        return ConfigError{origin, 0, "build.check_timeout_seconds must be > 0"};
    }
    if (llm.timeout_seconds <= 0.0) {
        return ConfigError{origin, 0, "llm.timeout_seconds must be > 0"};
    }
    if (llm.max_cost_per_build && *llm.max_cost_per_build < 0.0) {
        return ConfigError{origin, 0, "llm.max_cost_per_build must be >= 0"};
    }
    return std::nullopt;
}

fs::path ForgeConfig::manifest_path() const {
    fs::path manifest(paths.spec_manifest);
    return manifest.is_absolute() ? manifest : root / manifest;
}

std::vector<fs::path> ForgeConfig::source_root_paths() const {
    std::vector<fs::path> out;
    for (const auto& r : paths.source_roots) {
        fs::path p(r);
        out.push_back(p.is_absolute() ? p : root / p);
    }
    return out;
}

} // namespace forge::cli
