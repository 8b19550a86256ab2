//! # Project Configuration Interface
//!
//! This header defines `forge.toml` parsing and project configuration.
//!
//! ## Sections
//!
//! | Section   | Type            | Description                          |
//! |-----------|-----------------|--------------------------------------|
//! | `[paths]` | `PathsConfig`   | Source roots, generated dir, manifest |
//! | `[build]` | `BuildSettings` | Parallelism, inference, checker      |
//! | `[llm]`   | `LlmSettings`   | Generation command, model, budget    |
//!
//! ## Example
//!
//! ```toml
//! [paths]
//! source_roots = ["src"]
//! generated_dir = "__generated__"
//! spec_manifest = "forge-specs.json"
//!
//! [build]
//! jobs = 4
//! infer_deps = true
//! check_command = ["ty", "check"]
//! check_retry_attempts = 1
//! guidance_files = ["docs/codegen.md"]
//!
//! [llm]
//! model = "gpt-5"
//! command = ["./generate.sh"]
//! max_cost_per_build = 2.5
//! ```
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML these files use.

#ifndef FORGE_CLI_CONFIG_HPP
#define FORGE_CLI_CONFIG_HPP

#include "build/errors.hpp"
#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace forge::cli {

/// File name searched for by `ForgeConfig::find_root`.
constexpr const char* CONFIG_FILE_NAME = "forge.toml";

/**
 * Layout settings from the [paths] section
 */
struct PathsConfig {
    std::vector<std::string> source_roots = {"src"};
    std::string generated_dir = "__generated__";
    std::string spec_manifest = "forge-specs.json";
};

/**
 * Scheduler settings from the [build] section
 */
struct BuildSettings {
    int jobs = 4;
    bool infer_deps = true;
    std::vector<std::string> check_command; // Empty: no external checker
    int check_retry_attempts = 0;
    double check_timeout_seconds = 20.0;
    std::vector<std::string> guidance_files; // Prompt text shared by every module
};

/**
 * Generation settings from the [llm] section
 */
struct LlmSettings {
    std::string provider = "command";
    std::string model;
    std::vector<std::string> command;
    std::optional<double> max_cost_per_build;
    double timeout_seconds = 300.0;
};

/**
 * Complete project configuration
 */
struct ForgeConfig {
    fs::path root;        // Directory containing forge.toml
    fs::path config_path; // Empty when running on defaults
    PathsConfig paths;
    BuildSettings build;
    LlmSettings llm;

    /**
     * Load and validate a forge.toml file
     * @param path Path to forge.toml
     */
    static Result<ForgeConfig, build::ConfigError> load(const fs::path& path);

    /**
     * Parse config text; `root` becomes the project root
     */
    static Result<ForgeConfig, build::ConfigError> parse(const std::string& content,
                                                         const fs::path& root,
                                                         const std::string& origin);

    /**
     * Search `start` and its parents for forge.toml
     * @return Directory containing the file, or std::nullopt
     */
    static std::optional<fs::path> find_root(const fs::path& start);

    /**
     * Check value ranges
     * @return The first problem found, or std::nullopt when valid
     */
    std::optional<build::ConfigError> validate() const;

    fs::path manifest_path() const;
    std::vector<fs::path> source_root_paths() const;
};

// ============================================================================
// TOML subset
// ============================================================================

using TomlValue = std::variant<std::string, int64_t, double, bool, std::vector<std::string>>;

struct TomlEntry {
    TomlValue value;
    size_t line = 0;
};

/// section name -> key -> entry. Keys before any header live in section "".
using TomlDocument = std::map<std::string, std::map<std::string, TomlEntry>>;

/**
 * Simple TOML parser (subset of TOML spec)
 * Handles:
 * - Sections: [section], [dotted.section]
 * - Key-value pairs: key = "value", key = 'literal'
 * - Integers and floats: key = 123, key = 2.5
 * - Booleans: key = true
 * - String arrays, possibly spanning lines: key = ["a", "b"]
 * - Comments: # ...
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse the content
     * @return The document, or std::nullopt with get_error() set
     */
    std::optional<TomlDocument> parse();

    std::string get_error() const {
        return error_message_;
    }

    size_t get_error_line() const {
        return error_line_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t error_line_ = 0;
    size_t pos_ = 0;
    size_t line_ = 1;

    void skip_whitespace();
    void skip_comment();
    void skip_whitespace_and_newlines();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();
    bool expect_line_end();

    std::optional<std::string> parse_key();
    std::optional<std::string> parse_section_header();
    std::optional<TomlValue> parse_value();
    std::optional<std::string> parse_string();
    std::optional<TomlValue> parse_number();
    std::optional<std::vector<std::string>> parse_string_array();

    void set_error(const std::string& message);
};

/// Type name used in mismatch messages.
const char* toml_type_name(const TomlValue& value);

} // namespace forge::cli

#endif // FORGE_CLI_CONFIG_HPP
