//! # Generated File Header
//!
//! Every generated artifact starts with a comment block that records what
//! produced it. The module digest in this block is the only persistent
//! staleness record.
//!
//! ```text
//! # Generated by forge. DO NOT EDIT.
//! # forge:tool_version=0.3.0
//! # forge:kind=build
//! # forge:source_module=pkg.a
//! # forge:module_digest=sha256:3f1c...
//! # forge:spec_refs=["pkg.a:A","pkg.a:B"]
//! ```

#ifndef FORGE_BUILD_HEADER_HPP
#define FORGE_BUILD_HEADER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forge::build {

constexpr const char* HEADER_BANNER = "# Generated by forge. DO NOT EDIT.";
constexpr const char* HEADER_FIELD_PREFIX = "# forge:";

struct HeaderFields {
    std::string tool_version;
    std::string kind; ///< "build" or "test"
    std::string source_module;
    std::string module_digest; ///< Hex, with or without "sha256:"
    std::vector<std::string> spec_refs;
};

/// Renders the header block without a trailing newline.
[[nodiscard]] auto format_header(const HeaderFields& fields) -> std::string;

/// Parses the leading comment block; nullopt without the banner.
[[nodiscard]] auto parse_header(std::string_view text) -> std::optional<HeaderFields>;

/// The `module_digest` field of a generated file, or nullopt when the file
/// has no forge header or the field is missing.
[[nodiscard]] auto extract_module_digest(std::string_view text) -> std::optional<std::string>;

/// Strips a leading "sha256:" and maps empty to nullopt.
[[nodiscard]] auto normalize_digest(std::optional<std::string> digest)
    -> std::optional<std::string>;

} // namespace forge::build

#endif // FORGE_BUILD_HEADER_HPP
