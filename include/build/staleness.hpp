//! # Staleness Detection
//!
//! A module is stale when its generated artifact is missing, unreadable,
//! has no forge header, or records a digest different from the freshly
//! computed module digest. `force` marks everything stale.

#ifndef FORGE_BUILD_STALENESS_HPP
#define FORGE_BUILD_STALENESS_HPP

#include "build/digest.hpp"
#include "build/spec.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace forge::build {

namespace fs = std::filesystem;

/// Pure comparison. `on_disk_digests` maps a module to its stored digest,
/// or nullopt when there is none; modules missing from the map are stale.
[[nodiscard]] auto detect_stale(const std::map<std::string, std::string>& module_digests,
                                const std::map<std::string, std::optional<std::string>>& on_disk_digests,
                                bool force) -> std::set<std::string>;

/// Digest stored in the module's artifact header, if any.
[[nodiscard]] auto read_stored_digest(const fs::path& package_dir, const std::string& generated_dir,
                                      const std::string& module) -> std::optional<std::string>;

/// Reads every module's artifact header and compares it with the computed
/// module digest.
[[nodiscard]] auto detect_stale_modules(const fs::path& package_dir,
                                        const std::string& generated_dir,
                                        const std::map<std::string, std::vector<SpecEntry>>& module_specs,
                                        const std::map<SpecRef, SpecEntry>& specs,
                                        const SpecGraph& spec_graph, bool force)
    -> std::set<std::string>;

} // namespace forge::build

#endif // FORGE_BUILD_STALENESS_HPP
