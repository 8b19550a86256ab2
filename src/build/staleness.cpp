#include "build/staleness.hpp"

#include "build/artifact_writer.hpp"
#include "build/header.hpp"
#include "log/log.hpp"

namespace forge::build {

auto detect_stale(const std::map<std::string, std::string>& module_digests,
                  const std::map<std::string, std::optional<std::string>>& on_disk_digests,
                  bool force) -> std::set<std::string> {
    std::set<std::string> stale;
    for (const auto& [module, digest] : module_digests) {
        if (force) {
            stale.insert(module);
            continue;
        }
        auto it = on_disk_digests.find(module);
        if (it == on_disk_digests.end()) {
            stale.insert(module);
            continue;
        }
        auto stored = normalize_digest(it->second);
        auto computed = normalize_digest(digest);
        if (!stored || !computed || *stored != *computed) {
            stale.insert(module);
        }
    }
    return stale;
}

auto read_stored_digest(const fs::path& package_dir, const std::string& generated_dir,
                        const std::string& module) -> std::optional<std::string> {
    auto text = read_generated_module(package_dir, generated_dir, module);
    if (!text) {
        return std::nullopt;
    }
    return extract_module_digest(*text);
}

auto detect_stale_modules(const fs::path& package_dir, const std::string& generated_dir,
                          const std::map<std::string, std::vector<SpecEntry>>& module_specs,
                          const std::map<SpecRef, SpecEntry>& specs, const SpecGraph& spec_graph,
                          bool force) -> std::set<std::string> {
    std::map<std::string, std::string> computed;
    std::map<std::string, std::optional<std::string>> on_disk;

    for (const auto& [module, entries] : module_specs) {
        computed[module] = module_digest(module, entries, specs, spec_graph);
        if (!force) {
            on_disk[module] = read_stored_digest(package_dir, generated_dir, module);
        }
    }

    auto stale = detect_stale(computed, on_disk, force);
    FORGE_LOG_DEBUG("build", stale.size() << " of " << module_specs.size() << " modules stale"
                                          << (force ? " (forced)" : ""));
    return stale;
}

} // namespace forge::build
