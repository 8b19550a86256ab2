//! # Spec Discovery
//!
//! Manifest loading, spec-ref normalization and target resolution.

#include "build/spec.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace forge::build {

namespace {

auto trim(std::string_view s) -> std::string_view {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

auto read_file(const fs::path& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

/// Lines [start, end] (1-based, inclusive) of `text`.
auto slice_lines(const std::string& text, int64_t start, int64_t end) -> std::string {
    std::string out;
    std::istringstream in(text);
    std::string line;
    int64_t number = 0;
    while (std::getline(in, line)) {
        ++number;
        if (number < start) {
            continue;
        }
        if (number > end) {
            break;
        }
        out += line;
        out += '\n';
    }
    return out;
}

auto parse_entry(const json::JsonValue& item, size_t index, const fs::path& project_root,
                 const std::string& origin) -> Result<SpecEntry, ConfigError> {
    auto fail = [&](const std::string& msg) {
        return ConfigError{origin, 0, "specs[" + std::to_string(index) + "]: " + msg};
    };

    if (!item.is_object()) {
        return fail("expected an object");
    }

    SpecEntry entry;
    auto module = item.get_string("module");
    auto qualname = item.get_string("qualname");
    if (!module || module->empty()) {
        return fail("missing 'module'");
    }
    if (!qualname || qualname->empty()) {
        return fail("missing 'qualname'");
    }
    entry.module = std::string(trim(*module));
    entry.qualname = std::string(trim(*qualname));

    auto ref = normalize_spec_ref(entry.module + ":" + entry.qualname);
    if (!ref) {
        return fail("malformed spec ref '" + entry.module + ":" + entry.qualname + "'");
    }
    entry.spec_ref = *ref;

    if (auto inline_source = item.get_string("source")) {
        entry.source = *inline_source;
    } else if (auto source_file = item.get_string("source_file")) {
        entry.source_file = *source_file;
        fs::path path = fs::path(*source_file).is_absolute() ? fs::path(*source_file)
                                                              : project_root / *source_file;
        auto text = read_file(path);
        if (!text) {
            return fail("cannot read source file '" + path.string() + "'");
        }
        auto start = item.get_i64("start_line");
        auto end = item.get_i64("end_line");
        if (start || end) {
            int64_t first = start.value_or(1);
            int64_t last = end.value_or(INT64_MAX);
            if (first < 1 || last < first) {
                return fail("invalid line range");
            }
            entry.source = slice_lines(*text, first, last);
        } else {
            entry.source = std::move(*text);
        }
    } else {
        return fail("needs 'source' or 'source_file'");
    }

    if (const auto* deps = item.get("deps")) {
        if (!deps->is_array()) {
            return fail("'deps' must be an array");
        }
        for (const auto& dep : deps->as_array()) {
            std::optional<SpecRef> dep_ref;
            if (dep.is_string()) {
                dep_ref = normalize_spec_ref(dep.as_string());
            }
            if (!dep_ref) {
                return fail("malformed dependency ref in 'deps'");
            }
            entry.deps.push_back(*dep_ref);
        }
        std::sort(entry.deps.begin(), entry.deps.end());
        entry.deps.erase(std::unique(entry.deps.begin(), entry.deps.end()), entry.deps.end());
    }

    if (auto prompt = item.get_string("prompt")) {
        entry.prompt = *prompt;
    }
    if (const auto* infer = item.get("infer_deps")) {
        if (!infer->is_bool()) {
            return fail("'infer_deps' must be a boolean");
        }
        entry.infer_deps = infer->as_bool();
    }
    return entry;
}

} // namespace

// ============================================================================
// Spec Refs
// ============================================================================

auto normalize_spec_ref(std::string_view raw) -> std::optional<SpecRef> {
    std::string_view s = trim(raw);
    size_t colon = s.find(':');
    if (colon == std::string_view::npos || s.find(':', colon + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view module = trim(s.substr(0, colon));
    std::string_view qualname = trim(s.substr(colon + 1));
    if (module.empty() || qualname.empty()) {
        return std::nullopt;
    }
    return std::string(module) + ":" + std::string(qualname);
}

auto spec_ref_module(const SpecRef& ref) -> std::string {
    return ref.substr(0, ref.find(':'));
}

// ============================================================================
// SpecRegistry
// ============================================================================

auto SpecRegistry::by_module() const -> std::map<std::string, std::vector<SpecEntry>> {
    std::map<std::string, std::vector<SpecEntry>> result;
    for (const auto& [ref, entry] : specs) {
        result[entry.module].push_back(entry);
    }
    for (auto& [module, entries] : result) {
        std::sort(entries.begin(), entries.end(),
                  [](const SpecEntry& a, const SpecEntry& b) { return a.qualname < b.qualname; });
    }
    return result;
}

auto SpecRegistry::modules() const -> std::set<std::string> {
    std::set<std::string> result;
    for (const auto& [ref, entry] : specs) {
        result.insert(entry.module);
    }
    return result;
}

auto SpecRegistry::add(SpecEntry entry) -> bool {
    SpecRef ref = entry.spec_ref;
    return specs.emplace(std::move(ref), std::move(entry)).second;
}

// ============================================================================
// Manifest Loading
// ============================================================================

auto parse_spec_manifest(const std::string& text, const fs::path& project_root,
                         const std::string& origin) -> Result<SpecRegistry, ConfigError> {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        const auto& err = unwrap_err(parsed);
        return ConfigError{origin, err.line, "invalid JSON: " + err.message};
    }

    const auto& root = unwrap(parsed);
    const auto* specs = root.get("specs");
    if (specs == nullptr || !specs->is_array()) {
        return ConfigError{origin, 0, "expected a top-level \"specs\" array"};
    }

    SpecRegistry registry;
    size_t index = 0;
    for (const auto& item : specs->as_array()) {
        auto entry = parse_entry(item, index, project_root, origin);
        if (is_err(entry)) {
            return unwrap_err(entry);
        }
        SpecRef ref = unwrap(entry).spec_ref;
        if (!registry.add(std::move(unwrap(entry)))) {
            return ConfigError{origin, 0, "duplicate spec ref '" + ref + "'"};
        }
        ++index;
    }

    FORGE_LOG_DEBUG("specs", "Discovered " << registry.specs.size() << " specs in "
                                           << registry.modules().size() << " modules");
    return registry;
}

auto load_spec_manifest(const fs::path& manifest_path, const fs::path& project_root)
    -> Result<SpecRegistry, ConfigError> {
    auto text = read_file(manifest_path);
    if (!text) {
        return ConfigError{manifest_path.string(), 0, "cannot read spec manifest"};
    }
    return parse_spec_manifest(*text, project_root, manifest_path.string());
}

// ============================================================================
// Targets
// ============================================================================

auto resolve_targets(const std::vector<std::string>& targets, const SpecRegistry& registry,
                     const Graph& module_dag) -> Result<std::set<std::string>, ConfigError> {
    std::set<std::string> modules = registry.modules();
    std::set<std::string> roots;

    for (const auto& raw : targets) {
        std::string target(trim(raw));
        if (target.find(':') != std::string::npos) {
            auto ref = normalize_spec_ref(target);
            if (!ref || registry.specs.count(*ref) == 0) {
                return ConfigError{"", 0, "unknown target spec '" + target + "'"};
            }
            roots.insert(spec_ref_module(*ref));
        } else {
            if (modules.count(target) == 0) {
                return ConfigError{"", 0, "unknown target module '" + target + "'"};
            }
            roots.insert(target);
        }
    }
    return dependency_closure(module_dag, roots);
}

} // namespace forge::build
