//! # Digest Service
//!
//! SHA-256 digests over spec content and the spec dependency graph, plus
//! the spec graph construction and its collapse to module granularity.

#include "build/digest.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <set>
#include <sstream>

#include <openssl/evp.h>

namespace forge::build {

namespace {

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

/// Identifiers ([A-Za-z_][A-Za-z0-9_]*) occurring in `source`.
auto identifiers(const std::string& source) -> std::set<std::string> {
    std::set<std::string> result;
    size_t i = 0;
    while (i < source.size()) {
        unsigned char c = static_cast<unsigned char>(source[i]);
        if (std::isalpha(c) || c == '_') {
            size_t start = i;
            while (i < source.size() &&
                   (std::isalnum(static_cast<unsigned char>(source[i])) || source[i] == '_')) {
                ++i;
            }
            result.insert(source.substr(start, i - start));
        } else {
            ++i;
        }
    }
    return result;
}

auto leading_component(const std::string& qualname) -> std::string {
    return qualname.substr(0, qualname.find('.'));
}

class GraphDigester {
public:
    GraphDigester(const std::map<SpecRef, SpecEntry>& specs, const SpecGraph& spec_graph)
        : specs_(specs), spec_graph_(spec_graph) {}

    auto digest(const SpecRef& ref) -> std::string {
        auto memo_it = memo_.find(ref);
        if (memo_it != memo_.end()) {
            return memo_it->second;
        }

        auto spec_it = specs_.find(ref);
        if (spec_it == specs_.end()) {
            return sha256_fields({"missing", ref});
        }

        in_progress_.insert(ref);
        std::vector<std::string> fields{local_digest(spec_it->second)};
        auto graph_it = spec_graph_.find(ref);
        if (graph_it != spec_graph_.end()) {
            // std::set iterates sorted by ref
            for (const auto& dep : graph_it->second) {
                fields.push_back(dep);
                if (in_progress_.count(dep) > 0 || specs_.count(dep) == 0) {
                    continue;
                }
                fields.push_back(digest(dep));
            }
        }
        in_progress_.erase(ref);

        std::string result = sha256_fields(fields);
        memo_[ref] = result;
        return result;
    }

private:
    const std::map<SpecRef, SpecEntry>& specs_;
    const SpecGraph& spec_graph_;
    std::map<SpecRef, std::string> memo_;
    std::set<SpecRef> in_progress_;
};

} // namespace

// ============================================================================
// Hashing
// ============================================================================

auto sha256_hex(std::string_view data) -> std::string {
    EvpContext ctx(EVP_MD_CTX_new());
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        FORGE_LOG_ERROR("build", "SHA-256 computation failed");
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

auto sha256_fields(const std::vector<std::string>& parts) -> std::string {
    std::string joined;
    for (const auto& part : parts) {
        joined += std::to_string(part.size());
        joined += ':';
        joined += part;
    }
    return sha256_hex(joined);
}

// ============================================================================
// Digests
// ============================================================================

auto local_digest(const SpecEntry& entry) -> std::string {
    std::vector<std::string> deps = entry.deps;
    std::sort(deps.begin(), deps.end());

    std::vector<std::string> fields{entry.spec_ref, entry.source, std::to_string(deps.size())};
    fields.insert(fields.end(), deps.begin(), deps.end());
    fields.push_back(entry.prompt);
    return sha256_fields(fields);
}

auto graph_digest(const SpecRef& ref, const std::map<SpecRef, SpecEntry>& specs,
                  const SpecGraph& spec_graph) -> std::string {
    GraphDigester digester(specs, spec_graph);
    return digester.digest(ref);
}

auto module_digest(const std::string& module, const std::vector<SpecEntry>& entries,
                   const std::map<SpecRef, SpecEntry>& specs, const SpecGraph& spec_graph)
    -> std::string {
    GraphDigester digester(specs, spec_graph);

    std::vector<SpecRef> refs;
    refs.reserve(entries.size());
    for (const auto& entry : entries) {
        refs.push_back(entry.spec_ref);
    }
    std::sort(refs.begin(), refs.end());
    refs.erase(std::unique(refs.begin(), refs.end()), refs.end());

    std::vector<std::string> fields{module};
    for (const auto& ref : refs) {
        fields.push_back(ref);
        fields.push_back(digester.digest(ref));
    }
    return sha256_fields(fields);
}

// ============================================================================
// Spec Graph
// ============================================================================

auto build_spec_graph(const SpecRegistry& registry, bool infer_deps) -> SpecGraph {
    std::map<std::string, std::vector<SpecRef>> by_leading_name;
    for (const auto& [ref, entry] : registry.specs) {
        by_leading_name[leading_component(entry.qualname)].push_back(ref);
    }

    SpecGraph graph;
    for (const auto& [ref, entry] : registry.specs) {
        auto& deps = graph[ref];
        deps.insert(entry.deps.begin(), entry.deps.end());

        if (!entry.infer_deps.value_or(infer_deps)) {
            continue;
        }

        std::string own_name = leading_component(entry.qualname);
        for (const auto& ident : identifiers(entry.source)) {
            if (ident == own_name) {
                continue;
            }
            auto it = by_leading_name.find(ident);
            if (it == by_leading_name.end()) {
                continue;
            }
            for (const auto& candidate : it->second) {
                if (candidate != ref) {
                    deps.insert(candidate);
                }
            }
        }
        FORGE_LOG_TRACE("specs", ref << " depends on " << deps.size() << " specs");
    }
    return graph;
}

auto collapse_to_module_dag(const SpecGraph& spec_graph, const SpecRegistry& registry) -> Graph {
    Graph dag;
    for (const auto& module : registry.modules()) {
        dag[module];
    }
    for (const auto& [ref, deps] : spec_graph) {
        std::string module = spec_ref_module(ref);
        for (const auto& dep : deps) {
            std::string dep_module = spec_ref_module(dep);
            if (dep_module != module) {
                dag[module].insert(dep_module);
            }
        }
    }
    return dag;
}

} // namespace forge::build
