//! # Digest Tests
//!
//! SHA-256 helpers, local/graph/module digests and the spec graph.

#include "build/digest.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace forge::build;

namespace {

SpecEntry make_entry(const std::string& module, const std::string& qualname,
                     const std::string& source, std::vector<SpecRef> deps = {}) {
    SpecEntry entry;
    entry.module = module;
    entry.qualname = qualname;
    entry.spec_ref = module + ":" + qualname;
    entry.source = source;
    entry.deps = std::move(deps);
    return entry;
}

bool is_hex64(const std::string& s) {
    return s.size() == 64 && s.find_first_not_of("0123456789abcdef") == std::string::npos;
}

} // namespace

// ============================================================================
// SHA-256
// ============================================================================

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, FieldsAreSeparated) {
    EXPECT_NE(sha256_fields({"ab", "c"}), sha256_fields({"a", "bc"}));
    EXPECT_EQ(sha256_fields({"abc"}), sha256_hex("3:abc"));
    EXPECT_NE(sha256_fields({std::string("a\0b", 3)}), sha256_fields({"a", "b"}));
    EXPECT_NE(sha256_fields({"", ""}), sha256_fields({""}));
}

// ============================================================================
// Digests
// ============================================================================

class DigestTest : public ::testing::Test {
protected:
    void SetUp() override {
        add(make_entry("pkg.b", "helper", "def helper(): ..."));
        add(make_entry("pkg.a", "Widget", "class Widget: ...", {"pkg.b:helper"}));
        add(make_entry("pkg.a", "make", "def make(): ..."));
    }

    void add(const SpecEntry& entry) {
        registry.add(entry);
    }

    SpecGraph graph() const {
        return build_spec_graph(registry, false);
    }

    SpecRegistry registry;
};

TEST_F(DigestTest, LocalDigestIsHexAndDeterministic) {
    const auto& entry = registry.specs.at("pkg.a:Widget");

    EXPECT_TRUE(is_hex64(local_digest(entry)));
    EXPECT_EQ(local_digest(entry), local_digest(entry));
}

TEST_F(DigestTest, LocalDigestIgnoresDepOrder) {
    auto first = make_entry("m", "f", "def f(): ...", {"x:a", "y:b"});
    auto second = make_entry("m", "f", "def f(): ...", {"y:b", "x:a"});

    EXPECT_EQ(local_digest(first), local_digest(second));
}

TEST_F(DigestTest, LocalDigestCoversPrompt) {
    auto plain = make_entry("m", "f", "def f(): ...");
    auto guided = plain;
    guided.prompt = "use a dict";

    EXPECT_NE(local_digest(plain), local_digest(guided));
}

TEST_F(DigestTest, GraphDigestChangesWithDependencySource) {
    auto before = graph_digest("pkg.a:Widget", registry.specs, graph());

    registry.specs.at("pkg.b:helper").source = "def helper(x): ...";
    auto after = graph_digest("pkg.a:Widget", registry.specs, graph());

    EXPECT_TRUE(is_hex64(before));
    EXPECT_NE(before, after);
}

TEST_F(DigestTest, ModuleDigestIndependentOfEntryOrder) {
    auto entries = registry.by_module().at("pkg.a");
    auto forward = module_digest("pkg.a", entries, registry.specs, graph());

    std::reverse(entries.begin(), entries.end());
    auto reversed = module_digest("pkg.a", entries, registry.specs, graph());

    EXPECT_EQ(forward, reversed);
}

TEST_F(DigestTest, ModuleDigestChangesWithDependencyModule) {
    auto entries = registry.by_module().at("pkg.a");
    auto before = module_digest("pkg.a", entries, registry.specs, graph());

    registry.specs.at("pkg.b:helper").source = "def helper(): return 1";
    auto after = module_digest("pkg.a", entries, registry.specs, graph());

    EXPECT_NE(before, after);
}

TEST_F(DigestTest, UnknownDependencyContributesRefOnly) {
    auto lonely = make_entry("m", "f", "def f(): ...", {"gone:thing"});
    SpecRegistry reg;
    reg.add(lonely);
    auto spec_graph = build_spec_graph(reg, false);

    auto digest = graph_digest("m:f", reg.specs, spec_graph);

    EXPECT_TRUE(is_hex64(digest));
    EXPECT_EQ(digest, graph_digest("m:f", reg.specs, spec_graph));
}

TEST_F(DigestTest, CyclicGraphTerminates) {
    SpecRegistry reg;
    reg.add(make_entry("m", "a", "def a(): ...", {"n:b"}));
    reg.add(make_entry("n", "b", "def b(): ...", {"m:a"}));
    auto spec_graph = build_spec_graph(reg, false);

    EXPECT_TRUE(is_hex64(graph_digest("m:a", reg.specs, spec_graph)));
}

// ============================================================================
// Spec Graph
// ============================================================================

TEST_F(DigestTest, ExplicitDepsOnly) {
    auto spec_graph = graph();

    EXPECT_EQ(spec_graph.at("pkg.a:Widget"), (std::set<SpecRef>{"pkg.b:helper"}));
    EXPECT_TRUE(spec_graph.at("pkg.a:make").empty());
    EXPECT_TRUE(spec_graph.at("pkg.b:helper").empty());
}

TEST_F(DigestTest, InferredDepsFromIdentifiers) {
    registry.specs.at("pkg.a:make").source = "def make() -> Widget:\n    return helper()\n";

    auto spec_graph = build_spec_graph(registry, true);

    EXPECT_EQ(spec_graph.at("pkg.a:make"),
              (std::set<SpecRef>{"pkg.a:Widget", "pkg.b:helper"}));
}

TEST_F(DigestTest, PerSpecInferenceOverride) {
    registry.specs.at("pkg.a:make").source = "def make() -> Widget: ...";
    registry.specs.at("pkg.a:make").infer_deps = false;

    auto spec_graph = build_spec_graph(registry, true);

    EXPECT_TRUE(spec_graph.at("pkg.a:make").empty());
}

TEST_F(DigestTest, CollapseToModuleDag) {
    auto dag = collapse_to_module_dag(graph(), registry);

    EXPECT_EQ(dag, (Graph{{"pkg.a", {"pkg.b"}}, {"pkg.b", {}}}));
}

TEST_F(DigestTest, CollapseDropsSelfEdges) {
    registry.specs.at("pkg.a:make").deps = {"pkg.a:Widget"};

    auto dag = collapse_to_module_dag(graph(), registry);

    EXPECT_EQ(dag.at("pkg.a"), (std::set<std::string>{"pkg.b"}));
}
