//! # Spec Discovery Tests
//!
//! Spec-ref normalization, manifest parsing and `--target` resolution.

#include "build/spec.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace forge;
using namespace forge::build;
using forge::test::TempDir;

// ============================================================================
// Spec Refs
// ============================================================================

TEST(SpecRefTest, Normalize) {
    EXPECT_EQ(normalize_spec_ref("pkg.a:Foo"), "pkg.a:Foo");
    EXPECT_EQ(normalize_spec_ref("  pkg.a : Foo.bar "), "pkg.a:Foo.bar");
    EXPECT_FALSE(normalize_spec_ref("pkg.a").has_value());
    EXPECT_FALSE(normalize_spec_ref(":Foo").has_value());
    EXPECT_FALSE(normalize_spec_ref("pkg.a:").has_value());
    EXPECT_FALSE(normalize_spec_ref("a:b:c").has_value());
}

TEST(SpecRefTest, ModulePart) {
    EXPECT_EQ(spec_ref_module("pkg.sub.mod:Thing"), "pkg.sub.mod");
}

// ============================================================================
// Manifest Parsing
// ============================================================================

class SpecManifestTest : public ::testing::Test {
protected:
    TempDir dir{"forge-spec"};

    Result<SpecRegistry, ConfigError> parse(const std::string& text) {
        return parse_spec_manifest(text, dir.path(), "forge-specs.json");
    }
};

TEST_F(SpecManifestTest, InlineSources) {
    auto result = parse(R"({"specs": [
        {"module": "pkg.b", "qualname": "helper", "source": "def helper(): ..."},
        {"module": "pkg.a", "qualname": "Widget", "source": "class Widget: ...",
         "deps": ["pkg.b:helper", " pkg.b : helper "], "prompt": "keep it small"}
    ]})");

    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& registry = unwrap(result);
    ASSERT_EQ(registry.specs.size(), 2u);

    const auto& widget = registry.specs.at("pkg.a:Widget");
    EXPECT_EQ(widget.module, "pkg.a");
    EXPECT_EQ(widget.qualname, "Widget");
    EXPECT_EQ(widget.source, "class Widget: ...");
    EXPECT_EQ(widget.deps, (std::vector<SpecRef>{"pkg.b:helper"}));
    EXPECT_EQ(widget.prompt, "keep it small");
    EXPECT_FALSE(widget.infer_deps.has_value());

    EXPECT_EQ(registry.modules(), (std::set<std::string>{"pkg.a", "pkg.b"}));
}

TEST_F(SpecManifestTest, SourceFileWithLineRange) {
    dir.write("src/pkg/a.py", "import x\n\ndef f():\n    ...\n\ndef g():\n    ...\n");

    auto result = parse(R"({"specs": [
        {"module": "pkg.a", "qualname": "f", "source_file": "src/pkg/a.py",
         "start_line": 3, "end_line": 4}
    ]})");

    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& entry = unwrap(result).specs.at("pkg.a:f");
    EXPECT_EQ(entry.source, "def f():\n    ...\n");
    EXPECT_EQ(entry.source_file, "src/pkg/a.py");
}

TEST_F(SpecManifestTest, ByModuleSortsByQualname) {
    auto result = parse(R"({"specs": [
        {"module": "m", "qualname": "zeta", "source": "def zeta(): ..."},
        {"module": "m", "qualname": "Alpha", "source": "class Alpha: ..."},
        {"module": "m", "qualname": "beta", "source": "def beta(): ..."}
    ]})");

    ASSERT_TRUE(is_ok(result));
    auto by_module = unwrap(result).by_module();
    ASSERT_EQ(by_module["m"].size(), 3u);
    EXPECT_EQ(by_module["m"][0].qualname, "Alpha");
    EXPECT_EQ(by_module["m"][1].qualname, "beta");
    EXPECT_EQ(by_module["m"][2].qualname, "zeta");
}

TEST_F(SpecManifestTest, DuplicateRefIsAnError) {
    auto result = parse(R"({"specs": [
        {"module": "m", "qualname": "f", "source": "def f(): ..."},
        {"module": "m", "qualname": "f", "source": "def f(): pass"}
    ]})");

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("duplicate spec ref 'm:f'"), std::string::npos);
}

TEST_F(SpecManifestTest, MalformedDependencyIsAnError) {
    auto result = parse(R"({"specs": [
        {"module": "m", "qualname": "f", "source": "def f(): ...", "deps": ["no_colon"]}
    ]})");

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("specs[0]"), std::string::npos);
}

TEST_F(SpecManifestTest, MissingSourceFileIsAnError) {
    auto result = parse(R"({"specs": [
        {"module": "m", "qualname": "f", "source_file": "src/missing.py"}
    ]})");

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("cannot read source file"), std::string::npos);
}

TEST_F(SpecManifestTest, InvalidJsonReportsLine) {
    auto result = parse("{\n\"specs\": [\n}");

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).line, 3u);
    EXPECT_EQ(unwrap_err(result).path, "forge-specs.json");
}

TEST_F(SpecManifestTest, LoadFromDisk) {
    dir.write("forge-specs.json",
              R"({"specs": [{"module": "m", "qualname": "f", "source": "def f(): ..."}]})");

    auto result = load_spec_manifest(dir.path() / "forge-specs.json", dir.path());

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).specs.size(), 1u);
    EXPECT_TRUE(is_err(load_spec_manifest(dir.path() / "nope.json", dir.path())));
}

// ============================================================================
// Targets
// ============================================================================

class ResolveTargetsTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto& [module, qualname] :
             std::vector<std::pair<std::string, std::string>>{
                 {"a", "A"}, {"b", "B"}, {"c", "C"}, {"d", "D"}}) {
            SpecEntry entry;
            entry.module = module;
            entry.qualname = qualname;
            entry.spec_ref = module + ":" + qualname;
            entry.source = "class " + qualname + ": ...";
            registry.add(entry);
        }
    }

    SpecRegistry registry;
    Graph dag{{"a", {}}, {"b", {"a"}}, {"c", {"b"}}, {"d", {}}};
};

TEST_F(ResolveTargetsTest, ModuleTargetIncludesDependencies) {
    auto result = resolve_targets({"c"}, registry, dag);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::set<std::string>{"a", "b", "c"}));
}

TEST_F(ResolveTargetsTest, SpecRefTargetUsesItsModule) {
    auto result = resolve_targets({"b:B", "d"}, registry, dag);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), (std::set<std::string>{"a", "b", "d"}));
}

TEST_F(ResolveTargetsTest, UnknownTargetIsAnError) {
    EXPECT_TRUE(is_err(resolve_targets({"zzz"}, registry, dag)));
    EXPECT_TRUE(is_err(resolve_targets({"a:Missing"}, registry, dag)));
}
