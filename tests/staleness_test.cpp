//! # Staleness Tests

#include "build/artifact_writer.hpp"
#include "build/staleness.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace forge;
using namespace forge::build;
using forge::test::TempDir;

TEST(DetectStaleTest, MatchingDigestsAreFresh) {
    std::map<std::string, std::string> computed = {{"a", "111"}, {"b", "222"}};
    std::map<std::string, std::optional<std::string>> on_disk = {{"a", "sha256:111"},
                                                                 {"b", "222"}};

    EXPECT_TRUE(detect_stale(computed, on_disk, false).empty());
}

TEST(DetectStaleTest, MismatchOrMissingIsStale) {
    std::map<std::string, std::string> computed = {{"a", "111"}, {"b", "222"}, {"c", "333"}};
    std::map<std::string, std::optional<std::string>> on_disk = {{"a", "sha256:999"},
                                                                 {"b", std::nullopt}};

    EXPECT_EQ(detect_stale(computed, on_disk, false), (std::set<std::string>{"a", "b", "c"}));
}

TEST(DetectStaleTest, EmptyStoredDigestIsStale) {
    std::map<std::string, std::string> computed = {{"a", "111"}};
    std::map<std::string, std::optional<std::string>> on_disk = {{"a", "sha256:"}};

    EXPECT_EQ(detect_stale(computed, on_disk, false), (std::set<std::string>{"a"}));
}

TEST(DetectStaleTest, ForceMarksEverything) {
    std::map<std::string, std::string> computed = {{"a", "111"}, {"b", "222"}};
    std::map<std::string, std::optional<std::string>> on_disk = {{"a", "111"}, {"b", "222"}};

    EXPECT_EQ(detect_stale(computed, on_disk, true), (std::set<std::string>{"a", "b"}));
}

class StaleModulesTest : public ::testing::Test {
protected:
    void SetUp() override {
        SpecEntry entry;
        entry.spec_ref = "pkg.mod:f";
        entry.module = "pkg.mod";
        entry.qualname = "f";
        entry.source = "def f(): ...";
        registry.add(entry);
        spec_graph = build_spec_graph(registry, false);
        module_specs = registry.by_module();
    }

    std::string digest() const {
        return module_digest("pkg.mod", module_specs.at("pkg.mod"), registry.specs, spec_graph);
    }

    void write_artifact(const std::string& stored_digest) const {
        HeaderFields fields;
        fields.tool_version = "0.3.0";
        fields.kind = "build";
        fields.source_module = "pkg.mod";
        fields.module_digest = stored_digest;
        auto written = write_generated_module(dir.path(), "gen", "pkg.mod", "def f(): ...", fields);
        ASSERT_TRUE(is_ok(written));
    }

    std::set<std::string> stale(bool force = false) const {
        return detect_stale_modules(dir.path(), "gen", module_specs, registry.specs, spec_graph,
                                    force);
    }

    TempDir dir;
    SpecRegistry registry;
    SpecGraph spec_graph;
    std::map<std::string, std::vector<SpecEntry>> module_specs;
};

TEST_F(StaleModulesTest, NoArtifactIsStale) {
    EXPECT_EQ(stale(), (std::set<std::string>{"pkg.mod"}));
}

TEST_F(StaleModulesTest, CurrentArtifactIsFresh) {
    write_artifact(digest());

    EXPECT_EQ(read_stored_digest(dir.path(), "gen", "pkg.mod"), "sha256:" + digest());
    EXPECT_TRUE(stale().empty());
    EXPECT_EQ(stale(true), (std::set<std::string>{"pkg.mod"}));
}

TEST_F(StaleModulesTest, EditedSpecIsStale) {
    write_artifact(digest());

    registry.specs.at("pkg.mod:f").source = "def f(x): ...";
    module_specs = registry.by_module();

    EXPECT_EQ(stale(), (std::set<std::string>{"pkg.mod"}));
}

TEST_F(StaleModulesTest, HandWrittenFileIsStale) {
    dir.write("pkg/gen/mod.py", "def f(): ...\n");

    EXPECT_FALSE(read_stored_digest(dir.path(), "gen", "pkg.mod").has_value());
    EXPECT_EQ(stale(), (std::set<std::string>{"pkg.mod"}));
}
