//! # Watch Tests
//!
//! Tree snapshots, change detection and the rebuild loop driven by a
//! scripted sequence of snapshots.

#include "cli/commands/cmd_watch.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace forge::cli;
using forge::test::TempDir;

namespace {

TreeSnapshot snapshot_of(std::initializer_list<std::pair<const char*, uintmax_t>> files) {
    TreeSnapshot out;
    for (const auto& [path, size] : files) {
        out[fs::path(path)] = FileStamp{fs::file_time_type{}, size};
    }
    return out;
}

/// Replays `script`, repeating its last snapshot once exhausted.
class ScriptedTree {
public:
    explicit ScriptedTree(std::vector<TreeSnapshot> script) : script_(std::move(script)) {}

    TreeSnapshot next() {
        size_t index = std::min(taken_, script_.size() - 1);
        ++taken_;
        return script_[index];
    }

private:
    std::vector<TreeSnapshot> script_;
    size_t taken_ = 0;
};

} // namespace

TEST(SnapshotTreeTest, SkipsGeneratedAndHiddenDirs) {
    TempDir dir;
    dir.write("src/pkg/specs.py", "def f(): ...\n");
    dir.write("src/pkg/__generated__/specs.py", "x = 1\n");
    dir.write("src/.forge/cache/ab.json", "{}");
    dir.write("src/pkg/__pycache__/specs.pyc", "");
    dir.write("forge.toml", "[build]\n");

    auto snapshot = snapshot_tree({dir.path() / "src", dir.path() / "missing"},
                                  {dir.path() / "forge.toml", dir.path() / "absent.json"},
                                  "__generated__");

    std::vector<fs::path> paths;
    for (const auto& [path, stamp] : snapshot) {
        paths.push_back(path);
    }
    EXPECT_EQ(paths, (std::vector<fs::path>{dir.path() / "forge.toml",
                                            dir.path() / "src/pkg/specs.py"}));
    EXPECT_EQ(snapshot.at(dir.path() / "forge.toml").size, 8u);
}

TEST(SnapshotTreeTest, SeesRewrittenFile) {
    TempDir dir;
    dir.write("src/a.py", "a = 1\n");
    auto before = snapshot_tree({dir.path() / "src"}, {}, "__generated__");

    dir.write("src/a.py", "a = 12345\n");
    dir.write("src/b.py", "b = 2\n");
    auto after = snapshot_tree({dir.path() / "src"}, {}, "__generated__");

    EXPECT_EQ(changed_paths(before, after),
              (std::vector<fs::path>{dir.path() / "src/a.py", dir.path() / "src/b.py"}));
}

TEST(ChangedPathsTest, AddedRemovedAndModified) {
    auto before = snapshot_of({{"a.py", 1}, {"b.py", 2}, {"c.py", 3}});
    auto after = snapshot_of({{"a.py", 1}, {"b.py", 5}, {"d.py", 4}});

    EXPECT_EQ(changed_paths(before, after),
              (std::vector<fs::path>{"b.py", "c.py", "d.py"}));
    EXPECT_TRUE(changed_paths(before, before).empty());
}

TEST(WatchLoopTest, RebuildsOnceChangesSettle) {
    auto s0 = snapshot_of({{"a.py", 1}});
    auto s1 = snapshot_of({{"a.py", 2}});
    ScriptedTree tree({s0, s0, s1, s1});
    int builds = 0;
    std::vector<std::vector<fs::path>> changes;

    WatchLoop loop;
    loop.interval = std::chrono::milliseconds(1);
    loop.snapshot = [&tree] { return tree.next(); };
    loop.run_cycle = [&builds] {
        ++builds;
        return 0;
    };
    loop.should_stop = [&builds] { return builds >= 2; };
    loop.on_change = [&changes](const std::vector<fs::path>& changed) {
        changes.push_back(changed);
    };

    EXPECT_EQ(run_watch_loop(loop), 2);
    EXPECT_EQ(builds, 2);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0], (std::vector<fs::path>{"a.py"}));
}

TEST(WatchLoopTest, BurstOfSavesIsOneRebuild) {
    auto s0 = snapshot_of({{"a.py", 1}});
    auto s1 = snapshot_of({{"a.py", 2}});
    auto s2 = snapshot_of({{"a.py", 3}, {"b.py", 1}});
    ScriptedTree tree({s0, s1, s2, s2});
    int builds = 0;
    int notified = 0;
    std::vector<fs::path> last_change;

    WatchLoop loop;
    loop.interval = std::chrono::milliseconds(1);
    loop.snapshot = [&tree] { return tree.next(); };
    loop.run_cycle = [&builds] {
        ++builds;
        return 0;
    };
    loop.should_stop = [&builds] { return builds >= 2; };
    loop.on_change = [&](const std::vector<fs::path>& changed) {
        ++notified;
        last_change = changed;
    };

    EXPECT_EQ(run_watch_loop(loop), 2);
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(last_change, (std::vector<fs::path>{"a.py", "b.py"}));
}

TEST(WatchLoopTest, StopsWithoutChanges) {
    auto s0 = snapshot_of({{"a.py", 1}});
    ScriptedTree tree({s0});
    int builds = 0;
    int polls = 0;

    WatchLoop loop;
    loop.interval = std::chrono::milliseconds(1);
    loop.snapshot = [&] {
        ++polls;
        return tree.next();
    };
    loop.run_cycle = [&builds] {
        ++builds;
        return 0;
    };
    loop.should_stop = [&polls] { return polls >= 5; };

    EXPECT_EQ(run_watch_loop(loop), 1);
    EXPECT_EQ(builds, 1);
}
