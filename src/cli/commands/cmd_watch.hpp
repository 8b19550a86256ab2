//! # Watch Command Interface
//!
//! `forge watch` runs a build, then polls the source roots, the spec
//! manifest and the config and rebuilds whenever one of them changes. It
//! stops on SIGINT or SIGTERM.
//!
//! ## Change Detection
//!
//! Files are compared by modification time and size. Generated directories
//! and dot-directories (`.forge`, `.git`) are not scanned, so a build never
//! triggers another build through its own output.

#pragma once

#include "cli/project.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace forge::cli {

struct FileStamp {
    fs::file_time_type mtime;
    uintmax_t size = 0;

    bool operator==(const FileStamp& other) const {
        return mtime == other.mtime && size == other.size;
    }
};

using TreeSnapshot = std::map<fs::path, FileStamp>;

/// Stamps of every regular file under `roots` plus the listed `files`.
TreeSnapshot snapshot_tree(const std::vector<fs::path>& roots, const std::vector<fs::path>& files,
                           const std::string& generated_dir);

/// Added, removed or modified paths, sorted.
std::vector<fs::path> changed_paths(const TreeSnapshot& before, const TreeSnapshot& after);

struct WatchLoop {
    std::function<TreeSnapshot()> snapshot;
    std::function<int()> run_cycle;
    std::function<bool()> should_stop;
    std::function<void(const std::vector<fs::path>&)> on_change; ///< Optional
    std::chrono::milliseconds interval{500};
};

/// Runs one cycle, then one more per detected change until `should_stop`.
/// Returns the number of cycles run.
int run_watch_loop(const WatchLoop& loop);

int run_watch_command(const CommandOptions& options);

} // namespace forge::cli
