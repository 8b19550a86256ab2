#include "cmd_watch.hpp"

#include "cli/utils.hpp"
#include "cmd_build.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <set>
#include <thread>
#include <utility>

namespace forge::cli {

namespace {

constexpr std::chrono::milliseconds STOP_POLL{50};

volatile std::sig_atomic_t stop_requested = 0;

void request_stop(int) {
    stop_requested = 1;
}

/// Installs SIGINT/SIGTERM handlers for the lifetime of the object.
class StopSignals {
public:
    StopSignals() {
        stop_requested = 0;
        struct sigaction action {};
        action.sa_handler = request_stop;
        sigemptyset(&action.sa_mask);
        if (sigaction(SIGINT, &action, &old_int_) != 0 ||
            sigaction(SIGTERM, &action, &old_term_) != 0) {
            FORGE_LOG_WARN("cli", "Cannot install stop handlers: " << std::strerror(errno));
        }
    }

    ~StopSignals() {
        sigaction(SIGINT, &old_int_, nullptr);
        sigaction(SIGTERM, &old_term_, nullptr);
    }

    StopSignals(const StopSignals&) = delete;
    StopSignals& operator=(const StopSignals&) = delete;

private:
    struct sigaction old_int_ {};
    struct sigaction old_term_ {};
};

/// Sleeps for `interval` in short slices; false if asked to stop meanwhile.
bool wait_interval(const WatchLoop& loop) {
    auto remaining = loop.interval;
    while (remaining.count() > 0) {
        if (loop.should_stop()) {
            return false;
        }
        auto slice = std::min(remaining, STOP_POLL);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return !loop.should_stop();
}

void stamp_file(const fs::path& path, TreeSnapshot& out) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return;
    }
    FileStamp stamp;
    stamp.mtime = fs::last_write_time(path, ec);
    if (ec) {
        return;
    }
    stamp.size = fs::file_size(path, ec);
    if (ec) {
        return;
    }
    out[path] = stamp;
}

} // namespace

TreeSnapshot snapshot_tree(const std::vector<fs::path>& roots, const std::vector<fs::path>& files,
                           const std::string& generated_dir) {
    TreeSnapshot snapshot;
    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            continue;
        }
        for (auto it = fs::recursive_directory_iterator(root, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (it->is_directory(ec)) {
                if (name == generated_dir || name.starts_with(".") || name == "__pycache__") {
                    it.disable_recursion_pending();
                }
                continue;
            }
            stamp_file(it->path(), snapshot);
        }
        if (ec) {
            FORGE_LOG_DEBUG("cli", "Error scanning " << root.string() << ": " << ec.message());
        }
    }
    for (const auto& file : files) {
        stamp_file(file, snapshot);
    }
    return snapshot;
}

std::vector<fs::path> changed_paths(const TreeSnapshot& before, const TreeSnapshot& after) {
    std::set<fs::path> changed;
    for (const auto& [path, stamp] : after) {
        auto it = before.find(path);
        if (it == before.end() || !(it->second == stamp)) {
            changed.insert(path);
        }
    }
    for (const auto& [path, stamp] : before) {
        if (after.count(path) == 0) {
            changed.insert(path);
        }
    }
    return {changed.begin(), changed.end()};
}

int run_watch_loop(const WatchLoop& loop) {
    TreeSnapshot last = loop.snapshot();
    loop.run_cycle();
    int cycles = 1;

    while (wait_interval(loop)) {
        TreeSnapshot current = loop.snapshot();
        auto changed = changed_paths(last, current);
        if (changed.empty()) {
            continue;
        }

        // Let a burst of saves settle before building
        bool stopped = false;
        while (true) {
            if (!wait_interval(loop)) {
                stopped = true;
                break;
            }
            TreeSnapshot again = loop.snapshot();
            if (again == current) {
                break;
            }
            current = std::move(again);
        }
        if (stopped) {
            break;
        }

        changed = changed_paths(last, current);
        last = std::move(current);
        if (changed.empty()) {
            continue;
        }
        if (loop.on_change) {
            loop.on_change(changed);
        }
        loop.run_cycle();
        ++cycles;
    }
    return cycles;
}

int run_watch_command(const CommandOptions& options) {
    auto loaded = load_config(options);
    if (is_err(loaded)) {
        return report_command_error("watch", options.json, unwrap_err(loaded).to_string(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }
    const auto& config = unwrap(loaded);

    std::vector<fs::path> roots;
    for (const auto& root : config.source_root_paths()) {
        std::error_code ec;
        if (fs::is_directory(root, ec)) {
            roots.push_back(root);
        }
    }
    if (roots.empty()) {
        return report_command_error("watch", options.json, "No existing source roots to watch.",
                                    EXIT_CONFIG_OR_DISCOVERY);
    }

    std::vector<fs::path> files{config.config_path, config.manifest_path()};
    for (const auto& name : config.build.guidance_files) {
        files.push_back(config.root / name);
    }
    const std::string generated_dir = config.paths.generated_dir;

    StopSignals signals;

    WatchLoop loop;
    loop.snapshot = [&] { return snapshot_tree(roots, files, generated_dir); };
    loop.should_stop = [] { return stop_requested != 0; };
    loop.run_cycle = [&options] {
        int rc = run_build_command(options);
        FORGE_LOG_INFO("cli", "Watch cycle finished with exit code " << rc);
        return rc;
    };
    loop.on_change = [&options](const std::vector<fs::path>& changed) {
        FORGE_LOG_INFO("cli", changed.size() << " file(s) changed, first "
                                              << changed.front().string());
        if (!options.json) {
            std::cerr << "[watch] " << changed.size() << " file(s) changed; rebuilding\n";
        }
    };

    if (!options.json) {
        std::cerr << "[watch] watching " << roots.size() << " director"
                  << (roots.size() == 1 ? "y" : "ies") << "... (Ctrl+C to stop)\n";
    }
    int cycles = run_watch_loop(loop);
    if (!options.json) {
        std::cerr << "[watch] stopped after " << cycles << " build(s).\n";
    }
    return EXIT_OK;
}

} // namespace forge::cli
