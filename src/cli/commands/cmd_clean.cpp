#include "cmd_clean.hpp"

#include "cli/utils.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace forge::cli {

std::vector<fs::path> find_generated_dirs(const std::vector<fs::path>& roots,
                                          const std::string& generated_dir) {
    std::set<fs::path> found;
    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            continue;
        }
        for (auto it = fs::recursive_directory_iterator(root, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_directory(ec) || it->is_symlink(ec)) {
                continue;
            }
            if (it->path().filename() == generated_dir) {
                found.insert(it->path());
                it.disable_recursion_pending();
            }
        }
        if (ec) {
            FORGE_LOG_WARN("cli", "Error scanning " << root.string() << ": " << ec.message());
        }
    }
    return {found.begin(), found.end()};
}

int run_clean_command(const CommandOptions& options) {
    auto loaded = load_config(options);
    if (is_err(loaded)) {
        return report_command_error("clean", options.json, unwrap_err(loaded).to_string(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }
    const auto& config = unwrap(loaded);

    auto found = find_generated_dirs(config.source_root_paths(), config.paths.generated_dir);
    std::vector<std::string> paths;
    for (const auto& dir : found) {
        paths.push_back(dir.string());
    }

    if (options.dry_run) {
        if (options.json) {
            json::JsonValue doc = json::json_object();
            doc.set("command", json::JsonValue("clean"));
            doc.set("ok", json::JsonValue(true));
            doc.set("dry_run", json::JsonValue(true));
            doc.set("would_remove", json::json_string_array(paths));
            emit_json(doc);
        } else {
            for (const auto& path : paths) {
                std::cout << "would remove " << path << "\n";
            }
        }
        return EXIT_OK;
    }

    std::vector<std::string> removed;
    for (const auto& dir : found) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            return report_command_error("clean", options.json,
                                        "Failed to remove " + dir.string() + ": " + ec.message(),
                                        EXIT_CONFIG_OR_DISCOVERY);
        }
        FORGE_LOG_INFO("cli", "Removed " << dir.string());
        removed.push_back(dir.string());
    }

    if (options.json) {
        json::JsonValue doc = json::json_object();
        doc.set("command", json::JsonValue("clean"));
        doc.set("ok", json::JsonValue(true));
        doc.set("removed", json::json_string_array(removed));
        emit_json(doc);
    } else {
        std::cout << "Removed " << removed.size() << " generated director"
                  << (removed.size() == 1 ? "y" : "ies") << ".\n";
    }
    return EXIT_OK;
}

} // namespace forge::cli
