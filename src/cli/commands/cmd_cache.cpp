//! # Cache Management Command
//!
//! This file implements `forge cache` for the response cache kept under
//! `<root>/.forge/cache`.
//!
//! ## Subcommands
//!
//! | Command       | Description                           |
//! |---------------|---------------------------------------|
//! | `cache info`  | Show entry count, size and location   |
//! | `cache clear` | Remove all cache entries              |

#include "cmd_cache.hpp"

#include "build/response_cache.hpp"
#include "cli/utils.hpp"

#include <iostream>

namespace forge::cli {

int run_cache_command(const CommandOptions& options) {
    auto loaded = load_config(options);
    if (is_err(loaded)) {
        return report_command_error("cache", options.json, unwrap_err(loaded).to_string(),
                                    EXIT_CONFIG_OR_DISCOVERY);
    }
    build::ResponseCache cache(cache_dir_for(unwrap(loaded)));

    if (options.subcommand == "info") {
        auto info = cache.info();
        if (options.json) {
            json::JsonValue doc = json::json_object();
            doc.set("command", json::JsonValue("cache info"));
            doc.set("ok", json::JsonValue(true));
            doc.set("path", json::JsonValue(info.path.string()));
            doc.set("entries", json::JsonValue(static_cast<int64_t>(info.entries)));
            doc.set("size_bytes", json::JsonValue(static_cast<int64_t>(info.size_bytes)));
            emit_json(doc);
        } else {
            std::cout << "Cache directory: " << info.path.string() << "\n";
            std::cout << "Entries: " << info.entries << "\n";
            std::cout << "Size: " << format_size(info.size_bytes) << "\n";
        }
        return EXIT_OK;
    }

    if (options.subcommand == "clear") {
        size_t count = cache.clear_all();
        if (options.json) {
            json::JsonValue doc = json::json_object();
            doc.set("command", json::JsonValue("cache clear"));
            doc.set("ok", json::JsonValue(true));
            doc.set("removed", json::JsonValue(static_cast<int64_t>(count)));
            emit_json(doc);
        } else {
            std::cout << "Cleared " << count << " cache entries.\n";
        }
        return EXIT_OK;
    }

    return report_command_error("cache", options.json,
                                options.subcommand.empty()
                                    ? std::string("Usage: forge cache info|clear")
                                    : "Unknown cache subcommand '" + options.subcommand + "'",
                                EXIT_CONFIG_OR_DISCOVERY);
}

} // namespace forge::cli
