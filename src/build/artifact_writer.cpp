//! # Artifact Writer
//!
//! Path mapping for generated modules and the atomic write used for both
//! artifacts and cache entries.

#include "build/artifact_writer.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace forge::build {

namespace {

constexpr const char* AGENT_DOCS_FILE = "AGENTS.md";
constexpr const char* AGENT_DOCS_LINK = "CLAUDE.md";

constexpr const char* AGENT_DOCS_TEXT = R"(# Generated Code: Do Not Edit

Every module in this directory is written by `forge build` from the specs in
the parent package. Manual edits are overwritten on the next build, and an
edited file no longer matches its digest header, so forge regenerates it.

To change behaviour:

1. Edit the spec (its stub, docstring or prompt) in the parent package.
2. Run `forge build` (or `forge build --target <module>`).

Use `forge status` to see which modules are stale.
)";

auto split_module(const std::string& module) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = module.find('.', start);
        parts.push_back(module.substr(start, dot == std::string::npos ? dot : dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return parts;
}

auto rstrip(const std::string& s) -> std::string {
    size_t end = s.size();
    while (end > 0 && (s[end - 1] == ' ' || s[end - 1] == '\n' || s[end - 1] == '\t' ||
                       s[end - 1] == '\r')) {
        --end;
    }
    return s.substr(0, end);
}

/// True if `path` is `root` or lies beneath it (both already normalized).
auto is_within(const fs::path& root, const fs::path& path) -> bool {
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it) {
        // A trailing empty element comes from a trailing separator
        if (root_it->empty()) {
            continue;
        }
        if (path_it == path.end() || *root_it != *path_it) {
            return false;
        }
    }
    return true;
}

auto ensure_init_files(const fs::path& package_dir, const fs::path& relpath)
    -> std::optional<WriteError> {
    fs::path dir = package_dir;
    for (const auto& part : relpath.parent_path()) {
        dir /= part;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return WriteError{dir.string(), "cannot create directory: " + ec.message()};
        }
        fs::path init = dir / "__init__.py";
        if (!fs::exists(init, ec)) {
            std::ofstream out(init);
            if (!out) {
                return WriteError{init.string(), "cannot create package marker"};
            }
        }
    }
    return std::nullopt;
}

} // namespace

auto spec_module_to_generated_module(const std::string& module, const std::string& generated_dir)
    -> std::string {
    size_t dot = module.rfind('.');
    if (dot == std::string::npos) {
        return generated_dir + "." + module;
    }
    return module.substr(0, dot) + "." + generated_dir + module.substr(dot);
}

auto generated_module_to_relpath(const std::string& generated_module) -> fs::path {
    std::string rel;
    for (char c : generated_module) {
        rel += c == '.' ? '/' : c;
    }
    return fs::path(rel + ".py");
}

auto generated_relpath(const std::string& module, const std::string& generated_dir) -> fs::path {
    return generated_module_to_relpath(spec_module_to_generated_module(module, generated_dir));
}

auto ensure_agent_docs(const fs::path& generated_root) -> std::optional<WriteError> {
    std::error_code ec;
    if (!fs::is_directory(generated_root, ec)) {
        return std::nullopt;
    }

    fs::path docs = generated_root / AGENT_DOCS_FILE;
    if (!fs::exists(docs, ec)) {
        if (auto err = atomic_write_file(docs, AGENT_DOCS_TEXT)) {
            return err;
        }
    }

    fs::path link = generated_root / AGENT_DOCS_LINK;
    if (!fs::exists(fs::symlink_status(link, ec))) {
        fs::create_symlink(AGENT_DOCS_FILE, link, ec);
        if (ec) {
            return WriteError{link.string(), "cannot create symlink: " + ec.message()};
        }
    }
    return std::nullopt;
}

auto atomic_write_file(const fs::path& path, const std::string& content)
    -> std::optional<WriteError> {
    std::string tmpl = (path.parent_path() / ".forge-tmp-XXXXXX").string();
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = mkstemp(name.data());
    if (fd < 0) {
        return WriteError{path.string(), std::string("cannot create temp file: ") +
                                             std::strerror(errno)};
    }
    std::string tmp_path(name.data());

    auto fail = [&](const std::string& what) {
        int saved = errno;
        ::unlink(tmp_path.c_str());
        return WriteError{path.string(), what + ": " + std::strerror(saved)};
    };

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto err = fail("write failed");
            ::close(fd);
            return err;
        }
        written += static_cast<size_t>(n);
    }

    // mkstemp creates 0600; artifacts are ordinary source files
    if (::fchmod(fd, 0644) != 0) {
        FORGE_LOG_DEBUG("build", "fchmod failed for " << tmp_path << ": " << std::strerror(errno));
    }

    if (::fsync(fd) != 0) {
        auto err = fail("fsync failed");
        ::close(fd);
        return err;
    }
    if (::close(fd) != 0) {
        return fail("close failed");
    }
    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        return fail("rename failed");
    }
    return std::nullopt;
}

auto write_generated_module(const fs::path& package_dir, const std::string& generated_dir,
                            const std::string& module, const std::string& source,
                            const HeaderFields& header) -> Result<fs::path, WriteError> {
    for (const auto& part : split_module(module)) {
        if (part.empty()) {
            return WriteError{module, "Invalid module name."};
        }
    }

    fs::path relpath = generated_relpath(module, generated_dir);
    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::absolute(package_dir), ec).lexically_normal();
    if (ec) {
        return WriteError{package_dir.string(), "cannot resolve package dir: " + ec.message()};
    }
    fs::path out_path = fs::weakly_canonical(root / relpath, ec).lexically_normal();
    if (ec || relpath.is_absolute() || out_path == root || !is_within(root, out_path)) {
        return WriteError{(root / relpath).string(), "Refusing to write outside package_dir."};
    }

    if (auto err = ensure_init_files(root, relpath)) {
        return *err;
    }

    for (fs::path dir = out_path.parent_path(); dir != root && dir.has_relative_path();
         dir = dir.parent_path()) {
        if (dir.filename() == generated_dir) {
            if (auto err = ensure_agent_docs(dir)) {
                FORGE_LOG_WARN("build", "Cannot write agent docs: " << err->message);
            }
            break;
        }
    }

    std::string content = format_header(header) + "\n" + rstrip(source) + "\n";
    if (auto err = atomic_write_file(out_path, content)) {
        FORGE_LOG_WARN("build", "Failed to write " << out_path.string() << ": " << err->message);
        return *err;
    }

    FORGE_LOG_DEBUG("build", "Wrote " << out_path.string());
    return out_path;
}

auto read_generated_module(const fs::path& package_dir, const std::string& generated_dir,
                           const std::string& module) -> std::optional<std::string> {
    fs::path path = package_dir / generated_relpath(module, generated_dir);
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

} // namespace forge::build
