#include "build/header.hpp"

#include "json/json_parser.hpp"

namespace forge::build {

auto format_header(const HeaderFields& fields) -> std::string {
    std::string digest = fields.module_digest;
    if (!digest.starts_with("sha256:")) {
        digest = "sha256:" + digest;
    }

    std::string out = HEADER_BANNER;
    auto field = [&out](std::string_view key, const std::string& value) {
        out += '\n';
        out += HEADER_FIELD_PREFIX;
        out += key;
        out += '=';
        out += value;
    };
    field("tool_version", fields.tool_version);
    field("kind", fields.kind);
    field("source_module", fields.source_module);
    field("module_digest", digest);
    field("spec_refs", json::json_string_array(fields.spec_refs).to_string());
    return out;
}

auto parse_header(std::string_view text) -> std::optional<HeaderFields> {
    size_t pos = 0;
    auto next_line = [&]() -> std::optional<std::string_view> {
        if (pos >= text.size()) {
            return std::nullopt;
        }
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return line;
    };

    auto first = next_line();
    if (!first || *first != HEADER_BANNER) {
        return std::nullopt;
    }

    HeaderFields fields;
    std::string_view prefix = HEADER_FIELD_PREFIX;
    while (auto line = next_line()) {
        if (!line->starts_with(prefix)) {
            break;
        }
        std::string_view body = line->substr(prefix.size());
        size_t eq = body.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        std::string_view key = body.substr(0, eq);
        std::string value(body.substr(eq + 1));

        if (key == "tool_version") {
            fields.tool_version = value;
        } else if (key == "kind") {
            fields.kind = value;
        } else if (key == "source_module") {
            fields.source_module = value;
        } else if (key == "module_digest") {
            fields.module_digest = value;
        } else if (key == "spec_refs") {
            auto parsed = json::parse_json(value);
            if (is_ok(parsed) && unwrap(parsed).is_array()) {
                for (const auto& ref : unwrap(parsed).as_array()) {
                    if (ref.is_string()) {
                        fields.spec_refs.push_back(ref.as_string());
                    }
                }
            }
        }
    }
    return fields;
}

auto extract_module_digest(std::string_view text) -> std::optional<std::string> {
    auto fields = parse_header(text);
    if (!fields || fields->module_digest.empty()) {
        return std::nullopt;
    }
    return fields->module_digest;
}

auto normalize_digest(std::optional<std::string> digest) -> std::optional<std::string> {
    if (!digest || digest->empty()) {
        return std::nullopt;
    }
    if (digest->starts_with("sha256:")) {
        std::string hex = digest->substr(7);
        if (hex.empty()) {
            return std::nullopt;
        }
        return hex;
    }
    return digest;
}

} // namespace forge::build
