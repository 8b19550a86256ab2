//! # Generated Header Tests

#include "build/header.hpp"

#include <gtest/gtest.h>

using namespace forge::build;

namespace {

HeaderFields sample_fields() {
    HeaderFields fields;
    fields.tool_version = "0.3.0";
    fields.kind = "build";
    fields.source_module = "pkg.a";
    fields.module_digest = "abc123";
    fields.spec_refs = {"pkg.a:A", "pkg.a:B"};
    return fields;
}

} // namespace

TEST(HeaderTest, FormatLayout) {
    EXPECT_EQ(format_header(sample_fields()),
              "# Generated by forge. DO NOT EDIT.\n"
              "# forge:tool_version=0.3.0\n"
              "# forge:kind=build\n"
              "# forge:source_module=pkg.a\n"
              "# forge:module_digest=sha256:abc123\n"
              "# forge:spec_refs=[\"pkg.a:A\",\"pkg.a:B\"]");
}

TEST(HeaderTest, DigestPrefixNotDoubled) {
    auto fields = sample_fields();
    fields.module_digest = "sha256:abc123";

    EXPECT_NE(format_header(fields).find("module_digest=sha256:abc123\n"), std::string::npos);
    EXPECT_EQ(format_header(fields).find("sha256:sha256:"), std::string::npos);
}

TEST(HeaderTest, ParseReadsEveryField) {
    std::string text = format_header(sample_fields()) + "\n\ndef A(): ...\n";

    auto parsed = parse_header(text);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->tool_version, "0.3.0");
    EXPECT_EQ(parsed->kind, "build");
    EXPECT_EQ(parsed->source_module, "pkg.a");
    EXPECT_EQ(parsed->module_digest, "sha256:abc123");
    EXPECT_EQ(parsed->spec_refs, (std::vector<std::string>{"pkg.a:A", "pkg.a:B"}));
}

TEST(HeaderTest, ParseRequiresBanner) {
    EXPECT_FALSE(parse_header("def A(): ...\n").has_value());
    EXPECT_FALSE(parse_header("").has_value());
}

TEST(HeaderTest, ParseToleratesCrLf) {
    std::string text = "# Generated by forge. DO NOT EDIT.\r\n# forge:module_digest=sha256:ff\r\n";

    EXPECT_EQ(extract_module_digest(text), "sha256:ff");
}

TEST(HeaderTest, ExtractDigestMissing) {
    EXPECT_FALSE(extract_module_digest("# Generated by forge. DO NOT EDIT.\n").has_value());
}

TEST(HeaderTest, NormalizeDigest) {
    EXPECT_EQ(normalize_digest("sha256:abc"), "abc");
    EXPECT_EQ(normalize_digest("abc"), "abc");
    EXPECT_FALSE(normalize_digest("sha256:").has_value());
    EXPECT_FALSE(normalize_digest("").has_value());
    EXPECT_FALSE(normalize_digest(std::nullopt).has_value());
}
