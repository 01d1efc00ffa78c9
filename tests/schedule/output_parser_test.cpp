#include "tsync/schedule/output_parser.hpp"

#include <gtest/gtest.h>

using namespace tsync::schedule;

namespace {

OutputExtractor extractor(const std::string& name, ExtractorKind kind, const std::string& expression,
                          const std::string& fallback = "") {
    OutputExtractor e;
    e.name = name;
    e.kind = kind;
    e.expression = expression;
    e.default_value = fallback;
    return e;
}

} // namespace

TEST(OutputParserTest, KeyValueLinesBecomeVariables) {
    const auto vars = parse_key_values(
        "Building release\n"
        "VERSION=1.2.3\n"
        "  ARTIFACT = app.tar.gz  \n"
        "# COMMENTED=yes\n"
        "1BAD=no\n"
        "VERSION=1.2.4\n");
    ASSERT_EQ(vars.size(), 2u);
    EXPECT_EQ(vars.at("VERSION"), "1.2.4");
    EXPECT_EQ(vars.at("ARTIFACT"), "app.tar.gz");
}

TEST(OutputParserTest, OverlongKeysAreIgnored) {
    const std::string key(51, 'K');
    EXPECT_TRUE(parse_key_values(key + "=v").empty());
    EXPECT_EQ(parse_key_values(std::string(50, 'K') + "=v").size(), 1u);
}

TEST(OutputParserTest, RegexUsesFirstCaptureGroup) {
    const std::string output = "Processed 42 records in 3.5s\n";
    EXPECT_EQ(apply_extractor(extractor("n", ExtractorKind::Regex, R"(Processed (\d+) records)"), output), "42");
    EXPECT_EQ(apply_extractor(extractor("t", ExtractorKind::Regex, R"(\d+\.\d+s)"), output), "3.5s");
    EXPECT_EQ(apply_extractor(extractor("x", ExtractorKind::Regex, "missing", "none"), output), "none");
}

TEST(OutputParserTest, RegexDotCrossesLinesAndAnchorsMatchPerLine) {
    const std::string output = "header\nBEGIN\nalpha\nbeta\nEND\nstatus: ok\n";
    EXPECT_EQ(apply_extractor(extractor("block", ExtractorKind::Regex, "BEGIN\\n(.*)\\nEND"), output), "alpha\nbeta");
    EXPECT_EQ(apply_extractor(extractor("status", ExtractorKind::Regex, "^status: (\\w+)$"), output), "ok");

    // Dots in brackets or escaped stay literal
    const std::string version = "v1x2 v1.2\n";
    EXPECT_EQ(apply_extractor(extractor("v", ExtractorKind::Regex, "v(\\d[.]\\d)"), version), "1.2");
    EXPECT_EQ(apply_extractor(extractor("w", ExtractorKind::Regex, "v(\\d\\.\\d)"), version), "1.2");
    EXPECT_EQ(apply_extractor(extractor("u", ExtractorKind::Regex, "v(\\d.\\d)"), version), "1x2");
}

TEST(OutputParserTest, JsonPathWalksObjectsAndArrays) {
    const std::string output = R"({"build": {"id": 77, "tags": ["stable", "lts"], "name": "nightly"}})";
    EXPECT_EQ(apply_extractor(extractor("id", ExtractorKind::JsonPath, "$.build.id"), output), "77");
    EXPECT_EQ(apply_extractor(extractor("tag", ExtractorKind::JsonPath, "$.build.tags[1]"), output), "lts");
    EXPECT_EQ(apply_extractor(extractor("name", ExtractorKind::JsonPath, "build.name"), output), "nightly");
    EXPECT_EQ(apply_extractor(extractor("gone", ExtractorKind::JsonPath, "$.build.tags[5]", "-"), output), "-");
    EXPECT_EQ(apply_extractor(extractor("bad", ExtractorKind::JsonPath, "$.a", "fallback"), "not json"), "fallback");
}

TEST(OutputParserTest, LineExpressions) {
    const std::string output = "header\nStatus: OK\nrows=10\nfooter\n";
    EXPECT_EQ(apply_extractor(extractor("a", ExtractorKind::Line, "line:2"), output), "Status: OK");
    EXPECT_EQ(apply_extractor(extractor("b", ExtractorKind::Line, "first"), output), "header");
    EXPECT_EQ(apply_extractor(extractor("c", ExtractorKind::Line, "last"), output), "footer");
    EXPECT_EQ(apply_extractor(extractor("d", ExtractorKind::Line, "after:Status:"), output), "OK");
    EXPECT_EQ(apply_extractor(extractor("e", ExtractorKind::Line, "before:=10"), output), "rows");
    EXPECT_EQ(apply_extractor(extractor("f", ExtractorKind::Line, "contains:rows"), output), "rows=10");
    EXPECT_EQ(apply_extractor(extractor("g", ExtractorKind::Line, "line:9", "?"), output), "?");
}

TEST(OutputParserTest, SplitSelectsByIndex) {
    const std::string output = "alpha,beta,gamma";
    EXPECT_EQ(apply_extractor(extractor("a", ExtractorKind::Split, "sep:,,index:1"), output), "beta");
    EXPECT_EQ(apply_extractor(extractor("b", ExtractorKind::Split, "sep:,,index:-1"), output), "gamma");
    EXPECT_EQ(apply_extractor(extractor("c", ExtractorKind::Split, "sep:,,index:7", "none"), output), "none");
    EXPECT_EQ(apply_extractor(extractor("d", ExtractorKind::Split, "index:0"), "one two"), "one");
}

TEST(OutputParserTest, ValidationCatchesBrokenExtractors) {
    EXPECT_TRUE(validate_extractor(extractor("ok", ExtractorKind::Regex, "a+")).is_ok());
    EXPECT_TRUE(validate_extractor(extractor("", ExtractorKind::Regex, "a+")).is_error());
    EXPECT_TRUE(validate_extractor(extractor("bad", ExtractorKind::Regex, "(unclosed")).is_error());
    EXPECT_TRUE(validate_extractor(extractor("split", ExtractorKind::Split, "sep:,")).is_error());
    EXPECT_EQ(parse_extractor_kind("jsonpath"), ExtractorKind::JsonPath);
    EXPECT_FALSE(parse_extractor_kind("xpath").has_value());
}

TEST(OutputParserTest, ExtractorsSeeStderrAndSkipDisabledOnes) {
    auto from_stderr = extractor("WARNINGS", ExtractorKind::Regex, R"((\d+) warnings)");
    auto disabled = extractor("IGNORED", ExtractorKind::Line, "first");
    disabled.enabled = false;

    const auto vars = extract_variables("VERSION=1.2.3\n", "compiler: 4 warnings\n", {from_stderr, disabled});
    EXPECT_EQ(vars.at("VERSION"), "1.2.3");
    EXPECT_EQ(vars.at("WARNINGS"), "4");
    EXPECT_EQ(vars.count("IGNORED"), 0u);
}
