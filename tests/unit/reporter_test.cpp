#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <selcheck/report/analyzer.h>
#include <selcheck/report/reporter.h>

#include <string>

using namespace selcheck;
using namespace selcheck::report;

namespace {

AnalysisReport analyze(const char* css, const char* threshold = "0,0,2,2") {
    AnalyzerOptions options;
    options.threshold = css::parse_specificity(threshold).value;
    SpecificityAnalyzer analyzer(options);
    return analyzer.make_report({analyzer.analyze_css(css, "site.css")});
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

class ReporterTest : public ::testing::Test {};

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

TEST_F(ReporterTest, TextReportHeaderAndSections) {
    auto report = analyze(".c-button { color: red; } #nav .menu li a { color: blue; }");
    std::string text = format_text(report);

    EXPECT_TRUE(contains(text, "CSS Specificity Analysis: site.css"));
    EXPECT_TRUE(contains(text, std::string(70, '=')));
    EXPECT_TRUE(contains(text, "Total selectors: 2"));
    EXPECT_TRUE(contains(text, "Violations: 1"));
    EXPECT_TRUE(contains(text, "Errors: 0"));
    EXPECT_TRUE(contains(text, "Threshold: 0,0,2,2"));
    EXPECT_TRUE(contains(text, "High Specificity Selectors:"));
    EXPECT_TRUE(contains(text, "All Selectors:"));
    EXPECT_FALSE(contains(text, "\nErrors:\n"));
    EXPECT_FALSE(contains(text, "Summary:"));
}

TEST_F(ReporterTest, TextReportRows) {
    auto report = analyze(".c-button { color: red; } #nav .menu li a { color: blue; }");
    std::string text = format_text(report);

    EXPECT_TRUE(contains(text, "  0,0,1,0     PASS       .c-button  (1:1)\n"));
    EXPECT_TRUE(contains(text,
                         "  0,1,1,2     VIOLATION  #nav .menu li a  (1:27)"
                         "  exceeds 0,0,2,2\n"));
    EXPECT_TRUE(contains(text, "  0,1,1,2      | #nav .menu li a  (1:27)\n"));
}

TEST_F(ReporterTest, TextReportListsErrors) {
    auto report = analyze("p {}\n.x >, .y {}\n.card {");
    std::string text = format_text(report);

    EXPECT_TRUE(contains(text, "Errors: 2"));
    EXPECT_TRUE(contains(text, "\nErrors:\n"));
    EXPECT_TRUE(contains(
        text, "  ParseError at 2:4 (offset 8): dangling combinator near '>'  | .x >\n"));
    EXPECT_TRUE(contains(text, "  MalformedInput at 3:7 (offset 23): unclosed '{'\n"));
}

TEST_F(ReporterTest, TextReportReadError) {
    SpecificityAnalyzer analyzer;
    auto report = analyzer.analyze_files({"/nonexistent/selcheck/a.css"});
    std::string text = format_text(report);
    EXPECT_TRUE(contains(text, "Total selectors: 0"));
    EXPECT_TRUE(contains(text, "  ReadError: file not found: /nonexistent/selcheck/a.css\n"));
    EXPECT_FALSE(contains(text, "All Selectors:"));
}

TEST_F(ReporterTest, TextReportSummaryForMultipleSources) {
    AnalyzerOptions options;
    SpecificityAnalyzer analyzer(options);
    auto report = analyzer.make_report({analyzer.analyze_css(".a {}", "a.css"),
                                        analyzer.analyze_css("#x #y {}", "b.css")});
    std::string text = format_text(report);
    EXPECT_TRUE(contains(text, "CSS Specificity Analysis: a.css"));
    EXPECT_TRUE(contains(text, "CSS Specificity Analysis: b.css"));
    EXPECT_TRUE(contains(text,
                         "Summary: 2 selectors, 1 violations, 0 errors across 2 sources\n"));
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

TEST_F(ReporterTest, JsonEntriesPerSelector) {
    auto report = analyze(".c-button { color: red; } #nav .menu li a { color: blue; }");
    auto json = nlohmann::json::parse(format_json(report));

    ASSERT_TRUE(json.is_array());
    ASSERT_EQ(json.size(), 2u);

    EXPECT_EQ(json[0]["selector"], ".c-button");
    EXPECT_EQ(json[0]["specificity"], nlohmann::json::array({0, 0, 1, 0}));
    EXPECT_EQ(json[0]["status"], "pass");
    EXPECT_FALSE(json[0].contains("message"));
    EXPECT_EQ(json[0]["source"], "site.css");
    EXPECT_EQ(json[0]["offset"], 0);

    EXPECT_EQ(json[1]["selector"], "#nav .menu li a");
    EXPECT_EQ(json[1]["specificity"], nlohmann::json::array({0, 1, 1, 2}));
    EXPECT_EQ(json[1]["status"], "violation");
    EXPECT_EQ(json[1]["message"], "exceeds threshold 0,0,2,2");
    EXPECT_EQ(json[1]["line"], 1);
    EXPECT_EQ(json[1]["column"], 27);
}

TEST_F(ReporterTest, JsonErrorEntries) {
    auto report = analyze(".x > {}\n.card {");
    auto json = nlohmann::json::parse(format_json(report));
    ASSERT_EQ(json.size(), 3u);

    EXPECT_EQ(json[0]["status"], "error");
    EXPECT_EQ(json[0]["selector"], ".x >");
    EXPECT_EQ(json[0]["message"], "ParseError: dangling combinator near '>'");

    EXPECT_EQ(json[1]["selector"], ".card");
    EXPECT_EQ(json[1]["status"], "pass");

    EXPECT_EQ(json[2]["selector"], "");
    EXPECT_EQ(json[2]["specificity"], nlohmann::json::array({0, 0, 0, 0}));
    EXPECT_EQ(json[2]["status"], "error");
    EXPECT_EQ(json[2]["message"], "MalformedInput: unclosed '{'");
    EXPECT_EQ(json[2]["offset"], 14);
}

TEST_F(ReporterTest, JsonEmptyReport) {
    auto report = analyze("/* nothing */");
    EXPECT_EQ(format_json(report), "[]\n");
}

TEST_F(ReporterTest, FormatReportDispatches) {
    auto report = analyze(".a {}");
    EXPECT_EQ(format_report(report, OutputFormat::Json), format_json(report));
    EXPECT_EQ(format_report(report, OutputFormat::Text), format_text(report));
}

TEST_F(ReporterTest, ParseOutputFormat) {
    EXPECT_EQ(parse_output_format("text").value(), OutputFormat::Text);
    EXPECT_EQ(parse_output_format("json").value(), OutputFormat::Json);
    EXPECT_FALSE(parse_output_format("xml").has_value());
    EXPECT_FALSE(parse_output_format("JSON").has_value());
    EXPECT_STREQ(output_format_name(OutputFormat::Json), "json");
}
