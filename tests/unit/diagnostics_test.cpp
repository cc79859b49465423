#include <gtest/gtest.h>
#include <selcheck/core/diagnostics.h>

#include <chrono>
#include <string>
#include <vector>

using namespace selcheck::core;

class DiagnosticsTest : public ::testing::Test {};

TEST_F(DiagnosticsTest, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST_F(DiagnosticsTest, EmitRecordsStructuredFields) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Error, "extract", "scan", "site.css", "unclosed '{' at 3:7");

    ASSERT_EQ(emitter.size(), 1u);
    const auto& e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "extract");
    EXPECT_EQ(e.stage, "scan");
    EXPECT_EQ(e.source, "site.css");
    EXPECT_EQ(e.message, "unclosed '{' at 3:7");
    EXPECT_TRUE(e.timestamp != std::chrono::steady_clock::time_point{});
}

TEST_F(DiagnosticsTest, FormatIncludesAllFields) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "parse";
    event.stage = "selector";
    event.source = "a.css";
    event.message = "dangling combinator near '>'";
    EXPECT_EQ(format_diagnostic(event),
              "[warning] parse/selector (a.css): dangling combinator near '>'");
}

TEST_F(DiagnosticsTest, FormatWithoutSource) {
    DiagnosticEvent event;
    event.severity = Severity::Info;
    event.module = "analyze";
    event.stage = "start";
    event.message = "analyzing 10 bytes";
    EXPECT_EQ(format_diagnostic(event), "[info] analyze/start: analyzing 10 bytes");
}

TEST_F(DiagnosticsTest, MinSeverityFiltersEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    EXPECT_EQ(emitter.min_severity(), Severity::Warning);

    emitter.emit(Severity::Info, "analyze", "start", "ignored");
    emitter.emit(Severity::Warning, "analyze", "threshold", "kept");
    emitter.emit(Severity::Error, "analyze", "read", "kept too");

    ASSERT_EQ(emitter.size(), 2u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
}

TEST_F(DiagnosticsTest, FilterBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "analyze", "start", "a");
    emitter.emit(Severity::Warning, "parse", "selector", "b");
    emitter.emit(Severity::Warning, "analyze", "threshold", "c");

    auto warnings = emitter.events_by_severity(Severity::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].message, "b");
    EXPECT_EQ(warnings[1].message, "c");

    auto analyze = emitter.events_by_module("analyze");
    ASSERT_EQ(analyze.size(), 2u);
    EXPECT_EQ(analyze[0].message, "a");
    EXPECT_EQ(analyze[1].message, "c");
}

TEST_F(DiagnosticsTest, ObserversSeeRecordedEventsOnly) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });

    emitter.emit(Severity::Info, "analyze", "start", "hidden");
    emitter.emit(Severity::Error, "analyze", "read", "shown");

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "shown");
}

TEST_F(DiagnosticsTest, MergeKeepsOrderAndTimestamps) {
    DiagnosticEmitter worker;
    worker.emit(Severity::Info, "analyze", "start", "a.css", "one");
    worker.emit(Severity::Warning, "analyze", "threshold", "a.css", "two");

    DiagnosticEmitter collector;
    collector.set_min_severity(Severity::Warning);
    std::vector<std::string> seen;
    collector.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });
    collector.merge(worker);

    ASSERT_EQ(collector.size(), 1u);
    EXPECT_EQ(collector.events()[0].message, "two");
    EXPECT_TRUE(collector.events()[0].timestamp == worker.events()[1].timestamp);
    EXPECT_EQ(seen, (std::vector<std::string>{"two"}));
}

TEST_F(DiagnosticsTest, Clear) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Error, "analyze", "read", "x");
    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
    EXPECT_TRUE(emitter.events().empty());
}
