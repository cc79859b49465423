#pragma once
#include <selcheck/report/analyzer.h>
#include <optional>
#include <string>
#include <string_view>

namespace selcheck::report {

enum class OutputFormat {
    Text,
    Json,
};

std::optional<OutputFormat> parse_output_format(std::string_view name);
const char* output_format_name(OutputFormat format);

// Human-readable report: per-source header, violations, every selector, then
// malformed selectors and source errors.
std::string format_text(const AnalysisReport& report);

// JSON array with one object per selector:
// {"selector", "specificity": [a,b,c,d], "status", "message"?, "source",
//  "offset"?, "line"?, "column"?}. Source-level errors are entries with an
// empty selector and status "error".
std::string format_json(const AnalysisReport& report);

std::string format_report(const AnalysisReport& report, OutputFormat format);

}  // namespace selcheck::report
