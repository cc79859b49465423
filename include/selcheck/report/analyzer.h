#pragma once
#include <selcheck/core/config.h>
#include <selcheck/core/diagnostics.h>
#include <selcheck/css/specificity.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace selcheck::report {

enum class SelectorStatus {
    Pass,
    Violation,
    Error,
};

enum class ErrorKind {
    None,
    MalformedInput,  // stylesheet could not be scanned (braces, strings, comments)
    ParseError,      // one selector is not valid selector syntax
    ReadError,       // file missing or unreadable
};

const char* status_name(SelectorStatus status);
const char* error_kind_name(ErrorKind kind);

struct SourceLocation {
    size_t offset = 0;
    size_t line = 1;    // 1-based
    size_t column = 1;  // 1-based, in bytes
};

SourceLocation locate(std::string_view text, size_t offset);

struct SelectorResult {
    std::string selector;
    css::Specificity specificity;
    SelectorStatus status = SelectorStatus::Pass;
    ErrorKind error_kind = ErrorKind::None;
    std::string message;
    std::optional<SourceLocation> location;
};

struct Violation {
    std::string source;
    std::string selector;
    css::Specificity specificity;
    css::Specificity threshold;
    std::optional<SourceLocation> location;
};

struct SourceReport {
    std::string source;
    std::vector<SelectorResult> selectors;

    // Source-level failure; selectors found before it are still listed.
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::optional<SourceLocation> error_location;

    size_t violation_count() const;
    size_t parse_error_count() const;
    bool has_errors() const;
};

struct AnalysisReport {
    css::Specificity threshold;
    std::vector<SourceReport> sources;

    std::vector<Violation> violations() const;
    size_t selector_count() const;
    size_t violation_count() const;
    size_t error_count() const;

    // 0: everything passed, 1: violations only, 2: any error.
    int exit_code() const;
};

struct AnalyzerOptions {
    css::Specificity threshold{core::config::kDefaultThresholdInline,
                               core::config::kDefaultThresholdId,
                               core::config::kDefaultThresholdClass,
                               core::config::kDefaultThresholdType};
    // Worker threads for analyze_files(); 0 picks the hardware thread count.
    // Never more workers than files.
    size_t jobs = 0;
};

// Runs extract -> parse -> specificity -> threshold for stylesheets and
// literal selectors. Results keep input order regardless of `jobs`.
class SpecificityAnalyzer {
public:
    explicit SpecificityAnalyzer(AnalyzerOptions options = {},
                                 core::DiagnosticEmitter* diagnostics = nullptr);

    SourceReport analyze_css(std::string_view css, const std::string& source) const;
    SourceReport analyze_selector_text(
        std::string_view selector_text,
        const std::string& source = core::config::kSelectorSourceName) const;
    SourceReport analyze_file(const std::string& path) const;
    AnalysisReport analyze_files(const std::vector<std::string>& paths) const;

    AnalysisReport make_report(std::vector<SourceReport> sources) const;

    size_t worker_count(size_t file_count) const;

    const AnalyzerOptions& options() const { return options_; }

private:
    SourceReport analyze_css(std::string_view css, const std::string& source,
                             core::DiagnosticEmitter* diagnostics) const;
    SourceReport analyze_selector_text(std::string_view selector_text,
                                       const std::string& source,
                                       core::DiagnosticEmitter* diagnostics) const;
    SourceReport analyze_file(const std::string& path,
                              core::DiagnosticEmitter* diagnostics) const;
    void analyze_selector_list(std::string_view css, std::string_view text,
                               size_t base_offset, const std::string& source,
                               SourceReport& report,
                               core::DiagnosticEmitter* diagnostics) const;

    AnalyzerOptions options_;
    core::DiagnosticEmitter* diagnostics_;
};

// Reads a whole file. Returns nullopt and fills `error` when it cannot.
std::optional<std::string> read_file(const std::string& path, std::string& error);

// Collapses whitespace runs to single spaces for display.
std::string normalize_selector_text(std::string_view text);

}  // namespace selcheck::report
