#include <selcheck/report/analyzer.h>
#include <selcheck/css/extract/selector_extractor.h>
#include <selcheck/css/parser/selector.h>
#include <selcheck/platform/thread_pool.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <utility>

namespace selcheck::report {

namespace {

constexpr const char kModule[] = "analyze";

struct FileOutcome {
    SourceReport report;
    core::DiagnosticEmitter diagnostics;
};

void emit(core::DiagnosticEmitter* diagnostics, core::Severity severity,
          const char* module, const char* stage, const std::string& source,
          const std::string& message) {
    if (diagnostics != nullptr) {
        diagnostics->emit(severity, module, stage, source, message);
    }
}

std::string describe_location(const SourceLocation& location) {
    return std::to_string(location.line) + ":" + std::to_string(location.column);
}

} // namespace

const char* status_name(SelectorStatus status) {
    switch (status) {
        case SelectorStatus::Pass:      return "pass";
        case SelectorStatus::Violation: return "violation";
        case SelectorStatus::Error:     return "error";
    }
    return "unknown";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "None";
        case ErrorKind::MalformedInput: return "MalformedInput";
        case ErrorKind::ParseError:     return "ParseError";
        case ErrorKind::ReadError:      return "ReadError";
    }
    return "Unknown";
}

SourceLocation locate(std::string_view text, size_t offset) {
    SourceLocation location;
    location.offset = offset;
    size_t limit = std::min(offset, text.size());
    size_t line_start = 0;
    for (size_t i = 0; i < limit; ++i) {
        if (text[i] == '\n') {
            ++location.line;
            line_start = i + 1;
        }
    }
    location.column = offset - line_start + 1;
    return location;
}

std::string normalize_selector_text(std::string_view text) {
    std::string out;
    char quote = '\0';
    bool pending_space = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote != '\0') {
            out += c;
            if (c == '\\' && i + 1 < text.size()) {
                out += text[++i];
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        }
        out += c;
    }
    return out;
}

std::optional<std::string> read_file(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "file not found: " + path;
        return std::nullopt;
    }
    if (std::filesystem::is_directory(path, ec)) {
        error = "is a directory: " + path;
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        error = "cannot open file: " + path;
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        error = "failed to read file: " + path;
        return std::nullopt;
    }
    return content.str();
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

size_t SourceReport::violation_count() const {
    return static_cast<size_t>(std::count_if(
        selectors.begin(), selectors.end(), [](const SelectorResult& r) {
            return r.status == SelectorStatus::Violation;
        }));
}

size_t SourceReport::parse_error_count() const {
    return static_cast<size_t>(std::count_if(
        selectors.begin(), selectors.end(), [](const SelectorResult& r) {
            return r.status == SelectorStatus::Error;
        }));
}

bool SourceReport::has_errors() const {
    return error_kind != ErrorKind::None || parse_error_count() > 0;
}

std::vector<Violation> AnalysisReport::violations() const {
    std::vector<Violation> result;
    for (const auto& source : sources) {
        for (const auto& selector : source.selectors) {
            if (selector.status != SelectorStatus::Violation) continue;
            Violation violation;
            violation.source = source.source;
            violation.selector = selector.selector;
            violation.specificity = selector.specificity;
            violation.threshold = threshold;
            violation.location = selector.location;
            result.push_back(std::move(violation));
        }
    }
    return result;
}

size_t AnalysisReport::selector_count() const {
    size_t count = 0;
    for (const auto& source : sources) count += source.selectors.size();
    return count;
}

size_t AnalysisReport::violation_count() const {
    size_t count = 0;
    for (const auto& source : sources) count += source.violation_count();
    return count;
}

size_t AnalysisReport::error_count() const {
    size_t count = 0;
    for (const auto& source : sources) {
        count += source.parse_error_count();
        if (source.error_kind != ErrorKind::None) ++count;
    }
    return count;
}

int AnalysisReport::exit_code() const {
    if (error_count() > 0) return 2;
    if (violation_count() > 0) return 1;
    return 0;
}

// ---------------------------------------------------------------------------
// SpecificityAnalyzer
// ---------------------------------------------------------------------------

SpecificityAnalyzer::SpecificityAnalyzer(AnalyzerOptions options,
                                         core::DiagnosticEmitter* diagnostics)
    : options_(options), diagnostics_(diagnostics) {}

SourceReport SpecificityAnalyzer::analyze_css(std::string_view css,
                                              const std::string& source) const {
    return analyze_css(css, source, diagnostics_);
}

SourceReport SpecificityAnalyzer::analyze_selector_text(
    std::string_view selector_text, const std::string& source) const {
    return analyze_selector_text(selector_text, source, diagnostics_);
}

SourceReport SpecificityAnalyzer::analyze_file(const std::string& path) const {
    return analyze_file(path, diagnostics_);
}

void SpecificityAnalyzer::analyze_selector_list(
    std::string_view css, std::string_view text, size_t base_offset,
    const std::string& source, SourceReport& report,
    core::DiagnosticEmitter* diagnostics) const {
    for (auto& entry : css::parse_selector_entries(text)) {
        SelectorResult result;
        result.selector = normalize_selector_text(entry.text);

        if (!entry.ok) {
            result.status = SelectorStatus::Error;
            result.error_kind = ErrorKind::ParseError;
            result.message = entry.error.message;
            if (!entry.error.fragment.empty()) {
                result.message += " near '" + entry.error.fragment + "'";
            }
            result.location = locate(css, base_offset + entry.error.offset);
            emit(diagnostics, core::Severity::Warning, "parse", "selector", source,
                 result.message + " in '" + result.selector + "' at " +
                     describe_location(*result.location));
            report.selectors.push_back(std::move(result));
            continue;
        }

        result.location = locate(css, base_offset + entry.offset);
        result.specificity = css::compute_specificity(entry.selector);
        if (css::exceeds_threshold(result.specificity, options_.threshold)) {
            result.status = SelectorStatus::Violation;
            result.message = "exceeds threshold " + options_.threshold.to_string();
            emit(diagnostics, core::Severity::Warning, kModule, "threshold", source,
                 "'" + result.selector + "' has specificity " +
                     result.specificity.to_string() + ", " + result.message);
        }
        report.selectors.push_back(std::move(result));
    }
}

SourceReport SpecificityAnalyzer::analyze_css(
    std::string_view css, const std::string& source,
    core::DiagnosticEmitter* diagnostics) const {
    SourceReport report;
    report.source = source;
    emit(diagnostics, core::Severity::Info, kModule, "start", source,
         "analyzing " + std::to_string(css.size()) + " bytes");

    css::SelectorExtractor extractor(css);
    while (auto raw = extractor.next()) {
        analyze_selector_list(css, raw->text, raw->offset, source, report,
                              diagnostics);
    }

    if (extractor.failed()) {
        report.error_kind = ErrorKind::MalformedInput;
        report.error = extractor.error().message;
        report.error_location = locate(css, extractor.error().offset);
        emit(diagnostics, core::Severity::Error, "extract", "scan", source,
             report.error + " at " + describe_location(*report.error_location));
    }

    emit(diagnostics, core::Severity::Info, kModule, "done", source,
         std::to_string(report.selectors.size()) + " selectors, " +
             std::to_string(report.violation_count()) + " violations, " +
             std::to_string(report.parse_error_count()) + " parse errors");
    return report;
}

SourceReport SpecificityAnalyzer::analyze_selector_text(
    std::string_view selector_text, const std::string& source,
    core::DiagnosticEmitter* diagnostics) const {
    SourceReport report;
    report.source = source;
    analyze_selector_list(selector_text, selector_text, 0, source, report,
                          diagnostics);

    if (report.selectors.empty()) {
        SelectorResult result;
        result.status = SelectorStatus::Error;
        result.error_kind = ErrorKind::ParseError;
        result.message = "empty selector";
        result.location = locate(selector_text, 0);
        emit(diagnostics, core::Severity::Warning, "parse", "selector", source,
             result.message);
        report.selectors.push_back(std::move(result));
    }
    return report;
}

SourceReport SpecificityAnalyzer::analyze_file(
    const std::string& path, core::DiagnosticEmitter* diagnostics) const {
    std::string error;
    std::optional<std::string> content = read_file(path, error);
    if (!content.has_value()) {
        SourceReport report;
        report.source = path;
        report.error_kind = ErrorKind::ReadError;
        report.error = error;
        emit(diagnostics, core::Severity::Error, kModule, "read", path, error);
        return report;
    }
    return analyze_css(*content, path, diagnostics);
}

size_t SpecificityAnalyzer::worker_count(size_t file_count) const {
    size_t requested = options_.jobs == 0 ? platform::ThreadPool::default_size()
                                          : options_.jobs;
    return std::max<size_t>(1, std::min(requested, file_count));
}

AnalysisReport SpecificityAnalyzer::analyze_files(
    const std::vector<std::string>& paths) const {
    std::vector<SourceReport> sources;
    sources.reserve(paths.size());

    size_t workers = worker_count(paths.size());

    if (paths.size() <= 1 || workers <= 1) {
        for (const auto& path : paths) {
            sources.push_back(analyze_file(path, diagnostics_));
        }
        return make_report(std::move(sources));
    }

    // Each task owns its emitter; events are merged back in input order.
    platform::ThreadPool pool(workers);
    std::vector<std::future<FileOutcome>> pending;
    pending.reserve(paths.size());
    for (const auto& path : paths) {
        core::Severity min_severity = diagnostics_ != nullptr
                                          ? diagnostics_->min_severity()
                                          : core::Severity::Info;
        pending.push_back(pool.submit([this, path, min_severity]() {
            FileOutcome outcome;
            outcome.diagnostics.set_min_severity(min_severity);
            outcome.report = analyze_file(path, &outcome.diagnostics);
            return outcome;
        }));
    }

    for (auto& future : pending) {
        FileOutcome outcome = future.get();
        if (diagnostics_ != nullptr) {
            diagnostics_->merge(outcome.diagnostics);
        }
        sources.push_back(std::move(outcome.report));
    }
    return make_report(std::move(sources));
}

AnalysisReport SpecificityAnalyzer::make_report(std::vector<SourceReport> sources) const {
    AnalysisReport report;
    report.threshold = options_.threshold;
    report.sources = std::move(sources);
    return report;
}

}  // namespace selcheck::report
