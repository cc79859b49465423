#include <selcheck/report/reporter.h>

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace selcheck::report {

namespace {

const std::string kRule(70, '=');
const std::string kDivider(70, '-');

std::string status_label(SelectorStatus status) {
    switch (status) {
        case SelectorStatus::Pass:      return "PASS";
        case SelectorStatus::Violation: return "VIOLATION";
        case SelectorStatus::Error:     return "ERROR";
    }
    return "?";
}

std::string location_text(const std::optional<SourceLocation>& location) {
    if (!location.has_value()) return "";
    return std::to_string(location->line) + ":" + std::to_string(location->column);
}

nlohmann::json specificity_json(const css::Specificity& spec) {
    return nlohmann::json::array({spec.a, spec.b, spec.c, spec.d});
}

void add_location(nlohmann::json& entry, const std::optional<SourceLocation>& location) {
    if (!location.has_value()) return;
    entry["offset"] = location->offset;
    entry["line"] = location->line;
    entry["column"] = location->column;
}

void write_source(std::ostringstream& out, const SourceReport& source,
                  const css::Specificity& threshold) {
    out << "\nCSS Specificity Analysis: " << source.source << "\n";
    out << kRule << "\n";
    out << "Total selectors: " << source.selectors.size() << "\n";
    out << "Violations: " << source.violation_count() << "\n";
    out << "Errors: "
        << source.parse_error_count() + (source.error_kind != ErrorKind::None ? 1 : 0)
        << "\n";
    out << "Threshold: " << threshold.to_string() << "\n";

    if (source.violation_count() > 0) {
        out << "\nHigh Specificity Selectors:\n" << kDivider << "\n";
        for (const auto& item : source.selectors) {
            if (item.status != SelectorStatus::Violation) continue;
            out << "  " << std::left << std::setw(12) << item.specificity.to_string()
                << " | " << item.selector;
            if (item.location) out << "  (" << location_text(item.location) << ")";
            out << "\n";
        }
    }

    bool any_parsed = false;
    for (const auto& item : source.selectors) {
        if (item.status != SelectorStatus::Error) any_parsed = true;
    }
    if (any_parsed) {
        out << "\nAll Selectors:\n" << kDivider << "\n";
        for (const auto& item : source.selectors) {
            if (item.status == SelectorStatus::Error) continue;
            out << "  " << std::left << std::setw(12) << item.specificity.to_string()
                << std::setw(11) << status_label(item.status) << item.selector;
            if (item.location) out << "  (" << location_text(item.location) << ")";
            if (item.status == SelectorStatus::Violation) {
                out << "  exceeds " << threshold.to_string();
            }
            out << "\n";
        }
    }

    if (source.has_errors()) {
        out << "\nErrors:\n" << kDivider << "\n";
        for (const auto& item : source.selectors) {
            if (item.status != SelectorStatus::Error) continue;
            out << "  " << error_kind_name(item.error_kind);
            if (item.location) {
                out << " at " << location_text(item.location) << " (offset "
                    << item.location->offset << ")";
            }
            out << ": " << item.message;
            if (!item.selector.empty()) out << "  | " << item.selector;
            out << "\n";
        }
        if (source.error_kind != ErrorKind::None) {
            out << "  " << error_kind_name(source.error_kind);
            if (source.error_location) {
                out << " at " << location_text(source.error_location) << " (offset "
                    << source.error_location->offset << ")";
            }
            out << ": " << source.error << "\n";
        }
    }
}

} // namespace

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "text") return OutputFormat::Text;
    if (name == "json") return OutputFormat::Json;
    return std::nullopt;
}

const char* output_format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Json: return "json";
    }
    return "text";
}

std::string format_text(const AnalysisReport& report) {
    std::ostringstream out;
    for (const auto& source : report.sources) {
        write_source(out, source, report.threshold);
    }
    if (report.sources.size() > 1) {
        out << "\n" << kRule << "\n";
        out << "Summary: " << report.selector_count() << " selectors, "
            << report.violation_count() << " violations, " << report.error_count()
            << " errors across " << report.sources.size() << " sources\n";
    }
    return out.str();
}

std::string format_json(const AnalysisReport& report) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& source : report.sources) {
        for (const auto& item : source.selectors) {
            nlohmann::json entry;
            entry["selector"] = item.selector;
            entry["specificity"] = specificity_json(item.specificity);
            entry["status"] = status_name(item.status);
            if (item.status == SelectorStatus::Error) {
                entry["message"] = std::string(error_kind_name(item.error_kind)) +
                                   ": " + item.message;
            } else if (!item.message.empty()) {
                entry["message"] = item.message;
            }
            entry["source"] = source.source;
            add_location(entry, item.location);
            entries.push_back(std::move(entry));
        }
        if (source.error_kind != ErrorKind::None) {
            nlohmann::json entry;
            entry["selector"] = "";
            entry["specificity"] = specificity_json(css::Specificity{});
            entry["status"] = status_name(SelectorStatus::Error);
            entry["message"] = std::string(error_kind_name(source.error_kind)) + ": " +
                               source.error;
            entry["source"] = source.source;
            add_location(entry, source.error_location);
            entries.push_back(std::move(entry));
        }
    }
    return entries.dump(2) + "\n";
}

std::string format_report(const AnalysisReport& report, OutputFormat format) {
    if (format == OutputFormat::Json) {
        return format_json(report);
    }
    return format_text(report);
}

}  // namespace selcheck::report
