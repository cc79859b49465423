#include "selcheck/cli/options.h"
#include "selcheck/core/config.h"
#include "selcheck/core/diagnostics.h"
#include "selcheck/report/analyzer.h"
#include "selcheck/report/reporter.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitUsageError = 2;

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int index = 1; index < argc; ++index) {
    args.emplace_back(argv[index] != nullptr ? argv[index] : "");
  }

  const selcheck::cli::CommandLineResult parsed =
      selcheck::cli::parse_command_line(args);
  if (!parsed.ok) {
    std::cerr << selcheck::core::config::kProgramName << ": " << parsed.error
              << "\n";
    selcheck::cli::print_usage(std::cerr);
    return kExitUsageError;
  }

  const selcheck::cli::CommandLineOptions& options = parsed.options;
  if (options.show_help) {
    selcheck::cli::print_usage(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << selcheck::core::config::kVersionString << "\n";
    return 0;
  }

  selcheck::core::DiagnosticEmitter diagnostics;
  diagnostics.set_min_severity(options.verbose ? selcheck::core::Severity::Info
                                               : selcheck::core::Severity::Error);
  diagnostics.add_observer([](const selcheck::core::DiagnosticEvent& event) {
    std::cerr << selcheck::core::format_diagnostic(event) << "\n";
  });

  selcheck::report::AnalyzerOptions analyzer_options;
  analyzer_options.threshold = options.threshold;
  analyzer_options.jobs = options.jobs;
  const selcheck::report::SpecificityAnalyzer analyzer(analyzer_options,
                                                       &diagnostics);

  selcheck::report::AnalysisReport report;
  if (options.selector.has_value()) {
    std::vector<selcheck::report::SourceReport> sources;
    sources.push_back(analyzer.analyze_selector_text(*options.selector));
    report = analyzer.make_report(std::move(sources));
  } else {
    report = analyzer.analyze_files(options.files);
  }

  std::cout << selcheck::report::format_report(report, options.format);
  return report.exit_code();
}
