#include "selcheck/cli/options.h"

#include "selcheck/core/config.h"

#include <charconv>
#include <ostream>
#include <string_view>
#include <system_error>

namespace selcheck::cli {

namespace {

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_size(std::string_view text, std::size_t& value) {
  if (text.empty()) {
    return false;
  }
  std::size_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed == 0) {
    return false;
  }
  value = parsed;
  return true;
}

CommandLineResult failure(std::string message) {
  CommandLineResult result;
  result.error = std::move(message);
  return result;
}

}  // namespace

void print_usage(std::ostream& stream) {
  stream << "usage: " << core::config::kProgramName
         << " [options] <file.css>...\n"
         << "       " << core::config::kProgramName
         << " --selector \"<selector>\" [options]\n"
         << "\n"
         << "options:\n"
         << "  --selector <text>     analyze one selector list instead of files\n"
         << "  --threshold <a,b,c,d> maximum allowed specificity (default "
         << core::config::kDefaultThreshold << ")\n"
         << "  --format text|json    output format (default "
         << core::config::kDefaultFormat << ")\n"
         << "  --jobs <n>            worker threads for multiple files\n"
         << "  -v, --verbose         log progress to stderr\n"
         << "  -h, --help            show this help\n"
         << "  -V, --version         show version\n"
         << "\n"
         << "exit status: 0 all pass, 1 violations, 2 errors\n";
}

CommandLineResult parse_command_line(const std::vector<std::string>& args) {
  CommandLineResult result;
  CommandLineOptions& options = result.options;
  options.threshold = css::parse_specificity(core::config::kDefaultThreshold).value;

  bool has_threshold = false;
  bool has_format = false;
  bool has_jobs = false;
  bool options_done = false;

  for (std::size_t index = 0; index < args.size(); ++index) {
    const std::string_view argument(args[index]);

    if (options_done || argument.empty() || argument == "-" ||
        argument.front() != '-') {
      options.files.emplace_back(argument);
      continue;
    }
    if (argument == "--") {
      options_done = true;
      continue;
    }
    if (argument == "-h" || argument == "--help") {
      options.show_help = true;
      continue;
    }
    if (argument == "-V" || argument == "--version") {
      options.show_version = true;
      continue;
    }
    if (argument == "-v" || argument == "--verbose") {
      options.verbose = true;
      continue;
    }

    // Options taking a value: --name value or --name=value
    std::string_view name = argument;
    std::string_view value;
    bool has_value = false;
    const std::size_t equals = argument.find('=');
    if (starts_with(argument, "--") && equals != std::string_view::npos) {
      name = argument.substr(0, equals);
      value = argument.substr(equals + 1);
      has_value = true;
    }

    const bool known = name == "--selector" || name == "--threshold" ||
                       name == "--format" || name == "--jobs";
    if (!known) {
      return failure("unknown option '" + std::string(argument) + "'");
    }
    if (!has_value) {
      if (index + 1 >= args.size()) {
        return failure("missing value for " + std::string(name));
      }
      value = args[++index];
    }

    if (name == "--selector") {
      if (options.selector.has_value()) {
        return failure("duplicate flag '--selector'");
      }
      options.selector = std::string(value);
    } else if (name == "--threshold") {
      if (has_threshold) {
        return failure("duplicate flag '--threshold'");
      }
      const css::SpecificityParseResult threshold = css::parse_specificity(value);
      if (!threshold.ok) {
        return failure("invalid threshold '" + std::string(value) + "': " +
                       threshold.error);
      }
      options.threshold = threshold.value;
      has_threshold = true;
    } else if (name == "--format") {
      if (has_format) {
        return failure("duplicate flag '--format'");
      }
      const std::optional<report::OutputFormat> format =
          report::parse_output_format(value);
      if (!format.has_value()) {
        return failure("invalid format '" + std::string(value) +
                       "' (expected text or json)");
      }
      options.format = *format;
      has_format = true;
    } else {
      if (has_jobs) {
        return failure("duplicate flag '--jobs'");
      }
      if (!parse_positive_size(value, options.jobs)) {
        return failure("invalid --jobs '" + std::string(value) +
                       "' (expected a positive integer)");
      }
      has_jobs = true;
    }
  }

  if (options.show_help || options.show_version) {
    result.ok = true;
    return result;
  }
  if (options.selector.has_value() && !options.files.empty()) {
    return failure("--selector cannot be combined with file arguments");
  }
  if (!options.selector.has_value() && options.files.empty()) {
    return failure("no input: give a CSS file or --selector");
  }

  result.ok = true;
  return result;
}

}  // namespace selcheck::cli
