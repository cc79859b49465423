#pragma once

#include <selcheck/css/specificity.h>
#include <selcheck/report/reporter.h>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace selcheck::cli {

struct CommandLineOptions {
    std::vector<std::string> files;
    std::optional<std::string> selector;
    css::Specificity threshold;
    report::OutputFormat format = report::OutputFormat::Text;
    std::size_t jobs = 0;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

struct CommandLineResult {
    bool ok = false;
    CommandLineOptions options;
    std::string error;
};

// Parses arguments after the program name. Accepts "--flag value" and
// "--flag=value"; "--" ends option parsing.
CommandLineResult parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& stream);

}  // namespace selcheck::cli
