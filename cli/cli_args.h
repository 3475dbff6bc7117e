#pragma once

#include <ostream>
#include <string>

namespace jpx::cli {

/// Options parsed from argv.
/// Exactly one of expression/expression_file is set when an evaluation is requested.
struct CliOptions {
  std::string expression;
  bool expression_set = false;
  std::string expression_file;
  bool compact = false;
  bool verbose = false;
  bool check = false;
  bool show_help = false;
  bool show_version = false;
};

void print_startup_help(std::ostream& os);
void print_help(std::ostream& os);
/// Parses argv into typed options.
/// MUST return false with a message for unknown flags, missing values and conflicting sources.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace jpx::cli
