#include <exception>
#include <iostream>
#include <string>

#include "jpx/jpx.h"
#include "cli_args.h"
#include "cli_utils.h"
#include "util/string_util.h"

using namespace jpx::cli;

/// Entry point: reads the expression, evaluates it and prints the result as JSON.
/// MUST exit 0 for every evaluated expression, including null results.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << "Error: " << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "jpx " << jpx::version_string() << std::endl;
    return 0;
  }

  std::string expression = options.expression;
  if (!options.expression_file.empty()) {
    try {
      expression = strip_trailing_newline(read_file(options.expression_file));
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 2;
    }
    if (!jpx::util::is_valid_utf8(expression)) {
      std::cerr << "Error: expression file is not valid UTF-8: " << options.expression_file
                << std::endl;
      return 2;
    }
  } else if (!options.expression_set) {
    std::cerr << "Error: missing expression (pass it as an argument, --expr or --expr-file)\n";
    return 2;
  }

  if (options.check) {
    auto error = jpx::check_expression(expression);
    if (!error.has_value()) {
      std::cout << "OK" << std::endl;
      return 0;
    }
    std::cerr << "Error: " << error->message << "\n"
              << render_code_frame(expression, error->position) << std::endl;
    return 1;
  }

  jpx::EvalReport report = jpx::evaluate_expression_report(expression);
  if (options.verbose) {
    for (const auto& issue : report.issues) {
      std::cerr << "jpx: " << issue_kind_name(issue.kind) << " at byte " << issue.position
                << ": " << issue.message << std::endl;
    }
  }
  std::cout << format_result(report.value, options.compact) << std::endl;
  return 0;
}
