#include "cli_args.h"

#include <string>

namespace jpx::cli {

/// Prints the startup help so users see baseline usage without flags.
void print_startup_help(std::ostream& os) {
  os << "jpx - extract values from JSON with a single expression\n\n";
  os << "Usage:\n";
  os << "  jpx '<expression>'\n";
  os << "  jpx --expr '<expression>' [--compact] [--verbose]\n";
  os << "  jpx --expr-file <file> [--compact] [--verbose]\n";
  os << "  jpx --check '<expression>'\n";
  os << "  jpx --version\n\n";
  os << "Functions:\n";
  os << "  from_json(json, path)   matches of path in json, or null\n";
  os << "  first(x)                first element of an array result\n";
  os << "  unique(x)               array without deep-equal duplicates\n";
  os << "  or_default(x, json)     json when x is null or []\n\n";
  os << "Examples:\n";
  os << "  jpx 'first(from_json(\"{\\\"a\\\":[1,2]}\", \"$.a[*]\"))'\n";
  os << "  jpx 'from_json(\"{\\\"a\\\":[0,1,2,3,4]}\", \"$.a[1:4:2]\")'\n";
}

void print_help(std::ostream& os) {
  os << "Usage: jpx [--expr] '<expression>' [--compact] [--verbose]\n";
  os << "       jpx --expr-file <file> [--compact] [--verbose]\n";
  os << "       jpx --check '<expression>'\n";
  os << "       jpx --version\n";
  os << "The result is printed as JSON on stdout; failures print null.\n";
  os << "--compact prints the result on a single line.\n";
  os << "--verbose reports why parts of the expression evaluated to null on stderr.\n";
  os << "--check only parses the expression and reports the first syntax error.\n";
  os << "Exit codes: 0=evaluated (including null results), 1=--check found an error, "
        "2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed;
  auto set_expression = [&](const std::string& value) {
    if (parsed.expression_set) {
      error = "Only one expression may be given";
      return false;
    }
    parsed.expression = value;
    parsed.expression_set = true;
    return true;
  };
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--expr" || arg == "--check") {
      if (arg == "--check") parsed.check = true;
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      if (!set_expression(argv[++i])) return false;
    } else if (arg == "--expr-file") {
      if (i + 1 >= argc) {
        error = "Missing value for --expr-file";
        return false;
      }
      parsed.expression_file = argv[++i];
    } else if (arg == "--compact") {
      parsed.compact = true;
    } else if (arg == "--verbose") {
      parsed.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      error = "Unknown argument: " + arg;
      return false;
    } else {
      if (!set_expression(arg)) return false;
    }
  }
  if (parsed.expression_set && !parsed.expression_file.empty()) {
    error = "An expression and --expr-file are mutually exclusive";
    return false;
  }
  if (parsed.check && !parsed.expression_file.empty()) {
    error = "--check takes the expression as its value";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace jpx::cli
