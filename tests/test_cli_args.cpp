#include "test_harness.h"

#include <vector>

#include "cli_args.h"

namespace {

bool parse(std::vector<const char*> args, jpx::cli::CliOptions& options, std::string& error) {
  args.insert(args.begin(), "jpx");
  int argc = static_cast<int>(args.size());
  return jpx::cli::parse_cli_args(argc, const_cast<char**>(args.data()), options, error);
}

void test_parse_cli_args_positional_expression() {
  jpx::cli::CliOptions options;
  std::string error;
  bool ok = parse({"first('a')", "--compact"}, options, error);
  expect_true(ok, "positional expression accepted");
  expect_true(options.expression_set && options.expression == "first('a')", "expression stored");
  expect_true(options.compact, "compact parsed");
  expect_true(!options.verbose && !options.check, "other flags default off");
}

void test_parse_cli_args_expr_flag() {
  jpx::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--verbose", "--expr", "--looks-like-a-flag"}, options, error);
  expect_true(ok, "--expr takes the next argument verbatim");
  expect_true(options.expression == "--looks-like-a-flag", "flag-like expression kept");
  expect_true(options.verbose, "verbose parsed");
}

void test_parse_cli_args_expr_file() {
  jpx::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--expr-file", "query.jpx"}, options, error);
  expect_true(ok, "--expr-file accepted");
  expect_true(options.expression_file == "query.jpx", "file path stored");
  expect_true(!options.expression_set, "no inline expression");
}

void test_parse_cli_args_check() {
  jpx::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--check", "first('a')"}, options, error);
  expect_true(ok, "--check accepted");
  expect_true(options.check && options.expression == "first('a')", "check expression stored");
}

void test_parse_cli_args_help_and_version() {
  jpx::cli::CliOptions options;
  std::string error;
  expect_true(parse({"--help"}, options, error) && options.show_help, "--help parsed");
  jpx::cli::CliOptions short_help;
  expect_true(parse({"-h"}, short_help, error) && short_help.show_help, "-h parsed");
  jpx::cli::CliOptions version;
  expect_true(parse({"--version"}, version, error) && version.show_version, "--version parsed");
}

void test_parse_cli_args_rejects_missing_value() {
  jpx::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--expr-file"}, options, error);
  expect_true(!ok, "missing value is rejected");
  expect_true(error.find("Missing value for --expr-file") != std::string::npos,
              "missing value has clear error");
  ok = parse({"--expr"}, options, error);
  expect_true(!ok && error.find("Missing value for --expr") != std::string::npos,
              "missing --expr value rejected");
}

void test_parse_cli_args_rejects_unknown_argument() {
  jpx::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--unknown"}, options, error);
  expect_true(!ok, "unknown argument is rejected");
  expect_true(error.find("Unknown argument: --unknown") != std::string::npos,
              "unknown argument has clear error");
}

void test_parse_cli_args_rejects_conflicting_sources() {
  jpx::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"first('a')", "first('b')"}, options, error), "two expressions rejected");
  expect_true(!parse({"first('a')", "--expr-file", "x.jpx"}, options, error),
              "expression plus file rejected");
  expect_true(!parse({"--check", "first('a')", "--expr-file", "x.jpx"}, options, error),
              "check plus file rejected");
}

void test_parse_cli_args_failure_leaves_options_untouched() {
  jpx::cli::CliOptions options;
  options.compact = true;
  std::string error;
  bool ok = parse({"--verbose", "--bogus"}, options, error);
  expect_true(!ok, "bogus flag rejected");
  expect_true(options.compact && !options.verbose, "options unchanged on failure");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_positional_expression", test_parse_cli_args_positional_expression});
  tests.push_back({"parse_cli_args_expr_flag", test_parse_cli_args_expr_flag});
  tests.push_back({"parse_cli_args_expr_file", test_parse_cli_args_expr_file});
  tests.push_back({"parse_cli_args_check", test_parse_cli_args_check});
  tests.push_back({"parse_cli_args_help_and_version", test_parse_cli_args_help_and_version});
  tests.push_back({"parse_cli_args_rejects_missing_value", test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_unknown_argument",
                   test_parse_cli_args_rejects_unknown_argument});
  tests.push_back({"parse_cli_args_rejects_conflicting_sources",
                   test_parse_cli_args_rejects_conflicting_sources});
  tests.push_back({"parse_cli_args_failure_leaves_options_untouched",
                   test_parse_cli_args_failure_leaves_options_untouched});
}
