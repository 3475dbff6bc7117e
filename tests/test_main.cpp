#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "test_harness.h"
#include "util/string_util.h"

void register_value_tests(std::vector<TestCase>& tests);
void register_lexer_tests(std::vector<TestCase>& tests);
void register_expr_parser_tests(std::vector<TestCase>& tests);
void register_path_parser_tests(std::vector<TestCase>& tests);
void register_filter_tests(std::vector<TestCase>& tests);
void register_matcher_tests(std::vector<TestCase>& tests);
void register_builtin_tests(std::vector<TestCase>& tests);
void register_e2e_tests(std::vector<TestCase>& tests);
void register_cli_args_tests(std::vector<TestCase>& tests);
void register_cli_utils_tests(std::vector<TestCase>& tests);

namespace {

/// Reads JPX_TEST_SKIP as a comma-separated list of test names.
std::unordered_set<std::string> skip_list_from_env() {
  std::unordered_set<std::string> out;
  const char* raw = std::getenv("JPX_TEST_SKIP");
  if (raw == nullptr) return out;
  std::istringstream iss(raw);
  std::string token;
  while (std::getline(iss, token, ',')) {
    std::string name = jpx::util::trim_ws(token);
    if (!name.empty()) out.insert(name);
  }
  return out;
}

const TestCase* find_test(const std::vector<TestCase>& tests, const std::string& name) {
  for (const auto& test : tests) {
    if (name == test.name) return &test;
  }
  return nullptr;
}

}  // namespace

/// Usage: jpx_tests [--list] [test_name...]
/// With no names every registered test runs, minus those listed in JPX_TEST_SKIP.
int main(int argc, char** argv) {
  std::vector<TestCase> tests;
  tests.reserve(128);
  register_value_tests(tests);
  register_lexer_tests(tests);
  register_expr_parser_tests(tests);
  register_path_parser_tests(tests);
  register_filter_tests(tests);
  register_matcher_tests(tests);
  register_builtin_tests(tests);
  register_e2e_tests(tests);
  register_cli_args_tests(tests);
  register_cli_utils_tests(tests);

  std::vector<std::string> names(argv + 1, argv + argc);
  if (names.size() == 1 && names[0] == "--list") {
    for (const auto& test : tests) std::cout << test.name << "\n";
    return EXIT_SUCCESS;
  }

  const auto skip = skip_list_from_env();
  std::vector<TestCase> selected;
  if (names.empty()) {
    for (const auto& test : tests) {
      if (skip.count(test.name) == 0) selected.push_back(test);
    }
  } else {
    for (const auto& name : names) {
      const TestCase* test = find_test(tests, name);
      if (test == nullptr) {
        std::cerr << "Unknown test: " << name << " (use --list)" << std::endl;
        return EXIT_FAILURE;
      }
      if (skip.count(name) == 0) selected.push_back(*test);
    }
  }
  if (selected.size() < (names.empty() ? tests.size() : names.size())) {
    std::cout << "Skipped " << ((names.empty() ? tests.size() : names.size()) - selected.size())
              << " test(s) via JPX_TEST_SKIP." << std::endl;
  }
  return run_all_tests(selected);
}
