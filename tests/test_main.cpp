#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<crucible::tests::TestCase> &tests);
void register_config_tests(std::vector<crucible::tests::TestCase> &tests);
void register_observability_tests(std::vector<crucible::tests::TestCase> &tests);
void register_workspace_tests(std::vector<crucible::tests::TestCase> &tests);
void register_languages_tests(std::vector<crucible::tests::TestCase> &tests);
void register_runtime_tests(std::vector<crucible::tests::TestCase> &tests);
void register_container_tests(std::vector<crucible::tests::TestCase> &tests);
void register_pool_tests(std::vector<crucible::tests::TestCase> &tests);
void register_engine_tests(std::vector<crucible::tests::TestCase> &tests);
void register_tools_tests(std::vector<crucible::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<crucible::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_workspace_tests(tests);
  register_languages_tests(tests);
  register_runtime_tests(tests);
  register_container_tests(tests);
  register_pool_tests(tests);
  register_engine_tests(tests);
  register_tools_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
