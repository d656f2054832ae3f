#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct TestCase {
  const char* name;
  void (*fn)();
};

extern int g_failures;
extern std::string g_current_test;

void expect_true(bool condition, const std::string& message);
void expect_eq(size_t actual, size_t expected, const std::string& message);
void expect_eq(const std::string& actual, const std::string& expected, const std::string& message);

/// Runs every test, or only the one named by argv[1].
/// Returns the process exit code.
int run_tests(const std::vector<TestCase>& tests, int argc, char** argv);
