#pragma once

#include <gtest/gtest.h>

/*
 * Utility macros for Google Test.
 *
 * To give a Google test access to private members of a class, forward-declare the test outside of
 * the class's namespace and befriend it:
 *
 * GTEST_FORWARD_DECLARE(TestClassName, test_name);
 *
 * namespace n {
 * class ClassBeingTested {
 *   ...
 *   FRIEND_GTEST(TestClassName, test_name);
 * };
 * }  // namespace n
 *
 * TEST(TestClassName, test_name) {
 *   // private members of n::ClassBeingTested are accessible here
 * }
 */

#define GTEST_FORWARD_DECLARE(test_case_name, test_name) \
  class GTEST_TEST_CLASS_NAME_(test_case_name, test_name)

#define FRIEND_GTEST(test_case_name, test_name) \
  friend class ::GTEST_TEST_CLASS_NAME_(test_case_name, test_name)

// Dispatches to standard gtest main function, while adding LoggingUtil and Random cmdline params
int launch_gtest(int argc, char** argv);
