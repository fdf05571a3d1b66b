#pragma once

#include <string>
#include <vector>
#include "grading/language.hpp"
#include "grading/submission.hpp"

/**
 * Harness templates wrap candidate code into a program that
 * 1. defines the candidate code unmodified,
 * 2. decodes the embedded test cases,
 * 3. calls the entry point once per test case, catching errors per test case,
 * 4. compares the returned value to expected by canonical JSON equality,
 * 5. writes one JSON array line of verdict records to stdout.
 *
 * Anything the candidate prints goes to stderr, so the verdict line is the
 * only content on stdout. Each record has the shape
 * {"input", "expected", "actual", "passed", "error"?, "description"}.
 *
 * Test cases are embedded as base64 of their JSON text, so test data is
 * never spliced into source code as a literal.
 */
namespace codegrade::harness {

/**
 * @brief Default entry point every gradable submission must define
 */
extern const char *const ENTRY_POINT;

/**
 * @brief Error recorded per test case when the entry point is not defined
 */
extern const char *const MISSING_ENTRY_POINT;

/**
 * @brief Harness for Node.js
 */
std::string javascript(const std::string &code, const std::vector<test_case> &tests, const std::string &entry_point);

/**
 * @brief Harness for CPython 3
 */
std::string python(const std::string &code, const std::vector<test_case> &tests, const std::string &entry_point);

/**
 * @brief base64 of the JSON array of tests, as decoded by every harness
 */
std::string encode_test_cases(const std::vector<test_case> &tests);

/**
 * @brief Build the program to execute for a submission
 * @return the code itself if tests is empty, otherwise the harness program
 * @throw language_unsupported if tests is not empty and lang has no harness
 * @throw std::invalid_argument if entry_point is not a plain identifier
 */
std::string render(const language &lang, const std::string &code, const std::vector<test_case> &tests, const std::string &entry_point = ENTRY_POINT);

/**
 * @brief Starter code to pre-fill a candidate's editor
 * @param language language id or alias, unknown languages get a commented fallback
 * @param entry_point name of the function to declare
 */
std::string boilerplate(const std::string &language, const std::string &entry_point = ENTRY_POINT);

}  // namespace codegrade::harness
