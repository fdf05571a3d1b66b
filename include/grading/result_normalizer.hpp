#pragma once

#include <string>
#include <vector>
#include "grading/submission.hpp"

namespace codegrade {

/**
 * @brief Turn the stdout of a successful harness run into a grading report
 * Parsing is attempted once. Callers needing resilience should retry the
 * whole execution instead.
 *
 * @param stdout_text stdout of the harness, one JSON array line
 * @param tests the test cases embedded into the harness, in order
 * @return report with details[i].testcase == tests[i] and total == tests.size()
 * @throw malformed_output if stdout is not a JSON array of verdict records
 * with one record per test case
 */
grading_report normalize_results(const std::string &stdout_text, const std::vector<test_case> &tests);

}  // namespace codegrade
