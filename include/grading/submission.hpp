#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"

/**
 * This header contains the data passed through one grading request:
 * 1. submission (code, language and test cases supplied by the caller)
 * 2. execution_outcome (what one executor observed)
 * 3. test_verdict / grading_report (what the result normalizer derived)
 * 4. execution_result (what the caller receives)
 */
namespace codegrade {

/**
 * @brief One declarative test case from the question bank
 * The harness calls solution(input) and compares the return value
 * to expected using canonical JSON equality.
 */
struct test_case {
    nlohmann::json input;
    nlohmann::json expected;
    std::string description;

    bool operator==(const test_case &other) const;
};

void from_json(const nlohmann::json &j, test_case &test);
void to_json(nlohmann::json &j, const test_case &test);

/**
 * @brief A grading request
 * Immutable once built, owned by the call that grades it.
 */
struct submission {
    /**
     * @brief Internal language id or one of its aliases, e.g. "javascript", "py"
     */
    std::string language;

    /**
     * @brief Candidate code, embedded into the harness unmodified
     */
    std::string code;

    /**
     * @brief May be empty, then the code runs as-is and its stdout is returned
     */
    std::vector<test_case> test_cases;
};

void from_json(const nlohmann::json &j, submission &submit);

/**
 * @brief What an executor observed while running one program
 */
struct execution_outcome {
    /**
     * @brief true iff the program exited normally with code 0
     */
    bool success = false;

    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief exit status, or -signal if the program died from a signal
     */
    int exit_code = 0;

    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Verdict of one test case
 */
struct test_verdict {
    test_case testcase;
    bool passed = false;

    /**
     * @brief Value returned by the entry point, null if it threw
     */
    std::optional<nlohmann::json> actual;

    /**
     * @brief Message of the error raised while running this test case
     */
    std::optional<std::string> error;
};

void to_json(nlohmann::json &j, const test_verdict &verdict);

/**
 * @brief Aggregate verdict of one submission
 * passed == 0 always means no test actually passed, never "unknown".
 * details[i] belongs to test_cases[i].
 */
struct grading_report {
    size_t passed = 0;
    size_t total = 0;
    std::vector<test_verdict> details;
};

void to_json(nlohmann::json &j, const grading_report &report);

/**
 * @brief Result handed back to callers
 * Exactly one of the following holds:
 * 1. success == false, error and code are set
 * 2. success == true, test_results is set if test cases were supplied,
 *    otherwise output holds the program's stdout
 */
struct execution_result {
    bool success = false;
    std::optional<std::string> output;
    std::optional<std::string> error;
    error_code code = error_code::NONE;
    std::optional<grading_report> test_results;
};

void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace codegrade
