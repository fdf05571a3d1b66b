#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "common/cancellation.hpp"
#include "evaluator/qualitative_evaluator.hpp"
#include "grading/submission.hpp"
#include "sandbox/executor.hpp"

namespace codegrade {

struct grading_options {
    std::chrono::milliseconds timeout{10000};
    sandbox::backend backend = sandbox::backend::AUTO;

    /**
     * @brief Function the harness calls once per test case
     */
    std::string entry_point = "solution";
};

/**
 * @brief Entry point of the grading engine.
 *
 * A grading request flows through
 * harness::render -> executor_factory::select -> executor::execute -> normalize_results.
 * Everything that can be rejected without side effects (unknown language,
 * language without harness, no executor) is rejected before a file is
 * written or a request is sent.
 */
struct grader {
    grader(sandbox::executor_factory executors, std::shared_ptr<qualitative_evaluator> evaluator);

    /**
     * @brief Run a submission and grade it against its test cases
     * @return result with success == true, and test_results set iff submit has test cases,
     * output set otherwise
     * @throw grading_exception (one of its subclasses) if the program could not be graded
     * @throw std::invalid_argument if options.entry_point is not an identifier
     */
    execution_result execute_code(const submission &submit, const grading_options &options, const cancellation_token &cancel = cancellation_token());

    /**
     * @brief Same as execute_code, except that grading failures are reported in the result
     * @return result with success == false, code and error set if grading failed
     * @throw std::invalid_argument if options.entry_point is not an identifier
     */
    execution_result run(const submission &submit, const grading_options &options, const cancellation_token &cancel = cancellation_token());

    /**
     * @brief Ask the AI judge for an opinion, never throws
     */
    qualitative_score evaluate_qualitative(const std::string &code, const std::string &question, const std::vector<test_case> &tests) noexcept;

private:
    sandbox::executor_factory executors;
    std::shared_ptr<qualitative_evaluator> evaluator;
};

/**
 * @brief Failed result carrying the error of ex
 */
execution_result failed_result(const grading_exception &ex);

}  // namespace codegrade
