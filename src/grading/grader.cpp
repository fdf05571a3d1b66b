#include "grading/grader.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "grading/harness.hpp"
#include "grading/language.hpp"
#include "grading/result_normalizer.hpp"

namespace codegrade {
using namespace std;

grader::grader(sandbox::executor_factory executors, shared_ptr<qualitative_evaluator> evaluator)
    : executors(move(executors)), evaluator(move(evaluator)) {}

execution_result grader::execute_code(const submission &submit, const grading_options &options, const cancellation_token &cancel) {
    const language &lang = get_language(submit.language);
    string program = harness::render(lang, submit.code, submit.test_cases, options.entry_point);
    sandbox::executor &runner = executors.select(lang, options.backend);

    DLOG(INFO) << "Grading " << submit.test_cases.size() << " test cases of " << lang.id << " on " << runner.name();
    execution_outcome outcome = runner.execute({&lang, program, options.timeout}, cancel);
    if (!outcome.success)
        throw compile_error(outcome.exit_code, outcome.stdout_text, outcome.stderr_text);

    execution_result result;
    result.success = true;
    if (submit.test_cases.empty())
        result.output = outcome.stdout_text;
    else
        result.test_results = normalize_results(outcome.stdout_text, submit.test_cases);
    return result;
}

execution_result grader::run(const submission &submit, const grading_options &options, const cancellation_token &cancel) {
    try {
        return execute_code(submit, options, cancel);
    } catch (grading_exception &e) {
        LOG(WARNING) << "Grading " << submit.language << " failed with " << e.code() << ": " << e.what();
        return failed_result(e);
    }
}

qualitative_score grader::evaluate_qualitative(const string &code, const string &question, const vector<test_case> &tests) noexcept {
    if (!evaluator) return qualitative_score::unavailable();
    return evaluator->evaluate(code, question, tests);
}

execution_result failed_result(const grading_exception &ex) {
    execution_result result;
    result.success = false;
    result.code = ex.code();
    result.error = ex.what();
    return result;
}

}  // namespace codegrade
