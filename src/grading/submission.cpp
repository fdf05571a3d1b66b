#include "grading/submission.hpp"
#include "common/json_utils.hpp"

namespace codegrade {
using namespace std;

bool test_case::operator==(const test_case &other) const {
    return input == other.input && expected == other.expected && description == other.description;
}

void from_json(const nlohmann::json &j, test_case &test) {
    if (!j.is_object())
        throw invalid_argument("test case must be an object, got " + j.dump());
    test.input = access_optional(j, "input");
    test.expected = access_optional(j, "expected");
    test.description = get_value_def<string>(j, "", "description");
}

void to_json(nlohmann::json &j, const test_case &test) {
    j = {{"input", test.input},
         {"expected", test.expected},
         {"description", test.description}};
}

void from_json(const nlohmann::json &j, submission &submit) {
    submit.code = get_value<string>(j, "code");
    submit.language = get_value<string>(j, "language");
    submit.test_cases.clear();
    if (exists(j, "testCases")) {
        const nlohmann::json &tests = access(j, "testCases");
        if (!tests.is_array())
            throw build_invalid_argument(j, "testCases");
        for (auto &test : tests)
            submit.test_cases.push_back(test.get<test_case>());
    }
}

void to_json(nlohmann::json &j, const test_verdict &verdict) {
    j = {{"testCase", verdict.testcase},
         {"passed", verdict.passed}};
    if (verdict.actual) j["actual"] = *verdict.actual;
    if (verdict.error) j["error"] = *verdict.error;
}

void to_json(nlohmann::json &j, const grading_report &report) {
    j = {{"passed", report.passed},
         {"total", report.total},
         {"details", report.details}};
}

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {{"success", result.success}};
    if (result.output) j["output"] = *result.output;
    if (result.error) {
        j["error"] = *result.error;
        j["errorCode"] = error_name(result.code);
    }
    if (result.test_results) j["testResults"] = *result.test_results;
}

}  // namespace codegrade
