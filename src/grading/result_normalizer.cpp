#include "grading/result_normalizer.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"

namespace codegrade {
using namespace std;

static test_verdict parse_verdict(const nlohmann::json &record, const test_case &testcase, size_t index, const string &output) {
    if (!record.is_object())
        throw malformed_output(fmt::format("Failed to parse test results: record {} is not an object", index), output);
    auto passed = record.find("passed");
    if (passed == record.end() || !passed->is_boolean())
        throw malformed_output(fmt::format("Failed to parse test results: record {} has no boolean \"passed\"", index), output);

    test_verdict verdict;
    verdict.testcase = testcase;
    verdict.passed = passed->get<bool>();

    auto actual = record.find("actual");
    if (actual != record.end()) verdict.actual = *actual;

    auto error = record.find("error");
    if (error != record.end() && !error->is_null())
        verdict.error = error->is_string() ? error->get<string>() : error->dump();

    return verdict;
}

grading_report normalize_results(const string &stdout_text, const vector<test_case> &tests) {
    string output = boost::algorithm::trim_copy(stdout_text);

    nlohmann::json records;
    try {
        records = nlohmann::json::parse(output);
    } catch (nlohmann::json::parse_error &e) {
        LOG(WARNING) << "Harness output is not valid JSON: " << e.what();
        throw malformed_output("Failed to parse test results", stdout_text);
    }

    if (!records.is_array())
        throw malformed_output("Failed to parse test results: expected a JSON array", stdout_text);
    if (records.size() != tests.size())
        throw malformed_output(fmt::format("Failed to parse test results: expected {} records, got {}", tests.size(), records.size()), stdout_text);

    grading_report report;
    report.total = tests.size();
    for (size_t i = 0; i < tests.size(); ++i) {
        report.details.push_back(parse_verdict(records[i], tests[i], i, stdout_text));
        if (report.details.back().passed) ++report.passed;
    }
    return report;
}

}  // namespace codegrade
