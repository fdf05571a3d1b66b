#include "grading/harness.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <regex>
#include <stdexcept>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codegrade::harness {
using namespace std;

const char *const ENTRY_POINT = "solution";
const char *const MISSING_ENTRY_POINT = "reference error";

// Prologues run before the candidate code and reroute its prints to stderr.
// Epilogues may contain placeholders, they are substituted before the
// candidate code is appended so the code itself is never rewritten.

static const char *JAVASCRIPT_PROLOGUE = R"(const __codegrade_stdout = process.stdout.write.bind(process.stdout);
process.stdout.write = process.stderr.write.bind(process.stderr);
)";

static const char *JAVASCRIPT_EPILOGUE = R"(
;(function () {
  const canonical = (value) => {
    if (value === undefined || value === null) return 'null';
    switch (typeof value) {
      case 'number': return Number.isFinite(value) ? JSON.stringify(value) : 'null';
      case 'bigint': return value.toString();
      case 'string':
      case 'boolean': return JSON.stringify(value);
      case 'function':
      case 'symbol': return JSON.stringify(String(value));
    }
    if (Array.isArray(value)) return '[' + value.map(canonical).join(',') + ']';
    if (value instanceof Set) return canonical(Array.from(value));
    if (value instanceof Map) return canonical(Object.fromEntries(value));
    if (typeof value.toJSON === 'function') return canonical(value.toJSON());
    return '{' + Object.keys(value).sort()
      .map((key) => JSON.stringify(key) + ':' + canonical(value[key])).join(',') + '}';
  };
  const testCases = JSON.parse(Buffer.from('%TESTS%', 'base64').toString('utf8'));
  const results = [];
  for (const testCase of testCases) {
    const record = {
      input: testCase.input,
      expected: testCase.expected,
      actual: null,
      passed: false,
      description: testCase.description
    };
    if (typeof %ENTRY% !== 'function') {
      record.error = '%MISSING%';
    } else {
      try {
        const actual = JSON.parse(canonical(%ENTRY%(testCase.input)));
        record.actual = actual;
        record.passed = canonical(actual) === canonical(testCase.expected);
      } catch (error) {
        record.error = error instanceof Error ? error.message : String(error);
      }
    }
    results.push(record);
  }
  __codegrade_stdout(JSON.stringify(results) + '\n');
})();
)";

static const char *PYTHON_PROLOGUE = R"(import base64 as __codegrade_base64
import json as __codegrade_json
import math as __codegrade_math
import sys as __codegrade_sys

__codegrade_stdout = __codegrade_sys.stdout
__codegrade_sys.stdout = __codegrade_sys.stderr

)";

static const char *PYTHON_EPILOGUE = R"(


def __codegrade_plain(value):
    if value is None or isinstance(value, (bool, str, int)):
        return value
    if isinstance(value, float):
        if __codegrade_math.isnan(value) or __codegrade_math.isinf(value):
            return None
        return int(value) if value.is_integer() else value
    if isinstance(value, (list, tuple)):
        return [__codegrade_plain(item) for item in value]
    if isinstance(value, (set, frozenset)):
        return [__codegrade_plain(item) for item in sorted(value, key=repr)]
    if isinstance(value, dict):
        return {str(key): __codegrade_plain(item) for key, item in value.items()}
    return repr(value)


def __codegrade_canonical(value):
    return __codegrade_json.dumps(__codegrade_plain(value), sort_keys=True, separators=(',', ':'))


def __codegrade_run():
    test_cases = __codegrade_json.loads(__codegrade_base64.b64decode('%TESTS%').decode('utf-8'))
    entry = globals().get('%ENTRY%')
    results = []
    for test_case in test_cases:
        record = {
            'input': test_case['input'],
            'expected': test_case['expected'],
            'actual': None,
            'passed': False,
            'description': test_case['description'],
        }
        if not callable(entry):
            record['error'] = '%MISSING%'
        else:
            try:
                actual = __codegrade_plain(entry(test_case['input']))
                record['actual'] = actual
                record['passed'] = __codegrade_canonical(actual) == __codegrade_canonical(test_case['expected'])
            except Exception as e:
                record['error'] = str(e) or type(e).__name__
        results.append(record)
    __codegrade_stdout.write(__codegrade_json.dumps(results) + '\n')
    __codegrade_stdout.flush()


__codegrade_run()
)";

static string check_entry_point(const string &entry_point) {
    static const regex identifier("^[A-Za-z_][A-Za-z0-9_]*$");
    if (!regex_match(entry_point, identifier))
        throw invalid_argument("entry point is not an identifier: " + entry_point);
    return entry_point;
}

static string fill(string text, const vector<test_case> &tests, const string &entry_point) {
    boost::algorithm::replace_all(text, "%TESTS%", encode_test_cases(tests));
    boost::algorithm::replace_all(text, "%ENTRY%", check_entry_point(entry_point));
    boost::algorithm::replace_all(text, "%MISSING%", MISSING_ENTRY_POINT);
    return text;
}

string encode_test_cases(const vector<test_case> &tests) {
    nlohmann::json j = tests;
    return base64_encode(j.dump());
}

string javascript(const string &code, const vector<test_case> &tests, const string &entry_point) {
    string epilogue = fill(JAVASCRIPT_EPILOGUE, tests, entry_point);
    return JAVASCRIPT_PROLOGUE + code + epilogue;
}

string python(const string &code, const vector<test_case> &tests, const string &entry_point) {
    string epilogue = fill(PYTHON_EPILOGUE, tests, entry_point);
    return PYTHON_PROLOGUE + code + epilogue;
}

string render(const language &lang, const string &code, const vector<test_case> &tests, const string &entry_point) {
    if (tests.empty()) return code;
    if (!lang.harness) throw language_unsupported(lang.id, "test cases cannot be graded for this language");
    return lang.harness(code, tests, entry_point);
}

string boilerplate(const string &language, const string &entry_point) {
    string lang = to_lower(language);
    string name = check_entry_point(entry_point);

    if (lang == "javascript" || lang == "js") {
        return "function " + name + "(input) {\n"
               "    // Your code here\n"
               "    return input;\n"
               "}";
    } else if (lang == "python" || lang == "py") {
        return "def " + name + "(input):\n"
               "    # Your code here\n"
               "    return input";
    } else if (lang == "java") {
        return "public class Solution {\n"
               "    public static Object " + name + "(Object input) {\n"
               "        // Your code here\n"
               "        return input;\n"
               "    }\n"
               "}";
    } else if (lang == "cpp" || lang == "c++") {
        return "#include <iostream>\n"
               "#include <vector>\n"
               "using namespace std;\n"
               "\n"
               "auto " + name + "(auto input) {\n"
               "    // Your code here\n"
               "    return input;\n"
               "}";
    } else {
        return "// " + language + " boilerplate not available\n"
               "function " + name + "(input) {\n"
               "    // Your code here\n"
               "    return input;\n"
               "}";
    }
}

}  // namespace codegrade::harness
