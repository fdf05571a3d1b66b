#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "grading/harness.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace codegrade;

class HarnessTest : public ::testing::Test {
protected:
    vector<test_case> tests = {
        {nlohmann::json::array({1, 2}), 3, "adds two numbers"},
        {{{"text", "'); process.exit(0); //"}}, "\"quoted\"", "hostile strings"}};
};

TEST_F(HarnessTest, EmptyTestsReturnCodeAsIs) {
    string code = "console.log('hi')";
    EXPECT_EQ(harness::render(get_language("javascript"), code, {}), code);
    EXPECT_EQ(harness::render(get_language("java"), code, {}), code);
}

TEST_F(HarnessTest, LanguageWithoutHarnessRejectsTests) {
    EXPECT_THROW(harness::render(get_language("java"), "class Main {}", tests), language_unsupported);
    EXPECT_THROW(harness::render(get_language("typescript"), "", tests), language_unsupported);
}

TEST_F(HarnessTest, CandidateCodeIsEmbeddedUnmodified) {
    string code = "function solution(input) {\n  return input[0] + input[1]; // %TESTS% %ENTRY%\n}";
    string js = harness::render(get_language("javascript"), code, tests);
    EXPECT_NE(js.find(code), string::npos);

    string py = "def solution(input):\n    return '%MISSING%'";
    EXPECT_NE(harness::render(get_language("python"), py, tests).find(py), string::npos);
}

TEST_F(HarnessTest, TestDataIsNeverSplicedAsLiteral) {
    string js = harness::render(get_language("javascript"), "", tests);
    EXPECT_EQ(js.find("process.exit(0)"), string::npos);
    EXPECT_NE(js.find(harness::encode_test_cases(tests)), string::npos);

    string py = harness::render(get_language("python"), "", tests);
    EXPECT_EQ(py.find("process.exit(0)"), string::npos);
    EXPECT_NE(py.find(harness::encode_test_cases(tests)), string::npos);
}

TEST_F(HarnessTest, EncodedTestCasesDecodeToJson) {
    auto decoded = nlohmann::json::parse(base64_decode(harness::encode_test_cases(tests)));
    EXPECT_JSON_EQ(decoded, nlohmann::json(tests));
    EXPECT_EQ(decoded.at(1).at("description"), "hostile strings");
}

TEST_F(HarnessTest, EntryPointMustBeIdentifier) {
    string js = harness::render(get_language("javascript"), "", tests, "twoSum");
    EXPECT_NE(js.find("typeof twoSum"), string::npos);
    EXPECT_THROW(harness::render(get_language("javascript"), "", tests, "a; process.exit(1)"), invalid_argument);
    EXPECT_THROW(harness::render(get_language("python"), "", tests, "1abc"), invalid_argument);
}

TEST_F(HarnessTest, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64_decode("Zm8="), "fo");
    EXPECT_EQ(base64_decode("Zm8"), "fo");
    EXPECT_EQ(base64_decode("Zg=="), "f");
    EXPECT_THROW(base64_decode("Zm9v!!!!"), invalid_argument);
}

TEST(BoilerplateTest, KnownLanguages) {
    EXPECT_EQ(harness::boilerplate("javascript"),
              "function solution(input) {\n"
              "    // Your code here\n"
              "    return input;\n"
              "}");
    EXPECT_EQ(harness::boilerplate("python"),
              "def solution(input):\n"
              "    # Your code here\n"
              "    return input");
    EXPECT_NE(harness::boilerplate("java").find("public static Object solution(Object input)"), string::npos);
    EXPECT_NE(harness::boilerplate("cpp").find("#include <vector>"), string::npos);
}

TEST(BoilerplateTest, UnknownLanguageFallsBackToJavascript) {
    string code = harness::boilerplate("haskell");
    EXPECT_EQ(code.rfind("// haskell boilerplate not available\n", 0), 0u);
    EXPECT_NE(code.find("function solution(input)"), string::npos);
}

TEST(BoilerplateTest, CustomEntryPoint) {
    EXPECT_EQ(harness::boilerplate("py", "two_sum").rfind("def two_sum(input):", 0), 0u);
}

TEST(BoilerplateTest, RejectsEntryPointThatIsNotAnIdentifier) {
    EXPECT_THROW(harness::boilerplate("javascript", "solve me"), invalid_argument);
    EXPECT_THROW(harness::boilerplate("python", "x);import os#"), invalid_argument);
}
