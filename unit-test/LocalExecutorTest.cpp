#include <unistd.h>
#include <filesystem>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "grading/grader.hpp"
#include "gtest/gtest.h"
#include "sandbox/local_executor.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace std::chrono;
using namespace codegrade;
using namespace codegrade::sandbox;

class LocalExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        local_executor_options local_options = local_executor_options::from_config();
        local_options.temp_dir = TEMP_DIR / "local";
        local_options.kill_grace = milliseconds(200);
        local_options.enabled = true;
        temp_dir = local_options.temp_dir;

        pool = make_shared<execution_pool>(2, 4);
        local = make_shared<local_executor>(pool, local_options);
        engine = make_unique<grader>(executor_factory(local, nullptr), nullptr);

        options.timeout = milliseconds(5000);
        options.backend = backend::LOCAL;
    }

    execution_result grade(const string &language, const string &code, const vector<test_case> &tests) {
        return engine->run({language, code, tests}, options);
    }

    bool temp_dir_empty() const {
        return !filesystem::exists(temp_dir) || filesystem::is_empty(temp_dir);
    }

    filesystem::path temp_dir;
    shared_ptr<execution_pool> pool;
    shared_ptr<local_executor> local;
    unique_ptr<grader> engine;
    grading_options options;
};

TEST_F(LocalExecutorTest, JavascriptPassingTest) {
    REQUIRE_PROGRAM("node");
    auto result = grade("javascript", "function solution(x){return x*2}", {{2, 4, "doubles"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    ASSERT_TRUE(result.test_results);
    EXPECT_EQ(result.test_results->passed, 1u);
    EXPECT_EQ(result.test_results->total, 1u);
    EXPECT_TRUE(result.test_results->details[0].passed);
    EXPECT_JSON_EQ(*result.test_results->details[0].actual, 4);
    EXPECT_TRUE(temp_dir_empty());
}

TEST_F(LocalExecutorTest, JavascriptWrongAnswerIsNotAnError) {
    REQUIRE_PROGRAM("node");
    auto result = grade("javascript", "function solution(x){return x*2}", {{2, 5, "wrong"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.test_results->passed, 0u);
    EXPECT_EQ(result.test_results->total, 1u);
    EXPECT_FALSE(result.test_results->details[0].passed);
    EXPECT_JSON_EQ(*result.test_results->details[0].actual, 4);
    EXPECT_FALSE(result.test_results->details[0].error);
}

TEST_F(LocalExecutorTest, JavascriptRuntimeErrorStaysInsideTestCase) {
    REQUIRE_PROGRAM("node");
    string code = "function solution(x){ if (x === 0) throw new Error('zero'); return x }";
    auto result = grade("js", code, {{0, 0, "throws"}, {1, 1, "returns"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    ASSERT_EQ(result.test_results->details.size(), 2u);
    EXPECT_FALSE(result.test_results->details[0].passed);
    EXPECT_EQ(result.test_results->details[0].error, "zero");
    EXPECT_TRUE(result.test_results->details[1].passed);
    EXPECT_EQ(result.test_results->passed, 1u);
}

TEST_F(LocalExecutorTest, JavascriptInfiniteLoopTimesOut) {
    REQUIRE_PROGRAM("node");
    options.timeout = milliseconds(1000);
    elapsed_time timer;
    auto result = grade("javascript", "function solution(){while(true){}}", {{1, 1, "loops"}});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, codegrade::error_code::TIMEOUT);
    EXPECT_FALSE(result.test_results);
    EXPECT_LT(timer.duration<milliseconds>().count(), 5000);
    EXPECT_TRUE(temp_dir_empty());
}

TEST_F(LocalExecutorTest, JavascriptPrintsDoNotCorruptVerdicts) {
    REQUIRE_PROGRAM("node");
    string code = "console.log('top level noise');\n"
                  "function solution(x){ console.log('noise', x); process.stdout.write('more'); return x + 1 }";
    auto result = grade("javascript", code, {{1, 2, "prints"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.test_results->passed, 1u);
}

TEST_F(LocalExecutorTest, JavascriptStructuralEquality) {
    REQUIRE_PROGRAM("node");
    string code = "function solution(x){ return {b: [1, 2], a: x} }";
    nlohmann::json expected = {{"a", "k"}, {"b", {1, 2}}};
    auto result = grade("javascript", code, {{"k", expected, "key order"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.test_results->passed, 1u);
}

TEST_F(LocalExecutorTest, MissingEntryPoint) {
    REQUIRE_PROGRAM("node");
    auto result = grade("javascript", "function answer(x){return x}", {{1, 1, "no solution"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.test_results->passed, 0u);
    EXPECT_EQ(result.test_results->details[0].error, "reference error");
}

TEST_F(LocalExecutorTest, SyntaxErrorIsCompileError) {
    REQUIRE_PROGRAM("node");
    auto result = grade("javascript", "function solution(x) { return x", {{1, 1, "broken"}});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, codegrade::error_code::COMPILE_ERROR);
    ASSERT_TRUE(result.error);
    EXPECT_NE(result.error->find("SyntaxError"), string::npos);
    EXPECT_TRUE(temp_dir_empty());
}

TEST_F(LocalExecutorTest, JavascriptWithoutTestsReturnsStdout) {
    REQUIRE_PROGRAM("node");
    auto result = grade("javascript", "console.log('hello world')", {});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "hello world\n");
    EXPECT_FALSE(result.test_results);
}

TEST_F(LocalExecutorTest, PythonPassingAndFailingTests) {
    REQUIRE_PROGRAM("python3");
    string code = "def solution(nums):\n"
                  "    return sorted(nums)\n";
    auto result = grade("python", code, {
        {nlohmann::json::array({3, 1, 2}), nlohmann::json::array({1, 2, 3}), "sorts"},
        {nlohmann::json::array({2, 1}), nlohmann::json::array({2, 1}), "wrong expectation"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.test_results->passed, 1u);
    EXPECT_EQ(result.test_results->total, 2u);
    EXPECT_TRUE(result.test_results->details[0].passed);
    EXPECT_FALSE(result.test_results->details[1].passed);
}

TEST_F(LocalExecutorTest, PythonCanonicalEquality) {
    REQUIRE_PROGRAM("python3");
    string code = "def solution(x):\n"
                  "    print('debugging output')\n"
                  "    return {'pair': (x, x * 2.0), 'name': 'v'}\n";
    nlohmann::json expected = {{"name", "v"}, {"pair", {3, 6}}};
    auto result = grade("py", code, {{3, expected, "tuple, float and key order"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.test_results->passed, 1u);
}

TEST_F(LocalExecutorTest, PythonExceptionStaysInsideTestCase) {
    REQUIRE_PROGRAM("python3");
    string code = "def solution(x):\n"
                  "    return 10 // x\n";
    auto result = grade("python", code, {{0, 0, "divides by zero"}, {5, 2, "divides"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_FALSE(result.test_results->details[0].passed);
    ASSERT_TRUE(result.test_results->details[0].error);
    EXPECT_NE(result.test_results->details[0].error->find("division"), string::npos);
    EXPECT_TRUE(result.test_results->details[1].passed);
}

TEST_F(LocalExecutorTest, PythonExitIsCompileError) {
    REQUIRE_PROGRAM("python3");
    auto result = grade("python", "import sys\nsys.stderr.write('fatal')\nsys.exit(2)\n", {{1, 1, "exits"}});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, codegrade::error_code::COMPILE_ERROR);
    EXPECT_EQ(result.error, "fatal");
}

TEST_F(LocalExecutorTest, ExecutionDoesNotLeaveFiles) {
    REQUIRE_PROGRAM("python3");
    string code = "open('scratch.txt', 'w').write('x')\n"
                  "def solution(x):\n"
                  "    return x\n";
    auto result = grade("python", code, {{1, 1, "writes a file"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_TRUE(temp_dir_empty());
}

TEST_F(LocalExecutorTest, CancelledBeforeStart) {
    REQUIRE_PROGRAM("python3");
    cancellation_token cancel;
    cancel.cancel();
    auto result = engine->run({"python", "print(1)", {}}, options, cancel);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, codegrade::error_code::CANCELLED);
    EXPECT_TRUE(temp_dir_empty());
}

TEST_F(LocalExecutorTest, CancelledWhileRunning) {
    REQUIRE_PROGRAM("python3");
    cancellation_token cancel;
    thread canceller([&] {
        this_thread::sleep_for(milliseconds(300));
        cancel.cancel();
    });
    elapsed_time timer;
    auto result = engine->run({"python", "import time\ntime.sleep(30)\n", {}}, options, cancel);
    canceller.join();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, codegrade::error_code::CANCELLED);
    EXPECT_LT(timer.duration<milliseconds>().count(), 4000);
    EXPECT_TRUE(temp_dir_empty());
}

TEST_F(LocalExecutorTest, UnusableTempDirIsIOError) {
    REQUIRE_PROGRAM("python3");
    filesystem::path blocker = TEMP_DIR / "blocker";
    write_file_content(blocker, "not a directory");

    local_executor_options local_options = local_executor_options::from_config();
    local_options.temp_dir = blocker;
    local_options.enabled = true;
    grader blocked(executor_factory(make_shared<local_executor>(pool, local_options), nullptr), nullptr);

    auto result = blocked.run({"python", "print(1)", {}}, options);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, codegrade::error_code::IO_ERROR);
    EXPECT_TRUE(filesystem::is_regular_file(blocker));
    filesystem::remove(blocker);
}

TEST_F(LocalExecutorTest, CleanupFailureDoesNotChangeResult) {
    REQUIRE_PROGRAM("python3");
    if (geteuid() == 0) GTEST_SKIP() << "directory permissions do not apply to root";

    string code = "import os\n"
                  "os.mkdir('locked')\n"
                  "open('locked/data', 'w').write('x')\n"
                  "os.chmod('locked', 0o500)\n"
                  "def solution(x):\n"
                  "    return x\n";
    auto result = grade("python", code, {{1, 1, "locks a directory"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.test_results->passed, 1u);
    EXPECT_FALSE(temp_dir_empty());

    for (auto &entry : filesystem::recursive_directory_iterator(temp_dir))
        if (entry.is_directory())
            filesystem::permissions(entry.path(), filesystem::perms::owner_all, filesystem::perm_options::add);
    filesystem::remove_all(temp_dir);
}

TEST_F(LocalExecutorTest, InvalidUtf8OutputSerializes) {
    REQUIRE_PROGRAM("python3");
    auto result = grade("python", "import sys\nsys.stdout.buffer.write(b'caf\\xe9\\n')\n", {});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "caf\xe9\n");

    string text;
    ASSERT_NO_THROW(text = dump_json(result));
    EXPECT_EQ(nlohmann::json::parse(text).at("output"), "caf\xef\xbf\xbd\n");
}

TEST_F(LocalExecutorTest, InvalidUtf8ErrorSerializes) {
    REQUIRE_PROGRAM("python3");
    auto result = grade("python", "import sys\nsys.stderr.buffer.write(b'\\xff')\nsys.exit(1)\n", {{1, 1, "exits"}});
    EXPECT_EQ(result.code, codegrade::error_code::COMPILE_ERROR);

    string text;
    ASSERT_NO_THROW(text = dump_json(result));
    EXPECT_EQ(nlohmann::json::parse(text).at("error"), "\xef\xbf\xbd");
}

TEST_F(LocalExecutorTest, CompiledLanguageIsUnsupportedLocally) {
    EXPECT_FALSE(local->supports(get_language("java")));
    auto result = grade("java", "class Main {}", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, codegrade::error_code::LANGUAGE_UNSUPPORTED);
    EXPECT_TRUE(temp_dir_empty());
}

TEST_F(LocalExecutorTest, ConcurrentExecutionsAreIsolated) {
    REQUIRE_PROGRAM("python3");
    vector<execution_result> results(4);
    vector<thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            results[i] = grade("python", "def solution(x):\n    return x + " + to_string(i) + "\n", {{0, i, "offset"}});
        });
    }
    for (auto &t : threads) t.join();
    for (auto &result : results) {
        ASSERT_TRUE(result.success) << result.error.value_or("");
        EXPECT_EQ(result.test_results->passed, 1u);
    }
    EXPECT_TRUE(temp_dir_empty());
}

TEST(ScopedWorkdirTest, FailedWriteLeavesNothingBehind) {
    filesystem::path dir;
    {
        scoped_workdir workdir(TEMP_DIR, "failed-write");
        dir = workdir.path();
        filesystem::create_directory(dir / "main.py");
        EXPECT_THROW(workdir.write("main.py", "print(1)"), io_error);
    }
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST(ScopedWorkdirTest, RemoveIsIdempotent) {
    scoped_workdir workdir(TEMP_DIR, "removed-twice");
    workdir.write("main.py", "print(1)");
    EXPECT_TRUE(workdir.remove());
    EXPECT_TRUE(workdir.remove());
    EXPECT_FALSE(filesystem::exists(workdir.path()));
}
