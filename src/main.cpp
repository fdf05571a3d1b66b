#include <glog/logging.h>
#include <signal.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/http_client.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "evaluator/groq_evaluator.hpp"
#include "grading/grader.hpp"
#include "grading/harness.hpp"
#include "grading/language.hpp"
#include "sandbox/execution_pool.hpp"
#include "sandbox/local_executor.hpp"
#include "sandbox/remote_executor.hpp"
using namespace std;

namespace po = boost::program_options;

static codegrade::cancellation_token interrupted;

void sigintHandler(int /* signum */) {
    interrupted.cancel();
}

/**
 * @brief Take the option from the command line, or from the environment
 * variable env if it is not given there. target is left untouched otherwise.
 */
template <typename T>
void option_or_env(const po::variables_map& vm, const char* name, const char* env, T& target) {
    if (vm.count(name)) {
        target = vm.at(name).as<T>();
    } else if (getenv(env)) {
        target = boost::lexical_cast<T>(getenv(env));
    }
}

static string read_request(const string& path) {
    if (path == "-")
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return codegrade::read_file_content(path);
}

static nlohmann::json describe_languages(const codegrade::sandbox::executor& local, const codegrade::sandbox::executor& remote) {
    nlohmann::json languages = nlohmann::json::array();
    for (auto& lang : codegrade::available_languages()) {
        languages.push_back({{"id", lang.id},
                             {"aliases", lang.aliases},
                             {"extension", lang.extension},
                             {"gradable", lang.harness != nullptr},
                             {"local", local.supports(lang)},
                             {"remote", remote.supports(lang)}});
    }
    return languages;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    po::options_description desc("codegrade options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>(), "grading request {code, language, testCases?} in JSON, - to read it from stdin")
        ("config", po::value<string>(), "load settings from a JSON configuration file, command line options take precedence")
        ("backend", po::value<string>()->default_value("auto"), "where to run code: auto, local or remote")
        ("timeout", po::value<int>(), "wall-clock limit of one execution in milliseconds, default to 10000. You can either pass it from environ EXECTIMEOUT")
        ("entry-point", po::value<string>()->default_value(codegrade::harness::ENTRY_POINT), "function called once per test case")
        ("temp-dir", po::value<string>(), "set the directory receiving generated programs. You can either pass it from environ TEMPDIR")
        ("kill-grace", po::value<int>(), "milliseconds between SIGTERM and SIGKILL, default to 500. You can either pass it from environ KILLGRACE")
        ("memory-limit", po::value<long>(), "data segment limit of local interpreters in KB, 0 for none. You can either pass it from environ MEMLIMIT")
        ("output-limit", po::value<size_t>(), "bytes kept from each output stream, default to 8388608. You can either pass it from environ OUTPUTLIMIT")
        ("max-concurrent", po::value<size_t>(), "number of local executions running at the same time. You can either pass it from environ MAXCONCURRENT")
        ("max-queued", po::value<size_t>(), "number of executions waiting for a local slot before rejecting. You can either pass it from environ MAXQUEUED")
        ("sandbox-url", po::value<string>(), "base url of the piston compatible remote sandbox. You can either pass it from environ SANDBOXURL")
        ("sandbox-timeout", po::value<int>(), "transport timeout of the remote sandbox in milliseconds. You can either pass it from environ SANDBOXTIMEOUT")
        ("no-local", "never run code with local interpreters")
        ("no-remote", "never send code to the remote sandbox")
        ("evaluate", po::value<string>(), "ask the AI judge to score the request's code against the given question")
        ("boilerplate", po::value<string>(), "print starter code for the given language")
        ("languages", "list supported languages")
        ("runtimes", "list runtimes installed in the remote sandbox")
        ("debug", "turn on the debug mode to log generated programs. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("request", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codegrade: run untrusted code against test cases and grade it" << endl
             << "Usage: " << argv[0] << " [options] <request.json|->" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codegrade 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        if (vm.count("config")) {
            string config = vm.at("config").as<string>();
            CHECK(filesystem::is_regular_file(config))
                << "Configuration file " << config << " does not exist";
            codegrade::load_config_file(config);
        }

        if (vm.count("debug") || getenv("DEBUG")) codegrade::DEBUG = true;

        string temp_dir;
        option_or_env(vm, "temp-dir", "TEMPDIR", temp_dir);
        if (!temp_dir.empty()) codegrade::TEMP_DIR = temp_dir;

        option_or_env(vm, "timeout", "EXECTIMEOUT", codegrade::EXECUTION_TIMEOUT_MS);
        option_or_env(vm, "kill-grace", "KILLGRACE", codegrade::KILL_GRACE_PERIOD_MS);
        option_or_env(vm, "memory-limit", "MEMLIMIT", codegrade::MEMORY_LIMIT_KB);
        option_or_env(vm, "output-limit", "OUTPUTLIMIT", codegrade::OUTPUT_LIMIT_BYTES);
        option_or_env(vm, "max-concurrent", "MAXCONCURRENT", codegrade::MAX_CONCURRENT_EXECUTIONS);
        option_or_env(vm, "max-queued", "MAXQUEUED", codegrade::MAX_QUEUED_EXECUTIONS);
        option_or_env(vm, "sandbox-url", "SANDBOXURL", codegrade::REMOTE_SANDBOX_URL);
        option_or_env(vm, "sandbox-timeout", "SANDBOXTIMEOUT", codegrade::REMOTE_TIMEOUT_MS);
        if (vm.count("no-local")) codegrade::ENABLE_LOCAL = false;
        if (vm.count("no-remote")) codegrade::ENABLE_REMOTE = false;
        if (codegrade::EVALUATOR.api_keys.empty())
            codegrade::EVALUATOR.api_keys = codegrade::api_keys_from_env();
    } catch (boost::bad_lexical_cast& e) {
        cerr << "Malformed environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (exception& e) {
        cerr << "Unable to load configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(codegrade::EXECUTION_TIMEOUT_MS > 0)
        << "Execution timeout should be positive";
    CHECK(codegrade::MAX_CONCURRENT_EXECUTIONS > 0)
        << "At least one local execution slot is required";

    std::error_code ec;
    filesystem::create_directories(codegrade::TEMP_DIR, ec);
    CHECK(filesystem::is_directory(codegrade::TEMP_DIR))
        << "Temp directory " << codegrade::TEMP_DIR << " cannot be created: " << ec.message();

    auto http = make_shared<codegrade::curl_http_client>();
    auto pool = make_shared<codegrade::sandbox::execution_pool>(codegrade::MAX_CONCURRENT_EXECUTIONS, codegrade::MAX_QUEUED_EXECUTIONS);
    auto local = make_shared<codegrade::sandbox::local_executor>(pool);
    auto remote = make_shared<codegrade::sandbox::remote_executor>(http);
    codegrade::grader grader({local, remote}, make_shared<codegrade::groq_evaluator>(http));

    if (vm.count("boilerplate")) {
        try {
            cout << codegrade::harness::boilerplate(vm.at("boilerplate").as<string>(), vm.at("entry-point").as<string>()) << endl;
        } catch (invalid_argument& e) {
            cerr << e.what() << endl;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (vm.count("languages")) {
        cout << codegrade::dump_json(describe_languages(*local, *remote), 2) << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("runtimes")) {
        try {
            cout << codegrade::dump_json(remote->runtimes(interrupted), 2) << endl;
        } catch (codegrade::grading_exception& e) {
            LOG(ERROR) << e;
            cout << codegrade::dump_json(codegrade::failed_result(e)) << endl;
        }
        return EXIT_SUCCESS;
    }

    if (!vm.count("request")) {
        cerr << "No grading request given" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    codegrade::submission submit;
    try {
        submit = nlohmann::json::parse(read_request(vm.at("request").as<string>())).get<codegrade::submission>();
    } catch (nlohmann::json::exception& e) {
        cerr << "Malformed grading request: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (invalid_argument& e) {
        cerr << "Malformed grading request: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (codegrade::io_error& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("evaluate")) {
        auto score = grader.evaluate_qualitative(submit.code, vm.at("evaluate").as<string>(), submit.test_cases);
        cout << codegrade::dump_json(score) << endl;
        return EXIT_SUCCESS;
    }

    codegrade::grading_options options;
    options.timeout = chrono::milliseconds(codegrade::EXECUTION_TIMEOUT_MS);
    options.entry_point = vm.at("entry-point").as<string>();
    try {
        options.backend = codegrade::sandbox::parse_backend(vm.at("backend").as<string>());
        auto result = grader.run(submit, options, interrupted);
        cout << codegrade::dump_json(result) << endl;
    } catch (invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
