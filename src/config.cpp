#include "config.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <thread>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace codegrade {
using namespace std;

filesystem::path TEMP_DIR = filesystem::temp_directory_path() / "codegrade";
int EXECUTION_TIMEOUT_MS = 10000;
int KILL_GRACE_PERIOD_MS = 500;
long MEMORY_LIMIT_KB = 2L << 20;  // 2G
size_t OUTPUT_LIMIT_BYTES = 8 << 20;
size_t MAX_CONCURRENT_EXECUTIONS = max(1u, thread::hardware_concurrency());
size_t MAX_QUEUED_EXECUTIONS = 4 * MAX_CONCURRENT_EXECUTIONS;
string REMOTE_SANDBOX_URL = "https://emkc.org/api/v2/piston";
int REMOTE_TIMEOUT_MS = 30000;
bool ENABLE_LOCAL = true;
bool ENABLE_REMOTE = true;
evaluator_config EVALUATOR;
bool DEBUG = false;

void from_json(const nlohmann::json &j, evaluator_config &config) {
    config.url = get_value_def(j, config.url, "url");
    config.model = get_value_def(j, config.model, "model");
    config.api_keys = get_value_def(j, config.api_keys, "api_keys");
    config.temperature = get_value_def(j, config.temperature, "temperature");
    config.max_tokens = get_value_def(j, config.max_tokens, "max_tokens");
    config.timeout_ms = get_value_def(j, config.timeout_ms, "timeout_ms");
    config.cooldown_ms = get_value_def(j, config.cooldown_ms, "cooldown_ms");
    config.max_retries = get_value_def(j, config.max_retries, "max_retries");
}

void load_config_file(const filesystem::path &path) {
    nlohmann::json j = nlohmann::json::parse(read_file_content(path));

    if (exists(j, "sandbox")) {
        const nlohmann::json &sandbox = access(j, "sandbox");
        REMOTE_SANDBOX_URL = get_value_def(sandbox, REMOTE_SANDBOX_URL, "url");
        REMOTE_TIMEOUT_MS = get_value_def(sandbox, REMOTE_TIMEOUT_MS, "timeout_ms");
        ENABLE_REMOTE = get_value_def(sandbox, ENABLE_REMOTE, "enabled");
    }

    if (exists(j, "local")) {
        const nlohmann::json &local = access(j, "local");
        ENABLE_LOCAL = get_value_def(local, ENABLE_LOCAL, "enabled");
        MAX_CONCURRENT_EXECUTIONS = get_value_def(local, MAX_CONCURRENT_EXECUTIONS, "max_concurrent");
        MAX_QUEUED_EXECUTIONS = get_value_def(local, MAX_QUEUED_EXECUTIONS, "max_queued");
        MEMORY_LIMIT_KB = get_value_def(local, MEMORY_LIMIT_KB, "memory_limit_kb");
        if (exists(local, "temp_dir"))
            TEMP_DIR = get_value<string>(local, "temp_dir");
    }

    if (exists(j, "evaluator"))
        EVALUATOR = access(j, "evaluator").get<evaluator_config>();

    LOG(INFO) << "Loaded configuration " << path;
}

vector<string> api_keys_from_env(const string &prefix) {
    vector<string> keys;
    for (int i = 1; i <= 10; ++i) {
        string name = i == 1 ? prefix : prefix + "_" + to_string(i);
        string key = boost::algorithm::trim_copy(get_env(name, ""));
        if (!key.empty()) keys.push_back(key);
    }
    return keys;
}

}  // namespace codegrade
