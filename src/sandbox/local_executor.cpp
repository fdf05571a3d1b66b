#include "sandbox/local_executor.hpp"
#include <glog/logging.h>
#include <cmath>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/subprocess.hpp"

namespace codegrade::sandbox {
using namespace std;

local_executor_options local_executor_options::from_config() {
    local_executor_options options;
    options.temp_dir = TEMP_DIR;
    options.kill_grace = chrono::milliseconds(KILL_GRACE_PERIOD_MS);
    options.memory_limit_kb = MEMORY_LIMIT_KB;
    options.output_limit = OUTPUT_LIMIT_BYTES;
    options.enabled = ENABLE_LOCAL;
    return options;
}

local_executor::local_executor(shared_ptr<execution_pool> pool, local_executor_options options)
    : pool(move(pool)), options(move(options)) {}

string local_executor::name() const {
    return "local";
}

bool local_executor::supports(const language &lang) const {
    return options.enabled && lang.interpreter && find_program(*lang.interpreter);
}

execution_outcome local_executor::execute(const execution_request &request, const cancellation_token &cancel) {
    const language &lang = *request.lang;
    if (!lang.interpreter) throw language_unsupported(lang.id, "no local interpreter");
    auto interpreter = find_program(*lang.interpreter);
    if (!interpreter) throw language_unsupported(lang.id, *lang.interpreter + " is not installed");

    auto slot = pool->acquire(cancel);

    string id = generate_uuid();
    scoped_workdir workdir(options.temp_dir, id);
    auto source = workdir.write(lang.source_name(), request.source);
    if (DEBUG) LOG(INFO) << "[" << id << "] source of " << source << ":\n" << request.source;

    vector<string> argv = {interpreter->string()};
    argv.insert(argv.end(), lang.interpreter_args.begin(), lang.interpreter_args.end());
    argv.push_back(source.string());

    process_options process;
    process.working_directory = workdir.path();
    process.timeout = request.timeout;
    process.kill_grace = options.kill_grace;
    process.output_limit = options.output_limit;
    process.limits.memory_kb = options.memory_limit_kb;
    process.limits.cpu_seconds = (long)ceil(request.timeout.count() / 1000.0) + 1;

    LOG(INFO) << "[" << id << "] running " << lang.id << " with " << *interpreter;
    process_result result;
    try {
        result = run_process(argv, process, cancel);
    } catch (system_error &e) {
        LOG(ERROR) << "[" << id << "] unable to start " << *interpreter << ": " << e.what();
        throw io_error(string("Unable to start interpreter: ") + e.what());
    }

    if (result.cancelled) {
        LOG(WARNING) << "[" << id << "] cancelled after " << result.elapsed.count() << "ms";
        throw execution_cancelled();
    }
    if (result.timed_out) {
        LOG(WARNING) << "[" << id << "] killed after " << result.elapsed.count() << "ms, limit " << request.timeout.count() << "ms";
        throw timeout_error(result.elapsed, request.timeout);
    }

    LOG(INFO) << "[" << id << "] finished in " << result.elapsed.count() << "ms with exit code " << result.exit_code;

    execution_outcome outcome;
    outcome.success = result.exited && result.exit_code == 0;
    outcome.exit_code = result.exit_code;
    outcome.stdout_text = move(result.stdout_text);
    outcome.stderr_text = move(result.stderr_text);
    outcome.elapsed = result.elapsed;
    return outcome;
}

}  // namespace codegrade::sandbox
