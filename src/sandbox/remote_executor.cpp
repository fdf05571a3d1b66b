#include "sandbox/remote_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codegrade::sandbox {
using namespace std;

// time the remote sandbox needs beyond the program itself: queueing, compilation, transfer
static constexpr chrono::milliseconds TRANSPORT_SLACK(5000);

// piston marks a run killed for exceeding its time limit with this status
static const char *STATUS_TIMED_OUT = "TO";

remote_executor_options remote_executor_options::from_config() {
    remote_executor_options options;
    options.url = REMOTE_SANDBOX_URL;
    options.timeout = chrono::milliseconds(REMOTE_TIMEOUT_MS);
    options.enabled = ENABLE_REMOTE;
    return options;
}

/**
 * @brief Message shown for a non-2xx response, piston puts it in "message"
 */
static string error_message(const http_response &response) {
    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && exists(body, "message"))
        return get_value_def<string>(body, response.body, "message");
    if (response.body.size() > 200) return response.body.substr(0, 200) + "...";
    return response.body.empty() ? "empty response" : response.body;
}

/**
 * @brief Convert one stage ("compile" or "run") of the envelope
 */
static execution_outcome parse_stage(const nlohmann::json &stage, const string &body) {
    if (!stage.is_object())
        throw malformed_output("Malformed response from remote sandbox: stage is not an object", body);

    execution_outcome outcome;
    outcome.stdout_text = get_value_def<string>(stage, "", "stdout");
    outcome.stderr_text = get_value_def<string>(stage, "", "stderr");
    if (exists(stage, "code")) {
        if (!stage.at("code").is_number_integer())
            throw malformed_output("Malformed response from remote sandbox: exit code is not an integer", body);
        outcome.exit_code = stage.at("code").get<int>();
    } else if (exists(stage, "signal")) {
        // killed by a signal, piston only reports its name
        outcome.exit_code = -1;
    } else {
        throw malformed_output("Malformed response from remote sandbox: no exit code", body);
    }
    outcome.success = outcome.exit_code == 0;
    outcome.elapsed = chrono::milliseconds(get_value_def<long>(stage, 0, "wall_time"));
    return outcome;
}

remote_executor::remote_executor(shared_ptr<http_client> client, remote_executor_options options)
    : client(move(client)), options(move(options)) {}

string remote_executor::name() const {
    return "remote";
}

bool remote_executor::supports(const language &lang) const {
    return options.enabled && !lang.remote_id.empty();
}

http_response remote_executor::send(http_request request, const cancellation_token &cancel) {
    request.headers.push_back("Accept: application/json");
    http_response response;
    try {
        response = client->perform(request, cancel);
    } catch (network_error &e) {
        throw sandbox_unavailable(0, e.what());
    }

    if (response.status < 200 || response.status >= 300) {
        string message = error_message(response);
        LOG(WARNING) << "Remote sandbox " << request.url << " responded with HTTP " << response.status << ": " << message;
        throw sandbox_unavailable(response.status, message);
    }
    return response;
}

execution_outcome remote_executor::execute(const execution_request &request, const cancellation_token &cancel) {
    const language &lang = *request.lang;
    if (lang.remote_id.empty()) throw language_unsupported(lang.id, "unknown to the remote sandbox");
    cancel.throw_if_cancelled();

    nlohmann::json body = {
        {"language", lang.remote_id},
        {"version", "*"},
        {"run_timeout", request.timeout.count()},
        {"compile_timeout", request.timeout.count()},
        {"files", nlohmann::json::array({{{"name", lang.source_name()}, {"content", request.source}}})}};

    http_request http;
    http.method = "POST";
    http.url = options.url + "/execute";
    http.headers = {"Content-Type: application/json"};
    http.body = dump_json(body);
    http.timeout = max(options.timeout, request.timeout + TRANSPORT_SLACK);

    string id = generate_uuid();
    LOG(INFO) << "[" << id << "] running " << lang.id << " remotely as " << lang.remote_id;
    if (DEBUG) LOG(INFO) << "[" << id << "] source:\n" << request.source;

    elapsed_time timer;
    http_response response = send(http, cancel);
    auto elapsed = timer.duration<chrono::milliseconds>();

    auto envelope = nlohmann::json::parse(response.body, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        LOG(WARNING) << "[" << id << "] remote sandbox answered with a body that is not a JSON object";
        throw malformed_output("Malformed response from remote sandbox", response.body);
    }
    if (!exists(envelope, "run"))
        throw malformed_output("Malformed response from remote sandbox: no run stage", response.body);

    if (exists(envelope, "compile")) {
        execution_outcome compile = parse_stage(envelope.at("compile"), response.body);
        if (!compile.success) {
            LOG(INFO) << "[" << id << "] compilation failed with exit code " << compile.exit_code;
            compile.elapsed = elapsed;
            return compile;
        }
    }

    if (get_value_def<string>(envelope, "", "run", "status") == STATUS_TIMED_OUT) {
        LOG(WARNING) << "[" << id << "] remote sandbox killed the program after " << elapsed.count() << "ms";
        throw timeout_error(elapsed, request.timeout);
    }

    execution_outcome outcome = parse_stage(envelope.at("run"), response.body);
    if (outcome.elapsed.count() == 0) outcome.elapsed = elapsed;
    LOG(INFO) << "[" << id << "] finished in " << elapsed.count() << "ms with exit code " << outcome.exit_code;
    return outcome;
}

nlohmann::json remote_executor::runtimes(const cancellation_token &cancel) {
    http_request http;
    http.url = options.url + "/runtimes";
    http.timeout = options.timeout;

    http_response response = send(http, cancel);
    auto runtimes = nlohmann::json::parse(response.body, nullptr, false);
    if (runtimes.is_discarded())
        throw malformed_output("Malformed runtime list from remote sandbox", response.body);
    return runtimes;
}

}  // namespace codegrade::sandbox
