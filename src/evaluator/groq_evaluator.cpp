#include "evaluator/groq_evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codegrade {
using namespace std;

qualitative_score qualitative_score::unavailable() {
    return {0, "unavailable", {}};
}

void to_json(nlohmann::json &j, const qualitative_score &score) {
    j = {{"score", score.score}, {"feedback", score.feedback}, {"suggestions", score.suggestions}};
}

static bool is_temporary(long status) {
    return status == 429 || status >= 500;
}

groq_evaluator::groq_evaluator(shared_ptr<http_client> client, evaluator_config config, chrono::milliseconds backoff)
    : client(move(client)), config(config), keys(config.api_keys, chrono::milliseconds(config.cooldown_ms)), backoff(backoff) {}

string groq_evaluator::build_prompt(const string &code, const string &question, const vector<test_case> &tests) {
    nlohmann::json test_json = tests;
    return fmt::format("Score code (0-100). Return JSON:\n{}\n\nQ: {}\nTests: {}\n\n"
                       R"({{"score": number, "feedback": "brief", "suggestions": ["tip1", "tip2"]}})",
                       code, question, dump_json(test_json));
}

qualitative_score groq_evaluator::parse_reply(const string &content) {
    auto begin = content.find('{');
    auto end = content.rfind('}');
    if (begin == string::npos || end == string::npos || end < begin)
        throw invalid_argument("Reply contains no JSON object");

    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(content.substr(begin, end - begin + 1));
    } catch (nlohmann::json::parse_error &e) {
        throw invalid_argument(string("Reply is not valid JSON: ") + e.what());
    }

    qualitative_score result;
    double score = get_value_def<double>(reply, 0, "score");
    result.score = (int)lround(clamp(std::isfinite(score) ? score : 0.0, 0.0, 100.0));
    result.feedback = get_value_def<string>(reply, "", "feedback");
    if (result.feedback.empty()) result.feedback = "No feedback available";
    if (exists(reply, "suggestions") && reply.at("suggestions").is_array())
        for (auto &suggestion : reply.at("suggestions"))
            if (suggestion.is_string()) result.suggestions.push_back(suggestion.get<string>());
    return result;
}

qualitative_score groq_evaluator::evaluate(const string &code, const string &question, const vector<test_case> &tests) noexcept {
    try {
        if (keys.size() == 0) {
            LOG(WARNING) << "No evaluator API key configured";
            return qualitative_score::unavailable();
        }

        nlohmann::json body = {
            {"model", config.model},
            {"messages", nlohmann::json::array({{{"role", "user"}, {"content", build_prompt(code, question, tests)}}})},
            {"temperature", config.temperature},
            {"max_tokens", config.max_tokens}};

        for (int attempt = 0; attempt < config.max_retries; ++attempt) {
            if (attempt > 0) this_thread::sleep_for(backoff * attempt);

            auto key = keys.next_key();
            http_request request;
            request.method = "POST";
            request.url = config.url;
            request.headers = {"Content-Type: application/json", "Authorization: Bearer " + *key};
            request.body = dump_json(body);
            request.timeout = chrono::milliseconds(config.timeout_ms);

            http_response response = client->perform(request, cancellation_token());
            if (is_temporary(response.status)) {
                LOG(WARNING) << "Evaluator answered HTTP " << response.status << " on attempt " << attempt + 1;
                keys.mark_failed(*key);
                continue;
            }
            if (response.status < 200 || response.status >= 300) {
                LOG(WARNING) << "Evaluator answered HTTP " << response.status << ": " << response.body;
                return qualitative_score::unavailable();
            }

            auto reply = nlohmann::json::parse(response.body);
            return parse_reply(get_value<string>(reply, "choices", size_t(0), "message", "content"));
        }
        LOG(WARNING) << "Evaluator still failing after " << config.max_retries << " attempts";
    } catch (exception &e) {
        LOG(WARNING) << "Evaluation failed: " << e.what();
    }
    return qualitative_score::unavailable();
}

}  // namespace codegrade
