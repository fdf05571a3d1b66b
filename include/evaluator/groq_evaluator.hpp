#pragma once

#include <chrono>
#include <memory>
#include "common/http_client.hpp"
#include "config.hpp"
#include "evaluator/api_key_pool.hpp"
#include "evaluator/qualitative_evaluator.hpp"

namespace codegrade {

/**
 * @brief Asks a chat-completions endpoint (Groq, OpenAI compatible) to score code.
 *
 * Requests rotate over the configured API keys. A 429 or 5xx answer puts
 * the key to rest and the request is retried with the next key after a
 * linearly growing back-off, any other failure ends the evaluation.
 */
struct groq_evaluator : public qualitative_evaluator {
    /**
     * @param backoff wait before the second attempt, the n-th retry waits n times as long
     */
    groq_evaluator(std::shared_ptr<http_client> client, evaluator_config config = EVALUATOR,
                   std::chrono::milliseconds backoff = std::chrono::milliseconds(1000));

    qualitative_score evaluate(const std::string &code, const std::string &question, const std::vector<test_case> &tests) noexcept override;

    /**
     * @brief Prompt sent as the only user message
     */
    static std::string build_prompt(const std::string &code, const std::string &question, const std::vector<test_case> &tests);

    /**
     * @brief Read the score out of the model's reply.
     * The reply may wrap the JSON object in prose or a code fence.
     * @throw std::invalid_argument if the reply contains no JSON object
     */
    static qualitative_score parse_reply(const std::string &content);

private:
    std::shared_ptr<http_client> client;
    evaluator_config config;
    api_key_pool keys;
    std::chrono::milliseconds backoff;
};

}  // namespace codegrade
