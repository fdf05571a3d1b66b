#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "grading/submission.hpp"

namespace codegrade {

/**
 * @brief Opinion of an AI judge, independent from any grading report
 */
struct qualitative_score {
    /**
     * @brief 0..100
     */
    int score = 0;
    std::string feedback;
    std::vector<std::string> suggestions;

    /**
     * @brief Returned whenever the judge cannot be consulted or misbehaves
     */
    static qualitative_score unavailable();
};

void to_json(nlohmann::json &j, const qualitative_score &score);

/**
 * @brief Scores code against a free-form question.
 * Implementations never throw, a failure degrades to qualitative_score::unavailable().
 */
struct qualitative_evaluator {
    virtual ~qualitative_evaluator() = default;

    virtual qualitative_score evaluate(const std::string &code, const std::string &question, const std::vector<test_case> &tests) noexcept = 0;
};

}  // namespace codegrade
