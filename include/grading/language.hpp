#pragma once

#include <optional>
#include <string>
#include <vector>
#include "grading/submission.hpp"

namespace codegrade {

/**
 * @brief Generates a harness program around candidate code
 * @param code candidate code, embedded unmodified
 * @param tests test cases, never empty
 * @param entry_point name of the function the harness calls per test case
 */
using harness_template = std::string (*)(const std::string &code, const std::vector<test_case> &tests, const std::string &entry_point);

/**
 * @brief One row of the language identifier table
 */
struct language {
    /**
     * @brief Internal language id, e.g. "javascript"
     */
    std::string id;

    /**
     * @brief Other ids callers may use, e.g. "js", "node"
     */
    std::vector<std::string> aliases;

    /**
     * @brief Extension of the generated source file, without dot
     */
    std::string extension;

    /**
     * @brief Language id understood by the remote sandbox
     */
    std::string remote_id;

    /**
     * @brief Local interpreter program, searched in PATH.
     * Empty if this language is never run locally.
     */
    std::optional<std::string> interpreter;

    /**
     * @brief Arguments passed before the source file path
     */
    std::vector<std::string> interpreter_args;

    /**
     * @brief nullptr if the language can only run without test cases
     */
    harness_template harness = nullptr;

    /**
     * @brief Name of the generated source file, "main.<extension>"
     */
    std::string source_name() const;
};

/**
 * @brief Look up a language by id or alias, case-insensitively
 * @return nullptr if the id has no mapping
 */
const language *find_language(const std::string &id);

/**
 * @brief Look up a language by id or alias, case-insensitively
 * @throw language_unsupported if the id has no mapping
 */
const language &get_language(const std::string &id);

/**
 * @brief All supported languages in table order
 */
const std::vector<language> &available_languages();

}  // namespace codegrade
