#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace codegrade {

/**
 * @brief Find the value of an environment variable
 * @param key name of the environment variable
 * @param def_value returned if the variable is not set
 * @return value of the variable, or def_value if it does not exist
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief Resolve a program name against PATH like execvp does
 * @param program bare program name (e.g. "node") or a path containing '/'
 * @return absolute path of the executable, or nullopt if it cannot be found
 */
std::optional<std::filesystem::path> find_program(const std::string &program);

/**
 * @brief Lower-case copy of an ASCII string, used for language ids
 */
std::string to_lower(const std::string &str);

/**
 * @brief Generate a fresh random uuid string, used as execution id
 */
std::string generate_uuid();

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace codegrade
