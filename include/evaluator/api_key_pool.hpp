#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace codegrade {

/**
 * @brief Round-robin pool of API keys of one provider.
 * A key that hit a rate limit or a provider error rests for `cooldown`
 * before it is handed out again. When every key rests, the one that
 * failed first is handed out anyway.
 */
struct api_key_pool {
    api_key_pool(std::vector<std::string> keys, std::chrono::milliseconds cooldown);

    /**
     * @brief Key to use for the next request, nullopt if the pool is empty
     */
    std::optional<std::string> next_key();

    /**
     * @brief Put key to rest and move on to the following key
     */
    void mark_failed(const std::string &key);

    size_t size() const;

    /**
     * @brief Number of keys currently resting
     */
    size_t failed() const;

private:
    bool resting(const std::string &key, std::chrono::steady_clock::time_point now) const;

    std::vector<std::string> keys;
    std::chrono::milliseconds cooldown;
    size_t current = 0;
    std::map<std::string, std::chrono::steady_clock::time_point> failures;
    mutable std::mutex mut;
};

/**
 * @brief Mask a key for logging, e.g. "gsk_abcdef..."
 */
std::string mask_key(const std::string &key);

}  // namespace codegrade
