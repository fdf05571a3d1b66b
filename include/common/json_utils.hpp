#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * Helpers for walking nested JSON documents by a key path, e.g.
 * get_value<int>(envelope, "run", "code").
 * Keys can be object keys (strings) or array indices (size_t).
 */
namespace codegrade {

namespace detail {

inline const nlohmann::json *step(const nlohmann::json *ref, const std::string &key) {
    if (ref && ref->is_object() && ref->count(key)) return &ref->at(key);
    return nullptr;
}

inline const nlohmann::json *step(const nlohmann::json *ref, const char *key) {
    return step(ref, std::string(key));
}

inline const nlohmann::json *step(const nlohmann::json *ref, size_t index) {
    if (ref && ref->is_array() && index < ref->size()) return &ref->at(index);
    return nullptr;
}

template <typename... Keys>
const nlohmann::json *walk(const nlohmann::json &j, Keys &&... keys) {
    const nlohmann::json *ref = j.is_null() ? nullptr : &j;
    ((ref = step(ref, keys)), ...);
    return ref;
}

}  // namespace detail

/**
 * @brief Check whether the key path exists and is not null
 */
template <typename... Keys>
bool exists(const nlohmann::json &j, Keys &&... keys) {
    const nlohmann::json *ref = detail::walk(j, keys...);
    return ref && !ref->is_null();
}

/**
 * @brief Get the value at the key path, or null json if it does not exist
 */
template <typename... Keys>
nlohmann::json access_optional(const nlohmann::json &j, Keys &&... keys) {
    const nlohmann::json *ref = detail::walk(j, keys...);
    return !ref ? nlohmann::json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const nlohmann::json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

/**
 * @brief Get the value at the key path
 * @throw std::invalid_argument if the key path does not exist
 */
template <typename... Keys>
const nlohmann::json &access(const nlohmann::json &j, Keys &&... keys) {
    const nlohmann::json *ref = detail::walk(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    return *ref;
}

/**
 * @brief Get the value at the key path converted to T
 * @throw std::invalid_argument if the key path does not exist or has an incompatible type
 */
template <typename T, typename... Keys>
T get_value(const nlohmann::json &j, Keys &&... keys) {
    const nlohmann::json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (nlohmann::json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief Get the value at the key path converted to T, or def_value if it
 * does not exist or has an incompatible type
 */
template <typename T, typename... Keys>
T get_value_def(const nlohmann::json &j, const T &def_value, Keys &&... keys) {
    const nlohmann::json *ref = detail::walk(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (nlohmann::json::exception &) {
        return def_value;
    }
}

/**
 * @brief Serialize j, invalid UTF-8 sequences are written as U+FFFD
 * Program output is arbitrary bytes and may be cut in the middle of a character.
 */
inline std::string dump_json(const nlohmann::json &j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace codegrade
