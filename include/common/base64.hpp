#pragma once

#include <string>

namespace codegrade {

/**
 * @brief Standard base64 (RFC 4648, with '=' padding) of arbitrary bytes
 */
std::string base64_encode(const std::string &data);

/**
 * @brief Inverse of base64_encode, padding is optional
 * @throw std::invalid_argument on characters outside the base64 alphabet
 */
std::string base64_decode(const std::string &data);

}  // namespace codegrade
