#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "common/cancellation.hpp"

namespace codegrade {

struct http_request {
    /**
     * @brief "GET" or "POST"
     */
    std::string method = "GET";
    std::string url;

    /**
     * @brief Raw header lines, e.g. "Content-Type: application/json"
     */
    std::vector<std::string> headers;

    /**
     * @brief Request body, sent only with POST
     */
    std::string body;

    /**
     * @brief Limit of the whole transfer, connection included
     */
    std::chrono::milliseconds timeout{30000};
};

struct http_response {
    /**
     * @brief HTTP status code of the response
     */
    long status = 0;
    std::string body;
};

/**
 * @brief Minimal blocking HTTP client used by the remote sandbox and the evaluator
 */
struct http_client {
    virtual ~http_client() = default;

    /**
     * @brief Send the request and wait for the complete response
     * A response with any status (including 4xx and 5xx) is returned, not thrown.
     * @throw network_error if no response was received
     * @throw execution_cancelled if cancel was requested during the transfer
     */
    virtual http_response perform(const http_request &request, const cancellation_token &cancel) = 0;
};

/**
 * @brief http_client on top of the libcurl easy interface.
 * Every call uses its own easy handle, so one instance may be shared by threads.
 */
struct curl_http_client : public http_client {
    curl_http_client();

    http_response perform(const http_request &request, const cancellation_token &cancel) override;
};

}  // namespace codegrade
