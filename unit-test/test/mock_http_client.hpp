#pragma once

#include <nlohmann/json.hpp>
#include "common/http_client.hpp"
#include "gmock/gmock.h"

namespace codegrade {

class mock_http_client : public http_client {
public:
    MOCK_METHOD(http_response, perform, (const http_request &request, const cancellation_token &cancel), (override));
};

/**
 * @brief Response with the given status and JSON body
 */
inline http_response json_response(long status, const nlohmann::json &body) {
    return {status, body.dump()};
}

}  // namespace codegrade
