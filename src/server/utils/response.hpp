/*
 * response.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef FIRETV_SERVER_UTILS_RESPONSE_HPP
#define FIRETV_SERVER_UTILS_RESPONSE_HPP

#include <crow.h>
#include <string>

#include "atom/type/json.hpp"
#include "common/result.hpp"

namespace firetv::server::utils {

/**
 * @brief Utility class for creating standardized API responses
 *
 * Success bodies are `{"success": true, ...fields}`, failures
 * `{"success": false, "error": {"code", "message", "device"?}}`.
 */
class ResponseBuilder {
public:
    /**
     * @brief Create a successful JSON response
     *
     * Object data is merged into the body; any other value is placed under
     * "data".
     */
    static crow::response success(const nlohmann::json& data = nullptr,
                                  int code = 200) {
        nlohmann::json body = {{"success", true}};
        if (data.is_object()) {
            for (const auto& [key, value] : data.items()) {
                body[key] = value;
            }
        } else if (!data.is_null()) {
            body["data"] = data;
        }
        return makeJsonResponse(body, code);
    }

    /**
     * @brief Create an error response with the status of its code
     */
    static crow::response fromError(const Error& error) {
        nlohmann::json body = {{"success", false}, {"error", error.toJson()}};
        return makeJsonResponse(body, statusFor(error.code));
    }

    /**
     * @brief Render a result, success or failure
     */
    static crow::response fromResult(const Result<nlohmann::json>& result) {
        if (!result) {
            return fromError(result.error());
        }
        return success(*result);
    }

    /**
     * @brief HTTP status for an error code
     */
    static constexpr auto statusFor(ErrorCode code) -> int {
        switch (code) {
            case ErrorCode::ValidationError:
                return 400;
            case ErrorCode::NotFound:
                return 404;
            case ErrorCode::ParseError:
                return 422;
            case ErrorCode::AuthError:
            case ErrorCode::ProtocolError:
                return 502;
            case ErrorCode::NotConnected:
            case ErrorCode::Unavailable:
                return 503;
            case ErrorCode::TimeoutError:
                return 504;
            default:
                return 500;
        }
    }

private:
    static crow::response makeJsonResponse(const nlohmann::json& body,
                                           int code) {
        crow::response res(code);
        res.set_header("Content-Type", "application/json");
        res.write(body.dump());
        return res;
    }
};

}  // namespace firetv::server::utils

#endif  // FIRETV_SERVER_UTILS_RESPONSE_HPP
