/*
 * error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Error codes and error record shared by the configuration,
session and server layers

**************************************************/

#ifndef FIRETV_COMMON_ERROR_HPP
#define FIRETV_COMMON_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"

namespace firetv {

/**
 * @brief Error categories surfaced to callers
 *
 * Every failure that leaves a module is tagged with exactly one of these.
 * The HTTP layer maps them onto status codes, the CLI onto exit codes.
 */
enum class ErrorCode {
    Unknown = 0,

    // Request errors (10-29), raised before any device I/O
    ParseError = 10,
    NotFound = 20,
    ValidationError = 21,

    // Device link errors (30-49)
    AuthError = 30,
    TimeoutError = 31,
    NotConnected = 32,
    ProtocolError = 33,

    // Server errors (50+)
    Unavailable = 50,
    Internal = 90
};

/**
 * @brief Convert error code to its wire name
 */
[[nodiscard]] constexpr auto errorCodeToString(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::ParseError:
            return "ParseError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::ValidationError:
            return "ValidationError";
        case ErrorCode::AuthError:
            return "AuthError";
        case ErrorCode::TimeoutError:
            return "TimeoutError";
        case ErrorCode::NotConnected:
            return "NotConnectedError";
        case ErrorCode::ProtocolError:
            return "ProtocolError";
        case ErrorCode::Unavailable:
            return "Unavailable";
        case ErrorCode::Internal:
            return "InternalError";
        default:
            return "Unknown";
    }
}

/**
 * @brief True for errors that mean the device link is gone or unusable
 */
[[nodiscard]] constexpr auto isLinkFailure(ErrorCode code) -> bool {
    return code == ErrorCode::NotConnected ||
           code == ErrorCode::TimeoutError ||
           code == ErrorCode::ProtocolError;
}

/**
 * @brief Error record carried through Result<T>
 */
struct Error {
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
    std::optional<std::string> device;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    Error() = default;

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string dev)
        : code(c), message(std::move(msg)), device(std::move(dev)) {}

    [[nodiscard]] auto name() const -> std::string_view {
        return errorCodeToString(code);
    }

    /**
     * @brief Attach the device name if the error does not carry one yet
     */
    auto forDevice(const std::string& dev) && -> Error {
        if (!device) {
            device = dev;
        }
        return std::move(*this);
    }

    [[nodiscard]] auto toString() const -> std::string {
        std::string result(errorCodeToString(code));
        if (device) {
            result += " [" + *device + "]";
        }
        result += ": " + message;
        return result;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j = {{"code", std::string(errorCodeToString(code))},
                            {"message", message}};
        if (device) {
            j["device"] = *device;
        }
        return j;
    }
};

/**
 * @brief Factory functions for the common error shapes
 */
namespace error {

inline auto parse(const std::string& msg) -> Error {
    return {ErrorCode::ParseError, msg};
}

inline auto notFound(const std::string& device) -> Error {
    return {ErrorCode::NotFound, "Unknown device: " + device, device};
}

inline auto validation(const std::string& msg) -> Error {
    return {ErrorCode::ValidationError, msg};
}

inline auto auth(const std::string& msg) -> Error {
    return {ErrorCode::AuthError, msg};
}

inline auto timeout(const std::string& msg) -> Error {
    return {ErrorCode::TimeoutError, msg};
}

inline auto notConnected(const std::string& msg) -> Error {
    return {ErrorCode::NotConnected, msg};
}

inline auto protocol(const std::string& msg) -> Error {
    return {ErrorCode::ProtocolError, msg};
}

inline auto unavailable(const std::string& msg) -> Error {
    return {ErrorCode::Unavailable, msg};
}

inline auto internal(const std::string& msg) -> Error {
    return {ErrorCode::Internal, msg};
}

}  // namespace error

}  // namespace firetv

#endif  // FIRETV_COMMON_ERROR_HPP
