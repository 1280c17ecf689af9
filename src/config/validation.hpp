/*
 * validation.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Syntax checks for device ids, hosts and application ids

**************************************************/

#ifndef FIRETV_CONFIG_VALIDATION_HPP
#define FIRETV_CONFIG_VALIDATION_HPP

#include <optional>
#include <string>
#include <string_view>

namespace firetv::config {

/**
 * @brief Host address split into its parts
 */
struct HostAddress {
    std::string host;
    int port{0};
};

/**
 * @brief Device ids are one or more word characters or dashes
 */
[[nodiscard]] auto isValidDeviceId(std::string_view id) -> bool;

/**
 * @brief Android package names: a letter followed by letters, digits,
 * underscores or dots
 */
[[nodiscard]] auto isValidAppId(std::string_view app) -> bool;

[[nodiscard]] constexpr auto isValidPort(long port) -> bool {
    return port > 0 && port <= 65535;
}

/**
 * @brief Parse "address:port"
 *
 * The port is mandatory and must be numeric. Bracketed IPv6 literals
 * ("[::1]:5555") are accepted; the brackets are stripped.
 */
[[nodiscard]] auto parseHostAddress(std::string_view value)
    -> std::optional<HostAddress>;

/**
 * @brief Validate a bare host name or address (no port)
 */
[[nodiscard]] auto isValidHostName(std::string_view host) -> bool;

}  // namespace firetv::config

#endif  // FIRETV_CONFIG_VALIDATION_HPP
