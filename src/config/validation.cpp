/*
 * validation.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "validation.hpp"

#include <charconv>
#include <regex>

namespace firetv::config {

namespace {

const std::regex& deviceIdPattern() {
    static const std::regex pattern(R"(^[-\w]+$)");
    return pattern;
}

const std::regex& appIdPattern() {
    static const std::regex pattern(R"(^[a-zA-Z][a-zA-Z0-9_.]+$)");
    return pattern;
}

const std::regex& hostNamePattern() {
    static const std::regex pattern(R"(^[A-Za-z0-9]([A-Za-z0-9.\-]*[A-Za-z0-9])?$)");
    return pattern;
}

}  // namespace

auto isValidDeviceId(std::string_view id) -> bool {
    if (id.empty()) {
        return false;
    }
    return std::regex_match(id.begin(), id.end(), deviceIdPattern());
}

auto isValidAppId(std::string_view app) -> bool {
    return std::regex_match(app.begin(), app.end(), appIdPattern());
}

auto isValidHostName(std::string_view host) -> bool {
    if (host.empty() || host.size() > 253) {
        return false;
    }
    if (host.find(':') != std::string_view::npos) {
        // IPv6 literal
        return host.find_first_not_of("0123456789abcdefABCDEF:.") ==
               std::string_view::npos;
    }
    return std::regex_match(host.begin(), host.end(), hostNamePattern());
}

auto parseHostAddress(std::string_view value) -> std::optional<HostAddress> {
    std::string_view host;
    std::string_view port;

    if (value.starts_with('[')) {
        auto close = value.find(']');
        if (close == std::string_view::npos || close + 1 >= value.size() ||
            value[close + 1] != ':') {
            return std::nullopt;
        }
        host = value.substr(1, close - 1);
        port = value.substr(close + 2);
    } else {
        auto colon = value.rfind(':');
        if (colon == std::string_view::npos ||
            value.find(':') != colon) {
            return std::nullopt;
        }
        host = value.substr(0, colon);
        port = value.substr(colon + 1);
    }

    if (!isValidHostName(host) || port.empty()) {
        return std::nullopt;
    }

    long number = 0;
    auto [ptr, ec] =
        std::from_chars(port.data(), port.data() + port.size(), number);
    if (ec != std::errc{} || ptr != port.data() + port.size() ||
        !isValidPort(number)) {
        return std::nullopt;
    }

    return HostAddress{std::string(host), static_cast<int>(number)};
}

}  // namespace firetv::config
