/*
 * protocol.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "protocol.hpp"

#include <spdlog/spdlog.h>

#include "adb/adb_protocol.hpp"
#include "tcp_transport.hpp"

namespace firetv::device {

auto ProtocolOptions::fromSettings(const config::SessionSettings& settings)
    -> ProtocolOptions {
    ProtocolOptions options;
    options.connect_timeout = settings.connect_timeout;
    options.handshake_timeout = settings.handshake_timeout;
    options.auth_timeout = settings.auth_timeout;
    options.io_timeout = settings.command_timeout;
    options.enroll_public_key = settings.enroll_public_key;
    return options;
}

auto ProtocolRegistry::withDefaults() -> ProtocolRegistry {
    ProtocolRegistry registry;
    registry.registerFamily(
        adb::AdbProtocol::FAMILY, [](const ProtocolOptions& options) {
            return std::make_unique<adb::AdbProtocol>(tcpTransportFactory()(),
                                                      options);
        });
    return registry;
}

void ProtocolRegistry::registerFamily(const std::string& family,
                                      ProtocolFactory factory) {
    if (factories_.contains(family)) {
        spdlog::warn("Protocol family '{}' registered twice, replacing",
                     family);
    }
    factories_[family] = std::move(factory);
}

auto ProtocolRegistry::contains(std::string_view family) const -> bool {
    return factories_.find(family) != factories_.end();
}

auto ProtocolRegistry::families() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        names.push_back(name);
    }
    return names;
}

auto ProtocolRegistry::create(std::string_view family,
                              const ProtocolOptions& options) const
    -> Result<std::unique_ptr<DeviceProtocol>> {
    auto it = factories_.find(family);
    if (it == factories_.end()) {
        return failure(ErrorCode::ValidationError,
                       "Unknown device family: " + std::string(family));
    }
    auto protocol = it->second(options);
    if (!protocol) {
        return failure(ErrorCode::Internal,
                       "Factory for family '" + std::string(family) +
                           "' returned no protocol");
    }
    return protocol;
}

}  // namespace firetv::device
