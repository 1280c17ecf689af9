/*
 * configuration.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "configuration.hpp"

#include <algorithm>
#include <format>

namespace firetv::config {

auto DeviceDefinition::address() const -> std::string {
    if (host.find(':') != std::string::npos) {
        return std::format("[{}]:{}", host, port);
    }
    return std::format("{}:{}", host, port);
}

auto DeviceDefinition::connectionDiffers(const DeviceDefinition& other) const
    -> bool {
    return host != other.host || port != other.port ||
           credential != other.credential || family != other.family;
}

auto DeviceDefinition::toJson() const -> nlohmann::json {
    return {{"name", name},
            {"host", address()},
            {"family", family},
            {"authenticated", !credential.empty()}};
}

auto ConfigDiff::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"added", nlohmann::json::array()},
                        {"removed", removed},
                        {"changed", nlohmann::json::array()}};
    for (const auto& device : added) {
        j["added"].push_back(device.name);
    }
    for (const auto& device : changed) {
        j["changed"].push_back(device.name);
    }
    return j;
}

auto Configuration::find(std::string_view name) const
    -> const DeviceDefinition* {
    auto it = std::ranges::find_if(
        devices_, [&](const DeviceDefinition& d) { return d.name == name; });
    return it == devices_.end() ? nullptr : &*it;
}

auto Configuration::addDevice(DeviceDefinition device) -> VoidResult {
    if (contains(device.name)) {
        return failure(ErrorCode::ValidationError,
                       "Device already exists: " + device.name);
    }
    devices_.push_back(std::move(device));
    return success();
}

void Configuration::upsertDevice(DeviceDefinition device) {
    auto it = std::ranges::find_if(devices_, [&](const DeviceDefinition& d) {
        return d.name == device.name;
    });
    if (it != devices_.end()) {
        *it = std::move(device);
    } else {
        devices_.push_back(std::move(device));
    }
}

auto diff(const Configuration& before, const Configuration& after)
    -> ConfigDiff {
    ConfigDiff result;

    for (const auto& device : before.devices()) {
        const auto* next = after.find(device.name);
        if (next == nullptr) {
            result.removed.push_back(device.name);
        } else if (device.connectionDiffers(*next)) {
            result.changed.push_back(*next);
        }
    }

    for (const auto& device : after.devices()) {
        if (!before.contains(device.name)) {
            result.added.push_back(device);
        }
    }

    return result;
}

}  // namespace firetv::config
