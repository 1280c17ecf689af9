/*
 * config_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_store.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace firetv::config {

ConfigStore::ConfigStore(Configuration initial, std::filesystem::path source)
    : config_(std::move(initial)), source_(std::move(source)) {}

auto ConfigStore::snapshot() const -> Configuration {
    std::shared_lock lock(mutex_);
    return config_;
}

auto ConfigStore::findDevice(std::string_view name) const
    -> std::optional<DeviceDefinition> {
    std::shared_lock lock(mutex_);
    if (const auto* device = config_.find(name)) {
        return *device;
    }
    return std::nullopt;
}

auto ConfigStore::devices() const -> std::vector<DeviceDefinition> {
    std::shared_lock lock(mutex_);
    return config_.devices();
}

auto ConfigStore::sessionSettings() const -> SessionSettings {
    std::shared_lock lock(mutex_);
    return config_.sessions;
}

auto ConfigStore::sourcePath() const -> std::filesystem::path {
    std::shared_lock lock(mutex_);
    return source_;
}

auto ConfigStore::addDevice(DeviceDefinition device, bool pinned)
    -> VoidResult {
    std::unique_lock lock(mutex_);
    auto name = device.name;
    auto result = config_.addDevice(device);
    if (!result) {
        return result;
    }
    if (pinned) {
        pinned_.push_back(std::move(device));
    }
    spdlog::info("Device '{}' added{}", name, pinned ? " (pinned)" : "");
    return result;
}

auto ConfigStore::replaceDevices(const Configuration& next) -> ConfigDiff {
    std::unique_lock lock(mutex_);
    Configuration merged;
    merged.assignDevices(next);
    for (const auto& device : pinned_) {
        if (merged.contains(device.name)) {
            spdlog::warn("Configured device '{}' overrides the command line "
                         "definition",
                         device.name);
            continue;
        }
        merged.upsertDevice(device);
    }

    auto changes = diff(config_, merged);
    config_.assignDevices(merged);
    return changes;
}

}  // namespace firetv::config
