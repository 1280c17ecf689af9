/*
 * command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <utility>

#include "config/validation.hpp"

namespace firetv::device {

namespace {

struct CommandInfo {
    CommandKind kind;
    std::string_view name;
    Capability capability;
    int keyCode;  // 0 when the command is not a plain key press
};

// Android KeyEvent codes
constexpr std::array COMMANDS = {
    CommandInfo{CommandKind::TurnOn, "turn_on", Capability::Power, 0},
    CommandInfo{CommandKind::TurnOff, "turn_off", Capability::Power, 0},
    CommandInfo{CommandKind::Power, "power", Capability::Power, 26},
    CommandInfo{CommandKind::Home, "home", Capability::KeyEvent, 3},
    CommandInfo{CommandKind::Up, "up", Capability::KeyEvent, 19},
    CommandInfo{CommandKind::Down, "down", Capability::KeyEvent, 20},
    CommandInfo{CommandKind::Left, "left", Capability::KeyEvent, 21},
    CommandInfo{CommandKind::Right, "right", Capability::KeyEvent, 22},
    CommandInfo{CommandKind::Enter, "enter", Capability::KeyEvent, 66},
    CommandInfo{CommandKind::Back, "back", Capability::KeyEvent, 4},
    CommandInfo{CommandKind::Menu, "menu", Capability::KeyEvent, 1},
    CommandInfo{CommandKind::VolumeUp, "volume_up", Capability::Volume, 24},
    CommandInfo{CommandKind::VolumeDown, "volume_down", Capability::Volume,
                25},
    CommandInfo{CommandKind::MediaPlayPause, "media_play_pause",
                Capability::KeyEvent, 85},
    CommandInfo{CommandKind::MediaPlay, "media_play", Capability::KeyEvent,
                126},
    CommandInfo{CommandKind::MediaPause, "media_pause", Capability::KeyEvent,
                127},
    CommandInfo{CommandKind::MediaNext, "media_next", Capability::KeyEvent,
                87},
    CommandInfo{CommandKind::MediaPrevious, "media_previous",
                Capability::KeyEvent, 88},
    CommandInfo{CommandKind::KeyEvent, "key_event", Capability::KeyEvent, 0},
    CommandInfo{CommandKind::LaunchApp, "launch_app", Capability::AppLaunch,
                0},
    CommandInfo{CommandKind::StopApp, "stop_app", Capability::AppLaunch, 0},
    CommandInfo{CommandKind::State, "state", Capability::Query, 0},
    CommandInfo{CommandKind::CurrentApp, "current_app", Capability::Query, 0},
    CommandInfo{CommandKind::RunningApps, "running_apps", Capability::Query,
                0},
    CommandInfo{CommandKind::AppState, "app_state", Capability::Query, 0},
};

auto infoFor(CommandKind kind) -> const CommandInfo& {
    auto it = std::ranges::find(COMMANDS, kind, &CommandInfo::kind);
    return *it;
}

}  // namespace

auto capabilityName(Capability capability) -> std::string_view {
    switch (capability) {
        case Capability::Power:
            return "power";
        case Capability::Volume:
            return "volume";
        case Capability::KeyEvent:
            return "key-event";
        case Capability::AppLaunch:
            return "app-launch";
        case Capability::Query:
            return "query";
    }
    return "unknown";
}

auto CapabilitySet::toJson() const -> nlohmann::json {
    auto list = nlohmann::json::array();
    for (auto cap : {Capability::Power, Capability::Volume,
                     Capability::KeyEvent, Capability::AppLaunch,
                     Capability::Query}) {
        if (has(cap)) {
            list.push_back(std::string(capabilityName(cap)));
        }
    }
    return list;
}

auto commandKindName(CommandKind kind) -> std::string_view {
    return infoFor(kind).name;
}

auto commandKindFromName(std::string_view name) -> std::optional<CommandKind> {
    std::string normalized(name);
    std::ranges::replace(normalized, '-', '_');

    if (normalized == "power_on") {
        return CommandKind::TurnOn;
    }
    if (normalized == "power_off") {
        return CommandKind::TurnOff;
    }

    auto it = std::ranges::find(COMMANDS, normalized, &CommandInfo::name);
    if (it == COMMANDS.end()) {
        return std::nullopt;
    }
    return it->kind;
}

auto requiredCapability(CommandKind kind) -> Capability {
    return infoFor(kind).capability;
}

auto keyCodeFor(CommandKind kind) -> std::optional<int> {
    const auto& info = infoFor(kind);
    if (info.keyCode == 0) {
        return std::nullopt;
    }
    return info.keyCode;
}

auto needsApp(CommandKind kind) -> bool {
    return kind == CommandKind::LaunchApp || kind == CommandKind::StopApp ||
           kind == CommandKind::AppState;
}

auto Command::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"command", std::string(name())}, {"device", device}};
    if (needsApp(kind)) {
        j["app"] = app;
    }
    if (kind == CommandKind::KeyEvent) {
        j["code"] = keyCode;
    }
    return j;
}

auto makeCommand(std::string device, std::string_view name,
                 const nlohmann::json& params) -> Result<Command> {
    auto kind = commandKindFromName(name);
    if (!kind) {
        return failure(error::validation(
                           std::format("Unknown command '{}'", name))
                           .forDevice(device));
    }
    if (!params.is_null() && !params.is_object()) {
        return failure(
            error::validation("Command parameters must be an object")
                .forDevice(device));
    }

    Command command;
    command.kind = *kind;
    command.device = std::move(device);

    if (needsApp(command.kind)) {
        if (params.is_null() || !params.contains("app") ||
            !params["app"].is_string()) {
            return failure(error::validation(std::format(
                                                 "Command '{}' requires an "
                                                 "'app' parameter",
                                                 command.name()))
                               .forDevice(command.device));
        }
        command.app = params["app"].get<std::string>();
        if (!config::isValidAppId(command.app)) {
            return failure(
                error::validation("Invalid app id: " + command.app)
                    .forDevice(command.device));
        }
    }

    if (command.kind == CommandKind::KeyEvent) {
        if (params.is_null() || !params.contains("code") ||
            !params["code"].is_number_integer()) {
            return failure(error::validation(
                               "Command 'key_event' requires an integer "
                               "'code' parameter")
                               .forDevice(command.device));
        }
        const auto& code = params["code"];
        if (code.is_number_unsigned()
                ? code.get<uint64_t>() > static_cast<uint64_t>(MAX_KEY_CODE)
                : (code.get<int64_t>() < 0 ||
                   code.get<int64_t>() > MAX_KEY_CODE)) {
            return failure(error::validation(std::format(
                                                 "Key code {} out of range",
                                                 code.dump()))
                               .forDevice(command.device));
        }
        command.keyCode = static_cast<int>(code.get<int64_t>());
    }

    return command;
}

auto Ack::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"device", device},
                        {"command", command},
                        {"elapsed_ms", elapsed.count()}};
    if (data.is_object()) {
        for (const auto& [key, value] : data.items()) {
            j[key] = value;
        }
    }
    return j;
}

}  // namespace firetv::device
