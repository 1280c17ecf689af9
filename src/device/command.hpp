/*
 * command.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device commands, their capabilities and acknowledgements

**************************************************/

#ifndef FIRETV_DEVICE_COMMAND_HPP
#define FIRETV_DEVICE_COMMAND_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"
#include "common/result.hpp"

namespace firetv::device {

/**
 * @brief Feature a device family must support to run a command
 */
enum class Capability : uint8_t {
    Power = 1 << 0,
    Volume = 1 << 1,
    KeyEvent = 1 << 2,
    AppLaunch = 1 << 3,
    Query = 1 << 4
};

[[nodiscard]] auto capabilityName(Capability capability) -> std::string_view;

/**
 * @brief Set of capabilities declared by a protocol family
 */
class CapabilitySet {
public:
    constexpr CapabilitySet() = default;
    constexpr CapabilitySet(std::initializer_list<Capability> caps) {
        for (auto cap : caps) {
            bits_ |= static_cast<uint8_t>(cap);
        }
    }

    [[nodiscard]] static constexpr auto all() -> CapabilitySet {
        return {Capability::Power, Capability::Volume, Capability::KeyEvent,
                Capability::AppLaunch, Capability::Query};
    }

    [[nodiscard]] constexpr auto has(Capability cap) const -> bool {
        return (bits_ & static_cast<uint8_t>(cap)) != 0;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    uint8_t bits_{0};
};

enum class CommandKind {
    // Power
    TurnOn,
    TurnOff,
    Power,
    // Navigation
    Home,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Back,
    Menu,
    // Volume
    VolumeUp,
    VolumeDown,
    // Media
    MediaPlayPause,
    MediaPlay,
    MediaPause,
    MediaNext,
    MediaPrevious,
    // Raw key event with an explicit code
    KeyEvent,
    // Applications
    LaunchApp,
    StopApp,
    // Queries
    State,
    CurrentApp,
    RunningApps,
    AppState
};

inline constexpr int MAX_KEY_CODE = 400;

/**
 * @brief Wire name of a command ("turn_on", "volume_up", ...)
 */
[[nodiscard]] auto commandKindName(CommandKind kind) -> std::string_view;

/**
 * @brief Look up a command by name
 *
 * Dashes are accepted in place of underscores, and "power_on"/"power_off"
 * are aliases of "turn_on"/"turn_off".
 */
[[nodiscard]] auto commandKindFromName(std::string_view name)
    -> std::optional<CommandKind>;

[[nodiscard]] auto requiredCapability(CommandKind kind) -> Capability;

/**
 * @brief Android key code sent for a plain key command, if it is one
 */
[[nodiscard]] auto keyCodeFor(CommandKind kind) -> std::optional<int>;

[[nodiscard]] auto needsApp(CommandKind kind) -> bool;

/**
 * @brief A validated command addressed to one device
 */
struct Command {
    CommandKind kind{CommandKind::State};
    std::string device;
    std::string app;  ///< Package for LaunchApp/StopApp/AppState
    int keyCode{0};   ///< Code for KeyEvent

    [[nodiscard]] auto name() const -> std::string_view {
        return commandKindName(kind);
    }

    [[nodiscard]] auto capability() const -> Capability {
        return requiredCapability(kind);
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Build a command from its name and parameters
 *
 * Parameters: "app" for application commands, "code" for key_event.
 * @return ValidationError for unknown names or malformed parameters
 */
[[nodiscard]] auto makeCommand(std::string device, std::string_view name,
                               const nlohmann::json& params = nullptr)
    -> Result<Command>;

/**
 * @brief Successful command outcome
 */
struct Ack {
    std::string device;
    std::string command;
    nlohmann::json data = nlohmann::json::object();
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace firetv::device

#endif  // FIRETV_DEVICE_COMMAND_HPP
