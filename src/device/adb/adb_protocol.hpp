/*
 * adb_protocol.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: ADB over TCP device protocol for Fire TV and Android TV

**************************************************/

#ifndef FIRETV_DEVICE_ADB_ADB_PROTOCOL_HPP
#define FIRETV_DEVICE_ADB_ADB_PROTOCOL_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "adb_message.hpp"
#include "device/protocol.hpp"
#include "device/transport.hpp"

namespace firetv::device::adb {

inline constexpr const char* LAUNCHER_PACKAGE = "com.amazon.tv.launcher";
inline constexpr const char* INTENT_LAUNCH = "android.intent.category.LAUNCHER";
inline constexpr const char* INTENT_HOME = "android.intent.category.HOME";

// Device states reported by the "state" query
inline constexpr const char* STATE_ON = "on";
inline constexpr const char* STATE_OFF = "off";
inline constexpr const char* STATE_IDLE = "idle";
inline constexpr const char* STATE_STANDBY = "standby";
inline constexpr const char* STATE_PLAYING = "play";
inline constexpr const char* STATE_PAUSED = "pause";
inline constexpr const char* STATE_DISCONNECTED = "disconnected";

/**
 * @brief Focused window as reported by the window manager
 */
struct AppWindow {
    std::string package;
    std::string activity;
};

/**
 * @brief Extract the focused window from `dumpsys window windows` output
 */
[[nodiscard]] auto parseCurrentFocus(const std::string& output)
    -> std::optional<AppWindow>;

/**
 * @brief Package names of user processes (`u0_a*`) in `ps` output
 */
[[nodiscard]] auto parseRunningApps(const std::string& output)
    -> std::vector<std::string>;

class AdbProtocol : public DeviceProtocol {
public:
    static constexpr const char* FAMILY = "adb";

    AdbProtocol(std::unique_ptr<Transport> transport, ProtocolOptions options);
    ~AdbProtocol() override;

    [[nodiscard]] auto family() const -> std::string_view override {
        return FAMILY;
    }
    [[nodiscard]] auto capabilities() const -> CapabilitySet override {
        return CapabilitySet::all();
    }

    auto open(const config::DeviceDefinition& device) -> VoidResult override;
    auto execute(const Command& command) -> Result<nlohmann::json> override;
    auto ping() -> VoidResult override;
    void close() override;
    void abort() noexcept override;
    [[nodiscard]] auto isOpen() const -> bool override;

    /**
     * @brief Run a shell command and collect its output (CR stripped)
     */
    auto shell(const std::string& command) -> Result<std::string>;

    /**
     * @brief Banner the device sent with CNXN
     */
    [[nodiscard]] auto deviceBanner() const -> const std::string& {
        return deviceBanner_;
    }

private:
    auto handshake(const config::DeviceDefinition& device) -> VoidResult;
    auto authenticate(const Message& challenge,
                      const config::DeviceDefinition& device) -> VoidResult;
    void onConnected(const Message& cnxn);
    auto receiveDuringHandshake(std::chrono::milliseconds timeout)
        -> Result<Message>;

    auto sendKey(int code) -> VoidResult;
    auto dumpHas(const std::string& service, const std::string& grep,
                 const std::string& search) -> Result<bool>;
    auto screenOn() -> Result<bool>;
    auto awake() -> Result<bool>;
    auto wakeLock() -> Result<bool>;
    auto currentApp() -> Result<std::optional<AppWindow>>;
    auto deviceState() -> Result<std::string>;
    auto launchApp(const std::string& app) -> Result<nlohmann::json>;
    auto setPower(bool on) -> Result<nlohmann::json>;

    std::unique_ptr<Transport> transport_;
    MessageChannel channel_;
    ProtocolOptions options_;
    std::string deviceName_;
    std::string deviceBanner_;
    uint32_t nextLocalId_{1};
    bool connected_{false};
};

}  // namespace firetv::device::adb

#endif  // FIRETV_DEVICE_ADB_ADB_PROTOCOL_HPP
