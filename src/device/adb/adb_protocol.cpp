/*
 * adb_protocol.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: ADB protocol implementation: handshake, RSA authentication,
shell streams and Fire TV command translation

**************************************************/

#include "adb_protocol.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

#include "adb_key.hpp"

namespace firetv::device::adb {

namespace {

constexpr int KEY_POWER = 26;

auto stripCarriageReturns(std::string text) -> std::string {
    std::erase(text, '\r');
    return text;
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\n");
    return text.substr(begin, end - begin + 1);
}

}  // namespace

auto parseCurrentFocus(const std::string& output) -> std::optional<AppWindow> {
    static const std::regex pattern(R"(Window\{(.+?) (.+) (.+?)(?:\/(.+?))?\}$)");

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto trimmed = std::string(trim(line));
        std::smatch match;
        if (std::regex_search(trimmed, match, pattern)) {
            AppWindow window;
            window.package = match[3].str();
            if (match[4].matched) {
                window.activity = match[4].str();
            }
            return window;
        }
    }
    return std::nullopt;
}

auto parseRunningApps(const std::string& output) -> std::vector<std::string> {
    std::vector<std::string> apps;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find("u0_a") == std::string::npos) {
            continue;
        }
        auto trimmed = trim(line);
        auto space = trimmed.find_last_of(" \t");
        auto name = space == std::string_view::npos
                        ? trimmed
                        : trimmed.substr(space + 1);
        if (!name.empty()) {
            apps.emplace_back(name);
        }
    }
    return apps;
}

AdbProtocol::AdbProtocol(std::unique_ptr<Transport> transport,
                         ProtocolOptions options)
    : transport_(std::move(transport)),
      channel_(*transport_),
      options_(std::move(options)) {}

AdbProtocol::~AdbProtocol() { close(); }

auto AdbProtocol::open(const config::DeviceDefinition& device) -> VoidResult {
    close();
    deviceName_ = device.name;

    spdlog::debug("[{}] Connecting to {}", deviceName_, device.address());
    if (auto opened = transport_->open(device.host, device.port,
                                       options_.connect_timeout);
        !opened) {
        return opened;
    }

    channel_.setMaxPayload(MAX_PAYLOAD);
    if (auto result = handshake(device); !result) {
        transport_->close();
        return result;
    }

    connected_ = true;
    spdlog::info("[{}] ADB connected to {} ({})", deviceName_, device.address(),
                 deviceBanner_);
    return success();
}

auto AdbProtocol::receiveDuringHandshake(std::chrono::milliseconds timeout)
    -> Result<Message> {
    auto reply = channel_.receive(timeout);
    if (!reply && reply.error().code == ErrorCode::TimeoutError) {
        return failure(ErrorCode::TimeoutError,
                       std::format("Device did not answer the handshake within "
                                   "{}ms",
                                   timeout.count()));
    }
    return reply;
}

auto AdbProtocol::handshake(const config::DeviceDefinition& device)
    -> VoidResult {
    Message cnxn{A_CNXN, ADB_VERSION, MAX_PAYLOAD,
                 "host::" + options_.banner + std::string(1, '\0')};
    if (auto sent = channel_.send(cnxn); !sent) {
        return sent;
    }

    auto reply = receiveDuringHandshake(options_.handshake_timeout);
    if (!reply) {
        return std::unexpected(reply.error());
    }

    if (reply->command == A_CNXN) {
        onConnected(*reply);
        return success();
    }
    if (reply->command == A_AUTH && reply->arg0 == AUTH_TOKEN) {
        return authenticate(*reply, device);
    }
    return failure(ErrorCode::ProtocolError,
                   std::format("Unexpected {} during handshake",
                               commandName(reply->command)));
}

auto AdbProtocol::authenticate(const Message& challenge,
                               const config::DeviceDefinition& device)
    -> VoidResult {
    if (device.credential.empty()) {
        return failure(ErrorCode::AuthError,
                       "Device requires authentication but no credential "
                       "is configured");
    }

    auto key = AdbKey::loadFromFile(device.credential);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto signature = key->sign(challenge.payload);
    if (!signature) {
        return std::unexpected(signature.error());
    }

    if (auto sent = channel_.send({A_AUTH, AUTH_SIGNATURE, 0, *signature});
        !sent) {
        return sent;
    }

    auto reply = receiveDuringHandshake(options_.handshake_timeout);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (reply->command == A_CNXN) {
        onConnected(*reply);
        return success();
    }
    if (reply->command != A_AUTH || reply->arg0 != AUTH_TOKEN) {
        return failure(ErrorCode::ProtocolError,
                       std::format("Unexpected {} after AUTH signature",
                                   commandName(reply->command)));
    }

    // Signature rejected: the key is not trusted by the device yet
    if (!options_.enroll_public_key) {
        return failure(ErrorCode::AuthError,
                       "Device rejected the credential signature");
    }

    auto publicKey = key->androidPublicKey();
    if (!publicKey) {
        return std::unexpected(publicKey.error());
    }

    spdlog::warn("[{}] Credential not trusted yet, accept the debugging "
                 "prompt on the TV within {}s",
                 deviceName_,
                 std::chrono::duration_cast<std::chrono::seconds>(
                     options_.auth_timeout)
                     .count());

    Message enroll{A_AUTH, AUTH_RSAPUBLICKEY, 0,
                   *publicKey + " " + options_.banner + std::string(1, '\0')};
    if (auto sent = channel_.send(enroll); !sent) {
        return sent;
    }

    auto accepted = channel_.receive(options_.auth_timeout);
    if (!accepted) {
        if (accepted.error().code == ErrorCode::TimeoutError) {
            return failure(ErrorCode::TimeoutError,
                           std::format("Public key was not accepted on the "
                                       "device within {}ms",
                                       options_.auth_timeout.count()));
        }
        return std::unexpected(accepted.error());
    }
    if (accepted->command == A_CNXN) {
        onConnected(*accepted);
        return success();
    }
    if (accepted->command == A_AUTH) {
        return failure(ErrorCode::AuthError,
                       "Device rejected the public key");
    }
    return failure(ErrorCode::ProtocolError,
                   std::format("Unexpected {} after public key",
                               commandName(accepted->command)));
}

void AdbProtocol::onConnected(const Message& cnxn) {
    deviceBanner_ = cnxn.payload;
    std::erase(deviceBanner_, '\0');
    auto negotiated = std::clamp(cnxn.arg1, MAX_PAYLOAD, MAX_ACCEPTED_PAYLOAD);
    channel_.setMaxPayload(negotiated);
}

void AdbProtocol::close() {
    if (connected_) {
        spdlog::debug("[{}] Closing ADB link", deviceName_);
    }
    connected_ = false;
    transport_->close();
}

void AdbProtocol::abort() noexcept { transport_->abort(); }

auto AdbProtocol::isOpen() const -> bool {
    return connected_ && transport_->isOpen();
}

auto AdbProtocol::shell(const std::string& command) -> Result<std::string> {
    if (!isOpen()) {
        return failure(ErrorCode::NotConnected, "ADB link is not open");
    }

    const uint32_t localId = nextLocalId_++;
    if (nextLocalId_ == 0) {
        nextLocalId_ = 1;
    }

    spdlog::debug("[{}] shell: {}", deviceName_, command);
    if (auto sent = channel_.send(
            {A_OPEN, localId, 0, "shell:" + command + std::string(1, '\0')});
        !sent) {
        return std::unexpected(sent.error());
    }

    std::string output;
    uint32_t remoteId = 0;
    while (true) {
        auto message = channel_.receive(options_.io_timeout);
        if (!message) {
            return std::unexpected(message.error());
        }

        if (message->command == A_CNXN || message->command == A_AUTH) {
            return failure(ErrorCode::ProtocolError,
                           std::format("Device restarted the session ({})",
                                       commandName(message->command)));
        }
        if (message->arg1 != localId) {
            // Left over from an earlier stream
            spdlog::trace("[{}] Ignoring {} for stream {}", deviceName_,
                          commandName(message->command), message->arg1);
            continue;
        }

        switch (message->command) {
            case A_OKAY:
                remoteId = message->arg0;
                break;
            case A_WRTE: {
                output += message->payload;
                if (auto ack = channel_.send({A_OKAY, localId, message->arg0, {}});
                    !ack) {
                    return std::unexpected(ack.error());
                }
                break;
            }
            case A_CLSE:
                if (remoteId == 0 && message->arg0 == 0) {
                    return failure(ErrorCode::ProtocolError,
                                   "Device refused the shell stream");
                }
                if (auto ack = channel_.send({A_CLSE, localId, message->arg0, {}});
                    !ack) {
                    return std::unexpected(ack.error());
                }
                return stripCarriageReturns(std::move(output));
            default:
                return failure(ErrorCode::ProtocolError,
                               std::format("Unexpected {} on shell stream",
                                           commandName(message->command)));
        }
    }
}

auto AdbProtocol::ping() -> VoidResult {
    auto output = shell("echo ok");
    if (!output) {
        return std::unexpected(output.error());
    }
    if (trim(*output) != "ok") {
        return failure(ErrorCode::ProtocolError,
                       "Unexpected heartbeat answer: " + *output);
    }
    return success();
}

auto AdbProtocol::sendKey(int code) -> VoidResult {
    auto output = shell(std::format("input keyevent {}", code));
    if (!output) {
        return std::unexpected(output.error());
    }
    return success();
}

auto AdbProtocol::dumpHas(const std::string& service, const std::string& grep,
                          const std::string& search) -> Result<bool> {
    auto output = shell(std::format("dumpsys {} | grep \"{}\"", service, grep));
    if (!output) {
        return std::unexpected(output.error());
    }
    return output->find(search) != std::string::npos;
}

auto AdbProtocol::screenOn() -> Result<bool> {
    return dumpHas("power", "Display Power", "state=ON");
}

auto AdbProtocol::awake() -> Result<bool> {
    return dumpHas("power", "mWakefulness", "Awake");
}

auto AdbProtocol::wakeLock() -> Result<bool> {
    auto noLocks = dumpHas("power", "Locks", "size=0");
    if (!noLocks) {
        return noLocks;
    }
    return !*noLocks;
}

auto AdbProtocol::currentApp() -> Result<std::optional<AppWindow>> {
    auto output = shell("dumpsys window windows | grep mCurrentFocus");
    if (!output) {
        return std::unexpected(output.error());
    }
    return parseCurrentFocus(*output);
}

auto AdbProtocol::deviceState() -> Result<std::string> {
    auto on = screenOn();
    if (!on) {
        return std::unexpected(on.error());
    }
    if (!*on) {
        return std::string(STATE_OFF);
    }

    auto isAwake = awake();
    if (!isAwake) {
        return std::unexpected(isAwake.error());
    }
    if (!*isAwake) {
        return std::string(STATE_IDLE);
    }

    auto app = currentApp();
    if (!app) {
        return std::unexpected(app.error());
    }
    if (*app && (*app)->package == LAUNCHER_PACKAGE) {
        return std::string(STATE_STANDBY);
    }

    auto locked = wakeLock();
    if (!locked) {
        return std::unexpected(locked.error());
    }
    return std::string(*locked ? STATE_PLAYING : STATE_PAUSED);
}

auto AdbProtocol::launchApp(const std::string& app) -> Result<nlohmann::json> {
    auto output = shell(std::format("monkey -p {} -c {} 1; echo $?", app,
                                    INTENT_LAUNCH));
    if (!output) {
        return std::unexpected(output.error());
    }

    auto text = trim(*output);
    auto newline = text.find_last_of('\n');
    auto lastLine =
        newline == std::string_view::npos ? text : text.substr(newline + 1);
    int retcode = -1;
    auto [ptr, ec] = std::from_chars(
        lastLine.data(), lastLine.data() + lastLine.size(), retcode);
    if (ec != std::errc{}) {
        return failure(ErrorCode::ProtocolError,
                       "Cannot read launcher exit status: " +
                           std::string(lastLine));
    }
    if (retcode != 0) {
        return failure(ErrorCode::ValidationError,
                       std::format("App {} could not be launched (exit {})",
                                   app, retcode));
    }
    return nlohmann::json{{"app", app}, {"retcode", retcode}};
}

auto AdbProtocol::setPower(bool on) -> Result<nlohmann::json> {
    auto screen = screenOn();
    if (!screen) {
        return std::unexpected(screen.error());
    }
    bool changed = *screen != on;
    if (changed) {
        if (auto pressed = sendKey(KEY_POWER); !pressed) {
            return std::unexpected(pressed.error());
        }
    }
    return nlohmann::json{{"changed", changed}};
}

auto AdbProtocol::execute(const Command& command) -> Result<nlohmann::json> {
    if (!isOpen()) {
        return failure(ErrorCode::NotConnected, "ADB link is not open");
    }

    if (auto code = keyCodeFor(command.kind)) {
        if (auto pressed = sendKey(*code); !pressed) {
            return std::unexpected(pressed.error());
        }
        return nlohmann::json::object();
    }

    switch (command.kind) {
        case CommandKind::TurnOn:
            return setPower(true);
        case CommandKind::TurnOff:
            return setPower(false);
        case CommandKind::KeyEvent: {
            if (auto pressed = sendKey(command.keyCode); !pressed) {
                return std::unexpected(pressed.error());
            }
            return nlohmann::json{{"code", command.keyCode}};
        }
        case CommandKind::LaunchApp:
            return launchApp(command.app);
        case CommandKind::StopApp: {
            auto output = shell(std::format("monkey -p {} -c {} 1",
                                            LAUNCHER_PACKAGE, INTENT_HOME));
            if (!output) {
                return std::unexpected(output.error());
            }
            return nlohmann::json{{"app", command.app}};
        }
        case CommandKind::State: {
            auto state = deviceState();
            if (!state) {
                return std::unexpected(state.error());
            }
            return nlohmann::json{{"state", *state}};
        }
        case CommandKind::CurrentApp: {
            auto app = currentApp();
            if (!app) {
                return std::unexpected(app.error());
            }
            if (!*app) {
                return nlohmann::json{{"current_app", nullptr}};
            }
            return nlohmann::json{
                {"current_app",
                 {{"package", (*app)->package},
                  {"activity", (*app)->activity}}}};
        }
        case CommandKind::RunningApps: {
            auto output = shell("ps");
            if (!output) {
                return std::unexpected(output.error());
            }
            return nlohmann::json{{"running_apps", parseRunningApps(*output)}};
        }
        case CommandKind::AppState: {
            auto screen = screenOn();
            if (!screen) {
                return std::unexpected(screen.error());
            }
            bool running = false;
            if (*screen) {
                auto app = currentApp();
                if (!app) {
                    return std::unexpected(app.error());
                }
                running = *app && (*app)->package == command.app;
            }
            return nlohmann::json{{"app", command.app},
                                  {"status", running ? STATE_ON : STATE_OFF}};
        }
        default:
            return failure(ErrorCode::ValidationError,
                           std::format("Command '{}' is not supported by adb",
                                       command.name()));
    }
}

}  // namespace firetv::device::adb
