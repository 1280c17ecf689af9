/*
 * command_server.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_server.hpp"

#include <optional>

#include <spdlog/spdlog.h>

#include "config/validation.hpp"
#include "controller/config.hpp"
#include "controller/devices.hpp"

namespace firetv::server {

CommandServer::CommandServer(config::ConfigStore& store,
                             device::SessionManager& sessions,
                             config::ServerSettings settings)
    : store_(store), sessions_(sessions), settings_(std::move(settings)) {
    registerControllers();
}

CommandServer::~CommandServer() { stop(); }

void CommandServer::registerControllers() {
    controllers_.push_back(
        std::make_unique<controller::DeviceController>(*this));
    controllers_.push_back(
        std::make_unique<controller::ConfigController>(*this));
    for (auto& controller : controllers_) {
        controller->registerRoutes(app_);
    }
}

auto CommandServer::checkDeviceId(const std::string& device) const
    -> VoidResult {
    if (!accepting_.load()) {
        return failure(error::unavailable("Server is shutting down"));
    }
    if (!config::isValidDeviceId(device)) {
        return failure(error::validation("Invalid device id: " + device));
    }
    if (!store_.findDevice(device)) {
        return failure(error::notFound(device));
    }
    return success();
}

auto CommandServer::dispatch(const std::string& device,
                             std::string_view command,
                             const nlohmann::json& params)
    -> Result<device::Ack> {
    if (auto checked = checkDeviceId(device); !checked) {
        return std::unexpected(checked.error());
    }

    auto parsed = device::makeCommand(device, command, params);
    if (!parsed) {
        return failure(Error(parsed.error()).forDevice(device));
    }

    spdlog::debug("Dispatching '{}' to '{}'", parsed->name(), device);
    return sessions_.send(device, std::move(*parsed));
}

auto CommandServer::dispatchJson(const std::string& device,
                                 std::string_view command,
                                 const nlohmann::json& params)
    -> Result<nlohmann::json> {
    auto ack = dispatch(device, command, params);
    if (!ack) {
        spdlog::warn("Command '{}' failed: {}", command,
                     ack.error().toString());
        return std::unexpected(ack.error());
    }
    return ack->toJson();
}

auto CommandServer::deviceState(const std::string& device)
    -> Result<nlohmann::json> {
    auto ack = dispatch(device, "state");
    if (!ack) {
        if (ack.error().code == ErrorCode::NotConnected) {
            return nlohmann::json{{"device", device},
                                  {"state", "disconnected"},
                                  {"reason", ack.error().message}};
        }
        return std::unexpected(ack.error());
    }
    return ack->toJson();
}

auto CommandServer::connectDevice(const std::string& device)
    -> Result<nlohmann::json> {
    if (auto checked = checkDeviceId(device); !checked) {
        return std::unexpected(checked.error());
    }
    auto session = sessions_.connect(device);
    if (!session) {
        spdlog::warn("Connect to '{}' failed: {}", device,
                     session.error().message);
        return std::unexpected(session.error());
    }
    return nlohmann::json{
        {"device", device},
        {"state", std::string(device::sessionStateName((*session)->state()))}};
}

auto CommandServer::disconnectDevice(const std::string& device)
    -> Result<nlohmann::json> {
    if (auto checked = checkDeviceId(device); !checked) {
        return std::unexpected(checked.error());
    }
    if (auto result = sessions_.disconnect(device); !result) {
        return std::unexpected(result.error());
    }
    return nlohmann::json{{"device", device}, {"state", "disconnected"}};
}

auto CommandServer::addDevice(const nlohmann::json& body)
    -> Result<nlohmann::json> {
    if (!accepting_.load()) {
        return failure(error::unavailable("Server is shutting down"));
    }
    auto field = [&body](const char* key) -> std::optional<std::string> {
        auto it = body.find(key);
        if (it == body.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    };

    auto id = field("device_id");
    auto host = field("host");
    if (!id || !host) {
        return failure(error::validation(
            "Fields 'device_id' and 'host' are required strings"));
    }
    if (!config::isValidDeviceId(*id)) {
        return failure(error::validation("Invalid device id: " + *id));
    }
    auto address = config::parseHostAddress(*host);
    if (!address || !config::isValidHostName(address->host)) {
        return failure(error::validation(
            "Invalid host, expected <address>:<port>: " + *host));
    }

    config::DeviceDefinition definition;
    definition.name = *id;
    definition.host = address->host;
    definition.port = address->port;
    definition.credential = field("credential").value_or("");
    definition.family = field("family").value_or(config::DEFAULT_FAMILY);

    if (auto added = sessions_.addDevice(definition); !added) {
        return failure(Error(added.error()).forDevice(*id));
    }
    spdlog::info("Device '{}' added at {}", definition.name,
                 definition.address());
    return nlohmann::json{{"device", definition.toJson()}};
}

auto CommandServer::listDevices() const -> nlohmann::json {
    auto devices = nlohmann::json::object();
    for (const auto& info : sessions_.list()) {
        devices[info.name] = info.toJson();
    }
    return devices;
}

auto CommandServer::reloadConfiguration() -> Result<nlohmann::json> {
    if (!accepting_.load()) {
        return failure(error::unavailable("Server is shutting down"));
    }
    auto changes = sessions_.reload();
    if (!changes) {
        return std::unexpected(changes.error());
    }
    return changes->toJson();
}

void CommandServer::configure() {
    app_.loglevel(crow::LogLevel::Warning);
    // Process signals are handled by the caller
    app_.signal_clear();
    app_.bindaddr(settings_.bind_address)
        .port(static_cast<uint16_t>(settings_.port))
        .concurrency(static_cast<uint16_t>(settings_.threads));
}

void CommandServer::runAsync() {
    configure();
    serving_ = app_.run_async();
    app_.wait_for_server_start();
    spdlog::info("Command server listening on {}:{} with {} thread(s)",
                 settings_.bind_address, settings_.port, settings_.threads);
}

void CommandServer::beginShutdown() {
    if (!accepting_.exchange(false)) {
        return;
    }
    app_.get_middleware<middleware::ShutdownGate>().close();
    spdlog::info("Command server no longer accepts requests");
}

void CommandServer::stop() {
    beginShutdown();
    if (serving_.valid()) {
        app_.stop();
        serving_.wait();
        serving_ = {};
        spdlog::info("Command server stopped");
    }
}

auto CommandServer::isAccepting() const -> bool { return accepting_.load(); }

}  // namespace firetv::server
