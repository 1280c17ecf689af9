/*
 * devices.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef FIRETV_SERVER_CONTROLLER_DEVICES_HPP
#define FIRETV_SERVER_CONTROLLER_DEVICES_HPP

#include <spdlog/spdlog.h>
#include <string>

#include "../command_server.hpp"
#include "../utils/response.hpp"
#include "atom/type/json.hpp"
#include "controller.hpp"

namespace firetv::server::controller {

using ResponseBuilder = utils::ResponseBuilder;

/**
 * @brief Device listing, actions, app control and the JSON command API
 */
class DeviceController : public Controller {
public:
    explicit DeviceController(CommandServer& server) : server_(server) {}

    void registerRoutes(ServerApp& app) override {
        spdlog::info("Registering device routes.");

        // Static segments first so they win over the <string> routes below
        CROW_ROUTE(app, "/devices/list")
            .methods("GET"_method)([this](const crow::request&) {
                return ResponseBuilder::success(
                    {{"KNOWN_DEVICES", server_.listDevices()}});
            });

        CROW_ROUTE(app, "/devices/add")
            .methods("POST"_method)([this](const crow::request& req) {
                auto body = parseBody(req);
                if (!body) {
                    return ResponseBuilder::fromError(body.error());
                }
                return ResponseBuilder::fromResult(server_.addDevice(*body));
            });

        CROW_ROUTE(app, "/devices/state/<string>")
            .methods("GET"_method)(
                [this](const crow::request&, const std::string& deviceId) {
                    return ResponseBuilder::fromResult(
                        server_.deviceState(deviceId));
                });

        CROW_ROUTE(app, "/devices/connect/<string>")
            .methods("GET"_method)(
                [this](const crow::request&, const std::string& deviceId) {
                    return ResponseBuilder::fromResult(
                        server_.connectDevice(deviceId));
                });

        CROW_ROUTE(app, "/devices/disconnect/<string>")
            .methods("GET"_method)(
                [this](const crow::request&, const std::string& deviceId) {
                    return ResponseBuilder::fromResult(
                        server_.disconnectDevice(deviceId));
                });

        CROW_ROUTE(app, "/devices/action/<string>/<string>")
            .methods("GET"_method)([this](const crow::request&,
                                          const std::string& deviceId,
                                          const std::string& action) {
                return ResponseBuilder::fromResult(
                    server_.dispatchJson(deviceId, action));
            });

        CROW_ROUTE(app, "/devices/<string>/apps/running")
            .methods("GET"_method)(
                [this](const crow::request&, const std::string& deviceId) {
                    return ResponseBuilder::fromResult(
                        server_.dispatchJson(deviceId, "running_apps"));
                });

        CROW_ROUTE(app, "/devices/<string>/apps/state/<string>")
            .methods("GET"_method)([this](const crow::request&,
                                          const std::string& deviceId,
                                          const std::string& appId) {
                return ResponseBuilder::fromResult(server_.dispatchJson(
                    deviceId, "app_state", {{"app", appId}}));
            });

        CROW_ROUTE(app, "/devices/<string>/apps/<string>/start")
            .methods("GET"_method)([this](const crow::request&,
                                          const std::string& deviceId,
                                          const std::string& appId) {
                return ResponseBuilder::fromResult(server_.dispatchJson(
                    deviceId, "launch_app", {{"app", appId}}));
            });

        CROW_ROUTE(app, "/devices/<string>/apps/<string>/stop")
            .methods("GET"_method)([this](const crow::request&,
                                          const std::string& deviceId,
                                          const std::string& appId) {
                return ResponseBuilder::fromResult(server_.dispatchJson(
                    deviceId, "stop_app", {{"app", appId}}));
            });

        CROW_ROUTE(app, "/api/v1/devices")
            .methods("GET"_method)([this](const crow::request&) {
                return ResponseBuilder::success(
                    {{"devices", server_.listDevices()}});
            });

        CROW_ROUTE(app, "/api/v1/devices/<string>/commands")
            .methods("POST"_method)(
                [this](const crow::request& req, const std::string& deviceId) {
                    return executeCommand(req, deviceId);
                });
    }

private:
    static auto parseBody(const crow::request& req) -> Result<nlohmann::json> {
        try {
            auto body = nlohmann::json::parse(req.body);
            if (!body.is_object()) {
                return failure(error::validation(
                    "The request body must be a JSON object"));
            }
            return body;
        } catch (const nlohmann::json::parse_error& e) {
            return failure(error::validation(
                std::string("The request body is not valid JSON: ") +
                e.what()));
        }
    }

    crow::response executeCommand(const crow::request& req,
                                  const std::string& deviceId) {
        auto body = parseBody(req);
        if (!body) {
            return ResponseBuilder::fromError(body.error());
        }
        if (!body->contains("command") || !(*body)["command"].is_string()) {
            return ResponseBuilder::fromError(
                error::validation("Field 'command' must be a string"));
        }
        auto params = body->value("params", nlohmann::json(nullptr));
        spdlog::debug("Command request for '{}': {}", deviceId, body->dump());
        return ResponseBuilder::fromResult(server_.dispatchJson(
            deviceId, (*body)["command"].get<std::string>(), params));
    }

    CommandServer& server_;
};

}  // namespace firetv::server::controller

#endif  // FIRETV_SERVER_CONTROLLER_DEVICES_HPP
