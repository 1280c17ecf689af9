/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef FIRETV_SERVER_CONTROLLER_CONFIG_HPP
#define FIRETV_SERVER_CONTROLLER_CONFIG_HPP

#include <spdlog/spdlog.h>

#include "../command_server.hpp"
#include "../utils/response.hpp"
#include "controller.hpp"

namespace firetv::server::controller {

/**
 * @brief Configuration reload endpoint
 */
class ConfigController : public Controller {
public:
    explicit ConfigController(CommandServer& server) : server_(server) {}

    void registerRoutes(ServerApp& app) override {
        spdlog::info("Registering config routes.");

        CROW_ROUTE(app, "/config/reload")
            .methods("POST"_method)([this](const crow::request& req) {
                spdlog::info("Configuration reload requested by {}",
                             req.remote_ip_address);
                return utils::ResponseBuilder::fromResult(
                    server_.reloadConfiguration());
            });
    }

private:
    CommandServer& server_;
};

}  // namespace firetv::server::controller

#endif  // FIRETV_SERVER_CONTROLLER_CONFIG_HPP
