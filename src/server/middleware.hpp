/*
 * middleware.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Global HTTP middlewares: request logging and the shutdown gate

**************************************************/

#ifndef FIRETV_SERVER_MIDDLEWARE_HPP
#define FIRETV_SERVER_MIDDLEWARE_HPP

#include <crow.h>

#include <atomic>
#include <chrono>
#include <memory>

#include <spdlog/spdlog.h>

#include "atom/type/json.hpp"

namespace firetv::server::middleware {

/**
 * @brief Logs every request with its status and duration
 */
struct RequestLogger {
    struct context {
        std::chrono::steady_clock::time_point start_time;
    };

    void before_handle(crow::request& req, crow::response& /*res*/,
                       context& ctx) {
        ctx.start_time = std::chrono::steady_clock::now();
        spdlog::debug("Request received: {} {} from {}",
                      crow::method_name(req.method), req.url,
                      req.remote_ip_address);
    }

    void after_handle(crow::request& req, crow::response& res,
                      context& ctx) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);
        if (res.code >= 500) {
            spdlog::warn("{} {} -> {} ({}ms)", crow::method_name(req.method),
                         req.url, res.code, elapsed.count());
        } else {
            spdlog::info("{} {} -> {} ({}ms)", crow::method_name(req.method),
                         req.url, res.code, elapsed.count());
        }
    }
};

/**
 * @brief Answers 503 to every request once the server is shutting down
 */
struct ShutdownGate {
    struct context {};

    void before_handle(crow::request& req, crow::response& res,
                       context& /*ctx*/) {
        if (!closed_->load()) {
            return;
        }
        spdlog::debug("Rejecting {} during shutdown", req.url);
        nlohmann::json body = {
            {"success", false},
            {"error",
             {{"code", "Unavailable"},
              {"message", "Server is shutting down"}}}};
        res.code = 503;
        res.set_header("Content-Type", "application/json");
        res.write(body.dump());
        res.end();
    }

    void after_handle(crow::request& /*req*/, crow::response& /*res*/,
                      context& /*ctx*/) {}

    void close() { closed_->store(true); }

    [[nodiscard]] auto isClosed() const -> bool { return closed_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> closed_ =
        std::make_shared<std::atomic<bool>>(false);
};

}  // namespace firetv::server::middleware

#endif  // FIRETV_SERVER_MIDDLEWARE_HPP
