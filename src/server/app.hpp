/*
 * app.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef FIRETV_SERVER_APP_HPP
#define FIRETV_SERVER_APP_HPP

#include <crow.h>

#include "middleware.hpp"

namespace firetv::server {

/**
 * @brief Central HTTP application type with middleware stack
 *
 * Middleware execution order (before_handle):
 *   1. RequestLogger - Record the request start time
 *   2. ShutdownGate - Reject requests once shutdown has begun
 *
 * Note: after_handle runs in reverse order
 */
using ServerApp =
    crow::App<middleware::RequestLogger, middleware::ShutdownGate>;

}  // namespace firetv::server

#endif  // FIRETV_SERVER_APP_HPP
