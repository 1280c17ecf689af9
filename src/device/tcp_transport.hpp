/*
 * tcp_transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: TCP implementation of the device transport

**************************************************/

#ifndef FIRETV_DEVICE_TCP_TRANSPORT_HPP
#define FIRETV_DEVICE_TCP_TRANSPORT_HPP

#include <memory>

#include "transport.hpp"

namespace firetv::device {

/**
 * @brief Socket options applied after connect
 */
struct TcpOptions {
    bool keepAlive{true};
    bool noDelay{true};
};

/**
 * @brief Blocking TCP stream with poll() based deadlines
 */
class TcpTransport : public Transport {
public:
    explicit TcpTransport(TcpOptions options = {});
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    auto open(const std::string& host, int port,
              std::chrono::milliseconds timeout) -> VoidResult override;
    auto write(std::string_view data) -> VoidResult override;
    auto read(size_t size, std::chrono::milliseconds timeout)
        -> Result<std::string> override;
    void close() override;
    void abort() noexcept override;
    [[nodiscard]] auto isOpen() const -> bool override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Factory producing TcpTransport instances
 */
[[nodiscard]] auto tcpTransportFactory(TcpOptions options = {})
    -> TransportFactory;

}  // namespace firetv::device

#endif  // FIRETV_DEVICE_TCP_TRANSPORT_HPP
