/*
 * transport.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Byte stream transport used by device protocols

**************************************************/

#ifndef FIRETV_DEVICE_TRANSPORT_HPP
#define FIRETV_DEVICE_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "common/result.hpp"

namespace firetv::device {

/**
 * @brief Reliable, ordered byte stream to one device
 *
 * Only the session worker calls open/write/read/close. abort() may be called
 * from any thread to unblock a pending read or connect.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Connect to host:port
     * @return NotConnected if the peer is unreachable or refuses,
     * TimeoutError if the connect deadline passes
     */
    virtual auto open(const std::string& host, int port,
                      std::chrono::milliseconds timeout) -> VoidResult = 0;

    /**
     * @brief Write all bytes
     */
    virtual auto write(std::string_view data) -> VoidResult = 0;

    /**
     * @brief Read exactly `size` bytes
     * @return TimeoutError when the deadline passes first, NotConnected when
     * the peer closes the stream
     */
    virtual auto read(size_t size, std::chrono::milliseconds timeout)
        -> Result<std::string> = 0;

    virtual void close() = 0;

    /**
     * @brief Interrupt blocking operations; the transport is unusable until
     * the next open()
     */
    virtual void abort() noexcept = 0;

    [[nodiscard]] virtual auto isOpen() const -> bool = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

}  // namespace firetv::device

#endif  // FIRETV_DEVICE_TRANSPORT_HPP
