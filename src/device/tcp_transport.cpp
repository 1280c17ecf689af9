/*
 * tcp_transport.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: TCP transport implementation (POSIX sockets)

**************************************************/

#include "tcp_transport.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace firetv::device {

namespace {

constexpr int INVALID_SOCK = -1;

// Upper bound of a single poll() so abort() is noticed promptly
constexpr std::chrono::milliseconds POLL_SLICE{100};
constexpr std::chrono::milliseconds WRITE_TIMEOUT{5000};

auto setNonBlocking(int sock) -> bool {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

auto setSocketOption(int sock, int level, int optname, bool value) -> bool {
    int val = value ? 1 : 0;
    return setsockopt(sock, level, optname, &val, sizeof(val)) == 0;
}

auto wouldBlock() -> bool {
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINPROGRESS;
}

auto errnoMessage(int err) -> std::string { return std::strerror(err); }

}  // namespace

// ============================================================================
// TcpTransport Implementation
// ============================================================================

class TcpTransport::Impl {
public:
    explicit Impl(TcpOptions options) : options_(options) {}

    ~Impl() { close(); }

    auto open(const std::string& host, int port,
              std::chrono::milliseconds timeout) -> VoidResult {
        close();
        aborted_ = false;
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        struct addrinfo hints {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        struct addrinfo* result = nullptr;
        std::string portStr = std::to_string(port);
        int ret = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
        if (ret != 0) {
            return failure(ErrorCode::NotConnected,
                           std::format("Failed to resolve host {}: {}", host,
                                       gai_strerror(ret)));
        }

        Error lastError = error::notConnected(
            std::format("Failed to connect to {}:{}", host, port));
        int sock = INVALID_SOCK;

        for (auto* rp = result; rp != nullptr; rp = rp->ai_next) {
            sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
            if (sock == INVALID_SOCK) {
                continue;
            }
            fd_ = sock;

            if (!setNonBlocking(sock)) {
                lastError = error::notConnected("Failed to configure socket");
            } else if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0) {
                break;
            } else if (wouldBlock()) {
                auto waited = waitFor(sock, POLLOUT, deadline);
                if (waited) {
                    int err = 0;
                    socklen_t len = sizeof(err);
                    getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len);
                    if (err == 0) {
                        break;
                    }
                    lastError = error::notConnected(std::format(
                        "Failed to connect to {}:{}: {}", host, port,
                        errnoMessage(err)));
                } else {
                    lastError = waited.error();
                    if (lastError.code == ErrorCode::TimeoutError) {
                        lastError.message = std::format(
                            "Connection to {}:{} timed out after {}ms", host,
                            port, timeout.count());
                    }
                }
            } else {
                lastError = error::notConnected(
                    std::format("Failed to connect to {}:{}: {}", host, port,
                                errnoMessage(errno)));
            }

            fd_ = INVALID_SOCK;
            ::close(sock);
            sock = INVALID_SOCK;

            if (lastError.code == ErrorCode::TimeoutError ||
                std::chrono::steady_clock::now() >= deadline) {
                break;
            }
        }

        freeaddrinfo(result);

        if (sock == INVALID_SOCK) {
            spdlog::debug("{}", lastError.message);
            return std::unexpected(lastError);
        }

        if (options_.keepAlive) {
            setSocketOption(sock, SOL_SOCKET, SO_KEEPALIVE, true);
        }
        if (options_.noDelay) {
            setSocketOption(sock, IPPROTO_TCP, TCP_NODELAY, true);
        }

        spdlog::debug("TCP connected to {}:{}", host, port);
        return success();
    }

    auto write(std::string_view data) -> VoidResult {
        int sock = fd_.load();
        if (sock == INVALID_SOCK) {
            return failure(ErrorCode::NotConnected, "Transport is not open");
        }

        const auto deadline = std::chrono::steady_clock::now() + WRITE_TIMEOUT;
        size_t totalSent = 0;
        while (totalSent < data.size()) {
            auto sent = ::send(sock, data.data() + totalSent,
                               data.size() - totalSent, MSG_NOSIGNAL);
            if (sent > 0) {
                totalSent += static_cast<size_t>(sent);
                continue;
            }
            if (sent < 0 && wouldBlock()) {
                if (auto waited = waitFor(sock, POLLOUT, deadline); !waited) {
                    return std::unexpected(waited.error());
                }
                continue;
            }
            if (sent < 0 && errno == EINTR) {
                continue;
            }
            return failure(ErrorCode::NotConnected,
                           "Send failed: " + errnoMessage(errno));
        }
        return success();
    }

    auto read(size_t size, std::chrono::milliseconds timeout)
        -> Result<std::string> {
        int sock = fd_.load();
        if (sock == INVALID_SOCK) {
            return failure(ErrorCode::NotConnected, "Transport is not open");
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string buffer(size, '\0');
        size_t received = 0;
        while (received < size) {
            auto n = ::recv(sock, buffer.data() + received, size - received, 0);
            if (n > 0) {
                received += static_cast<size_t>(n);
                continue;
            }
            if (n == 0) {
                return failure(ErrorCode::NotConnected,
                               "Connection closed by peer");
            }
            if (errno == EINTR) {
                continue;
            }
            if (!wouldBlock()) {
                return failure(ErrorCode::NotConnected,
                               "Receive failed: " + errnoMessage(errno));
            }
            if (auto waited = waitFor(sock, POLLIN, deadline); !waited) {
                auto err = waited.error();
                if (err.code == ErrorCode::TimeoutError) {
                    err.message = std::format(
                        "No data from device within {}ms", timeout.count());
                }
                return std::unexpected(err);
            }
        }
        return buffer;
    }

    void close() {
        int sock = fd_.exchange(INVALID_SOCK);
        if (sock != INVALID_SOCK) {
            ::shutdown(sock, SHUT_RDWR);
            ::close(sock);
        }
    }

    void abort() noexcept {
        aborted_ = true;
        int sock = fd_.load();
        if (sock != INVALID_SOCK) {
            ::shutdown(sock, SHUT_RDWR);
        }
    }

    [[nodiscard]] auto isOpen() const -> bool {
        return fd_.load() != INVALID_SOCK && !aborted_.load();
    }

private:
    /**
     * @brief Wait until `sock` is ready for `events` or the deadline passes
     */
    auto waitFor(int sock, short events,
                 std::chrono::steady_clock::time_point deadline) -> VoidResult {
        while (true) {
            if (aborted_.load()) {
                return failure(ErrorCode::NotConnected, "Transport aborted");
            }
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return failure(ErrorCode::TimeoutError, "Operation timed out");
            }

            struct pollfd pfd {};
            pfd.fd = sock;
            pfd.events = events;
            int ret = ::poll(&pfd, 1,
                             static_cast<int>(std::min(remaining, POLL_SLICE)
                                                  .count()));
            if (ret > 0) {
                if ((pfd.revents & (POLLERR | POLLNVAL)) != 0 &&
                    (pfd.revents & events) == 0) {
                    return failure(ErrorCode::NotConnected, "Socket error");
                }
                return success();
            }
            if (ret < 0 && errno != EINTR) {
                return failure(ErrorCode::NotConnected,
                               "poll failed: " + errnoMessage(errno));
            }
        }
    }

    TcpOptions options_;
    std::atomic<int> fd_{INVALID_SOCK};
    std::atomic<bool> aborted_{false};
};

TcpTransport::TcpTransport(TcpOptions options)
    : impl_(std::make_unique<Impl>(options)) {}

TcpTransport::~TcpTransport() = default;

auto TcpTransport::open(const std::string& host, int port,
                        std::chrono::milliseconds timeout) -> VoidResult {
    return impl_->open(host, port, timeout);
}

auto TcpTransport::write(std::string_view data) -> VoidResult {
    return impl_->write(data);
}

auto TcpTransport::read(size_t size, std::chrono::milliseconds timeout)
    -> Result<std::string> {
    return impl_->read(size, timeout);
}

void TcpTransport::close() { impl_->close(); }

void TcpTransport::abort() noexcept { impl_->abort(); }

auto TcpTransport::isOpen() const -> bool { return impl_->isOpen(); }

auto tcpTransportFactory(TcpOptions options) -> TransportFactory {
    return [options]() -> std::unique_ptr<Transport> {
        return std::make_unique<TcpTransport>(options);
    };
}

}  // namespace firetv::device
