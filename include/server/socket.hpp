#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace rsproxy {

enum class IoStatus {
    OK,
    CLOSED,      // orderly shutdown by the peer
    TIMED_OUT,   // SO_RCVTIMEO / SO_SNDTIMEO expired
    FAILED       // any other socket error (reset, shutdown by us, ...)
};

struct IoOutcome {
    IoStatus status = IoStatus::OK;
    size_t transferred = 0;

    [[nodiscard]] bool ok() const { return status == IoStatus::OK; }
};

/**
 * @brief Owning wrapper around a blocking TCP (or socketpair) file descriptor
 *
 * Only the owner closes the descriptor. shutdown() may be called from another
 * thread to interrupt a blocked read or write on this socket.
 */
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    /**
     * @brief Connect to "host:port" with a bounded connect timeout
     */
    [[nodiscard]] static Result<Socket> connect_tcp(
        const std::string& address, std::chrono::milliseconds timeout);

    /**
     * @brief Bind and listen. Port 0 picks an ephemeral port (see local_port()).
     */
    [[nodiscard]] static Result<Socket> listen_tcp(
        const std::string& host, uint16_t port, int backlog = 128);

    /**
     * @brief Connected AF_UNIX stream pair
     */
    [[nodiscard]] static std::pair<Socket, Socket> pair();

    /**
     * @brief Accept one connection. Returns an invalid socket on failure.
     */
    [[nodiscard]] Socket accept(std::string& remote_addr) const;

    /// Reads exactly len bytes unless the peer closes or an error occurs
    [[nodiscard]] IoOutcome read_exact(void* buf, size_t len);

    /// Writes all len bytes (MSG_NOSIGNAL)
    [[nodiscard]] IoOutcome write_all(const void* buf, size_t len);

    void set_receive_timeout(std::chrono::milliseconds timeout);
    void set_send_timeout(std::chrono::milliseconds timeout);
    void set_nodelay();

    /**
     * @brief Non-blocking check: true when an idle socket has become readable
     * (peer closed, or unsolicited bytes which also make it unusable)
     */
    [[nodiscard]] bool has_pending_input() const;

    void shutdown() noexcept;
    void close() noexcept;

    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] uint16_t local_port() const;

private:
    int fd_ = -1;
};

} // namespace rsproxy
