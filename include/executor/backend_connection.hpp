#pragma once

#include "core/error.hpp"
#include "server/admission_controller.hpp"
#include "server/message_framer.hpp"
#include "server/socket.hpp"
#include "server/wire_protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rsproxy {

/**
 * @brief One open transport to one cluster member
 *
 * Owned either by its pool's idle deque or by a PooledBackend handle, never
 * both. Any I/O error clears the liveness flag; a dead connection is closed
 * instead of being returned to the idle deque. Destroying the connection
 * closes the socket and gives its global backend slot back.
 */
class BackendConnection {
public:
    BackendConnection(std::string address, Socket socket,
                      std::optional<AdmissionController::BackendSlot> slot,
                      uint64_t epoch, size_t max_message_bytes);

    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    [[nodiscard]] bool send(const Message& msg);

    [[nodiscard]] Result<Message> read_message();

    /// Unblock a read/write in progress on another thread (eviction)
    void interrupt() noexcept { socket_.shutdown(); }

    /// False once an idle socket turned readable (peer closed it)
    [[nodiscard]] bool check_idle_alive();

    [[nodiscard]] bool is_alive() const { return alive_.load(std::memory_order_acquire); }
    void mark_dead() { alive_.store(false, std::memory_order_release); }

    [[nodiscard]] const std::string& address() const { return address_; }
    [[nodiscard]] uint64_t epoch() const { return epoch_; }
    [[nodiscard]] uint64_t id() const { return id_; }

    [[nodiscard]] std::chrono::steady_clock::time_point last_used() const { return last_used_; }
    void touch() { last_used_ = std::chrono::steady_clock::now(); }

private:
    std::string address_;
    Socket socket_;
    MessageFramer framer_;
    std::optional<AdmissionController::BackendSlot> slot_;
    uint64_t epoch_;
    uint64_t id_;
    std::atomic<bool> alive_{true};
    std::chrono::steady_clock::time_point last_used_;
};

} // namespace rsproxy
