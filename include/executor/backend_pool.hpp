#pragma once

#include "core/error.hpp"
#include "executor/backend_connection.hpp"
#include "executor/backend_connector.hpp"
#include "server/admission_controller.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace rsproxy {

/**
 * @brief RAII checkout of one BackendConnection
 *
 * Returns the connection to its pool on destruction, exactly once.
 * Move-only; a moved-from handle returns nothing.
 */
class PooledBackend {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<BackendConnection>, bool healthy)>;

    PooledBackend(std::unique_ptr<BackendConnection> conn, ReturnFunc return_fn);
    ~PooledBackend();

    PooledBackend(PooledBackend&& other) noexcept;
    PooledBackend& operator=(PooledBackend&& other) noexcept;

    PooledBackend(const PooledBackend&) = delete;
    PooledBackend& operator=(const PooledBackend&) = delete;

    BackendConnection* get() const { return conn_.get(); }
    BackendConnection* operator->() const { return conn_.get(); }
    BackendConnection& operator*() const { return *conn_; }

    /// The connection will be closed instead of returned to the idle deque
    void mark_unhealthy() { healthy_ = false; }
    [[nodiscard]] bool healthy() const { return healthy_; }

    [[nodiscard]] bool is_valid() const { return conn_ != nullptr; }

private:
    void give_back();

    std::unique_ptr<BackendConnection> conn_;
    ReturnFunc return_fn_;
    bool healthy_ = true;
};

/**
 * @brief Bounded pool of connections to one cluster member
 *
 * Design:
 * - count (idle + checked out) never exceeds capacity
 * - every new connection also needs a global slot from the AdmissionController
 * - mutex + condition_variable_any; waits are interruptible via stop_token
 * - drop() bumps the epoch: idle connections close now, checked-out ones
 *   close when they come back
 * - idle deque is LIFO so shrink() finds the cold connections at the front
 *
 * Always owned by a shared_ptr: handles keep their pool alive.
 */
class BackendPool : public std::enable_shared_from_this<BackendPool> {
public:
    struct Config {
        size_t capacity = 16;
        size_t min_idle = 0;
        std::chrono::milliseconds idle_timeout{300000};
        size_t max_message_bytes = wire::DEFAULT_MAX_MESSAGE_BYTES;
    };

    struct Stats {
        std::string address;
        size_t total_connections;
        size_t idle_connections;
        size_t in_use_connections;
        size_t capacity;
        uint64_t acquires;
        uint64_t releases;
        uint64_t timeouts;
        uint64_t connect_failures;
        uint64_t discarded;
    };

    /// Tries to free a global slot by closing an idle connection elsewhere
    using ReclaimFunc = std::function<bool(const std::string& requesting_address)>;

    BackendPool(std::string address, const Config& config,
                std::shared_ptr<IBackendConnector> connector,
                std::shared_ptr<AdmissionController> admission = nullptr);
    ~BackendPool();

    BackendPool(const BackendPool&) = delete;
    BackendPool& operator=(const BackendPool&) = delete;

    /**
     * @brief Check out a connection
     *
     * Idle connection first, else a new one when under capacity and a global
     * slot is available, else wait for a release.
     *
     * @return POOL_EXHAUSTED on timeout, BACKEND_UNREACHABLE when connecting
     *         fails, CANCELLED when `stop` fires or the pool is closed
     */
    [[nodiscard]] Result<PooledBackend> acquire(std::chrono::milliseconds timeout,
                                                std::stop_token stop = {});

    void drop();

    /**
     * @brief Close idle connections unused for longer than idle_timeout
     * @return number closed
     */
    size_t shrink(std::chrono::steady_clock::time_point now);

    /// Close one idle connection, if any (frees its global slot)
    bool try_close_one_idle();

    /// Refuse new acquires and close everything idle
    void close();

    void set_reclaim_callback(ReclaimFunc fn) { reclaim_fn_ = std::move(fn); }

    [[nodiscard]] Stats get_stats() const;
    [[nodiscard]] const std::string& address() const { return address_; }

private:
    void return_connection(std::unique_ptr<BackendConnection> conn, bool healthy);
    PooledBackend make_handle(std::unique_ptr<BackendConnection> conn);

    const std::string address_;
    const Config config_;
    std::shared_ptr<IBackendConnector> connector_;
    std::shared_ptr<AdmissionController> admission_;
    ReclaimFunc reclaim_fn_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::unique_ptr<BackendConnection>> idle_;
    size_t count_ = 0;
    uint64_t epoch_ = 0;
    uint64_t release_seq_ = 0;
    bool closed_ = false;

    std::atomic<uint64_t> acquires_{0};
    std::atomic<uint64_t> releases_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> connect_failures_{0};
    std::atomic<uint64_t> discarded_{0};
};

} // namespace rsproxy
