#pragma once

#include "server/proxy_session.hpp"
#include "server/socket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rsproxy {

struct RouterConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 27017;   // 0 picks an ephemeral port
    SessionConfig session;
    std::chrono::milliseconds maintenance_interval{1000};
};

/**
 * @brief Client listener: one ProxySession and one thread per client
 *
 * A maintenance thread reaps finished session threads, runs the idle sweep
 * and shrinks the backend pools.
 */
class Router {
public:
    Router(RouterConfig config,
           std::shared_ptr<TopologyTracker> topology,
           std::shared_ptr<PoolRegistry> pools,
           std::shared_ptr<AdmissionController> admission);

    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /**
     * @brief Bind, listen and start the accept and maintenance threads
     * @throws std::runtime_error when the listener cannot be opened
     */
    void start();

    /// Stop accepting, evict every session and join all threads
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

    /// Bound port (resolves port 0)
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    [[nodiscard]] size_t active_sessions() const;
    [[nodiscard]] uint64_t accepted_total() const {
        return accepted_.load(std::memory_order_relaxed);
    }

    /// One maintenance pass (reap, idle sweep, pool shrink)
    void run_maintenance();

private:
    struct SessionEntry {
        std::shared_ptr<ProxySession> session;
        std::jthread thread;
    };

    void accept_loop(std::stop_token stop);
    void maintenance_loop(std::stop_token stop);
    void spawn_session(Socket client, std::string remote_addr);
    void mark_finished(uint64_t id);
    void reap_finished();

    RouterConfig config_;
    SessionContext context_;

    Socket listener_;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> next_session_id_{1};
    std::atomic<uint64_t> accepted_{0};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<uint64_t, SessionEntry> sessions_;
    std::vector<uint64_t> finished_;

    std::mutex maintenance_mutex_;
    std::condition_variable_any maintenance_cv_;

    std::jthread accept_thread_;
    std::jthread maintenance_thread_;
};

} // namespace rsproxy
