#pragma once

#include "config/config_types.hpp"
#include "executor/backend_connector.hpp"
#include "executor/backend_pool.hpp"
#include "server/admission_controller.hpp"
#include "topology/member_prober.hpp"
#include "topology/replica_set_view.hpp"
#include "topology/topology_tracker.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rsproxy {

class AdminServer;
class PoolRegistry;
class Router;

// ============================================================================
// Events
// ============================================================================

enum class ProxyEventType {
    STARTED,
    STOPPED,
    MEMBER_ROLE_CHANGED,
    MEMBER_REMOVED,
};

[[nodiscard]] inline constexpr const char* proxy_event_type_name(ProxyEventType type) {
    switch (type) {
        case ProxyEventType::STARTED:             return "started";
        case ProxyEventType::STOPPED:             return "stopped";
        case ProxyEventType::MEMBER_ROLE_CHANGED: return "member_role_changed";
        case ProxyEventType::MEMBER_REMOVED:      return "member_removed";
    }
    return "unknown";
}

struct ProxyEvent {
    ProxyEventType type;
    std::string address;                 // member address, empty for lifecycle events
    MemberRole from = MemberRole::UNKNOWN;
    MemberRole to = MemberRole::UNKNOWN;
};

// ============================================================================
// Stats
// ============================================================================

struct ProxyStats {
    bool running = false;
    uint16_t listen_port = 0;
    uint64_t accepted_sessions = 0;
    size_t active_sessions = 0;
    AdmissionController::Stats admission{};
    TopologyTracker::Stats topology{};
    std::shared_ptr<const ReplicaSetView> view;
    std::vector<BackendPool::Stats> pools;
};

/// `{"running":..,"listener":{..},"admission":{..},"topology":{..},"pools":[..]}`
[[nodiscard]] std::string stats_to_json(const ProxyStats& stats);

/// `{"status":"healthy"|"degraded","primary":"host:port"|null,...}`
[[nodiscard]] std::string health_to_json(const ProxyStats& stats);

// ============================================================================
// Proxy
// ============================================================================

/**
 * @brief Wires tracker, pools, admission control, router and admin endpoint
 *
 * start() order: validate config, build admission controller and pool
 * registry, one synchronous probe cycle, tracker loop, client listener,
 * admin endpoint. stop() tears down in reverse. A Proxy starts at most once.
 */
class Proxy {
public:
    using EventCallback = std::function<void(const ProxyEvent&)>;

    explicit Proxy(ProxyConfig config);

    /// Substitute the transports (tests)
    Proxy(ProxyConfig config,
          std::shared_ptr<IMemberProber> prober,
          std::shared_ptr<IBackendConnector> connector);

    ~Proxy();

    Proxy(const Proxy&) = delete;
    Proxy& operator=(const Proxy&) = delete;

    /**
     * @brief Validate config and start serving
     * @throws ZeroMaxConnectionsError if backend.max_connections is 0
     * @throws ConfigurationError for any other invalid setting
     * @throws std::runtime_error if a listener cannot be opened or the proxy
     *         was already started
     */
    void start();

    /// Stop accepting, evict all sessions, stop probing, close all pools
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

    /// Bound client port (0 before start)
    [[nodiscard]] uint16_t listen_port() const;

    /// Bound admin port (0 when disabled)
    [[nodiscard]] uint16_t admin_port() const;

    [[nodiscard]] ProxyStats stats() const;

    /// Must be set before start()
    void set_event_callback(EventCallback cb) { event_cb_ = std::move(cb); }

    [[nodiscard]] const ProxyConfig& config() const { return config_; }

private:
    void validate() const;
    void on_member_change(const MemberChange& change);
    void emit(const ProxyEvent& event) const;

    const ProxyConfig config_;
    std::shared_ptr<IMemberProber> prober_;
    std::shared_ptr<IBackendConnector> connector_;

    std::shared_ptr<AdmissionController> admission_;
    std::shared_ptr<PoolRegistry> registry_;
    std::shared_ptr<TopologyTracker> tracker_;
    std::unique_ptr<Router> router_;
    std::unique_ptr<AdminServer> admin_;

    EventCallback event_cb_;

    std::mutex lifecycle_mutex_;
    bool started_ = false;
    std::atomic<bool> running_{false};
};

} // namespace rsproxy
