#pragma once

#include "core/error.hpp"
#include "executor/backend_pool.hpp"
#include "executor/pool_registry.hpp"
#include "server/admission_controller.hpp"
#include "server/message_framer.hpp"
#include "server/op_classifier.hpp"
#include "server/socket.hpp"
#include "topology/topology_tracker.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace rsproxy {

struct SessionConfig {
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds write_timeout{30000};
    size_t max_message_bytes = wire::DEFAULT_MAX_MESSAGE_BYTES;
};

struct SessionContext {
    std::shared_ptr<TopologyTracker> topology;
    std::shared_ptr<PoolRegistry> pools;
    std::shared_ptr<AdmissionController> admission;
    SessionConfig config;
};

/**
 * @brief One client connection relayed to the replica set
 *
 * Strictly sequential: read one client message, forward it, relay the
 * correlated response chain, repeat. Responses therefore reach the client in
 * request order.
 *
 * Connection affinity lives in pinned_: cursors (getMore/killCursors),
 * legacy unacknowledged writes (getLastError) and transactions keep using the
 * connection that served them. Everything else borrows a pooled connection
 * for a single exchange.
 *
 * evict() may be called from any thread. It never closes a socket; it
 * requests stop and shuts the sockets down so the session thread unwinds and
 * RAII returns every backend connection.
 */
class ProxySession : public Evictable {
public:
    ProxySession(uint64_t id, Socket client, std::string remote_addr, SessionContext context);
    ~ProxySession() override;

    ProxySession(const ProxySession&) = delete;
    ProxySession& operator=(const ProxySession&) = delete;

    /// Relay until the client leaves, fails, or the session is evicted
    void run();

    void attach_ticket(AdmissionController::SessionTicket ticket);

    [[nodiscard]] uint64_t id() const override { return id_; }
    [[nodiscard]] std::chrono::steady_clock::time_point last_activity() const override;
    [[nodiscard]] bool in_exchange() const override {
        return busy_.load(std::memory_order_acquire);
    }
    void evict(EvictionReason reason) override;

    [[nodiscard]] bool finished() const { return finished_.load(std::memory_order_acquire); }
    [[nodiscard]] const std::string& remote_address() const { return remote_addr_; }

    struct Stats {
        uint64_t requests;
        uint64_t responses;
        uint64_t error_replies;
        bool pinned;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    enum class StepResult { CONTINUE, CLOSE };

    enum class ExchangeStatus { OK, BACKEND_FAILED, BACKEND_TIMEOUT, DESYNC, CLIENT_GONE, CANCELLED };

    struct ExchangeOutcome {
        ExchangeStatus status = ExchangeStatus::OK;
        bool drained = true;    // no unread bytes left on the backend connection
        bool replied = false;   // at least one response reached the client
        int64_t cursor_id = 0;
        std::string detail;
    };

    StepResult relay(const Message& request);

    [[nodiscard]] ExchangeOutcome exchange(BackendConnection& backend, const Message& request,
                                           const OpClassification& op);

    [[nodiscard]] Result<std::string> select_target(const OpClassification& op,
                                                    const ReplicaSetView& view) const;
    [[nodiscard]] bool pin_serves(const OpClassification& op, const ReplicaSetView& view) const;

    StepResult reply_error(const Message& request, const OpClassification& op,
                           int32_t code, std::string_view code_name, std::string_view errmsg);

    [[nodiscard]] IoStatus write_to_client(const Message& msg);
    void set_active_backend(BackendConnection* conn);
    void touch();
    void set_pin(std::optional<PooledBackend> pin);

    const uint64_t id_;
    Socket client_;
    const std::string remote_addr_;
    SessionContext ctx_;
    MessageFramer framer_;

    std::optional<PooledBackend> pinned_;
    std::optional<AdmissionController::SessionTicket> ticket_;

    std::stop_source stop_;
    std::atomic<int64_t> last_activity_ns_{0};
    std::atomic<bool> busy_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> has_pin_{false};

    // Guards the client fd against close-vs-shutdown and the active backend
    // pointer against release-vs-interrupt
    std::mutex interrupt_mutex_;
    BackendConnection* active_backend_ = nullptr;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> responses_{0};
    std::atomic<uint64_t> error_replies_{0};
};

} // namespace rsproxy
