#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace rsproxy {

enum class EvictionReason { IDLE, CHATTY, SHUTDOWN };

[[nodiscard]] constexpr const char* eviction_reason_name(EvictionReason reason) {
    switch (reason) {
        case EvictionReason::IDLE:     return "idle";
        case EvictionReason::CHATTY:   return "chatty";
        case EvictionReason::SHUTDOWN: return "shutdown";
    }
    return "unknown";
}

/**
 * @brief A client session as seen by the admission controller
 */
class Evictable {
public:
    virtual ~Evictable() = default;

    [[nodiscard]] virtual uint64_t id() const = 0;
    [[nodiscard]] virtual std::chrono::steady_clock::time_point last_activity() const = 0;
    /// True while a request/response exchange is in flight
    [[nodiscard]] virtual bool in_exchange() const = 0;
    /// Must not block; may be called from any thread
    virtual void evict(EvictionReason reason) = 0;
};

/**
 * @brief Global backend connection cap, client session cap, idle eviction
 *
 * Backend slots are counted with a CAS loop so the cap is never exceeded,
 * even transiently. Each open BackendConnection holds one BackendSlot; the
 * slot returns to the controller when the connection is destroyed.
 *
 * The controller must outlive every slot and ticket it hands out.
 */
class AdmissionController {
public:
    struct Config {
        uint32_t max_backend_connections = 64;
        uint32_t max_client_sessions = 1024;
        std::chrono::milliseconds idle_timeout{3600000};
    };

    class BackendSlot {
    public:
        explicit BackendSlot(AdmissionController* owner) : owner_(owner) {}
        ~BackendSlot();

        BackendSlot(const BackendSlot&) = delete;
        BackendSlot& operator=(const BackendSlot&) = delete;
        BackendSlot(BackendSlot&& other) noexcept;
        BackendSlot& operator=(BackendSlot&& other) noexcept;

    private:
        AdmissionController* owner_;
    };

    class SessionTicket {
    public:
        SessionTicket(AdmissionController* owner, uint64_t session_id)
            : owner_(owner), session_id_(session_id) {}
        ~SessionTicket();

        SessionTicket(const SessionTicket&) = delete;
        SessionTicket& operator=(const SessionTicket&) = delete;
        SessionTicket(SessionTicket&& other) noexcept;
        SessionTicket& operator=(SessionTicket&& other) noexcept;

    private:
        AdmissionController* owner_;
        uint64_t session_id_;
    };

    AdmissionController();
    explicit AdmissionController(const Config& config);

    /**
     * @brief Reserve one global backend connection slot
     * @return nullopt when max_backend_connections are already open
     */
    [[nodiscard]] std::optional<BackendSlot> try_reserve_backend();

    /**
     * @brief Register a new client session
     * @return nullopt when max_client_sessions are already registered
     */
    [[nodiscard]] std::optional<SessionTicket> admit(const std::shared_ptr<Evictable>& session);

    /**
     * @brief Evict sessions idle longer than idle_timeout (never mid-exchange)
     * @return number of sessions evicted
     */
    size_t sweep_idle(std::chrono::steady_clock::time_point now);

    void evict_all(EvictionReason reason);

    void record_chatty_eviction();

    struct Stats {
        uint32_t open_backend_connections;
        uint32_t max_backend_connections;
        uint32_t active_sessions;
        uint32_t max_client_sessions;
        uint64_t admitted_sessions;
        uint64_t rejected_sessions;
        uint64_t refused_backend_slots;
        uint64_t idle_evictions;
        uint64_t chatty_evictions;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    void release_backend();
    void unregister(uint64_t session_id);

    Config config_;
    std::atomic<uint32_t> open_backends_{0};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<uint64_t, std::weak_ptr<Evictable>> sessions_;

    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> refused_backend_slots_{0};
    std::atomic<uint64_t> idle_evictions_{0};
    std::atomic<uint64_t> chatty_evictions_{0};
};

} // namespace rsproxy
