#include "server/admission_controller.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>
#include <vector>

namespace rsproxy {

// ============================================================================
// BackendSlot / SessionTicket
// ============================================================================

AdmissionController::BackendSlot::~BackendSlot() {
    if (owner_) owner_->release_backend();
}

AdmissionController::BackendSlot::BackendSlot(BackendSlot&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)) {}

AdmissionController::BackendSlot&
AdmissionController::BackendSlot::operator=(BackendSlot&& other) noexcept {
    if (this != &other) {
        if (owner_) owner_->release_backend();
        owner_ = std::exchange(other.owner_, nullptr);
    }
    return *this;
}

AdmissionController::SessionTicket::~SessionTicket() {
    if (owner_) owner_->unregister(session_id_);
}

AdmissionController::SessionTicket::SessionTicket(SessionTicket&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)), session_id_(other.session_id_) {}

AdmissionController::SessionTicket&
AdmissionController::SessionTicket::operator=(SessionTicket&& other) noexcept {
    if (this != &other) {
        if (owner_) owner_->unregister(session_id_);
        owner_ = std::exchange(other.owner_, nullptr);
        session_id_ = other.session_id_;
    }
    return *this;
}

// ============================================================================
// AdmissionController
// ============================================================================

AdmissionController::AdmissionController() = default;

AdmissionController::AdmissionController(const Config& config)
    : config_(config) {}

std::optional<AdmissionController::BackendSlot> AdmissionController::try_reserve_backend() {
    uint32_t current = open_backends_.load(std::memory_order_relaxed);
    while (current < config_.max_backend_connections) {
        if (open_backends_.compare_exchange_weak(current, current + 1,
                std::memory_order_acq_rel, std::memory_order_relaxed)) {
            return BackendSlot(this);
        }
    }
    refused_backend_slots_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

void AdmissionController::release_backend() {
    open_backends_.fetch_sub(1, std::memory_order_acq_rel);
}

std::optional<AdmissionController::SessionTicket> AdmissionController::admit(
    const std::shared_ptr<Evictable>& session) {
    std::lock_guard lock(sessions_mutex_);
    if (sessions_.size() >= config_.max_client_sessions) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    sessions_[session->id()] = session;
    admitted_.fetch_add(1, std::memory_order_relaxed);
    return SessionTicket(this, session->id());
}

void AdmissionController::unregister(uint64_t session_id) {
    std::lock_guard lock(sessions_mutex_);
    sessions_.erase(session_id);
}

size_t AdmissionController::sweep_idle(std::chrono::steady_clock::time_point now) {
    std::vector<std::shared_ptr<Evictable>> idle;
    {
        std::lock_guard lock(sessions_mutex_);
        for (const auto& [id, weak] : sessions_) {
            auto session = weak.lock();
            if (!session || session->in_exchange()) continue;
            if (now - session->last_activity() > config_.idle_timeout) {
                idle.push_back(std::move(session));
            }
        }
    }

    // Evict outside the lock: eviction tears down sockets and may end up
    // releasing the session's ticket
    for (const auto& session : idle) {
        utils::log::info(std::format("Evicting idle session {}", session->id()));
        session->evict(EvictionReason::IDLE);
    }
    idle_evictions_.fetch_add(idle.size(), std::memory_order_relaxed);
    return idle.size();
}

void AdmissionController::evict_all(EvictionReason reason) {
    std::vector<std::shared_ptr<Evictable>> all;
    {
        std::lock_guard lock(sessions_mutex_);
        for (const auto& [id, weak] : sessions_) {
            if (auto session = weak.lock()) all.push_back(std::move(session));
        }
    }
    for (const auto& session : all) {
        session->evict(reason);
    }
}

void AdmissionController::record_chatty_eviction() {
    chatty_evictions_.fetch_add(1, std::memory_order_relaxed);
}

AdmissionController::Stats AdmissionController::get_stats() const {
    uint32_t active = 0;
    {
        std::lock_guard lock(sessions_mutex_);
        active = static_cast<uint32_t>(sessions_.size());
    }
    return {
        .open_backend_connections = open_backends_.load(std::memory_order_relaxed),
        .max_backend_connections = config_.max_backend_connections,
        .active_sessions = active,
        .max_client_sessions = config_.max_client_sessions,
        .admitted_sessions = admitted_.load(std::memory_order_relaxed),
        .rejected_sessions = rejected_.load(std::memory_order_relaxed),
        .refused_backend_slots = refused_backend_slots_.load(std::memory_order_relaxed),
        .idle_evictions = idle_evictions_.load(std::memory_order_relaxed),
        .chatty_evictions = chatty_evictions_.load(std::memory_order_relaxed),
    };
}

} // namespace rsproxy
