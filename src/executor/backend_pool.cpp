#include "executor/backend_pool.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace rsproxy {

namespace {
// Global slots are freed by other pools without notifying this one
constexpr auto kSlotRecheckInterval = std::chrono::milliseconds{50};
} // namespace

// ============================================================================
// PooledBackend
// ============================================================================

PooledBackend::PooledBackend(std::unique_ptr<BackendConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledBackend::~PooledBackend() {
    give_back();
}

PooledBackend::PooledBackend(PooledBackend&& other) noexcept
    : conn_(std::move(other.conn_)),
      return_fn_(std::move(other.return_fn_)),
      healthy_(other.healthy_) {
    other.healthy_ = true;
}

PooledBackend& PooledBackend::operator=(PooledBackend&& other) noexcept {
    if (this != &other) {
        // Return current connection before taking the new one
        give_back();
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
        healthy_ = other.healthy_;
        other.healthy_ = true;
    }
    return *this;
}

void PooledBackend::give_back() {
    if (conn_ && return_fn_) {
        return_fn_(std::move(conn_), healthy_);
    }
    conn_.reset();
}

// ============================================================================
// BackendPool
// ============================================================================

BackendPool::BackendPool(std::string address, const Config& config,
                         std::shared_ptr<IBackendConnector> connector,
                         std::shared_ptr<AdmissionController> admission)
    : address_(std::move(address)),
      config_(config),
      connector_(std::move(connector)),
      admission_(std::move(admission)) {}

BackendPool::~BackendPool() = default;

PooledBackend BackendPool::make_handle(std::unique_ptr<BackendConnection> conn) {
    auto self = shared_from_this();
    return PooledBackend(std::move(conn),
        [self](std::unique_ptr<BackendConnection> c, bool healthy) {
            self->return_connection(std::move(c), healthy);
        });
}

Result<PooledBackend> BackendPool::acquire(std::chrono::milliseconds timeout, std::stop_token stop) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;
    bool reclaim_attempted = false;

    std::unique_lock lock(mutex_);
    while (true) {
        if (closed_) {
            return Result<PooledBackend>::error(ErrorCategory::CANCELLED,
                std::format("Pool for {} is closed", address_));
        }
        if (stop.stop_requested()) {
            return Result<PooledBackend>::error(ErrorCategory::CANCELLED,
                "Acquire cancelled");
        }

        // 1. Most recently used idle connection
        while (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            if (conn->epoch() == epoch_ && conn->check_idle_alive()) {
                acquires_.fetch_add(1, std::memory_order_relaxed);
                lock.unlock();
                return Result<PooledBackend>::ok(make_handle(std::move(conn)));
            }
            --count_;
            discarded_.fetch_add(1, std::memory_order_relaxed);
        }

        // 2. New connection, bounded by pool capacity and the global cap
        if (count_ < config_.capacity) {
            std::optional<AdmissionController::BackendSlot> slot;
            bool granted = true;
            if (admission_) {
                slot = admission_->try_reserve_backend();
                granted = slot.has_value();
            }

            if (!granted && reclaim_fn_ && !reclaim_attempted) {
                reclaim_attempted = true;
                lock.unlock();
                const bool freed = reclaim_fn_(address_);
                lock.lock();
                if (freed) continue;
            }

            if (granted) {
                ++count_;
                const uint64_t epoch = epoch_;
                lock.unlock();

                auto sock = connector_->connect(address_);
                if (sock.is_error()) {
                    connect_failures_.fetch_add(1, std::memory_order_relaxed);
                    {
                        std::lock_guard relock(mutex_);
                        --count_;
                        ++release_seq_;
                    }
                    cv_.notify_one();
                    return Result<PooledBackend>::error(ErrorCategory::BACKEND_UNREACHABLE,
                        sock.error_message());
                }

                auto conn = std::make_unique<BackendConnection>(address_,
                    std::move(sock.value()), std::move(slot), epoch, config_.max_message_bytes);
                utils::log::debug(std::format("Opened backend connection #{} to {}",
                    conn->id(), address_));
                acquires_.fetch_add(1, std::memory_order_relaxed);
                return Result<PooledBackend>::ok(make_handle(std::move(conn)));
            }
        }

        // 3. Wait for a release, the deadline, or cancellation
        const auto now = Clock::now();
        if (now >= deadline) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            return Result<PooledBackend>::error(ErrorCategory::POOL_EXHAUSTED,
                std::format("No connection to {} available within {}ms",
                            address_, timeout.count()));
        }

        const auto wake = admission_ ? std::min(deadline, now + kSlotRecheckInterval) : deadline;
        const uint64_t seen = release_seq_;
        cv_.wait_until(lock, stop, wake, [&] { return closed_ || release_seq_ != seen; });
        reclaim_attempted = false;
    }
}

void BackendPool::return_connection(std::unique_ptr<BackendConnection> conn, bool healthy) {
    std::unique_ptr<BackendConnection> to_close;
    {
        std::lock_guard lock(mutex_);
        releases_.fetch_add(1, std::memory_order_relaxed);
        if (healthy && !closed_ && conn->is_alive() && conn->epoch() == epoch_) {
            conn->touch();
            idle_.push_back(std::move(conn));
        } else {
            --count_;
            discarded_.fetch_add(1, std::memory_order_relaxed);
            to_close = std::move(conn);
        }
        ++release_seq_;
    }
    cv_.notify_one();

    if (to_close) {
        utils::log::debug(std::format("Closing backend connection #{} to {}",
            to_close->id(), address_));
    }
}

void BackendPool::drop() {
    std::deque<std::unique_ptr<BackendConnection>> doomed;
    {
        std::lock_guard lock(mutex_);
        ++epoch_;
        doomed.swap(idle_);
        count_ -= doomed.size();
        discarded_.fetch_add(doomed.size(), std::memory_order_relaxed);
        ++release_seq_;
    }
    cv_.notify_all();

    utils::log::info(std::format("Dropped pool for {} ({} idle connections closed)",
        address_, doomed.size()));
}

size_t BackendPool::shrink(std::chrono::steady_clock::time_point now) {
    std::vector<std::unique_ptr<BackendConnection>> doomed;
    {
        std::lock_guard lock(mutex_);
        // Front of the deque holds the least recently used connections
        while (idle_.size() > config_.min_idle
               && now - idle_.front()->last_used() > config_.idle_timeout) {
            doomed.push_back(std::move(idle_.front()));
            idle_.pop_front();
            --count_;
        }
        if (!doomed.empty()) ++release_seq_;
    }

    if (!doomed.empty()) {
        cv_.notify_all();
        utils::log::debug(std::format("Closed {} idle connections to {}",
            doomed.size(), address_));
    }
    return doomed.size();
}

bool BackendPool::try_close_one_idle() {
    std::unique_ptr<BackendConnection> doomed;
    {
        std::lock_guard lock(mutex_);
        if (idle_.empty()) return false;
        doomed = std::move(idle_.front());
        idle_.pop_front();
        --count_;
        ++release_seq_;
    }
    cv_.notify_all();
    return true;
}

void BackendPool::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    drop();
}

BackendPool::Stats BackendPool::get_stats() const {
    std::lock_guard lock(mutex_);
    return {
        .address = address_,
        .total_connections = count_,
        .idle_connections = idle_.size(),
        .in_use_connections = count_ - idle_.size(),
        .capacity = config_.capacity,
        .acquires = acquires_.load(std::memory_order_relaxed),
        .releases = releases_.load(std::memory_order_relaxed),
        .timeouts = timeouts_.load(std::memory_order_relaxed),
        .connect_failures = connect_failures_.load(std::memory_order_relaxed),
        .discarded = discarded_.load(std::memory_order_relaxed),
    };
}

} // namespace rsproxy
