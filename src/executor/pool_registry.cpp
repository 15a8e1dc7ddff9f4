#include "executor/pool_registry.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace rsproxy {

PoolRegistry::PoolRegistry(const BackendPool::Config& config,
                           std::shared_ptr<IBackendConnector> connector,
                           std::shared_ptr<AdmissionController> admission)
    : config_(config),
      connector_(std::move(connector)),
      admission_(std::move(admission)) {}

PoolRegistry::~PoolRegistry() {
    close_all();
}

std::shared_ptr<BackendPool> PoolRegistry::pool_for(const std::string& address) {
    {
        std::shared_lock lock(mutex_);
        const auto it = pools_.find(address);
        if (it != pools_.end()) return it->second;
    }

    std::unique_lock lock(mutex_);
    auto& slot = pools_[address];
    if (!slot) {
        slot = std::make_shared<BackendPool>(address, config_, connector_, admission_);
        std::weak_ptr<PoolRegistry> weak = weak_from_this();
        slot->set_reclaim_callback([weak](const std::string& requesting) {
            const auto registry = weak.lock();
            return registry && registry->reclaim_idle(requesting);
        });
        if (closed_) slot->close();
        utils::log::debug(std::format("Created backend pool for {} (capacity {})",
            address, config_.capacity));
    }
    return slot;
}

void PoolRegistry::drop(const std::string& address) {
    std::shared_ptr<BackendPool> pool;
    {
        std::shared_lock lock(mutex_);
        const auto it = pools_.find(address);
        if (it == pools_.end()) return;
        pool = it->second;
    }
    pool->drop();
}

void PoolRegistry::remove(const std::string& address) {
    std::shared_ptr<BackendPool> pool;
    {
        std::unique_lock lock(mutex_);
        const auto it = pools_.find(address);
        if (it == pools_.end()) return;
        pool = std::move(it->second);
        pools_.erase(it);
    }
    // Handles still out keep the pool alive; it closes them when they return
    pool->close();
}

size_t PoolRegistry::shrink_all() {
    std::vector<std::shared_ptr<BackendPool>> snapshot;
    {
        std::shared_lock lock(mutex_);
        snapshot.reserve(pools_.size());
        for (const auto& [address, pool] : pools_) snapshot.push_back(pool);
    }

    const auto now = std::chrono::steady_clock::now();
    size_t closed = 0;
    for (const auto& pool : snapshot) {
        closed += pool->shrink(now);
    }
    return closed;
}

bool PoolRegistry::reclaim_idle(const std::string& requesting_address) {
    std::vector<std::shared_ptr<BackendPool>> snapshot;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [address, pool] : pools_) {
            if (address != requesting_address) snapshot.push_back(pool);
        }
    }
    for (const auto& pool : snapshot) {
        if (pool->try_close_one_idle()) return true;
    }
    return false;
}

void PoolRegistry::close_all() {
    std::vector<std::shared_ptr<BackendPool>> snapshot;
    {
        std::unique_lock lock(mutex_);
        closed_ = true;
        for (const auto& [address, pool] : pools_) snapshot.push_back(pool);
    }
    for (const auto& pool : snapshot) {
        pool->close();
    }
}

std::vector<BackendPool::Stats> PoolRegistry::stats() const {
    std::vector<std::shared_ptr<BackendPool>> snapshot;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [address, pool] : pools_) snapshot.push_back(pool);
    }
    std::vector<BackendPool::Stats> result;
    result.reserve(snapshot.size());
    for (const auto& pool : snapshot) {
        result.push_back(pool->get_stats());
    }
    return result;
}

size_t PoolRegistry::pool_count() const {
    std::shared_lock lock(mutex_);
    return pools_.size();
}

} // namespace rsproxy
