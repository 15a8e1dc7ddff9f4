#pragma once

#include "executor/backend_pool.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace rsproxy {

/**
 * @brief Member address -> BackendPool, created lazily
 *
 * When the global backend cap refuses a slot, a pool asks the registry to
 * close an idle connection held by some other member's pool.
 */
class PoolRegistry : public std::enable_shared_from_this<PoolRegistry> {
public:
    PoolRegistry(const BackendPool::Config& config,
                 std::shared_ptr<IBackendConnector> connector,
                 std::shared_ptr<AdmissionController> admission);
    ~PoolRegistry();

    [[nodiscard]] std::shared_ptr<BackendPool> pool_for(const std::string& address);

    /// Close idle connections now and checked-out ones on return
    void drop(const std::string& address);

    /// drop() and forget the pool (member left the replica set)
    void remove(const std::string& address);

    size_t shrink_all();

    bool reclaim_idle(const std::string& requesting_address);

    void close_all();

    [[nodiscard]] std::vector<BackendPool::Stats> stats() const;
    [[nodiscard]] size_t pool_count() const;

private:
    const BackendPool::Config config_;
    std::shared_ptr<IBackendConnector> connector_;
    std::shared_ptr<AdmissionController> admission_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<BackendPool>> pools_;
    bool closed_ = false;
};

} // namespace rsproxy
