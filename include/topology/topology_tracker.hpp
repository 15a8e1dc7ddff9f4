#pragma once

#include "topology/member_prober.hpp"
#include "topology/replica_set_view.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace rsproxy {

struct TopologyConfig {
    std::vector<std::string> seeds;
    std::chrono::milliseconds probe_interval{5000};
    std::chrono::milliseconds probe_timeout{2000};
    uint32_t unreachable_grace_cycles = 3;
};

struct MemberChange {
    std::string address;
    MemberRole from = MemberRole::UNKNOWN;
    MemberRole to = MemberRole::UNKNOWN;
    bool removed = false;
};

/**
 * @brief Replica set topology tracker
 *
 * Per member: UNKNOWN -> PRIMARY/SECONDARY -> UNREACHABLE -> removed after
 * the grace period, or reachable again. Each probe cycle probes every known
 * member in parallel, then every member reported for the first time, and
 * publishes a fresh ReplicaSetView with one atomic pointer swap. Readers never
 * block and always see a complete snapshot.
 *
 * Seeds are never removed so the cluster can always be rediscovered.
 */
class TopologyTracker {
public:
    using ChangeCallback = std::function<void(const MemberChange&)>;

    TopologyTracker(TopologyConfig config, std::shared_ptr<IMemberProber> prober);
    ~TopologyTracker();

    TopologyTracker(const TopologyTracker&) = delete;
    TopologyTracker& operator=(const TopologyTracker&) = delete;

    /// Start the background probe loop
    void start();
    void stop();

    /// One synchronous probe cycle
    void probe_once();

    /// Wake the probe loop early
    void request_refresh();

    /**
     * @brief A relay to `address` failed at the I/O level
     *
     * Demotes the member at once (new generation) and asks for an early
     * probe cycle to confirm.
     */
    void report_unreachable(const std::string& address);

    [[nodiscard]] std::shared_ptr<const ReplicaSetView> current() const {
        return std::atomic_load_explicit(&view_, std::memory_order_acquire);
    }

    /// Invoked outside the tracker's locks on every role change or removal
    void set_change_callback(ChangeCallback cb);

    struct Stats {
        uint64_t cycles;
        uint64_t probe_failures;
        uint64_t generation;
        size_t members;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    using ProbeResults = std::vector<Result<ProbeReply>>;

    [[nodiscard]] ProbeResults probe_all(const std::vector<std::string>& targets);

    void merge_locked(const std::vector<std::string>& targets, const ProbeResults& results,
                      std::set<std::string>& reported, bool& any_report,
                      std::vector<MemberChange>& changes,
                      std::vector<std::string>& discovered);
    void expire_locked(const std::set<std::string>& reported, bool any_report,
                       std::vector<MemberChange>& changes);
    void publish_locked();
    void notify(const std::vector<MemberChange>& changes);
    void probe_loop(std::stop_token stop);

    const TopologyConfig config_;
    std::shared_ptr<IMemberProber> prober_;

    std::mutex cycle_mutex_;  // one probe cycle at a time

    mutable std::mutex state_mutex_;
    std::map<std::string, ClusterMember> members_;
    std::string set_name_;
    uint64_t generation_ = 0;
    bool split_brain_logged_ = false;

    std::shared_ptr<const ReplicaSetView> view_;

    std::mutex callback_mutex_;
    ChangeCallback callback_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool refresh_requested_ = false;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> probe_failures_{0};

    std::jthread thread_;
};

} // namespace rsproxy
