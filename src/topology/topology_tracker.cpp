#include "topology/topology_tracker.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace rsproxy {

TopologyTracker::TopologyTracker(TopologyConfig config, std::shared_ptr<IMemberProber> prober)
    : config_(std::move(config)), prober_(std::move(prober)) {
    std::lock_guard lock(state_mutex_);
    for (const auto& seed : config_.seeds) {
        ClusterMember member;
        member.address = seed;
        member.seed = true;
        members_.emplace(seed, std::move(member));
    }
    publish_locked();
}

TopologyTracker::~TopologyTracker() {
    stop();
}

void TopologyTracker::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) { probe_loop(stop); });
    utils::log::info(std::format("Topology tracker started ({} seeds, probe every {}ms)",
        config_.seeds.size(), config_.probe_interval.count()));
}

void TopologyTracker::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void TopologyTracker::set_change_callback(ChangeCallback cb) {
    std::lock_guard lock(callback_mutex_);
    callback_ = std::move(cb);
}

void TopologyTracker::request_refresh() {
    {
        std::lock_guard lock(wake_mutex_);
        refresh_requested_ = true;
    }
    wake_cv_.notify_all();
}

void TopologyTracker::probe_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wake_mutex_);
            wake_cv_.wait_for(lock, stop, config_.probe_interval,
                              [this] { return refresh_requested_; });
            refresh_requested_ = false;
        }
        if (stop.stop_requested()) break;

        try {
            probe_once();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Topology probe cycle failed: {}", e.what()));
        }
    }
}

TopologyTracker::ProbeResults TopologyTracker::probe_all(const std::vector<std::string>& targets) {
    ProbeResults results(targets.size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(targets.size());
        for (size_t i = 0; i < targets.size(); ++i) {
            workers.emplace_back([this, &targets, &results, i] {
                try {
                    results[i] = prober_->probe(targets[i], config_.probe_timeout);
                } catch (const std::exception& e) {
                    results[i] = Result<ProbeReply>::error(ErrorCategory::INTERNAL_ERROR, e.what());
                }
            });
        }
    }  // workers join here
    return results;
}

void TopologyTracker::merge_locked(const std::vector<std::string>& targets,
                                   const ProbeResults& results,
                                   std::set<std::string>& reported, bool& any_report,
                                   std::vector<MemberChange>& changes,
                                   std::vector<std::string>& discovered) {
    const auto now = std::chrono::steady_clock::now();

    for (size_t i = 0; i < targets.size(); ++i) {
        const auto it = members_.find(targets[i]);
        if (it == members_.end()) continue;

        ClusterMember& member = it->second;
        const MemberRole old_role = member.role;
        const auto& result = results[i];

        if (result.is_ok()) {
            const ProbeReply& reply = result.value();
            member.last_seen = now;
            member.rtt = reply.rtt;
            member.consecutive_failures = 0;

            if (!reply.me.empty() && reply.me != member.address) {
                // Reachable under another name (seed given as an alias); only
                // the canonical entry may carry a role, otherwise one server
                // would look like two primaries
                member.role = MemberRole::UNKNOWN;
            } else if (reply.is_primary) {
                member.role = MemberRole::PRIMARY;
            } else if (reply.is_secondary) {
                member.role = MemberRole::SECONDARY;
            } else {
                member.role = MemberRole::UNKNOWN;
            }

            if (!reply.set_name.empty()) set_name_ = reply.set_name;

            if (!reply.hosts.empty()) {
                any_report = true;
                for (const auto& host : reply.hosts) {
                    reported.insert(host);
                    if (!members_.contains(host)) {
                        ClusterMember fresh;
                        fresh.address = host;
                        members_.emplace(host, std::move(fresh));
                        discovered.push_back(host);
                        utils::log::info(std::format("Discovered replica set member {}", host));
                    }
                }
            }
        } else {
            ++member.consecutive_failures;
            member.role = MemberRole::UNREACHABLE;
            probe_failures_.fetch_add(1, std::memory_order_relaxed);
            if (member.consecutive_failures == 1) {
                utils::log::warn(std::format("Probe of {} failed: {}",
                    member.address, result.error_message()));
            } else {
                utils::log::debug(std::format("Probe of {} failed ({} in a row): {}",
                    member.address, member.consecutive_failures, result.error_message()));
            }
        }

        if (old_role != member.role) {
            changes.push_back({member.address, old_role, member.role, false});
        }
    }
}

void TopologyTracker::expire_locked(const std::set<std::string>& reported, bool any_report,
                                    std::vector<MemberChange>& changes) {
    // A cycle in which nobody answered says nothing about membership
    if (any_report) {
        for (auto& [address, member] : members_) {
            if (reported.contains(address)) {
                member.missing_cycles = 0;
            } else {
                ++member.missing_cycles;
            }
        }
    }

    const uint32_t grace = config_.unreachable_grace_cycles;
    for (auto it = members_.begin(); it != members_.end();) {
        const ClusterMember& member = it->second;
        const bool unreachable_too_long = member.consecutive_failures >= grace;
        const bool unreported_too_long = member.missing_cycles >= grace;
        if (member.seed || (!unreachable_too_long && !unreported_too_long)) {
            ++it;
            continue;
        }

        utils::log::info(std::format("Removing member {} ({})", member.address,
            unreachable_too_long ? "unreachable" : "no longer in replica set config"));
        changes.push_back({member.address, member.role, MemberRole::UNREACHABLE, true});
        it = members_.erase(it);
    }
}

void TopologyTracker::publish_locked() {
    auto view = std::make_shared<ReplicaSetView>();
    view->generation = ++generation_;
    view->set_name = set_name_;

    std::vector<const ClusterMember*> primaries;
    for (const auto& [address, member] : members_) {
        view->members.push_back(member);
        if (member.role == MemberRole::PRIMARY) {
            primaries.push_back(&member);
        } else if (member.role == MemberRole::SECONDARY) {
            view->secondaries.push_back(member);
        }
    }

    if (primaries.size() == 1) {
        view->primary = *primaries.front();
        split_brain_logged_ = false;
    } else if (primaries.size() > 1) {
        // No primary until the members agree again
        view->split_brain = true;
        if (!split_brain_logged_) {
            std::string claimants;
            for (const auto* m : primaries) {
                if (!claimants.empty()) claimants += ", ";
                claimants += m->address;
            }
            utils::log::warn(std::format("Multiple members claim primary ({}); "
                "routing reads only until probes agree", claimants));
            split_brain_logged_ = true;
        }
    }

    std::sort(view->secondaries.begin(), view->secondaries.end(),
        [](const ClusterMember& a, const ClusterMember& b) {
            if (a.rtt != b.rtt) return a.rtt < b.rtt;
            return a.address < b.address;
        });

    std::atomic_store_explicit(&view_, std::shared_ptr<const ReplicaSetView>(std::move(view)),
                               std::memory_order_release);
}

void TopologyTracker::notify(const std::vector<MemberChange>& changes) {
    if (changes.empty()) return;

    ChangeCallback cb;
    {
        std::lock_guard lock(callback_mutex_);
        cb = callback_;
    }

    for (const auto& change : changes) {
        if (!change.removed) {
            utils::log::info(std::format("Member {} changed role: {} -> {}", change.address,
                member_role_name(change.from), member_role_name(change.to)));
        }
        if (cb) cb(change);
    }
}

void TopologyTracker::probe_once() {
    std::lock_guard cycle(cycle_mutex_);

    std::vector<std::string> targets;
    {
        std::lock_guard lock(state_mutex_);
        targets.reserve(members_.size());
        for (const auto& [address, member] : members_) targets.push_back(address);
    }

    const auto results = probe_all(targets);

    std::vector<MemberChange> changes;
    std::set<std::string> reported;
    bool any_report = false;
    std::vector<std::string> discovered;
    {
        std::lock_guard lock(state_mutex_);
        merge_locked(targets, results, reported, any_report, changes, discovered);
    }

    // Members reported for the first time get their first probe this cycle;
    // anything they report in turn waits for the next one
    if (!discovered.empty()) {
        const auto more = probe_all(discovered);
        std::vector<std::string> ignored;
        std::lock_guard lock(state_mutex_);
        merge_locked(discovered, more, reported, any_report, changes, ignored);
    }

    {
        std::lock_guard lock(state_mutex_);
        expire_locked(reported, any_report, changes);
        publish_locked();
    }
    cycles_.fetch_add(1, std::memory_order_relaxed);

    notify(changes);
}

void TopologyTracker::report_unreachable(const std::string& address) {
    std::vector<MemberChange> changes;
    {
        std::lock_guard lock(state_mutex_);
        const auto it = members_.find(address);
        if (it != members_.end() && it->second.role != MemberRole::UNREACHABLE) {
            changes.push_back({address, it->second.role, MemberRole::UNREACHABLE, false});
            it->second.role = MemberRole::UNREACHABLE;
            publish_locked();
        }
    }

    if (!changes.empty()) {
        utils::log::warn(std::format("Relay to {} failed; marking it unreachable", address));
        notify(changes);
    }
    request_refresh();
}

TopologyTracker::Stats TopologyTracker::get_stats() const {
    std::lock_guard lock(state_mutex_);
    return {
        .cycles = cycles_.load(std::memory_order_relaxed),
        .probe_failures = probe_failures_.load(std::memory_order_relaxed),
        .generation = generation_,
        .members = members_.size(),
    };
}

} // namespace rsproxy
