#include "server/router.hpp"
#include "core/utils.hpp"

#include <cerrno>
#include <format>
#include <stdexcept>

namespace rsproxy {

Router::Router(RouterConfig config,
               std::shared_ptr<TopologyTracker> topology,
               std::shared_ptr<PoolRegistry> pools,
               std::shared_ptr<AdmissionController> admission)
    : config_(std::move(config)) {
    context_.topology = std::move(topology);
    context_.pools = std::move(pools);
    context_.admission = std::move(admission);
    context_.config = config_.session;
}

Router::~Router() {
    stop();
}

void Router::start() {
    if (running_.load()) return;

    auto listener = Socket::listen_tcp(config_.host, config_.port);
    if (listener.is_error()) {
        throw std::runtime_error(std::format("Router: {}", listener.error_message()));
    }
    listener_ = std::move(listener.value());
    bound_port_ = listener_.local_port();

    running_.store(true, std::memory_order_release);

    accept_thread_ = std::jthread([this](std::stop_token stop) { accept_loop(stop); });
    maintenance_thread_ = std::jthread([this](std::stop_token stop) { maintenance_loop(stop); });

    utils::log::info(std::format("Router listening on {}:{}", config_.host, bound_port_));
}

void Router::stop() {
    if (!running_.exchange(false)) return;

    // Wakes the blocked accept()
    listener_.shutdown();
    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    listener_.close();

    if (maintenance_thread_.joinable()) {
        maintenance_thread_.request_stop();
        maintenance_thread_.join();
    }

    std::unordered_map<uint64_t, SessionEntry> remaining;
    {
        std::lock_guard lock(sessions_mutex_);
        remaining.swap(sessions_);
        finished_.clear();
    }
    for (auto& [id, entry] : remaining) {
        entry.session->evict(EvictionReason::SHUTDOWN);
    }
    for (auto& [id, entry] : remaining) {
        if (entry.thread.joinable()) entry.thread.join();
    }

    utils::log::info(std::format("Router stopped ({} sessions closed)", remaining.size()));
}

size_t Router::active_sessions() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size() - finished_.size();
}

void Router::accept_loop(std::stop_token stop) {
    while (!stop.stop_requested() && running_.load(std::memory_order_acquire)) {
        std::string remote_addr;
        Socket client = listener_.accept(remote_addr);
        if (!client.is_open()) {
            if (!running_.load(std::memory_order_acquire)) break;
            if (errno == EMFILE || errno == ENFILE) {
                utils::log::warn("Router: out of file descriptors; pausing accept");
                std::this_thread::sleep_for(std::chrono::milliseconds{100});
            }
            continue;
        }

        accepted_.fetch_add(1, std::memory_order_relaxed);
        spawn_session(std::move(client), std::move(remote_addr));
    }
}

void Router::spawn_session(Socket client, std::string remote_addr) {
    const uint64_t id = next_session_id_.fetch_add(1, std::memory_order_relaxed);
    auto session = std::make_shared<ProxySession>(id, std::move(client), remote_addr, context_);

    auto ticket = context_.admission->admit(session);
    if (!ticket) {
        utils::log::warn(std::format("Rejecting client {}: session limit {} reached",
            remote_addr, context_.admission->config().max_client_sessions));
        return;  // session and its socket are destroyed here
    }
    session->attach_ticket(std::move(*ticket));

    std::lock_guard lock(sessions_mutex_);
    auto& entry = sessions_[id];
    entry.session = session;
    entry.thread = std::jthread([this, session] {
        session->run();
        mark_finished(session->id());
    });
}

void Router::mark_finished(uint64_t id) {
    std::lock_guard lock(sessions_mutex_);
    // Absent once stop() has taken over the session table
    if (sessions_.contains(id)) finished_.push_back(id);
}

void Router::reap_finished() {
    std::vector<SessionEntry> done;
    {
        std::lock_guard lock(sessions_mutex_);
        for (const uint64_t id : finished_) {
            const auto it = sessions_.find(id);
            if (it == sessions_.end()) continue;
            done.push_back(std::move(it->second));
            sessions_.erase(it);
        }
        finished_.clear();
    }
    // Joins happen outside the lock: the thread may still be returning
    for (auto& entry : done) {
        if (entry.thread.joinable()) entry.thread.join();
    }
}

void Router::run_maintenance() {
    reap_finished();
    context_.admission->sweep_idle(std::chrono::steady_clock::now());
    context_.pools->shrink_all();
}

void Router::maintenance_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(maintenance_mutex_);
            maintenance_cv_.wait_for(lock, stop, config_.maintenance_interval,
                                     [] { return false; });
        }
        if (stop.stop_requested()) break;

        try {
            run_maintenance();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Router maintenance failed: {}", e.what()));
        }
    }
}

} // namespace rsproxy
