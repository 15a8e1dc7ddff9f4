#include "core/proxy.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "executor/pool_registry.hpp"
#include "server/admin_server.hpp"
#include "server/router.hpp"

#include <format>
#include <stdexcept>

namespace rsproxy {

// ============================================================================
// JSON rendering
// ============================================================================

namespace {

std::string member_json(const ClusterMember& m) {
    return std::format(R"({{"address":"{}","role":"{}","rtt_us":{},"consecutive_failures":{},"seed":{}}})",
        utils::escape_json(m.address), member_role_name(m.role), m.rtt.count(),
        m.consecutive_failures, utils::booltostr(m.seed));
}

std::string pool_json(const BackendPool::Stats& p) {
    return std::format(
        R"({{"address":"{}","total":{},"idle":{},"in_use":{},"capacity":{},)"
        R"("acquires":{},"releases":{},"timeouts":{},"connect_failures":{},"discarded":{}}})",
        utils::escape_json(p.address), p.total_connections, p.idle_connections,
        p.in_use_connections, p.capacity, p.acquires, p.releases, p.timeouts,
        p.connect_failures, p.discarded);
}

std::string primary_json(const ProxyStats& stats) {
    if (!stats.view || !stats.view->primary) return "null";
    return std::format(R"("{}")", utils::escape_json(stats.view->primary->address));
}

} // namespace

std::string stats_to_json(const ProxyStats& stats) {
    const auto& a = stats.admission;
    std::string json = std::format(
        R"({{"running":{},"listener":{{"port":{},"accepted_sessions":{},"active_sessions":{}}},)",
        utils::booltostr(stats.running), stats.listen_port, stats.accepted_sessions,
        stats.active_sessions);

    json += std::format(
        R"("admission":{{"open_backend_connections":{},"max_backend_connections":{},)"
        R"("active_sessions":{},"max_client_sessions":{},"admitted_sessions":{},)"
        R"("rejected_sessions":{},"refused_backend_slots":{},"idle_evictions":{},)"
        R"("chatty_evictions":{}}},)",
        a.open_backend_connections, a.max_backend_connections, a.active_sessions,
        a.max_client_sessions, a.admitted_sessions, a.rejected_sessions,
        a.refused_backend_slots, a.idle_evictions, a.chatty_evictions);

    json += std::format(
        R"("topology":{{"set_name":"{}","generation":{},"split_brain":{},"cycles":{},)"
        R"("probe_failures":{},"primary":{},"members":[)",
        stats.view ? utils::escape_json(stats.view->set_name) : std::string(),
        stats.topology.generation,
        utils::booltostr(stats.view && stats.view->split_brain),
        stats.topology.cycles, stats.topology.probe_failures, primary_json(stats));
    if (stats.view) {
        for (size_t i = 0; i < stats.view->members.size(); ++i) {
            if (i > 0) json += ',';
            json += member_json(stats.view->members[i]);
        }
    }
    json += "]},";

    json += R"("pools":[)";
    for (size_t i = 0; i < stats.pools.size(); ++i) {
        if (i > 0) json += ',';
        json += pool_json(stats.pools[i]);
    }
    json += "]}";
    return json;
}

std::string health_to_json(const ProxyStats& stats) {
    const bool healthy = stats.running && stats.view && stats.view->primary.has_value();
    return std::format(R"({{"status":"{}","primary":{},"secondaries":{},"active_sessions":{}}})",
        healthy ? "healthy" : "degraded", primary_json(stats),
        stats.view ? stats.view->secondaries.size() : 0, stats.active_sessions);
}

// ============================================================================
// Proxy
// ============================================================================

Proxy::Proxy(ProxyConfig config)
    : Proxy(config,
            std::make_shared<WireMemberProber>(config.backend.max_message_bytes),
            std::make_shared<TcpBackendConnector>(config.backend.connect_timeout,
                                                  config.backend.message_timeout)) {}

Proxy::Proxy(ProxyConfig config,
             std::shared_ptr<IMemberProber> prober,
             std::shared_ptr<IBackendConnector> connector)
    : config_(std::move(config)),
      prober_(std::move(prober)),
      connector_(std::move(connector)) {}

Proxy::~Proxy() {
    stop();
}

void Proxy::validate() const {
    // Checked first: nothing is opened for a proxy that could never relay
    if (config_.backend.max_connections == 0) {
        throw ZeroMaxConnectionsError();
    }

    const auto errors = ConfigLoader::validate_config(config_);
    if (!errors.empty()) {
        std::string combined = "rsproxy: invalid configuration:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        throw ConfigurationError(combined);
    }
}

void Proxy::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (started_) {
        throw std::runtime_error("rsproxy: proxy already started");
    }
    validate();
    started_ = true;

    const auto& backend = config_.backend;

    admission_ = std::make_shared<AdmissionController>(AdmissionController::Config{
        .max_backend_connections = static_cast<uint32_t>(backend.max_connections),
        .max_client_sessions = static_cast<uint32_t>(config_.listener.max_client_connections),
        .idle_timeout = config_.sessions.idle_timeout,
    });

    registry_ = std::make_shared<PoolRegistry>(
        BackendPool::Config{
            .capacity = backend.pool_capacity,
            .min_idle = backend.min_idle_connections,
            .idle_timeout = backend.server_idle_timeout,
            .max_message_bytes = backend.max_message_bytes,
        },
        connector_, admission_);

    tracker_ = std::make_shared<TopologyTracker>(
        TopologyConfig{
            .seeds = backend.seeds,
            .probe_interval = config_.topology.probe_interval,
            .probe_timeout = config_.topology.probe_timeout,
            .unreachable_grace_cycles = config_.topology.unreachable_grace_cycles,
        },
        prober_);
    tracker_->set_change_callback([this](const MemberChange& change) { on_member_change(change); });

    tracker_->probe_once();
    const auto view = tracker_->current();
    if (view->primary) {
        utils::log::info(std::format("Replica set '{}': primary {}, {} secondaries",
            view->set_name, view->primary->address, view->secondaries.size()));
    } else {
        utils::log::warn(std::format("Replica set '{}': no primary yet ({} members known)",
            view->set_name, view->members.size()));
    }
    tracker_->start();

    router_ = std::make_unique<Router>(
        RouterConfig{
            .host = config_.listener.host,
            .port = static_cast<uint16_t>(config_.listener.port),
            .session = SessionConfig{
                .acquire_timeout = backend.acquire_timeout,
                .write_timeout = config_.sessions.write_timeout,
                .max_message_bytes = backend.max_message_bytes,
            },
        },
        tracker_, registry_, admission_);

    try {
        router_->start();
        if (config_.admin.enabled) {
            admin_ = std::make_unique<AdminServer>(
                config_.admin.host, static_cast<uint16_t>(config_.admin.port),
                [this] { return stats(); });
            admin_->start();
        }
    } catch (const std::exception&) {
        // Leave nothing running behind a failed start
        if (admin_) admin_->stop();
        router_->stop();
        tracker_->stop();
        registry_->close_all();
        throw;
    }

    running_.store(true, std::memory_order_release);
    utils::log::info(std::format("rsproxy listening on {}:{}", config_.listener.host,
                                 router_->port()));
    emit({.type = ProxyEventType::STARTED});
}

void Proxy::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    utils::log::info("Shutting down rsproxy");
    if (admin_) admin_->stop();
    router_->stop();
    tracker_->stop();
    registry_->close_all();

    const auto a = admission_->get_stats();
    utils::log::info(std::format("rsproxy stopped ({} sessions served, {} idle / {} chatty evictions)",
        a.admitted_sessions, a.idle_evictions, a.chatty_evictions));
    emit({.type = ProxyEventType::STOPPED});
}

uint16_t Proxy::listen_port() const {
    return router_ ? router_->port() : 0;
}

uint16_t Proxy::admin_port() const {
    return admin_ ? admin_->port() : 0;
}

ProxyStats Proxy::stats() const {
    ProxyStats s;
    s.running = is_running();
    if (router_) {
        s.listen_port = router_->port();
        s.accepted_sessions = router_->accepted_total();
        s.active_sessions = router_->active_sessions();
    }
    if (admission_) s.admission = admission_->get_stats();
    if (tracker_) {
        s.topology = tracker_->get_stats();
        s.view = tracker_->current();
    }
    if (registry_) s.pools = registry_->stats();
    return s;
}

void Proxy::on_member_change(const MemberChange& change) {
    if (!registry_) return;

    if (change.removed) {
        registry_->remove(change.address);
        emit({.type = ProxyEventType::MEMBER_REMOVED, .address = change.address,
              .from = change.from, .to = change.to});
        return;
    }

    // Connections opened under the old role may carry state (or a stale
    // notion of primary) that no longer holds
    registry_->drop(change.address);
    emit({.type = ProxyEventType::MEMBER_ROLE_CHANGED, .address = change.address,
          .from = change.from, .to = change.to});
}

void Proxy::emit(const ProxyEvent& event) const {
    if (!event_cb_) return;
    try {
        event_cb_(event);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Event callback failed on {}: {}",
            proxy_event_type_name(event.type), e.what()));
    }
}

} // namespace rsproxy
