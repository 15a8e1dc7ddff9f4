#include "server/proxy_session.hpp"
#include "core/utils.hpp"

#include <format>

namespace rsproxy {

namespace {

std::atomic<uint64_t> g_secondary_rr{0};

// Marks the session busy for the duration of one relay step
class ExchangeGuard {
public:
    explicit ExchangeGuard(std::atomic<bool>& busy) : busy_(busy) {
        busy_.store(true, std::memory_order_release);
    }
    ~ExchangeGuard() { busy_.store(false, std::memory_order_release); }

    ExchangeGuard(const ExchangeGuard&) = delete;
    ExchangeGuard& operator=(const ExchangeGuard&) = delete;

private:
    std::atomic<bool>& busy_;
};

} // namespace

ProxySession::ProxySession(uint64_t id, Socket client, std::string remote_addr,
                           SessionContext context)
    : id_(id),
      client_(std::move(client)),
      remote_addr_(std::move(remote_addr)),
      ctx_(std::move(context)),
      framer_(ctx_.config.max_message_bytes) {
    touch();
}

ProxySession::~ProxySession() = default;

void ProxySession::attach_ticket(AdmissionController::SessionTicket ticket) {
    ticket_.emplace(std::move(ticket));
}

std::chrono::steady_clock::time_point ProxySession::last_activity() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::nanoseconds(last_activity_ns_.load(std::memory_order_acquire)));
}

void ProxySession::touch() {
    last_activity_ns_.store(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count(),
        std::memory_order_release);
}

void ProxySession::set_pin(std::optional<PooledBackend> pin) {
    // Assigning over an engaged pin returns the old connection to its pool
    pinned_ = std::move(pin);
    has_pin_.store(pinned_.has_value(), std::memory_order_release);
}

void ProxySession::set_active_backend(BackendConnection* conn) {
    std::lock_guard lock(interrupt_mutex_);
    active_backend_ = conn;
}

void ProxySession::evict(EvictionReason reason) {
    if (finished()) return;

    utils::log::info(std::format("Evicting session {} ({}): {}",
        id_, remote_addr_, eviction_reason_name(reason)));

    stop_.request_stop();

    std::lock_guard lock(interrupt_mutex_);
    client_.shutdown();
    // An idle eviction lets an exchange that started in the meantime finish
    // on the backend side; its reply then fails to reach the client
    if (reason == EvictionReason::SHUTDOWN && active_backend_) {
        active_backend_->interrupt();
    }
}

ProxySession::Stats ProxySession::get_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .responses = responses_.load(std::memory_order_relaxed),
        .error_replies = error_replies_.load(std::memory_order_relaxed),
        .pinned = has_pin_.load(std::memory_order_acquire),
    };
}

void ProxySession::run() {
    client_.set_send_timeout(ctx_.config.write_timeout);
    utils::log::debug(std::format("Session {} started for {}", id_, remote_addr_));

    try {
        while (!stop_.stop_requested()) {
            auto request = framer_.next(client_);
            if (request.is_error()) {
                if (request.error_category() == ErrorCategory::FRAME_ERROR) {
                    utils::log::warn(std::format("Session {} ({}): {}; closing",
                        id_, remote_addr_, request.error_message()));
                } else {
                    utils::log::debug(std::format("Session {} ({}): {}",
                        id_, remote_addr_, request.error_message()));
                }
                break;
            }

            touch();
            if (relay(request.value()) == StepResult::CLOSE) break;
            touch();
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Session {} ({}) failed: {}", id_, remote_addr_, e.what()));
    }

    set_pin(std::nullopt);
    {
        std::lock_guard lock(interrupt_mutex_);
        client_.close();
    }
    ticket_.reset();
    finished_.store(true, std::memory_order_release);

    utils::log::debug(std::format("Session {} ({}) closed after {} requests",
        id_, remote_addr_, requests_.load(std::memory_order_relaxed)));
}

Result<std::string> ProxySession::select_target(const OpClassification& op,
                                                const ReplicaSetView& view) const {
    if (op.primary_bound()) {
        if (!view.primary) {
            return Result<std::string>::error(ErrorCategory::NO_PRIMARY,
                view.split_brain ? "not primary: replica set members disagree on the primary"
                                 : "not primary: replica set has no reachable primary");
        }
        return Result<std::string>::ok(view.primary->address);
    }

    if (!view.secondaries.empty()) {
        const uint64_t n = g_secondary_rr.fetch_add(1, std::memory_order_relaxed);
        return Result<std::string>::ok(view.secondaries[n % view.secondaries.size()].address);
    }
    if (view.primary) {
        return Result<std::string>::ok(view.primary->address);
    }
    return Result<std::string>::error(ErrorCategory::NO_PRIMARY,
        "no replica set member available for reads");
}

bool ProxySession::pin_serves(const OpClassification& op, const ReplicaSetView& view) const {
    if (op.requires_affinity) return true;
    if (!op.establishes_affinity && !op.may_open_cursor) return false;

    const std::string& address = (*pinned_)->address();
    if (op.primary_bound()) return view.is_primary(address);
    return view.is_primary(address) || view.is_secondary(address);
}

IoStatus ProxySession::write_to_client(const Message& msg) {
    return client_.write_all(msg.bytes.data(), msg.bytes.size()).status;
}

ProxySession::StepResult ProxySession::reply_error(const Message& request,
                                                   const OpClassification& op,
                                                   int32_t code, std::string_view code_name,
                                                   std::string_view errmsg) {
    if (!op.expects_response) return StepResult::CONTINUE;

    const auto reply = WireWriter::error_reply(request, code, code_name, errmsg);
    error_replies_.fetch_add(1, std::memory_order_relaxed);
    if (write_to_client(reply) != IoStatus::OK) {
        return StepResult::CLOSE;
    }
    return StepResult::CONTINUE;
}

ProxySession::ExchangeOutcome ProxySession::exchange(BackendConnection& backend,
                                                     const Message& request,
                                                     const OpClassification& op) {
    ExchangeOutcome out;

    set_active_backend(&backend);
    struct ActiveReset {
        ProxySession* self;
        ~ActiveReset() { self->set_active_backend(nullptr); }
    } active_reset{this};

    if (stop_.stop_requested()) {
        out.status = ExchangeStatus::CANCELLED;
        return out;
    }

    if (!backend.send(request)) {
        out.status = ExchangeStatus::BACKEND_FAILED;
        out.drained = false;
        out.detail = std::format("failed to forward {} to {}", op.command, backend.address());
        return out;
    }
    if (!op.expects_response) return out;

    // First reply answers the request; each exhaust reply answers the previous one
    int32_t expected = request.header.request_id;
    bool first = true;
    while (true) {
        auto reply = backend.read_message();
        if (reply.is_error()) {
            out.drained = false;
            if (stop_.stop_requested()) {
                out.status = ExchangeStatus::CANCELLED;
            } else if (reply.error_category() == ErrorCategory::BACKEND_TIMEOUT) {
                out.status = ExchangeStatus::BACKEND_TIMEOUT;
                out.detail = reply.error_message();
            } else {
                out.status = ExchangeStatus::BACKEND_FAILED;
                out.detail = reply.error_message();
            }
            return out;
        }

        const Message& msg = reply.value();
        if (msg.header.response_to != expected) {
            backend.mark_dead();
            out.status = ExchangeStatus::DESYNC;
            out.drained = false;
            out.detail = std::format("response to {} while awaiting response to {}",
                                     msg.header.response_to, expected);
            return out;
        }
        if (first) {
            out.cursor_id = OpClassifier::reply_cursor_id(msg);
            first = false;
        }

        const bool more = OpClassifier::has_more_to_come(msg);
        const IoStatus written = write_to_client(msg);
        if (written != IoStatus::OK) {
            out.status = ExchangeStatus::CLIENT_GONE;
            out.drained = !more;
            out.detail = written == IoStatus::TIMED_OUT ? "client stopped reading responses"
                                                        : "client disconnected before reading responses";
            return out;
        }
        out.replied = true;
        responses_.fetch_add(1, std::memory_order_relaxed);

        if (!more) return out;
        expected = msg.header.request_id;
    }
}

ProxySession::StepResult ProxySession::relay(const Message& request) {
    const OpClassification op = OpClassifier::classify(request);
    ExchangeGuard busy(busy_);
    requests_.fetch_add(1, std::memory_order_relaxed);

    // One consistent snapshot for the whole step
    const auto view = ctx_.topology->current();

    const bool use_pin = pinned_.has_value() && pin_serves(op, *view);
    std::optional<PooledBackend> borrowed;

    if (!use_pin) {
        auto target = select_target(op, *view);
        if (target.is_error()) {
            utils::log::debug(std::format("Session {}: {} rejected: {}",
                id_, op.command, target.error_message()));
            return reply_error(request, op, wire::ERR_NOT_WRITABLE_PRIMARY,
                               "NotWritablePrimary", target.error_message());
        }

        auto acquired = ctx_.pools->pool_for(target.value())->acquire(
            ctx_.config.acquire_timeout, stop_.get_token());
        if (acquired.is_error()) {
            switch (acquired.error_category()) {
                case ErrorCategory::CANCELLED:
                    return StepResult::CLOSE;
                case ErrorCategory::POOL_EXHAUSTED:
                    utils::log::warn(std::format("Session {}: {}", id_, acquired.error_message()));
                    return reply_error(request, op,
                                       wire::ERR_NETWORK_INTERFACE_EXCEEDED_TIME_LIMIT,
                                       "NetworkInterfaceExceededTimeLimit",
                                       acquired.error_message());
                default:
                    utils::log::warn(std::format("Session {}: {}", id_, acquired.error_message()));
                    ctx_.topology->report_unreachable(target.value());
                    return reply_error(request, op, wire::ERR_HOST_UNREACHABLE,
                                       "HostUnreachable", acquired.error_message());
            }
        }
        borrowed.emplace(std::move(acquired.value()));
    }

    PooledBackend& handle = use_pin ? *pinned_ : *borrowed;
    const std::string address = handle->address();

    const ExchangeOutcome outcome = exchange(*handle, request, op);
    if (outcome.status != ExchangeStatus::OK && !outcome.drained) {
        handle.mark_unhealthy();
    }

    switch (outcome.status) {
        case ExchangeStatus::OK:
            if (!use_pin && (op.establishes_affinity || outcome.cursor_id != 0)) {
                utils::log::debug(std::format("Session {}: pinned to {} conn #{} ({})",
                    id_, address, handle->id(), op.command));
                set_pin(std::move(borrowed));
            }
            return StepResult::CONTINUE;

        case ExchangeStatus::CLIENT_GONE:
            // Already evicted: the write failed because evict() shut the client down
            if (!stop_.stop_requested()) {
                ctx_.admission->record_chatty_eviction();
                utils::log::info(std::format("Evicting session {} ({}): {}",
                    id_, remote_addr_, outcome.detail));
            }
            return StepResult::CLOSE;

        case ExchangeStatus::CANCELLED:
            return StepResult::CLOSE;

        case ExchangeStatus::DESYNC:
            utils::log::warn(std::format("Session {}: protocol desync on {}: {}; closing",
                id_, address, outcome.detail));
            if (use_pin) set_pin(std::nullopt);
            return StepResult::CLOSE;

        case ExchangeStatus::BACKEND_TIMEOUT:
            // A slow operation says nothing about the member; only this
            // connection is given up
            utils::log::warn(std::format("Session {}: backend {} conn #{} timed out during {}: {}",
                id_, address, handle->id(), op.command, outcome.detail));
            if (use_pin) set_pin(std::nullopt);
            if (outcome.replied) return StepResult::CLOSE;
            return reply_error(request, op, wire::ERR_NETWORK_TIMEOUT, "NetworkTimeout",
                               std::format("operation on {} timed out: {}", address, outcome.detail));

        case ExchangeStatus::BACKEND_FAILED:
            utils::log::warn(std::format("Session {}: backend {} failed during {}: {}",
                id_, address, op.command, outcome.detail));
            if (use_pin) set_pin(std::nullopt);
            ctx_.topology->report_unreachable(address);
            // Part of an exhaust stream already went out; an error reply
            // now would not correlate with anything
            if (outcome.replied) return StepResult::CLOSE;
            return reply_error(request, op, wire::ERR_HOST_UNREACHABLE, "HostUnreachable",
                               std::format("connection to {} failed: {}", address, outcome.detail));
    }
    return StepResult::CLOSE;
}

} // namespace rsproxy
