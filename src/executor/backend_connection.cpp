#include "executor/backend_connection.hpp"
#include "executor/backend_connector.hpp"
#include "core/utils.hpp"

#include <format>

namespace rsproxy {

namespace {
std::atomic<uint64_t> g_next_connection_id{1};
} // namespace

// ============================================================================
// TcpBackendConnector
// ============================================================================

Result<Socket> TcpBackendConnector::connect(const std::string& address) {
    auto result = Socket::connect_tcp(address, connect_timeout_);
    if (result.is_error()) {
        return result;
    }
    result.value().set_receive_timeout(message_timeout_);
    result.value().set_send_timeout(message_timeout_);
    return result;
}

// ============================================================================
// BackendConnection
// ============================================================================

BackendConnection::BackendConnection(std::string address, Socket socket,
                                     std::optional<AdmissionController::BackendSlot> slot,
                                     uint64_t epoch, size_t max_message_bytes)
    : address_(std::move(address)),
      socket_(std::move(socket)),
      framer_(max_message_bytes),
      slot_(std::move(slot)),
      epoch_(epoch),
      id_(g_next_connection_id.fetch_add(1, std::memory_order_relaxed)),
      last_used_(std::chrono::steady_clock::now()) {}

bool BackendConnection::send(const Message& msg) {
    const auto outcome = socket_.write_all(msg.bytes.data(), msg.bytes.size());
    if (!outcome.ok()) {
        mark_dead();
        utils::log::debug(std::format("Backend {} conn #{}: write failed after {} bytes",
            address_, id_, outcome.transferred));
        return false;
    }
    return true;
}

Result<Message> BackendConnection::read_message() {
    auto result = framer_.next(socket_);
    if (result.is_error()) {
        mark_dead();
        if (result.error_category() == ErrorCategory::CONNECTION_CLOSED) {
            // Server hung up between messages: from our side the member went away
            return Result<Message>::error(ErrorCategory::BACKEND_UNREACHABLE,
                std::format("Backend {} closed the connection", address_));
        }
    }
    return result;
}

bool BackendConnection::check_idle_alive() {
    if (socket_.has_pending_input()) {
        mark_dead();
    }
    return is_alive();
}

} // namespace rsproxy
