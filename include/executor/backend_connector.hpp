#pragma once

#include "core/error.hpp"
#include "server/socket.hpp"

#include <chrono>
#include <string>

namespace rsproxy {

/**
 * @brief Abstract factory for backend transports
 *
 * The pool calls connect() outside its lock. Tests substitute socketpairs.
 */
class IBackendConnector {
public:
    virtual ~IBackendConnector() = default;

    /**
     * @brief Open a transport to one cluster member
     * @param address "host:port"
     * @return Connected socket, or BACKEND_UNREACHABLE
     */
    [[nodiscard]] virtual Result<Socket> connect(const std::string& address) = 0;
};

/**
 * @brief Plain TCP connector with connect and per-message read timeouts
 */
class TcpBackendConnector : public IBackendConnector {
public:
    TcpBackendConnector(std::chrono::milliseconds connect_timeout,
                        std::chrono::milliseconds message_timeout)
        : connect_timeout_(connect_timeout), message_timeout_(message_timeout) {}

    [[nodiscard]] Result<Socket> connect(const std::string& address) override;

private:
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds message_timeout_;
};

} // namespace rsproxy
