#pragma once

#include "core/proxy.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace rsproxy {

/**
 * @brief Read-only HTTP admin endpoint
 *
 * GET /health  200 when a primary is known, 503 otherwise
 * GET /stats   full ProxyStats as JSON
 */
class AdminServer {
public:
    using StatsProvider = std::function<ProxyStats()>;

    AdminServer(std::string host, uint16_t port, StatsProvider provider);
    ~AdminServer();

    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    /**
     * @brief Bind and serve on a background thread
     * @throws std::runtime_error when the port cannot be bound
     */
    void start();
    void stop();

    /// Bound port (resolves port 0)
    [[nodiscard]] uint16_t port() const { return bound_port_; }

private:
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);

    const std::string host_;
    const uint16_t port_;
    StatsProvider provider_;

    std::unique_ptr<httplib::Server> server_;
    uint16_t bound_port_ = 0;
    std::jthread thread_;
};

} // namespace rsproxy
