#include "server/admin_server.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace rsproxy {

namespace {
constexpr const char* kJsonContentType = "application/json";
}

AdminServer::AdminServer(std::string host, uint16_t port, StatsProvider provider)
    : host_(std::move(host)), port_(port), provider_(std::move(provider)) {}

AdminServer::~AdminServer() {
    stop();
}

void AdminServer::start() {
    if (server_) return;

    auto svr = std::make_unique<httplib::Server>();
    svr->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr->Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });

    int bound = -1;
    if (port_ == 0) {
        bound = svr->bind_to_any_port(host_);
    } else if (svr->bind_to_port(host_, port_)) {
        bound = port_;
    }
    if (bound <= 0) {
        throw std::runtime_error(std::format("Admin endpoint: cannot bind {}:{}", host_, port_));
    }
    bound_port_ = static_cast<uint16_t>(bound);
    server_ = std::move(svr);

    thread_ = std::jthread([this] {
        if (!server_->listen_after_bind()) {
            utils::log::error(std::format("Admin endpoint on {}:{} stopped unexpectedly",
                                          host_, bound_port_));
        }
    });
    utils::log::info(std::format("Admin endpoint on http://{}:{}", host_, bound_port_));
}

void AdminServer::stop() {
    if (!server_) return;
    server_->stop();
    if (thread_.joinable()) thread_.join();
    server_.reset();
}

void AdminServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const ProxyStats stats = provider_();
    const bool healthy = stats.running && stats.view && stats.view->primary.has_value();
    res.status = healthy ? 200 : 503;
    res.set_content(health_to_json(stats), kJsonContentType);
}

void AdminServer::handle_stats(const httplib::Request&, httplib::Response& res) {
    res.set_content(stats_to_json(provider_()), kJsonContentType);
}

} // namespace rsproxy
