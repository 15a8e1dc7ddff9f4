#include "config/config_loader.hpp"
#include "core/proxy.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <string>
#include <thread>

using namespace rsproxy;

namespace {

std::atomic<int> g_signal{0};

void signal_handler(int signal) {
    g_signal.store(signal);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("rsproxy starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGPIPE, SIG_IGN);

        std::string config_file = "config/rsproxy.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const ProxyConfig& config = config_result.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info(std::format("[2/5] Replica set seeds: {}",
            utils::join(config.backend.seeds, ", ")));
        utils::log::info(std::format("[3/5] Backend limits: {} connections total, {} per member, "
            "acquire timeout {}ms",
            config.backend.max_connections, config.backend.pool_capacity,
            config.backend.acquire_timeout.count()));

        Proxy proxy(config);
        proxy.set_event_callback([](const ProxyEvent& event) {
            if (event.type == ProxyEventType::MEMBER_ROLE_CHANGED ||
                event.type == ProxyEventType::MEMBER_REMOVED) {
                utils::log::debug(std::format("Event {}: {} ({} -> {})",
                    proxy_event_type_name(event.type), event.address,
                    member_role_name(event.from), member_role_name(event.to)));
            }
        });

        utils::log::info("[4/5] Probing replica set and opening listener");
        proxy.start();

        utils::log::info(std::format("[5/5] Ready on {}:{} (admin: {})",
            config.listener.host, proxy.listen_port(),
            config.admin.enabled ? std::format("{}:{}", config.admin.host, proxy.admin_port())
                                 : std::string("disabled")));

        while (g_signal.load() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        utils::log::info(std::format("Received signal {}, shutting down...", g_signal.load()));
        proxy.stop();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
