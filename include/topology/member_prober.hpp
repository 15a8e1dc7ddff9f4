#pragma once

#include "core/error.hpp"
#include "server/wire_protocol.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rsproxy {

/**
 * @brief What one member says about itself and its replica set
 */
struct ProbeReply {
    bool is_primary = false;
    bool is_secondary = false;
    std::vector<std::string> hosts;   // hosts + passives
    std::string set_name;
    std::string me;
    std::chrono::microseconds rtt{0};
};

class IMemberProber {
public:
    virtual ~IMemberProber() = default;

    /**
     * @brief Ask one member for its role and membership view
     * @return BACKEND_UNREACHABLE on connect, timeout or protocol failure
     */
    [[nodiscard]] virtual Result<ProbeReply> probe(const std::string& address,
                                                   std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Probes with `isMaster` over OP_MSG on a short-lived connection
 *
 * Probe connections are monitoring traffic and do not count against the
 * global backend connection cap.
 */
class WireMemberProber : public IMemberProber {
public:
    explicit WireMemberProber(size_t max_message_bytes = wire::DEFAULT_MAX_MESSAGE_BYTES)
        : max_message_bytes_(max_message_bytes) {}

    [[nodiscard]] Result<ProbeReply> probe(const std::string& address,
                                           std::chrono::milliseconds timeout) override;

    [[nodiscard]] static Message build_request(int32_t request_id);

    /// Interpret an isMaster reply (OP_MSG or OP_REPLY)
    [[nodiscard]] static Result<ProbeReply> parse_reply(const Message& reply);

private:
    size_t max_message_bytes_;
};

} // namespace rsproxy
