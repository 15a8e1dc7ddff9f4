#pragma once

#include "server/bson.hpp"
#include "server/wire_protocol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rsproxy {

enum class RouteClass { READ, WRITE };

/**
 * @brief Routing facts about one client message
 *
 * Produced by inspection only; the message bytes are forwarded unchanged.
 */
struct OpClassification {
    RouteClass route = RouteClass::WRITE;
    bool secondary_ok = false;          // client allows a non-primary read
    bool expects_response = true;
    bool requires_affinity = false;     // must reuse the pinned connection
    bool establishes_affinity = false;  // later ops must see this one's connection
    bool may_open_cursor = false;
    std::string command;                // command name, or the opcode name

    /// Writes, affinity ops and reads without a secondary read preference
    [[nodiscard]] bool primary_bound() const {
        return route == RouteClass::WRITE || requires_affinity
            || establishes_affinity || !secondary_ok;
    }
};

class OpClassifier {
public:
    [[nodiscard]] static OpClassification classify(const Message& msg);

    /**
     * @brief Server-side cursor left open by a reply
     * @return OP_REPLY cursorID or OP_MSG cursor.id, compressed or not; 0 when none
     */
    [[nodiscard]] static int64_t reply_cursor_id(const Message& reply);

    /// OP_MSG moreToCome, looking inside noop/zlib OP_COMPRESSED envelopes
    [[nodiscard]] static bool has_more_to_come(const Message& msg);

    [[nodiscard]] static bool is_read_command(std::string_view name);

    /// Section-0 body of an OP_MSG, nullopt when absent or malformed
    [[nodiscard]] static std::optional<BsonDocument> op_msg_body(const Message& msg);

private:
    static void classify_command(const BsonDocument& body, OpClassification& out);
    static void classify_op_msg(const Message& msg, OpClassification& out);
    static void classify_op_query(const Message& msg, OpClassification& out);
};

} // namespace rsproxy
