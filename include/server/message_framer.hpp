#pragma once

#include "core/error.hpp"
#include "server/socket.hpp"
#include "server/wire_protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rsproxy {

/**
 * @brief Splits a byte stream into whole wire protocol messages
 *
 * next() reads exactly the 16-byte header, validates it, then reads exactly
 * the body, so it never consumes bytes of the following message. Errors:
 *   - CONNECTION_CLOSED: peer closed cleanly on a message boundary
 *   - FRAME_ERROR: implausible length, unknown opcode, or EOF mid-message
 *   - BACKEND_UNREACHABLE: read timed out or the socket failed
 * After FRAME_ERROR the stream position is undefined and the connection must
 * be closed.
 */
class MessageFramer {
public:
    explicit MessageFramer(size_t max_message_bytes = wire::DEFAULT_MAX_MESSAGE_BYTES)
        : max_message_bytes_(max_message_bytes) {}

    [[nodiscard]] Result<Message> next(Socket& stream);

    /// Start over for a fresh connection
    void reset() { messages_read_ = 0; }

    [[nodiscard]] uint64_t messages_read() const { return messages_read_; }
    [[nodiscard]] size_t max_message_bytes() const { return max_message_bytes_; }

    /**
     * @brief Header validation shared with tests and the backend side
     * @return empty string when valid, otherwise the reason
     */
    [[nodiscard]] static std::string validate_header(const MessageHeader& header,
                                                     size_t max_message_bytes);

private:
    size_t max_message_bytes_;
    uint64_t messages_read_ = 0;
};

} // namespace rsproxy
