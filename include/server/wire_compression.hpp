#pragma once

#include "core/error.hpp"
#include "server/wire_protocol.hpp"

#include <cstdint>
#include <optional>

namespace rsproxy {

/**
 * @brief OP_COMPRESSED envelope handling
 *
 * Layout after the standard header: originalOpcode(int32),
 * uncompressedSize(int32), compressorId(uint8), compressed message body.
 * The proxy forwards compressed messages verbatim and only decompresses a
 * copy to inspect it. noop and zlib payloads can be opened; snappy and zstd
 * cannot.
 */
class WireCompression {
public:
    struct Envelope {
        int32_t original_op_code = 0;
        int32_t uncompressed_size = 0;
        uint8_t compressor_id = wire::COMPRESSOR_NOOP;
    };

    /// Envelope fields of an OP_COMPRESSED message, nullopt for anything else
    [[nodiscard]] static std::optional<Envelope> envelope(const Message& msg);

    /**
     * @brief Rebuild the original message (same requestID and responseTo)
     * @return FRAME_ERROR for a malformed envelope or an unsupported compressor
     */
    [[nodiscard]] static Result<Message> decompress(
        const Message& msg, size_t max_message_bytes = wire::DEFAULT_MAX_MESSAGE_BYTES);

    /// Wrap `msg` in OP_COMPRESSED with a noop or zlib payload
    [[nodiscard]] static Result<Message> compress(const Message& msg, uint8_t compressor_id);

    [[nodiscard]] static bool can_decompress(uint8_t compressor_id) {
        return compressor_id == wire::COMPRESSOR_NOOP || compressor_id == wire::COMPRESSOR_ZLIB;
    }
};

} // namespace rsproxy
