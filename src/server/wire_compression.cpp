#include "server/wire_compression.hpp"

#include <zlib.h>

#include <format>
#include <vector>

namespace rsproxy {

namespace {

Message assemble(int32_t request_id, int32_t response_to, int32_t op_code,
                 const uint8_t* body, size_t body_len, const uint8_t* prefix = nullptr,
                 size_t prefix_len = 0) {
    WireBuffer buf;
    buf.write_int32(static_cast<int32_t>(wire::HEADER_SIZE + prefix_len + body_len));
    buf.write_int32(request_id);
    buf.write_int32(response_to);
    buf.write_int32(op_code);
    if (prefix_len > 0) buf.write_bytes(prefix, prefix_len);
    buf.write_bytes(body, body_len);

    Message msg;
    msg.bytes = buf.take();
    msg.header = WireWriter::parse_header(msg.bytes.data());
    return msg;
}

} // namespace

std::optional<WireCompression::Envelope> WireCompression::envelope(const Message& msg) {
    if (msg.header.op_code != wire::OP_COMPRESSED
        || msg.body_size() < wire::COMPRESSED_PREFIX_SIZE) {
        return std::nullopt;
    }
    const uint8_t* p = msg.body();
    return Envelope{
        .original_op_code = WireBuffer::read_int32(p),
        .uncompressed_size = WireBuffer::read_int32(p + 4),
        .compressor_id = p[8],
    };
}

Result<Message> WireCompression::decompress(const Message& msg, size_t max_message_bytes) {
    const auto env = envelope(msg);
    if (!env) {
        return Result<Message>::error(ErrorCategory::FRAME_ERROR, "Not an OP_COMPRESSED message");
    }
    if (env->original_op_code == wire::OP_COMPRESSED || !wire::is_known_opcode(env->original_op_code)) {
        return Result<Message>::error(ErrorCategory::FRAME_ERROR,
            std::format("OP_COMPRESSED wraps invalid opcode {}", env->original_op_code));
    }
    if (env->uncompressed_size < 0
        || wire::HEADER_SIZE + static_cast<size_t>(env->uncompressed_size) > max_message_bytes) {
        return Result<Message>::error(ErrorCategory::FRAME_ERROR,
            std::format("Implausible uncompressed size {}", env->uncompressed_size));
    }

    const uint8_t* payload = msg.body() + wire::COMPRESSED_PREFIX_SIZE;
    const size_t payload_len = msg.body_size() - wire::COMPRESSED_PREFIX_SIZE;
    const auto size = static_cast<size_t>(env->uncompressed_size);

    switch (env->compressor_id) {
        case wire::COMPRESSOR_NOOP:
            if (payload_len != size) {
                return Result<Message>::error(ErrorCategory::FRAME_ERROR,
                    std::format("noop payload is {} bytes, header says {}", payload_len, size));
            }
            return Result<Message>::ok(assemble(msg.header.request_id, msg.header.response_to,
                                                env->original_op_code, payload, payload_len));

        case wire::COMPRESSOR_ZLIB: {
            std::vector<uint8_t> plain(size);
            uLongf plain_len = static_cast<uLongf>(size);
            const int rc = ::uncompress(plain.data(), &plain_len, payload,
                                        static_cast<uLong>(payload_len));
            if (rc != Z_OK || plain_len != static_cast<uLongf>(size)) {
                return Result<Message>::error(ErrorCategory::FRAME_ERROR,
                    std::format("zlib payload does not inflate to {} bytes (rc {})", size, rc));
            }
            return Result<Message>::ok(assemble(msg.header.request_id, msg.header.response_to,
                                                env->original_op_code, plain.data(), plain.size()));
        }

        default:
            return Result<Message>::error(ErrorCategory::FRAME_ERROR,
                std::format("Cannot inspect {} compressed payload",
                            wire::compressor_name(env->compressor_id)));
    }
}

Result<Message> WireCompression::compress(const Message& msg, uint8_t compressor_id) {
    const uint8_t* body = msg.body();
    const size_t body_len = msg.body_size();

    WireBuffer prefix;
    prefix.write_int32(msg.header.op_code);
    prefix.write_int32(static_cast<int32_t>(body_len));
    prefix.write_byte(compressor_id);

    switch (compressor_id) {
        case wire::COMPRESSOR_NOOP:
            return Result<Message>::ok(assemble(msg.header.request_id, msg.header.response_to,
                wire::OP_COMPRESSED, body, body_len, prefix.data().data(), prefix.size()));

        case wire::COMPRESSOR_ZLIB: {
            uLongf packed_len = ::compressBound(static_cast<uLong>(body_len));
            std::vector<uint8_t> packed(packed_len);
            const int rc = ::compress2(packed.data(), &packed_len, body,
                                       static_cast<uLong>(body_len), Z_DEFAULT_COMPRESSION);
            if (rc != Z_OK) {
                return Result<Message>::error(ErrorCategory::INTERNAL_ERROR,
                    std::format("zlib compress failed (rc {})", rc));
            }
            return Result<Message>::ok(assemble(msg.header.request_id, msg.header.response_to,
                wire::OP_COMPRESSED, packed.data(), packed_len, prefix.data().data(), prefix.size()));
        }

        default:
            return Result<Message>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("Unsupported compressor {}", wire::compressor_name(compressor_id)));
    }
}

} // namespace rsproxy
