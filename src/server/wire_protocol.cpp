#include "server/wire_protocol.hpp"
#include "server/bson.hpp"

// GCC 14 false positive: -Wfree-nonheap-object in std::vector<uint8_t>::push_back
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wfree-nonheap-object"
#endif

#include <atomic>
#include <bit>
#include <cstring>

namespace rsproxy {

// ============================================================================
// Opcodes
// ============================================================================

bool wire::is_known_opcode(int32_t op_code) {
    switch (op_code) {
        case OP_REPLY:
        case OP_UPDATE:
        case OP_INSERT:
        case OP_QUERY:
        case OP_GET_MORE:
        case OP_DELETE:
        case OP_KILL_CURSORS:
        case OP_COMPRESSED:
        case OP_MSG:
            return true;
        default:
            return false;
    }
}

const char* wire::opcode_name(int32_t op_code) {
    switch (op_code) {
        case OP_REPLY:        return "OP_REPLY";
        case OP_UPDATE:       return "OP_UPDATE";
        case OP_INSERT:       return "OP_INSERT";
        case OP_QUERY:        return "OP_QUERY";
        case OP_GET_MORE:     return "OP_GET_MORE";
        case OP_DELETE:       return "OP_DELETE";
        case OP_KILL_CURSORS: return "OP_KILL_CURSORS";
        case OP_COMPRESSED:   return "OP_COMPRESSED";
        case OP_MSG:          return "OP_MSG";
        default:              return "UNKNOWN";
    }
}

const char* wire::compressor_name(uint8_t compressor_id) {
    switch (compressor_id) {
        case COMPRESSOR_NOOP:   return "noop";
        case COMPRESSOR_SNAPPY: return "snappy";
        case COMPRESSOR_ZLIB:   return "zlib";
        case COMPRESSOR_ZSTD:   return "zstd";
        default:                return "unknown";
    }
}

uint32_t Message::msg_flags() const {
    if (header.op_code != wire::OP_MSG || body_size() < 4) return 0;
    return WireBuffer::read_uint32(body());
}

// ============================================================================
// WireBuffer
// ============================================================================

void WireBuffer::write_byte(uint8_t b) {
    data_.push_back(b);
}

void WireBuffer::write_int32(int32_t val) {
    write_uint32(static_cast<uint32_t>(val));
}

void WireBuffer::write_uint32(uint32_t val) {
    data_.push_back(static_cast<uint8_t>(val & 0xFF));
    data_.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    data_.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    data_.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
}

void WireBuffer::write_int64(int64_t val) {
    const auto u = static_cast<uint64_t>(val);
    for (int shift = 0; shift < 64; shift += 8) {
        data_.push_back(static_cast<uint8_t>((u >> shift) & 0xFF));
    }
}

void WireBuffer::write_double(double val) {
    write_int64(std::bit_cast<int64_t>(val));
}

void WireBuffer::write_cstring(std::string_view s) {
    data_.insert(data_.end(), s.begin(), s.end());
    data_.push_back(0);  // null terminator
}

void WireBuffer::write_bytes(const uint8_t* data, size_t len) {
    data_.insert(data_.end(), data, data + len);
}

void WireBuffer::patch_int32(size_t offset, int32_t val) {
    const auto u = static_cast<uint32_t>(val);
    data_[offset] = static_cast<uint8_t>(u & 0xFF);
    data_[offset + 1] = static_cast<uint8_t>((u >> 8) & 0xFF);
    data_[offset + 2] = static_cast<uint8_t>((u >> 16) & 0xFF);
    data_[offset + 3] = static_cast<uint8_t>((u >> 24) & 0xFF);
}

int32_t WireBuffer::read_int32(const uint8_t* data) {
    return static_cast<int32_t>(read_uint32(data));
}

uint32_t WireBuffer::read_uint32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

int64_t WireBuffer::read_int64(const uint8_t* data) {
    uint64_t u = 0;
    for (int i = 7; i >= 0; --i) {
        u = (u << 8) | data[i];
    }
    return static_cast<int64_t>(u);
}

double WireBuffer::read_double(const uint8_t* data) {
    return std::bit_cast<double>(read_int64(data));
}

// ============================================================================
// WireWriter
// ============================================================================

MessageHeader WireWriter::parse_header(const uint8_t* data) {
    MessageHeader h;
    h.message_length = WireBuffer::read_int32(data);
    h.request_id = WireBuffer::read_int32(data + 4);
    h.response_to = WireBuffer::read_int32(data + 8);
    h.op_code = WireBuffer::read_int32(data + 12);
    return h;
}

int32_t WireWriter::next_request_id() {
    // Start high so ids are easy to tell apart from driver ids in captures
    static std::atomic<int32_t> counter{0x40000000};
    int32_t id = counter.fetch_add(1, std::memory_order_relaxed);
    if (id <= 0) {
        counter.store(0x40000000, std::memory_order_relaxed);
        id = 0x40000000;
    }
    return id;
}

Message WireWriter::finish(WireBuffer& buf, int32_t request_id,
                           int32_t response_to, int32_t op_code) {
    Message msg;
    msg.header.message_length = static_cast<int32_t>(buf.size());
    msg.header.request_id = request_id;
    msg.header.response_to = response_to;
    msg.header.op_code = op_code;
    buf.patch_int32(0, msg.header.message_length);
    msg.bytes = buf.take();
    return msg;
}

Message WireWriter::op_msg(int32_t request_id, int32_t response_to,
                           uint32_t flags, const std::vector<uint8_t>& body_doc) {
    WireBuffer buf;
    buf.write_int32(0);  // patched by finish()
    buf.write_int32(request_id);
    buf.write_int32(response_to);
    buf.write_int32(wire::OP_MSG);
    buf.write_uint32(flags);
    buf.write_byte(wire::SECTION_BODY);
    buf.write_bytes(body_doc);
    return finish(buf, request_id, response_to, wire::OP_MSG);
}

Message WireWriter::op_query(int32_t request_id, int32_t flags,
                             std::string_view full_collection_name,
                             int32_t number_to_skip, int32_t number_to_return,
                             const std::vector<uint8_t>& query_doc) {
    WireBuffer buf;
    buf.write_int32(0);
    buf.write_int32(request_id);
    buf.write_int32(0);
    buf.write_int32(wire::OP_QUERY);
    buf.write_int32(flags);
    buf.write_cstring(full_collection_name);
    buf.write_int32(number_to_skip);
    buf.write_int32(number_to_return);
    buf.write_bytes(query_doc);
    return finish(buf, request_id, 0, wire::OP_QUERY);
}

Message WireWriter::op_reply(int32_t request_id, int32_t response_to,
                             int32_t response_flags, int64_t cursor_id,
                             const std::vector<uint8_t>& doc) {
    WireBuffer buf;
    buf.write_int32(0);
    buf.write_int32(request_id);
    buf.write_int32(response_to);
    buf.write_int32(wire::OP_REPLY);
    buf.write_int32(response_flags);
    buf.write_int64(cursor_id);
    buf.write_int32(0);  // startingFrom
    buf.write_int32(1);  // numberReturned
    buf.write_bytes(doc);
    return finish(buf, request_id, response_to, wire::OP_REPLY);
}

Message WireWriter::error_reply(const Message& request, int32_t code,
                                std::string_view code_name, std::string_view errmsg) {
    const int32_t id = next_request_id();

    // Answer in the shape of the message inside an OP_COMPRESSED envelope
    int32_t op_code = request.header.op_code;
    if (op_code == wire::OP_COMPRESSED && request.body_size() >= wire::COMPRESSED_PREFIX_SIZE) {
        op_code = WireBuffer::read_int32(request.body());
    }

    if (op_code == wire::OP_QUERY) {
        BsonBuilder doc;
        doc.append_string("$err", errmsg);
        doc.append_int32("code", code);
        doc.append_string("codeName", code_name);
        return op_reply(id, request.header.request_id,
                        wire::REPLY_QUERY_FAILURE, 0, doc.finish());
    }

    BsonBuilder doc;
    doc.append_double("ok", 0.0);
    doc.append_string("errmsg", errmsg);
    doc.append_int32("code", code);
    doc.append_string("codeName", code_name);
    return op_msg(id, request.header.request_id, 0, doc.finish());
}

} // namespace rsproxy

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif
