#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rsproxy {

// MongoDB wire protocol. All integers are little-endian.
namespace wire {

// Opcodes
constexpr int32_t OP_REPLY = 1;
constexpr int32_t OP_UPDATE = 2001;
constexpr int32_t OP_INSERT = 2002;
constexpr int32_t OP_QUERY = 2004;
constexpr int32_t OP_GET_MORE = 2005;
constexpr int32_t OP_DELETE = 2006;
constexpr int32_t OP_KILL_CURSORS = 2007;
constexpr int32_t OP_COMPRESSED = 2012;
constexpr int32_t OP_MSG = 2013;

// Standard message header: messageLength, requestID, responseTo, opCode
constexpr size_t HEADER_SIZE = 16;
constexpr int32_t DEFAULT_MAX_MESSAGE_BYTES = 48000000;

// OP_MSG flagBits
constexpr uint32_t MSG_CHECKSUM_PRESENT = 1u << 0;
constexpr uint32_t MSG_MORE_TO_COME = 1u << 1;
constexpr uint32_t MSG_EXHAUST_ALLOWED = 1u << 16;

// OP_MSG section kinds
constexpr uint8_t SECTION_BODY = 0;
constexpr uint8_t SECTION_DOCUMENT_SEQUENCE = 1;

// OP_COMPRESSED: originalOpcode(4) uncompressedSize(4) compressorId(1)
constexpr size_t COMPRESSED_PREFIX_SIZE = 9;
constexpr uint8_t COMPRESSOR_NOOP = 0;
constexpr uint8_t COMPRESSOR_SNAPPY = 1;
constexpr uint8_t COMPRESSOR_ZLIB = 2;
constexpr uint8_t COMPRESSOR_ZSTD = 3;

[[nodiscard]] const char* compressor_name(uint8_t compressor_id);

// OP_QUERY flags
constexpr int32_t QUERY_SECONDARY_OK = 1 << 2;

// OP_REPLY responseFlags
constexpr int32_t REPLY_CURSOR_NOT_FOUND = 1 << 0;
constexpr int32_t REPLY_QUERY_FAILURE = 1 << 1;

// Server error codes the proxy emits on its own behalf
constexpr int32_t ERR_HOST_UNREACHABLE = 6;
constexpr int32_t ERR_NETWORK_TIMEOUT = 89;
constexpr int32_t ERR_NETWORK_INTERFACE_EXCEEDED_TIME_LIMIT = 202;
constexpr int32_t ERR_NOT_WRITABLE_PRIMARY = 10107;

[[nodiscard]] bool is_known_opcode(int32_t op_code);
[[nodiscard]] const char* opcode_name(int32_t op_code);

} // namespace wire

struct MessageHeader {
    int32_t message_length = 0;
    int32_t request_id = 0;
    int32_t response_to = 0;
    int32_t op_code = 0;
};

/**
 * @brief One complete protocol message, header included, bytes verbatim
 */
struct Message {
    MessageHeader header;
    std::vector<uint8_t> bytes;

    [[nodiscard]] const uint8_t* body() const { return bytes.data() + wire::HEADER_SIZE; }
    [[nodiscard]] size_t body_size() const {
        return bytes.size() > wire::HEADER_SIZE ? bytes.size() - wire::HEADER_SIZE : 0;
    }

    /// OP_MSG flagBits; 0 for every other opcode or a truncated body
    [[nodiscard]] uint32_t msg_flags() const;
};

// Buffer for building wire protocol messages
class WireBuffer {
public:
    WireBuffer() { data_.reserve(256); }

    void clear() { data_.clear(); }

    void write_byte(uint8_t b);
    void write_int32(int32_t val);
    void write_uint32(uint32_t val);
    void write_int64(int64_t val);
    void write_double(double val);
    void write_cstring(std::string_view s);  // null-terminated
    void write_bytes(const uint8_t* data, size_t len);
    void write_bytes(const std::vector<uint8_t>& bytes) { write_bytes(bytes.data(), bytes.size()); }

    /// Overwrite 4 bytes at offset (length back-patching)
    void patch_int32(size_t offset, int32_t val);

    [[nodiscard]] static int32_t read_int32(const uint8_t* data);
    [[nodiscard]] static uint32_t read_uint32(const uint8_t* data);
    [[nodiscard]] static int64_t read_int64(const uint8_t* data);
    [[nodiscard]] static double read_double(const uint8_t* data);

    [[nodiscard]] const std::vector<uint8_t>& data() const { return data_; }
    [[nodiscard]] std::vector<uint8_t> take() { return std::move(data_); }
    [[nodiscard]] size_t size() const { return data_.size(); }

private:
    std::vector<uint8_t> data_;
};

// Writer for messages the proxy originates (probes, error replies)
class WireWriter {
public:
    [[nodiscard]] static MessageHeader parse_header(const uint8_t* data);

    /// Request id for proxy-originated messages (process-wide, never 0)
    [[nodiscard]] static int32_t next_request_id();

    // OP_MSG with a single kind-0 section
    [[nodiscard]] static Message op_msg(int32_t request_id, int32_t response_to,
                                        uint32_t flags, const std::vector<uint8_t>& body_doc);

    // OP_QUERY against a namespace
    [[nodiscard]] static Message op_query(int32_t request_id, int32_t flags,
                                          std::string_view full_collection_name,
                                          int32_t number_to_skip, int32_t number_to_return,
                                          const std::vector<uint8_t>& query_doc);

    // OP_REPLY carrying one document
    [[nodiscard]] static Message op_reply(int32_t request_id, int32_t response_to,
                                          int32_t response_flags, int64_t cursor_id,
                                          const std::vector<uint8_t>& doc);

    /**
     * @brief Protocol-native error reply answering `request`
     *
     * OP_QUERY requests get an OP_REPLY with QueryFailure and {$err, code};
     * everything else gets OP_MSG {ok: 0, errmsg, code, codeName}. An
     * OP_COMPRESSED request is answered by its original opcode, uncompressed.
     */
    [[nodiscard]] static Message error_reply(const Message& request, int32_t code,
                                             std::string_view code_name,
                                             std::string_view errmsg);

private:
    [[nodiscard]] static Message finish(WireBuffer& buf, int32_t request_id,
                                        int32_t response_to, int32_t op_code);
};

} // namespace rsproxy
