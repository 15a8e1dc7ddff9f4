#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rsproxy {

// BSON element type tags (bsonspec.org)
enum class BsonType : uint8_t {
    DOUBLE = 0x01,
    STRING = 0x02,
    DOCUMENT = 0x03,
    ARRAY = 0x04,
    BINARY = 0x05,
    UNDEFINED = 0x06,
    OBJECT_ID = 0x07,
    BOOLEAN = 0x08,
    DATETIME = 0x09,
    NULL_VALUE = 0x0A,
    REGEX = 0x0B,
    DB_POINTER = 0x0C,
    JAVASCRIPT = 0x0D,
    SYMBOL = 0x0E,
    JAVASCRIPT_WITH_SCOPE = 0x0F,
    INT32 = 0x10,
    TIMESTAMP = 0x11,
    INT64 = 0x12,
    DECIMAL128 = 0x13,
    MAX_KEY = 0x7F,
    MIN_KEY = 0xFF
};

class BsonDocument;

/**
 * @brief Non-owning view of one element inside a BsonDocument
 */
struct BsonElement {
    BsonType type = BsonType::NULL_VALUE;
    std::string_view key;
    const uint8_t* value = nullptr;
    size_t value_size = 0;

    [[nodiscard]] std::optional<std::string_view> as_string() const;

    /// int32, int64 and integral doubles
    [[nodiscard]] std::optional<int64_t> as_int64() const;

    /// Booleans, plus numeric truthiness (servers answer `ok: 1.0`)
    [[nodiscard]] std::optional<bool> as_bool() const;

    /// Embedded documents and arrays
    [[nodiscard]] std::optional<BsonDocument> as_document() const;
};

/**
 * @brief Read-only view over an encoded BSON document
 *
 * Only as much of the document is decoded as a lookup needs. The view does
 * not own its bytes.
 */
class BsonDocument {
public:
    /**
     * @brief Validate the outer length and terminator
     * @return nullopt when `available` is too short or the framing is wrong
     */
    [[nodiscard]] static std::optional<BsonDocument> parse(const uint8_t* data, size_t available);

    [[nodiscard]] std::optional<BsonElement> first() const;
    [[nodiscard]] std::optional<BsonElement> find(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const { return find(key).has_value(); }

    /// Elements in order; stops at the first malformed element
    [[nodiscard]] std::vector<BsonElement> elements() const;

    [[nodiscard]] size_t size_bytes() const { return size_; }
    [[nodiscard]] const uint8_t* data() const { return data_; }

private:
    BsonDocument(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    // Decode the element at `offset`; nullopt at the terminator or on damage
    [[nodiscard]] std::optional<BsonElement> element_at(size_t offset, size_t& next) const;

    const uint8_t* data_;
    size_t size_;
};

/**
 * @brief Append-only BSON encoder
 *
 * Used for the proxy's own messages (isMaster probes, error replies) and by
 * the tests to script client and server traffic.
 */
class BsonBuilder {
public:
    BsonBuilder();

    BsonBuilder& append_double(std::string_view key, double value);
    BsonBuilder& append_string(std::string_view key, std::string_view value);
    BsonBuilder& append_document(std::string_view key, const std::vector<uint8_t>& doc);
    BsonBuilder& append_array(std::string_view key, const std::vector<uint8_t>& array_doc);
    BsonBuilder& append_bool(std::string_view key, bool value);
    BsonBuilder& append_null(std::string_view key);
    BsonBuilder& append_int32(std::string_view key, int32_t value);
    BsonBuilder& append_int64(std::string_view key, int64_t value);

    BsonBuilder& append_string_array(std::string_view key, const std::vector<std::string>& values);
    BsonBuilder& append_document_array(std::string_view key,
                                       const std::vector<std::vector<uint8_t>>& docs);

    /// Terminate and back-patch the length; the builder is then empty
    [[nodiscard]] std::vector<uint8_t> finish();

private:
    void append_key(BsonType type, std::string_view key);

    std::vector<uint8_t> data_;
};

} // namespace rsproxy
