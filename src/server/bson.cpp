#include "server/bson.hpp"
#include "server/wire_protocol.hpp"

#include <cmath>
#include <cstring>

namespace rsproxy {

namespace {

// Bytes occupied by a value of `type` starting at `p`, or nullopt when the
// value runs past `remaining`.
std::optional<size_t> value_length(BsonType type, const uint8_t* p, size_t remaining) {
    auto fixed = [remaining](size_t n) -> std::optional<size_t> {
        return n <= remaining ? std::optional<size_t>(n) : std::nullopt;
    };
    auto length_prefixed = [p, remaining](size_t extra) -> std::optional<size_t> {
        if (remaining < 4) return std::nullopt;
        const int32_t len = WireBuffer::read_int32(p);
        if (len < 0) return std::nullopt;
        const size_t total = 4 + static_cast<size_t>(len) + extra;
        return total <= remaining ? std::optional<size_t>(total) : std::nullopt;
    };
    auto self_sized = [p, remaining]() -> std::optional<size_t> {
        if (remaining < 5) return std::nullopt;
        const int32_t len = WireBuffer::read_int32(p);
        if (len < 5 || static_cast<size_t>(len) > remaining) return std::nullopt;
        return static_cast<size_t>(len);
    };

    switch (type) {
        case BsonType::DOUBLE:
        case BsonType::DATETIME:
        case BsonType::TIMESTAMP:
        case BsonType::INT64:
            return fixed(8);
        case BsonType::STRING:
        case BsonType::JAVASCRIPT:
        case BsonType::SYMBOL:
            return length_prefixed(0);
        case BsonType::DOCUMENT:
        case BsonType::ARRAY:
        case BsonType::JAVASCRIPT_WITH_SCOPE:
            return self_sized();
        case BsonType::BINARY:
            return length_prefixed(1);
        case BsonType::UNDEFINED:
        case BsonType::NULL_VALUE:
        case BsonType::MIN_KEY:
        case BsonType::MAX_KEY:
            return 0;
        case BsonType::OBJECT_ID:
            return fixed(12);
        case BsonType::BOOLEAN:
            return fixed(1);
        case BsonType::INT32:
            return fixed(4);
        case BsonType::DECIMAL128:
            return fixed(16);
        case BsonType::DB_POINTER:
            return length_prefixed(12);
        case BsonType::REGEX: {
            // Two cstrings: pattern, options
            const auto* first_nul = static_cast<const uint8_t*>(std::memchr(p, 0, remaining));
            if (!first_nul) return std::nullopt;
            const size_t first_len = static_cast<size_t>(first_nul - p) + 1;
            const auto* second_nul = static_cast<const uint8_t*>(
                std::memchr(p + first_len, 0, remaining - first_len));
            if (!second_nul) return std::nullopt;
            return static_cast<size_t>(second_nul - p) + 1;
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// BsonElement
// ============================================================================

std::optional<std::string_view> BsonElement::as_string() const {
    if (type != BsonType::STRING || value_size < 5) return std::nullopt;
    const int32_t len = WireBuffer::read_int32(value);
    if (len < 1) return std::nullopt;
    // Length counts the trailing NUL
    return std::string_view(reinterpret_cast<const char*>(value + 4),
                            static_cast<size_t>(len) - 1);
}

std::optional<int64_t> BsonElement::as_int64() const {
    switch (type) {
        case BsonType::INT32:
            return WireBuffer::read_int32(value);
        case BsonType::INT64:
            return WireBuffer::read_int64(value);
        case BsonType::DOUBLE: {
            const double d = WireBuffer::read_double(value);
            if (std::isfinite(d) && std::trunc(d) == d) {
                return static_cast<int64_t>(d);
            }
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

std::optional<bool> BsonElement::as_bool() const {
    switch (type) {
        case BsonType::BOOLEAN:
            return value[0] != 0;
        case BsonType::INT32:
            return WireBuffer::read_int32(value) != 0;
        case BsonType::INT64:
            return WireBuffer::read_int64(value) != 0;
        case BsonType::DOUBLE:
            return WireBuffer::read_double(value) != 0.0;
        default:
            return std::nullopt;
    }
}

std::optional<BsonDocument> BsonElement::as_document() const {
    if (type != BsonType::DOCUMENT && type != BsonType::ARRAY) return std::nullopt;
    return BsonDocument::parse(value, value_size);
}

// ============================================================================
// BsonDocument
// ============================================================================

std::optional<BsonDocument> BsonDocument::parse(const uint8_t* data, size_t available) {
    if (data == nullptr || available < 5) return std::nullopt;
    const int32_t len = WireBuffer::read_int32(data);
    if (len < 5 || static_cast<size_t>(len) > available) return std::nullopt;
    if (data[len - 1] != 0) return std::nullopt;
    return BsonDocument(data, static_cast<size_t>(len));
}

std::optional<BsonElement> BsonDocument::element_at(size_t offset, size_t& next) const {
    // Last byte is the document terminator
    if (offset >= size_ - 1) return std::nullopt;

    const auto type = static_cast<BsonType>(data_[offset]);
    const size_t key_start = offset + 1;
    const auto* nul = static_cast<const uint8_t*>(
        std::memchr(data_ + key_start, 0, size_ - 1 - key_start));
    if (!nul) return std::nullopt;

    const size_t key_len = static_cast<size_t>(nul - (data_ + key_start));
    const size_t value_start = key_start + key_len + 1;
    const auto len = value_length(type, data_ + value_start, size_ - 1 - value_start);
    if (!len) return std::nullopt;

    BsonElement element;
    element.type = type;
    element.key = std::string_view(reinterpret_cast<const char*>(data_ + key_start), key_len);
    element.value = data_ + value_start;
    element.value_size = *len;
    next = value_start + *len;
    return element;
}

std::optional<BsonElement> BsonDocument::first() const {
    size_t next = 0;
    return element_at(4, next);
}

std::optional<BsonElement> BsonDocument::find(std::string_view key) const {
    size_t offset = 4;
    size_t next = 0;
    while (auto element = element_at(offset, next)) {
        if (element->key == key) return element;
        offset = next;
    }
    return std::nullopt;
}

std::vector<BsonElement> BsonDocument::elements() const {
    std::vector<BsonElement> result;
    size_t offset = 4;
    size_t next = 0;
    while (auto element = element_at(offset, next)) {
        result.push_back(*element);
        offset = next;
    }
    return result;
}

// ============================================================================
// BsonBuilder
// ============================================================================

BsonBuilder::BsonBuilder() {
    data_.reserve(64);
    data_.resize(4, 0);  // length, patched in finish()
}

void BsonBuilder::append_key(BsonType type, std::string_view key) {
    data_.push_back(static_cast<uint8_t>(type));
    data_.insert(data_.end(), key.begin(), key.end());
    data_.push_back(0);
}

BsonBuilder& BsonBuilder::append_double(std::string_view key, double value) {
    append_key(BsonType::DOUBLE, key);
    WireBuffer buf;
    buf.write_double(value);
    data_.insert(data_.end(), buf.data().begin(), buf.data().end());
    return *this;
}

BsonBuilder& BsonBuilder::append_string(std::string_view key, std::string_view value) {
    append_key(BsonType::STRING, key);
    WireBuffer buf;
    buf.write_int32(static_cast<int32_t>(value.size() + 1));
    buf.write_cstring(value);
    data_.insert(data_.end(), buf.data().begin(), buf.data().end());
    return *this;
}

BsonBuilder& BsonBuilder::append_document(std::string_view key, const std::vector<uint8_t>& doc) {
    append_key(BsonType::DOCUMENT, key);
    data_.insert(data_.end(), doc.begin(), doc.end());
    return *this;
}

BsonBuilder& BsonBuilder::append_array(std::string_view key, const std::vector<uint8_t>& array_doc) {
    append_key(BsonType::ARRAY, key);
    data_.insert(data_.end(), array_doc.begin(), array_doc.end());
    return *this;
}

BsonBuilder& BsonBuilder::append_bool(std::string_view key, bool value) {
    append_key(BsonType::BOOLEAN, key);
    data_.push_back(value ? 1 : 0);
    return *this;
}

BsonBuilder& BsonBuilder::append_null(std::string_view key) {
    append_key(BsonType::NULL_VALUE, key);
    return *this;
}

BsonBuilder& BsonBuilder::append_int32(std::string_view key, int32_t value) {
    append_key(BsonType::INT32, key);
    WireBuffer buf;
    buf.write_int32(value);
    data_.insert(data_.end(), buf.data().begin(), buf.data().end());
    return *this;
}

BsonBuilder& BsonBuilder::append_int64(std::string_view key, int64_t value) {
    append_key(BsonType::INT64, key);
    WireBuffer buf;
    buf.write_int64(value);
    data_.insert(data_.end(), buf.data().begin(), buf.data().end());
    return *this;
}

BsonBuilder& BsonBuilder::append_string_array(std::string_view key,
                                              const std::vector<std::string>& values) {
    BsonBuilder array;
    for (size_t i = 0; i < values.size(); ++i) {
        array.append_string(std::to_string(i), values[i]);
    }
    return append_array(key, array.finish());
}

BsonBuilder& BsonBuilder::append_document_array(std::string_view key,
                                                const std::vector<std::vector<uint8_t>>& docs) {
    BsonBuilder array;
    for (size_t i = 0; i < docs.size(); ++i) {
        array.append_document(std::to_string(i), docs[i]);
    }
    return append_array(key, array.finish());
}

std::vector<uint8_t> BsonBuilder::finish() {
    data_.push_back(0);
    const auto len = static_cast<uint32_t>(data_.size());
    data_[0] = static_cast<uint8_t>(len & 0xFF);
    data_[1] = static_cast<uint8_t>((len >> 8) & 0xFF);
    data_[2] = static_cast<uint8_t>((len >> 16) & 0xFF);
    data_[3] = static_cast<uint8_t>((len >> 24) & 0xFF);

    std::vector<uint8_t> result = std::move(data_);
    data_.clear();
    data_.resize(4, 0);
    return result;
}

} // namespace rsproxy
