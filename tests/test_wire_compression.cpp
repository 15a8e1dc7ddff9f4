#include <catch2/catch_test_macros.hpp>
#include "server/bson.hpp"
#include "server/op_classifier.hpp"
#include "server/wire_compression.hpp"
#include "server/wire_protocol.hpp"

#include <algorithm>
#include <string>

using namespace rsproxy;

namespace {

Message insert_command(uint32_t flags = 0) {
    BsonBuilder body;
    body.append_string("insert", "users");
    body.append_string("$db", "test");
    body.append_string("note", std::string(512, 'z'));
    return WireWriter::op_msg(77, 0, flags, body.finish());
}

Message squeeze(const Message& msg, uint8_t compressor) {
    auto packed = WireCompression::compress(msg, compressor);
    REQUIRE(packed.is_ok());
    return packed.value();
}

} // namespace

TEST_CASE("WireCompression: envelope fields", "[wire][compression]") {
    const auto plain = insert_command();
    const auto packed = squeeze(plain, wire::COMPRESSOR_ZLIB);

    CHECK(packed.header.op_code == wire::OP_COMPRESSED);
    CHECK(packed.header.request_id == plain.header.request_id);

    const auto env = WireCompression::envelope(packed);
    REQUIRE(env.has_value());
    CHECK(env->original_op_code == wire::OP_MSG);
    CHECK(env->uncompressed_size == static_cast<int32_t>(plain.body_size()));
    CHECK(env->compressor_id == wire::COMPRESSOR_ZLIB);

    CHECK_FALSE(WireCompression::envelope(plain).has_value());
}

TEST_CASE("WireCompression: noop and zlib restore the original message", "[wire][compression]") {
    const auto plain = insert_command(wire::MSG_MORE_TO_COME);

    for (const uint8_t compressor : {wire::COMPRESSOR_NOOP, wire::COMPRESSOR_ZLIB}) {
        const auto restored = WireCompression::decompress(squeeze(plain, compressor));
        REQUIRE(restored.is_ok());
        CHECK(restored.value().bytes == plain.bytes);
        CHECK(restored.value().header.op_code == wire::OP_MSG);
    }

    // zlib actually shrinks a repetitive body
    CHECK(squeeze(plain, wire::COMPRESSOR_ZLIB).bytes.size() < plain.bytes.size());
}

TEST_CASE("WireCompression: snappy and zstd cannot be opened", "[wire][compression]") {
    CHECK_FALSE(WireCompression::can_decompress(wire::COMPRESSOR_SNAPPY));
    CHECK_FALSE(WireCompression::can_decompress(wire::COMPRESSOR_ZSTD));
    CHECK(WireCompression::compress(insert_command(), wire::COMPRESSOR_SNAPPY).is_error());

    // Relabel a noop envelope as snappy
    auto packed = squeeze(insert_command(), wire::COMPRESSOR_NOOP);
    packed.bytes[wire::HEADER_SIZE + 8] = wire::COMPRESSOR_SNAPPY;
    const auto result = WireCompression::decompress(packed);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::FRAME_ERROR);
    CHECK(result.error_message().find("snappy") != std::string::npos);
}

TEST_CASE("WireCompression: malformed envelopes are frame errors", "[wire][compression]") {
    const auto plain = insert_command();

    SECTION("noop length disagrees with uncompressedSize") {
        auto packed = squeeze(plain, wire::COMPRESSOR_NOOP);
        WireBuffer size;
        size.write_int32(static_cast<int32_t>(plain.body_size()) + 10);
        std::copy(size.data().begin(), size.data().end(), packed.bytes.begin() + wire::HEADER_SIZE + 4);
        const auto result = WireCompression::decompress(packed);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::FRAME_ERROR);
    }

    SECTION("corrupt zlib stream") {
        auto packed = squeeze(plain, wire::COMPRESSOR_ZLIB);
        for (size_t i = wire::HEADER_SIZE + wire::COMPRESSED_PREFIX_SIZE; i < packed.bytes.size(); ++i) {
            packed.bytes[i] ^= 0x5A;
        }
        const auto result = WireCompression::decompress(packed);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::FRAME_ERROR);
    }

    SECTION("wrapped OP_COMPRESSED") {
        auto packed = squeeze(plain, wire::COMPRESSOR_NOOP);
        WireBuffer op;
        op.write_int32(wire::OP_COMPRESSED);
        std::copy(op.data().begin(), op.data().end(), packed.bytes.begin() + wire::HEADER_SIZE);
        CHECK(WireCompression::decompress(packed).is_error());
    }

    SECTION("uncompressed size over the limit") {
        const auto packed = squeeze(plain, wire::COMPRESSOR_ZLIB);
        CHECK(WireCompression::decompress(packed, 64).is_error());
    }
}

TEST_CASE("WireCompression: error replies take the inner message's shape", "[wire][compression]") {
    SECTION("compressed OP_MSG gets an OP_MSG") {
        const auto request = squeeze(insert_command(), wire::COMPRESSOR_ZLIB);
        const auto reply = WireWriter::error_reply(request, wire::ERR_NETWORK_TIMEOUT,
                                                   "NetworkTimeout", "too slow");
        CHECK(reply.header.op_code == wire::OP_MSG);
        CHECK(reply.header.response_to == request.header.request_id);
        const auto body = OpClassifier::op_msg_body(reply);
        REQUIRE(body.has_value());
        CHECK(body->find("code")->as_int64().value_or(0) == wire::ERR_NETWORK_TIMEOUT);
    }

    SECTION("compressed OP_QUERY gets an OP_REPLY") {
        BsonBuilder query;
        query.append_int32("count", 1);
        const auto plain = WireWriter::op_query(91, 0, "test.$cmd", 0, -1, query.finish());
        const auto request = squeeze(plain, wire::COMPRESSOR_NOOP);
        const auto reply = WireWriter::error_reply(request, wire::ERR_HOST_UNREACHABLE,
                                                   "HostUnreachable", "gone");
        CHECK(reply.header.op_code == wire::OP_REPLY);
        CHECK(reply.header.response_to == 91);
    }
}
