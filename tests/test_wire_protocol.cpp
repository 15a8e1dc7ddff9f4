#include <catch2/catch_test_macros.hpp>
#include "server/bson.hpp"
#include "server/op_classifier.hpp"
#include "server/wire_protocol.hpp"

using namespace rsproxy;

// ============================================================================
// Opcodes
// ============================================================================

TEST_CASE("Wire protocol: known opcodes", "[wire]") {
    REQUIRE(wire::is_known_opcode(wire::OP_MSG));
    REQUIRE(wire::is_known_opcode(wire::OP_QUERY));
    REQUIRE(wire::is_known_opcode(wire::OP_REPLY));
    REQUIRE(wire::is_known_opcode(wire::OP_COMPRESSED));
    REQUIRE_FALSE(wire::is_known_opcode(0));
    REQUIRE_FALSE(wire::is_known_opcode(2010));
    REQUIRE(std::string(wire::opcode_name(wire::OP_KILL_CURSORS)) == "OP_KILL_CURSORS");
    REQUIRE(std::string(wire::opcode_name(42)) == "UNKNOWN");
}

// ============================================================================
// WireBuffer
// ============================================================================

TEST_CASE("WireBuffer: little-endian int32", "[wire]") {
    WireBuffer buf;
    buf.write_int32(0x01020304);
    REQUIRE(buf.size() == 4);
    REQUIRE(buf.data()[0] == 0x04);
    REQUIRE(buf.data()[3] == 0x01);
    REQUIRE(WireBuffer::read_int32(buf.data().data()) == 0x01020304);
}

TEST_CASE("WireBuffer: int64 and double", "[wire]") {
    WireBuffer buf;
    buf.write_int64(-5000000000LL);
    buf.write_double(2.5);
    REQUIRE(buf.size() == 16);
    REQUIRE(WireBuffer::read_int64(buf.data().data()) == -5000000000LL);
    REQUIRE(WireBuffer::read_double(buf.data().data() + 8) == 2.5);
}

TEST_CASE("WireBuffer: cstring is null-terminated", "[wire]") {
    WireBuffer buf;
    buf.write_cstring("admin.$cmd");
    REQUIRE(buf.size() == 11);
    REQUIRE(buf.data().back() == 0);
}

TEST_CASE("WireBuffer: patch_int32 overwrites in place", "[wire]") {
    WireBuffer buf;
    buf.write_int32(0);
    buf.write_int32(7);
    buf.patch_int32(0, 99);
    REQUIRE(WireBuffer::read_int32(buf.data().data()) == 99);
    REQUIRE(WireBuffer::read_int32(buf.data().data() + 4) == 7);
}

// ============================================================================
// WireWriter - message builders
// ============================================================================

TEST_CASE("WireWriter: op_msg header matches its bytes", "[wire]") {
    BsonBuilder body;
    body.append_int32("ping", 1);
    const auto msg = WireWriter::op_msg(17, 0, 0, body.finish());

    REQUIRE(msg.header.op_code == wire::OP_MSG);
    REQUIRE(msg.header.request_id == 17);
    REQUIRE(static_cast<size_t>(msg.header.message_length) == msg.bytes.size());

    const auto parsed = WireWriter::parse_header(msg.bytes.data());
    REQUIRE(parsed.message_length == msg.header.message_length);
    REQUIRE(parsed.request_id == 17);
    REQUIRE(parsed.response_to == 0);
    REQUIRE(parsed.op_code == wire::OP_MSG);
}

TEST_CASE("WireWriter: op_msg flags are readable", "[wire]") {
    BsonBuilder body;
    body.append_double("ok", 1.0);
    const auto msg = WireWriter::op_msg(1, 0, wire::MSG_MORE_TO_COME, body.finish());
    REQUIRE(msg.msg_flags() == wire::MSG_MORE_TO_COME);
    REQUIRE(OpClassifier::has_more_to_come(msg));
}

TEST_CASE("WireWriter: msg_flags is zero for other opcodes", "[wire]") {
    BsonBuilder doc;
    doc.append_double("ok", 1.0);
    const auto reply = WireWriter::op_reply(1, 2, 0, 0, doc.finish());
    REQUIRE(reply.msg_flags() == 0);
}

TEST_CASE("WireWriter: next_request_id is positive and increasing", "[wire]") {
    const int32_t a = WireWriter::next_request_id();
    const int32_t b = WireWriter::next_request_id();
    REQUIRE(a > 0);
    REQUIRE(b > a);
}

TEST_CASE("WireWriter: error_reply to OP_MSG", "[wire]") {
    BsonBuilder body;
    body.append_int32("insert", 1);
    const auto request = WireWriter::op_msg(55, 0, 0, body.finish());

    const auto reply = WireWriter::error_reply(request, wire::ERR_NOT_WRITABLE_PRIMARY,
                                               "NotWritablePrimary", "no primary");
    REQUIRE(reply.header.op_code == wire::OP_MSG);
    REQUIRE(reply.header.response_to == 55);

    const auto doc = OpClassifier::op_msg_body(reply);
    REQUIRE(doc.has_value());
    REQUIRE(doc->find("ok")->as_int64() == 0);
    REQUIRE(doc->find("code")->as_int64() == wire::ERR_NOT_WRITABLE_PRIMARY);
    REQUIRE(doc->find("codeName")->as_string() == "NotWritablePrimary");
    REQUIRE(doc->find("errmsg")->as_string() == "no primary");
}

TEST_CASE("WireWriter: error_reply to OP_QUERY sets QueryFailure", "[wire]") {
    BsonBuilder query;
    query.append_int32("count", 1);
    const auto request = WireWriter::op_query(77, 0, "test.$cmd", 0, -1, query.finish());

    const auto reply = WireWriter::error_reply(request, wire::ERR_HOST_UNREACHABLE,
                                               "HostUnreachable", "member down");
    REQUIRE(reply.header.op_code == wire::OP_REPLY);
    REQUIRE(reply.header.response_to == 77);
    REQUIRE((WireBuffer::read_int32(reply.body()) & wire::REPLY_QUERY_FAILURE) != 0);
    REQUIRE(OpClassifier::reply_cursor_id(reply) == 0);

    // responseFlags(4) cursorID(8) startingFrom(4) numberReturned(4)
    const auto doc = BsonDocument::parse(reply.body() + 20, reply.body_size() - 20);
    REQUIRE(doc.has_value());
    REQUIRE(doc->find("$err")->as_string() == "member down");
    REQUIRE(doc->find("code")->as_int64() == wire::ERR_HOST_UNREACHABLE);
}
