#include <catch2/catch_test_macros.hpp>
#include "server/bson.hpp"
#include "server/op_classifier.hpp"
#include "server/wire_compression.hpp"
#include "server/wire_protocol.hpp"

using namespace rsproxy;

namespace {

Message op_msg(BsonBuilder body, uint32_t flags = 0) {
    return WireWriter::op_msg(1, 0, flags, body.finish());
}

BsonBuilder command(std::string_view name) {
    BsonBuilder b;
    b.append_string(name, "users");
    b.append_string("$db", "test");
    return b;
}

std::vector<uint8_t> read_pref(std::string_view mode) {
    BsonBuilder pref;
    pref.append_string("mode", mode);
    return pref.finish();
}

Message legacy(int32_t op_code) {
    WireBuffer buf;
    buf.write_int32(0);
    buf.write_int32(3);
    buf.write_int32(0);
    buf.write_int32(op_code);
    buf.write_int32(0);
    buf.write_cstring("test.users");
    buf.patch_int32(0, static_cast<int32_t>(buf.size()));
    Message msg;
    msg.bytes = buf.take();
    msg.header = WireWriter::parse_header(msg.bytes.data());
    return msg;
}

Message squeeze(const Message& msg, uint8_t compressor) {
    auto packed = WireCompression::compress(msg, compressor);
    REQUIRE(packed.is_ok());
    return packed.value();
}

/// OP_COMPRESSED envelope around bytes that cannot be opened here
Message opaque_envelope(uint8_t compressor) {
    WireBuffer buf;
    buf.write_int32(0);
    buf.write_int32(4);
    buf.write_int32(0);
    buf.write_int32(wire::OP_COMPRESSED);
    buf.write_int32(wire::OP_MSG);
    buf.write_int32(64);
    buf.write_byte(compressor);
    for (int i = 0; i < 16; ++i) buf.write_byte(0xAB);
    buf.patch_int32(0, static_cast<int32_t>(buf.size()));
    Message msg;
    msg.bytes = buf.take();
    msg.header = WireWriter::parse_header(msg.bytes.data());
    return msg;
}

} // namespace

// ============================================================================
// OP_MSG
// ============================================================================

TEST_CASE("OpClassifier: find is a primary read by default", "[classifier]") {
    const auto op = OpClassifier::classify(op_msg(command("find")));
    CHECK(op.command == "find");
    CHECK(op.route == RouteClass::READ);
    CHECK_FALSE(op.secondary_ok);
    CHECK(op.may_open_cursor);
    CHECK(op.expects_response);
    CHECK(op.primary_bound());
}

TEST_CASE("OpClassifier: non-primary read preference allows secondaries", "[classifier]") {
    for (const auto* mode : {"secondary", "secondaryPreferred", "nearest", "primaryPreferred"}) {
        auto b = command("count");
        b.append_document("$readPreference", read_pref(mode));
        const auto op = OpClassifier::classify(op_msg(std::move(b)));
        CHECK(op.route == RouteClass::READ);
        CHECK(op.secondary_ok);
        CHECK_FALSE(op.primary_bound());
    }
}

TEST_CASE("OpClassifier: explicit primary read preference stays on primary", "[classifier]") {
    auto b = command("find");
    b.append_document("$readPreference", read_pref("primary"));
    const auto op = OpClassifier::classify(op_msg(std::move(b)));
    CHECK_FALSE(op.secondary_ok);
    CHECK(op.primary_bound());
}

TEST_CASE("OpClassifier: unknown commands are writes", "[classifier]") {
    for (const auto* name : {"insert", "update", "delete", "createIndexes", "drop", "someNewCommand"}) {
        const auto op = OpClassifier::classify(op_msg(command(name)));
        CHECK(op.route == RouteClass::WRITE);
        CHECK(op.primary_bound());
    }
}

TEST_CASE("OpClassifier: writes ignore read preference", "[classifier]") {
    auto b = command("insert");
    b.append_document("$readPreference", read_pref("secondary"));
    const auto op = OpClassifier::classify(op_msg(std::move(b)));
    CHECK(op.route == RouteClass::WRITE);
    CHECK(op.primary_bound());
}

TEST_CASE("OpClassifier: aggregate with $out or $merge is a write", "[classifier]") {
    BsonBuilder match;
    match.append_document("$match", BsonBuilder().finish());
    BsonBuilder out;
    out.append_string("$out", "archive");

    auto b = command("aggregate");
    b.append_document_array("pipeline", {match.finish(), out.finish()});
    b.append_document("$readPreference", read_pref("secondary"));
    const auto op = OpClassifier::classify(op_msg(std::move(b)));
    CHECK(op.route == RouteClass::WRITE);
    CHECK_FALSE(op.secondary_ok);
    CHECK(op.may_open_cursor);
}

TEST_CASE("OpClassifier: getMore and killCursors require affinity", "[classifier]") {
    for (const auto* name : {"getMore", "killCursors"}) {
        const auto op = OpClassifier::classify(op_msg(command(name)));
        CHECK(op.requires_affinity);
        CHECK_FALSE(op.establishes_affinity);
        CHECK(op.expects_response);
    }
}

TEST_CASE("OpClassifier: getLastError requires affinity", "[classifier]") {
    const auto op = OpClassifier::classify(op_msg(command("getLastError")));
    CHECK(op.requires_affinity);
}

TEST_CASE("OpClassifier: transaction statements pin to the primary", "[classifier]") {
    auto b = command("find");
    b.append_bool("autocommit", false);
    b.append_document("$readPreference", read_pref("secondary"));
    const auto op = OpClassifier::classify(op_msg(std::move(b)));
    CHECK(op.requires_affinity);
    CHECK(op.establishes_affinity);
    CHECK(op.primary_bound());
}

TEST_CASE("OpClassifier: moreToCome expects no response", "[classifier]") {
    const auto op = OpClassifier::classify(op_msg(command("insert"), wire::MSG_MORE_TO_COME));
    CHECK_FALSE(op.expects_response);
}

TEST_CASE("OpClassifier: unparseable OP_MSG is a write", "[classifier]") {
    auto msg = op_msg(command("find"));
    msg.bytes.resize(wire::HEADER_SIZE + 6);
    const auto op = OpClassifier::classify(msg);
    CHECK(op.route == RouteClass::WRITE);
}

TEST_CASE("OpClassifier: body after a document sequence section", "[classifier]") {
    BsonBuilder doc;
    doc.append_int32("_id", 1);
    const auto seq_doc = doc.finish();
    const auto body = command("insert").finish();

    WireBuffer buf;
    buf.write_int32(0);
    buf.write_int32(5);
    buf.write_int32(0);
    buf.write_int32(wire::OP_MSG);
    buf.write_uint32(0);
    buf.write_byte(wire::SECTION_DOCUMENT_SEQUENCE);
    buf.write_int32(static_cast<int32_t>(4 + 10 + seq_doc.size()));
    buf.write_cstring("documents");
    buf.write_bytes(seq_doc);
    buf.write_byte(wire::SECTION_BODY);
    buf.write_bytes(body);
    buf.patch_int32(0, static_cast<int32_t>(buf.size()));

    Message msg;
    msg.bytes = buf.take();
    msg.header = WireWriter::parse_header(msg.bytes.data());

    const auto op = OpClassifier::classify(msg);
    CHECK(op.command == "insert");
    CHECK(op.route == RouteClass::WRITE);
}

// ============================================================================
// OP_QUERY
// ============================================================================

TEST_CASE("OpClassifier: OP_QUERY command unwraps $query", "[classifier]") {
    BsonBuilder inner;
    inner.append_string("count", "users");
    BsonBuilder wrapped;
    wrapped.append_document("$query", inner.finish());
    wrapped.append_document("$readPreference", read_pref("secondaryPreferred"));

    const auto msg = WireWriter::op_query(1, 0, "test.$cmd", 0, -1, wrapped.finish());
    const auto op = OpClassifier::classify(msg);
    CHECK(op.command == "count");
    CHECK(op.route == RouteClass::READ);
    CHECK(op.secondary_ok);
}

TEST_CASE("OpClassifier: OP_QUERY SecondaryOk flag", "[classifier]") {
    BsonBuilder q;
    q.append_int32("isMaster", 1);

    const auto plain = OpClassifier::classify(WireWriter::op_query(1, 0, "admin.$cmd", 0, -1, q.finish()));
    CHECK_FALSE(plain.secondary_ok);

    BsonBuilder q2;
    q2.append_int32("isMaster", 1);
    const auto flagged = OpClassifier::classify(
        WireWriter::op_query(1, wire::QUERY_SECONDARY_OK, "admin.$cmd", 0, -1, q2.finish()));
    CHECK(flagged.secondary_ok);
}

TEST_CASE("OpClassifier: OP_QUERY write command", "[classifier]") {
    BsonBuilder q;
    q.append_string("insert", "users");
    const auto op = OpClassifier::classify(
        WireWriter::op_query(1, wire::QUERY_SECONDARY_OK, "test.$cmd", 0, -1, q.finish()));
    CHECK(op.route == RouteClass::WRITE);
    CHECK_FALSE(op.secondary_ok);
}

TEST_CASE("OpClassifier: OP_QUERY on a collection is a cursor-opening find", "[classifier]") {
    BsonBuilder q;
    q.append_string("name", "abc");
    const auto op = OpClassifier::classify(
        WireWriter::op_query(1, 0, "test.users", 0, 0, q.finish()));
    CHECK(op.command == "find");
    CHECK(op.route == RouteClass::READ);
    CHECK(op.may_open_cursor);
}

// ============================================================================
// Legacy opcodes
// ============================================================================

TEST_CASE("OpClassifier: legacy writes expect nothing and establish affinity", "[classifier]") {
    for (const int32_t code : {wire::OP_INSERT, wire::OP_UPDATE, wire::OP_DELETE}) {
        const auto op = OpClassifier::classify(legacy(code));
        CHECK(op.route == RouteClass::WRITE);
        CHECK_FALSE(op.expects_response);
        CHECK(op.establishes_affinity);
    }
}

TEST_CASE("OpClassifier: legacy cursor ops require affinity", "[classifier]") {
    const auto get_more = OpClassifier::classify(legacy(wire::OP_GET_MORE));
    CHECK(get_more.requires_affinity);
    CHECK(get_more.expects_response);

    const auto kill = OpClassifier::classify(legacy(wire::OP_KILL_CURSORS));
    CHECK(kill.requires_affinity);
    CHECK_FALSE(kill.expects_response);
}

TEST_CASE("OpClassifier: undecodable OP_COMPRESSED goes to the primary with affinity", "[classifier][compression]") {
    for (const auto& msg : {legacy(wire::OP_COMPRESSED), opaque_envelope(wire::COMPRESSOR_SNAPPY),
                            opaque_envelope(wire::COMPRESSOR_ZSTD)}) {
        const auto op = OpClassifier::classify(msg);
        CHECK(op.primary_bound());
        CHECK(op.requires_affinity);
        CHECK(op.establishes_affinity);
        CHECK(op.expects_response);
    }
}

TEST_CASE("OpClassifier: compressed moreToCome write expects no response", "[classifier][compression]") {
    const auto plain = op_msg(command("insert"), wire::MSG_MORE_TO_COME);
    for (const uint8_t compressor : {wire::COMPRESSOR_NOOP, wire::COMPRESSOR_ZLIB}) {
        const auto msg = squeeze(plain, compressor);
        const auto op = OpClassifier::classify(msg);
        CHECK(op.command == "insert");
        CHECK(op.route == RouteClass::WRITE);
        CHECK_FALSE(op.expects_response);
        CHECK(OpClassifier::has_more_to_come(msg));
    }
}

TEST_CASE("OpClassifier: compressed read keeps its read preference", "[classifier][compression]") {
    auto b = command("find");
    b.append_document("$readPreference", read_pref("secondaryPreferred"));
    const auto op = OpClassifier::classify(squeeze(op_msg(std::move(b)), wire::COMPRESSOR_ZLIB));
    CHECK(op.command == "find");
    CHECK(op.route == RouteClass::READ);
    CHECK(op.secondary_ok);
    CHECK(op.expects_response);
    CHECK_FALSE(op.requires_affinity);
}

// ============================================================================
// Replies
// ============================================================================

TEST_CASE("OpClassifier: cursor id from OP_MSG reply", "[classifier]") {
    BsonBuilder cursor;
    cursor.append_int64("id", 987654321);
    cursor.append_string("ns", "test.users");
    BsonBuilder body;
    body.append_document("cursor", cursor.finish());
    body.append_double("ok", 1.0);

    CHECK(OpClassifier::reply_cursor_id(op_msg(std::move(body))) == 987654321);

    BsonBuilder plain;
    plain.append_double("ok", 1.0);
    CHECK(OpClassifier::reply_cursor_id(op_msg(std::move(plain))) == 0);
}

TEST_CASE("OpClassifier: cursor id from OP_REPLY", "[classifier]") {
    BsonBuilder doc;
    doc.append_string("name", "abc");
    const auto reply = WireWriter::op_reply(2, 1, 0, 555, doc.finish());
    CHECK(OpClassifier::reply_cursor_id(reply) == 555);
}

TEST_CASE("OpClassifier: cursor id from a compressed reply", "[classifier][compression]") {
    BsonBuilder cursor;
    cursor.append_int64("id", 31337);
    BsonBuilder body;
    body.append_document("cursor", cursor.finish());
    body.append_double("ok", 1.0);
    const auto reply = squeeze(op_msg(std::move(body), wire::MSG_MORE_TO_COME), wire::COMPRESSOR_ZLIB);

    CHECK(OpClassifier::reply_cursor_id(reply) == 31337);
    CHECK(OpClassifier::has_more_to_come(reply));
}

TEST_CASE("OpClassifier: read command table", "[classifier]") {
    CHECK(OpClassifier::is_read_command("listDatabases"));
    CHECK(OpClassifier::is_read_command("hello"));
    CHECK_FALSE(OpClassifier::is_read_command("findAndModify"));
    CHECK_FALSE(OpClassifier::is_read_command("mapReduce"));
}
