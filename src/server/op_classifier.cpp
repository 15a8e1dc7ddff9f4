#include "server/op_classifier.hpp"
#include "server/wire_compression.hpp"

#include <cstring>

namespace rsproxy {

namespace {

// Commands that never modify data. Anything not listed is treated as a write.
constexpr std::string_view kReadCommands[] = {
    "find", "aggregate", "count", "distinct",
    "listCollections", "listIndexes", "listDatabases",
    "dbStats", "dbstats", "collStats", "collstats",
    "isMaster", "ismaster", "hello", "ping", "buildInfo", "buildinfo",
    "serverStatus", "explain", "getParameter", "connectionStatus",
    "hostInfo", "whatsmyuri", "getLog", "listCommands", "features",
    "dataSize", "geoNear", "geoSearch", "getCmdLineOpts", "replSetGetStatus"
};

constexpr std::string_view kCursorOpeningCommands[] = {
    "find", "aggregate", "listCollections", "listIndexes"
};

bool contains(std::string_view name, const auto& set) {
    for (const auto& entry : set) {
        if (entry == name) return true;
    }
    return false;
}

// $readPreference: { mode: "..." } with anything but "primary" allows secondaries
bool read_preference_allows_secondary(const BsonDocument& doc) {
    const auto pref = doc.find("$readPreference");
    if (!pref) return false;
    const auto pref_doc = pref->as_document();
    if (!pref_doc) return false;
    const auto mode = pref_doc->find("mode");
    if (!mode) return false;
    const auto mode_str = mode->as_string();
    return mode_str && *mode_str != "primary";
}

} // namespace

bool OpClassifier::is_read_command(std::string_view name) {
    return contains(name, kReadCommands);
}

std::optional<BsonDocument> OpClassifier::op_msg_body(const Message& msg) {
    if (msg.header.op_code != wire::OP_MSG || msg.body_size() < 5) return std::nullopt;

    const uint8_t* p = msg.body();
    size_t remaining = msg.body_size();
    const uint32_t flags = WireBuffer::read_uint32(p);
    p += 4;
    remaining -= 4;
    if (flags & wire::MSG_CHECKSUM_PRESENT) {
        if (remaining < 4) return std::nullopt;
        remaining -= 4;
    }

    while (remaining > 0) {
        const uint8_t kind = *p++;
        --remaining;
        if (kind == wire::SECTION_BODY) {
            return BsonDocument::parse(p, remaining);
        }
        if (kind != wire::SECTION_DOCUMENT_SEQUENCE || remaining < 4) {
            return std::nullopt;
        }
        const int32_t size = WireBuffer::read_int32(p);
        if (size < 4 || static_cast<size_t>(size) > remaining) return std::nullopt;
        p += size;
        remaining -= static_cast<size_t>(size);
    }
    return std::nullopt;
}

void OpClassifier::classify_command(const BsonDocument& body, OpClassification& out) {
    const auto first = body.first();
    if (!first) {
        out.command = "<empty>";
        return;
    }

    out.command = std::string(first->key);
    const std::string_view name = first->key;

    if (name == "getMore" || name == "killCursors") {
        out.route = RouteClass::READ;
        out.requires_affinity = true;
        return;
    }
    if (name == "getLastError" || name == "getlasterror" || name == "getPrevError") {
        out.route = RouteClass::READ;
        out.requires_affinity = true;
        return;
    }

    // Multi-document transactions: every statement carries autocommit:false,
    // commitTransaction/abortTransaction included
    if (body.has("autocommit")) {
        out.route = is_read_command(name) ? RouteClass::READ : RouteClass::WRITE;
        out.requires_affinity = true;
        out.establishes_affinity = true;
        return;
    }

    if (is_read_command(name)) {
        out.route = RouteClass::READ;
        out.secondary_ok = read_preference_allows_secondary(body);
        out.may_open_cursor = contains(name, kCursorOpeningCommands);
        // aggregate with $out/$merge writes; it still opens a cursor
        if (name == "aggregate") {
            const auto pipeline = body.find("pipeline");
            if (pipeline) {
                if (const auto stages = pipeline->as_document()) {
                    for (const auto& stage : stages->elements()) {
                        const auto stage_doc = stage.as_document();
                        if (stage_doc && (stage_doc->has("$out") || stage_doc->has("$merge"))) {
                            out.route = RouteClass::WRITE;
                            out.secondary_ok = false;
                        }
                    }
                }
            }
        }
        return;
    }

    out.route = RouteClass::WRITE;
}

void OpClassifier::classify_op_msg(const Message& msg, OpClassification& out) {
    if (msg.msg_flags() & wire::MSG_MORE_TO_COME) {
        out.expects_response = false;
    }

    const auto body = op_msg_body(msg);
    if (!body) {
        out.command = "<unparsed OP_MSG>";
        out.route = RouteClass::WRITE;
        return;
    }
    classify_command(*body, out);
}

void OpClassifier::classify_op_query(const Message& msg, OpClassification& out) {
    // flags(4) fullCollectionName(cstring) numberToSkip(4) numberToReturn(4) query
    if (msg.body_size() < 4 + 1 + 8 + 5) {
        out.command = "<short OP_QUERY>";
        return;
    }
    const uint8_t* p = msg.body();
    const int32_t flags = WireBuffer::read_int32(p);
    const char* ns_start = reinterpret_cast<const char*>(p + 4);
    const size_t ns_max = msg.body_size() - 4;
    const auto* nul = static_cast<const char*>(std::memchr(ns_start, 0, ns_max));
    if (!nul) {
        out.command = "<short OP_QUERY>";
        return;
    }
    const std::string_view ns(ns_start, static_cast<size_t>(nul - ns_start));
    const size_t query_offset = 4 + ns.size() + 1 + 8;
    if (query_offset >= msg.body_size()) {
        out.command = "<short OP_QUERY>";
        return;
    }
    const auto query = BsonDocument::parse(p + query_offset, msg.body_size() - query_offset);
    const bool secondary_flag = (flags & wire::QUERY_SECONDARY_OK) != 0;

    const auto dot = ns.find('.');
    const std::string_view collection = dot == std::string_view::npos ? ns : ns.substr(dot + 1);

    if (collection == "$cmd") {
        if (!query) {
            out.command = "<unparsed command>";
            return;
        }
        // Drivers wrap commands as {$query: {...}, $readPreference: {...}}
        std::optional<BsonDocument> command = query;
        if (const auto wrapped = query->find("$query")) {
            if (auto inner = wrapped->as_document()) command = inner;
        }
        classify_command(*command, out);
        if (out.route == RouteClass::READ && !out.requires_affinity) {
            out.secondary_ok = secondary_flag || read_preference_allows_secondary(*query)
                || read_preference_allows_secondary(*command);
        }
        return;
    }

    // Legacy find against a collection
    out.command = "find";
    out.route = RouteClass::READ;
    out.may_open_cursor = true;
    out.secondary_ok = secondary_flag || (query && read_preference_allows_secondary(*query));
}

OpClassification OpClassifier::classify(const Message& msg) {
    OpClassification out;
    out.command = wire::opcode_name(msg.header.op_code);

    switch (msg.header.op_code) {
        case wire::OP_MSG:
            classify_op_msg(msg, out);
            break;
        case wire::OP_QUERY:
            classify_op_query(msg, out);
            break;
        case wire::OP_INSERT:
        case wire::OP_UPDATE:
        case wire::OP_DELETE:
            out.route = RouteClass::WRITE;
            out.expects_response = false;
            out.establishes_affinity = true;
            break;
        case wire::OP_GET_MORE:
            out.route = RouteClass::READ;
            out.requires_affinity = true;
            break;
        case wire::OP_KILL_CURSORS:
            out.route = RouteClass::READ;
            out.requires_affinity = true;
            out.expects_response = false;
            break;
        case wire::OP_COMPRESSED: {
            // noop and zlib: route by the message inside, moreToCome included
            auto original = WireCompression::decompress(msg);
            if (original.is_ok()) {
                out = classify(original.value());
                break;
            }
            // snappy/zstd stay opaque and are assumed to be answered
            out.route = RouteClass::WRITE;
            out.requires_affinity = true;
            out.establishes_affinity = true;
            break;
        }
        default:
            out.route = RouteClass::WRITE;
            break;
    }
    return out;
}

bool OpClassifier::has_more_to_come(const Message& msg) {
    if (msg.header.op_code == wire::OP_COMPRESSED) {
        auto original = WireCompression::decompress(msg);
        return original.is_ok() && has_more_to_come(original.value());
    }
    return (msg.msg_flags() & wire::MSG_MORE_TO_COME) != 0;
}

int64_t OpClassifier::reply_cursor_id(const Message& reply) {
    if (reply.header.op_code == wire::OP_COMPRESSED) {
        auto original = WireCompression::decompress(reply);
        return original.is_ok() ? reply_cursor_id(original.value()) : 0;
    }

    if (reply.header.op_code == wire::OP_REPLY) {
        // responseFlags(4) cursorID(8)
        if (reply.body_size() < 12) return 0;
        return WireBuffer::read_int64(reply.body() + 4);
    }

    if (reply.header.op_code == wire::OP_MSG) {
        const auto body = op_msg_body(reply);
        if (!body) return 0;
        const auto cursor = body->find("cursor");
        if (!cursor) return 0;
        const auto cursor_doc = cursor->as_document();
        if (!cursor_doc) return 0;
        const auto id = cursor_doc->find("id");
        if (!id) return 0;
        return id->as_int64().value_or(0);
    }
    return 0;
}

} // namespace rsproxy
