#include "topology/member_prober.hpp"
#include "core/utils.hpp"
#include "server/bson.hpp"
#include "server/message_framer.hpp"
#include "server/op_classifier.hpp"
#include "server/socket.hpp"

#include <format>

namespace rsproxy {

namespace {

void append_hosts(const BsonDocument& doc, std::string_view key, std::vector<std::string>& out) {
    const auto element = doc.find(key);
    if (!element) return;
    const auto array = element->as_document();
    if (!array) return;
    for (const auto& entry : array->elements()) {
        if (const auto host = entry.as_string()) {
            out.emplace_back(*host);
        }
    }
}

} // namespace

Message WireMemberProber::build_request(int32_t request_id) {
    BsonBuilder cmd;
    cmd.append_int32("isMaster", 1);
    cmd.append_string("$db", "admin");
    return WireWriter::op_msg(request_id, 0, 0, cmd.finish());
}

Result<ProbeReply> WireMemberProber::parse_reply(const Message& reply) {
    std::optional<BsonDocument> doc;
    if (reply.header.op_code == wire::OP_MSG) {
        doc = OpClassifier::op_msg_body(reply);
    } else if (reply.header.op_code == wire::OP_REPLY && reply.body_size() > 20) {
        // responseFlags(4) cursorID(8) startingFrom(4) numberReturned(4) documents
        doc = BsonDocument::parse(reply.body() + 20, reply.body_size() - 20);
    }
    if (!doc) {
        return Result<ProbeReply>::error(ErrorCategory::BACKEND_UNREACHABLE,
            std::format("Unparseable isMaster reply ({})", wire::opcode_name(reply.header.op_code)));
    }

    const auto ok = doc->find("ok");
    if (!ok || !ok->as_bool().value_or(false)) {
        std::string errmsg = "isMaster failed";
        if (const auto msg = doc->find("errmsg")) {
            if (const auto s = msg->as_string()) errmsg = std::string(*s);
        }
        return Result<ProbeReply>::error(ErrorCategory::BACKEND_UNREACHABLE, errmsg);
    }

    ProbeReply result;
    // Newer servers answer both; either one set means writable primary
    if (const auto e = doc->find("isWritablePrimary")) {
        result.is_primary = e->as_bool().value_or(false);
    }
    if (const auto e = doc->find("ismaster")) {
        result.is_primary = result.is_primary || e->as_bool().value_or(false);
    }
    if (const auto e = doc->find("secondary")) {
        result.is_secondary = e->as_bool().value_or(false);
    }
    if (const auto e = doc->find("setName")) {
        result.set_name = std::string(e->as_string().value_or(""));
    }
    if (const auto e = doc->find("me")) {
        result.me = std::string(e->as_string().value_or(""));
    }
    append_hosts(*doc, "hosts", result.hosts);
    append_hosts(*doc, "passives", result.hosts);
    return Result<ProbeReply>::ok(std::move(result));
}

Result<ProbeReply> WireMemberProber::probe(const std::string& address,
                                           std::chrono::milliseconds timeout) {
    utils::Timer timer;

    auto conn = Socket::connect_tcp(address, timeout);
    if (conn.is_error()) {
        return Result<ProbeReply>::error(ErrorCategory::BACKEND_UNREACHABLE, conn.error_message());
    }
    Socket& sock = conn.value();
    sock.set_receive_timeout(timeout);
    sock.set_send_timeout(timeout);

    const auto request = build_request(WireWriter::next_request_id());
    if (!sock.write_all(request.bytes.data(), request.bytes.size()).ok()) {
        return Result<ProbeReply>::error(ErrorCategory::BACKEND_UNREACHABLE,
            std::format("Failed to send isMaster to {}", address));
    }

    MessageFramer framer(max_message_bytes_);
    auto reply = framer.next(sock);
    if (reply.is_error()) {
        return Result<ProbeReply>::error(ErrorCategory::BACKEND_UNREACHABLE,
            std::format("isMaster to {}: {}", address, reply.error_message()));
    }
    if (reply.value().header.response_to != request.header.request_id) {
        return Result<ProbeReply>::error(ErrorCategory::PROTOCOL_DESYNC,
            std::format("isMaster reply from {} answers request {} instead of {}",
                        address, reply.value().header.response_to, request.header.request_id));
    }

    auto parsed = parse_reply(reply.value());
    if (parsed.is_ok()) {
        parsed.value().rtt = timer.elapsed_us();
    }
    return parsed;
}

} // namespace rsproxy
