#include "server/message_framer.hpp"

#include <algorithm>
#include <format>

namespace rsproxy {

namespace {

Result<Message> io_error(const IoOutcome& outcome, bool mid_message, const char* what) {
    switch (outcome.status) {
        case IoStatus::CLOSED:
            if (!mid_message) {
                return Result<Message>::error(ErrorCategory::CONNECTION_CLOSED,
                    "Peer closed the connection");
            }
            return Result<Message>::error(ErrorCategory::FRAME_ERROR,
                std::format("Stream ended mid-{} after {} bytes", what, outcome.transferred));
        case IoStatus::TIMED_OUT:
            return Result<Message>::error(ErrorCategory::BACKEND_TIMEOUT,
                std::format("Timed out reading message {}", what));
        default:
            return Result<Message>::error(ErrorCategory::BACKEND_UNREACHABLE,
                std::format("Socket error reading message {}", what));
    }
}

} // namespace

std::string MessageFramer::validate_header(const MessageHeader& header, size_t max_message_bytes) {
    if (header.message_length < static_cast<int32_t>(wire::HEADER_SIZE)) {
        return std::format("Implausible message length {}", header.message_length);
    }
    if (static_cast<size_t>(header.message_length) > max_message_bytes) {
        return std::format("Message length {} exceeds limit {}",
                           header.message_length, max_message_bytes);
    }
    if (!wire::is_known_opcode(header.op_code)) {
        return std::format("Unknown opcode {}", header.op_code);
    }
    return {};
}

Result<Message> MessageFramer::next(Socket& stream) {
    uint8_t header_bytes[wire::HEADER_SIZE];
    const auto header_read = stream.read_exact(header_bytes, sizeof(header_bytes));
    if (!header_read.ok()) {
        return io_error(header_read, header_read.transferred > 0, "header");
    }

    Message msg;
    msg.header = WireWriter::parse_header(header_bytes);

    const auto problem = validate_header(msg.header, max_message_bytes_);
    if (!problem.empty()) {
        return Result<Message>::error(ErrorCategory::FRAME_ERROR, problem);
    }

    msg.bytes.resize(static_cast<size_t>(msg.header.message_length));
    std::copy(header_bytes, header_bytes + wire::HEADER_SIZE, msg.bytes.begin());

    const size_t body_len = msg.bytes.size() - wire::HEADER_SIZE;
    if (body_len > 0) {
        const auto body_read = stream.read_exact(msg.bytes.data() + wire::HEADER_SIZE, body_len);
        if (!body_read.ok()) {
            return io_error(body_read, true, "body");
        }
    }

    ++messages_read_;
    return Result<Message>::ok(std::move(msg));
}

} // namespace rsproxy
