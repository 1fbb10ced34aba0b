#include "bus/nats_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "bus/transport.hpp"

namespace helix::bus::nats {
namespace {

std::vector<std::string> SplitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream stream(line);
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::string Upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::uint64_t ParseNumber(const std::string& value, const std::string& line) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw BusError("malformed protocol line: " + line);
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw BusError("number out of range in protocol line: " + line);
    }
}

std::string Trailing(const std::string& line, std::size_t op_length) {
    if (line.size() <= op_length) {
        return "";
    }
    auto rest = line.substr(op_length);
    const auto first = rest.find_first_not_of(" \t");
    return first == std::string::npos ? "" : rest.substr(first);
}

}  // namespace

std::string EncodeConnect(const nlohmann::json& options) {
    return "CONNECT " + options.dump() + kCrlf;
}

std::string EncodePub(const std::string& subject,
                      const std::string& reply_to,
                      const std::string& payload) {
    std::string frame = "PUB " + subject;
    if (!reply_to.empty()) {
        frame += " " + reply_to;
    }
    frame += " " + std::to_string(payload.size()) + kCrlf;
    frame += payload;
    frame += kCrlf;
    return frame;
}

std::string EncodeSub(const std::string& subject,
                      const std::string& queue_group,
                      std::uint64_t sid) {
    std::string frame = "SUB " + subject;
    if (!queue_group.empty()) {
        frame += " " + queue_group;
    }
    frame += " " + std::to_string(sid) + kCrlf;
    return frame;
}

std::string EncodeUnsub(std::uint64_t sid) {
    return "UNSUB " + std::to_string(sid) + kCrlf;
}

Parser::Parser(std::size_t max_payload)
    : max_payload_(max_payload) {}

void Parser::Feed(const char* data, std::size_t size) {
    buffer_.append(data, size);
}

std::optional<ServerOp> Parser::Next() {
    const auto line_end = buffer_.find(kCrlf);
    if (line_end == std::string::npos) {
        return std::nullopt;
    }
    const std::string line = buffer_.substr(0, line_end);
    const auto fields = SplitFields(line);
    if (fields.empty()) {
        buffer_.erase(0, line_end + 2);
        return Next();
    }

    ServerOp op{};
    const auto name = Upper(fields[0]);
    if (name == "MSG") {
        // MSG <subject> <sid> [reply-to] <#bytes>
        if (fields.size() != 4 && fields.size() != 5) {
            throw BusError("malformed protocol line: " + line);
        }
        const auto size = ParseNumber(fields.back(), line);
        if (size > max_payload_) {
            throw BusError("payload of " + std::to_string(size) + " bytes exceeds limit of "
                + std::to_string(max_payload_));
        }
        const auto frame_size = line_end + 2 + size + 2;
        if (buffer_.size() < frame_size) {
            return std::nullopt;
        }
        op.kind = OpKind::kMsg;
        op.subject = fields[1];
        op.sid = ParseNumber(fields[2], line);
        if (fields.size() == 5) {
            op.reply_to = fields[3];
        }
        op.payload = buffer_.substr(line_end + 2, size);
        buffer_.erase(0, frame_size);
        return op;
    }

    buffer_.erase(0, line_end + 2);
    if (name == "PING") {
        op.kind = OpKind::kPing;
    } else if (name == "PONG") {
        op.kind = OpKind::kPong;
    } else if (name == "+OK") {
        op.kind = OpKind::kOk;
    } else if (name == "INFO") {
        op.kind = OpKind::kInfo;
        op.payload = Trailing(line, 4);
    } else if (name == "-ERR") {
        op.kind = OpKind::kErr;
        auto reason = Trailing(line, 4);
        if (reason.size() >= 2 && reason.front() == '\'' && reason.back() == '\'') {
            reason = reason.substr(1, reason.size() - 2);
        }
        op.payload = reason;
    } else {
        throw BusError("unknown protocol operation: " + line);
    }
    return op;
}

ServerAddress ParseServerUrl(const std::string& url) {
    std::string working = url;
    const auto scheme = working.find("://");
    if (scheme != std::string::npos) {
        working = working.substr(scheme + 3);
    }
    const auto slash = working.find('/');
    if (slash != std::string::npos) {
        working = working.substr(0, slash);
    }
    const auto at = working.rfind('@');
    if (at != std::string::npos) {
        working = working.substr(at + 1);
    }
    ServerAddress address{working, "4222"};
    const auto colon = working.rfind(':');
    if (colon != std::string::npos) {
        address.host = working.substr(0, colon);
        address.port = working.substr(colon + 1);
    }
    if (address.host.empty()) {
        address.host = "127.0.0.1";
    }
    if (address.port.empty()) {
        address.port = "4222";
    }
    return address;
}

}  // namespace helix::bus::nats
