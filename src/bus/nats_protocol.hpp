#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace helix::bus::nats {

inline constexpr const char* kCrlf = "\r\n";
inline constexpr const char* kPing = "PING\r\n";
inline constexpr const char* kPong = "PONG\r\n";
// Server default for max_payload.
inline constexpr std::size_t kDefaultMaxPayload = 1024 * 1024;

std::string EncodeConnect(const nlohmann::json& options);
std::string EncodePub(const std::string& subject,
                      const std::string& reply_to,
                      const std::string& payload);
std::string EncodeSub(const std::string& subject,
                      const std::string& queue_group,
                      std::uint64_t sid);
std::string EncodeUnsub(std::uint64_t sid);

enum class OpKind {
    kInfo,
    kMsg,
    kPing,
    kPong,
    kOk,
    kErr
};

struct ServerOp {
    OpKind kind = OpKind::kOk;
    std::string subject;
    std::uint64_t sid = 0;
    std::string reply_to;
    // MSG payload, INFO json text or -ERR reason.
    std::string payload;
};

// Incremental parser for the server side of the protocol. Bytes are fed as
// they arrive; Next() yields complete operations only.
class Parser {
public:
    explicit Parser(std::size_t max_payload = kDefaultMaxPayload);

    // MSG frames declaring a larger payload are rejected.
    void SetMaxPayload(std::size_t max_payload) { max_payload_ = max_payload; }
    std::size_t MaxPayload() const { return max_payload_; }

    void Feed(const char* data, std::size_t size);
    // nullopt when the buffer holds no complete operation. Throws BusError on
    // a malformed line.
    std::optional<ServerOp> Next();
    std::size_t Buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
    std::size_t max_payload_;
};

struct ServerAddress {
    std::string host;
    std::string port;
};

// nats://host:port, host:port or host. Port defaults to 4222.
ServerAddress ParseServerUrl(const std::string& url);

}  // namespace helix::bus::nats
