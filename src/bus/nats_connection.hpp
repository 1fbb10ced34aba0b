#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "bus/nats_protocol.hpp"
#include "bus/transport.hpp"

namespace helix::bus {

// Client side of the NATS text protocol over one TCP connection. A reader
// thread answers server PINGs and runs subscription handlers; writes from
// any thread are serialized.
//
// The socket is shared between the reader (blocking read_some) and the
// writers. Once connected, every write, shutdown and close holds
// write_mutex_, so the only concurrent pair is one read alongside one write
// or shutdown. Blocking sockets on POSIX allow that, and shutdown() is what
// wakes the reader on Close(). The socket is never closed while the reader
// runs.
class NatsConnection : public Transport {
public:
    NatsConnection(std::string url, std::string client_name, std::chrono::seconds connect_timeout);
    ~NatsConnection() override;

    NatsConnection(const NatsConnection&) = delete;
    NatsConnection& operator=(const NatsConnection&) = delete;

    // Resolves, connects and completes the INFO/CONNECT/PING handshake.
    // Throws BusError.
    void Connect() override;
    void Close() override;
    bool IsConnected() const override { return connected_; }

    std::uint64_t Subscribe(const std::string& subject,
                            const std::string& queue_group,
                            MessageHandler handler) override;
    void Unsubscribe(std::uint64_t id) override;
    void Publish(const std::string& subject,
                 const std::string& payload,
                 const std::string& reply_to = "") override;
    // Answers arrive on the connection's _INBOX.<id>.* subscription.
    std::optional<Message> Request(const std::string& subject,
                                   const std::string& payload,
                                   std::chrono::milliseconds timeout) override;

    void SetStatusCallback(StatusCallback callback) override;

    const std::string& ServerInfo() const { return server_info_; }

private:
    struct Subscription {
        std::string subject;
        std::string queue_group;
        MessageHandler handler;
    };

    struct PendingRequest {
        std::optional<Message> reply;
    };

    void Handshake(std::chrono::steady_clock::time_point deadline);
    nats::ServerOp ReadOp(std::chrono::steady_clock::time_point deadline);
    void Write(const std::string& frame);
    void ReadLoop();
    void Dispatch(const nats::ServerOp& op);
    void OnInboxMessage(const Message& msg);
    void ReportLoss(const std::string& detail);

    std::string url_;
    std::string client_name_;
    std::chrono::seconds connect_timeout_;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::socket socket_;
    nats::Parser parser_;
    std::string server_info_;

    std::mutex write_mutex_;
    std::mutex mutex_;
    std::map<std::uint64_t, Subscription> subscriptions_;
    std::uint64_t next_sid_ = 1;
    StatusCallback status_callback_;

    std::string inbox_prefix_;
    std::uint64_t next_request_ = 1;
    std::map<std::string, PendingRequest> requests_;
    std::condition_variable requests_cv_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};
    std::thread reader_;
};

}  // namespace helix::bus
