#include "bus/nats_connection.hpp"

#include <array>
#include <exception>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace helix::bus {
namespace {

using tcp = boost::asio::ip::tcp;

constexpr const char* kClientVersion = "0.1.0";

}  // namespace

NatsConnection::NatsConnection(std::string url, std::string client_name, std::chrono::seconds connect_timeout)
    : url_(std::move(url))
    , client_name_(std::move(client_name))
    , connect_timeout_(connect_timeout)
    , socket_(io_) {}

NatsConnection::~NatsConnection() {
    Close();
}

void NatsConnection::Connect() {
    if (connected_) {
        return;
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    const auto address = nats::ParseServerUrl(url_);
    const auto deadline = std::chrono::steady_clock::now() + connect_timeout_;
    io_.restart();
    parser_ = nats::Parser{};
    closing_ = false;

    boost::system::error_code ec;
    tcp::resolver resolver(io_);
    const auto endpoints = resolver.resolve(address.host, address.port, ec);
    if (ec) {
        throw BusError("cannot resolve " + address.host + ": " + ec.message());
    }

    bool done = false;
    boost::system::error_code connect_ec;
    boost::asio::async_connect(socket_, endpoints,
        [&](const boost::system::error_code& error, const tcp::endpoint&) {
            connect_ec = error;
            done = true;
        });
    io_.run_until(deadline);
    if (!done) {
        socket_.close(ec);
        io_.restart();
        io_.run();
        throw BusError("connect to " + url_ + " timed out");
    }
    if (connect_ec) {
        socket_.close(ec);
        throw BusError("connect to " + url_ + " failed: " + connect_ec.message());
    }

    try {
        Handshake(deadline);
    } catch (const BusError&) {
        socket_.close(ec);
        throw;
    }

    connected_ = true;
    inbox_prefix_ = "_INBOX." + helix::utils::GenerateId(22);
    Subscribe(inbox_prefix_ + ".*", "", [this](const Message& msg) {
        OnInboxMessage(msg);
    });
    reader_ = std::thread([this] { ReadLoop(); });
    helix::utils::LogInfo("nats", "connected to " + address.host + ":" + address.port);
}

nats::ServerOp NatsConnection::ReadOp(std::chrono::steady_clock::time_point deadline) {
    std::array<char, 4096> buffer{};
    while (true) {
        if (auto op = parser_.Next()) {
            return *op;
        }
        bool done = false;
        std::size_t received = 0;
        boost::system::error_code read_ec;
        socket_.async_read_some(boost::asio::buffer(buffer),
            [&](const boost::system::error_code& error, std::size_t size) {
                read_ec = error;
                received = size;
                done = true;
            });
        io_.restart();
        io_.run_until(deadline);
        if (!done) {
            boost::system::error_code ec;
            socket_.close(ec);
            io_.restart();
            io_.run();
            throw BusError("handshake with " + url_ + " timed out");
        }
        if (read_ec) {
            throw BusError("handshake with " + url_ + " failed: " + read_ec.message());
        }
        parser_.Feed(buffer.data(), received);
    }
}

void NatsConnection::Handshake(std::chrono::steady_clock::time_point deadline) {
    const auto info = ReadOp(deadline);
    if (info.kind != nats::OpKind::kInfo) {
        throw BusError("expected INFO from " + url_);
    }
    server_info_ = info.payload;
    const auto info_json = nlohmann::json::parse(server_info_, nullptr, false);
    if (info_json.is_object() && info_json.contains("max_payload")
        && info_json["max_payload"].is_number_unsigned()) {
        parser_.SetMaxPayload(info_json["max_payload"].get<std::size_t>());
    }

    const nlohmann::json options = {
        {"verbose", false},
        {"pedantic", false},
        {"name", client_name_},
        {"lang", "cpp"},
        {"version", kClientVersion},
        {"protocol", 1}
    };
    Write(nats::EncodeConnect(options));
    Write(nats::kPing);

    while (true) {
        const auto op = ReadOp(deadline);
        switch (op.kind) {
            case nats::OpKind::kPong:
                return;
            case nats::OpKind::kPing:
                Write(nats::kPong);
                break;
            case nats::OpKind::kErr:
                throw BusError("server rejected connection: " + op.payload);
            default:
                break;
        }
    }
}

void NatsConnection::Write(const std::string& frame) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!socket_.is_open()) {
        throw BusError("connection closed");
    }
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(frame), ec);
    if (ec) {
        throw BusError("write failed: " + ec.message());
    }
}

void NatsConnection::ReadLoop() {
    std::array<char, 8192> buffer{};
    while (!closing_) {
        boost::system::error_code ec;
        const auto size = socket_.read_some(boost::asio::buffer(buffer), ec);
        if (ec) {
            if (!closing_) {
                ReportLoss(ec.message());
            }
            return;
        }
        parser_.Feed(buffer.data(), size);
        try {
            while (auto op = parser_.Next()) {
                Dispatch(*op);
            }
        } catch (const BusError& ex) {
            if (!closing_) {
                ReportLoss(ex.what());
            }
            return;
        }
    }
}

void NatsConnection::Dispatch(const nats::ServerOp& op) {
    switch (op.kind) {
        case nats::OpKind::kPing:
            Write(nats::kPong);
            return;
        case nats::OpKind::kErr:
            helix::utils::LogWarn("nats", "server error: " + op.payload);
            return;
        case nats::OpKind::kMsg:
            break;
        default:
            return;
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(op.sid);
        if (it == subscriptions_.end()) {
            return;
        }
        handler = it->second.handler;
    }
    if (!handler) {
        return;
    }
    try {
        handler(Message{op.subject, op.reply_to, op.payload});
    } catch (const std::exception& ex) {
        helix::utils::LogError("nats", "handler for " + op.subject + " failed: " + ex.what());
    }
}

void NatsConnection::OnInboxMessage(const Message& msg) {
    const auto token = msg.subject.substr(inbox_prefix_.size() + 1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(token);
        if (it == requests_.end() || it->second.reply) {
            return;
        }
        it->second.reply = msg;
    }
    requests_cv_.notify_all();
}

void NatsConnection::ReportLoss(const std::string& detail) {
    connected_ = false;
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = status_callback_;
    }
    requests_cv_.notify_all();
    helix::utils::LogWarn("nats", "connection lost: " + detail);
    if (callback) {
        callback(false, detail);
    }
}

void NatsConnection::Close() {
    closing_ = true;
    connected_ = false;
    boost::system::error_code ec;
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (socket_.is_open()) {
            socket_.shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        socket_.close(ec);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.clear();
    }
    requests_cv_.notify_all();
}

std::uint64_t NatsConnection::Subscribe(const std::string& subject,
                                        const std::string& queue_group,
                                        MessageHandler handler) {
    if (!connected_) {
        throw BusError("not connected");
    }
    std::uint64_t sid = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sid = next_sid_++;
        subscriptions_[sid] = Subscription{subject, queue_group, std::move(handler)};
    }
    try {
        Write(nats::EncodeSub(subject, queue_group, sid));
    } catch (const BusError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.erase(sid);
        throw;
    }
    return sid;
}

void NatsConnection::Unsubscribe(std::uint64_t id) {
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        known = subscriptions_.erase(id) > 0;
    }
    if (!known || !connected_) {
        return;
    }
    try {
        Write(nats::EncodeUnsub(id));
    } catch (const BusError& ex) {
        helix::utils::LogWarn("nats", std::string("unsubscribe failed: ") + ex.what());
    }
}

void NatsConnection::Publish(const std::string& subject,
                             const std::string& payload,
                             const std::string& reply_to) {
    if (!connected_) {
        throw BusError("not connected");
    }
    Write(nats::EncodePub(subject, reply_to, payload));
}

std::optional<Message> NatsConnection::Request(const std::string& subject,
                                               const std::string& payload,
                                               std::chrono::milliseconds timeout) {
    if (!connected_) {
        throw BusError("not connected");
    }
    std::string token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = std::to_string(next_request_++);
        requests_[token] = PendingRequest{};
    }
    try {
        Publish(subject, payload, inbox_prefix_ + "." + token);
    } catch (const BusError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.erase(token);
        throw;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    requests_cv_.wait_for(lock, timeout, [this, &token] {
        auto it = requests_.find(token);
        return !connected_ || (it != requests_.end() && it->second.reply.has_value());
    });
    auto reply = requests_[token].reply;
    requests_.erase(token);
    return reply;
}

void NatsConnection::SetStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_callback_ = std::move(callback);
}

}  // namespace helix::bus
