#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "bus/events.hpp"
#include "bus/transport.hpp"

namespace helix::bus {

// NATS subject matching: tokens split on '.', '*' matches one token, '>'
// matches one or more trailing tokens.
bool SubjectMatches(const std::string& pattern, const std::string& subject);

// In-process broker with the same delivery rules as a NATS server. Published
// messages are queued and delivered from a single dispatch thread: every plain
// subscriber gets a copy, each queue group gets exactly one (round-robin).
class MessageBus {
public:
    MessageBus() = default;
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    void Start();
    // Drops queued messages and notifies stop listeners.
    void Stop();
    bool Running() const { return running_; }

    void Publish(const Message& msg);
    std::uint64_t Subscribe(const std::string& subject,
                            const std::string& queue_group,
                            MessageHandler handler);
    void Unsubscribe(std::uint64_t id);

    std::uint64_t AddStopListener(std::function<void()> listener);
    void RemoveStopListener(std::uint64_t id);

    std::size_t PendingSize() const;

private:
    struct Subscription {
        std::uint64_t id = 0;
        std::string subject;
        std::string queue_group;
        MessageHandler handler;
    };

    bool TryConsume(Message& msg, std::chrono::milliseconds timeout);
    void DispatchLoop();
    std::vector<MessageHandler> Route(const Message& msg);

    std::queue<Message> pending_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Subscription> subscriptions_;
    std::map<std::string, std::size_t> group_cursor_;
    std::map<std::uint64_t, std::function<void()>> stop_listeners_;
    std::uint64_t next_id_ = 1;
    std::atomic<bool> running_{false};
    std::thread dispatcher_;
};

// Transport bound to a MessageBus. Several transports may share one bus;
// each stands for one client connection.
class LocalTransport : public Transport {
public:
    explicit LocalTransport(MessageBus& bus);
    ~LocalTransport() override;

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

    void SetStatusCallback(StatusCallback callback) override;

private:
    void Detach();
    void OnBusStopped();

    MessageBus& bus_;
    std::atomic<bool> connected_{false};
    std::mutex mutex_;
    std::vector<std::uint64_t> subscriptions_;
    std::uint64_t stop_listener_ = 0;
    StatusCallback status_callback_;
};

}  // namespace helix::bus
