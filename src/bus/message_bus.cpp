#include "bus/message_bus.hpp"

#include <algorithm>
#include <exception>

#include "utils/logging.hpp"

namespace helix::bus {
namespace {

std::vector<std::string> SplitTokens(const std::string& subject) {
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (true) {
        const auto dot = subject.find('.', start);
        if (dot == std::string::npos) {
            tokens.push_back(subject.substr(start));
            break;
        }
        tokens.push_back(subject.substr(start, dot - start));
        start = dot + 1;
    }
    return tokens;
}

}  // namespace

bool SubjectMatches(const std::string& pattern, const std::string& subject) {
    if (pattern == subject) {
        return true;
    }
    const auto want = SplitTokens(pattern);
    const auto have = SplitTokens(subject);
    for (std::size_t i = 0; i < want.size(); ++i) {
        if (want[i] == ">") {
            return i + 1 == want.size() && have.size() > i;
        }
        if (i >= have.size()) {
            return false;
        }
        if (want[i] != "*" && want[i] != have[i]) {
            return false;
        }
    }
    return want.size() == have.size();
}

MessageBus::~MessageBus() {
    Stop();
}

void MessageBus::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    dispatcher_ = std::thread([this] { DispatchLoop(); });
}

void MessageBus::Stop() {
    std::map<std::uint64_t, std::function<void()>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        std::queue<Message>().swap(pending_);
        listeners = stop_listeners_;
    }
    cv_.notify_all();
    if (dispatcher_.joinable() && dispatcher_.get_id() != std::this_thread::get_id()) {
        dispatcher_.join();
    } else if (dispatcher_.joinable()) {
        dispatcher_.detach();
    }
    for (const auto& [id, listener] : listeners) {
        if (listener) {
            listener();
        }
    }
}

void MessageBus::Publish(const Message& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw BusError("message bus is not running");
        }
        pending_.push(msg);
    }
    cv_.notify_one();
}

std::uint64_t MessageBus::Subscribe(const std::string& subject,
                                    const std::string& queue_group,
                                    MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    subscriptions_.push_back(Subscription{id, subject, queue_group, std::move(handler)});
    return id;
}

void MessageBus::Unsubscribe(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(
        std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                       [id](const Subscription& sub) { return sub.id == id; }),
        subscriptions_.end());
}

std::uint64_t MessageBus::AddStopListener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    stop_listeners_[id] = std::move(listener);
    return id;
}

void MessageBus::RemoveStopListener(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_listeners_.erase(id);
}

std::size_t MessageBus::PendingSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool MessageBus::TryConsume(Message& msg, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !pending_.empty() || !running_; })) {
        return false;
    }
    if (pending_.empty()) {
        return false;
    }
    msg = pending_.front();
    pending_.pop();
    return true;
}

std::vector<MessageHandler> MessageBus::Route(const Message& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MessageHandler> handlers;
    std::map<std::string, std::vector<const Subscription*>> groups;
    for (const auto& sub : subscriptions_) {
        if (!SubjectMatches(sub.subject, msg.subject)) {
            continue;
        }
        if (sub.queue_group.empty()) {
            handlers.push_back(sub.handler);
        } else {
            groups[sub.subject + " " + sub.queue_group].push_back(&sub);
        }
    }
    for (const auto& [key, members] : groups) {
        auto& cursor = group_cursor_[key];
        handlers.push_back(members[cursor % members.size()]->handler);
        ++cursor;
    }
    return handlers;
}

void MessageBus::DispatchLoop() {
    while (running_) {
        Message msg{};
        if (!TryConsume(msg, std::chrono::milliseconds(1000))) {
            continue;
        }
        for (const auto& handler : Route(msg)) {
            if (!handler) {
                continue;
            }
            try {
                handler(msg);
            } catch (const std::exception& ex) {
                helix::utils::LogError("bus", "handler for " + msg.subject + " failed: " + ex.what());
            }
        }
    }
}

LocalTransport::LocalTransport(MessageBus& bus)
    : bus_(bus) {}

LocalTransport::~LocalTransport() {
    Close();
}

void LocalTransport::Connect() {
    if (connected_) {
        return;
    }
    if (!bus_.Running()) {
        throw BusError("message bus is not running");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    stop_listener_ = bus_.AddStopListener([this] { OnBusStopped(); });
    connected_ = true;
}

void LocalTransport::Close() {
    if (!connected_.exchange(false)) {
        return;
    }
    Detach();
}

void LocalTransport::Detach() {
    std::vector<std::uint64_t> subscriptions;
    std::uint64_t listener = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions.swap(subscriptions_);
        listener = stop_listener_;
        stop_listener_ = 0;
    }
    for (const auto id : subscriptions) {
        bus_.Unsubscribe(id);
    }
    if (listener != 0) {
        bus_.RemoveStopListener(listener);
    }
}

void LocalTransport::OnBusStopped() {
    if (!connected_.exchange(false)) {
        return;
    }
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = status_callback_;
    }
    helix::utils::LogWarn("bus", "local bus stopped");
    if (callback) {
        callback(false, "message bus stopped");
    }
}

std::uint64_t LocalTransport::Subscribe(const std::string& subject,
                                        const std::string& queue_group,
                                        MessageHandler handler) {
    if (!connected_) {
        throw BusError("not connected");
    }
    const auto id = bus_.Subscribe(subject, queue_group, std::move(handler));
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.push_back(id);
    return id;
}

void LocalTransport::Unsubscribe(std::uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.erase(std::remove(subscriptions_.begin(), subscriptions_.end(), id),
                             subscriptions_.end());
    }
    bus_.Unsubscribe(id);
}

void LocalTransport::Publish(const std::string& subject,
                             const std::string& payload,
                             const std::string& reply_to) {
    if (!connected_) {
        throw BusError("not connected");
    }
    bus_.Publish(Message{subject, reply_to, payload});
}

void LocalTransport::SetStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_callback_ = std::move(callback);
}

}  // namespace helix::bus
