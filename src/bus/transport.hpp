#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "bus/events.hpp"

namespace helix::bus {

class BusError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using MessageHandler = std::function<void(const Message&)>;
// Invoked with connected == false when the bus goes away underneath a live
// connection. A deliberate Close() is not reported.
using StatusCallback = std::function<void(bool connected, const std::string& detail)>;

class Transport {
public:
    virtual ~Transport() = default;

    virtual void Connect() = 0;
    virtual void Close() = 0;
    virtual bool IsConnected() const = 0;

    // Empty queue_group means a plain subscriber. Handlers run on the
    // transport's delivery thread.
    virtual std::uint64_t Subscribe(const std::string& subject,
                                    const std::string& queue_group,
                                    MessageHandler handler) = 0;
    virtual void Unsubscribe(std::uint64_t id) = 0;
    virtual void Publish(const std::string& subject,
                         const std::string& payload,
                         const std::string& reply_to = "") = 0;

    // Publishes with a private reply subject and waits for the first answer.
    // nullopt on timeout.
    virtual std::optional<Message> Request(const std::string& subject,
                                           const std::string& payload,
                                           std::chrono::milliseconds timeout);

    virtual void SetStatusCallback(StatusCallback callback) = 0;
};

}  // namespace helix::bus
