#include "bus/transport.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

#include "utils/common.hpp"

namespace helix::bus {

std::optional<Message> Transport::Request(const std::string& subject,
                                          const std::string& payload,
                                          std::chrono::milliseconds timeout) {
    struct Pending {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<Message> reply;
    };
    auto pending = std::make_shared<Pending>();
    const std::string inbox = "_INBOX." + helix::utils::GenerateId(22);

    const auto id = Subscribe(inbox, "", [pending](const Message& msg) {
        {
            std::lock_guard<std::mutex> lock(pending->mutex);
            if (!pending->reply) {
                pending->reply = msg;
            }
        }
        pending->cv.notify_all();
    });

    try {
        Publish(subject, payload, inbox);
    } catch (const BusError&) {
        Unsubscribe(id);
        throw;
    }

    std::optional<Message> reply;
    {
        std::unique_lock<std::mutex> lock(pending->mutex);
        pending->cv.wait_for(lock, timeout, [&pending] { return pending->reply.has_value(); });
        reply = pending->reply;
    }
    Unsubscribe(id);
    return reply;
}

}  // namespace helix::bus
