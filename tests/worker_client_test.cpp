#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "bus/message_bus.hpp"
#include "support/test_modules.hpp"
#include "support/wait.hpp"
#include "worker/execution_unit.hpp"
#include "worker/sandbox_protocol.hpp"
#include "worker/task.hpp"
#include "worker/task_requester.hpp"
#include "worker/worker_client.hpp"

using helix::bus::LocalTransport;
using helix::bus::Message;
using helix::bus::MessageBus;
using helix::bus::MessageHandler;
using helix::testing::FakeModuleSource;
using helix::worker::ClientState;
using helix::worker::InProcessExecutionUnit;
using helix::worker::TaskRequester;
using helix::worker::WorkerClient;
using helix::worker::WorkerOptions;

namespace {

constexpr std::uint32_t kStack = 64 * 1024;
constexpr auto kTimeout = std::chrono::seconds(5);
const std::string kReplies = "test.replies";

WorkerOptions Options(const std::string& worker_id, std::size_t max_pending = 16) {
    WorkerOptions options{};
    options.worker_id = worker_id;
    options.module_base = "mem://wasm/";
    options.max_pending = max_pending;
    return options;
}

// Subscribes to the reply subject and collects decoded replies.
class ReplyCollector {
public:
    explicit ReplyCollector(MessageBus& bus) : transport_(bus) {
        transport_.Connect();
        transport_.Subscribe(kReplies, "", [this](const Message& msg) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                replies_.push_back(nlohmann::json::parse(msg.payload));
            }
            cv_.notify_all();
        });
    }

    void Submit(const std::string& task_id, const std::string& input = "") {
        const helix::worker::Task task{task_id, "job.wasm", input};
        transport_.Publish("helix.tasks.wasm", helix::worker::EncodeTask(task).dump(), kReplies);
    }

    bool WaitFor(std::size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, kTimeout, [&] { return replies_.size() >= count; });
    }

    std::vector<nlohmann::json> Replies() {
        std::lock_guard<std::mutex> lock(mutex_);
        return replies_;
    }

    nlohmann::json ReplyFor(const std::string& task_id) {
        for (const auto& reply : Replies()) {
            if (reply.value("task_id", "") == task_id) {
                return reply;
            }
        }
        return nullptr;
    }

private:
    LocalTransport transport_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<nlohmann::json> replies_;
};

// Execution unit that records requests and holds each one until released.
class BlockingUnit : public helix::worker::ExecutionUnit {
public:
    explicit BlockingUnit(bool released = false) : released_(released) {}

    void Start() override {}
    void Stop() override { Release(); }

    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    bool WaitEntered(std::size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, kTimeout, [&] { return order_.size() >= count; });
    }

    std::vector<std::string> Order() {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

protected:
    nlohmann::json Exchange(const nlohmann::json& message) override {
        const auto request = helix::worker::DecodeExecute(message);
        std::unique_lock<std::mutex> lock(mutex_);
        order_.push_back(request.task_id);
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });

        helix::sandbox::ExecutionResult result{};
        result.success = true;
        result.output = request.input;
        return helix::worker::EncodeResult(request.task_id, result);
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_;
    std::vector<std::string> order_;
};

// Transport without a broker. Records what is published and can inject a
// delivery while the client subscribes or closes.
class ScriptedTransport : public helix::bus::Transport {
public:
    void Connect() override { connected_ = true; }

    void Close() override {
        std::optional<Message> late;
        MessageHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            late.swap(on_close_);
            if (late) {
                handler = HandlerFor(late->subject);
            }
        }
        if (late && handler) {
            handler(*late);
        }
        connected_ = false;
    }

    bool IsConnected() const override { return connected_; }

    std::uint64_t Subscribe(const std::string& subject,
                            const std::string&,
                            MessageHandler handler) override {
        std::optional<Message> early;
        MessageHandler target;
        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            handlers_[id] = std::make_pair(subject, std::move(handler));
            if (on_subscribe_ && on_subscribe_->first == subject) {
                early = on_subscribe_->second;
                on_subscribe_.reset();
                target = HandlerFor(early->subject);
            }
        }
        if (early && target) {
            target(*early);
        }
        return id;
    }

    void Unsubscribe(std::uint64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(id);
    }

    void Publish(const std::string& subject,
                 const std::string& payload,
                 const std::string& reply_to) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            published_.push_back(Message{subject, reply_to, payload});
        }
        cv_.notify_all();
    }

    void SetStatusCallback(helix::bus::StatusCallback) override {}

    // Delivered to the subscriber of msg.subject during Close().
    void DeliverOnClose(Message msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_close_ = std::move(msg);
    }

    // Delivered to the subscriber of msg.subject once `trigger` is subscribed.
    void DeliverOnSubscribe(const std::string& trigger, Message msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_subscribe_ = std::make_pair(trigger, std::move(msg));
    }

    bool WaitPublished(std::size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, kTimeout, [&] { return published_.size() >= count; });
    }

    std::vector<Message> Published() {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

private:
    MessageHandler HandlerFor(const std::string& subject) const {
        for (const auto& entry : handlers_) {
            if (entry.second.first == subject) {
                return entry.second.second;
            }
        }
        return nullptr;
    }

    std::atomic<bool> connected_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t next_id_ = 1;
    std::map<std::uint64_t, std::pair<std::string, MessageHandler>> handlers_;
    std::optional<Message> on_close_;
    std::optional<std::pair<std::string, Message>> on_subscribe_;
    std::vector<Message> published_;
};

Message TaskMessage(const std::string& task_id, const std::string& input, const std::string& reply_to) {
    const helix::worker::Task task{task_id, "echo.wasm", input};
    return Message{"helix.tasks.wasm", reply_to, helix::worker::EncodeTask(task).dump()};
}

class worker_client_fixture : public ::testing::Test {
protected:
    void SetUp() override {
        bus_.Start();
        source_.Put("mem://wasm/echo.wasm", helix::testing::EchoModule());
        source_.Put("mem://wasm/fail.wasm", helix::testing::WriteModule(2, "boom", 3));
    }

    void TearDown() override { bus_.Stop(); }

    MessageBus bus_;
    FakeModuleSource source_;
};

}  // namespace

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, executes_submitted_task) {
    LocalTransport worker_transport(bus_);
    InProcessExecutionUnit unit(source_, 8, kStack);
    WorkerClient client(worker_transport, unit, Options("native-test"));
    client.Start();

    LocalTransport requester_transport(bus_);
    requester_transport.Connect();
    TaskRequester requester(requester_transport, "helix.tasks.wasm", "helix.tasks.wasm.ping");

    const auto result = requester.Execute("echo.wasm", R"({"msg":"hello"})", kTimeout);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output["msg"], "hello");
    EXPECT_EQ(result.worker_id, "native-test");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_GE(result.execution_time_ms, 0.0);

    client.Stop();
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, failures_come_back_as_replies) {
    LocalTransport worker_transport(bus_);
    InProcessExecutionUnit unit(source_, 8, kStack);
    WorkerClient client(worker_transport, unit, Options("native-test"));
    client.Start();

    LocalTransport requester_transport(bus_);
    requester_transport.Connect();
    TaskRequester requester(requester_transport, "helix.tasks.wasm", "helix.tasks.wasm.ping");

    const auto missing = requester.Execute("missing.wasm", "", kTimeout);
    EXPECT_FALSE(missing.success);
    ASSERT_TRUE(missing.error.has_value());
    EXPECT_NE(missing.error->find("Failed to fetch WASM"), std::string::npos);

    ReplyCollector collector(bus_);
    const helix::worker::Task task{"t-fail", "fail.wasm", ""};
    requester_transport.Publish("helix.tasks.wasm", helix::worker::EncodeTask(task).dump(), kReplies);
    ASSERT_TRUE(collector.WaitFor(1));
    const auto reply = collector.ReplyFor("t-fail");
    EXPECT_EQ(reply["success"], false);
    EXPECT_EQ(reply["exit_code"], 3);
    EXPECT_EQ(reply["stderr"], "boom");

    client.Stop();
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, answers_liveness_probe) {
    LocalTransport worker_transport(bus_);
    BlockingUnit unit;
    WorkerClient client(worker_transport, unit, Options("native-probe"));
    client.Start();

    LocalTransport requester_transport(bus_);
    requester_transport.Connect();
    TaskRequester requester(requester_transport, "helix.tasks.wasm", "helix.tasks.wasm.ping");

    // A task stuck in the unit must not delay the probe.
    ReplyCollector collector(bus_);
    collector.Submit("t-long");
    ASSERT_TRUE(unit.WaitEntered(1));

    const auto probe = requester.CheckWorkers(std::chrono::seconds(2));
    EXPECT_TRUE(probe.available);
    EXPECT_EQ(probe.worker_id, "native-probe");
    EXPECT_EQ(probe.workers, 1);

    unit.Release();
    client.Stop();
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, each_task_answered_once_across_group) {
    LocalTransport transport_a(bus_);
    LocalTransport transport_b(bus_);
    InProcessExecutionUnit unit_a(source_, 8, kStack);
    InProcessExecutionUnit unit_b(source_, 8, kStack);
    WorkerClient client_a(transport_a, unit_a, Options("native-a"));
    WorkerClient client_b(transport_b, unit_b, Options("native-b"));
    client_a.Start();
    client_b.Start();

    ReplyCollector collector(bus_);
    constexpr int kTasks = 6;
    for (int i = 0; i < kTasks; ++i) {
        const helix::worker::Task task{"t" + std::to_string(i), "echo.wasm", std::to_string(i)};
        LocalTransport sender(bus_);
        sender.Connect();
        sender.Publish("helix.tasks.wasm", helix::worker::EncodeTask(task).dump(), kReplies);
    }
    ASSERT_TRUE(collector.WaitFor(kTasks));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const auto replies = collector.Replies();
    ASSERT_EQ(replies.size(), static_cast<std::size_t>(kTasks));
    std::set<std::string> task_ids;
    std::map<std::string, int> per_worker;
    for (const auto& reply : replies) {
        EXPECT_EQ(reply["success"], true);
        task_ids.insert(reply["task_id"].get<std::string>());
        ++per_worker[reply["worker_id"].get<std::string>()];
    }
    EXPECT_EQ(task_ids.size(), static_cast<std::size_t>(kTasks));
    EXPECT_EQ(per_worker["native-a"], kTasks / 2);
    EXPECT_EQ(per_worker["native-b"], kTasks / 2);

    client_a.Stop();
    client_b.Stop();
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, malformed_task_gets_error_reply) {
    LocalTransport worker_transport(bus_);
    BlockingUnit unit(true);
    WorkerClient client(worker_transport, unit, Options("native-test"));
    client.Start();

    LocalTransport requester_transport(bus_);
    requester_transport.Connect();
    const auto reply = requester_transport.Request("helix.tasks.wasm", "not json", kTimeout);
    ASSERT_TRUE(reply.has_value());
    const auto data = nlohmann::json::parse(reply->payload);
    EXPECT_EQ(data["error"], "task payload is not valid JSON");
    EXPECT_EQ(data["worker_id"], "native-test");
    EXPECT_TRUE(unit.Order().empty());

    client.Stop();
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, rejects_tasks_beyond_capacity) {
    LocalTransport worker_transport(bus_);
    BlockingUnit unit;
    WorkerClient client(worker_transport, unit, Options("native-test", 1));
    client.Start();

    ReplyCollector collector(bus_);
    collector.Submit("t1");
    ASSERT_TRUE(unit.WaitEntered(1));
    collector.Submit("t2");
    collector.Submit("t3");

    ASSERT_TRUE(collector.WaitFor(1));
    const auto rejected = collector.ReplyFor("t3");
    EXPECT_EQ(rejected["success"], false);
    EXPECT_EQ(rejected["error"], "worker at capacity");
    EXPECT_EQ(client.Status().in_flight, 2u);

    unit.Release();
    ASSERT_TRUE(collector.WaitFor(3));
    EXPECT_EQ(collector.ReplyFor("t1")["success"], true);
    EXPECT_EQ(collector.ReplyFor("t2")["success"], true);
    client.Stop();
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, processes_in_delivery_order) {
    LocalTransport worker_transport(bus_);
    BlockingUnit unit(true);
    WorkerClient client(worker_transport, unit, Options("native-test"));
    client.Start();

    ReplyCollector collector(bus_);
    const std::vector<std::string> ids = {"a", "b", "c", "d", "e"};
    for (const auto& id : ids) {
        collector.Submit(id, "input-" + id);
    }
    ASSERT_TRUE(collector.WaitFor(ids.size()));
    EXPECT_EQ(unit.Order(), ids);
    EXPECT_EQ(collector.ReplyFor("c")["output"], "input-c");
    client.Stop();
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, stop_answers_queued_tasks) {
    LocalTransport worker_transport(bus_);
    BlockingUnit unit;
    WorkerClient client(worker_transport, unit, Options("native-test"));
    client.Start();

    ReplyCollector collector(bus_);
    collector.Submit("t1");
    ASSERT_TRUE(unit.WaitEntered(1));
    collector.Submit("t2");
    collector.Submit("t3");
    ASSERT_TRUE(helix::testing::WaitUntil([&client] { return client.Status().in_flight == 3; }));

    std::thread stopper([&client] { client.Stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    unit.Release();
    stopper.join();

    ASSERT_TRUE(collector.WaitFor(3));
    EXPECT_EQ(collector.ReplyFor("t1")["success"], true);
    EXPECT_EQ(collector.ReplyFor("t2")["error"], "worker shutting down");
    EXPECT_EQ(collector.ReplyFor("t3")["error"], "worker shutting down");
    EXPECT_EQ(unit.Order().size(), 1u);
}

// NOLINTNEXTLINE
TEST(worker_client, task_arriving_during_stop_is_answered) {
    ScriptedTransport transport;
    BlockingUnit unit(true);
    WorkerClient client(transport, unit, Options("native-test"));
    transport.DeliverOnClose(TaskMessage("t-late", "", "reply.late"));

    client.Start();
    client.Stop();

    const auto published = transport.Published();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].subject, "reply.late");
    const auto reply = nlohmann::json::parse(published[0].payload);
    EXPECT_EQ(reply["task_id"], "t-late");
    EXPECT_EQ(reply["success"], false);
    EXPECT_EQ(reply["error"], "worker shutting down");
    EXPECT_TRUE(unit.Order().empty());
    EXPECT_EQ(client.Status().in_flight, 0u);
    EXPECT_EQ(client.Status().state, ClientState::kDisconnected);
}

// NOLINTNEXTLINE
TEST(worker_client, subscribed_is_reported_before_first_dispatch) {
    ScriptedTransport transport;
    BlockingUnit unit(true);
    WorkerClient client(transport, unit, Options("native-test"));

    std::mutex mutex;
    std::vector<std::pair<ClientState, std::string>> changes;
    client.SetStatusCallback([&](ClientState state, const std::string& detail) {
        std::lock_guard<std::mutex> lock(mutex);
        changes.emplace_back(state, detail);
    });
    // The task lands while Start() is still subscribing.
    transport.DeliverOnSubscribe("helix.tasks.wasm.ping", TaskMessage("t-early", "x", "reply.early"));

    client.Start();
    ASSERT_TRUE(transport.WaitPublished(1));
    const auto reply = nlohmann::json::parse(transport.Published()[0].payload);
    EXPECT_EQ(reply["task_id"], "t-early");
    EXPECT_EQ(reply["success"], true);
    EXPECT_EQ(reply["output"], "x");
    client.Stop();

    std::lock_guard<std::mutex> lock(mutex);
    const std::vector<std::pair<ClientState, std::string>> expected = {
        {ClientState::kConnecting, "connecting"},
        {ClientState::kSubscribed, "subscribed"},
        {ClientState::kDisconnected, "stopped"}};
    EXPECT_EQ(changes, expected);
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, reports_state_changes) {
    LocalTransport worker_transport(bus_);
    BlockingUnit unit(true);
    WorkerClient client(worker_transport, unit, Options("native-test"));

    std::mutex mutex;
    std::vector<ClientState> states;
    client.SetStatusCallback([&](ClientState state, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        states.push_back(state);
    });

    EXPECT_EQ(client.Status().state, ClientState::kDisconnected);
    client.Start();
    const auto status = client.Status();
    EXPECT_EQ(status.state, ClientState::kSubscribed);
    EXPECT_EQ(status.in_flight, 0u);
    EXPECT_EQ(helix::worker::ToJson(status)["state"], "subscribed");

    bus_.Stop();
    ASSERT_TRUE(helix::testing::WaitUntil([&client] {
        return client.Status().state == ClientState::kDisconnected;
    }));
    client.Stop();

    std::lock_guard<std::mutex> lock(mutex);
    const std::vector<ClientState> expected = {
        ClientState::kConnecting, ClientState::kSubscribed, ClientState::kDisconnected};
    EXPECT_EQ(states, expected);
}

// NOLINTNEXTLINE
TEST_F(worker_client_fixture, start_fails_without_bus) {
    bus_.Stop();
    LocalTransport worker_transport(bus_);
    BlockingUnit unit(true);
    WorkerClient client(worker_transport, unit, Options("native-test"));
    EXPECT_THROW(client.Start(), helix::bus::BusError);
    EXPECT_EQ(client.Status().state, ClientState::kDisconnected);
}

// NOLINTNEXTLINE
TEST(worker_options, built_from_config) {
    helix::config::Config config{};
    config.worker.max_pending = 3;
    config.worker.module_base = "https://cdn.example/";
    const auto generated = helix::worker::MakeWorkerOptions(config);
    EXPECT_EQ(generated.worker_id.rfind("native-", 0), 0u);
    EXPECT_EQ(generated.worker_id.size(), 15u);
    EXPECT_EQ(generated.max_pending, 3u);
    EXPECT_EQ(generated.queue_group, "wasm-workers");

    config.worker.id = "fixed";
    EXPECT_EQ(helix::worker::MakeWorkerOptions(config).worker_id, "fixed");
}
