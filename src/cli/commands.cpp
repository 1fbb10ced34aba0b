#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bus/nats_connection.hpp"
#include "config/config_loader.hpp"
#include "module/module_source.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"
#include "worker/execution_unit.hpp"
#include "worker/process_execution_unit.hpp"
#include "worker/sandbox_protocol.hpp"
#include "worker/sandbox_runtime.hpp"
#include "worker/task_requester.hpp"
#include "worker/worker_client.hpp"

namespace {

constexpr int kUsageError = 2;
constexpr int kDefaultSubmitTimeoutS = 30;
constexpr int kPingTimeoutS = 5;

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;
const char* g_argv0 = nullptr;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  helix worker [--in-process]\n"
              << "  helix sandbox\n"
              << "  helix run <module> [input]\n"
              << "  helix submit <module_ref> [input] [--timeout S]\n"
              << "  helix ping" << std::endl;
}

helix::config::Config LoadConfigAndLogging() {
    auto config = helix::config::LoadConfig();
    helix::utils::LogConfig log_config{};
    log_config.min_level = helix::utils::ParseLogLevel(config.log.level);
    helix::utils::SetLogConfig(log_config);
    return config;
}

std::uint32_t StackSizeBytes(const helix::config::Config& config) {
    return static_cast<std::uint32_t>(config.sandbox.stack_size_kb) * 1024u;
}

std::string SelfExecutable() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return self.string();
    }
    return g_argv0 ? std::string(g_argv0) : std::string("helix");
}

std::vector<std::string> SandboxCommand(const helix::config::Config& config) {
    std::vector<std::string> command;
    std::istringstream stream(config.worker.sandbox_command);
    std::string part;
    while (stream >> part) {
        command.push_back(part);
    }
    if (command.empty()) {
        command = {SelfExecutable(), "sandbox"};
    }
    return command;
}

std::unique_ptr<helix::bus::NatsConnection> ConnectBus(const helix::config::Config& config,
                                                       const std::string& client_name) {
    auto connection = std::make_unique<helix::bus::NatsConnection>(
        config.bus.url, client_name, std::chrono::seconds(config.bus.connect_timeout_s));
    connection->Connect();
    return connection;
}

int RunWorker(bool in_process) {
    auto config = LoadConfigAndLogging();
    in_process = in_process || config.worker.in_process;

    helix::module::DefaultModuleSource source;
    std::unique_ptr<helix::worker::ExecutionUnit> unit;
    if (in_process) {
        unit = std::make_unique<helix::worker::InProcessExecutionUnit>(
            source, static_cast<std::size_t>(config.sandbox.cache_capacity), StackSizeBytes(config));
    } else {
        unit = std::make_unique<helix::worker::ProcessExecutionUnit>(
            SandboxCommand(config), std::chrono::seconds(config.worker.execution_timeout_s));
    }

    auto options = helix::worker::MakeWorkerOptions(config);
    helix::bus::NatsConnection connection(
        config.bus.url, options.worker_id, std::chrono::seconds(config.bus.connect_timeout_s));
    helix::worker::WorkerClient client(connection, *unit, options);

    std::atomic<bool> connection_lost{false};
    client.SetStatusCallback([&connection_lost](helix::worker::ClientState state, const std::string& detail) {
        helix::utils::LogInfo("worker", std::string("state ") + helix::worker::ToString(state) + ": " + detail);
        if (state == helix::worker::ClientState::kDisconnected && g_running.load()) {
            connection_lost = true;
        }
    });

    try {
        client.Start();
    } catch (const std::exception& ex) {
        std::cerr << "Failed to start worker: " << ex.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::cout << "helix worker " << client.WorkerId() << " started ("
              << (in_process ? "in-process" : "process") << " sandbox). Press Ctrl+C to stop."
              << std::endl;

    bool shutdown_guard_started = false;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(10));
                    std::_Exit(130);
                }).detach();
            }
            break;
        }
        if (connection_lost.load()) {
            std::cerr << "Bus connection lost, shutting down." << std::endl;
            g_running.store(false);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    const auto status = client.Status();
    helix::utils::LogInfo("worker", "stopping with " + std::to_string(status.in_flight) + " task(s) in flight");
    client.Stop();
    return connection_lost.load() ? 1 : 0;
}

int RunSandbox() {
    auto config = LoadConfigAndLogging();
    helix::module::DefaultModuleSource source;
    helix::worker::SandboxRuntime runtime(
        source, static_cast<std::size_t>(config.sandbox.cache_capacity), StackSizeBytes(config));
    helix::utils::LogDebug("sandbox", "execution unit ready");
    return helix::worker::RunSandboxLoop(runtime, std::cin, std::cout);
}

int RunModule(const std::string& ref, const std::string& input) {
    auto config = LoadConfigAndLogging();
    std::error_code ec;
    const auto address = helix::module::IsFullAddress(ref) || std::filesystem::exists(ref, ec)
        ? ref
        : helix::module::ResolveModuleAddress(config.worker.module_base, ref);

    helix::module::DefaultModuleSource source;
    helix::worker::SandboxRuntime runtime(source, 1, StackSizeBytes(config));
    const auto result = runtime.Execute(address, input);
    std::cout << helix::worker::DumpLine(helix::sandbox::ToJson(result)) << std::endl;
    return result.success ? 0 : 1;
}

int SubmitTask(const std::string& ref, const std::string& input, int timeout_s) {
    auto config = LoadConfigAndLogging();
    try {
        auto connection = ConnectBus(config, "helix-submit");
        helix::worker::TaskRequester requester(
            *connection, config.bus.task_subject, config.bus.ping_subject);
        const auto result = requester.Execute(ref, input, std::chrono::seconds(timeout_s));
        connection->Close();
        std::cout << helix::worker::ToJson(result).dump(2) << std::endl;
        return result.success ? 0 : 1;
    } catch (const helix::bus::BusError& ex) {
        std::cerr << "Submit failed: " << ex.what() << std::endl;
        return 1;
    }
}

int PingWorkers() {
    auto config = LoadConfigAndLogging();
    try {
        auto connection = ConnectBus(config, "helix-ping");
        helix::worker::TaskRequester requester(
            *connection, config.bus.task_subject, config.bus.ping_subject);
        const auto probe = requester.CheckWorkers(std::chrono::seconds(kPingTimeoutS));
        connection->Close();
        std::cout << helix::worker::ToJson(probe).dump(2) << std::endl;
        return probe.available ? 0 : 1;
    } catch (const helix::bus::BusError& ex) {
        std::cerr << "Ping failed: " << ex.what() << std::endl;
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    g_argv0 = (argc > 0 ? argv[0] : nullptr);
    if (argc < 2) {
        PrintUsage();
        return kUsageError;
    }
    const std::string command = argv[1];

    if (command == "worker") {
        bool in_process = false;
        for (int i = 2; i < argc; ++i) {
            if (std::string(argv[i]) == "--in-process") {
                in_process = true;
            } else {
                PrintUsage();
                return kUsageError;
            }
        }
        return RunWorker(in_process);
    }

    if (command == "sandbox") {
        return RunSandbox();
    }

    if (command == "run") {
        if (argc < 3 || argc > 4) {
            PrintUsage();
            return kUsageError;
        }
        return RunModule(argv[2], argc == 4 ? argv[3] : "");
    }

    if (command == "submit") {
        std::vector<std::string> positional;
        int timeout_s = kDefaultSubmitTimeoutS;
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--timeout") {
                if (i + 1 >= argc) {
                    PrintUsage();
                    return kUsageError;
                }
                try {
                    timeout_s = std::stoi(argv[++i]);
                } catch (const std::logic_error&) {
                    PrintUsage();
                    return kUsageError;
                }
            } else {
                positional.push_back(arg);
            }
        }
        if (positional.empty() || positional.size() > 2 || timeout_s <= 0) {
            PrintUsage();
            return kUsageError;
        }
        return SubmitTask(positional[0], positional.size() == 2 ? positional[1] : "", timeout_s);
    }

    if (command == "ping") {
        return PingWorkers();
    }

    PrintUsage();
    return kUsageError;
}
