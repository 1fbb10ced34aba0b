#pragma once

#include <string>

namespace helix::config {

struct BusConfig {
    std::string url = "nats://localhost:4222";
    std::string task_subject = "helix.tasks.wasm";
    std::string queue_group = "wasm-workers";
    std::string ping_subject = "helix.tasks.wasm.ping";
    int connect_timeout_s = 5;
};

struct WorkerConfig {
    std::string id;
    std::string module_base = "./wasm/";
    int max_pending = 16;
    int execution_timeout_s = 30;
    bool in_process = false;
    std::string sandbox_command;
};

struct SandboxConfig {
    int stack_size_kb = 1024;
    int cache_capacity = 64;
};

struct LogConfig {
    std::string level = "info";
};

struct Config {
    BusConfig bus;
    WorkerConfig worker;
    SandboxConfig sandbox;
    LogConfig log;
};

}  // namespace helix::config
