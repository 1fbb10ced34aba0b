#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace helix::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("bus") && data["bus"].is_object()) {
        const auto& bus = data["bus"];
        ApplyString(bus, "url", config.bus.url);
        ApplyString(bus, "taskSubject", config.bus.task_subject);
        ApplyString(bus, "queueGroup", config.bus.queue_group);
        ApplyString(bus, "pingSubject", config.bus.ping_subject);
        ApplyInt(bus, "connectTimeoutS", config.bus.connect_timeout_s);
    }

    if (data.contains("worker") && data["worker"].is_object()) {
        const auto& worker = data["worker"];
        ApplyString(worker, "id", config.worker.id);
        ApplyString(worker, "moduleBase", config.worker.module_base);
        ApplyInt(worker, "maxPending", config.worker.max_pending);
        ApplyInt(worker, "executionTimeoutS", config.worker.execution_timeout_s);
        ApplyBool(worker, "inProcess", config.worker.in_process);
        ApplyString(worker, "sandboxCommand", config.worker.sandbox_command);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyInt(sandbox, "stackSizeKb", config.sandbox.stack_size_kb);
        ApplyInt(sandbox, "cacheCapacity", config.sandbox.cache_capacity);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ApplyString(data["log"], "level", config.log.level);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

void ApplyEnvString(const char* primary, const char* secondary, std::string& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void ApplyEnvInt(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void ApplyEnvOverrides(Config& config) {
    ApplyEnvString("HELIX_BUS__URL", "HELIX_NATS_URL", config.bus.url);
    ApplyEnvString("HELIX_BUS__TASK_SUBJECT", "HELIX_TASK_SUBJECT", config.bus.task_subject);
    ApplyEnvString("HELIX_BUS__QUEUE_GROUP", "HELIX_QUEUE_GROUP", config.bus.queue_group);
    ApplyEnvString("HELIX_BUS__PING_SUBJECT", "HELIX_PING_SUBJECT", config.bus.ping_subject);
    ApplyEnvInt("HELIX_BUS__CONNECT_TIMEOUT_S", "HELIX_CONNECT_TIMEOUT_S",
                config.bus.connect_timeout_s);

    ApplyEnvString("HELIX_WORKER__ID", "HELIX_WORKER_ID", config.worker.id);
    ApplyEnvString("HELIX_WORKER__MODULE_BASE", "HELIX_MODULE_BASE", config.worker.module_base);
    ApplyEnvInt("HELIX_WORKER__MAX_PENDING", "HELIX_MAX_PENDING", config.worker.max_pending);
    ApplyEnvInt("HELIX_WORKER__EXECUTION_TIMEOUT_S", "HELIX_EXECUTION_TIMEOUT_S",
                config.worker.execution_timeout_s);
    ApplyEnvString("HELIX_WORKER__SANDBOX_COMMAND", "HELIX_SANDBOX_COMMAND",
                   config.worker.sandbox_command);
    const auto in_process = GetEnvFallback("HELIX_WORKER__IN_PROCESS", "HELIX_IN_PROCESS");
    if (!in_process.empty()) {
        config.worker.in_process = ParseBool(in_process);
    }

    ApplyEnvInt("HELIX_SANDBOX__STACK_SIZE_KB", "HELIX_STACK_SIZE_KB", config.sandbox.stack_size_kb);
    ApplyEnvInt("HELIX_SANDBOX__CACHE_CAPACITY", "HELIX_CACHE_CAPACITY",
                config.sandbox.cache_capacity);

    ApplyEnvString("HELIX_LOG__LEVEL", "HELIX_LOG_LEVEL", config.log.level);
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("HELIX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".helix" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            helix::utils::LogWarn("config", "ignoring malformed " + path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);

    if (config.worker.max_pending < 1) {
        config.worker.max_pending = 1;
    }
    if (config.worker.execution_timeout_s < 0) {
        config.worker.execution_timeout_s = 0;
    }
    if (config.sandbox.cache_capacity < 0) {
        config.sandbox.cache_capacity = 0;
    }
    if (config.sandbox.stack_size_kb < 64) {
        config.sandbox.stack_size_kb = 64;
    }
    return config;
}

}  // namespace helix::config
