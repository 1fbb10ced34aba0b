#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace helix::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_log_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug" || lowered == "trace") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level = static_cast<int>(config.min_level);
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << tag << "]";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << " " << ToString(level);
    }
    std::cerr << " " << message << std::endl;
}

}  // namespace helix::utils
