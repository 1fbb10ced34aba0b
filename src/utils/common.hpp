#pragma once

#include <chrono>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace helix::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline long long NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Now().time_since_epoch()).count();
}

inline std::string GenerateId(std::size_t length = 8) {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

}  // namespace helix::utils
