#include "module/module_source.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

#include "httplib.h"
#include "sandbox/errors.hpp"
#include "utils/logging.hpp"

namespace helix::module {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path;
};

bool StartsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (StartsWith(working, "https://")) {
        parsed.https = true;
        working = working.substr(8);
    } else if (StartsWith(working, "http://")) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
    } else {
        parsed.path = "/";
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::logic_error&) {
            throw helix::sandbox::FetchError("invalid port in " + url);
        }
    } else {
        parsed.host = host_port;
    }
    return parsed;
}

}  // namespace

bool IsFullAddress(const std::string& ref) {
    return StartsWith(ref, "http://") || StartsWith(ref, "https://")
        || StartsWith(ref, "file://") || StartsWith(ref, "/");
}

std::string ResolveModuleAddress(const std::string& base, const std::string& ref) {
    if (IsFullAddress(ref) || base.empty()) {
        return ref;
    }
    if (base.back() == '/') {
        return base + ref;
    }
    return base + "/" + ref;
}

DefaultModuleSource::DefaultModuleSource(int timeout_s)
    : timeout_s_(timeout_s) {}

std::vector<std::uint8_t> DefaultModuleSource::Fetch(const std::string& address) {
    if (StartsWith(address, "http://") || StartsWith(address, "https://")) {
        return FetchHttp(address);
    }
    if (StartsWith(address, "file://")) {
        return FetchFile(address.substr(7));
    }
    return FetchFile(address);
}

std::vector<std::uint8_t> DefaultModuleSource::FetchHttp(const std::string& url) {
    const auto parsed = ParseUrl(url);
    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);

    httplib::Client client(scheme_host_port);
    client.set_connection_timeout(timeout_s_);
    client.set_read_timeout(timeout_s_);
    client.set_follow_location(true);

    helix::utils::LogDebug("fetch", "GET " + scheme_host_port + parsed.path);
    auto response = client.Get(parsed.path);
    if (!response) {
        throw helix::sandbox::FetchError(
            "Failed to fetch WASM: " + url + " (" + httplib::to_string(response.error()) + ")");
    }
    if (response->status < 200 || response->status >= 300) {
        throw helix::sandbox::FetchError(
            "Failed to fetch WASM: " + url + " (HTTP " + std::to_string(response->status) + ")");
    }
    return std::vector<std::uint8_t>(response->body.begin(), response->body.end());
}

std::vector<std::uint8_t> DefaultModuleSource::FetchFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw helix::sandbox::FetchError("Failed to fetch WASM: " + path + " (not found)");
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw helix::sandbox::FetchError("Failed to fetch WASM: " + path + " (cannot open)");
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)),
                                    std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw helix::sandbox::FetchError("Failed to fetch WASM: " + path + " (read error)");
    }
    return bytes;
}

}  // namespace helix::module
