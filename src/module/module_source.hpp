#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace helix::module {

// True for references that carry their own location: http(s)://, file://
// or an absolute filesystem path.
bool IsFullAddress(const std::string& ref);

// Joins a relative reference to the configured base location.
std::string ResolveModuleAddress(const std::string& base, const std::string& ref);

class ModuleSource {
public:
    virtual ~ModuleSource() = default;
    // Raw module bytes. Throws sandbox::FetchError.
    virtual std::vector<std::uint8_t> Fetch(const std::string& address) = 0;
};

// http:// and https:// through cpp-httplib, everything else from the local
// filesystem (file:// prefix stripped).
class DefaultModuleSource : public ModuleSource {
public:
    explicit DefaultModuleSource(int timeout_s = 30);
    std::vector<std::uint8_t> Fetch(const std::string& address) override;

private:
    std::vector<std::uint8_t> FetchHttp(const std::string& url);
    std::vector<std::uint8_t> FetchFile(const std::string& path);

    int timeout_s_;
};

}  // namespace helix::module
