#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "module/module_source.hpp"
#include "sandbox/compiled_module.hpp"

namespace helix::module {

// Compiled modules keyed by resolved address. Entries are immutable and
// shared; executions instantiate their own copy. Two threads resolving the
// same uncached address may both compile it; the later store wins.
class ModuleCache {
public:
    // capacity 0 keeps every entry.
    ModuleCache(ModuleSource& source, std::size_t capacity);

    // Throws sandbox::FetchError or sandbox::CompileError.
    std::shared_ptr<const helix::sandbox::CompiledModule> Resolve(const std::string& address);

    void Clear();
    std::size_t Size() const;
    bool Contains(const std::string& address) const;

private:
    using Entry = std::pair<std::string, std::shared_ptr<const helix::sandbox::CompiledModule>>;

    void Store(std::shared_ptr<const helix::sandbox::CompiledModule> module);

    ModuleSource& source_;
    std::size_t capacity_;
    mutable std::mutex mutex_;
    // Most recently resolved first.
    std::list<Entry> entries_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

}  // namespace helix::module
