#include "module/module_cache.hpp"

#include "utils/logging.hpp"

namespace helix::module {

ModuleCache::ModuleCache(ModuleSource& source, std::size_t capacity)
    : source_(source)
    , capacity_(capacity) {}

std::shared_ptr<const helix::sandbox::CompiledModule> ModuleCache::Resolve(const std::string& address) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(address);
        if (it != index_.end()) {
            entries_.splice(entries_.begin(), entries_, it->second);
            return it->second->second;
        }
    }

    helix::utils::LogInfo("cache", "loading " + address);
    auto bytes = source_.Fetch(address);
    auto module = helix::sandbox::CompiledModule::Compile(address, std::move(bytes));
    Store(module);
    return module;
}

void ModuleCache::Store(std::shared_ptr<const helix::sandbox::CompiledModule> module) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& address = module->Address();
    auto it = index_.find(address);
    if (it != index_.end()) {
        it->second->second = module;
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }
    entries_.emplace_front(address, std::move(module));
    index_[entries_.front().first] = entries_.begin();
    if (capacity_ > 0 && entries_.size() > capacity_) {
        helix::utils::LogDebug("cache", "evicting " + entries_.back().first);
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

void ModuleCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

std::size_t ModuleCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool ModuleCache::Contains(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(address) > 0;
}

}  // namespace helix::module
