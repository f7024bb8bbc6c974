#include "engine.hpp"
#include "errors.hpp"
#include <algorithm>

namespace execrelay {

EngineRegistry& EngineRegistry::instance() {
    static EngineRegistry registry;
    return registry;
}

void EngineRegistry::register_engine(EngineDescriptor descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = descriptor.id;
    engines_[id] = std::move(descriptor);
}

EngineDescriptor EngineRegistry::resolve(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = engines_.find(id);
    if (it == engines_.end()) {
        throw ConfigError("Unknown engine: " + id);
    }
    return it->second;
}

bool EngineRegistry::has_engine(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.count(id) > 0;
}

std::vector<std::string> EngineRegistry::engine_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(engines_.size());
    for (const auto& [id, _] : engines_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace execrelay
