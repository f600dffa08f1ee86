#include "../../include/scrape_core/sites/AdapterRegistry.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/Logger.h"

namespace scrape_core::sites {

using common::ConfigurationError;

void AdapterRegistry::add(const std::string& id, AdapterFactory factory) {
    if (id.empty()) {
        throw ConfigurationError("Site adapter id must not be empty");
    }
    if (!factory) {
        throw ConfigurationError("Site adapter '" + id + "' registered without a factory");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!factories_.emplace(id, std::move(factory)).second) {
        throw ConfigurationError("Site adapter '" + id + "' is already registered");
    }
    LOG_DEBUG("Registered adapter for site: " + id);
}

std::unique_ptr<SiteAdapter> AdapterRegistry::create(const std::string& id, const nlohmann::json& config) const {
    AdapterFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(id);
        if (it == factories_.end()) {
            LOG_WARNING("No adapter found for site " + id);
            throw ConfigurationError("No site adapter registered for '" + id + "'");
        }
        factory = it->second;
    }
    auto adapter = factory(config);
    if (!adapter) {
        throw ConfigurationError("Factory for site adapter '" + id + "' returned nothing");
    }
    return adapter;
}

bool AdapterRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(id) > 0;
}

std::vector<std::string> AdapterRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [id, factory] : factories_) {
        result.push_back(id);
    }
    return result;
}

size_t AdapterRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.size();
}

} // namespace scrape_core::sites
