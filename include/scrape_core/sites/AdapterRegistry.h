#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "SiteAdapter.h"

namespace scrape_core::sites {

using AdapterFactory = std::function<std::unique_ptr<SiteAdapter>(const nlohmann::json& config)>;

// Caller-owned table of site adapters keyed by site id
class AdapterRegistry {
public:
    // @throws common::ConfigurationError for an empty or already registered id
    void add(const std::string& id, AdapterFactory factory);

    // @throws common::ConfigurationError for an unknown id
    std::unique_ptr<SiteAdapter> create(const std::string& id, const nlohmann::json& config = nlohmann::json::object()) const;

    bool contains(const std::string& id) const;

    // Sorted
    std::vector<std::string> ids() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, AdapterFactory> factories_;
};

} // namespace scrape_core::sites
