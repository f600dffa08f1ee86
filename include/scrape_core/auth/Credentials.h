#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace scrape_core::auth {

struct Credentials {
    std::string username;
    std::string password;
    // Set by an interactive prompt when the user asked to keep them
    bool save = false;

    bool empty() const { return username.empty() && password.empty(); }

    // {"username": ..., "password": ...}; the save flag is never serialized
    nlohmann::json toJson() const;

    // Throws ConfigurationError unless both fields are strings
    static Credentials fromJson(const nlohmann::json& j);
};

} // namespace scrape_core::auth
