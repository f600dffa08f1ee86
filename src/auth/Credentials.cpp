#include "../../include/scrape_core/auth/Credentials.h"
#include "../../include/scrape_core/common/Errors.h"

namespace scrape_core::auth {

nlohmann::json Credentials::toJson() const {
    return {
        {"username", username},
        {"password", password}
    };
}

Credentials Credentials::fromJson(const nlohmann::json& j) {
    if (!j.is_object() ||
        !j.contains("username") || !j["username"].is_string() ||
        !j.contains("password") || !j["password"].is_string()) {
        throw common::ConfigurationError("Credentials entry needs string 'username' and 'password' fields");
    }
    Credentials credentials;
    credentials.username = j["username"].get<std::string>();
    credentials.password = j["password"].get<std::string>();
    return credentials;
}

} // namespace scrape_core::auth
