#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "CredentialStore.h"
#include "Credentials.h"
#include "LoginVerifier.h"
#include "../crawler/FetchEngine.h"
#include "../crawler/SessionHandle.h"
#include "../sites/SiteAdapter.h"

namespace scrape_core::auth {

// Locators of the login form, as configured per site
struct FieldMap {
    std::string username;
    std::string password;
    // Optional; without it the form is submitted by Enter in the password field
    std::string submit;
    // Optional form action URL (absolute or relative to the login page)
    std::string action;

    // @throws common::ConfigurationError if username or password is missing
    void validate() const;

    // {"username": "#user", "password": "#pass", "submit": "#go", "action": "/session"}
    static FieldMap fromJson(const nlohmann::json& j);
};

struct LoginConfig {
    std::string loginUrl;
    FieldMap fieldMap;
    std::string credentialsKey;
    // Default phrase lists unless failure_phrases / success_phrases are configured
    LoginVerifier verifier;

    // Keys: login_url, form_selectors, credentials_key, failure_phrases, success_phrases
    static LoginConfig fromJson(const nlohmann::json& j);
};

/**
 * Establishes an authenticated session on a FetchEngine: loads the login
 * page, forwards any CSRF token, submits the credentials through the
 * engine and checks the result page before handing back the session.
 */
class SessionNegotiator {
public:
    explicit SessionNegotiator(LoginVerifier verifier = LoginVerifier(),
                               std::shared_ptr<const sites::SiteAdapter> adapter = nullptr);

    /**
     * @return Snapshot of the engine's session after a verified login
     * @throws common::AuthenticationError when the login is rejected or a fetch fails
     * @throws common::ConfigurationError for an incomplete field map
     */
    crawler::SessionHandle login(crawler::FetchEngine& engine,
                                 const std::string& loginUrl,
                                 const FieldMap& fieldMap,
                                 const Credentials& credentials);

    // Resolves credentials for key first; CredentialUnavailableError propagates
    crawler::SessionHandle login(crawler::FetchEngine& engine,
                                 const std::string& loginUrl,
                                 const FieldMap& fieldMap,
                                 CredentialStore& store,
                                 const std::string& key);

    crawler::SessionHandle login(crawler::FetchEngine& engine,
                                 const LoginConfig& config,
                                 CredentialStore& store);

    void setSiteAdapter(std::shared_ptr<const sites::SiteAdapter> adapter) { adapter_ = std::move(adapter); }
    const LoginVerifier& verifier() const { return verifier_; }

private:
    bool loginSucceeded(const crawler::FetchResult& result) const;

    LoginVerifier verifier_;
    std::shared_ptr<const sites::SiteAdapter> adapter_;
};

} // namespace scrape_core::auth
