#include "../../include/scrape_core/auth/SessionNegotiator.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/scrape_core/common/UrlUtils.h"
#include "../../include/Logger.h"
#include "CsrfTokenExtractor.h"

namespace scrape_core::auth {

using namespace scrape_core::common;
using crawler::FetchEngine;
using crawler::FetchResult;
using crawler::FormField;
using crawler::LoginForm;
using crawler::SessionHandle;
using json = nlohmann::json;

void FieldMap::validate() const {
    if (username.empty()) {
        throw ConfigurationError("Login field map is missing the 'username' locator");
    }
    if (password.empty()) {
        throw ConfigurationError("Login field map is missing the 'password' locator");
    }
}

FieldMap FieldMap::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Login field map must be a JSON object");
    }
    FieldMap map;
    try {
        map.username = j.value("username", "");
        map.password = j.value("password", "");
        map.submit = j.value("submit", "");
        map.action = j.value("action", "");
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid login field map: " + std::string(e.what()));
    }
    map.validate();
    return map;
}

LoginConfig LoginConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Login configuration must be a JSON object");
    }
    LoginConfig config;
    try {
        config.loginUrl = j.value("login_url", "");
        config.credentialsKey = j.value("credentials_key", "");
        config.verifier = LoginVerifier(
            j.value("failure_phrases", LoginVerifier::defaultFailurePhrases()),
            j.value("success_phrases", LoginVerifier::defaultSuccessPhrases()));
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid login configuration: " + std::string(e.what()));
    }
    if (config.loginUrl.empty()) {
        throw ConfigurationError("Login configuration requires 'login_url'");
    }
    if (config.credentialsKey.empty()) {
        throw ConfigurationError("Login configuration requires 'credentials_key'");
    }
    if (!j.contains("form_selectors")) {
        throw ConfigurationError("Login configuration requires 'form_selectors'");
    }
    config.fieldMap = FieldMap::fromJson(j["form_selectors"]);
    return config;
}

SessionNegotiator::SessionNegotiator(LoginVerifier verifier, std::shared_ptr<const sites::SiteAdapter> adapter)
    : verifier_(std::move(verifier)), adapter_(std::move(adapter)) {}

SessionHandle SessionNegotiator::login(FetchEngine& engine,
                                       const std::string& loginUrl,
                                       const FieldMap& fieldMap,
                                       const Credentials& credentials) {
    fieldMap.validate();
    LOG_INFO("Logging in at " + loginUrl + " via " + crawler::transportKindToString(engine.transport()));

    FetchResult page;
    try {
        page = engine.fetch(loginUrl);
    } catch (const FetchError& e) {
        LOG_ERROR("Failed to load login page " + loginUrl + ": " + e.what());
        throw AuthenticationError("Authentication failed: could not load login page: " + std::string(e.what()));
    }

    LoginForm form;
    form.pageUrl = page.finalUrl;
    if (!fieldMap.action.empty()) {
        form.actionUrl = isAbsoluteUrl(fieldMap.action) ? fieldMap.action
                                                        : resolveUrl(page.finalUrl, fieldMap.action);
    }
    form.fields.push_back(FormField{"username", fieldMap.username, credentials.username});
    form.fields.push_back(FormField{"password", fieldMap.password, credentials.password});
    form.submitLocator = fieldMap.submit;
    form.passwordLocator = fieldMap.password;

    if (auto token = extractCsrfToken(page.content)) {
        LOG_DEBUG("Forwarding CSRF token as '" + token->fieldName + "'");
        form.hiddenFields.emplace_back(token->fieldName, token->value);
    }

    FetchResult result;
    try {
        result = engine.submitForm(form);
    } catch (const FetchError& e) {
        LOG_ERROR("Login submission failed: " + std::string(e.what()));
        throw AuthenticationError("Authentication failed: " + std::string(e.what()));
    }

    if (!loginSucceeded(result)) {
        LOG_ERROR("Login failed - verification check did not pass for " + result.finalUrl);
        throw AuthenticationError("Login failed - verification check did not pass");
    }

    SessionHandle session = engine.exportSession();
    LOG_INFO("Authentication successful (" + std::to_string(session.cookies.size()) + " cookies)");
    return session;
}

SessionHandle SessionNegotiator::login(FetchEngine& engine,
                                       const std::string& loginUrl,
                                       const FieldMap& fieldMap,
                                       CredentialStore& store,
                                       const std::string& key) {
    fieldMap.validate();
    Credentials credentials = store.resolve(key);
    return login(engine, loginUrl, fieldMap, credentials);
}

SessionHandle SessionNegotiator::login(FetchEngine& engine, const LoginConfig& config, CredentialStore& store) {
    return login(engine, config.loginUrl, config.fieldMap, store, config.credentialsKey);
}

bool SessionNegotiator::loginSucceeded(const FetchResult& result) const {
    if (adapter_) {
        auto verdict = adapter_->verifyLogin(result.content, result.finalUrl);
        if (verdict != LoginVerdict::Undecided) {
            LOG_DEBUG("Site adapter login verdict: " + loginVerdictToString(verdict));
            return verdict == LoginVerdict::Success;
        }
    }
    return verifier_.verify(result.content);
}

} // namespace scrape_core::auth
