#include "../../include/scrape_core/auth/LoginVerifier.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>

namespace scrape_core::auth {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::vector<std::string> lowered(std::vector<std::string> phrases) {
    for (auto& phrase : phrases) {
        phrase = toLower(phrase);
    }
    phrases.erase(std::remove(phrases.begin(), phrases.end(), std::string()), phrases.end());
    return phrases;
}

} // namespace

std::string loginVerdictToString(LoginVerdict verdict) {
    switch (verdict) {
        case LoginVerdict::Success: return "success";
        case LoginVerdict::Failure: return "failure";
        case LoginVerdict::Undecided: return "undecided";
    }
    return "unknown";
}

LoginVerifier::LoginVerifier()
    : LoginVerifier(defaultFailurePhrases(), defaultSuccessPhrases()) {}

LoginVerifier::LoginVerifier(std::vector<std::string> failurePhrases, std::vector<std::string> successPhrases)
    : failurePhrases_(lowered(std::move(failurePhrases))),
      successPhrases_(lowered(std::move(successPhrases))) {}

const std::vector<std::string>& LoginVerifier::defaultFailurePhrases() {
    static const std::vector<std::string> phrases = {
        "incorrect password",
        "login failed",
        "invalid credentials",
        "username or password is incorrect",
        "authentication failed"
    };
    return phrases;
}

const std::vector<std::string>& LoginVerifier::defaultSuccessPhrases() {
    static const std::vector<std::string> phrases = {
        "logout", "sign out", "account", "profile", "dashboard"
    };
    return phrases;
}

LoginVerdict LoginVerifier::classify(const std::string& content) const {
    const std::string text = toLower(content);
    for (const auto& phrase : failurePhrases_) {
        if (text.find(phrase) != std::string::npos) {
            LOG_DEBUG("Login failure phrase matched: '" + phrase + "'");
            return LoginVerdict::Failure;
        }
    }
    for (const auto& phrase : successPhrases_) {
        if (text.find(phrase) != std::string::npos) {
            LOG_DEBUG("Login success phrase matched: '" + phrase + "'");
            return LoginVerdict::Success;
        }
    }
    return LoginVerdict::Undecided;
}

bool LoginVerifier::verify(const std::string& content) const {
    switch (classify(content)) {
        case LoginVerdict::Success:
            return true;
        case LoginVerdict::Failure:
            return false;
        case LoginVerdict::Undecided:
            break;
    }
    LOG_WARNING("Login result matched no known phrase; assuming success");
    return true;
}

} // namespace scrape_core::auth
