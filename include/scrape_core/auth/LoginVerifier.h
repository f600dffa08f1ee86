#pragma once

#include <string>
#include <vector>

namespace scrape_core::auth {

enum class LoginVerdict {
    Success,
    Failure,
    Undecided
};

std::string loginVerdictToString(LoginVerdict verdict);

/**
 * Phrase heuristic over the page returned by a login submission.
 * Matching is case-insensitive; failure phrases win over success phrases.
 * A page matching neither is treated as success, which is known to be weak.
 */
class LoginVerifier {
public:
    LoginVerifier();
    LoginVerifier(std::vector<std::string> failurePhrases, std::vector<std::string> successPhrases);

    static const std::vector<std::string>& defaultFailurePhrases();
    static const std::vector<std::string>& defaultSuccessPhrases();

    // Undecided when no phrase matches
    LoginVerdict classify(const std::string& content) const;

    // classify() with Undecided resolved to success (logged as a warning)
    bool verify(const std::string& content) const;

    const std::vector<std::string>& failurePhrases() const { return failurePhrases_; }
    const std::vector<std::string>& successPhrases() const { return successPhrases_; }

private:
    std::vector<std::string> failurePhrases_;
    std::vector<std::string> successPhrases_;
};

} // namespace scrape_core::auth
