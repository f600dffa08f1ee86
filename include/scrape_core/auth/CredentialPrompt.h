#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include "Credentials.h"

namespace scrape_core::auth {

// Last-resort credential source asked by CredentialStore
class CredentialPrompt {
public:
    virtual ~CredentialPrompt() = default;

    // nullopt when nobody can answer (no terminal, input closed)
    virtual std::optional<Credentials> prompt(const std::string& key) = 0;
};

/**
 * Interactive prompt on the controlling terminal. The secret is read with
 * echo disabled; the answer to "Save credentials" sets Credentials::save.
 */
class TerminalCredentialPrompt : public CredentialPrompt {
public:
    TerminalCredentialPrompt();
    // Streams other than stdin/stdout are never treated as a terminal
    TerminalCredentialPrompt(std::istream& in, std::ostream& out);

    std::optional<Credentials> prompt(const std::string& key) override;

private:
    std::string readSecret();

    std::istream& in_;
    std::ostream& out_;
    bool terminal_;
};

} // namespace scrape_core::auth
