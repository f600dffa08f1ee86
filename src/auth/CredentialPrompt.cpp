#include "../../include/scrape_core/auth/CredentialPrompt.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace scrape_core::auth {

namespace {

// Turns terminal echo off for its lifetime
class EchoGuard {
public:
    EchoGuard() {
        if (tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
        }
        if (!active_) {
            LOG_WARNING("Unable to disable terminal echo; the secret will be visible");
        }
    }

    ~EchoGuard() {
        if (active_) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
        }
    }

private:
    termios saved_{};
    bool active_ = false;
};

} // namespace

TerminalCredentialPrompt::TerminalCredentialPrompt()
    : in_(std::cin), out_(std::cout), terminal_(isatty(STDIN_FILENO) == 1) {}

TerminalCredentialPrompt::TerminalCredentialPrompt(std::istream& in, std::ostream& out)
    : in_(in), out_(out), terminal_(false) {}

std::optional<Credentials> TerminalCredentialPrompt::prompt(const std::string& key) {
    if (&in_ == &std::cin && !terminal_) {
        LOG_WARNING("Credentials for '" + key + "' requested but stdin is not a terminal");
        return std::nullopt;
    }

    Credentials credentials;
    out_ << "\nPlease enter credentials for " << key << ":\n";
    out_ << "Username: " << std::flush;
    if (!std::getline(in_, credentials.username)) {
        return std::nullopt;
    }

    out_ << "Password: " << std::flush;
    credentials.password = readSecret();
    if (!in_) {
        return std::nullopt;
    }

    out_ << "Save credentials for future use? (y/n): " << std::flush;
    std::string answer;
    if (std::getline(in_, answer)) {
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        credentials.save = answer == "y" || answer == "yes";
    }
    return credentials;
}

std::string TerminalCredentialPrompt::readSecret() {
    std::string secret;
    if (terminal_) {
        EchoGuard guard;
        std::getline(in_, secret);
        out_ << "\n";
    } else {
        std::getline(in_, secret);
    }
    return secret;
}

} // namespace scrape_core::auth
