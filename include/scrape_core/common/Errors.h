#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include "../crawler/models/FetchStatus.h"

namespace scrape_core::common {

// Root of every error raised by the fetch and session layer
class ScrapeError : public std::runtime_error {
public:
    explicit ScrapeError(const std::string& message) : std::runtime_error(message) {}
};

class FetchError : public ScrapeError {
public:
    FetchError(const std::string& message,
               crawler::FetchStatus status,
               std::string url,
               int httpStatus = 0)
        : ScrapeError(message), status_(status), url_(std::move(url)), httpStatus_(httpStatus) {}

    crawler::FetchStatus status() const { return status_; }
    const std::string& url() const { return url_; }
    int httpStatus() const { return httpStatus_; }

private:
    crawler::FetchStatus status_;
    std::string url_;
    int httpStatus_;
};

// Connection, DNS or TLS failure
class NetworkError : public FetchError {
public:
    NetworkError(const std::string& message, std::string url)
        : FetchError(message, crawler::FetchStatus::NETWORK_ERROR, std::move(url)) {}
};

// Non-2xx response; status() is CLIENT_ERROR or SERVER_ERROR
class HttpStatusError : public FetchError {
public:
    HttpStatusError(const std::string& message, std::string url, int httpStatus, std::string body = "")
        : FetchError(message, crawler::classifyHttpStatus(httpStatus), std::move(url), httpStatus),
          body_(std::move(body)) {}

    const std::string& body() const { return body_; }

private:
    std::string body_;
};

class TimeoutError : public FetchError {
public:
    TimeoutError(const std::string& message, std::string url)
        : FetchError(message, crawler::FetchStatus::TIMEOUT, std::move(url)) {}
};

class CancelledError : public FetchError {
public:
    CancelledError(const std::string& message, std::string url)
        : FetchError(message, crawler::FetchStatus::CANCELLED, std::move(url)) {}
};

// Login verification failed or no usable credentials
class AuthenticationError : public ScrapeError {
public:
    explicit AuthenticationError(const std::string& message) : ScrapeError(message) {}
};

class CredentialUnavailableError : public AuthenticationError {
public:
    explicit CredentialUnavailableError(const std::string& key)
        : AuthenticationError("No credentials available for key '" + key + "'"), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Malformed field map, missing required settings, bad registry usage
class ConfigurationError : public ScrapeError {
public:
    explicit ConfigurationError(const std::string& message) : ScrapeError(message) {}
};

} // namespace scrape_core::common
