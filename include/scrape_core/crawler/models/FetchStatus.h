#pragma once

#include <string>

namespace scrape_core::crawler {

// Outcome classification attached to every fetch result and fetch error
enum class FetchStatus {
    SUCCESS,       // 2xx response
    CLIENT_ERROR,  // 4xx response
    SERVER_ERROR,  // 5xx or otherwise unexpected status
    TIMEOUT,       // request exceeded its bounded timeout
    NETWORK_ERROR, // connection, DNS or TLS failure
    CANCELLED      // engine closed or caller cancelled while waiting
};

std::string fetchStatusToString(FetchStatus status);

// Map an HTTP status code onto SUCCESS / CLIENT_ERROR / SERVER_ERROR
FetchStatus classifyHttpStatus(int statusCode);

} // namespace scrape_core::crawler
