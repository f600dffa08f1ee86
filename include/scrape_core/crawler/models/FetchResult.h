#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "FetchStatus.h"
#include "FetchConfig.h"
#include "../SessionHandle.h"

namespace scrape_core::crawler {

// Produced once per completed fetch and handed out by value
struct FetchResult {
    std::string url;
    std::string finalUrl;
    std::string content;
    std::string contentType;
    int statusCode = 0;
    FetchStatus status = FetchStatus::SUCCESS;
    TransportKind transport = TransportKind::HTTP;

    // Cookies set or changed by this response
    std::vector<Cookie> newCookies;

    std::chrono::milliseconds elapsed{0};

    bool success() const { return status == FetchStatus::SUCCESS; }
};

} // namespace scrape_core::crawler
