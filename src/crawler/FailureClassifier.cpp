#include "FailureClassifier.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>

namespace scrape_core::crawler {

using namespace scrape_core::common;

std::string fetchStatusToString(FetchStatus status) {
    switch (status) {
        case FetchStatus::SUCCESS: return "success";
        case FetchStatus::CLIENT_ERROR: return "client-error";
        case FetchStatus::SERVER_ERROR: return "server-error";
        case FetchStatus::TIMEOUT: return "timeout";
        case FetchStatus::NETWORK_ERROR: return "network-error";
        case FetchStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

FetchStatus classifyHttpStatus(int statusCode) {
    if (statusCode >= 200 && statusCode < 300) {
        return FetchStatus::SUCCESS;
    }
    if (statusCode >= 400 && statusCode < 500) {
        return FetchStatus::CLIENT_ERROR;
    }
    // 5xx, and anything left unresolved such as 3xx without redirect following
    return FetchStatus::SERVER_ERROR;
}

FetchStatus FailureClassifier::classifyCurlError(CURLcode curlCode, bool cancelled) {
    if (cancelled) {
        return FetchStatus::CANCELLED;
    }
    if (curlCode == CURLE_OPERATION_TIMEDOUT) {
        return FetchStatus::TIMEOUT;
    }
    return FetchStatus::NETWORK_ERROR;
}

void FailureClassifier::throwTransferError(FetchStatus status, const std::string& url, const std::string& detail) {
    switch (status) {
        case FetchStatus::TIMEOUT:
            LOG_WARNING("Timeout fetching " + url + ": " + detail);
            throw TimeoutError("Timed out fetching " + url + ": " + detail, url);
        case FetchStatus::CANCELLED:
            LOG_INFO("Fetch cancelled: " + url);
            throw CancelledError("Fetch cancelled: " + url, url);
        default:
            LOG_ERROR("Network error fetching " + url + ": " + detail);
            throw NetworkError("Failed to fetch " + url + ": " + detail, url);
    }
}

void FailureClassifier::throwStatusError(const std::string& url, int httpStatus, const std::string& body) {
    if (httpStatus >= 500) {
        LOG_ERROR("HTTP SERVER ERROR (" + std::to_string(httpStatus) + "): " + url);
    } else {
        LOG_WARNING("HTTP CLIENT ERROR (" + std::to_string(httpStatus) + "): " + url);
    }
    throw HttpStatusError("HTTP error " + std::to_string(httpStatus) + " when fetching " + url, url, httpStatus, body);
}

FetchStatus FailureClassifier::classifyErrorMessage(const std::string& errorMessage) {
    std::string lowerError = errorMessage;
    std::transform(lowerError.begin(), lowerError.end(), lowerError.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerError.find("timeout") != std::string::npos ||
        lowerError.find("timed out") != std::string::npos) {
        return FetchStatus::TIMEOUT;
    }
    return FetchStatus::NETWORK_ERROR;
}

} // namespace scrape_core::crawler
