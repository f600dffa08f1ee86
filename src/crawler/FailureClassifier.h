#pragma once

#include <string>
#include <curl/curl.h>
#include "../../include/scrape_core/crawler/models/FetchStatus.h"

namespace scrape_core::crawler {

class FailureClassifier {
public:
    /**
     * Classify a libcurl transfer failure
     * @param curlCode Result of curl_easy_perform (not CURLE_OK)
     * @param cancelled Whether the engine's cancellation token fired during the transfer
     * @return TIMEOUT, CANCELLED or NETWORK_ERROR
     */
    static FetchStatus classifyCurlError(CURLcode curlCode, bool cancelled);

    /**
     * Throw the typed FetchError matching a failed transfer.
     * @param status Result of classifyCurlError
     * @param url URL being fetched
     * @param detail Human-readable cause, logged and kept in the message
     */
    [[noreturn]] static void throwTransferError(FetchStatus status, const std::string& url, const std::string& detail);

    /**
     * Throw HttpStatusError for a completed response with a non-2xx status
     */
    [[noreturn]] static void throwStatusError(const std::string& url, int httpStatus, const std::string& body);

    // Message fragments reported by transports other than libcurl
    static FetchStatus classifyErrorMessage(const std::string& errorMessage);
};

} // namespace scrape_core::crawler
