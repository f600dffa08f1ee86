#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "../auth/LoginVerifier.h"

namespace scrape_core::sites {

/**
 * Site-specific knowledge supplied by the caller. The core only ever
 * consults verifyLogin(); the extraction hooks are for downstream consumers
 * of fetched pages.
 */
class SiteAdapter {
public:
    virtual ~SiteAdapter() = default;

    // e.g. "product_list", "product_detail", "generic"
    virtual std::string classifyPage(const std::string& content, const std::string& url) const = 0;

    virtual nlohmann::json extractList(const std::string& content, const std::string& url) const = 0;
    virtual nlohmann::json extractDetail(const std::string& content, const std::string& url) const = 0;
    virtual nlohmann::json extractGeneric(const std::string& content, const std::string& url) const = 0;

    // Definitive verdict on a login result page; Undecided defers to the phrase heuristic
    virtual auth::LoginVerdict verifyLogin(const std::string& content, const std::string& url) const {
        (void)content;
        (void)url;
        return auth::LoginVerdict::Undecided;
    }
};

} // namespace scrape_core::sites
