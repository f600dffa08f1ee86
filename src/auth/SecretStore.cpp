#include "../../include/scrape_core/auth/SecretStore.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/Logger.h"
#include "UserFiles.h"

#include <cstdlib>

namespace scrape_core::auth {

namespace fs = std::filesystem;
using json = nlohmann::json;

FileSecretStore::FileSecretStore(fs::path path) : path_(std::move(path)) {
    LOG_DEBUG("FileSecretStore using " + path_.string());
}

fs::path FileSecretStore::defaultPath() {
    const char* dataHome = std::getenv("XDG_DATA_HOME");
    fs::path base = (dataHome && *dataHome) ? fs::path(dataHome)
                                            : homeDirectory() / ".local" / "share";
    return base / "scrape_core" / "secrets.json";
}

std::optional<std::string> FileSecretStore::get(const std::string& service, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto root = readJsonFile(path_);
        if (!root || !root->contains(service) || !(*root)[service].is_object()) {
            return std::nullopt;
        }
        const json& entries = (*root)[service];
        auto it = entries.find(key);
        if (it == entries.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    } catch (const common::ScrapeError& e) {
        LOG_WARNING("Secret store unreadable: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool FileSecretStore::put(const std::string& service, const std::string& key, const std::string& secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    json root = json::object();
    try {
        if (auto existing = readJsonFile(path_)) {
            root = *existing;
        }
    } catch (const common::ScrapeError& e) {
        LOG_ERROR("Refusing to overwrite unreadable secret store " + path_.string() + ": " + e.what());
        return false;
    }
    if (!root[service].is_object()) {
        root[service] = json::object();
    }
    root[service][key] = secret;
    return writePrivateFile(path_, root.dump(2));
}

bool FileSecretStore::remove(const std::string& service, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto root = readJsonFile(path_);
        if (!root || !root->contains(service) || !(*root)[service].is_object()) {
            return false;
        }
        if ((*root)[service].erase(key) == 0) {
            return false;
        }
        return writePrivateFile(path_, root->dump(2));
    } catch (const common::ScrapeError& e) {
        LOG_WARNING("Secret store unreadable: " + std::string(e.what()));
        return false;
    }
}

} // namespace scrape_core::auth
