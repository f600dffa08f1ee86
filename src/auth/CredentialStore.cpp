#include "../../include/scrape_core/auth/CredentialStore.h"
#include "../../include/scrape_core/auth/CredentialCipher.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/Logger.h"
#include "UserFiles.h"

namespace scrape_core::auth {

namespace fs = std::filesystem;
using json = nlohmann::json;
using common::ConfigurationError;
using common::CredentialUnavailableError;
using common::ScrapeError;

fs::path CredentialStoreOptions::defaultConfigDir() {
    return homeDirectory() / ".scraper";
}

CredentialStoreOptions CredentialStoreOptions::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Credential store configuration must be a JSON object");
    }
    CredentialStoreOptions options;
    try {
        if (j.contains("config_dir")) options.configDir = j["config_dir"].get<std::string>();
        options.secure = j.value("secure_storage", options.secure);
        options.allowPrompt = j.value("allow_prompt", options.allowPrompt);
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid credential store configuration: " + std::string(e.what()));
    }
    return options;
}

CredentialStore::CredentialStore(CredentialStoreOptions options,
                                 std::shared_ptr<SecretStore> secretStore,
                                 std::shared_ptr<CredentialPrompt> prompt)
    : options_(std::move(options)), secretStore_(std::move(secretStore)), prompt_(std::move(prompt)) {
    if (options_.configDir.empty()) {
        options_.configDir = CredentialStoreOptions::defaultConfigDir();
    }
    if (options_.machineId.empty()) {
        options_.machineId = CredentialCipher::machineIdentifier();
    }
    if (!secretStore_) {
        secretStore_ = std::make_shared<FileSecretStore>();
    }
    if (!prompt_ && options_.allowPrompt) {
        prompt_ = std::make_shared<TerminalCredentialPrompt>();
    }
}

fs::path CredentialStore::configFile() const {
    return options_.configDir / "credentials.json";
}

Credentials CredentialStore::resolve(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    std::optional<Credentials> found = fromSecretStore(key);
    if (found) {
        LOG_INFO("Credentials for '" + key + "' loaded from secret store");
    } else if ((found = fromConfigFile(key))) {
        LOG_INFO("Credentials for '" + key + "' loaded from " + configFile().string());
    } else if (options_.allowPrompt && prompt_) {
        LOG_INFO("No stored credentials found for '" + key + "', prompting user");
        found = prompt_->prompt(key);
        if (found && found->save) {
            if (!persist(key, *found, options_.secure)) {
                LOG_WARNING("Prompted credentials for '" + key + "' could not be saved");
            }
        }
    }

    if (!found) {
        LOG_ERROR("No credentials available for '" + key + "'");
        throw CredentialUnavailableError(key);
    }

    found->save = false;
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = *found;
    return *found;
}

bool CredentialStore::persist(const std::string& key, const Credentials& credentials, bool secure) {
    try {
        CredentialCipher cipher(key, options_.machineId);
        const std::string blob = cipher.seal(credentials.toJson().dump());

        bool stored = secure ? secretStore_->put(kService, key, blob)
                             : storeInConfigFile(key, blob);
        if (!stored) {
            LOG_ERROR("Failed to store credentials for '" + key + "' in " +
                      (secure ? std::string("secret store") : configFile().string()));
            return false;
        }

        Credentials cached = credentials;
        cached.save = false;
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[key] = cached;
        LOG_INFO("Credentials for '" + key + "' saved to " +
                 (secure ? std::string("secret store") : configFile().string()));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to persist credentials for '" + key + "': " + e.what());
        return false;
    }
}

void CredentialStore::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(key);
}

std::optional<Credentials> CredentialStore::fromSecretStore(const std::string& key) {
    if (!secretStore_) {
        return std::nullopt;
    }
    auto blob = secretStore_->get(kService, key);
    if (!blob) {
        return std::nullopt;
    }
    return unseal(key, *blob, "secret store");
}

std::optional<Credentials> CredentialStore::fromConfigFile(const std::string& key) {
    std::optional<json> root;
    try {
        root = readJsonFile(configFile());
    } catch (const ScrapeError& e) {
        LOG_WARNING("Failed to read credentials config: " + std::string(e.what()));
        return std::nullopt;
    }
    if (!root || !root->contains(key)) {
        return std::nullopt;
    }

    const json& entry = (*root)[key];
    if (entry.is_object() && entry.contains("encrypted") && entry["encrypted"].is_string()) {
        return unseal(key, entry["encrypted"].get<std::string>(), configFile().string());
    }
    try {
        return Credentials::fromJson(entry);
    } catch (const ConfigurationError& e) {
        LOG_WARNING("Skipping credentials entry '" + key + "' in " + configFile().string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<Credentials> CredentialStore::unseal(const std::string& key,
                                                   const std::string& blob,
                                                   const std::string& source) {
    try {
        CredentialCipher cipher(key, options_.machineId);
        auto plaintext = cipher.open(blob);
        if (!plaintext) {
            LOG_WARNING("Credentials for '" + key + "' in " + source + " could not be decrypted");
            return std::nullopt;
        }
        return Credentials::fromJson(json::parse(*plaintext));
    } catch (const json::exception& e) {
        LOG_WARNING("Corrupt credentials for '" + key + "' in " + source + ": " + e.what());
    } catch (const ScrapeError& e) {
        LOG_WARNING("Unusable credentials for '" + key + "' in " + source + ": " + e.what());
    }
    return std::nullopt;
}

bool CredentialStore::storeInConfigFile(const std::string& key, const std::string& blob) {
    json root = json::object();
    try {
        if (auto existing = readJsonFile(configFile())) {
            root = *existing;
        }
    } catch (const ScrapeError& e) {
        LOG_ERROR("Refusing to overwrite unreadable " + configFile().string() + ": " + e.what());
        return false;
    }
    root[key] = {{"encrypted", blob}};
    return writePrivateFile(configFile(), root.dump(2));
}

} // namespace scrape_core::auth
