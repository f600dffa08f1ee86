#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "CredentialPrompt.h"
#include "Credentials.h"
#include "SecretStore.h"

namespace scrape_core::auth {

struct CredentialStoreOptions {
    // Holds credentials.json; defaults to ~/.scraper
    std::filesystem::path configDir;
    // Where prompted credentials go when the user asks to save them
    bool secure = true;
    bool allowPrompt = true;
    // KDF salt source; empty reads /etc/machine-id (or the host name)
    std::string machineId;

    static std::filesystem::path defaultConfigDir();

    // Keys: config_dir, secure_storage, allow_prompt
    static CredentialStoreOptions fromJson(const nlohmann::json& j);
};

/**
 * Resolves credentials for a caller-supplied key from, in order: the in-run
 * cache, the encrypted secret store, <configDir>/credentials.json and an
 * interactive prompt. Persisted copies are always sealed with a
 * CredentialCipher keyed on the credential key.
 */
class CredentialStore {
public:
    static constexpr const char* kService = "scrape_core";

    /**
     * @param secretStore Defaults to a FileSecretStore at its default path
     * @param prompt Defaults to a TerminalCredentialPrompt when prompting is allowed
     */
    explicit CredentialStore(CredentialStoreOptions options = {},
                             std::shared_ptr<SecretStore> secretStore = nullptr,
                             std::shared_ptr<CredentialPrompt> prompt = nullptr);

    /**
     * @throws common::CredentialUnavailableError when no source has the key
     */
    Credentials resolve(const std::string& key);

    /**
     * Seal and store credentials: secret store when secure, config file otherwise.
     * Never throws.
     * @return false on I/O or crypto failure (logged)
     */
    bool persist(const std::string& key, const Credentials& credentials, bool secure);

    // Drop the cached copy so the next resolve reads the sources again
    void forget(const std::string& key);

    const CredentialStoreOptions& options() const { return options_; }
    std::filesystem::path configFile() const;

private:
    std::optional<Credentials> fromSecretStore(const std::string& key);
    std::optional<Credentials> fromConfigFile(const std::string& key);
    std::optional<Credentials> unseal(const std::string& key, const std::string& blob, const std::string& source);
    bool storeInConfigFile(const std::string& key, const std::string& blob);

    CredentialStoreOptions options_;
    std::shared_ptr<SecretStore> secretStore_;
    std::shared_ptr<CredentialPrompt> prompt_;

    std::mutex mutex_;
    std::map<std::string, Credentials> cache_;
};

} // namespace scrape_core::auth
