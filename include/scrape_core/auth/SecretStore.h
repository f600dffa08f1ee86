#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace scrape_core::auth {

// Storage for sealed credential blobs, addressed by service and key
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual std::optional<std::string> get(const std::string& service, const std::string& key) = 0;
    // false on I/O failure; never throws
    virtual bool put(const std::string& service, const std::string& key, const std::string& secret) = 0;
    virtual bool remove(const std::string& service, const std::string& key) = 0;
};

/**
 * Secret store backed by a JSON file readable only by its owner (0600):
 * {"<service>": {"<key>": "<sealed blob>"}}
 */
class FileSecretStore : public SecretStore {
public:
    explicit FileSecretStore(std::filesystem::path path = defaultPath());

    std::optional<std::string> get(const std::string& service, const std::string& key) override;
    bool put(const std::string& service, const std::string& key, const std::string& secret) override;
    bool remove(const std::string& service, const std::string& key) override;

    const std::filesystem::path& path() const { return path_; }

    // $XDG_DATA_HOME/scrape_core/secrets.json, else ~/.local/share/scrape_core/secrets.json
    static std::filesystem::path defaultPath();

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace scrape_core::auth
