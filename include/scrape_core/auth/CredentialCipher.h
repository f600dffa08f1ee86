#pragma once

#include <array>
#include <optional>
#include <string>

namespace scrape_core::auth {

/**
 * AES-256-GCM sealing of credential payloads. The key is derived with
 * PBKDF2-HMAC-SHA256 from the credential key (never from the secret itself)
 * salted with the local machine identifier.
 *
 * Sealed blob: base64("v1" || IV(12) || tag(16) || ciphertext)
 */
class CredentialCipher {
public:
    static constexpr int kIterations = 100000;
    static constexpr size_t kSaltLength = 16;
    static constexpr size_t kKeyLength = 32;
    static constexpr size_t kIvLength = 12;
    static constexpr size_t kTagLength = 16;

    /**
     * @param credentialKey Stable per-target label used as the KDF password
     * @param machineId Salt source; empty uses machineIdentifier()
     * @throws common::ScrapeError if key derivation fails
     */
    explicit CredentialCipher(const std::string& credentialKey, const std::string& machineId = "");

    // @throws common::ScrapeError on OpenSSL failure
    std::string seal(const std::string& plaintext) const;

    // nullopt for malformed, tampered or foreign-key blobs
    std::optional<std::string> open(const std::string& blob) const;

    // /etc/machine-id, else the host name
    static std::string machineIdentifier();

    // First 16 bytes of the machine id, right-padded with '0'
    static std::string saltFor(const std::string& machineId);

    static std::string base64Encode(const std::string& data);
    static std::optional<std::string> base64Decode(const std::string& encoded);

private:
    std::array<unsigned char, kKeyLength> key_{};
};

} // namespace scrape_core::auth
