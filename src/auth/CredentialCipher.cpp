#include "../../include/scrape_core/auth/CredentialCipher.h"
#include "../../include/scrape_core/common/Errors.h"
#include "../../include/Logger.h"

#include <fstream>
#include <memory>
#include <vector>
#include <unistd.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace scrape_core::auth {

using common::ScrapeError;

namespace {

const std::string kBlobMagic = "v1";

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherContext newContext() {
    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw ScrapeError("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace

CredentialCipher::CredentialCipher(const std::string& credentialKey, const std::string& machineId) {
    const std::string salt = saltFor(machineId.empty() ? machineIdentifier() : machineId);
    int rc = PKCS5_PBKDF2_HMAC(credentialKey.data(), static_cast<int>(credentialKey.size()),
                               reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                               kIterations, EVP_sha256(),
                               static_cast<int>(key_.size()), key_.data());
    if (rc != 1) {
        LOG_ERROR("PBKDF2 key derivation failed");
        throw ScrapeError("PBKDF2 key derivation failed");
    }
}

std::string CredentialCipher::seal(const std::string& plaintext) const {
    unsigned char iv[kIvLength];
    if (RAND_bytes(iv, static_cast<int>(kIvLength)) != 1) {
        throw ScrapeError("RAND_bytes failed");
    }

    CipherContext ctx = newContext();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLength), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) != 1) {
        throw ScrapeError("AES-256-GCM encryption setup failed");
    }

    std::vector<unsigned char> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw ScrapeError("AES-256-GCM encryption failed");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        throw ScrapeError("AES-256-GCM finalization failed");
    }
    total += len;

    unsigned char tag[kTagLength];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLength), tag) != 1) {
        throw ScrapeError("AES-256-GCM tag retrieval failed");
    }

    std::string blob = kBlobMagic;
    blob.append(reinterpret_cast<const char*>(iv), kIvLength);
    blob.append(reinterpret_cast<const char*>(tag), kTagLength);
    blob.append(reinterpret_cast<const char*>(ciphertext.data()), static_cast<size_t>(total));
    return base64Encode(blob);
}

std::optional<std::string> CredentialCipher::open(const std::string& encoded) const {
    auto blob = base64Decode(encoded);
    if (!blob) {
        LOG_DEBUG("Credential blob is not valid base64");
        return std::nullopt;
    }
    const size_t header = kBlobMagic.size() + kIvLength + kTagLength;
    if (blob->size() < header || blob->compare(0, kBlobMagic.size(), kBlobMagic) != 0) {
        LOG_DEBUG("Credential blob has an unknown format");
        return std::nullopt;
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(blob->data());
    const unsigned char* iv = bytes + kBlobMagic.size();
    const unsigned char* tag = iv + kIvLength;
    const unsigned char* ciphertext = tag + kTagLength;
    const int ciphertextLength = static_cast<int>(blob->size() - header);

    CipherContext ctx = newContext();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLength), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) != 1) {
        LOG_WARNING("AES-256-GCM decryption setup failed");
        return std::nullopt;
    }

    std::vector<unsigned char> plaintext(static_cast<size_t>(ciphertextLength) + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext, ciphertextLength) != 1) {
        return std::nullopt;
    }
    total = len;

    // GCM tag must be set before finalization verifies it
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLength),
                            const_cast<unsigned char*>(tag)) != 1) {
        return std::nullopt;
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) <= 0) {
        LOG_DEBUG("Credential blob failed authentication");
        return std::nullopt;
    }
    total += len;
    return std::string(reinterpret_cast<const char*>(plaintext.data()), static_cast<size_t>(total));
}

std::string CredentialCipher::machineIdentifier() {
    std::ifstream file("/etc/machine-id");
    if (file) {
        std::string id;
        std::getline(file, id);
        id = trim(id);
        if (!id.empty()) {
            return id;
        }
    }

    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
        return hostname;
    }
    LOG_WARNING("No machine identifier available, using a fixed salt");
    return "";
}

std::string CredentialCipher::saltFor(const std::string& machineId) {
    std::string salt = machineId.substr(0, kSaltLength);
    salt.resize(kSaltLength, '0');
    return salt;
}

std::string CredentialCipher::base64Encode(const std::string& data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::string> CredentialCipher::base64Decode(const std::string& encoded) {
    std::string input = trim(encoded);
    if (input.empty() || input.size() % 4 != 0) {
        return std::nullopt;
    }
    std::string out(input.size() / 4 * 3, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace scrape_core::auth
