#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <snipvault/core/types.h>

namespace snipvault::crypto {

inline constexpr std::size_t kKeySize = 32;   // AES-256
inline constexpr std::size_t kNonceSize = 12; // GCM recommended IV length
inline constexpr std::size_t kTagSize = 16;
inline constexpr std::string_view kCiphertextPrefix = "svx1:";
inline constexpr int kDefaultPbkdf2Iterations = 200000;

using KeyMaterial = std::array<unsigned char, kKeySize>;

// Interface for transparent payload protection
class IContentProtector {
public:
    virtual ~IContentProtector() = default;

    virtual Result<std::string> encrypt(std::string_view plaintext) = 0;

    // CorruptContent on malformed input or failed authentication
    virtual Result<std::string> decrypt(std::string_view ciphertext) = 0;

    // Format check only; does not authenticate
    virtual bool isEncrypted(std::string_view value) const = 0;
};

/**
 * @brief AES-256-GCM content cipher
 *
 * Output format is "svx1:" followed by base64(nonce || ciphertext || tag).
 * A fresh random nonce is drawn for every encryption.
 */
class ContentCipher : public IContentProtector {
public:
    explicit ContentCipher(const KeyMaterial& key);
    ~ContentCipher();

    // Disable copy, enable move
    ContentCipher(const ContentCipher&) = delete;
    ContentCipher& operator=(const ContentCipher&) = delete;
    ContentCipher(ContentCipher&&) noexcept;
    ContentCipher& operator=(ContentCipher&&) noexcept;

    Result<std::string> encrypt(std::string_view plaintext) override;
    Result<std::string> decrypt(std::string_view ciphertext) override;
    bool isEncrypted(std::string_view value) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentProtector> createContentCipher(const KeyMaterial& key);

// Key material helpers
Result<KeyMaterial> generateKey();
Result<KeyMaterial> deriveKeyFromPassphrase(std::string_view passphrase, std::string_view salt,
                                            int iterations = kDefaultPbkdf2Iterations);

std::string keyToHex(const KeyMaterial& key);
Result<KeyMaterial> keyFromHex(std::string_view hex);

/**
 * @brief Read a hex key file, creating it with a random key when missing
 *
 * New files are written with owner-only read/write permissions.
 */
Result<KeyMaterial> loadOrCreateKeyFile(const std::filesystem::path& path);

} // namespace snipvault::crypto
