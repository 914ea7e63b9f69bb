#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <snipvault/crypto/content_cipher.h>

#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace snipvault::crypto {

Result<KeyMaterial> generateKey() {
    KeyMaterial key{};
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        return Error{ErrorCode::InternalError, "Failed to generate random key"};
    }
    return key;
}

Result<KeyMaterial> deriveKeyFromPassphrase(std::string_view passphrase, std::string_view salt,
                                            int iterations) {
    if (passphrase.empty()) {
        return Error{ErrorCode::InvalidArgument, "Passphrase must not be empty"};
    }
    if (salt.size() < 8) {
        return Error{ErrorCode::InvalidArgument, "Salt must be at least 8 bytes"};
    }
    if (iterations < 1000) {
        return Error{ErrorCode::InvalidArgument, "PBKDF2 iteration count too low"};
    }

    KeyMaterial key{};
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()), iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        return Error{ErrorCode::InternalError, "PBKDF2 key derivation failed"};
    }
    return key;
}

std::string keyToHex(const KeyMaterial& key) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(key.size() * 2);
    for (unsigned char b : key) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return out;
}

Result<KeyMaterial> keyFromHex(std::string_view hex) {
    if (hex.size() != kKeySize * 2) {
        return Error{ErrorCode::InvalidArgument,
                     "Key must be " + std::to_string(kKeySize * 2) + " hex characters"};
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    KeyMaterial key{};
    for (size_t i = 0; i < key.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::InvalidArgument, "Key contains non-hex characters"};
        }
        key[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return key;
}

Result<KeyMaterial> loadOrCreateKeyFile(const std::filesystem::path& path) {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (fs::exists(path, ec)) {
        std::ifstream in(path);
        if (!in) {
            return Error{ErrorCode::StorageFailure, "Cannot read key file: " + path.string()};
        }
        std::string contents((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
        while (!contents.empty() && std::isspace(static_cast<unsigned char>(contents.back()))) {
            contents.pop_back();
        }
        auto key = keyFromHex(contents);
        OPENSSL_cleanse(contents.data(), contents.size());
        if (!key) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid key file " + path.string() + ": " + key.error().message};
        }
        spdlog::debug("Loaded content key from {}", path.string());
        return key;
    }

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::StorageFailure,
                         "Cannot create key directory: " + ec.message()};
        }
    }

    auto key = generateKey();
    if (!key) {
        return key.error();
    }

    {
        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::StorageFailure, "Cannot write key file: " + path.string()};
        }
        out << keyToHex(key.value()) << '\n';
        if (!out) {
            return Error{ErrorCode::StorageFailure, "Failed writing key file: " + path.string()};
        }
    }

    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions on {}: {}", path.string(), ec.message());
    }

    spdlog::info("Created new content key file {}", path.string());
    return key;
}

} // namespace snipvault::crypto
