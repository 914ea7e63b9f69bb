#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <snipvault/crypto/content_cipher.h>

#include <vector>

namespace snipvault::crypto {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string base64Encode(const std::vector<unsigned char>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return out;
}

Result<std::vector<unsigned char>> base64Decode(std::string_view encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return Error{ErrorCode::CorruptContent, "Ciphertext is not valid base64"};
    }

    std::vector<unsigned char> out(3 * encoded.size() / 4);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        return Error{ErrorCode::CorruptContent, "Ciphertext is not valid base64"};
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (encoded.back() == '=')
        ++padding;
    if (encoded.size() > 1 && encoded[encoded.size() - 2] == '=')
        ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

bool isBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

} // namespace

struct ContentCipher::Impl {
    KeyMaterial key{};

    explicit Impl(const KeyMaterial& k) : key(k) {}

    ~Impl() { OPENSSL_cleanse(key.data(), key.size()); }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

ContentCipher::ContentCipher(const KeyMaterial& key) : pImpl(std::make_unique<Impl>(key)) {}

ContentCipher::~ContentCipher() = default;

ContentCipher::ContentCipher(ContentCipher&&) noexcept = default;
ContentCipher& ContentCipher::operator=(ContentCipher&&) noexcept = default;

Result<std::string> ContentCipher::encrypt(std::string_view plaintext) {
    if (!pImpl) {
        return Error{ErrorCode::NotInitialized, "Cipher has no key"};
    }

    std::vector<unsigned char> buffer(kNonceSize + plaintext.size() + kTagSize);
    unsigned char* nonce = buffer.data();
    unsigned char* body = buffer.data() + kNonceSize;

    if (RAND_bytes(nonce, static_cast<int>(kNonceSize)) != 1) {
        return Error{ErrorCode::InternalError, "Failed to generate nonce"};
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Error{ErrorCode::InternalError, "Failed to create EVP_CIPHER_CTX"};
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, pImpl->key.data(), nonce) != 1) {
        return Error{ErrorCode::InternalError, "Failed to initialize AES-256-GCM"};
    }

    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), body, &len,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            return Error{ErrorCode::InternalError, "Encryption failed"};
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), body + total, &len) != 1) {
        return Error{ErrorCode::InternalError, "Encryption finalization failed"};
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            body + total) != 1) {
        return Error{ErrorCode::InternalError, "Failed to read GCM tag"};
    }
    buffer.resize(kNonceSize + static_cast<size_t>(total) + kTagSize);

    return std::string(kCiphertextPrefix) + base64Encode(buffer);
}

Result<std::string> ContentCipher::decrypt(std::string_view ciphertext) {
    if (!pImpl) {
        return Error{ErrorCode::NotInitialized, "Cipher has no key"};
    }
    if (!isEncrypted(ciphertext)) {
        return Error{ErrorCode::CorruptContent, "Value is not in encrypted form"};
    }

    auto decoded = base64Decode(ciphertext.substr(kCiphertextPrefix.size()));
    if (!decoded) {
        return decoded.error();
    }
    const auto& raw = decoded.value();
    if (raw.size() < kNonceSize + kTagSize) {
        return Error{ErrorCode::CorruptContent, "Ciphertext is truncated"};
    }

    const unsigned char* nonce = raw.data();
    const unsigned char* body = raw.data() + kNonceSize;
    const size_t bodySize = raw.size() - kNonceSize - kTagSize;
    std::vector<unsigned char> tag(raw.end() - static_cast<std::ptrdiff_t>(kTagSize), raw.end());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Error{ErrorCode::InternalError, "Failed to create EVP_CIPHER_CTX"};
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, pImpl->key.data(), nonce) != 1) {
        return Error{ErrorCode::InternalError, "Failed to initialize AES-256-GCM"};
    }

    std::string plaintext(bodySize, '\0');
    int len = 0;
    int total = 0;
    if (bodySize > 0) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len,
                              body, static_cast<int>(bodySize)) != 1) {
            return Error{ErrorCode::CorruptContent, "Decryption failed"};
        }
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            tag.data()) != 1) {
        return Error{ErrorCode::CorruptContent, "Failed to set GCM tag"};
    }

    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + total,
                            &len) != 1) {
        spdlog::debug("GCM authentication failed for {} byte payload", bodySize);
        return Error{ErrorCode::CorruptContent, "Ciphertext failed authentication"};
    }
    total += len;
    plaintext.resize(static_cast<size_t>(total));
    return plaintext;
}

bool ContentCipher::isEncrypted(std::string_view value) const {
    if (value.size() <= kCiphertextPrefix.size() ||
        value.substr(0, kCiphertextPrefix.size()) != kCiphertextPrefix) {
        return false;
    }

    const auto body = value.substr(kCiphertextPrefix.size());
    if (body.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '=') {
            // Padding only in the last two positions
            if (i + 2 < body.size()) {
                return false;
            }
            ++padding;
            continue;
        }
        if (padding > 0 || !isBase64Char(c)) {
            return false;
        }
    }

    // Decoded payload holds at least the nonce and the tag
    return 3 * (body.size() / 4) - padding >= kNonceSize + kTagSize;
}

std::unique_ptr<IContentProtector> createContentCipher(const KeyMaterial& key) {
    return std::make_unique<ContentCipher>(key);
}

} // namespace snipvault::crypto
