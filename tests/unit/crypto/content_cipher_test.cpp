#include <gtest/gtest.h>
#include <snipvault/crypto/content_cipher.h>

#include <filesystem>
#include <fstream>

#include "../../common/store_fixture.h"

using namespace snipvault;
using namespace snipvault::crypto;

TEST(ContentCipherTest, RoundTrip) {
    ContentCipher cipher(test::fixedKey());
    for (std::string plain : {std::string("hello"), std::string(), std::string(4096, 'z'),
                              std::string("multi\nline\0bytes", 16)}) {
        auto enc = cipher.encrypt(plain);
        ASSERT_TRUE(enc) << enc.error().message;
        EXPECT_TRUE(cipher.isEncrypted(enc.value()));
        auto dec = cipher.decrypt(enc.value());
        ASSERT_TRUE(dec) << dec.error().message;
        EXPECT_EQ(dec.value(), plain);
    }
}

TEST(ContentCipherTest, FreshNoncePerEncryption) {
    ContentCipher cipher(test::fixedKey());
    auto a = cipher.encrypt("same");
    auto b = cipher.encrypt("same");
    ASSERT_TRUE(a && b);
    EXPECT_NE(a.value(), b.value());
}

TEST(ContentCipherTest, WrongKeyIsCorruptContent) {
    ContentCipher writer(test::fixedKey(0x01));
    ContentCipher reader(test::fixedKey(0x02));
    auto enc = writer.encrypt("secret");
    ASSERT_TRUE(enc);
    auto dec = reader.decrypt(enc.value());
    ASSERT_FALSE(dec);
    EXPECT_EQ(dec.error().code, ErrorCode::CorruptContent);
}

TEST(ContentCipherTest, TamperedCiphertextIsRejected) {
    ContentCipher cipher(test::fixedKey());
    auto enc = cipher.encrypt("payload to protect");
    ASSERT_TRUE(enc);
    std::string tampered = enc.value();
    char& c = tampered[tampered.size() / 2];
    c = (c == 'A') ? 'B' : 'A';

    auto dec = cipher.decrypt(tampered);
    ASSERT_FALSE(dec);
    EXPECT_EQ(dec.error().code, ErrorCode::CorruptContent);
}

TEST(ContentCipherTest, RejectsNonCiphertext) {
    ContentCipher cipher(test::fixedKey());
    EXPECT_FALSE(cipher.isEncrypted("plain text"));
    EXPECT_FALSE(cipher.isEncrypted("svx1:short"));

    auto dec = cipher.decrypt("plain text");
    ASSERT_FALSE(dec);
    EXPECT_EQ(dec.error().code, ErrorCode::CorruptContent);
}

TEST(ContentCipherTest, PrefixedPlaintextIsNotCiphertext) {
    ContentCipher cipher(test::fixedKey());
    EXPECT_FALSE(cipher.isEncrypted("svx1: remember to rotate the staging keys on friday!!"));
    // Base64 alphabet but too short for nonce and tag
    EXPECT_FALSE(cipher.isEncrypted("svx1:QUJDRA=="));
    // Padding in the middle
    EXPECT_FALSE(cipher.isEncrypted("svx1:" + std::string(20, 'A') + "==" + std::string(22, 'A')));

    auto enc = cipher.encrypt("x");
    ASSERT_TRUE(enc);
    EXPECT_TRUE(cipher.isEncrypted(enc.value()));
    EXPECT_FALSE(cipher.isEncrypted(enc.value() + "A"));
}

TEST(KeyMaterialTest, HexRoundTrip) {
    auto key = generateKey();
    ASSERT_TRUE(key);
    const auto hex = keyToHex(key.value());
    EXPECT_EQ(hex.size(), kKeySize * 2);
    auto parsed = keyFromHex(hex);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value(), key.value());

    EXPECT_FALSE(keyFromHex("abc"));
    EXPECT_FALSE(keyFromHex(std::string(kKeySize * 2, 'g')));
}

TEST(KeyMaterialTest, PassphraseDerivationIsDeterministic) {
    auto a = deriveKeyFromPassphrase("correct horse", "saltsalt", 1000);
    auto b = deriveKeyFromPassphrase("correct horse", "saltsalt", 1000);
    auto c = deriveKeyFromPassphrase("correct horse", "pepperpe", 1000);
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(a.value(), b.value());
    EXPECT_NE(a.value(), c.value());

    auto shortSalt = deriveKeyFromPassphrase("pw", "salt", 1000);
    ASSERT_FALSE(shortSalt);
    EXPECT_EQ(shortSalt.error().code, ErrorCode::InvalidArgument);
}

TEST(KeyMaterialTest, KeyFileIsCreatedOnceAndReused) {
    const auto dir = test::uniqueTempPath("snipvault_keys", "");
    const auto path = dir / "content.key";

    auto created = loadOrCreateKeyFile(path);
    ASSERT_TRUE(created) << created.error().message;
    auto perms = std::filesystem::status(path).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::others_read, std::filesystem::perms::none);

    auto loaded = loadOrCreateKeyFile(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), created.value());

    {
        std::ofstream out(path, std::ios::trunc);
        out << "not-a-key\n";
    }
    auto bad = loadOrCreateKeyFile(path);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);

    std::filesystem::remove_all(dir);
}
