#pragma once

#include <gtest/gtest.h>
#include <snipvault/crypto/content_cipher.h>
#include <snipvault/store/store.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snipvault::test {

// Unique per call so parallel test processes never share a database file
inline std::filesystem::path uniqueTempPath(const std::string& stem, const std::string& ext) {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           (stem + "_" + std::to_string(stamp) + "_" + std::to_string(counter++) + ext);
}

inline crypto::KeyMaterial fixedKey(unsigned char fill = 0x42) {
    crypto::KeyMaterial key;
    key.fill(fill);
    return key;
}

/**
 * @brief Opens a fresh file-backed store with a fixed content key
 */
class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = uniqueTempPath("snipvault_test", ".db");
        openStore(fixedKey());
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove(dbPath_, ec);
        std::filesystem::remove(dbPath_.string() + "-wal", ec);
        std::filesystem::remove(dbPath_.string() + "-shm", ec);
    }

    void openStore(std::optional<crypto::KeyMaterial> key) {
        store_.reset();
        store::StoreOptions options;
        options.databasePath = dbPath_.string();
        options.key = key;
        auto opened = store::Store::open(options);
        ASSERT_TRUE(opened) << opened.error().message;
        store_ = std::move(opened).value();
    }

    store::ItemRepository& repo() { return store_->repository(); }
    store::Database& db() { return store_->database(); }

    CollectionId makeCollection(const std::string& name = "default") {
        auto id = repo().createCollection(name);
        EXPECT_TRUE(id) << id.error().message;
        return id ? id.value() : 0;
    }

    static store::NewItem item(const std::string& label, const std::string& content,
                               std::vector<std::string> tags = {}) {
        store::NewItem n;
        n.label = label;
        n.content = content;
        n.tags = std::move(tags);
        return n;
    }

    std::filesystem::path dbPath_;
    std::unique_ptr<store::Store> store_;
};

} // namespace snipvault::test
