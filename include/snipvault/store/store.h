#pragma once

#include <snipvault/config/store_config.h>
#include <snipvault/crypto/content_cipher.h>
#include <snipvault/store/database.h>
#include <snipvault/store/item_repository.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace snipvault::store {

struct StoreOptions {
    // ":memory:" opens a private in-memory database
    std::string databasePath;
    std::optional<crypto::KeyMaterial> key;
    std::chrono::milliseconds busyTimeout{5000};
    bool enableWal = true;
};

/**
 * @brief Owns the connection, the cipher and the repository
 *
 * Opening creates the database file when needed, turns on foreign keys and
 * brings the schema to the latest migration. Without a key the store is
 * usable for non-sensitive content only.
 */
class Store {
public:
    static Result<std::unique_ptr<Store>> open(const StoreOptions& options);

    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    ItemRepository& repository() { return *repository_; }
    Database& database() { return db_; }
    crypto::IContentProtector* protector() { return protector_.get(); }

    Result<int> schemaVersion();
    Result<void> verifyIntegrity();

private:
    Store() = default;

    Database db_;
    std::unique_ptr<crypto::IContentProtector> protector_;
    std::unique_ptr<ItemRepository> repository_;
};

/**
 * @brief Open the store described by a loaded configuration
 *
 * The key file is read, or created with a fresh random key on first use.
 */
Result<std::unique_ptr<Store>> openStore(const config::StoreConfig& config);

} // namespace snipvault::store
