#include <spdlog/spdlog.h>
#include <snipvault/store/migration.h>
#include <snipvault/store/store.h>

#include <filesystem>
#include <system_error>

#include "detail/result_helpers.hpp"

namespace snipvault::store {

Store::~Store() {
    // Repository holds a reference to db_
    repository_.reset();
    db_.close();
}

Result<std::unique_ptr<Store>> Store::open(const StoreOptions& options) {
    if (options.databasePath.empty()) {
        return Error{ErrorCode::InvalidArgument, "Database path must not be empty"};
    }

    const bool inMemory = options.databasePath == ":memory:";
    if (!inMemory) {
        const std::filesystem::path dbPath(options.databasePath);
        if (dbPath.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(dbPath.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::StorageFailure, "Cannot create directory " +
                                                            dbPath.parent_path().string() + ": " +
                                                            ec.message()};
            }
        }
    }

    std::unique_ptr<Store> store(new Store());
    SNIPVAULT_TRY(store->db_.open(options.databasePath,
                                  inMemory ? ConnectionMode::Memory : ConnectionMode::Create));
    SNIPVAULT_TRY(store->db_.setBusyTimeout(options.busyTimeout));
    SNIPVAULT_TRY(store->db_.enableForeignKeys());
    if (options.enableWal && !inMemory) {
        SNIPVAULT_TRY(store->db_.enableWAL());
    }

    MigrationManager migrations(store->db_);
    SNIPVAULT_TRY(migrations.initialize());
    migrations.registerMigrations(SnipVaultMigrations::getAllMigrations());
    SNIPVAULT_TRY(migrations.migrate());

    if (options.key) {
        store->protector_ = crypto::createContentCipher(*options.key);
    }
    store->repository_ = std::make_unique<ItemRepository>(store->db_, store->protector_.get());

    SNIPVAULT_TRY_UNWRAP(version, migrations.getCurrentVersion());
    spdlog::info("Opened item store {} (schema v{}, {})", options.databasePath, version,
                 store->protector_ ? "encryption enabled" : "no content key");
    return std::move(store);
}

Result<int> Store::schemaVersion() {
    MigrationManager migrations(db_);
    return migrations.getCurrentVersion();
}

Result<void> Store::verifyIntegrity() {
    MigrationManager migrations(db_);
    return migrations.verifyIntegrity();
}

Result<std::unique_ptr<Store>> openStore(const config::StoreConfig& config) {
    StoreOptions options;
    options.databasePath = config.databasePath.string();
    options.busyTimeout = std::chrono::milliseconds(config.busyTimeoutMs);
    options.enableWal = config.enableWal;

    if (!config.keyFile.empty()) {
        SNIPVAULT_TRY_UNWRAP(key, crypto::loadOrCreateKeyFile(config.keyFile));
        options.key = key;
    }
    return Store::open(options);
}

} // namespace snipvault::store
