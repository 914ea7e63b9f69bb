#pragma once

#include <snipvault/store/database.h>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace snipvault::store {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration;
    bool success;
    std::string error;
};

/**
 * @brief Database migration manager
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Get current schema version (0 when nothing applied)
     */
    Result<int> getCurrentVersion();

    int getLatestVersion() const;

    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     */
    Result<void> migrate();

    /**
     * @brief Migrate forward to a specific version
     */
    Result<void> migrateTo(int targetVersion);

    Result<std::vector<MigrationHistory>> getHistory();

    /**
     * @brief Run PRAGMA integrity_check and foreign_key_check
     */
    Result<void> verifyIntegrity();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
    Result<void> createMigrationTables();
};

/**
 * @brief Built-in migrations for the item store schema
 */
class SnipVaultMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: collections, lists, tables and the polymorphic items table
    static Migration createInitialSchema();

    // Version 2: tag vocabulary and item associations
    static Migration createTagTables();

    // Version 3: lookup indexes
    static Migration createIndexes();
};

} // namespace snipvault::store
