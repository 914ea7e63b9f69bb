#include <spdlog/spdlog.h>
#include <snipvault/store/migration.h>

namespace snipvault::store {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    return migrateTo(getLatestVersion());
}

Result<void> MigrationManager::migrateTo(int targetVersion) {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();

    if (currentVersion == targetVersion) {
        spdlog::debug("Schema already at version {}", targetVersion);
        return {};
    }

    if (currentVersion > targetVersion) {
        return Error{ErrorCode::InvalidState,
                     "Database schema version " + std::to_string(currentVersion) +
                         " is newer than supported version " + std::to_string(targetVersion)};
    }

    int totalMigrations = 0;
    for (const auto& [version, _] : migrations_) {
        if (version > currentVersion && version <= targetVersion) {
            totalMigrations++;
        }
    }

    int appliedMigrations = 0;

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion || version > targetVersion) {
            continue;
        }

        spdlog::debug("Applying migration {} '{}' ({}/{})", version, migration.name,
                      ++appliedMigrations, totalMigrations);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Failed to record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;

        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM migration_history ORDER BY version ASC");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);

        history.push_back(entry);
    }

    return history;
}

Result<void> MigrationManager::verifyIntegrity() {
    auto stmtResult = db_.prepare("PRAGMA integrity_check");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (stepResult.value() && stmt.getString(0) != "ok") {
        return Error{ErrorCode::StorageFailure, "Integrity check failed: " + stmt.getString(0)};
    }

    auto fkResult = db_.prepare("PRAGMA foreign_key_check");
    if (!fkResult)
        return fkResult.error();

    Statement fkStmt = std::move(fkResult).value();
    auto fkStep = fkStmt.step();
    if (!fkStep)
        return fkStep.error();
    if (fkStep.value()) {
        return Error{ErrorCode::StorageFailure,
                     "Foreign key violation in table " + fkStmt.getString(0)};
    }

    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        } else {
            return Error{ErrorCode::InvalidArgument, "Migration has no up function or SQL"};
        }
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    int64_t durationMs = duration.count();

    auto bindResult = stmt.bindAll(version, name, seconds, durationMs, success, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT,
            UNIQUE(version)
        )
    )");
}

// SnipVaultMigrations implementation
std::vector<Migration> SnipVaultMigrations::getAllMigrations() {
    return {createInitialSchema(), createTagTables(), createIndexes()};
}

Migration SnipVaultMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create initial schema";

    m.upSQL = R"(
        CREATE TABLE collections (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            description TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE lists (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            collection_id INTEGER NOT NULL,
            name TEXT NOT NULL,
            description TEXT,
            use_count INTEGER NOT NULL DEFAULT 0,
            last_used INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE(collection_id, name),
            FOREIGN KEY (collection_id) REFERENCES collections(id) ON DELETE CASCADE
        );

        CREATE TABLE item_tables (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            collection_id INTEGER NOT NULL,
            name TEXT NOT NULL UNIQUE,
            description TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            FOREIGN KEY (collection_id) REFERENCES collections(id) ON DELETE CASCADE
        );

        -- One row per stored unit; placement columns are mutually exclusive
        CREATE TABLE items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            collection_id INTEGER NOT NULL,
            label TEXT NOT NULL,
            content TEXT NOT NULL,
            kind TEXT NOT NULL DEFAULT 'text'
                CHECK (kind IN ('text', 'url', 'code', 'path')),
            is_sensitive INTEGER NOT NULL DEFAULT 0,
            is_favorite INTEGER NOT NULL DEFAULT 0,
            color TEXT,
            description TEXT,
            size_bytes INTEGER,
            use_count INTEGER NOT NULL DEFAULT 0,
            last_used INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            list_id INTEGER,
            position INTEGER,
            table_id INTEGER,
            cell_row INTEGER,
            cell_col INTEGER,
            row_key TEXT,
            CHECK ((list_id IS NULL) = (position IS NULL)),
            CHECK ((table_id IS NULL) = (cell_row IS NULL)
                   AND (table_id IS NULL) = (cell_col IS NULL)),
            CHECK (list_id IS NULL OR table_id IS NULL),
            CHECK (position IS NULL OR position >= 1),
            CHECK (cell_row IS NULL OR (cell_row >= 0 AND cell_col >= 0)),
            UNIQUE (table_id, cell_row, cell_col),
            FOREIGN KEY (collection_id) REFERENCES collections(id) ON DELETE CASCADE,
            FOREIGN KEY (list_id) REFERENCES lists(id) ON DELETE CASCADE,
            FOREIGN KEY (table_id) REFERENCES item_tables(id) ON DELETE CASCADE
        );
    )";

    return m;
}

Migration SnipVaultMigrations::createTagTables() {
    Migration m;
    m.version = 2;
    m.name = "Add tag tables";

    m.upSQL = R"(
        CREATE TABLE tags (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            usage_count INTEGER NOT NULL DEFAULT 0 CHECK (usage_count >= 0),
            last_used INTEGER,
            created_at INTEGER NOT NULL,
            color TEXT,
            description TEXT
        );

        CREATE TABLE item_tags (
            item_id INTEGER NOT NULL,
            tag_id INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            PRIMARY KEY (item_id, tag_id),
            FOREIGN KEY (item_id) REFERENCES items(id) ON DELETE CASCADE,
            FOREIGN KEY (tag_id) REFERENCES tags(id) ON DELETE CASCADE
        );
    )";

    return m;
}

Migration SnipVaultMigrations::createIndexes() {
    Migration m;
    m.version = 3;
    m.name = "Add lookup indexes";

    m.upSQL = R"(
        CREATE INDEX idx_items_collection ON items(collection_id);
        CREATE INDEX idx_items_list_position ON items(list_id, position);
        CREATE INDEX idx_items_table_cell ON items(table_id, cell_row, cell_col);
        CREATE INDEX idx_items_favorite ON items(is_favorite);
        CREATE INDEX idx_lists_collection ON lists(collection_id);
        CREATE INDEX idx_item_tables_collection ON item_tables(collection_id);
        CREATE INDEX idx_item_tags_tag ON item_tags(tag_id);
        CREATE INDEX idx_tags_usage ON tags(usage_count DESC);
    )";

    return m;
}

} // namespace snipvault::store
