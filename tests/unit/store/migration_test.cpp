#include <gtest/gtest.h>
#include <snipvault/store/database.h>
#include <snipvault/store/migration.h>

using namespace snipvault;
using namespace snipvault::store;

class MigrationTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(db_.open(":memory:", ConnectionMode::Memory)); }

    Database db_;
};

TEST_F(MigrationTest, AppliesAllBuiltInMigrations) {
    MigrationManager mm(db_);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigrations(SnipVaultMigrations::getAllMigrations());

    auto before = mm.getCurrentVersion();
    ASSERT_TRUE(before);
    EXPECT_EQ(before.value(), 0);

    ASSERT_TRUE(mm.migrate());

    auto after = mm.getCurrentVersion();
    ASSERT_TRUE(after);
    EXPECT_EQ(after.value(), mm.getLatestVersion());

    for (const char* table : {"collections", "lists", "item_tables", "items", "tags", "item_tags"}) {
        auto exists = db_.tableExists(table);
        ASSERT_TRUE(exists);
        EXPECT_TRUE(exists.value()) << table;
    }
    EXPECT_TRUE(mm.verifyIntegrity());
}

TEST_F(MigrationTest, MigrateIsIdempotent) {
    MigrationManager mm(db_);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigrations(SnipVaultMigrations::getAllMigrations());
    ASSERT_TRUE(mm.migrate());
    ASSERT_TRUE(mm.migrate());

    auto needs = mm.needsMigration();
    ASSERT_TRUE(needs);
    EXPECT_FALSE(needs.value());

    auto history = mm.getHistory();
    ASSERT_TRUE(history);
    EXPECT_EQ(static_cast<int>(history.value().size()), mm.getLatestVersion());
}

TEST_F(MigrationTest, FailedMigrationLeavesVersionUnchanged) {
    MigrationManager mm(db_);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigration(Migration{1, "good", "CREATE TABLE a (id INTEGER)", {}});
    mm.registerMigration(Migration{2, "bad", "CREATE TABLE a (id INTEGER)", {}});

    auto r = mm.migrate();
    ASSERT_FALSE(r);

    auto version = mm.getCurrentVersion();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), 1);
}

TEST_F(MigrationTest, RefusesDatabaseNewerThanCode) {
    MigrationManager mm(db_);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigrations(SnipVaultMigrations::getAllMigrations());
    ASSERT_TRUE(mm.migrate());

    auto r = mm.migrateTo(1);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
}

TEST_F(MigrationTest, PlacementCheckRejectsMixedPlacement) {
    MigrationManager mm(db_);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigrations(SnipVaultMigrations::getAllMigrations());
    ASSERT_TRUE(mm.migrate());
    ASSERT_TRUE(db_.enableForeignKeys());

    ASSERT_TRUE(db_.execute("INSERT INTO collections (name, created_at, updated_at) "
                            "VALUES ('c', 0, 0)"));
    ASSERT_TRUE(db_.execute("INSERT INTO lists (collection_id, name, created_at, updated_at) "
                            "VALUES (1, 'l', 0, 0)"));
    ASSERT_TRUE(db_.execute("INSERT INTO item_tables (collection_id, name, created_at, updated_at) "
                            "VALUES (1, 't', 0, 0)"));

    auto mixed = db_.execute(
        "INSERT INTO items (collection_id, label, content, kind, created_at, updated_at, "
        "list_id, position, table_id, cell_row, cell_col) "
        "VALUES (1, 'x', 'y', 'text', 0, 0, 1, 1, 1, 0, 0)");
    ASSERT_FALSE(mixed);
    EXPECT_EQ(mixed.error().code, ErrorCode::Conflict);
}
