#include <gtest/gtest.h>
#include <snipvault/store/store.h>

#include <filesystem>

#include "../../common/store_fixture.h"

using namespace snipvault;
using namespace snipvault::store;

TEST(StoreTest, OpensInMemory) {
    StoreOptions options;
    options.databasePath = ":memory:";
    auto opened = Store::open(options);
    ASSERT_TRUE(opened) << opened.error().message;
    auto& store = *opened.value();

    EXPECT_EQ(store.protector(), nullptr);
    auto version = store.schemaVersion();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), 3);
    EXPECT_TRUE(store.verifyIntegrity());
}

TEST(StoreTest, RejectsEmptyPath) {
    auto opened = Store::open(StoreOptions{});
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code, ErrorCode::InvalidArgument);
}

TEST(StoreTest, OpenFromConfigCreatesKeyAndPersists) {
    const auto dir = test::uniqueTempPath("snipvault_store", "");
    config::StoreConfig cfg;
    cfg.databasePath = dir / "data" / "items.db";
    cfg.keyFile = dir / "keys" / "content.key";

    ItemId secretId = 0;
    {
        auto opened = openStore(cfg);
        ASSERT_TRUE(opened) << opened.error().message;
        auto& repo = opened.value()->repository();
        auto collection = repo.createCollection("c");
        ASSERT_TRUE(collection);
        NewItem n;
        n.label = "token";
        n.content = "abc123";
        n.sensitive = true;
        auto id = repo.createStandaloneItem(collection.value(), n);
        ASSERT_TRUE(id) << id.error().message;
        secretId = id.value();
    }
    EXPECT_TRUE(std::filesystem::exists(cfg.keyFile));

    {
        auto reopened = openStore(cfg);
        ASSERT_TRUE(reopened) << reopened.error().message;
        auto read = reopened.value()->repository().readItem(secretId);
        ASSERT_TRUE(read);
        EXPECT_EQ(read.value().content, "abc123");
        EXPECT_FALSE(read.value().contentCorrupt);
    }

    std::filesystem::remove_all(dir);
}
