#include <gtest/gtest.h>
#include <snipvault/store/tag_manager.h>

#include "../../common/store_fixture.h"

using namespace snipvault;
using namespace snipvault::store;

class TagManagerTest : public test::StoreTest {
protected:
    void SetUp() override {
        test::StoreTest::SetUp();
        collection_ = makeCollection();
    }

    TagManager& tags() { return repo().tagManager(); }

    ItemId makeItem(const std::string& label, std::vector<std::string> tagNames = {}) {
        auto id = repo().createStandaloneItem(collection_, item(label, label + " body", tagNames));
        EXPECT_TRUE(id) << id.error().message;
        return id ? id.value() : 0;
    }

    int64_t usage(const std::string& name) {
        auto tag = tags().getTag(name);
        EXPECT_TRUE(tag);
        return (tag && tag.value()) ? tag.value()->usageCount : -1;
    }

    // usage_count must equal the association count for every tag
    void expectCountersConsistent() {
        auto stmt = db().prepare(R"(
            SELECT COUNT(*) FROM tags t
            WHERE t.usage_count != (SELECT COUNT(*) FROM item_tags it WHERE it.tag_id = t.id)
        )");
        ASSERT_TRUE(stmt);
        auto s = std::move(stmt).value();
        auto row = s.step();
        ASSERT_TRUE(row && row.value());
        EXPECT_EQ(s.getInt64(0), 0);
    }

    CollectionId collection_ = 0;
};

TEST_F(TagManagerTest, NormalizesNames) {
    EXPECT_EQ(TagManager::normalizeTagName("  Docker "), "docker");
    auto names = TagManager::normalizeTagNames({"B", "a", " b ", "", "  "});
    EXPECT_EQ(names, (std::vector<std::string>{"a", "b"}));
}

TEST_F(TagManagerTest, GetOrCreateIsIdempotent) {
    auto first = tags().getOrCreateTag("Linux");
    auto second = tags().getOrCreateTag("linux ");
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), second.value());

    auto empty = tags().getOrCreateTag("   ");
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);
}

TEST_F(TagManagerTest, AssociateTracksUsage) {
    ItemId a = makeItem("a");
    ItemId b = makeItem("b");

    auto added = tags().associate(a, "net");
    ASSERT_TRUE(added);
    EXPECT_TRUE(added.value());
    ASSERT_TRUE(tags().associate(b, "NET"));
    EXPECT_EQ(usage("net"), 2);

    auto again = tags().associate(a, "net");
    ASSERT_TRUE(again);
    EXPECT_FALSE(again.value());
    EXPECT_EQ(usage("net"), 2);

    auto removed = tags().dissociate(a, "net");
    ASSERT_TRUE(removed);
    EXPECT_TRUE(removed.value());
    EXPECT_EQ(usage("net"), 1);
    expectCountersConsistent();
}

TEST_F(TagManagerTest, AssociateMissingItemIsNotFound) {
    auto r = tags().associate(9999, "x");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(TagManagerTest, ReplaceAppliesDifference) {
    ItemId id = makeItem("x", {"a", "b"});
    ASSERT_TRUE(tags().replaceItemTags(id, {"b", "c"}));

    auto current = tags().getItemTags(id);
    ASSERT_TRUE(current);
    EXPECT_EQ(current.value(), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(usage("a"), 0);
    EXPECT_EQ(usage("b"), 1);
    EXPECT_EQ(usage("c"), 1);
    expectCountersConsistent();
}

TEST_F(TagManagerTest, ReplaceWithSameSetChangesNothing) {
    ItemId id = makeItem("x", {"a", "b"});
    auto before = tags().getTag("a");
    ASSERT_TRUE(before && before.value());

    ASSERT_TRUE(tags().replaceItemTags(id, {"B", "a", "a"}));

    auto after = tags().getTag("a");
    ASSERT_TRUE(after && after.value());
    EXPECT_EQ(after.value()->usageCount, before.value()->usageCount);
    EXPECT_EQ(after.value()->lastUsed, before.value()->lastUsed);
    EXPECT_EQ(usage("b"), 1);
}

TEST_F(TagManagerTest, DeletingItemsKeepsCountersConsistent) {
    ItemId a = makeItem("a", {"shared", "solo"});
    makeItem("b", {"shared"});
    ASSERT_TRUE(repo().deleteItem(a));

    EXPECT_EQ(usage("shared"), 1);
    EXPECT_EQ(usage("solo"), 0);
    expectCountersConsistent();

    auto pruned = tags().pruneUnusedTags();
    ASSERT_TRUE(pruned);
    EXPECT_EQ(pruned.value(), 1);
    auto solo = tags().getTag("solo");
    ASSERT_TRUE(solo);
    EXPECT_FALSE(solo.value().has_value());
}

TEST_F(TagManagerTest, RecountRepairsDrift) {
    ItemId id = makeItem("a", {"x"});
    (void)id;
    ASSERT_TRUE(db().execute("UPDATE tags SET usage_count = 7 WHERE name = 'x'"));

    auto corrected = tags().recountAllTags();
    ASSERT_TRUE(corrected);
    EXPECT_EQ(corrected.value(), 1);
    EXPECT_EQ(usage("x"), 1);

    auto missing = tags().recountTag(424242);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(TagManagerTest, SearchMatchesLiterally) {
    makeItem("a", {"c_plus", "cxplus", "python"});
    auto found = tags().searchTags("c_");
    ASSERT_TRUE(found);
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value().front().name, "c_plus");
}

TEST_F(TagManagerTest, ListByUsageAndStatistics) {
    makeItem("a", {"hot", "cold"});
    makeItem("b", {"hot"});
    ASSERT_TRUE(tags().getOrCreateTag("unused"));

    auto byUsage = tags().listTags(TagOrder::Usage);
    ASSERT_TRUE(byUsage);
    ASSERT_EQ(byUsage.value().size(), 3u);
    EXPECT_EQ(byUsage.value().front().name, "hot");

    auto top = tags().topTags(1);
    ASSERT_TRUE(top);
    ASSERT_EQ(top.value().size(), 1u);
    EXPECT_EQ(top.value().front().name, "hot");

    auto stats = tags().statistics();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().totalTags, 3);
    EXPECT_EQ(stats.value().tagsInUse, 2);
    EXPECT_EQ(stats.value().unusedTags, 1);
    EXPECT_EQ(stats.value().totalAssociations, 3);

    auto ids = tags().findItemsByTag("HOT");
    ASSERT_TRUE(ids);
    EXPECT_EQ(ids.value().size(), 2u);
}
