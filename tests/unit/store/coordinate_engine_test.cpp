#include <gtest/gtest.h>
#include <snipvault/store/coordinate_engine.h>

#include <limits>
#include <utility>

#include "../../common/store_fixture.h"

using namespace snipvault;
using namespace snipvault::store;

class CoordinateEngineTest : public test::StoreTest {
protected:
    void SetUp() override {
        test::StoreTest::SetUp();
        collection_ = makeCollection();
        auto table = repo().createTable(collection_, "hosts");
        ASSERT_TRUE(table) << table.error().message;
        table_ = table.value();
    }

    std::optional<Item> cell(int row, int col) {
        auto found = repo().getTableCell(table_, row, col);
        EXPECT_TRUE(found);
        return found ? found.value() : std::nullopt;
    }

    CollectionId collection_ = 0;
    TableId table_ = 0;
};

TEST(RowKeyTest, DerivesFromContent) {
    EXPECT_EQ(CoordinateEngine::deriveRowKey("  web server:01 ", 3), "web_server01");
    EXPECT_EQ(CoordinateEngine::deriveRowKey("a-b_c", 0), "a-b_c");
    EXPECT_EQ(CoordinateEngine::deriveRowKey("!!!", 7), "row_7");
    EXPECT_EQ(CoordinateEngine::deriveRowKey("", 2), "row_2");

    const std::string longName(80, 'x');
    EXPECT_EQ(CoordinateEngine::deriveRowKey(longName, 0).size(),
              CoordinateEngine::kMaxRowKeyLength);
}

TEST_F(CoordinateEngineTest, SparseExportFillsBlanks) {
    ASSERT_TRUE(repo().setTableCell(table_, 0, 0, "Row1"));
    ASSERT_TRUE(repo().setTableCell(table_, 0, 1, "X"));
    ASSERT_TRUE(repo().setTableCell(table_, 1, 0, "Row2"));

    auto matrix = repo().exportTable(table_);
    ASSERT_TRUE(matrix) << matrix.error().message;
    EXPECT_EQ(matrix.value().columns, (std::vector<std::string>{"Row1", "X"}));
    ASSERT_EQ(matrix.value().rows.size(), 2u);
    EXPECT_EQ(matrix.value().rows[0], (std::vector<std::string>{"Row1", "X"}));
    EXPECT_EQ(matrix.value().rows[1], (std::vector<std::string>{"Row2", ""}));
}

TEST_F(CoordinateEngineTest, ExportIsStable) {
    ASSERT_TRUE(repo().setTableCell(table_, 0, 0, "name"));
    ASSERT_TRUE(repo().setTableCell(table_, 2, 1, "value"));
    auto first = repo().exportTable(table_);
    auto second = repo().exportTable(table_);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first.value().columns, second.value().columns);
    EXPECT_EQ(first.value().rows, second.value().rows);
    EXPECT_EQ(first.value().columns, (std::vector<std::string>{"name", "COL_1"}));
}

TEST_F(CoordinateEngineTest, EmptyTableExportsEmptyMatrix) {
    auto matrix = repo().exportTable(table_);
    ASSERT_TRUE(matrix);
    EXPECT_TRUE(matrix.value().columns.empty());
    EXPECT_TRUE(matrix.value().rows.empty());
}

TEST_F(CoordinateEngineTest, SetCellUpdatesInPlace) {
    auto first = repo().setTableCell(table_, 1, 1, "old");
    auto second = repo().setTableCell(table_, 1, 1, "new");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first.value(), second.value());

    auto count = repo().countCells(table_);
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 1);
    auto stored = cell(1, 1);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->content, "new");
}

TEST_F(CoordinateEngineTest, NewCellsTakeColumnLabel) {
    ASSERT_TRUE(repo().setTableCell(table_, 0, 1, "password"));
    ASSERT_TRUE(repo().setTableCell(table_, 3, 1, "hunter2"));
    ASSERT_TRUE(repo().setTableCell(table_, 3, 2, "orphan"));

    auto labelled = cell(3, 1);
    ASSERT_TRUE(labelled);
    EXPECT_EQ(labelled->label, "password");
    auto fallback = cell(3, 2);
    ASSERT_TRUE(fallback);
    EXPECT_EQ(fallback->label, "COL_2");
}

TEST_F(CoordinateEngineTest, OccupiedCoordinateIsConflict) {
    ASSERT_TRUE(repo().createTableCell(table_, 0, 0, item("h", "host")));
    auto dup = repo().createTableCell(table_, 0, 0, item("h", "other"));
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::Conflict);

    auto negative = repo().setTableCell(table_, -1, 0, "x");
    ASSERT_FALSE(negative);
    EXPECT_EQ(negative.error().code, ErrorCode::ValidationError);
}

TEST_F(CoordinateEngineTest, MissingTableIsNotFound) {
    auto r = repo().setTableCell(9999, 0, 0, "x");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    auto exported = repo().exportTable(9999);
    ASSERT_FALSE(exported);
    EXPECT_EQ(exported.error().code, ErrorCode::NotFound);
}

TEST_F(CoordinateEngineTest, RowKeyFollowsColumnZero) {
    ASSERT_TRUE(repo().setTableCell(table_, 1, 1, "10.0.0.1"));
    ASSERT_TRUE(repo().setTableCell(table_, 1, 0, "web one"));

    auto ip = cell(1, 1);
    ASSERT_TRUE(ip && ip->tableCell());
    EXPECT_EQ(ip->tableCell()->rowKey, "web_one");

    ASSERT_TRUE(repo().setTableCell(table_, 1, 0, "db"));
    ip = cell(1, 1);
    ASSERT_TRUE(ip && ip->tableCell());
    EXPECT_EQ(ip->tableCell()->rowKey, "db");

    auto added = repo().setTableCell(table_, 1, 2, "later");
    ASSERT_TRUE(added);
    auto later = cell(1, 2);
    ASSERT_TRUE(later && later->tableCell());
    EXPECT_EQ(later->tableCell()->rowKey, "db");
}

TEST_F(CoordinateEngineTest, DeletingColumnZeroResetsRowKey) {
    auto key = repo().setTableCell(table_, 1, 0, "Alpha Row");
    ASSERT_TRUE(repo().setTableCell(table_, 1, 1, "value"));
    ASSERT_TRUE(repo().setTableCell(table_, 2, 0, "Beta"));
    ASSERT_TRUE(key);

    ASSERT_TRUE(repo().deleteItem(key.value()));

    auto value = cell(1, 1);
    ASSERT_TRUE(value && value->tableCell());
    EXPECT_EQ(value->tableCell()->rowKey, "row_1");
    auto other = cell(2, 0);
    ASSERT_TRUE(other && other->tableCell());
    EXPECT_EQ(other->tableCell()->rowKey, "Beta");
}

TEST_F(CoordinateEngineTest, CoordinatesBeyondLimitsAreRejected) {
    for (auto [row, col] : {std::pair{0, std::numeric_limits<int>::max()},
                            std::pair{std::numeric_limits<int>::max(), 0},
                            std::pair{CoordinateEngine::kMaxRow + 1, 0},
                            std::pair{0, CoordinateEngine::kMaxColumn + 1}}) {
        auto set = repo().setTableCell(table_, row, col, "x");
        ASSERT_FALSE(set);
        EXPECT_EQ(set.error().code, ErrorCode::ValidationError);
        auto created = repo().createTableCell(table_, row, col, item("x", "x"));
        ASSERT_FALSE(created);
        EXPECT_EQ(created.error().code, ErrorCode::ValidationError);
    }

    ASSERT_TRUE(
        repo().setTableCell(table_, CoordinateEngine::kMaxRow, CoordinateEngine::kMaxColumn, "x"));
    auto dims = repo().tableDimensions(table_);
    ASSERT_TRUE(dims);
    EXPECT_EQ(dims.value().rows, CoordinateEngine::kMaxRow + 1);
    EXPECT_EQ(dims.value().cols, CoordinateEngine::kMaxColumn + 1);
    EXPECT_EQ(dims.value().cells, 1);
}

TEST_F(CoordinateEngineTest, UpdatingHeaderRelabelsIt) {
    ASSERT_TRUE(repo().setTableCell(table_, 0, 1, "user"));
    ASSERT_TRUE(repo().setTableCell(table_, 1, 1, "root"));
    ASSERT_TRUE(repo().setTableCell(table_, 0, 1, " login "));

    auto header = cell(0, 1);
    ASSERT_TRUE(header);
    EXPECT_EQ(header->label, "login");

    auto matrix = repo().exportTable(table_);
    ASSERT_TRUE(matrix);
    EXPECT_EQ(matrix.value().columns, (std::vector<std::string>{"COL_0", "login"}));
    EXPECT_EQ(matrix.value().rows[0], (std::vector<std::string>{"", " login "}));
}

TEST_F(CoordinateEngineTest, SensitiveColumnZeroDoesNotLeakIntoRowKey) {
    auto id = repo().setTableCell(table_, 2, 0, "secret-host");
    ASSERT_TRUE(id);
    ItemUpdate update;
    update.sensitive = true;
    ASSERT_TRUE(repo().updateItem(id.value(), update));

    auto stored = cell(2, 0);
    ASSERT_TRUE(stored && stored->tableCell());
    EXPECT_EQ(stored->tableCell()->rowKey, "row_2");
    EXPECT_EQ(stored->content, "secret-host");
}

TEST_F(CoordinateEngineTest, DimensionsAndDelete) {
    ASSERT_TRUE(repo().createTableCell(table_, 0, 0, item("a", "x", {"infra"})));
    ASSERT_TRUE(repo().createTableCell(table_, 4, 2, item("b", "y", {"infra"})));

    auto dims = repo().tableDimensions(table_);
    ASSERT_TRUE(dims);
    EXPECT_EQ(dims.value().rows, 5);
    EXPECT_EQ(dims.value().cols, 3);
    EXPECT_EQ(dims.value().cells, 2);

    ASSERT_TRUE(repo().deleteTable(table_));
    auto gone = repo().getTable(table_);
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);

    auto tag = repo().tagManager().getTag("infra");
    ASSERT_TRUE(tag && tag.value());
    EXPECT_EQ(tag.value()->usageCount, 0);
}

TEST_F(CoordinateEngineTest, ImportFromRows) {
    TableImportOptions options;
    options.sensitiveColumns = {2};
    options.urlColumns = {1};
    options.tags = {"Imported"};

    auto table = repo().createTableFromRows(
        collection_, "servers", {"host", "console", "password"},
        {{"alpha", "https://alpha.example", "pw1"}, {"beta", "", "pw2"}}, options);
    ASSERT_TRUE(table) << table.error().message;

    auto count = repo().countCells(table.value());
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 5);

    auto url = repo().getTableCell(table.value(), 0, 1);
    ASSERT_TRUE(url && url.value());
    EXPECT_EQ(url.value()->kind, ContentKind::Url);
    EXPECT_EQ(url.value()->label, "console");
    EXPECT_EQ(url.value()->tags, (std::vector<std::string>{"imported"}));

    auto secret = repo().getTableCell(table.value(), 1, 2);
    ASSERT_TRUE(secret && secret.value());
    EXPECT_TRUE(secret.value()->sensitive);
    EXPECT_EQ(secret.value()->content, "pw2");
    ASSERT_TRUE(secret.value()->tableCell());
    EXPECT_EQ(secret.value()->tableCell()->rowKey, "beta");
}

TEST_F(CoordinateEngineTest, ImportRejectsBadInputAtomically) {
    auto badUrl = repo().createTableFromRows(collection_, "links", {"name", "url"},
                                             {{"ok", "https://ok.example"}, {"bad", "not a url"}},
                                             TableImportOptions{{}, {1}, {}, std::nullopt});
    ASSERT_FALSE(badUrl);
    EXPECT_EQ(badUrl.error().code, ErrorCode::ValidationError);
    auto found = repo().findTableByName("links");
    ASSERT_TRUE(found);
    EXPECT_FALSE(found.value().has_value());

    auto tooWide = repo().createTableFromRows(collection_, "wide", {"a"}, {{"1", "2"}});
    ASSERT_FALSE(tooWide);
    EXPECT_EQ(tooWide.error().code, ErrorCode::ValidationError);
}

TEST_F(CoordinateEngineTest, TableNamesAreUnique) {
    auto dup = repo().createTable(collection_, " hosts ");
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::Conflict);

    auto other = repo().createTable(collection_, "routers");
    ASSERT_TRUE(other);
    auto rename = repo().renameTable(other.value(), "hosts");
    ASSERT_FALSE(rename);
    EXPECT_EQ(rename.error().code, ErrorCode::Conflict);

    auto tables = repo().listTables(collection_);
    ASSERT_TRUE(tables);
    ASSERT_EQ(tables.value().size(), 2u);
    EXPECT_EQ(tables.value()[0].name, "hosts");
}
