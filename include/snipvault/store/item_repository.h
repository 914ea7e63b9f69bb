#pragma once

#include <snipvault/crypto/content_cipher.h>
#include <snipvault/store/coordinate_engine.h>
#include <snipvault/store/database.h>
#include <snipvault/store/item.h>
#include <snipvault/store/ordering_engine.h>
#include <snipvault/store/tag_manager.h>
#include <optional>
#include <string>
#include <vector>

namespace snipvault::store {

/**
 * @brief Row counts across the store
 */
struct StoreStatistics {
    int64_t collections = 0;
    int64_t lists = 0;
    int64_t tables = 0;
    int64_t items = 0;
    int64_t standaloneItems = 0;
    int64_t listSteps = 0;
    int64_t tableCells = 0;
    int64_t sensitiveItems = 0;
    TagStatistics tags;
};

/**
 * @brief Aggregate root for items, lists, tables and collections
 *
 * Every mutating operation runs in one transaction; the tag manager and the
 * ordering and coordinate engines join it when called from here.
 */
class ItemRepository : public ICellStore {
public:
    /**
     * @param protector Cipher for sensitive content; sensitive writes fail
     *        with InvalidState when null
     */
    ItemRepository(Database& db, crypto::IContentProtector* protector);
    ~ItemRepository() override = default;

    ItemRepository(const ItemRepository&) = delete;
    ItemRepository& operator=(const ItemRepository&) = delete;

    // Collections
    Result<CollectionId> createCollection(const std::string& name,
                                          const std::optional<std::string>& description = {});
    Result<Collection> getCollection(CollectionId id);
    Result<std::optional<Collection>> findCollection(const std::string& name);
    Result<std::vector<Collection>> listCollections();
    Result<void> deleteCollection(CollectionId id);

    // Items
    Result<ItemId> createStandaloneItem(CollectionId collectionId, const NewItem& item);
    Result<ItemId> createListStep(ListId listId, const NewItem& item,
                                  std::optional<int> position = std::nullopt);
    Result<ItemId> createTableCell(TableId tableId, int row, int col,
                                   const NewItem& item) override;
    Result<void> updateCellContent(ItemId itemId, std::string_view content) override;

    /**
     * @brief Load an item with plaintext content and tags
     *
     * Undecryptable sensitive content is returned as the corrupt-content
     * sentinel with contentCorrupt set rather than as an error.
     */
    Result<Item> readItem(ItemId itemId);

    Result<void> updateItem(ItemId itemId, const ItemUpdate& update);
    Result<void> deleteItem(ItemId itemId);

    Result<std::vector<Item>> listItems(CollectionId collectionId);
    Result<std::vector<Item>> findItemsByTag(const std::string& tag);
    Result<void> recordUse(ItemId itemId);

    // Lists
    Result<ListId> createList(CollectionId collectionId, const std::string& name,
                              const std::optional<std::string>& description = {});
    Result<ItemList> getList(ListId listId);
    Result<std::optional<ItemList>> findList(CollectionId collectionId, const std::string& name);
    Result<std::vector<ItemList>> listLists(CollectionId collectionId);
    Result<void> renameList(ListId listId, const std::string& newName);
    Result<ListId> createListWithSteps(CollectionId collectionId, const std::string& name,
                                       const std::vector<NewItem>& steps,
                                       const std::optional<std::string>& description = {});
    Result<std::vector<Item>> listSteps(ListId listId);
    Result<int> countSteps(ListId listId);
    Result<void> moveStep(ItemId itemId, int newPosition);
    Result<int> renumberList(ListId listId);
    Result<bool> checkListContiguity(ListId listId);
    Result<void> recordListUse(ListId listId);
    Result<void> deleteList(ListId listId);

    // Tables
    Result<TableId> createTable(CollectionId collectionId, const std::string& name,
                                const std::optional<std::string>& description = {});
    Result<Table> getTable(TableId tableId);
    Result<std::optional<Table>> findTableByName(const std::string& name);
    Result<std::vector<Table>> listTables(std::optional<CollectionId> collectionId = std::nullopt);
    Result<void> renameTable(TableId tableId, const std::string& newName);

    /**
     * @brief Create a table and fill it from rows in one transaction
     *
     * Row r of the input becomes table row r. Every non-blank value becomes a
     * cell labelled with its column name.
     */
    Result<TableId> createTableFromRows(CollectionId collectionId, const std::string& name,
                                        const std::vector<std::string>& columnNames,
                                        const std::vector<std::vector<std::string>>& rows,
                                        const TableImportOptions& options = {});

    Result<ItemId> setTableCell(TableId tableId, int row, int col, std::string_view content);
    Result<std::optional<Item>> getTableCell(TableId tableId, int row, int col);
    Result<std::vector<Item>> listCells(TableId tableId);
    Result<int64_t> countCells(TableId tableId);
    Result<TableMatrix> exportTable(TableId tableId);
    Result<TableDimensions> tableDimensions(TableId tableId);
    Result<void> deleteTable(TableId tableId);

    Result<StoreStatistics> statistics();

    TagManager& tagManager() { return tags_; }
    OrderingEngine& ordering() { return ordering_; }
    CoordinateEngine& coordinates() { return coordinates_; }

private:
    Database& db_;
    crypto::IContentProtector* protector_;
    TagManager tags_;
    OrderingEngine ordering_;
    CoordinateEngine coordinates_;

    Result<void> validateNewItem(const NewItem& item) const;
    Result<std::string> protectContent(const std::string& plaintext, bool sensitive);
    Result<ItemId> insertItem(CollectionId collectionId, const NewItem& item,
                              const Placement& placement);
    Result<Item> loadStoredItem(ItemId itemId);
    Result<void> removeItemRow(ItemId itemId);
    Result<std::vector<Item>> queryItems(const std::string& sql, int64_t param);
    Result<std::vector<ItemId>> collectItemIds(const std::string& sql, int64_t param);
    Result<void> requireCollection(CollectionId collectionId);
    Result<int64_t> countRows(const std::string& sql);
};

} // namespace snipvault::store
