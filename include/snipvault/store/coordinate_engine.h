#pragma once

#include <snipvault/crypto/content_cipher.h>
#include <snipvault/store/database.h>
#include <snipvault/store/item.h>
#include <optional>
#include <string>
#include <string_view>

namespace snipvault::store {

class TagManager;

/**
 * @brief Creation and content-update hooks the coordinate engine delegates to
 *
 * Implemented by the item repository, which owns item lifecycle.
 */
class ICellStore {
public:
    virtual ~ICellStore() = default;

    virtual Result<ItemId> createTableCell(TableId tableId, int row, int col,
                                           const NewItem& item) = 0;
    virtual Result<void> updateCellContent(ItemId itemId, std::string_view content) = 0;
};

/**
 * @brief Sparse (row, col) cell storage with dense reconstruction
 *
 * Every cell carries a row key derived from its row's column-0 content.
 * Writes to column 0 refresh the key across the row in the same transaction.
 */
class CoordinateEngine {
public:
    static constexpr std::size_t kMaxRowKeyLength = 50;
    static constexpr int kMaxRow = 9999;
    static constexpr int kMaxColumn = 255;

    /**
     * @brief ValidationError unless 0 <= row <= kMaxRow and 0 <= col <= kMaxColumn
     */
    static Result<void> validateCoordinates(int row, int col);

    CoordinateEngine(Database& db, TagManager& tags, crypto::IContentProtector* protector);

    /**
     * @brief Row key for a column-0 value: trimmed, spaces to '_', only
     *        alphanumerics, '_' and '-', at most 50 characters, "row_<n>" when empty
     */
    static std::string deriveRowKey(std::string_view content, int row);

    Result<std::optional<Item>> getCell(TableId tableId, int row, int col);

    /**
     * @brief Update the cell in place, or create it through store
     *
     * Row-0 cells are labelled with their content, on creation and on update;
     * other new cells take the label of their column's row-0 header, falling
     * back to "COL_<c>".
     */
    Result<ItemId> setCell(TableId tableId, int row, int col, std::string_view content,
                           ICellStore& store);

    /**
     * @brief Give a freshly written cell its row key
     *
     * For column 0 the key is derived from plaintext (or "row_<n>" when the
     * cell is sensitive) and pushed to every cell of the row; other columns
     * adopt the row's existing key.
     */
    Result<void> assignRowKey(TableId tableId, int row, int col, ItemId itemId,
                              std::string_view plaintext, bool sensitive);

    /**
     * @brief Reset the row's key to "row_<n>" once its column-0 cell is gone
     */
    Result<void> resetRowKey(TableId tableId, int row);

    Result<TableMatrix> exportToMatrix(TableId tableId);

    /**
     * @brief Remove every cell of the table
     * @return ids of the removed cells
     */
    Result<std::vector<ItemId>> deleteTable(TableId tableId);

    Result<TableDimensions> dimensions(TableId tableId);

    Result<int64_t> countCells(TableId tableId);

    Result<std::vector<Item>> listCells(TableId tableId);

private:
    Database& db_;
    TagManager& tags_;
    crypto::IContentProtector* protector_;

    Result<void> requireTable(TableId tableId);
    Result<std::optional<ItemId>> findCellId(TableId tableId, int row, int col);
    Result<std::string> columnLabel(TableId tableId, int col);
};

} // namespace snipvault::store
