#include <spdlog/spdlog.h>
#include <snipvault/store/coordinate_engine.h>
#include <snipvault/store/tag_manager.h>

#include <algorithm>
#include <cctype>
#include <map>

#include "detail/item_rows.hpp"
#include "detail/result_helpers.hpp"
#include "detail/string_utils.hpp"

namespace snipvault::store {

CoordinateEngine::CoordinateEngine(Database& db, TagManager& tags,
                                   crypto::IContentProtector* protector)
    : db_(db), tags_(tags), protector_(protector) {}

std::string CoordinateEngine::deriveRowKey(std::string_view content, int row) {
    std::string key;
    for (unsigned char c : detail::trimCopy(content)) {
        if (key.size() >= kMaxRowKeyLength)
            break;
        if (c == ' ') {
            key += '_';
        } else if (std::isalnum(c) || c == '_' || c == '-') {
            key += static_cast<char>(c);
        }
    }
    if (key.empty()) {
        return "row_" + std::to_string(row);
    }
    return key;
}

Result<void> CoordinateEngine::validateCoordinates(int row, int col) {
    if (row < 0 || col < 0) {
        return Error{ErrorCode::ValidationError, "Cell coordinates must be non-negative"};
    }
    if (row > kMaxRow || col > kMaxColumn) {
        return Error{ErrorCode::ValidationError,
                     "Cell (" + std::to_string(row) + ", " + std::to_string(col) +
                         ") outside table limits of " + std::to_string(kMaxRow + 1) + " rows and " +
                         std::to_string(kMaxColumn + 1) + " columns"};
    }
    return {};
}

Result<void> CoordinateEngine::requireTable(TableId tableId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT 1 FROM item_tables WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, tableId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "Table " + std::to_string(tableId) + " not found"};
    }
    return {};
}

Result<std::optional<ItemId>> CoordinateEngine::findCellId(TableId tableId, int row, int col) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT id FROM items "
                                           "WHERE table_id = ? AND cell_row = ? AND cell_col = ?"));
    SNIPVAULT_TRY(stmt.bindAll(tableId, row, col));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<ItemId>{};
    }
    return std::optional<ItemId>{stmt.getInt64(0)};
}

Result<std::string> CoordinateEngine::columnLabel(TableId tableId, int col) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT label FROM items "
                                           "WHERE table_id = ? AND cell_row = 0 AND cell_col = ?"));
    SNIPVAULT_TRY(stmt.bindAll(tableId, col));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (hasRow) {
        return stmt.getString(0);
    }
    return "COL_" + std::to_string(col);
}

Result<std::optional<Item>> CoordinateEngine::getCell(TableId tableId, int row, int col) {
    SNIPVAULT_TRY_UNWRAP(stmt,
                         db_.prepare(std::string(detail::kItemSelect) +
                                     " WHERE table_id = ? AND cell_row = ? AND cell_col = ?"));
    SNIPVAULT_TRY(stmt.bindAll(tableId, row, col));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<Item>{};
    }

    Item item = detail::itemFromRow(stmt);
    detail::revealContent(item, protector_);
    SNIPVAULT_TRY_UNWRAP(itemTags, tags_.getItemTags(item.id));
    item.tags = std::move(itemTags);
    return std::optional<Item>{std::move(item)};
}

Result<ItemId> CoordinateEngine::setCell(TableId tableId, int row, int col,
                                         std::string_view content, ICellStore& store) {
    SNIPVAULT_TRY(validateCoordinates(row, col));

    return db_.transaction([&]() -> Result<ItemId> {
        SNIPVAULT_TRY(requireTable(tableId));
        SNIPVAULT_TRY_UNWRAP(existing, findCellId(tableId, row, col));

        if (existing) {
            SNIPVAULT_TRY(store.updateCellContent(*existing, content));
            const auto header = detail::trimCopy(content);
            if (row == 0 && !header.empty()) {
                SNIPVAULT_TRY_UNWRAP(relabel,
                                     db_.prepare("UPDATE items SET label = ? WHERE id = ?"));
                SNIPVAULT_TRY(relabel.bindAll(header, *existing));
                SNIPVAULT_TRY(relabel.execute());
            }
            return *existing;
        }

        NewItem cell;
        if (row == 0) {
            cell.label = detail::trimCopy(content);
        } else {
            SNIPVAULT_TRY_UNWRAP(label, columnLabel(tableId, col));
            cell.label = std::move(label);
        }
        if (cell.label.empty()) {
            cell.label = "COL_" + std::to_string(col);
        }
        cell.content = std::string(content);
        return store.createTableCell(tableId, row, col, cell);
    });
}

Result<void> CoordinateEngine::assignRowKey(TableId tableId, int row, int col, ItemId itemId,
                                            std::string_view plaintext, bool sensitive) {
    return db_.transaction([&]() -> Result<void> {
        if (col == 0) {
            const auto key = sensitive ? "row_" + std::to_string(row) : deriveRowKey(plaintext, row);
            SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("UPDATE items SET row_key = ? "
                                                   "WHERE table_id = ? AND cell_row = ?"));
            SNIPVAULT_TRY(stmt.bindAll(key, tableId, row));
            SNIPVAULT_TRY(stmt.execute());
            spdlog::debug("Table {} row {} key '{}' ({} cell(s))", tableId, row, key,
                          db_.changes());
            return {};
        }

        std::string key = "row_" + std::to_string(row);
        SNIPVAULT_TRY_UNWRAP(lookup, db_.prepare(R"(
            SELECT row_key FROM items
            WHERE table_id = ? AND cell_row = ? AND id != ? AND row_key IS NOT NULL
            ORDER BY cell_col ASC LIMIT 1
        )"));
        SNIPVAULT_TRY(lookup.bindAll(tableId, row, itemId));
        SNIPVAULT_TRY_UNWRAP(hasRow, lookup.step());
        if (hasRow) {
            key = lookup.getString(0);
        }

        SNIPVAULT_TRY_UNWRAP(update, db_.prepare("UPDATE items SET row_key = ? WHERE id = ?"));
        SNIPVAULT_TRY(update.bindAll(key, itemId));
        return update.execute();
    });
}

Result<void> CoordinateEngine::resetRowKey(TableId tableId, int row) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("UPDATE items SET row_key = ? "
                                           "WHERE table_id = ? AND cell_row = ?"));
    SNIPVAULT_TRY(stmt.bindAll("row_" + std::to_string(row), tableId, row));
    SNIPVAULT_TRY(stmt.execute());
    spdlog::debug("Table {} row {} lost its key cell ({} cell(s) reset)", tableId, row,
                  db_.changes());
    return {};
}

Result<TableMatrix> CoordinateEngine::exportToMatrix(TableId tableId) {
    SNIPVAULT_TRY(requireTable(tableId));

    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(detail::kItemSelect) +
                                           " WHERE table_id = ? ORDER BY cell_row, cell_col"));
    SNIPVAULT_TRY(stmt.bind(1, tableId));

    std::map<std::pair<int, int>, std::string> cells;
    std::map<int, std::string> headers;
    int maxRow = -1;
    int maxCol = -1;

    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;

        Item item = detail::itemFromRow(stmt);
        detail::revealContent(item, protector_);
        const auto* cell = item.tableCell();
        if (!cell) {
            continue;
        }
        maxRow = std::max(maxRow, cell->row);
        maxCol = std::max(maxCol, cell->col);
        if (cell->row == 0) {
            headers[cell->col] = item.label;
        }
        cells[{cell->row, cell->col}] = std::move(item.content);
    }

    TableMatrix matrix;
    if (maxRow < 0) {
        return matrix;
    }

    const auto rowCount = static_cast<size_t>(maxRow) + 1;
    const auto colCount = static_cast<size_t>(maxCol) + 1;

    matrix.columns.reserve(colCount);
    for (size_t c = 0; c < colCount; ++c) {
        auto it = headers.find(static_cast<int>(c));
        matrix.columns.push_back(it != headers.end() ? it->second : "COL_" + std::to_string(c));
    }

    matrix.rows.reserve(rowCount);
    for (size_t r = 0; r < rowCount; ++r) {
        std::vector<std::string> values;
        values.reserve(colCount);
        for (size_t c = 0; c < colCount; ++c) {
            auto it = cells.find({static_cast<int>(r), static_cast<int>(c)});
            values.push_back(it != cells.end() ? it->second : std::string{});
        }
        matrix.rows.push_back(std::move(values));
    }
    return matrix;
}

Result<std::vector<ItemId>> CoordinateEngine::deleteTable(TableId tableId) {
    return db_.transaction([&]() -> Result<std::vector<ItemId>> {
        SNIPVAULT_TRY_UNWRAP(query, db_.prepare("SELECT id FROM items WHERE table_id = ?"));
        SNIPVAULT_TRY(query.bind(1, tableId));

        std::vector<ItemId> ids;
        while (true) {
            SNIPVAULT_TRY_UNWRAP(hasRow, query.step());
            if (!hasRow)
                break;
            ids.push_back(query.getInt64(0));
        }

        SNIPVAULT_TRY(tags_.removeTagsForItems(ids));

        SNIPVAULT_TRY_UNWRAP(remove, db_.prepare("DELETE FROM items WHERE table_id = ?"));
        SNIPVAULT_TRY(remove.bind(1, tableId));
        SNIPVAULT_TRY(remove.execute());

        spdlog::debug("Removed {} cell(s) of table {}", ids.size(), tableId);
        return ids;
    });
}

Result<TableDimensions> CoordinateEngine::dimensions(TableId tableId) {
    SNIPVAULT_TRY(requireTable(tableId));

    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT MAX(cell_row), MAX(cell_col), COUNT(*) "
                                           "FROM items WHERE table_id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, tableId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());

    TableDimensions dims;
    if (hasRow && !stmt.isNull(0)) {
        dims.rows = stmt.getInt(0) + 1;
        dims.cols = stmt.getInt(1) + 1;
        dims.cells = stmt.getInt64(2);
    }
    return dims;
}

Result<int64_t> CoordinateEngine::countCells(TableId tableId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT COUNT(*) FROM items WHERE table_id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, tableId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    return hasRow ? stmt.getInt64(0) : int64_t{0};
}

Result<std::vector<Item>> CoordinateEngine::listCells(TableId tableId) {
    SNIPVAULT_TRY(requireTable(tableId));

    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(detail::kItemSelect) +
                                           " WHERE table_id = ? ORDER BY cell_row, cell_col"));
    SNIPVAULT_TRY(stmt.bind(1, tableId));

    std::vector<Item> items;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        Item item = detail::itemFromRow(stmt);
        detail::revealContent(item, protector_);
        items.push_back(std::move(item));
    }

    for (auto& item : items) {
        SNIPVAULT_TRY_UNWRAP(itemTags, tags_.getItemTags(item.id));
        item.tags = std::move(itemTags);
    }
    return items;
}

} // namespace snipvault::store
