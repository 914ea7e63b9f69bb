#include <spdlog/spdlog.h>
#include <snipvault/store/item_repository.h>

#include <algorithm>

#include "detail/result_helpers.hpp"
#include "detail/string_utils.hpp"

namespace snipvault::store {

namespace {

constexpr const char* kTableSelect =
    "SELECT id, collection_id, name, description, created_at, updated_at FROM item_tables";

Table tableFromRow(const Statement& stmt) {
    Table table;
    table.id = stmt.getInt64(0);
    table.collectionId = stmt.getInt64(1);
    table.name = stmt.getString(2);
    table.description = stmt.getOptionalString(3);
    table.created = fromUnixSeconds(stmt.getInt64(4));
    table.updated = fromUnixSeconds(stmt.getInt64(5));
    return table;
}

bool containsColumn(const std::vector<int>& columns, int col) {
    return std::find(columns.begin(), columns.end(), col) != columns.end();
}

} // namespace

Result<TableId> ItemRepository::createTable(CollectionId collectionId, const std::string& name,
                                            const std::optional<std::string>& description) {
    const auto trimmed = detail::trimCopy(name);
    if (trimmed.empty()) {
        return Error{ErrorCode::ValidationError, "Table name must not be empty"};
    }

    return db_.transaction([&]() -> Result<TableId> {
        SNIPVAULT_TRY(requireCollection(collectionId));
        SNIPVAULT_TRY_UNWRAP(existing, findTableByName(trimmed));
        if (existing) {
            return Error{ErrorCode::Conflict, "Table '" + trimmed + "' already exists"};
        }

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
            INSERT INTO item_tables (collection_id, name, description, created_at, updated_at)
            VALUES (?, ?, ?, ?, ?)
        )"));
        const int64_t now = nowUnixSeconds();
        SNIPVAULT_TRY(stmt.bindAll(collectionId, trimmed, description, now, now));
        SNIPVAULT_TRY(stmt.execute());

        TableId id = db_.lastInsertRowId();
        spdlog::debug("Created table '{}' (id {})", trimmed, id);
        return id;
    });
}

Result<Table> ItemRepository::getTable(TableId tableId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kTableSelect) + " WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, tableId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "Table " + std::to_string(tableId) + " not found"};
    }
    return tableFromRow(stmt);
}

Result<std::optional<Table>> ItemRepository::findTableByName(const std::string& name) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kTableSelect) + " WHERE name = ?"));
    SNIPVAULT_TRY(stmt.bind(1, detail::trimCopy(name)));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<Table>{};
    }
    return std::optional<Table>{tableFromRow(stmt)};
}

Result<std::vector<Table>> ItemRepository::listTables(std::optional<CollectionId> collectionId) {
    QueryBuilder qb;
    qb.select({"id", "collection_id", "name", "description", "created_at", "updated_at"})
        .from("item_tables");
    if (collectionId) {
        qb.where("collection_id = ?");
    }
    qb.orderBy("name");

    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(qb.build()));
    if (collectionId) {
        SNIPVAULT_TRY(stmt.bind(1, *collectionId));
    }

    std::vector<Table> tables;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        tables.push_back(tableFromRow(stmt));
    }
    return tables;
}

Result<void> ItemRepository::renameTable(TableId tableId, const std::string& newName) {
    const auto trimmed = detail::trimCopy(newName);
    if (trimmed.empty()) {
        return Error{ErrorCode::ValidationError, "Table name must not be empty"};
    }

    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(table, getTable(tableId));
        if (table.name == trimmed) {
            return {};
        }

        SNIPVAULT_TRY_UNWRAP(existing, findTableByName(trimmed));
        if (existing) {
            return Error{ErrorCode::Conflict, "Table '" + trimmed + "' already exists"};
        }

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(
                                       "UPDATE item_tables SET name = ?, updated_at = ? WHERE id = ?"));
        SNIPVAULT_TRY(stmt.bindAll(trimmed, nowUnixSeconds(), tableId));
        return stmt.execute();
    });
}

Result<ItemId> ItemRepository::createTableCell(TableId tableId, int row, int col,
                                               const NewItem& item) {
    SNIPVAULT_TRY(CoordinateEngine::validateCoordinates(row, col));
    SNIPVAULT_TRY(validateNewItem(item));

    return db_.transaction([&]() -> Result<ItemId> {
        SNIPVAULT_TRY_UNWRAP(table, getTable(tableId));

        SNIPVAULT_TRY_UNWRAP(occupied, coordinates_.getCell(tableId, row, col));
        if (occupied) {
            return Error{ErrorCode::Conflict, "Cell (" + std::to_string(row) + ", " +
                                                  std::to_string(col) + ") of table " +
                                                  std::to_string(tableId) + " is occupied"};
        }

        SNIPVAULT_TRY_UNWRAP(id,
                             insertItem(table.collectionId, item, TableCell{tableId, row, col, {}}));
        SNIPVAULT_TRY(
            coordinates_.assignRowKey(tableId, row, col, id, item.content, item.sensitive));
        return id;
    });
}

Result<TableId> ItemRepository::createTableFromRows(
    CollectionId collectionId, const std::string& name, const std::vector<std::string>& columnNames,
    const std::vector<std::vector<std::string>>& rows, const TableImportOptions& options) {
    if (columnNames.empty()) {
        return Error{ErrorCode::ValidationError, "Table import needs at least one column"};
    }
    if (columnNames.size() > static_cast<size_t>(CoordinateEngine::kMaxColumn) + 1 ||
        rows.size() > static_cast<size_t>(CoordinateEngine::kMaxRow) + 1) {
        return Error{ErrorCode::ValidationError,
                     "Table import of " + std::to_string(rows.size()) + " rows and " +
                         std::to_string(columnNames.size()) + " columns exceeds table limits"};
    }
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() > columnNames.size()) {
            return Error{ErrorCode::ValidationError,
                         "Row " + std::to_string(r) + " has " + std::to_string(rows[r].size()) +
                             " values for " + std::to_string(columnNames.size()) + " columns"};
        }
    }

    return db_.transaction([&]() -> Result<TableId> {
        SNIPVAULT_TRY_UNWRAP(tableId, createTable(collectionId, name, options.description));

        size_t created = 0;
        for (size_t r = 0; r < rows.size(); ++r) {
            for (size_t c = 0; c < rows[r].size(); ++c) {
                if (detail::trimCopy(rows[r][c]).empty()) {
                    continue;
                }
                const int col = static_cast<int>(c);

                NewItem cell;
                cell.label = detail::trimCopy(columnNames[c]);
                if (cell.label.empty()) {
                    cell.label = "COL_" + std::to_string(col);
                }
                cell.content = rows[r][c];
                cell.sensitive = containsColumn(options.sensitiveColumns, col);
                if (containsColumn(options.urlColumns, col)) {
                    cell.kind = ContentKind::Url;
                    cell.validateKind = true;
                }
                cell.tags = options.tags;

                SNIPVAULT_TRY(createTableCell(tableId, static_cast<int>(r), col, cell));
                ++created;
            }
        }

        spdlog::info("Imported table '{}' (id {}): {} row(s), {} cell(s)", name, tableId,
                     rows.size(), created);
        return tableId;
    });
}

Result<ItemId> ItemRepository::setTableCell(TableId tableId, int row, int col,
                                            std::string_view content) {
    return coordinates_.setCell(tableId, row, col, content, *this);
}

Result<std::optional<Item>> ItemRepository::getTableCell(TableId tableId, int row, int col) {
    SNIPVAULT_TRY(getTable(tableId));
    return coordinates_.getCell(tableId, row, col);
}

Result<std::vector<Item>> ItemRepository::listCells(TableId tableId) {
    return coordinates_.listCells(tableId);
}

Result<int64_t> ItemRepository::countCells(TableId tableId) {
    return coordinates_.countCells(tableId);
}

Result<TableMatrix> ItemRepository::exportTable(TableId tableId) {
    return coordinates_.exportToMatrix(tableId);
}

Result<TableDimensions> ItemRepository::tableDimensions(TableId tableId) {
    return coordinates_.dimensions(tableId);
}

Result<void> ItemRepository::deleteTable(TableId tableId) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY(getTable(tableId));
        SNIPVAULT_TRY_UNWRAP(removed, coordinates_.deleteTable(tableId));

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("DELETE FROM item_tables WHERE id = ?"));
        SNIPVAULT_TRY(stmt.bind(1, tableId));
        SNIPVAULT_TRY(stmt.execute());

        spdlog::debug("Deleted table {} with {} cell(s)", tableId, removed.size());
        return {};
    });
}

} // namespace snipvault::store
