#include <spdlog/spdlog.h>
#include <snipvault/store/content_kind.h>
#include <snipvault/store/item_repository.h>

#include <variant>

#include "detail/item_rows.hpp"
#include "detail/result_helpers.hpp"
#include "detail/string_utils.hpp"

namespace snipvault::store {

namespace {

using BindValue = std::variant<std::nullptr_t, int64_t, std::string>;

Result<void> bindValues(Statement& stmt, const std::vector<BindValue>& values) {
    int index = 1;
    for (const auto& value : values) {
        auto result = std::visit([&](const auto& v) { return stmt.bind(index, v); }, value);
        if (!result)
            return result;
        ++index;
    }
    return {};
}

BindValue optionalText(const std::string& value) {
    if (value.empty())
        return nullptr;
    return value;
}

Collection collectionFromRow(const Statement& stmt) {
    Collection c;
    c.id = stmt.getInt64(0);
    c.name = stmt.getString(1);
    c.description = stmt.getOptionalString(2);
    c.created = fromUnixSeconds(stmt.getInt64(3));
    c.updated = fromUnixSeconds(stmt.getInt64(4));
    return c;
}

constexpr const char* kCollectionSelect =
    "SELECT id, name, description, created_at, updated_at FROM collections";

} // namespace

ItemRepository::ItemRepository(Database& db, crypto::IContentProtector* protector)
    : db_(db), protector_(protector), tags_(db), ordering_(db),
      coordinates_(db, tags_, protector) {}

// ----------------------------------------------------------------------------
// Collections
// ----------------------------------------------------------------------------

Result<CollectionId> ItemRepository::createCollection(const std::string& name,
                                                      const std::optional<std::string>& description) {
    const auto trimmed = detail::trimCopy(name);
    if (trimmed.empty()) {
        return Error{ErrorCode::ValidationError, "Collection name must not be empty"};
    }

    return db_.transaction([&]() -> Result<CollectionId> {
        SNIPVAULT_TRY_UNWRAP(existing, findCollection(trimmed));
        if (existing) {
            return Error{ErrorCode::Conflict, "Collection '" + trimmed + "' already exists"};
        }

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("INSERT INTO collections (name, description, "
                                               "created_at, updated_at) VALUES (?, ?, ?, ?)"));
        const int64_t now = nowUnixSeconds();
        SNIPVAULT_TRY(stmt.bindAll(trimmed, description, now, now));
        SNIPVAULT_TRY(stmt.execute());

        CollectionId id = db_.lastInsertRowId();
        spdlog::debug("Created collection '{}' (id {})", trimmed, id);
        return id;
    });
}

Result<Collection> ItemRepository::getCollection(CollectionId id) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kCollectionSelect) + " WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, id));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "Collection " + std::to_string(id) + " not found"};
    }
    return collectionFromRow(stmt);
}

Result<std::optional<Collection>> ItemRepository::findCollection(const std::string& name) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kCollectionSelect) + " WHERE name = ?"));
    SNIPVAULT_TRY(stmt.bind(1, detail::trimCopy(name)));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<Collection>{};
    }
    return std::optional<Collection>{collectionFromRow(stmt)};
}

Result<std::vector<Collection>> ItemRepository::listCollections() {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kCollectionSelect) + " ORDER BY name ASC"));

    std::vector<Collection> collections;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        collections.push_back(collectionFromRow(stmt));
    }
    return collections;
}

Result<void> ItemRepository::requireCollection(CollectionId collectionId) {
    auto result = getCollection(collectionId);
    if (!result)
        return result.error();
    return {};
}

Result<void> ItemRepository::deleteCollection(CollectionId id) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY(requireCollection(id));

        // Counters first; item_tags rows vanish with the cascade
        SNIPVAULT_TRY_UNWRAP(ids, collectItemIds("SELECT id FROM items WHERE collection_id = ?", id));
        SNIPVAULT_TRY(tags_.removeTagsForItems(ids));

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("DELETE FROM collections WHERE id = ?"));
        SNIPVAULT_TRY(stmt.bind(1, id));
        SNIPVAULT_TRY(stmt.execute());

        spdlog::info("Deleted collection {} with {} item(s)", id, ids.size());
        return {};
    });
}

// ----------------------------------------------------------------------------
// Items
// ----------------------------------------------------------------------------

Result<void> ItemRepository::validateNewItem(const NewItem& item) const {
    if (detail::trimCopy(item.label).empty()) {
        return Error{ErrorCode::ValidationError, "Item label must not be empty"};
    }
    if (detail::trimCopy(item.content).empty()) {
        return Error{ErrorCode::ValidationError, "Item content must not be empty"};
    }
    if (item.validateKind) {
        return validateContent(item.kind, item.content);
    }
    return {};
}

Result<std::string> ItemRepository::protectContent(const std::string& plaintext, bool sensitive) {
    if (!sensitive) {
        return plaintext;
    }
    if (!protector_) {
        return Error{ErrorCode::InvalidState, "No content key configured for sensitive items"};
    }
    // Only ciphertext this key authenticates is stored as is
    if (protector_->isEncrypted(plaintext) && protector_->decrypt(plaintext)) {
        return plaintext;
    }
    return protector_->encrypt(plaintext);
}

Result<ItemId> ItemRepository::insertItem(CollectionId collectionId, const NewItem& item,
                                          const Placement& placement) {
    SNIPVAULT_TRY(validateNewItem(item));
    SNIPVAULT_TRY_UNWRAP(stored, protectContent(item.content, item.sensitive));

    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
        INSERT INTO items (collection_id, label, content, kind, is_sensitive, is_favorite,
                           color, description, size_bytes, created_at, updated_at,
                           list_id, position, table_id, cell_row, cell_col)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )"));

    const int64_t now = nowUnixSeconds();
    const int64_t sizeBytes = item.sizeBytes.value_or(static_cast<int64_t>(item.content.size()));
    SNIPVAULT_TRY(stmt.bindAll(collectionId, detail::trimCopy(item.label), stored,
                               contentKindToString(item.kind), item.sensitive, item.favorite,
                               item.color, item.description, sizeBytes, now, now));

    std::optional<int64_t> listId, tableId;
    std::optional<int> position, row, col;
    if (const auto* step = std::get_if<ListStep>(&placement)) {
        listId = step->listId;
        position = step->position;
    } else if (const auto* cell = std::get_if<TableCell>(&placement)) {
        tableId = cell->tableId;
        row = cell->row;
        col = cell->col;
    }
    SNIPVAULT_TRY(stmt.bind(12, listId));
    SNIPVAULT_TRY(stmt.bind(13, position));
    SNIPVAULT_TRY(stmt.bind(14, tableId));
    SNIPVAULT_TRY(stmt.bind(15, row));
    SNIPVAULT_TRY(stmt.bind(16, col));
    SNIPVAULT_TRY(stmt.execute());

    ItemId id = db_.lastInsertRowId();
    for (const auto& tag : TagManager::normalizeTagNames(item.tags)) {
        SNIPVAULT_TRY(tags_.associate(id, tag));
    }
    return id;
}

Result<ItemId> ItemRepository::createStandaloneItem(CollectionId collectionId,
                                                    const NewItem& item) {
    return db_.transaction([&]() -> Result<ItemId> {
        SNIPVAULT_TRY(requireCollection(collectionId));
        SNIPVAULT_TRY_UNWRAP(id, insertItem(collectionId, item, Standalone{}));
        spdlog::debug("Created item {} in collection {}", id, collectionId);
        return id;
    });
}

Result<Item> ItemRepository::loadStoredItem(ItemId itemId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(detail::kItemSelect) + " WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, itemId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "Item " + std::to_string(itemId) + " not found"};
    }
    return detail::itemFromRow(stmt);
}

Result<Item> ItemRepository::readItem(ItemId itemId) {
    SNIPVAULT_TRY_UNWRAP(item, loadStoredItem(itemId));
    detail::revealContent(item, protector_);
    SNIPVAULT_TRY_UNWRAP(itemTags, tags_.getItemTags(itemId));
    item.tags = std::move(itemTags);
    return item;
}

Result<void> ItemRepository::updateItem(ItemId itemId, const ItemUpdate& update) {
    if (update.label && detail::trimCopy(*update.label).empty()) {
        return Error{ErrorCode::ValidationError, "Item label must not be empty"};
    }
    if (update.content && detail::trimCopy(*update.content).empty()) {
        return Error{ErrorCode::ValidationError, "Item content must not be empty"};
    }

    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(current, loadStoredItem(itemId));
        if (update.empty()) {
            return {};
        }

        const bool wasSensitive = current.sensitive;
        const bool nowSensitive = update.sensitive.value_or(wasSensitive);

        // Plaintext of the new content, when content or its protection changes
        std::optional<std::string> plaintext;
        std::optional<std::string> stored;
        if (update.content) {
            plaintext = *update.content;
            SNIPVAULT_TRY_UNWRAP(protectedContent, protectContent(*update.content, nowSensitive));
            stored = std::move(protectedContent);
        } else if (nowSensitive && !wasSensitive) {
            plaintext = current.content;
            SNIPVAULT_TRY_UNWRAP(protectedContent, protectContent(current.content, true));
            stored = std::move(protectedContent);
        } else if (!nowSensitive && wasSensitive) {
            if (!protector_) {
                return Error{ErrorCode::InvalidState,
                             "No content key configured to decrypt item " +
                                 std::to_string(itemId)};
            }
            auto decrypted = protector_->decrypt(current.content);
            if (!decrypted) {
                return Error{ErrorCode::CorruptContent,
                             "Cannot remove protection from item " + std::to_string(itemId) +
                                 ": " + decrypted.error().message};
            }
            plaintext = decrypted.value();
            stored = std::move(decrypted).value();
        }

        QueryBuilder qb;
        qb.update("items");
        std::vector<BindValue> values;

        if (update.label) {
            qb.set("label");
            values.emplace_back(detail::trimCopy(*update.label));
        }
        if (stored) {
            qb.set("content");
            values.emplace_back(*stored);
        }
        if (update.content && !update.sizeBytes) {
            qb.set("size_bytes");
            values.emplace_back(static_cast<int64_t>(update.content->size()));
        }
        if (update.kind) {
            qb.set("kind");
            values.emplace_back(std::string(contentKindToString(*update.kind)));
        }
        if (update.sensitive) {
            qb.set("is_sensitive");
            values.emplace_back(int64_t{nowSensitive ? 1 : 0});
        }
        if (update.favorite) {
            qb.set("is_favorite");
            values.emplace_back(int64_t{*update.favorite ? 1 : 0});
        }
        if (update.color) {
            qb.set("color");
            values.push_back(optionalText(*update.color));
        }
        if (update.description) {
            qb.set("description");
            values.push_back(optionalText(*update.description));
        }
        if (update.sizeBytes) {
            qb.set("size_bytes");
            values.emplace_back(*update.sizeBytes);
        }
        qb.set("updated_at");
        values.emplace_back(nowUnixSeconds());
        qb.where("id = ?");
        values.emplace_back(itemId);

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(qb.build()));
        SNIPVAULT_TRY(bindValues(stmt, values));
        SNIPVAULT_TRY(stmt.execute());

        if (update.tags) {
            SNIPVAULT_TRY(tags_.replaceItemTags(itemId, *update.tags));
        }

        const auto* cell = current.tableCell();
        if (cell && cell->col == 0 && plaintext) {
            SNIPVAULT_TRY(coordinates_.assignRowKey(cell->tableId, cell->row, cell->col, itemId,
                                                    *plaintext, nowSensitive));
        }

        if (wasSensitive != nowSensitive) {
            spdlog::debug("Item {} sensitivity {} -> {}", itemId, wasSensitive, nowSensitive);
        }
        return {};
    });
}

Result<void> ItemRepository::updateCellContent(ItemId itemId, std::string_view content) {
    ItemUpdate update;
    update.content = std::string(content);
    return updateItem(itemId, update);
}

Result<void> ItemRepository::removeItemRow(ItemId itemId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("DELETE FROM items WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, itemId));
    SNIPVAULT_TRY(stmt.execute());
    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Item " + std::to_string(itemId) + " not found"};
    }
    return {};
}

Result<void> ItemRepository::deleteItem(ItemId itemId) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(current, loadStoredItem(itemId));
        SNIPVAULT_TRY(tags_.removeAllItemTags(itemId));

        if (current.listStep()) {
            return ordering_.deleteStep(itemId,
                                        [this](ItemId id) { return removeItemRow(id); });
        }
        SNIPVAULT_TRY(removeItemRow(itemId));
        if (const auto* cell = current.tableCell(); cell && cell->col == 0) {
            SNIPVAULT_TRY(coordinates_.resetRowKey(cell->tableId, cell->row));
        }
        return {};
    });
}

Result<std::vector<Item>> ItemRepository::queryItems(const std::string& sql, int64_t param) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(sql));
    SNIPVAULT_TRY(stmt.bind(1, param));

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

Result<std::vector<ItemId>> ItemRepository::collectItemIds(const std::string& sql, int64_t param) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(sql));
    SNIPVAULT_TRY(stmt.bind(1, param));

    std::vector<ItemId> ids;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        ids.push_back(stmt.getInt64(0));
    }
    return ids;
}

Result<std::vector<Item>> ItemRepository::listItems(CollectionId collectionId) {
    SNIPVAULT_TRY(requireCollection(collectionId));
    return queryItems(std::string(detail::kItemSelect) +
                          " WHERE collection_id = ? AND list_id IS NULL AND table_id IS NULL"
                          " ORDER BY is_favorite DESC, label COLLATE NOCASE ASC, id ASC",
                      collectionId);
}

Result<std::vector<Item>> ItemRepository::findItemsByTag(const std::string& tag) {
    SNIPVAULT_TRY_UNWRAP(ids, tags_.findItemsByTag(tag));

    std::vector<Item> items;
    items.reserve(ids.size());
    for (ItemId id : ids) {
        SNIPVAULT_TRY_UNWRAP(item, readItem(id));
        items.push_back(std::move(item));
    }
    return items;
}

Result<void> ItemRepository::recordUse(ItemId itemId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("UPDATE items SET use_count = use_count + 1, "
                                           "last_used = ? WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bindAll(nowUnixSeconds(), itemId));
    SNIPVAULT_TRY(stmt.execute());
    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Item " + std::to_string(itemId) + " not found"};
    }
    return {};
}

// ----------------------------------------------------------------------------
// Statistics
// ----------------------------------------------------------------------------

Result<int64_t> ItemRepository::countRows(const std::string& sql) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(sql));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    return hasRow ? stmt.getInt64(0) : int64_t{0};
}

Result<StoreStatistics> ItemRepository::statistics() {
    StoreStatistics stats;
    SNIPVAULT_TRY_UNWRAP(collections, countRows("SELECT COUNT(*) FROM collections"));
    SNIPVAULT_TRY_UNWRAP(lists, countRows("SELECT COUNT(*) FROM lists"));
    SNIPVAULT_TRY_UNWRAP(tables, countRows("SELECT COUNT(*) FROM item_tables"));
    SNIPVAULT_TRY_UNWRAP(items, countRows("SELECT COUNT(*) FROM items"));
    SNIPVAULT_TRY_UNWRAP(steps, countRows("SELECT COUNT(*) FROM items WHERE list_id IS NOT NULL"));
    SNIPVAULT_TRY_UNWRAP(cells, countRows("SELECT COUNT(*) FROM items WHERE table_id IS NOT NULL"));
    SNIPVAULT_TRY_UNWRAP(sensitive, countRows("SELECT COUNT(*) FROM items WHERE is_sensitive = 1"));
    SNIPVAULT_TRY_UNWRAP(tagStats, tags_.statistics());

    stats.collections = collections;
    stats.lists = lists;
    stats.tables = tables;
    stats.items = items;
    stats.listSteps = steps;
    stats.tableCells = cells;
    stats.standaloneItems = items - steps - cells;
    stats.sensitiveItems = sensitive;
    stats.tags = tagStats;
    return stats;
}

} // namespace snipvault::store
