#include <spdlog/spdlog.h>
#include <snipvault/store/item_repository.h>

#include "detail/item_rows.hpp"
#include "detail/result_helpers.hpp"
#include "detail/string_utils.hpp"

namespace snipvault::store {

namespace {

constexpr const char* kListSelect = R"(
    SELECT l.id, l.collection_id, l.name, l.description, l.use_count, l.last_used,
           l.created_at, l.updated_at,
           (SELECT COUNT(*) FROM items i WHERE i.list_id = l.id) AS step_count
    FROM lists l
)";

ItemList listFromRow(const Statement& stmt) {
    ItemList list;
    list.id = stmt.getInt64(0);
    list.collectionId = stmt.getInt64(1);
    list.name = stmt.getString(2);
    list.description = stmt.getOptionalString(3);
    list.useCount = stmt.getInt64(4);
    if (auto lastUsed = stmt.getOptionalInt64(5)) {
        list.lastUsed = fromUnixSeconds(*lastUsed);
    }
    list.created = fromUnixSeconds(stmt.getInt64(6));
    list.updated = fromUnixSeconds(stmt.getInt64(7));
    list.stepCount = stmt.getInt64(8);
    return list;
}

} // namespace

Result<ListId> ItemRepository::createList(CollectionId collectionId, const std::string& name,
                                          const std::optional<std::string>& description) {
    const auto trimmed = detail::trimCopy(name);
    if (trimmed.empty()) {
        return Error{ErrorCode::ValidationError, "List name must not be empty"};
    }

    return db_.transaction([&]() -> Result<ListId> {
        SNIPVAULT_TRY(requireCollection(collectionId));
        SNIPVAULT_TRY_UNWRAP(existing, findList(collectionId, trimmed));
        if (existing) {
            return Error{ErrorCode::Conflict, "List '" + trimmed + "' already exists in collection " +
                                                  std::to_string(collectionId)};
        }

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
            INSERT INTO lists (collection_id, name, description, created_at, updated_at)
            VALUES (?, ?, ?, ?, ?)
        )"));
        const int64_t now = nowUnixSeconds();
        SNIPVAULT_TRY(stmt.bindAll(collectionId, trimmed, description, now, now));
        SNIPVAULT_TRY(stmt.execute());

        ListId id = db_.lastInsertRowId();
        spdlog::debug("Created list '{}' (id {}) in collection {}", trimmed, id, collectionId);
        return id;
    });
}

Result<ItemList> ItemRepository::getList(ListId listId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kListSelect) + " WHERE l.id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, listId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "List " + std::to_string(listId) + " not found"};
    }
    return listFromRow(stmt);
}

Result<std::optional<ItemList>> ItemRepository::findList(CollectionId collectionId,
                                                         const std::string& name) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kListSelect) +
                                           " WHERE l.collection_id = ? AND l.name = ?"));
    SNIPVAULT_TRY(stmt.bindAll(collectionId, detail::trimCopy(name)));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<ItemList>{};
    }
    return std::optional<ItemList>{listFromRow(stmt)};
}

Result<std::vector<ItemList>> ItemRepository::listLists(CollectionId collectionId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(std::string(kListSelect) +
                                           " WHERE l.collection_id = ? ORDER BY l.name ASC"));
    SNIPVAULT_TRY(stmt.bind(1, collectionId));

    std::vector<ItemList> lists;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        lists.push_back(listFromRow(stmt));
    }
    return lists;
}

Result<void> ItemRepository::renameList(ListId listId, const std::string& newName) {
    const auto trimmed = detail::trimCopy(newName);
    if (trimmed.empty()) {
        return Error{ErrorCode::ValidationError, "List name must not be empty"};
    }

    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(list, getList(listId));
        if (list.name == trimmed) {
            return {};
        }

        SNIPVAULT_TRY_UNWRAP(existing, findList(list.collectionId, trimmed));
        if (existing) {
            return Error{ErrorCode::Conflict, "List '" + trimmed + "' already exists"};
        }

        SNIPVAULT_TRY_UNWRAP(stmt,
                             db_.prepare("UPDATE lists SET name = ?, updated_at = ? WHERE id = ?"));
        SNIPVAULT_TRY(stmt.bindAll(trimmed, nowUnixSeconds(), listId));
        return stmt.execute();
    });
}

Result<ItemId> ItemRepository::createListStep(ListId listId, const NewItem& item,
                                              std::optional<int> position) {
    SNIPVAULT_TRY(validateNewItem(item));

    return db_.transaction([&]() -> Result<ItemId> {
        SNIPVAULT_TRY_UNWRAP(list, getList(listId));

        int target = 0;
        if (position) {
            SNIPVAULT_TRY(ordering_.insertAt(listId, *position));
            target = *position;
        } else {
            SNIPVAULT_TRY_UNWRAP(next, ordering_.nextPosition(listId));
            target = next;
        }

        SNIPVAULT_TRY_UNWRAP(id, insertItem(list.collectionId, item, ListStep{listId, target}));
        spdlog::debug("Created step {} at position {} in list {}", id, target, listId);
        return id;
    });
}

Result<ListId> ItemRepository::createListWithSteps(CollectionId collectionId,
                                                   const std::string& name,
                                                   const std::vector<NewItem>& steps,
                                                   const std::optional<std::string>& description) {
    return db_.transaction([&]() -> Result<ListId> {
        SNIPVAULT_TRY_UNWRAP(listId, createList(collectionId, name, description));
        for (const auto& step : steps) {
            SNIPVAULT_TRY(createListStep(listId, step));
        }
        return listId;
    });
}

Result<std::vector<Item>> ItemRepository::listSteps(ListId listId) {
    SNIPVAULT_TRY(getList(listId));
    return queryItems(std::string(detail::kItemSelect) +
                          " WHERE list_id = ? ORDER BY position ASC, id ASC",
                      listId);
}

Result<int> ItemRepository::countSteps(ListId listId) {
    return ordering_.countSteps(listId);
}

Result<void> ItemRepository::moveStep(ItemId itemId, int newPosition) {
    return ordering_.moveStep(itemId, newPosition);
}

Result<int> ItemRepository::renumberList(ListId listId) {
    SNIPVAULT_TRY(getList(listId));
    return ordering_.renumberList(listId);
}

Result<bool> ItemRepository::checkListContiguity(ListId listId) {
    SNIPVAULT_TRY(getList(listId));
    return ordering_.checkContiguity(listId);
}

Result<void> ItemRepository::recordListUse(ListId listId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("UPDATE lists SET use_count = use_count + 1, "
                                           "last_used = ? WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bindAll(nowUnixSeconds(), listId));
    SNIPVAULT_TRY(stmt.execute());
    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "List " + std::to_string(listId) + " not found"};
    }
    return {};
}

Result<void> ItemRepository::deleteList(ListId listId) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY(getList(listId));

        SNIPVAULT_TRY_UNWRAP(ids, collectItemIds("SELECT id FROM items WHERE list_id = ?", listId));
        SNIPVAULT_TRY(tags_.removeTagsForItems(ids));

        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("DELETE FROM lists WHERE id = ?"));
        SNIPVAULT_TRY(stmt.bind(1, listId));
        SNIPVAULT_TRY(stmt.execute());

        spdlog::debug("Deleted list {} with {} step(s)", listId, ids.size());
        return {};
    });
}

} // namespace snipvault::store
