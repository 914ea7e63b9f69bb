#include <spdlog/spdlog.h>
#include <snipvault/store/tag_manager.h>

#include <algorithm>
#include <iterator>

#include "detail/result_helpers.hpp"
#include "detail/string_utils.hpp"

namespace snipvault::store {

namespace {

constexpr const char* kTagColumns =
    "SELECT id, name, usage_count, last_used, created_at, color, description FROM tags";

Tag tagFromRow(const Statement& stmt) {
    Tag tag;
    tag.id = stmt.getInt64(0);
    tag.name = stmt.getString(1);
    tag.usageCount = stmt.getInt64(2);
    if (auto lastUsed = stmt.getOptionalInt64(3)) {
        tag.lastUsed = fromUnixSeconds(*lastUsed);
    }
    tag.created = fromUnixSeconds(stmt.getInt64(4));
    tag.color = stmt.getOptionalString(5);
    tag.description = stmt.getOptionalString(6);
    return tag;
}

Result<bool> itemExists(Database& db, ItemId itemId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db.prepare("SELECT 1 FROM items WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, itemId));
    return stmt.step();
}

} // namespace

TagManager::TagManager(Database& db) : db_(db) {}

std::string TagManager::normalizeTagName(std::string_view name) {
    return detail::asciiLower(detail::trimCopy(name));
}

std::vector<std::string> TagManager::normalizeTagNames(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        auto normalized = normalizeTagName(name);
        if (!normalized.empty()) {
            out.push_back(std::move(normalized));
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

Result<std::optional<TagId>> TagManager::findTagId(const std::string& normalized) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT id FROM tags WHERE name = ?"));
    SNIPVAULT_TRY(stmt.bind(1, normalized));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return std::optional<TagId>{};
    }
    return std::optional<TagId>{stmt.getInt64(0)};
}

Result<TagId> TagManager::getOrCreateTag(std::string_view name) {
    const auto normalized = normalizeTagName(name);
    if (normalized.empty()) {
        return Error{ErrorCode::ValidationError, "Tag name must not be empty"};
    }

    SNIPVAULT_TRY_UNWRAP(existing, findTagId(normalized));
    if (existing) {
        return *existing;
    }

    SNIPVAULT_TRY_UNWRAP(
        stmt, db_.prepare("INSERT INTO tags (name, usage_count, created_at) VALUES (?, 0, ?)"));
    SNIPVAULT_TRY(stmt.bindAll(normalized, nowUnixSeconds()));
    SNIPVAULT_TRY(stmt.execute());

    TagId id = db_.lastInsertRowId();
    spdlog::debug("Created tag '{}' (id {})", normalized, id);
    return id;
}

Result<bool> TagManager::associate(ItemId itemId, std::string_view name) {
    const auto normalized = normalizeTagName(name);
    if (normalized.empty()) {
        return Error{ErrorCode::ValidationError, "Tag name must not be empty"};
    }

    return db_.transaction([&]() -> Result<bool> {
        SNIPVAULT_TRY_UNWRAP(exists, itemExists(db_, itemId));
        if (!exists) {
            return Error{ErrorCode::NotFound, "Item " + std::to_string(itemId) + " not found"};
        }

        SNIPVAULT_TRY_UNWRAP(tagId, getOrCreateTag(normalized));
        const int64_t now = nowUnixSeconds();

        SNIPVAULT_TRY_UNWRAP(insert,
                             db_.prepare("INSERT OR IGNORE INTO item_tags (item_id, tag_id, "
                                         "created_at) VALUES (?, ?, ?)"));
        SNIPVAULT_TRY(insert.bindAll(itemId, tagId, now));
        SNIPVAULT_TRY(insert.execute());
        if (db_.changes() == 0) {
            return false;
        }

        SNIPVAULT_TRY_UNWRAP(bump, db_.prepare("UPDATE tags SET usage_count = usage_count + 1, "
                                               "last_used = ? WHERE id = ?"));
        SNIPVAULT_TRY(bump.bindAll(now, tagId));
        SNIPVAULT_TRY(bump.execute());
        return true;
    });
}

Result<bool> TagManager::dissociate(ItemId itemId, std::string_view name) {
    const auto normalized = normalizeTagName(name);
    if (normalized.empty()) {
        return false;
    }

    return db_.transaction([&]() -> Result<bool> {
        SNIPVAULT_TRY_UNWRAP(tagId, findTagId(normalized));
        if (!tagId) {
            return false;
        }

        SNIPVAULT_TRY_UNWRAP(remove,
                             db_.prepare("DELETE FROM item_tags WHERE item_id = ? AND tag_id = ?"));
        SNIPVAULT_TRY(remove.bindAll(itemId, *tagId));
        SNIPVAULT_TRY(remove.execute());
        if (db_.changes() == 0) {
            return false;
        }

        SNIPVAULT_TRY_UNWRAP(drop, db_.prepare("UPDATE tags SET usage_count = "
                                               "MAX(usage_count - 1, 0) WHERE id = ?"));
        SNIPVAULT_TRY(drop.bind(1, *tagId));
        SNIPVAULT_TRY(drop.execute());
        return true;
    });
}

Result<void> TagManager::replaceItemTags(ItemId itemId, const std::vector<std::string>& names) {
    const auto desired = normalizeTagNames(names);

    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(exists, itemExists(db_, itemId));
        if (!exists) {
            return Error{ErrorCode::NotFound, "Item " + std::to_string(itemId) + " not found"};
        }

        SNIPVAULT_TRY_UNWRAP(current, getItemTags(itemId));

        std::vector<std::string> toAdd;
        std::vector<std::string> toRemove;
        std::set_difference(desired.begin(), desired.end(), current.begin(), current.end(),
                            std::back_inserter(toAdd));
        std::set_difference(current.begin(), current.end(), desired.begin(), desired.end(),
                            std::back_inserter(toRemove));

        for (const auto& name : toRemove) {
            SNIPVAULT_TRY(dissociate(itemId, name));
        }
        for (const auto& name : toAdd) {
            SNIPVAULT_TRY(associate(itemId, name));
        }

        if (!toAdd.empty() || !toRemove.empty()) {
            spdlog::debug("Item {} tags: +{} -{}", itemId, toAdd.size(), toRemove.size());
        }
        return {};
    });
}

Result<void> TagManager::removeAllItemTags(ItemId itemId) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(drop, db_.prepare(R"(
            UPDATE tags SET usage_count = MAX(usage_count - 1, 0)
            WHERE id IN (SELECT tag_id FROM item_tags WHERE item_id = ?)
        )"));
        SNIPVAULT_TRY(drop.bind(1, itemId));
        SNIPVAULT_TRY(drop.execute());

        SNIPVAULT_TRY_UNWRAP(remove, db_.prepare("DELETE FROM item_tags WHERE item_id = ?"));
        SNIPVAULT_TRY(remove.bind(1, itemId));
        return remove.execute();
    });
}

Result<void> TagManager::removeTagsForItems(const std::vector<ItemId>& itemIds) {
    if (itemIds.empty()) {
        return {};
    }
    return db_.transaction([&]() -> Result<void> {
        for (ItemId id : itemIds) {
            SNIPVAULT_TRY(removeAllItemTags(id));
        }
        return {};
    });
}

Result<int> TagManager::pruneUnusedTags() {
    return db_.transaction([&]() -> Result<int> {
        SNIPVAULT_TRY(db_.execute(R"(
            DELETE FROM tags
            WHERE usage_count = 0
              AND NOT EXISTS (SELECT 1 FROM item_tags WHERE item_tags.tag_id = tags.id)
        )"));
        int removed = db_.changes();
        if (removed > 0) {
            spdlog::info("Pruned {} unused tag(s)", removed);
        }
        return removed;
    });
}

Result<void> TagManager::recountTag(TagId tagId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
        UPDATE tags
        SET usage_count = (SELECT COUNT(*) FROM item_tags WHERE tag_id = tags.id)
        WHERE id = ?
    )"));
    SNIPVAULT_TRY(stmt.bind(1, tagId));
    SNIPVAULT_TRY(stmt.execute());
    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Tag " + std::to_string(tagId) + " not found"};
    }
    return {};
}

Result<int> TagManager::recountAllTags() {
    return db_.transaction([&]() -> Result<int> {
        SNIPVAULT_TRY(db_.execute(R"(
            UPDATE tags
            SET usage_count = (SELECT COUNT(*) FROM item_tags WHERE tag_id = tags.id)
            WHERE usage_count != (SELECT COUNT(*) FROM item_tags WHERE tag_id = tags.id)
        )"));
        int corrected = db_.changes();
        if (corrected > 0) {
            spdlog::warn("Recount corrected usage counters of {} tag(s)", corrected);
        }
        return corrected;
    });
}

Result<std::vector<Tag>> TagManager::queryTags(const std::string& sql, const std::string& param) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(sql));
    if (!param.empty()) {
        SNIPVAULT_TRY(stmt.bind(1, param));
    }

    std::vector<Tag> tags;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        tags.push_back(tagFromRow(stmt));
    }
    return tags;
}

Result<std::optional<Tag>> TagManager::getTag(std::string_view name) {
    const auto normalized = normalizeTagName(name);
    if (normalized.empty()) {
        return std::optional<Tag>{};
    }
    SNIPVAULT_TRY_UNWRAP(tags, queryTags(std::string(kTagColumns) + " WHERE name = ?", normalized));
    if (tags.empty()) {
        return std::optional<Tag>{};
    }
    return std::optional<Tag>{std::move(tags.front())};
}

Result<std::vector<std::string>> TagManager::getItemTags(ItemId itemId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
        SELECT t.name FROM tags t
        JOIN item_tags it ON it.tag_id = t.id
        WHERE it.item_id = ?
        ORDER BY t.name ASC
    )"));
    SNIPVAULT_TRY(stmt.bind(1, itemId));

    std::vector<std::string> names;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        names.push_back(stmt.getString(0));
    }
    return names;
}

Result<std::vector<Tag>> TagManager::listTags(TagOrder order) {
    const char* orderClause = order == TagOrder::Usage ? " ORDER BY usage_count DESC, name ASC"
                                                       : " ORDER BY name ASC";
    return queryTags(std::string(kTagColumns) + orderClause);
}

Result<std::vector<Tag>> TagManager::searchTags(std::string_view fragment) {
    const auto normalized = normalizeTagName(fragment);
    if (normalized.empty()) {
        return listTags(TagOrder::Name);
    }

    // Escape LIKE wildcards so the fragment matches literally
    std::string pattern = "%";
    for (char c : normalized) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '%';

    return queryTags(std::string(kTagColumns) +
                         " WHERE name LIKE ? ESCAPE '\\' ORDER BY usage_count DESC, name ASC",
                     pattern);
}

Result<std::vector<Tag>> TagManager::topTags(int limit) {
    if (limit <= 0) {
        return std::vector<Tag>{};
    }
    return queryTags(std::string(kTagColumns) +
                     " WHERE usage_count > 0 ORDER BY usage_count DESC, name ASC LIMIT " +
                     std::to_string(limit));
}

Result<TagStatistics> TagManager::statistics() {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
        SELECT
            (SELECT COUNT(*) FROM tags),
            (SELECT COUNT(*) FROM tags WHERE usage_count > 0),
            (SELECT COUNT(*) FROM tags WHERE usage_count = 0),
            (SELECT COUNT(*) FROM item_tags),
            (SELECT AVG(tag_count) FROM
                (SELECT COUNT(*) AS tag_count FROM item_tags GROUP BY item_id))
    )"));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());

    TagStatistics stats;
    if (hasRow) {
        stats.totalTags = stmt.getInt64(0);
        stats.tagsInUse = stmt.getInt64(1);
        stats.unusedTags = stmt.getInt64(2);
        stats.totalAssociations = stmt.getInt64(3);
        stats.averageTagsPerItem = stmt.isNull(4) ? 0.0 : stmt.getDouble(4);
    }
    return stats;
}

Result<std::vector<ItemId>> TagManager::findItemsByTag(std::string_view name) {
    const auto normalized = normalizeTagName(name);
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
        SELECT it.item_id FROM item_tags it
        JOIN tags t ON t.id = it.tag_id
        WHERE t.name = ?
        ORDER BY it.item_id ASC
    )"));
    SNIPVAULT_TRY(stmt.bind(1, normalized));

    std::vector<ItemId> ids;
    while (true) {
        SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        ids.push_back(stmt.getInt64(0));
    }
    return ids;
}

} // namespace snipvault::store
