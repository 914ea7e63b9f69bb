#pragma once

#include <snipvault/store/database.h>
#include <snipvault/store/item.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snipvault::store {

/**
 * @brief Normalized tag vocabulary with live reference counts
 *
 * The only writer of the tags and item_tags tables. A tag's usage_count equals
 * the number of item_tags rows referencing it; every association change moves
 * the counter inside the same transaction.
 */
class TagManager {
public:
    explicit TagManager(Database& db);

    /**
     * @brief Trim and ASCII case-fold a tag name
     */
    static std::string normalizeTagName(std::string_view name);

    /**
     * @brief Normalize, drop blanks and duplicates, and sort
     */
    static std::vector<std::string> normalizeTagNames(const std::vector<std::string>& names);

    Result<TagId> getOrCreateTag(std::string_view name);

    /**
     * @brief Attach a tag to an item
     * @return true when a new association was created, false when it already existed
     */
    Result<bool> associate(ItemId itemId, std::string_view name);

    /**
     * @brief Detach a tag from an item
     * @return true when an association was removed
     */
    Result<bool> dissociate(ItemId itemId, std::string_view name);

    /**
     * @brief Make the item's tag set equal to names, touching only the difference
     */
    Result<void> replaceItemTags(ItemId itemId, const std::vector<std::string>& names);

    Result<void> removeAllItemTags(ItemId itemId);
    Result<void> removeTagsForItems(const std::vector<ItemId>& itemIds);

    /**
     * @brief Delete tags with no associations
     * @return number of tags removed
     */
    Result<int> pruneUnusedTags();

    // Administrative repair: recompute counters from item_tags
    Result<void> recountTag(TagId tagId);
    Result<int> recountAllTags();

    Result<std::optional<Tag>> getTag(std::string_view name);
    Result<std::vector<std::string>> getItemTags(ItemId itemId);
    Result<std::vector<Tag>> listTags(TagOrder order = TagOrder::Name);
    Result<std::vector<Tag>> searchTags(std::string_view fragment);
    Result<std::vector<Tag>> topTags(int limit = 10);
    Result<TagStatistics> statistics();
    Result<std::vector<ItemId>> findItemsByTag(std::string_view name);

private:
    Database& db_;

    Result<std::optional<TagId>> findTagId(const std::string& normalized);
    Result<std::vector<Tag>> queryTags(const std::string& sql, const std::string& param = {});
};

} // namespace snipvault::store
