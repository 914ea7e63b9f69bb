#pragma once

#include <snipvault/core/types.h>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace snipvault::store {

/**
 * @brief Declared kind of an item's payload
 */
enum class ContentKind { Text, Url, Code, Path };

const char* contentKindToString(ContentKind kind);
std::optional<ContentKind> contentKindFromString(std::string_view value);

// Placement alternatives. An item is exactly one of these.
struct Standalone {};

struct ListStep {
    ListId listId = 0;
    int position = 0; ///< 1-based, contiguous within the list
};

struct TableCell {
    TableId tableId = 0;
    int row = 0;
    int col = 0;
    std::string rowKey; ///< Derived from the row's column-0 content
};

using Placement = std::variant<Standalone, ListStep, TableCell>;

/**
 * @brief The single polymorphic stored unit
 */
struct Item {
    ItemId id = 0;
    CollectionId collectionId = 0;
    std::string label;
    std::string content;
    ContentKind kind = ContentKind::Text;
    bool sensitive = false;
    bool favorite = false;
    std::optional<std::string> color;
    std::optional<std::string> description;
    std::optional<int64_t> sizeBytes;
    int64_t useCount = 0;
    std::optional<TimePoint> lastUsed;
    TimePoint created;
    TimePoint updated;
    std::vector<std::string> tags; ///< Normalized, sorted
    Placement placement;

    /// Set when sensitive content could not be decrypted on read
    bool contentCorrupt = false;

    bool isStandalone() const { return std::holds_alternative<Standalone>(placement); }
    const ListStep* listStep() const { return std::get_if<ListStep>(&placement); }
    const TableCell* tableCell() const { return std::get_if<TableCell>(&placement); }
};

/// Content placed in an item whose ciphertext failed to decrypt
inline constexpr std::string_view kCorruptContentSentinel = "[DECRYPTION ERROR]";

/**
 * @brief Fields for creating an item
 */
struct NewItem {
    std::string label;
    std::string content;
    ContentKind kind = ContentKind::Text;
    bool sensitive = false;
    bool favorite = false;
    std::optional<std::string> color;
    std::optional<std::string> description;
    std::optional<int64_t> sizeBytes;
    std::vector<std::string> tags;

    /// Check content against its declared kind before storing
    bool validateKind = false;
};

/**
 * @brief Partial update; only engaged fields are written
 *
 * An engaged but empty color/description clears the stored value.
 */
struct ItemUpdate {
    std::optional<std::string> label;
    std::optional<std::string> content;
    std::optional<ContentKind> kind;
    std::optional<bool> sensitive;
    std::optional<bool> favorite;
    std::optional<std::string> color;
    std::optional<std::string> description;
    std::optional<int64_t> sizeBytes;
    std::optional<std::vector<std::string>> tags;

    bool empty() const {
        return !label && !content && !kind && !sensitive && !favorite && !color &&
               !description && !sizeBytes && !tags;
    }
};

struct Collection {
    CollectionId id = 0;
    std::string name;
    std::optional<std::string> description;
    TimePoint created;
    TimePoint updated;
};

struct ItemList {
    ListId id = 0;
    CollectionId collectionId = 0;
    std::string name;
    std::optional<std::string> description;
    int64_t useCount = 0;
    std::optional<TimePoint> lastUsed;
    TimePoint created;
    TimePoint updated;
    int64_t stepCount = 0;
};

struct Table {
    TableId id = 0;
    CollectionId collectionId = 0;
    std::string name;
    std::optional<std::string> description;
    TimePoint created;
    TimePoint updated;
};

struct Tag {
    TagId id = 0;
    std::string name;
    int64_t usageCount = 0;
    std::optional<TimePoint> lastUsed;
    TimePoint created;
    std::optional<std::string> color;
    std::optional<std::string> description;
};

enum class TagOrder { Name, Usage };

struct TagStatistics {
    int64_t totalTags = 0;
    int64_t tagsInUse = 0;
    int64_t unusedTags = 0;
    int64_t totalAssociations = 0;
    double averageTagsPerItem = 0.0;
};

/**
 * @brief Dense reconstruction of a table's sparse cells
 */
struct TableMatrix {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
};

struct TableDimensions {
    int rows = 0;
    int cols = 0;
    int64_t cells = 0;
};

/**
 * @brief Options for bulk table import
 */
struct TableImportOptions {
    std::vector<int> sensitiveColumns;
    std::vector<int> urlColumns;
    std::vector<std::string> tags;
    std::optional<std::string> description;
};

// Time helpers shared by the store components; timestamps persist as unix seconds
int64_t toUnixSeconds(TimePoint tp);
TimePoint fromUnixSeconds(int64_t seconds);
int64_t nowUnixSeconds();

} // namespace snipvault::store
