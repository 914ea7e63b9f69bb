#include <spdlog/spdlog.h>

#include "item_rows.hpp"

namespace snipvault::store::detail {

Item itemFromRow(const Statement& stmt) {
    Item item;
    item.id = stmt.getInt64(0);
    item.collectionId = stmt.getInt64(1);
    item.label = stmt.getString(2);
    item.content = stmt.getString(3);
    item.kind = contentKindFromString(stmt.getString(4)).value_or(ContentKind::Text);
    item.sensitive = stmt.getInt(5) != 0;
    item.favorite = stmt.getInt(6) != 0;
    item.color = stmt.getOptionalString(7);
    item.description = stmt.getOptionalString(8);
    item.sizeBytes = stmt.getOptionalInt64(9);
    item.useCount = stmt.getInt64(10);
    if (auto lastUsed = stmt.getOptionalInt64(11)) {
        item.lastUsed = fromUnixSeconds(*lastUsed);
    }
    item.created = fromUnixSeconds(stmt.getInt64(12));
    item.updated = fromUnixSeconds(stmt.getInt64(13));

    if (!stmt.isNull(14)) {
        item.placement = ListStep{stmt.getInt64(14), stmt.getInt(15)};
    } else if (!stmt.isNull(16)) {
        item.placement = TableCell{stmt.getInt64(16), stmt.getInt(17), stmt.getInt(18),
                                   stmt.getOptionalString(19).value_or("")};
    } else {
        item.placement = Standalone{};
    }
    return item;
}

void revealContent(Item& item, crypto::IContentProtector* protector) {
    if (!item.sensitive) {
        return;
    }

    if (protector) {
        auto plain = protector->decrypt(item.content);
        if (plain) {
            item.content = std::move(plain).value();
            return;
        }
        spdlog::warn("Item {}: {}", item.id, plain.error().message);
    } else {
        spdlog::warn("Item {} is sensitive but no content key is configured", item.id);
    }
    item.content = std::string(kCorruptContentSentinel);
    item.contentCorrupt = true;
}

} // namespace snipvault::store::detail
