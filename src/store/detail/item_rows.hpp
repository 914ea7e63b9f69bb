#pragma once

#include <snipvault/crypto/content_cipher.h>
#include <snipvault/store/database.h>
#include <snipvault/store/item.h>

namespace snipvault::store::detail {

// Column order expected by itemFromRow
inline constexpr const char* kItemSelect =
    "SELECT id, collection_id, label, content, kind, is_sensitive, is_favorite, color, "
    "description, size_bytes, use_count, last_used, created_at, updated_at, list_id, position, "
    "table_id, cell_row, cell_col, row_key FROM items";

Item itemFromRow(const Statement& stmt);

/**
 * @brief Replace stored ciphertext with plaintext
 *
 * Sensitive content that cannot be decrypted becomes the corrupt-content
 * sentinel with contentCorrupt set; the read itself still succeeds.
 */
void revealContent(Item& item, crypto::IContentProtector* protector);

} // namespace snipvault::store::detail
