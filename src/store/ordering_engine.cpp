#include <spdlog/spdlog.h>
#include <snipvault/store/ordering_engine.h>

#include <vector>

#include "detail/result_helpers.hpp"

namespace snipvault::store {

OrderingEngine::OrderingEngine(Database& db) : db_(db) {}

Result<int> OrderingEngine::countSteps(ListId listId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT COUNT(*) FROM items WHERE list_id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, listId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    return hasRow ? stmt.getInt(0) : 0;
}

Result<int> OrderingEngine::nextPosition(ListId listId) {
    SNIPVAULT_TRY_UNWRAP(count, countSteps(listId));
    return count + 1;
}

Result<void> OrderingEngine::insertAt(ListId listId, int position) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(count, countSteps(listId));
        if (position < 1 || position > count + 1) {
            return Error{ErrorCode::ValidationError,
                         "Position " + std::to_string(position) + " outside 1.." +
                             std::to_string(count + 1)};
        }

        SNIPVAULT_TRY_UNWRAP(shift, db_.prepare("UPDATE items SET position = position + 1 "
                                                "WHERE list_id = ? AND position >= ?"));
        SNIPVAULT_TRY(shift.bindAll(listId, position));
        return shift.execute();
    });
}

Result<ListStep> OrderingEngine::loadStep(ItemId itemId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT list_id, position FROM items WHERE id = ?"));
    SNIPVAULT_TRY(stmt.bind(1, itemId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "Item " + std::to_string(itemId) + " not found"};
    }
    if (stmt.isNull(0)) {
        return Error{ErrorCode::NotFound,
                     "Item " + std::to_string(itemId) + " is not a list step"};
    }
    return ListStep{stmt.getInt64(0), stmt.getInt(1)};
}

Result<void> OrderingEngine::moveStep(ItemId itemId, int newPosition) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(step, loadStep(itemId));
        SNIPVAULT_TRY_UNWRAP(count, countSteps(step.listId));

        if (newPosition < 1 || newPosition > count) {
            return Error{ErrorCode::ValidationError, "Position " + std::to_string(newPosition) +
                                                         " outside 1.." + std::to_string(count)};
        }

        const int oldPosition = step.position;
        if (newPosition == oldPosition) {
            return {};
        }

        std::string shiftSql;
        int lower = 0;
        int upper = 0;
        if (newPosition < oldPosition) {
            shiftSql = "UPDATE items SET position = position + 1 "
                       "WHERE list_id = ? AND position >= ? AND position < ? AND id != ?";
            lower = newPosition;
            upper = oldPosition;
        } else {
            shiftSql = "UPDATE items SET position = position - 1 "
                       "WHERE list_id = ? AND position > ? AND position <= ? AND id != ?";
            lower = oldPosition;
            upper = newPosition;
        }

        SNIPVAULT_TRY_UNWRAP(shift, db_.prepare(shiftSql));
        SNIPVAULT_TRY(shift.bindAll(step.listId, lower, upper, itemId));
        SNIPVAULT_TRY(shift.execute());

        SNIPVAULT_TRY_UNWRAP(place,
                             db_.prepare("UPDATE items SET position = ?, updated_at = ? "
                                         "WHERE id = ?"));
        SNIPVAULT_TRY(place.bindAll(newPosition, nowUnixSeconds(), itemId));
        SNIPVAULT_TRY(place.execute());

        spdlog::debug("Moved step {} in list {} from {} to {}", itemId, step.listId, oldPosition,
                      newPosition);
        return {};
    });
}

Result<void> OrderingEngine::deleteStep(ItemId itemId, const StepRemover& remover) {
    return db_.transaction([&]() -> Result<void> {
        SNIPVAULT_TRY_UNWRAP(step, loadStep(itemId));
        SNIPVAULT_TRY(remover(itemId));

        SNIPVAULT_TRY_UNWRAP(closeGap, db_.prepare("UPDATE items SET position = position - 1 "
                                                "WHERE list_id = ? AND position > ?"));
        SNIPVAULT_TRY(closeGap.bindAll(step.listId, step.position));
        return closeGap.execute();
    });
}

Result<int> OrderingEngine::renumberList(ListId listId) {
    return db_.transaction([&]() -> Result<int> {
        SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare("SELECT id, position FROM items WHERE list_id = ? "
                                               "ORDER BY position ASC, created_at ASC, id ASC"));
        SNIPVAULT_TRY(stmt.bind(1, listId));

        std::vector<std::pair<ItemId, int>> steps;
        while (true) {
            SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            steps.emplace_back(stmt.getInt64(0), stmt.getInt(1));
        }

        SNIPVAULT_TRY_UNWRAP(update, db_.prepare("UPDATE items SET position = ? WHERE id = ?"));
        int changed = 0;
        for (size_t i = 0; i < steps.size(); ++i) {
            const int expected = static_cast<int>(i) + 1;
            if (steps[i].second == expected) {
                continue;
            }
            SNIPVAULT_TRY(update.reset());
            SNIPVAULT_TRY(update.clearBindings());
            SNIPVAULT_TRY(update.bindAll(expected, steps[i].first));
            SNIPVAULT_TRY(update.execute());
            ++changed;
        }

        if (changed > 0) {
            spdlog::warn("Renumbered list {}: {} of {} step(s) repositioned", listId, changed,
                         steps.size());
        }
        return changed;
    });
}

Result<bool> OrderingEngine::checkContiguity(ListId listId) {
    SNIPVAULT_TRY_UNWRAP(stmt, db_.prepare(R"(
        SELECT COUNT(*), COUNT(DISTINCT position), MIN(position), MAX(position)
        FROM items WHERE list_id = ?
    )"));
    SNIPVAULT_TRY(stmt.bind(1, listId));
    SNIPVAULT_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return true;
    }

    const int64_t count = stmt.getInt64(0);
    if (count == 0) {
        return true;
    }
    return stmt.getInt64(1) == count && stmt.getInt64(2) == 1 && stmt.getInt64(3) == count;
}

} // namespace snipvault::store
