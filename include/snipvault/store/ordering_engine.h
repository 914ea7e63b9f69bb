#pragma once

#include <snipvault/store/database.h>
#include <snipvault/store/item.h>
#include <functional>

namespace snipvault::store {

/**
 * @brief Keeps list step positions at the contiguous sequence 1..N
 *
 * The engine only reassigns positions; creating and physically removing
 * items belongs to the repository.
 */
class OrderingEngine {
public:
    using StepRemover = std::function<Result<void>(ItemId)>;

    explicit OrderingEngine(Database& db);

    Result<int> countSteps(ListId listId);

    /**
     * @brief Position a newly appended step would take (count + 1)
     */
    Result<int> nextPosition(ListId listId);

    /**
     * @brief Open a slot at position by shifting every step at or after it down one
     *
     * Position must lie in 1..N+1.
     */
    Result<void> insertAt(ListId listId, int position);

    /**
     * @brief Move a step, shifting only the band between old and new position
     *
     * Moving up increments [newPosition, old); moving down decrements
     * (old, newPosition]. Moving to the current position is a no-op.
     */
    Result<void> moveStep(ItemId itemId, int newPosition);

    /**
     * @brief Remove a step through remover and close the gap it leaves
     */
    Result<void> deleteStep(ItemId itemId, const StepRemover& remover);

    /**
     * @brief Reassign 1..N by (position, created, id)
     * @return number of steps whose position changed
     */
    Result<int> renumberList(ListId listId);

    Result<bool> checkContiguity(ListId listId);

private:
    Database& db_;

    Result<ListStep> loadStep(ItemId itemId);
};

} // namespace snipvault::store
