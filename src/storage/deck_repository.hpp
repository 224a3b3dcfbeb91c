#pragma once

#include "storage/local_store.hpp"
#include "core/deck.hpp"
#include "core/result.hpp"
#include <vector>
#include <optional>

namespace studysync::storage {

/**
 * DeckRepository - Data access layer for decks.
 *
 * Every write goes through the local store and is therefore captured in the
 * mutation log.
 */
class DeckRepository {
public:
    explicit DeckRepository(LocalStore& store) : store_(store) {}

    [[nodiscard]] Result<std::optional<Deck>, Error> get(const Uuid& id);

    /**
     * All decks ordered by name.
     */
    [[nodiscard]] Result<std::vector<Deck>, Error> get_all();

    [[nodiscard]] Result<std::vector<Deck>, Error> get_children(const Uuid& parent_id);

    [[nodiscard]] Result<void, Error> insert(const Deck& deck);

    [[nodiscard]] Result<void, Error> update(const Deck& deck);

    /**
     * Delete a deck, its cards and, recursively, its subdecks and their
     * cards, in one transaction.
     */
    [[nodiscard]] Result<void, Error> remove(const Uuid& id);

private:
    LocalStore& store_;
};

} // namespace studysync::storage
