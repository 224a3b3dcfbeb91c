#pragma once

#include "storage/local_store.hpp"
#include "core/card.hpp"
#include "core/result.hpp"
#include <vector>
#include <optional>

namespace studysync::storage {

/**
 * CardRepository - Data access layer for cards.
 */
class CardRepository {
public:
    explicit CardRepository(LocalStore& store) : store_(store) {}

    [[nodiscard]] Result<std::optional<Card>, Error> get(const Uuid& id);

    /**
     * All cards, newest first.
     */
    [[nodiscard]] Result<std::vector<Card>, Error> get_all();

    [[nodiscard]] Result<std::vector<Card>, Error> get_by_deck(const Uuid& deck_id);

    /**
     * Cards whose next review has arrived or that are still New.
     */
    [[nodiscard]] Result<std::vector<Card>, Error> get_due(Timestamp now);

    [[nodiscard]] Result<int64_t, Error> due_count(Timestamp now);

    [[nodiscard]] Result<void, Error> insert(const Card& card);

    /**
     * Insert many cards in one transaction; all or nothing.
     */
    [[nodiscard]] Result<void, Error> insert_all(const std::vector<Card>& cards);

    [[nodiscard]] Result<void, Error> update(const Card& card);

    [[nodiscard]] Result<void, Error> move_to_deck(const Uuid& card_id, const std::optional<Uuid>& deck_id);

    [[nodiscard]] Result<void, Error> remove(const Uuid& id);

private:
    LocalStore& store_;
};

} // namespace studysync::storage
