#include "storage/card_repository.hpp"

#include "storage/row_writer.hpp"
#include "core/deck_tree.hpp"

namespace studysync::storage {

namespace {

constexpr const char* kSelectCards = R"SQL(
    SELECT id, user_id, deck_id, front, back, stability, difficulty, state, lapses,
           next_review_date, last_review_date, total_reviews, correct_reviews,
           created_at, modified_at
    FROM cards
)SQL";

} // namespace

Result<std::optional<Card>, Error> CardRepository::get(const Uuid& id) {
    auto cards = store_.get_all<Card>(std::string(kSelectCards) + " WHERE id = ?;",
                                      {Value{id.to_string()}}, card_from_row);
    if (cards.is_err()) {
        return Result<std::optional<Card>, Error>::err(cards.unwrap_err());
    }
    auto& list = cards.unwrap();
    if (list.empty()) {
        return Result<std::optional<Card>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Card>, Error>::ok(std::move(list.front()));
}

Result<std::vector<Card>, Error> CardRepository::get_all() {
    return store_.get_all<Card>(std::string(kSelectCards) + " ORDER BY created_at DESC;",
                                {}, card_from_row);
}

Result<std::vector<Card>, Error> CardRepository::get_by_deck(const Uuid& deck_id) {
    return store_.get_all<Card>(
        std::string(kSelectCards) + " WHERE deck_id = ? ORDER BY created_at DESC;",
        {Value{deck_id.to_string()}}, card_from_row);
}

Result<std::vector<Card>, Error> CardRepository::get_due(Timestamp now) {
    // Filtered here rather than in SQL: backend rows may use another ISO
    // offset format, which breaks text comparison.
    return get_all().map([now](const std::vector<Card>& cards) {
        std::vector<Card> due;
        for (const auto& card : cards) {
            if (is_due(card, now)) due.push_back(card);
        }
        return due;
    });
}

Result<int64_t, Error> CardRepository::due_count(Timestamp now) {
    return get_all().map([now](const std::vector<Card>& cards) {
        return count_due(cards, now);
    });
}

Result<void, Error> CardRepository::insert(const Card& card) {
    const auto row = card_to_row(card);
    return store_.write_transaction([&row](Database& db) {
        return insert_row(db, "cards", row);
    });
}

Result<void, Error> CardRepository::insert_all(const std::vector<Card>& cards) {
    if (cards.empty()) {
        return Result<void, Error>::ok();
    }
    return store_.write_transaction([&cards](Database& db) -> Result<void, Error> {
        for (const auto& card : cards) {
            auto result = insert_row(db, "cards", card_to_row(card));
            if (result.is_err()) return result;
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> CardRepository::update(const Card& card) {
    const auto row = card_to_row(card);
    return store_.write_transaction([&row](Database& db) {
        return update_row(db, "cards", row);
    });
}

Result<void, Error> CardRepository::move_to_deck(const Uuid& card_id, const std::optional<Uuid>& deck_id) {
    auto existing = get(card_id);
    if (existing.is_err()) {
        return Result<void, Error>::err(existing.unwrap_err());
    }
    if (!existing.unwrap()) {
        return Result<void, Error>::err(Error::validation("No card with id " + card_id.to_string()));
    }
    return update(with_deck(*existing.unwrap(), deck_id));
}

Result<void, Error> CardRepository::remove(const Uuid& id) {
    return store_.execute("DELETE FROM cards WHERE id = ?;", {Value{id.to_string()}});
}

} // namespace studysync::storage
