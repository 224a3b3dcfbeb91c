#include "storage/data_repository.hpp"

#include "storage/row_writer.hpp"

namespace studysync::storage {

DataRepository::DataRepository(LocalStore& store, Uuid user_id, media::MediaStore* media)
    : store_(store)
    , deck_repo_(store)
    , card_repo_(store)
    , media_(media)
    , user_id_(user_id) {}

DataRepository::~DataRepository() {
    stop_watching();
}

void DataRepository::start_watching() {
    if (watch_id_) return;
    // The query result is unused; the watch only signals that a table changed.
    watch_id_ = store_.watch("SELECT 1;", {}, {"decks", "cards"},
                             [this](const std::vector<Row>&) { on_store_changed(); });
}

void DataRepository::stop_watching() {
    if (!watch_id_) return;
    if (store_.is_open()) {
        store_.unwatch(*watch_id_);
    }
    watch_id_.reset();
}

void DataRepository::on_store_changed() {
    auto result = refresh();
    if (result.is_err()) {
        last_error_ = result.unwrap_err();
        return;
    }
    if (on_changed_) on_changed_();
}

Result<void, Error> DataRepository::refresh() {
    auto decks = deck_repo_.get_all();
    if (decks.is_err()) {
        return Result<void, Error>::err(decks.unwrap_err());
    }
    auto cards = card_repo_.get_all();
    if (cards.is_err()) {
        return Result<void, Error>::err(cards.unwrap_err());
    }

    flat_decks_ = std::move(decks).unwrap();
    cards_ = std::move(cards).unwrap();
    tree_ = build_deck_tree(flat_decks_, cards_, Timestamp::now());
    last_error_.reset();
    return Result<void, Error>::ok();
}

// ============================================================================
// Decks
// ============================================================================

Result<Deck, Error> DataRepository::create_deck(
    const std::string& name,
    const std::string& description,
    std::optional<Uuid> parent_id
) {
    auto valid = validate_deck_name(name);
    if (valid.is_err()) {
        return Result<Deck, Error>::err(valid.unwrap_err());
    }
    auto deck = studysync::create_deck(Uuid::generate(), user_id_, valid.unwrap(), description, parent_id);
    auto inserted = deck_repo_.insert(deck);
    if (inserted.is_err()) {
        return Result<Deck, Error>::err(inserted.unwrap_err());
    }
    return Result<Deck, Error>::ok(std::move(deck));
}

Result<void, Error> DataRepository::update_deck(const Deck& deck) {
    Deck updated = deck;
    updated.modified_at = Timestamp::now();
    return deck_repo_.update(updated);
}

Result<void, Error> DataRepository::delete_deck(const Uuid& id) {
    return deck_repo_.remove(id);
}

const DeckNode* DataRepository::find_deck(const Uuid& id) const {
    return studysync::find_deck(tree_, id);
}

// ============================================================================
// Cards
// ============================================================================

Result<Card, Error> DataRepository::create_card(
    const std::string& front, const std::string& back, std::optional<Uuid> deck_id
) {
    auto card = studysync::create_card(Uuid::generate(), user_id_, deck_id, front, back);
    auto inserted = card_repo_.insert(card);
    if (inserted.is_err()) {
        return Result<Card, Error>::err(inserted.unwrap_err());
    }
    return Result<Card, Error>::ok(std::move(card));
}

Result<void, Error> DataRepository::update_card(const Card& card) {
    Card updated = card;
    updated.modified_at = Timestamp::now();
    return card_repo_.update(updated);
}

Result<void, Error> DataRepository::delete_card(const Uuid& id) {
    return card_repo_.remove(id);
}

Result<void, Error> DataRepository::move_card(const Uuid& card_id, std::optional<Uuid> deck_id) {
    return card_repo_.move_to_deck(card_id, deck_id);
}

Result<int64_t, Error> DataRepository::import_cards(
    const std::vector<std::pair<std::string, std::string>>& cards, const Uuid& deck_id
) {
    std::vector<Card> created;
    created.reserve(cards.size());
    for (const auto& [front, back] : cards) {
        created.push_back(studysync::create_card(Uuid::generate(), user_id_, deck_id, front, back));
    }
    auto inserted = card_repo_.insert_all(created);
    if (inserted.is_err()) {
        return Result<int64_t, Error>::err(inserted.unwrap_err());
    }
    return Result<int64_t, Error>::ok(static_cast<int64_t>(created.size()));
}

Result<Card, Error> DataRepository::review_card(
    const Uuid& card_id, Rating rating, const Scheduler& scheduler,
    double desired_retention, Timestamp now
) {
    auto existing = card_repo_.get(card_id);
    if (existing.is_err()) {
        return Result<Card, Error>::err(existing.unwrap_err());
    }
    if (!existing.unwrap()) {
        return Result<Card, Error>::err(Error::validation("No card with id " + card_id.to_string()));
    }

    auto reviewed = apply_review(*existing.unwrap(), rating, scheduler, desired_retention, now);
    if (reviewed.is_err()) {
        return reviewed;
    }
    auto saved = card_repo_.update(reviewed.unwrap());
    if (saved.is_err()) {
        return Result<Card, Error>::err(saved.unwrap_err());
    }
    return reviewed;
}

Result<std::vector<Card>, Error> DataRepository::due_cards(Timestamp now) {
    return card_repo_.get_due(now);
}

Result<int64_t, Error> DataRepository::due_count(Timestamp now) {
    return card_repo_.due_count(now);
}

std::vector<Card> DataRepository::due_cards_in(const DeckNode& node, Timestamp now) {
    std::vector<Card> due;
    for (const auto& card : node.all_cards()) {
        if (is_due(card, now)) due.push_back(card);
    }
    return due;
}

CardStatistics DataRepository::statistics(Timestamp day_start) const {
    CardStatistics stats;
    stats.total = static_cast<int64_t>(cards_.size());
    for (const auto& card : cards_) {
        switch (card.memory.state) {
            case LearningState::New: ++stats.new_cards; break;
            case LearningState::Learning:
            case LearningState::Relearning: ++stats.learning; break;
            case LearningState::Review: ++stats.review; break;
        }
        if (card.memory.last_review && *card.memory.last_review >= day_start) {
            ++stats.reviewed_today;
        }
    }
    return stats;
}

// ============================================================================
// Media
// ============================================================================

Result<media::StoredMedia, Error> DataRepository::import_media(
    std::span<const uint8_t> bytes, const std::string& extension
) {
    if (!media_) {
        return Result<media::StoredMedia, Error>::err(Error{"No media store configured"});
    }
    auto stored = media_->store(bytes, extension);
    if (stored.is_err()) {
        return stored;
    }
    const auto& info = stored.unwrap();

    auto existing = store_.get_rows("SELECT id FROM media WHERE hash = ? LIMIT 1;", {Value{info.hash}});
    if (existing.is_err()) {
        return Result<media::StoredMedia, Error>::err(existing.unwrap_err());
    }
    if (!existing.unwrap().empty()) {
        return stored;
    }

    const Row row{
        {"id", Uuid::generate().to_string()},
        {"user_id", user_id_.to_string()},
        {"hash", info.hash},
        {"format", info.format},
        {"storage_path", info.relative_path},
        {"size_bytes", info.size_bytes},
        {"created_at", Timestamp::now().to_iso_string()},
    };
    auto inserted = store_.write_transaction([&row](Database& db) {
        return insert_row(db, "media", row);
    });
    if (inserted.is_err()) {
        return Result<media::StoredMedia, Error>::err(inserted.unwrap_err());
    }
    return stored;
}

} // namespace studysync::storage
