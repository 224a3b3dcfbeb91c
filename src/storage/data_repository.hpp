#pragma once

#include "core/card.hpp"
#include "core/deck.hpp"
#include "core/deck_tree.hpp"
#include "core/result.hpp"
#include "core/scheduler.hpp"
#include "media/media_store.hpp"
#include "storage/card_repository.hpp"
#include "storage/deck_repository.hpp"
#include "storage/local_store.hpp"
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace studysync::storage {

struct CardStatistics {
    int64_t total{0};
    int64_t new_cards{0};
    int64_t learning{0};      // learning + relearning
    int64_t review{0};
    int64_t reviewed_today{0};
};

/**
 * DataRepository - read model and write API over decks and cards.
 *
 * While watching, every committed change to decks or cards reloads both
 * tables and rebuilds the deck tree, then calls the change callback.
 */
class DataRepository {
public:
    DataRepository(LocalStore& store, Uuid user_id, media::MediaStore* media = nullptr);
    ~DataRepository();

    DataRepository(const DataRepository&) = delete;
    DataRepository& operator=(const DataRepository&) = delete;

    void start_watching();
    void stop_watching();
    [[nodiscard]] bool is_watching() const noexcept { return watch_id_.has_value(); }

    /**
     * Reload everything now.
     */
    [[nodiscard]] Result<void, Error> refresh();

    void set_on_changed(std::function<void()> callback) { on_changed_ = std::move(callback); }
    void set_user_id(Uuid user_id) noexcept { user_id_ = user_id; }

    [[nodiscard]] const std::vector<DeckNode>& decks() const noexcept { return tree_; }
    [[nodiscard]] const std::vector<Card>& all_cards() const noexcept { return cards_; }
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return last_error_; }

    // Decks
    [[nodiscard]] Result<Deck, Error> create_deck(
        const std::string& name,
        const std::string& description = {},
        std::optional<Uuid> parent_id = std::nullopt);
    [[nodiscard]] Result<void, Error> update_deck(const Deck& deck);
    [[nodiscard]] Result<void, Error> delete_deck(const Uuid& id);
    [[nodiscard]] const DeckNode* find_deck(const Uuid& id) const;

    // Cards
    [[nodiscard]] Result<Card, Error> create_card(
        const std::string& front, const std::string& back, std::optional<Uuid> deck_id);
    [[nodiscard]] Result<void, Error> update_card(const Card& card);
    [[nodiscard]] Result<void, Error> delete_card(const Uuid& id);
    [[nodiscard]] Result<void, Error> move_card(const Uuid& card_id, std::optional<Uuid> deck_id);

    /**
     * Create one card per (front, back) pair in a single transaction.
     * Returns the number of cards created.
     */
    [[nodiscard]] Result<int64_t, Error> import_cards(
        const std::vector<std::pair<std::string, std::string>>& cards, const Uuid& deck_id);

    /**
     * Apply a review to a stored card and persist the result.
     */
    [[nodiscard]] Result<Card, Error> review_card(
        const Uuid& card_id, Rating rating, const Scheduler& scheduler,
        double desired_retention, Timestamp now = Timestamp::now());

    [[nodiscard]] Result<std::vector<Card>, Error> due_cards(Timestamp now = Timestamp::now());
    [[nodiscard]] Result<int64_t, Error> due_count(Timestamp now = Timestamp::now());

    /**
     * Due cards of a deck and all its subdecks, from the loaded tree.
     */
    [[nodiscard]] static std::vector<Card> due_cards_in(const DeckNode& node, Timestamp now);

    /**
     * Counts over the loaded cards. "Reviewed today" means a last review at
     * or after `day_start`.
     */
    [[nodiscard]] CardStatistics statistics(Timestamp day_start) const;

    // Media
    /**
     * Store a blob in the media store and record it in the media table
     * (once per distinct hash).
     */
    [[nodiscard]] Result<media::StoredMedia, Error> import_media(
        std::span<const uint8_t> bytes, const std::string& extension);

private:
    void on_store_changed();

    LocalStore& store_;
    DeckRepository deck_repo_;
    CardRepository card_repo_;
    media::MediaStore* media_;
    Uuid user_id_;

    std::optional<LocalStore::WatchId> watch_id_;
    std::function<void()> on_changed_;

    std::vector<Deck> flat_decks_;
    std::vector<Card> cards_;
    std::vector<DeckNode> tree_;
    std::optional<Error> last_error_;
};

} // namespace studysync::storage
