#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "core/row.hpp"
#include "core/scheduler.hpp"
#include <string>
#include <optional>

namespace studysync {

enum class LearningState : int {
    New = 0,
    Learning = 1,
    Review = 2,
    Relearning = 3
};

[[nodiscard]] const char* to_string(LearningState state) noexcept;

/**
 * MemoryState - scheduling fields of a card.
 *
 * Always replaced as a group during conflict resolution so that stability,
 * due date and last review stay consistent with one another.
 */
struct MemoryState {
    double stability{0.0};
    double difficulty{0.0};
    LearningState state{LearningState::New};
    int64_t lapses{0};
    Timestamp next_review;
    std::optional<Timestamp> last_review;

    bool operator==(const MemoryState&) const = default;
};

/**
 * ReviewStats - monotonic review counters.
 */
struct ReviewStats {
    int64_t total_reviews{0};
    int64_t correct_reviews{0};

    bool operator==(const ReviewStats&) const = default;
};

/**
 * Card - a flashcard with markdown front and back.
 *
 * deck_id is a weak reference; the deck may be missing locally.
 */
struct Card {
    Uuid id;
    Uuid user_id;
    std::optional<Uuid> deck_id;
    std::string front;
    std::string back;
    MemoryState memory;
    ReviewStats stats;
    Timestamp created_at;
    Timestamp modified_at;

    bool operator==(const Card&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a new card, due immediately.
 */
[[nodiscard]] inline Card create_card(
    Uuid id,
    Uuid user_id,
    std::optional<Uuid> deck_id,
    std::string front,
    std::string back
) {
    auto now = Timestamp::now();
    return Card{
        .id = id,
        .user_id = user_id,
        .deck_id = deck_id,
        .front = std::move(front),
        .back = std::move(back),
        .memory = MemoryState{.next_review = now},
        .stats = {},
        .created_at = now,
        .modified_at = now
    };
}

[[nodiscard]] inline Card with_content(Card card, std::string front, std::string back) {
    card.front = std::move(front);
    card.back = std::move(back);
    card.modified_at = Timestamp::now();
    return card;
}

[[nodiscard]] inline Card with_deck(Card card, std::optional<Uuid> deck_id) {
    card.deck_id = deck_id;
    card.modified_at = Timestamp::now();
    return card;
}

/**
 * A card is due when its next review has arrived or it was never studied.
 */
[[nodiscard]] inline bool is_due(const Card& card, Timestamp now) {
    return card.memory.next_review <= now || card.memory.state == LearningState::New;
}

/**
 * Whole days between the last review and now; 0 if never reviewed.
 */
[[nodiscard]] int64_t days_since_last_review(const Card& card, Timestamp now);

/**
 * Record one review of the card.
 *
 * Total reviews always increments. Again counts a lapse and moves the card
 * into Learning (from New) or Relearning; any other rating counts as correct
 * and moves the card to Review. A scheduler rejection is returned as the
 * error.
 */
[[nodiscard]] Result<Card, Error> apply_review(
    const Card& card,
    Rating rating,
    const Scheduler& scheduler,
    double desired_retention,
    Timestamp now);

// ============================================================================
// Row mapping
// ============================================================================

[[nodiscard]] Row card_to_row(const Card& card);

/**
 * Only a valid id is required; other fields default when missing.
 */
[[nodiscard]] Result<Card, Error> card_from_row(const Row& row);

} // namespace studysync
