#pragma once

#include "core/card.hpp"
#include "core/deck.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <vector>

namespace studysync {

/**
 * DeckNode - a deck with its cards and subdecks, plus counts computed at
 * build time.
 */
struct DeckNode {
    Deck deck;
    std::vector<Card> cards;
    std::vector<DeckNode> children;
    int64_t due_count{0};
    int64_t new_count{0};

    [[nodiscard]] int64_t card_count() const noexcept {
        return static_cast<int64_t>(cards.size());
    }

    [[nodiscard]] int64_t total_card_count() const;
    [[nodiscard]] int64_t total_due_count() const;
    [[nodiscard]] int64_t total_new_count() const;

    /**
     * Cards of this deck followed by those of every subdeck, depth first.
     */
    [[nodiscard]] std::vector<Card> all_cards() const;
};

/**
 * Build the deck forest from flat rows.
 *
 * A deck is a root when it has no parent or its parent is not in `decks`,
 * so subdecks synced ahead of their parent stay visible. Siblings are
 * sorted case-insensitively by name (ties by id). Decks caught in a parent
 * cycle are promoted to roots rather than dropped. Cards attach to the deck
 * whose id equals their deck_id; cards without a matching deck are left out.
 */
[[nodiscard]] std::vector<DeckNode> build_deck_tree(
    const std::vector<Deck>& decks,
    const std::vector<Card>& cards,
    Timestamp now);

/**
 * Depth-first lookup; nullptr if absent.
 */
[[nodiscard]] const DeckNode* find_deck(const std::vector<DeckNode>& roots, const Uuid& id);

/**
 * Number of due cards among `cards`.
 */
[[nodiscard]] int64_t count_due(const std::vector<Card>& cards, Timestamp now);

} // namespace studysync
