#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "core/row.hpp"
#include <string>
#include <optional>

namespace studysync {

/**
 * Deck - A named collection of cards.
 *
 * Decks nest through parent_id. The parent is a weak reference: it may
 * point at a deck that has not been synced yet, in which case the deck is
 * shown as a root.
 */
struct Deck {
    Uuid id;
    Uuid user_id;
    std::optional<Uuid> parent_id;
    std::string name;
    std::string description;
    Timestamp created_at;
    Timestamp modified_at;

    bool operator==(const Deck&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Trim surrounding whitespace and reject empty names.
 */
[[nodiscard]] Result<std::string, Error> validate_deck_name(std::string_view name);

[[nodiscard]] inline Deck create_deck(
    Uuid id,
    Uuid user_id,
    std::string name,
    std::string description = {},
    std::optional<Uuid> parent_id = std::nullopt
) {
    auto now = Timestamp::now();
    return Deck{
        .id = id,
        .user_id = user_id,
        .parent_id = parent_id,
        .name = std::move(name),
        .description = std::move(description),
        .created_at = now,
        .modified_at = now
    };
}

[[nodiscard]] inline Deck with_name(Deck deck, std::string name) {
    deck.name = std::move(name);
    deck.modified_at = Timestamp::now();
    return deck;
}

[[nodiscard]] inline Deck with_description(Deck deck, std::string description) {
    deck.description = std::move(description);
    deck.modified_at = Timestamp::now();
    return deck;
}

[[nodiscard]] inline Deck with_parent(Deck deck, std::optional<Uuid> parent_id) {
    deck.parent_id = parent_id;
    deck.modified_at = Timestamp::now();
    return deck;
}

// ============================================================================
// Row mapping
// ============================================================================

[[nodiscard]] Row deck_to_row(const Deck& deck);

/**
 * Map a row from the local store or the backend. Only a valid id is
 * required; missing or malformed fields fall back to defaults.
 */
[[nodiscard]] Result<Deck, Error> deck_from_row(const Row& row);

} // namespace studysync
