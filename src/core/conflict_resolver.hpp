#pragma once

#include "core/card.hpp"
#include "core/deck.hpp"
#include "core/row.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>

namespace studysync {

/**
 * Resolved - the record to upload plus a resolution tag when a conflict
 * was detected. No tag means the local record is uploaded unchanged.
 */
template<typename T>
struct Resolved {
    T merged;
    std::optional<std::string> tag;

    [[nodiscard]] bool conflicted() const noexcept { return tag.has_value(); }
};

/**
 * The backend copy only conflicts with the local one when it is strictly
 * newer. A missing timestamp on either side never conflicts.
 */
[[nodiscard]] inline bool is_conflict(
    const std::optional<Timestamp>& local_modified,
    const std::optional<Timestamp>& remote_modified
) {
    return local_modified && remote_modified && *remote_modified > *local_modified;
}

// ============================================================================
// Cards
// ============================================================================

enum class MergeSource { Local, Server };

/**
 * CardMerge - outcome of a field-level card merge.
 */
struct CardMerge {
    Card merged;
    MergeSource memory_source{MergeSource::Server};
    bool content_conflict{false};

    /**
     * "FSRS:local" or "FSRS:server", with ",content:server" appended when
     * the text differed.
     */
    [[nodiscard]] std::string tag() const;
};

/**
 * Merge two copies of a card, starting from the server copy:
 * - memory state as a group from the side with the later last review
 *   (null loses, ties keep local)
 * - review counters take the maximum of each side
 * - front/back from the server
 */
[[nodiscard]] CardMerge merge_cards(const Card& local, const Card& server);

[[nodiscard]] Resolved<Card> resolve_card(const Card& local, const Card& remote);

// ============================================================================
// Decks
// ============================================================================

/**
 * Whole-record last writer wins: a newer remote deck replaces the local one.
 */
[[nodiscard]] Resolved<Deck> resolve_deck(const Deck& local, const Deck& remote);

// ============================================================================
// Generic rows
// ============================================================================

/**
 * Resolve a pending local row against the current backend row of the same
 * table. Cards and decks use their dedicated rules; card rows that do not
 * parse as a Card get the same rules column by column. Any other table
 * lets the backend's columns overwrite the local ones ("server_wins").
 */
[[nodiscard]] Resolved<Row> resolve_row(
    const std::string& table,
    const Row& local,
    const Row& remote);

} // namespace studysync
