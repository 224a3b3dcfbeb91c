#pragma once

#include "core/card.hpp"
#include "core/deck_tree.hpp"
#include "core/sync_types.hpp"
#include <QString>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace studysync::cli {

struct DeckListOptions {
    bool includeIds = false;
    bool includeUnfiled = true;
};

// Text tree, one deck per line:
//   - Spanish [due 3, new 1, cards 12]
//     - Verbs [due 1, new 0, cards 5]
// Counts include subdecks. Cards without a deck are summarised last.
[[nodiscard]] QString format_deck_tree(const std::vector<DeckNode>& roots,
                                       const std::vector<Card>& cards,
                                       const DeckListOptions& options = {});

// JSON output:
// {
//   "decks": [{ "deckId"?, "name", "due", "new", "cards", "children": [ ... ] }],
//   "unfiled"?: { "cards", "due" }
// }
[[nodiscard]] QString format_deck_tree_json(const std::vector<DeckNode>& roots,
                                            const std::vector<Card>& cards,
                                            Timestamp now,
                                            const DeckListOptions& options = {});

struct StatusReport {
    std::vector<PendingOperation> pending;
    std::map<std::string, std::optional<std::string>> checkpoints;
    std::deque<SyncError> errors;
};

[[nodiscard]] QString format_status(const StatusReport& report);

} // namespace studysync::cli
