#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/deck_tree.hpp"
#include <set>

using namespace studysync;

namespace {

// Decks 0..n-1, each with an optional parent index that may point anywhere,
// including itself or a missing deck.
std::vector<Deck> decks_from(const std::vector<std::pair<std::string, int>>& spec) {
    std::vector<Uuid> ids;
    ids.reserve(spec.size());
    for (size_t i = 0; i < spec.size(); ++i) ids.push_back(Uuid::generate());

    std::vector<Deck> decks;
    for (size_t i = 0; i < spec.size(); ++i) {
        const auto& [name, parent] = spec[i];
        std::optional<Uuid> parent_id;
        if (parent >= 0) {
            const auto index = static_cast<size_t>(parent) % (spec.size() + 1);
            parent_id = index < spec.size() ? ids[index] : Uuid::generate();
        }
        decks.push_back(create_deck(ids[i], Uuid{}, name.empty() ? "deck" : name, {}, parent_id));
    }
    return decks;
}

void collect(const std::vector<DeckNode>& nodes, std::vector<Uuid>& out) {
    for (const auto& node : nodes) {
        out.push_back(node.deck.id);
        collect(node.children, out);
    }
}

} // namespace

TEST_CASE("Property: every deck appears exactly once", "[property][deck_tree]") {
    REQUIRE(rc::check("the tree is a partition of the input decks",
        [](const std::vector<std::pair<std::string, int>>& spec) {
            const auto decks = decks_from(spec);
            const auto roots = build_deck_tree(decks, {}, Timestamp::now());

            std::vector<Uuid> seen;
            collect(roots, seen);
            RC_ASSERT(seen.size() == decks.size());
            RC_ASSERT(std::set<Uuid>(seen.begin(), seen.end()).size() == decks.size());
        }));
}

TEST_CASE("Property: total card count covers every filed card", "[property][deck_tree]") {
    REQUIRE(rc::check("card totals add up to the cards with a known deck",
        [](const std::vector<std::pair<std::string, int>>& spec, const std::vector<unsigned>& placement) {
            const auto decks = decks_from(spec);
            std::vector<Card> cards;
            size_t filed = 0;
            for (unsigned p : placement) {
                std::optional<Uuid> deck_id;
                if (!decks.empty() && p % 3 != 0) {
                    deck_id = decks[p % decks.size()].id;
                    ++filed;
                }
                cards.push_back(create_card(Uuid::generate(), Uuid{}, deck_id, "q", "a"));
            }

            const auto roots = build_deck_tree(decks, cards, Timestamp::now());
            int64_t total = 0;
            int64_t due = 0;
            for (const auto& root : roots) {
                total += root.total_card_count();
                due += root.total_due_count();
            }
            RC_ASSERT(total == static_cast<int64_t>(filed));
            // New cards are always due
            RC_ASSERT(due == total);
        }));
}
