#include <catch2/catch_test_macros.hpp>
#include "core/deck_tree.hpp"

using namespace studysync;

namespace {

constexpr int64_t kDay = 86'400'000;
const Uuid kUser = Uuid::generate();

Deck deck(const std::string& name, std::optional<Uuid> parent = std::nullopt) {
    return create_deck(Uuid::generate(), kUser, name, {}, parent);
}

Card card_in(const Deck& d, LearningState state, Timestamp next_review) {
    auto c = create_card(Uuid::generate(), kUser, d.id, "q", "a");
    c.memory.state = state;
    c.memory.next_review = next_review;
    return c;
}

size_t count_nodes(const std::vector<DeckNode>& nodes) {
    size_t n = 0;
    for (const auto& node : nodes) n += 1 + count_nodes(node.children);
    return n;
}

} // namespace

TEST_CASE("Deck tree nests subdecks under their parent", "[deck_tree]") {
    auto languages = deck("Languages");
    auto spanish = deck("spanish", languages.id);
    auto french = deck("French", languages.id);
    auto verbs = deck("Verbs", spanish.id);
    auto math = deck("Math");

    auto roots = build_deck_tree({verbs, math, spanish, languages, french}, {}, Timestamp::now());

    REQUIRE(roots.size() == 2);
    REQUIRE(roots[0].deck.name == "Languages");
    REQUIRE(roots[1].deck.name == "Math");

    // Case-insensitive sibling order
    REQUIRE(roots[0].children.size() == 2);
    REQUIRE(roots[0].children[0].deck.name == "French");
    REQUIRE(roots[0].children[1].deck.name == "spanish");
    REQUIRE(roots[0].children[1].children[0].deck.id == verbs.id);

    REQUIRE(find_deck(roots, verbs.id) != nullptr);
    REQUIRE(find_deck(roots, Uuid::generate()) == nullptr);
}

TEST_CASE("Decks whose parent is missing stay visible as roots", "[deck_tree]") {
    auto orphan = deck("Orphan", Uuid::generate());
    auto child = deck("Child", orphan.id);

    auto roots = build_deck_tree({child, orphan}, {}, Timestamp::now());

    REQUIRE(roots.size() == 1);
    REQUIRE(roots[0].deck.id == orphan.id);
    REQUIRE(roots[0].children.size() == 1);
    REQUIRE(roots[0].children[0].deck.id == child.id);
}

TEST_CASE("Parent cycles do not lose decks", "[deck_tree]") {
    auto a = deck("A");
    auto b = deck("B", a.id);
    a.parent_id = b.id;
    auto self = deck("Self");
    self.parent_id = self.id;

    auto roots = build_deck_tree({a, b, self}, {}, Timestamp::now());

    REQUIRE(count_nodes(roots) == 3);
    REQUIRE(find_deck(roots, a.id) != nullptr);
    REQUIRE(find_deck(roots, b.id) != nullptr);
    REQUIRE(find_deck(roots, self.id) != nullptr);
}

TEST_CASE("Deck counts aggregate over subdecks", "[deck_tree]") {
    const auto now = Timestamp(100 * kDay);
    auto parent = deck("Parent");
    auto child = deck("Child", parent.id);

    std::vector<Card> cards{
        card_in(parent, LearningState::New, now.plus_days(3)),
        card_in(parent, LearningState::Review, now.plus_days(3)),
        card_in(child, LearningState::Review, now.plus_days(-1)),
        card_in(child, LearningState::Relearning, now),
    };
    auto unfiled = create_card(Uuid::generate(), kUser, std::nullopt, "q", "a");
    auto stray = create_card(Uuid::generate(), kUser, Uuid::generate(), "q", "a");
    cards.push_back(unfiled);
    cards.push_back(stray);

    auto roots = build_deck_tree({parent, child}, cards, now);
    REQUIRE(roots.size() == 1);
    const auto& p = roots[0];

    REQUIRE(p.card_count() == 2);
    REQUIRE(p.due_count == 1);
    REQUIRE(p.new_count == 1);
    REQUIRE(p.children[0].due_count == 2);

    REQUIRE(p.total_card_count() == 4);
    REQUIRE(p.total_due_count() == 3);
    REQUIRE(p.total_new_count() == 1);
    REQUIRE(p.all_cards().size() == 4);
    REQUIRE(p.all_cards().front().id == cards[0].id);

    REQUIRE(count_due(cards, now) == 5);
}

TEST_CASE("An empty store builds an empty tree", "[deck_tree]") {
    REQUIRE(build_deck_tree({}, {}, Timestamp::now()).empty());
}
