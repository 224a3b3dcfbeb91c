#include "core/deck_tree.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace studysync {

namespace {

std::string fold_case(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool name_less(const Deck* a, const Deck* b) {
    const auto fa = fold_case(a->name);
    const auto fb = fold_case(b->name);
    if (fa != fb) return fa < fb;
    return a->id < b->id;
}

struct TreeBuilder {
    const std::unordered_map<Uuid, std::vector<const Deck*>>& children_of;
    const std::unordered_map<Uuid, std::vector<const Card*>>& cards_of;
    Timestamp now;
    std::unordered_set<Uuid> visited;

    DeckNode build(const Deck& deck) {
        visited.insert(deck.id);

        DeckNode node{.deck = deck};
        if (auto it = cards_of.find(deck.id); it != cards_of.end()) {
            node.cards.reserve(it->second.size());
            for (const Card* card : it->second) {
                node.cards.push_back(*card);
                if (is_due(*card, now)) ++node.due_count;
                if (card->memory.state == LearningState::New) ++node.new_count;
            }
        }

        if (auto it = children_of.find(deck.id); it != children_of.end()) {
            for (const Deck* child : it->second) {
                if (visited.count(child->id)) continue;
                node.children.push_back(build(*child));
            }
        }
        return node;
    }
};

} // namespace

int64_t DeckNode::total_card_count() const {
    int64_t total = card_count();
    for (const auto& child : children) total += child.total_card_count();
    return total;
}

int64_t DeckNode::total_due_count() const {
    int64_t total = due_count;
    for (const auto& child : children) total += child.total_due_count();
    return total;
}

int64_t DeckNode::total_new_count() const {
    int64_t total = new_count;
    for (const auto& child : children) total += child.total_new_count();
    return total;
}

std::vector<Card> DeckNode::all_cards() const {
    std::vector<Card> out = cards;
    for (const auto& child : children) {
        auto nested = child.all_cards();
        out.insert(out.end(), nested.begin(), nested.end());
    }
    return out;
}

std::vector<DeckNode> build_deck_tree(
    const std::vector<Deck>& decks,
    const std::vector<Card>& cards,
    Timestamp now
) {
    std::unordered_set<Uuid> present;
    present.reserve(decks.size());
    for (const auto& deck : decks) present.insert(deck.id);

    std::unordered_map<Uuid, std::vector<const Deck*>> children_of;
    std::vector<const Deck*> roots;
    std::vector<const Deck*> all;
    all.reserve(decks.size());
    for (const auto& deck : decks) {
        all.push_back(&deck);
        if (deck.parent_id && present.count(*deck.parent_id) && *deck.parent_id != deck.id) {
            children_of[*deck.parent_id].push_back(&deck);
        } else {
            roots.push_back(&deck);
        }
    }
    for (auto& [_, list] : children_of) {
        std::sort(list.begin(), list.end(), name_less);
    }
    std::sort(roots.begin(), roots.end(), name_less);

    std::unordered_map<Uuid, std::vector<const Card*>> cards_of;
    for (const auto& card : cards) {
        if (card.deck_id) cards_of[*card.deck_id].push_back(&card);
    }

    TreeBuilder builder{.children_of = children_of, .cards_of = cards_of, .now = now, .visited = {}};
    std::vector<DeckNode> result;
    result.reserve(roots.size());
    for (const Deck* root : roots) {
        result.push_back(builder.build(*root));
    }

    // Anything unvisited sits on a parent cycle.
    std::sort(all.begin(), all.end(), name_less);
    bool promoted = false;
    for (const Deck* deck : all) {
        if (builder.visited.count(deck->id)) continue;
        result.push_back(builder.build(*deck));
        promoted = true;
    }
    if (promoted) {
        std::sort(result.begin(), result.end(), [](const DeckNode& a, const DeckNode& b) {
            return name_less(&a.deck, &b.deck);
        });
    }
    return result;
}

const DeckNode* find_deck(const std::vector<DeckNode>& roots, const Uuid& id) {
    for (const auto& node : roots) {
        if (node.deck.id == id) return &node;
        if (const auto* found = find_deck(node.children, id)) return found;
    }
    return nullptr;
}

int64_t count_due(const std::vector<Card>& cards, Timestamp now) {
    return std::count_if(cards.begin(), cards.end(),
                         [now](const Card& card) { return is_due(card, now); });
}

} // namespace studysync
