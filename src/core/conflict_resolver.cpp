#include "core/conflict_resolver.hpp"

#include <algorithm>

namespace studysync {

namespace {

constexpr const char* kServerWins = "server_wins";

bool local_has_later_review(const Card& local, const Card& server) {
    const auto& l = local.memory.last_review;
    const auto& s = server.memory.last_review;
    if (!l && !s) return true;
    if (!l) return false;
    if (!s) return true;
    return *l >= *s;
}

constexpr const char* kMemoryColumns[] = {
    "stability", "difficulty", "state", "lapses", "next_review_date", "last_review_date"};
constexpr const char* kCounterColumns[] = {"total_reviews", "correct_reviews"};

// Card rules applied column by column, for rows that do not map onto a Card.
Resolved<Row> merge_card_rows(const Row& local, const Row& remote) {
    Row merged = local;
    for (const auto& [key, value] : remote) {
        merged[key] = value;
    }

    const auto l = get_timestamp(local, "last_review_date");
    const auto s = get_timestamp(remote, "last_review_date");
    const bool local_memory = !s || (l && *l >= *s);
    if (local_memory) {
        for (const auto* column : kMemoryColumns) {
            if (auto it = local.find(column); it != local.end()) merged[column] = it->second;
        }
    }

    for (const auto* column : kCounterColumns) {
        const auto a = get_int(local, column);
        const auto b = get_int(remote, column);
        if (a || b) merged[column] = std::max(a.value_or(0), b.value_or(0));
    }

    std::string tag = local_memory ? "FSRS:local" : "FSRS:server";
    if (get_text(local, "front") != get_text(remote, "front") ||
        get_text(local, "back") != get_text(remote, "back")) {
        tag += ",content:server";
    }
    return {.merged = std::move(merged), .tag = std::move(tag)};
}

Resolved<Row> overlay_remote(const Row& local, const Row& remote) {
    Row merged = local;
    for (const auto& [key, value] : remote) {
        merged[key] = value;
    }
    return {.merged = std::move(merged), .tag = kServerWins};
}

} // namespace

std::string CardMerge::tag() const {
    std::string out = memory_source == MergeSource::Local ? "FSRS:local" : "FSRS:server";
    if (content_conflict) {
        out += ",content:server";
    }
    return out;
}

CardMerge merge_cards(const Card& local, const Card& server) {
    CardMerge result{.merged = server};

    if (local_has_later_review(local, server)) {
        result.merged.memory = local.memory;
        result.memory_source = MergeSource::Local;
    }

    result.merged.stats.total_reviews =
        std::max(local.stats.total_reviews, server.stats.total_reviews);
    result.merged.stats.correct_reviews =
        std::max(local.stats.correct_reviews, server.stats.correct_reviews);

    result.content_conflict = local.front != server.front || local.back != server.back;
    return result;
}

Resolved<Card> resolve_card(const Card& local, const Card& remote) {
    if (!is_conflict(local.modified_at, remote.modified_at)) {
        return {.merged = local, .tag = std::nullopt};
    }
    auto merge = merge_cards(local, remote);
    auto tag = merge.tag();
    return {.merged = std::move(merge.merged), .tag = std::move(tag)};
}

Resolved<Deck> resolve_deck(const Deck& local, const Deck& remote) {
    if (!is_conflict(local.modified_at, remote.modified_at)) {
        return {.merged = local, .tag = std::nullopt};
    }
    Deck merged = remote;
    merged.id = local.id;
    return {.merged = std::move(merged), .tag = kServerWins};
}

Resolved<Row> resolve_row(const std::string& table, const Row& local, const Row& remote) {
    if (!is_conflict(get_timestamp(local, "modified_at"), get_timestamp(remote, "modified_at"))) {
        return {.merged = local, .tag = std::nullopt};
    }

    if (table == "cards") {
        auto local_card = card_from_row(local);
        auto remote_card = card_from_row(remote);
        if (local_card.is_ok() && remote_card.is_ok()) {
            auto merge = merge_cards(local_card.unwrap(), remote_card.unwrap());
            return {.merged = card_to_row(merge.merged), .tag = merge.tag()};
        }
        return merge_card_rows(local, remote);
    } else if (table == "decks") {
        auto local_deck = deck_from_row(local);
        auto remote_deck = deck_from_row(remote);
        if (local_deck.is_ok() && remote_deck.is_ok()) {
            auto resolved = resolve_deck(local_deck.unwrap(), remote_deck.unwrap());
            return {.merged = deck_to_row(resolved.merged), .tag = resolved.tag};
        }
    }

    return overlay_remote(local, remote);
}

} // namespace studysync
