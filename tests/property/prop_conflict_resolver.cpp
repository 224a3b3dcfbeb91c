#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/conflict_resolver.hpp"
#include <algorithm>

using namespace studysync;

namespace {

constexpr int64_t kDay = 86'400'000;

std::optional<Timestamp> review_day(int day) {
    if (day < 0) return std::nullopt;
    return Timestamp(day * kDay);
}

Card card_with(const Uuid& id, int last_review_day, int total, int correct,
               const std::string& front, int64_t modified_day) {
    auto card = create_card(id, Uuid{}, std::nullopt, front, "back");
    card.memory.last_review = review_day(last_review_day);
    card.memory.stability = last_review_day + 0.5;
    card.stats.total_reviews = total;
    card.stats.correct_reviews = correct;
    card.modified_at = Timestamp(modified_day * kDay);
    return card;
}

} // namespace

TEST_CASE("Property: merged counters never go backwards", "[property][conflict]") {
    REQUIRE(rc::check("merged counters are the maximum of both sides",
        [](int l_total, int s_total, int l_correct, int s_correct) {
            const auto id = Uuid::generate();
            auto local = card_with(id, 1, l_total, l_correct, "a", 1);
            auto server = card_with(id, 2, s_total, s_correct, "a", 2);

            auto merge = merge_cards(local, server);
            RC_ASSERT(merge.merged.stats.total_reviews == std::max<int64_t>(l_total, s_total));
            RC_ASSERT(merge.merged.stats.correct_reviews == std::max<int64_t>(l_correct, s_correct));
        }));
}

TEST_CASE("Property: memory state moves as a group", "[property][conflict]") {
    REQUIRE(rc::check("merged memory equals one side's memory",
        [](int l_day, int s_day) {
            const auto id = Uuid::generate();
            auto local = card_with(id, l_day % 1000, 0, 0, "a", 1);
            auto server = card_with(id, s_day % 1000, 0, 0, "b", 2);

            auto merge = merge_cards(local, server);
            const auto& picked = merge.memory_source == MergeSource::Local ? local : server;
            RC_ASSERT(merge.merged.memory == picked.memory);

            // The later review always wins.
            if (local.memory.last_review && server.memory.last_review &&
                *local.memory.last_review != *server.memory.last_review) {
                const bool local_later = *local.memory.last_review > *server.memory.last_review;
                RC_ASSERT(local_later == (merge.memory_source == MergeSource::Local));
            }
        }));
}

TEST_CASE("Property: content always comes from the server", "[property][conflict]") {
    REQUIRE(rc::check("front and back are the server's",
        [](const std::string& local_front, const std::string& server_front) {
            const auto id = Uuid::generate();
            auto local = card_with(id, 3, 1, 1, local_front, 1);
            auto server = card_with(id, 3, 1, 1, server_front, 2);

            auto resolved = resolve_card(local, server);
            RC_ASSERT(resolved.conflicted());
            RC_ASSERT(resolved.merged.front == server_front);
            RC_ASSERT((resolved.tag->find("content:server") != std::string::npos) ==
                      (local_front != server_front));
        }));
}

TEST_CASE("Property: resolution only happens for newer remotes", "[property][conflict]") {
    REQUIRE(rc::check("no conflict when the remote is not newer",
        [](int local_day, int remote_day) {
            const auto id = Uuid::generate();
            auto local = card_with(id, 1, 1, 1, "a", local_day % 10000);
            auto remote = card_with(id, 2, 2, 2, "b", remote_day % 10000);

            auto resolved = resolve_card(local, remote);
            RC_ASSERT(resolved.conflicted() == (remote.modified_at > local.modified_at));
            if (!resolved.conflicted()) {
                RC_ASSERT(resolved.merged == local);
            }
        }));
}
