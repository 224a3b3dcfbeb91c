#include <catch2/catch_test_macros.hpp>
#include "core/card.hpp"
#include "core/deck.hpp"
#include "fixed_scheduler.hpp"

using namespace studysync;
using studysync::testing::FixedScheduler;

namespace {

constexpr int64_t kDay = 86'400'000;

Card new_card() {
    return create_card(Uuid::generate(), Uuid::generate(), std::nullopt, "front", "back");
}

} // namespace

TEST_CASE("apply_review on a new card", "[card][review]") {
    FixedScheduler scheduler;
    const auto now = Timestamp(100 * kDay);
    auto card = new_card();

    SECTION("Good moves to Review and counts a correct review") {
        auto reviewed = apply_review(card, Rating::Good, scheduler, 0.9, now);
        REQUIRE(reviewed.is_ok());
        const auto& c = reviewed.unwrap();
        REQUIRE(c.memory.state == LearningState::Review);
        REQUIRE(c.stats.total_reviews == 1);
        REQUIRE(c.stats.correct_reviews == 1);
        REQUIRE(c.memory.lapses == 0);
        REQUIRE(c.memory.last_review == now);
        REQUIRE(c.memory.next_review == now.plus_days(3));
        REQUIRE(c.modified_at == now);
        REQUIRE_FALSE(scheduler.last_memory.has_value());
    }

    SECTION("Again moves to Learning and counts a lapse") {
        auto reviewed = apply_review(card, Rating::Again, scheduler, 0.9, now).unwrap();
        REQUIRE(reviewed.memory.state == LearningState::Learning);
        REQUIRE(reviewed.memory.lapses == 1);
        REQUIRE(reviewed.stats.total_reviews == 1);
        REQUIRE(reviewed.stats.correct_reviews == 0);
    }
}

TEST_CASE("apply_review on a reviewed card", "[card][review]") {
    FixedScheduler scheduler;
    auto card = new_card();
    card.memory.state = LearningState::Review;
    card.memory.stability = 4.0;
    card.memory.difficulty = 5.0;
    card.memory.last_review = Timestamp(10 * kDay);
    const auto now = Timestamp(13 * kDay + 5);

    auto reviewed = apply_review(card, Rating::Again, scheduler, 0.9, now).unwrap();

    const SchedulerMemory expected{.stability = 4.0, .difficulty = 5.0};
    REQUIRE(scheduler.last_memory == expected);
    REQUIRE(scheduler.last_days_elapsed == 3);
    REQUIRE(reviewed.memory.state == LearningState::Relearning);
    REQUIRE(reviewed.memory.stability == 4.0);
    REQUIRE(reviewed.memory.next_review == now.plus_days(1));
}

TEST_CASE("apply_review leaves the card alone on scheduler rejection", "[card][review]") {
    FixedScheduler scheduler;
    auto card = new_card();

    auto reviewed = apply_review(card, Rating::Good, scheduler, 1.5, Timestamp::now());
    REQUIRE(reviewed.is_err());
    REQUIRE(reviewed.unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(card.stats.total_reviews == 0);
}

TEST_CASE("Due cards", "[card]") {
    const auto now = Timestamp(50 * kDay);
    auto card = new_card();
    card.memory.next_review = now.plus_days(5);

    REQUIRE(is_due(card, now));  // new cards are always due

    card.memory.state = LearningState::Review;
    REQUIRE_FALSE(is_due(card, now));
    REQUIRE(is_due(card, now.plus_days(5)));
}

TEST_CASE("Card row mapping", "[card][row]") {
    auto card = create_card(Uuid::generate(), Uuid::generate(), Uuid::generate(), "Q", "A");
    card.memory.last_review = Timestamp(1704067200000);
    card.stats.total_reviews = 7;

    auto row = card_to_row(card);
    REQUIRE(std::get<std::string>(row.at("next_review_date")) == card.memory.next_review.to_iso_string());
    REQUIRE(std::get<int64_t>(row.at("state")) == 0);

    auto back = card_from_row(row);
    REQUIRE(back.is_ok());
    REQUIRE(back.unwrap() == card);

    SECTION("rows without an id are rejected") {
        row.erase("id");
        REQUIRE(card_from_row(row).unwrap_err().kind == ErrorKind::Validation);
    }

    SECTION("a null deck and review date stay empty") {
        row["deck_id"] = Value{};
        row["last_review_date"] = Value{};
        auto mapped = card_from_row(row).unwrap();
        REQUIRE_FALSE(mapped.deck_id.has_value());
        REQUIRE_FALSE(mapped.memory.last_review.has_value());
    }
}

TEST_CASE("Deck names are validated", "[deck]") {
    REQUIRE(validate_deck_name("  Spanish ").unwrap() == "Spanish");
    REQUIRE(validate_deck_name("   ").is_err());
    REQUIRE(validate_deck_name("").unwrap_err().kind == ErrorKind::Validation);

    auto deck = create_deck(Uuid::generate(), Uuid::generate(), "Verbs", "irregular", Uuid::generate());
    REQUIRE(deck_from_row(deck_to_row(deck)).unwrap() == deck);
}
