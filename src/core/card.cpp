#include "core/card.hpp"

namespace studysync {

namespace {

constexpr int64_t kMicrosPerDay = 86'400'000'000;

LearningState state_from_int(int64_t value) {
    switch (value) {
        case 1: return LearningState::Learning;
        case 2: return LearningState::Review;
        case 3: return LearningState::Relearning;
        default: return LearningState::New;
    }
}

} // namespace

const char* to_string(LearningState state) noexcept {
    switch (state) {
        case LearningState::New: return "new";
        case LearningState::Learning: return "learning";
        case LearningState::Review: return "review";
        case LearningState::Relearning: return "relearning";
    }
    return "new";
}

int64_t days_since_last_review(const Card& card, Timestamp now) {
    if (!card.memory.last_review) return 0;
    const auto elapsed = (now - *card.memory.last_review).count();
    return elapsed > 0 ? elapsed / kMicrosPerDay : 0;
}

Result<Card, Error> apply_review(
    const Card& card,
    Rating rating,
    const Scheduler& scheduler,
    double desired_retention,
    Timestamp now
) {
    std::optional<SchedulerMemory> memory;
    if (card.memory.state != LearningState::New) {
        memory = SchedulerMemory{
            .stability = card.memory.stability,
            .difficulty = card.memory.difficulty
        };
    }

    auto outcome = scheduler.compute_next_state(
        memory, rating, days_since_last_review(card, now), desired_retention);
    if (outcome.is_err()) {
        return Result<Card, Error>::err(outcome.unwrap_err());
    }
    const auto& next = outcome.unwrap();

    Card reviewed = card;
    reviewed.stats.total_reviews += 1;
    reviewed.modified_at = now;

    if (rating == Rating::Again) {
        reviewed.memory.lapses += 1;
        reviewed.memory.state = card.memory.state == LearningState::New
            ? LearningState::Learning
            : LearningState::Relearning;
    } else {
        reviewed.stats.correct_reviews += 1;
        reviewed.memory.state = LearningState::Review;
    }

    reviewed.memory.stability = next.memory.stability;
    reviewed.memory.difficulty = next.memory.difficulty;
    reviewed.memory.next_review = now.plus_days(next.interval_days);
    reviewed.memory.last_review = now;

    return Result<Card, Error>::ok(std::move(reviewed));
}

Row card_to_row(const Card& card) {
    const auto& m = card.memory;
    return Row{
        {"id", card.id.to_string()},
        {"user_id", card.user_id.to_string()},
        {"deck_id", card.deck_id ? Value{card.deck_id->to_string()} : Value{}},
        {"front", card.front},
        {"back", card.back},
        {"stability", m.stability},
        {"difficulty", m.difficulty},
        {"state", static_cast<int64_t>(m.state)},
        {"lapses", m.lapses},
        {"next_review_date", m.next_review.to_iso_string()},
        {"last_review_date", m.last_review ? Value{m.last_review->to_iso_string()} : Value{}},
        {"total_reviews", card.stats.total_reviews},
        {"correct_reviews", card.stats.correct_reviews},
        {"created_at", card.created_at.to_iso_string()},
        {"modified_at", card.modified_at.to_iso_string()},
    };
}

Result<Card, Error> card_from_row(const Row& row) {
    auto id = get_uuid(row, "id");
    if (!id) {
        return Result<Card, Error>::err(Error::validation("Card row has no valid id"));
    }

    const auto now = Timestamp::now();
    return Result<Card, Error>::ok(Card{
        .id = *id,
        .user_id = get_uuid(row, "user_id").value_or(Uuid{}),
        .deck_id = get_uuid(row, "deck_id"),
        .front = get_text(row, "front").value_or(""),
        .back = get_text(row, "back").value_or(""),
        .memory = MemoryState{
            .stability = get_double(row, "stability").value_or(0.0),
            .difficulty = get_double(row, "difficulty").value_or(0.0),
            .state = state_from_int(get_int(row, "state").value_or(0)),
            .lapses = get_int(row, "lapses").value_or(0),
            .next_review = get_timestamp(row, "next_review_date").value_or(now),
            .last_review = get_timestamp(row, "last_review_date")
        },
        .stats = ReviewStats{
            .total_reviews = get_int(row, "total_reviews").value_or(0),
            .correct_reviews = get_int(row, "correct_reviews").value_or(0)
        },
        .created_at = get_timestamp(row, "created_at").value_or(now),
        .modified_at = get_timestamp(row, "modified_at").value_or(now)
    });
}

} // namespace studysync
