#pragma once

#include "core/result.hpp"
#include <cstdint>
#include <optional>

namespace studysync {

/**
 * Rating - the learner's answer to a review.
 */
enum class Rating : int {
    Again = 1,
    Hard = 2,
    Good = 3,
    Easy = 4
};

/**
 * SchedulerMemory - the part of a card's memory state the scheduling
 * algorithm reads and writes.
 */
struct SchedulerMemory {
    double stability{0.0};
    double difficulty{0.0};

    bool operator==(const SchedulerMemory&) const = default;
};

struct ScheduleOutcome {
    SchedulerMemory memory;
    int64_t interval_days{0};
};

/**
 * Scheduler - spaced-repetition algorithm.
 *
 * Implementations are deterministic and pure; they may only fail by
 * rejecting invalid input (e.g. retention outside (0, 1)).
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /**
     * @param memory         current memory, or none for a card never reviewed
     * @param days_elapsed   whole days since the previous review
     */
    [[nodiscard]] virtual Result<ScheduleOutcome, Error> compute_next_state(
        const std::optional<SchedulerMemory>& memory,
        Rating rating,
        int64_t days_elapsed,
        double desired_retention) const = 0;
};

} // namespace studysync
