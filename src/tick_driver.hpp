#pragma once
#include <chrono>
#include <cstddef>
#include <optional>

#include "growth_model.hpp"
#include "snapshot.hpp"

enum class TickOutcome
{
    Admitted,            // try_grow succeeded first time
    AdmittedAfterExpand, // expanded, retry succeeded
    Deferred,            // blocked while the previous generation is still migrating
    Stalled,             // expanded but capacity did not move and no hard limit caps it
    LimitReached,        // entered the terminal state this tick
    Frozen               // terminal state already active; nothing happened
};

const char *to_string(TickOutcome o);

struct TickReport
{
    std::size_t tick = 0;
    TickOutcome outcome = TickOutcome::Admitted;
    bool admitted = false;
    bool expanded = false;
    bool migrated = false;
    int operations = 0; // model work done this tick
    Snapshot snapshot;
};

// Per-tick policy over a GrowthModel: admit, expand when blocked and the old
// generation is fully migrated, then migrate one unit. The model is borrowed
// for the duration of a tick only, so it stays testable on its own.
class TickDriver
{
public:
    using Clock = std::chrono::steady_clock;

    TickReport tick(GrowthModel &model, Clock::time_point now);

    std::size_t ticks() const { return ticks_; }
    bool limit_reached() const { return limit_tick_.has_value(); }
    std::optional<std::size_t> limit_tick() const { return limit_tick_; }
    std::optional<Clock::time_point> limit_time() const { return limit_time_; }

    // True once the terminal state has lasted at least `grace`.
    bool grace_elapsed(Clock::time_point now, Clock::duration grace) const
    {
        return limit_time_ && now - *limit_time_ >= grace;
    }

private:
    std::size_t ticks_ = 0;
    std::optional<std::size_t> limit_tick_;
    std::optional<Clock::time_point> limit_time_;
};
