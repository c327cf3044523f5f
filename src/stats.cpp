#include "stats.hpp"

FpsCounter::FpsCounter(Clock::time_point start)
    : window_start_(start), min_refresh_(start)
{
}

void FpsCounter::frame(Clock::time_point now)
{
    ++frames_;
    auto elapsed = now - window_start_;
    if (elapsed >= std::chrono::seconds(1))
    {
        fps_ = static_cast<double>(frames_) / std::chrono::duration<double>(elapsed).count();
        frames_ = 0;
        window_start_ = now;
        windows_.add(fps_);
        if (fps_ > max_)
            max_ = fps_;
        if (!have_min_ || fps_ < min_pending_)
        {
            min_pending_ = fps_;
            have_min_ = true;
        }
    }
    if (now - min_refresh_ >= std::chrono::seconds(3))
    {
        min_shown_ = min_pending_;
        // restart the pending window from the latest reading
        min_pending_ = fps_;
        min_refresh_ = now;
    }
}

void RunStats::sample(const TickReport &r)
{
    ++ticks_;
    efficiency_.add(r.snapshot.efficiency);
    last_ops_ = r.operations;
    if (r.operations > max_ops_)
        max_ops_ = r.operations;
    if (r.admitted)
    {
        ++appends_;
        ops_.add(static_cast<double>(r.operations));
    }
    if (r.outcome == TickOutcome::Deferred)
        ++deferred_;
    else if (r.outcome == TickOutcome::Stalled)
        ++stalled_;
}
