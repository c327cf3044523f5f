#include "tick_driver.hpp"

const char *to_string(TickOutcome o)
{
    switch (o)
    {
    case TickOutcome::Admitted:
        return "admitted";
    case TickOutcome::AdmittedAfterExpand:
        return "admitted_after_expand";
    case TickOutcome::Deferred:
        return "deferred";
    case TickOutcome::Stalled:
        return "stalled";
    case TickOutcome::LimitReached:
        return "limit_reached";
    case TickOutcome::Frozen:
        return "frozen";
    }
    return "unknown";
}

TickReport TickDriver::tick(GrowthModel &model, Clock::time_point now)
{
    TickReport r;
    r.tick = ++ticks_;

    if (limit_reached())
    {
        r.outcome = TickOutcome::Frozen;
        r.snapshot = model.snapshot();
        return r;
    }

    // 1. growth
    if (model.try_grow())
    {
        r.admitted = true;
        r.outcome = TickOutcome::Admitted;
        r.operations += 1;
    }
    else if (model.migration_pending())
    {
        r.outcome = TickOutcome::Deferred;
    }
    else
    {
        model.expand();
        r.expanded = true;
        r.operations += 1;
        if (model.try_grow())
        {
            r.admitted = true;
            r.outcome = TickOutcome::AdmittedAfterExpand;
            r.operations += 1;
        }
        else if (model.at_hard_limit())
        {
            r.outcome = TickOutcome::LimitReached;
            limit_tick_ = r.tick;
            limit_time_ = now;
        }
        else
        {
            r.outcome = TickOutcome::Stalled;
        }
    }

    // 2. one unit of migration, whatever happened above
    if (model.migrate_one())
    {
        r.migrated = true;
        r.operations += 1;
    }

    r.snapshot = model.snapshot();
    return r;
}
