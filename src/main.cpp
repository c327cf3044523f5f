#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "cli.hpp"
#include "frame.hpp"
#include "growth_model.hpp"
#include "stats.hpp"
#include "stop_signal.hpp"
#include "tick_driver.hpp"

static void print_metadata(const Args &a)
{
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug\n");
#endif
    if (a.limit)
        std::fprintf(stderr, "# growth: %g limit: %zu\n", a.growth, *a.limit);
    else
        std::fprintf(stderr, "# growth: %g limit: none\n", a.growth);
}

static void print_status(const TickReport &r, const RunStats &st, const FpsCounter &fps)
{
    const Snapshot &s = r.snapshot;
    std::fprintf(stderr,
                 "\rtick %zu | Memory efficiency: %.2f%% | Operations per append: %d (mean %.2f) | "
                 "FPS cur %.2f min %.2f max %.2f | Capacity: %zu | Size: %zu | Growth factor: %g | "
                 "resizes %zu migrations %zu   ",
                 r.tick, s.efficiency * 100.0, st.last_ops(), st.mean_ops_per_append(),
                 fps.current(), fps.min(), fps.max(), s.capacity, s.size, s.growth_factor,
                 s.resize_count, s.migration_op_count);
}

static void print_summary(const TickDriver &driver, const GrowthModel &model, const RunStats &st,
                          const FpsCounter &fps, std::size_t frames)
{
    std::fprintf(stderr, "\n# ticks: %zu appends: %zu deferred: %zu stalled: %zu\n",
                 st.ticks(), st.appends(), st.deferred(), st.stalled());
    std::fprintf(stderr, "# capacity: %zu size: %zu resizes: %zu migrations: %zu\n",
                 model.capacity(), model.size(), model.resize_count(), model.migration_op_count());
    std::fprintf(stderr, "# mean efficiency: %.4f mean ops/append: %.4f max ops/tick: %d\n",
                 st.mean_efficiency(), st.mean_ops_per_append(), st.max_ops());
    std::fprintf(stderr, "# fps min %.2f max %.2f mean %.2f frames written: %zu\n",
                 fps.min(), fps.max(), fps.mean(), frames);
    if (driver.limit_tick())
        std::fprintf(stderr, "# limit reached at tick %zu\n", *driver.limit_tick());
}

static int run(const Args &a)
{
    using Clock = TickDriver::Clock;

    std::unique_ptr<FrameSink> sink;
    if (!a.record_dir.empty())
        sink = std::make_unique<FrameSink>(FrameSink::Mode::Directory, a.record_dir);
    else if (!a.stream_path.empty())
        sink = std::make_unique<FrameSink>(FrameSink::Mode::Stream, a.stream_path);

    FrameLayout layout;
    layout.grid = a.grid;
    layout.cell_px = a.cell_px;

    GrowthModel model(a.growth, a.limit);
    TickDriver driver;
    RunStats stats;
    FpsCounter fps(Clock::now());
    const auto grace = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(a.grace_s));

    if (a.csv)
        write_csv_header(std::cout);

    while (!stop_requested())
    {
        auto now = Clock::now();
        TickReport r = driver.tick(model, now);
        stats.sample(r);

        if (r.outcome == TickOutcome::LimitReached && !a.quiet)
            std::fprintf(stderr, "\n# hard limit %zu reached at tick %zu\n", r.snapshot.capacity, r.tick);
        else if (r.expanded && !a.quiet)
            std::fprintf(stderr, "\nNew capacity: %zu (resize %zu, %zu old elements to migrate)\n",
                         r.snapshot.capacity, r.snapshot.resize_count, r.snapshot.old_generation_size);

        if (a.csv)
            write_csv_row(std::cout, r.tick, r.snapshot);
        if (sink && (r.tick - 1) % a.every == 0)
            sink->write(render_frame(r.snapshot, layout));

        fps.frame(Clock::now());
        if (!a.quiet && a.report > 0 && r.tick % a.report == 0)
            print_status(r, stats, fps);

        if (a.ticks > 0 && r.tick >= a.ticks)
            break;
        if (driver.grace_elapsed(Clock::now(), grace))
            break;
    }
    if (stop_requested())
        std::fprintf(stderr, "\n# stopped by signal\n");

    std::size_t frames = 0;
    if (sink)
    {
        frames = sink->frames_written();
        sink->close();
    }
    std::cout.flush();
    print_summary(driver, model, stats, fps, frames);
    return 0;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);

    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::fprintf(stderr, "error: %s\n", e.what());
        print_usage(argv[0]);
        return 2;
    }
    if (a.help)
    {
        print_usage(argv[0]);
        return 0;
    }
    if (auto err = validate(a))
    {
        std::fprintf(stderr, "error: %s\n", err->c_str());
        return 2;
    }

    install_stop_handlers();
    print_metadata(a);
    try
    {
        return run(a);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "\nerror: %s\n", e.what());
        return 1;
    }
}
