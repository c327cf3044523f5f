#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/cli.hpp"
#include "../src/growth_model.hpp"
#include "../src/stats.hpp"
#include "../src/tick_driver.hpp"

// timing helper
template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

struct Row
{
    double growth;
    std::size_t ticks, capacity, resizes;
    double mean_ops, mean_eff;
    int max_ops;
    std::size_t atomic_worst; // one-tick cost if every expansion copied everything at once
    std::uint64_t ns;
};

struct BenchArgs
{
    std::vector<double> growth{1.25, 1.5, 2.0, 3.0, 4.0};
    std::size_t ticks = 1u << 20;
    std::size_t limit = 1u << 18;
};

static BenchArgs parse_bench(int argc, char **argv)
{
    BenchArgs a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&](std::string &out)
        { if (i+1<argc){ out = argv[++i]; } };
        std::string v;
        if (s == "--growth")
        {
            next(v);
            a.growth = parse_list(v);
        }
        else if (s == "--ticks")
        {
            next(v);
            a.ticks = std::stoull(v);
        }
        else if (s == "--limit")
        {
            next(v);
            a.limit = std::stoull(v);
        }
    }
    return a;
}

static Row run_one(double growth, std::size_t ticks, std::size_t limit)
{
    GrowthModel model(growth, limit);
    TickDriver driver;
    RunStats stats;
    std::size_t atomic_worst = 0;
    auto t = TickDriver::Clock::now();

    std::uint64_t ns = time_ns([&]
                               {
        for (std::size_t i = 0; i < ticks && !driver.limit_reached(); ++i)
        {
            TickReport r = driver.tick(model, t);
            stats.sample(r);
            if (r.expanded)
                atomic_worst = std::max(atomic_worst, r.snapshot.old_generation_size + 1);
        } });

    return Row{growth, stats.ticks(), model.capacity(), model.resize_count(),
               stats.mean_ops_per_append(), stats.mean_efficiency(), stats.max_ops(),
               atomic_worst, ns};
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    BenchArgs a;
    try
    {
        a = parse_bench(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 2;
    }
    if (a.limit < 1)
    {
        std::fprintf(stderr, "error: limit must be at least 1\n");
        return 2;
    }

    std::cout << "growth,ticks,capacity,resizes,mean_ops_per_append,max_ops_per_tick,atomic_worst_ops,mean_efficiency,ns\n";
    for (double g : a.growth)
    {
        if (!(g > 1.0))
        {
            std::fprintf(stderr, "# skipping growth %g: must be greater than 1\n", g);
            continue;
        }
        Row r = run_one(g, a.ticks, a.limit);
        std::cout << r.growth << "," << r.ticks << "," << r.capacity << "," << r.resizes << ","
                  << r.mean_ops << "," << r.max_ops << "," << r.atomic_worst << ","
                  << r.mean_eff << "," << r.ns << "\n";
    }
    return 0;
}
