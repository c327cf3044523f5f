#pragma once
#include <chrono>
#include <cstddef>

#include "tick_driver.hpp"

// Simple arithmetic mean of sampled values.
class RunningAverage
{
public:
    void add(double x)
    {
        sum_ += x;
        ++n_;
    }
    double mean() const { return n_ ? sum_ / static_cast<double>(n_) : 0.0; }
    std::size_t count() const { return n_; }

private:
    double sum_ = 0.0;
    std::size_t n_ = 0;
};

// Frames-per-second tracker. Current FPS is published once per full second;
// the minimum shown is latched every three seconds so short dips stay visible.
class FpsCounter
{
public:
    using Clock = std::chrono::steady_clock;

    explicit FpsCounter(Clock::time_point start);

    void frame(Clock::time_point now);

    double current() const { return fps_; }
    double max() const { return max_; }
    double min() const { return min_shown_; }
    double mean() const { return windows_.mean(); }

private:
    Clock::time_point window_start_;
    Clock::time_point min_refresh_;
    std::size_t frames_ = 0;
    double fps_ = 0.0;
    double max_ = 0.0;
    double min_pending_ = 0.0;
    double min_shown_ = 0.0;
    bool have_min_ = false;
    RunningAverage windows_;
};

// Harness-side aggregates over the reports of a run. Never touches the model.
class RunStats
{
public:
    void sample(const TickReport &r);

    double mean_efficiency() const { return efficiency_.mean(); }
    double mean_ops_per_append() const { return ops_.mean(); }
    int last_ops() const { return last_ops_; }
    int max_ops() const { return max_ops_; }
    std::size_t ticks() const { return ticks_; }
    std::size_t appends() const { return appends_; }
    std::size_t deferred() const { return deferred_; }
    std::size_t stalled() const { return stalled_; }

private:
    RunningAverage efficiency_;
    RunningAverage ops_;
    int last_ops_ = 0;
    int max_ops_ = 0;
    std::size_t ticks_ = 0;
    std::size_t appends_ = 0;
    std::size_t deferred_ = 0;
    std::size_t stalled_ = 0;
};
