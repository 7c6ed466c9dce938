/**
 * @file rate_meter.hpp
 * @brief Smoothed measurement of how often an event happens
 */

#pragma once

#include <chrono>

namespace skyline {

/**
 * @brief Event rate meter (events per second)
 *
 * Smooths inter-event intervals with an EMA that converges fast over the
 * first samples and then settles; single samples are clamped to [0.5x, 2x]
 * of the running average so one stall does not wreck the reading.
 */
class RateMeter {
public:
    using Clock = std::chrono::steady_clock;

    void addEvent() { addEvent(Clock::now()); }
    void addEvent(Clock::time_point now);

    /// Smoothed rate in Hz, 0 until two events have been seen
    double rate() const;

    void reset();

private:
    Clock::time_point last_event_{};
    bool has_last_ = false;
    double ema_interval_s_ = 0.0;
    unsigned int samples_ = 0;

    static constexpr double ALPHA_FAST = 0.45;
    static constexpr double ALPHA_STABLE = 0.20;
    static constexpr unsigned int RAMP_SAMPLES = 20;
    static constexpr double SPIKE_MIN_RATIO = 0.5;
    static constexpr double SPIKE_MAX_RATIO = 2.0;
};

} // namespace skyline
