/**
 * @file rate_meter.cpp
 * @brief Implementation of RateMeter
 */

#include "skyline/rate_meter.hpp"
#include <algorithm>
#include <cmath>

namespace skyline {

void RateMeter::addEvent(Clock::time_point now) {
    if (!has_last_) {
        last_event_ = now;
        has_last_ = true;
        return;
    }

    double interval = std::chrono::duration<double>(now - last_event_).count();
    last_event_ = now;
    if (!std::isfinite(interval) || interval < 0.0) {
        return;
    }

    if (samples_ == 0 || ema_interval_s_ <= 0.0) {
        ema_interval_s_ = interval;
        samples_ = 1;
        return;
    }

    double sample = std::clamp(interval,
                               ema_interval_s_ * SPIKE_MIN_RATIO,
                               ema_interval_s_ * SPIKE_MAX_RATIO);
    double alpha = (samples_ < RAMP_SAMPLES) ? ALPHA_FAST : ALPHA_STABLE;
    ema_interval_s_ = alpha * sample + (1.0 - alpha) * ema_interval_s_;
    samples_++;
}

double RateMeter::rate() const {
    if (samples_ == 0 || ema_interval_s_ <= 1e-9) {
        return 0.0;
    }
    return 1.0 / ema_interval_s_;
}

void RateMeter::reset() {
    has_last_ = false;
    ema_interval_s_ = 0.0;
    samples_ = 0;
}

} // namespace skyline
