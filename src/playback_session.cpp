/**
 * @file playback_session.cpp
 * @brief Implementation of PlaybackSession
 */

#include "skyline/playback_session.hpp"
#include "skyline/horizon_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>
#include <utility>

namespace skyline {

PlaybackSession::PlaybackSession(const Config& config)
    : PlaybackSession(config, FrameProcessor()) {
}

PlaybackSession::PlaybackSession(const Config& config, FrameProcessor processor)
    : config_(config), processor_(std::move(processor)) {

    if (!processor_) {
        processor_ = [](const cv::Mat& frame,
                        const DetectorParameters& detector,
                        const TrackerParameters& tracker) {
            return trackFrame(frame, detector, tracker);
        };
    }

    std::lock_guard<std::mutex> lock(params_mutex_);
    recomputeStrideLocked();
}

PlaybackSession::~PlaybackSession() {
    stop();
}

// =============================================================================
// TIMING
// =============================================================================

double PlaybackSession::computeTimerFrameRate(double native_fps, double display_fps_cap) {
    double rate = display_fps_cap;
    if (native_fps > 0.0 && (rate <= 0.0 || native_fps < rate)) {
        rate = native_fps;
    }
    return rate > 0.0 ? rate : DEFAULT_FRAME_RATE;
}

int PlaybackSession::computeStride(double native_fps, double display_fps_cap, double processing_fps) {
    if (!(processing_fps > 0.0)) {
        return 1;
    }
    double timer_fps = computeTimerFrameRate(native_fps, display_fps_cap);
    long stride = std::lround(timer_fps / processing_fps);
    return static_cast<int>(std::max(1L, stride));
}

void PlaybackSession::recomputeStrideLocked() {
    const PlaybackParameters& playback = config_.playback;
    stride_ = computeStride(native_fps_, playback.display_fps_cap, playback.processing_fps);
    timer_interval_ms_ = 1000.0 / computeTimerFrameRate(native_fps_, playback.display_fps_cap);
}

void PlaybackSession::armTimer(bool immediate) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::milli>(timer_interval_ms_));
    next_deadline_ = immediate ? Clock::now() : Clock::now() + period;
    timer_armed_ = true;
}

void PlaybackSession::disarmTimer() {
    std::lock_guard<std::mutex> lock(params_mutex_);
    timer_armed_ = false;
}

void PlaybackSession::resetTiming() {
    next_index_ = 0;
    frame_counter_ = 0;
    eos_pending_ = false;

    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        current_index_ = -1;
        total_frames_ = source_ ? source_->frameCount() : 0;
        cached_line_.clear();
        rendered_line_.clear();
        rendered_source_ = LineSource::NONE;
        frames_emitted_ = 0;
        fallback_count_ = 0;

        display_meter_.reset();
        processing_meter_.reset();
    }
    disarmTimer();
}

PlaybackSession::ParameterSnapshot PlaybackSession::snapshot() const {
    std::lock_guard<std::mutex> lock(params_mutex_);
    ParameterSnapshot params;
    params.detector = config_.detector;
    params.tracker = config_.tracker;
    params.stride = stride_;
    return params;
}

// =============================================================================
// SESSION LIFECYCLE
// =============================================================================

bool PlaybackSession::open(std::unique_ptr<FrameSource> source) {
    if (!source || !source->isOpened()) {
        std::cerr << "[PlaybackSession] Cannot open source: "
                  << (source ? source->description() : std::string("null")) << "\n";
        return false;
    }

    stop();
    source_ = std::move(source);

    {
        std::lock_guard<std::mutex> lock(params_mutex_);
        native_fps_ = source_->nativeFrameRate();
        recomputeStrideLocked();
    }
    resetTiming();

    if (config_.verbose) {
        std::cout << "[PlaybackSession] Opened " << source_->description()
                  << ": " << source_->frameCount() << " frames @ " << source_->nativeFrameRate()
                  << " fps, timer " << timerIntervalMs() << " ms, stride " << stride() << "\n";
    }
    return true;
}

bool PlaybackSession::play() {
    PlaybackState current = state_.load();
    if (current == PlaybackState::PAUSED) {
        return resume();
    }
    if (current != PlaybackState::STOPPED || !source_) {
        return false;
    }
    state_ = PlaybackState::PLAYING;
    armTimer(true);
    return true;
}

bool PlaybackSession::pause() {
    PlaybackState expected = PlaybackState::PLAYING;
    if (!state_.compare_exchange_strong(expected, PlaybackState::PAUSED)) {
        return false;
    }
    disarmTimer();
    return true;
}

bool PlaybackSession::resume() {
    PlaybackState expected = PlaybackState::PAUSED;
    if (!state_.compare_exchange_strong(expected, PlaybackState::PLAYING)) {
        return false;
    }
    armTimer(true);
    return true;
}

bool PlaybackSession::togglePause() {
    if (state_.load() == PlaybackState::PLAYING) {
        return pause();
    }
    if (state_.load() == PlaybackState::PAUSED) {
        return resume();
    }
    return false;
}

void PlaybackSession::stop() {
    state_ = PlaybackState::STOPPED;
    disarmTimer();
    if (source_) {
        if (config_.verbose) {
            std::cout << "[PlaybackSession] Released " << source_->description() << "\n";
        }
        source_.reset();
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    total_frames_ = 0;
}

// =============================================================================
// NAVIGATION
// =============================================================================

bool PlaybackSession::seek(FrameIndex index) {
    PlaybackState current = state_.load();
    if (current == PlaybackState::STOPPED || !source_) {
        return false;
    }

    int total = source_->frameCount();
    if (index < 0 || (total > 0 && index >= total)) {
        return false;
    }
    if (!source_->seek(index)) {
        std::cerr << "[PlaybackSession] Seek to frame " << index << " failed\n";
        return false;
    }
    next_index_ = index;
    eos_pending_ = false;

    if (current == PlaybackState::PAUSED) {
        return advance(true) == TickOutcome::FRAME;
    }
    return true;
}

bool PlaybackSession::step() {
    if (state_.load() != PlaybackState::PAUSED || !source_) {
        return false;
    }
    return advance(true) == TickOutcome::FRAME;
}

// =============================================================================
// PARAMETERS
// =============================================================================

bool PlaybackSession::setProcessingFrameRate(double fps) {
    if (state_.load() == PlaybackState::STOPPED || !(fps > 0.0) || !std::isfinite(fps)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(params_mutex_);
        config_.playback.processing_fps = fps;
        recomputeStrideLocked();
    }
    if (state_.load() == PlaybackState::PLAYING) {
        armTimer(false);
    }
    if (config_.verbose) {
        std::cout << "[PlaybackSession] Processing fps " << fps << ", stride " << stride() << "\n";
    }
    return true;
}

bool PlaybackSession::setDisplayFrameRateCap(double fps) {
    if (state_.load() == PlaybackState::STOPPED || !(fps > 0.0) || !std::isfinite(fps)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(params_mutex_);
        config_.playback.display_fps_cap = fps;
        recomputeStrideLocked();
    }
    if (state_.load() == PlaybackState::PLAYING) {
        armTimer(false);
    }
    if (config_.verbose) {
        std::cout << "[PlaybackSession] Display cap " << fps << " fps, timer "
                  << timerIntervalMs() << " ms, stride " << stride() << "\n";
    }
    return true;
}

void PlaybackSession::setDetectorParameters(const DetectorParameters& params) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    config_.detector = params;
}

void PlaybackSession::setTrackerParameters(const TrackerParameters& params) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    config_.tracker = params;
}

void PlaybackSession::setSink(FrameSink sink) {
    sink_ = std::move(sink);
}

// =============================================================================
// EXECUTION
// =============================================================================

TickOutcome PlaybackSession::tick() {
    if (state_.load() != PlaybackState::PLAYING || !source_) {
        return TickOutcome::IDLE;
    }
    return advance(false);
}

TickOutcome PlaybackSession::advance(bool force_track) {
    const ParameterSnapshot params = snapshot();

    std::optional<cv::Mat> frame = source_->nextFrame();
    if (!frame) {
        handleEndOfStream();
        return TickOutcome::END_OF_STREAM;
    }
    eos_pending_ = false;

    FrameIndex index = next_index_++;
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        current_index_ = index;
    }
    bool track = force_track || (frame_counter_ % params.stride == 0);
    frame_counter_++;

    TickResult result;
    result.frame_index = index;
    result.frame = *frame;
    result.line = resolveLine(result.frame, params, track, result.source);
    emit(std::move(result));
    return TickOutcome::FRAME;
}

HorizonLine PlaybackSession::resolveLine(
    const cv::Mat& frame,
    const ParameterSnapshot& params,
    bool track,
    LineSource& source
) {
    // Only this thread writes cached_line_, so unlocked reads here are fine
    if (!track) {
        source = cached_line_.empty() ? LineSource::NONE : LineSource::CACHED;
        return cached_line_;
    }

    std::string failure;
    HorizonResult tracked;
    try {
        tracked = processor_(frame, params.detector, params.tracker);
        if (!tracked.is_valid) {
            failure = toString(tracked.error) + (tracked.message.empty() ? "" : ": " + tracked.message);
        } else if (tracked.line.size() != static_cast<size_t>(frame.cols)) {
            failure = "line has " + std::to_string(tracked.line.size()) +
                      " columns, frame has " + std::to_string(frame.cols);
        }
    } catch (const std::exception& e) {
        failure = std::string("exception: ") + e.what();
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (!failure.empty()) {
        fallback_count_++;
        std::cerr << "[PlaybackSession] Tracking failed on frame " << current_index_
                  << " (" << failure << "), reusing cached line\n";
        source = LineSource::FALLBACK;
        return cached_line_;
    }

    processing_meter_.addEvent();
    cached_line_ = std::move(tracked.line);
    source = LineSource::FRESH;
    return cached_line_;
}

void PlaybackSession::handleEndOfStream() {
    if (eos_pending_) {
        std::cerr << "[PlaybackSession] No frames after rewind, stopping\n";
        stop();
        return;
    }
    eos_pending_ = true;

    if (!source_->seek(0)) {
        std::cerr << "[PlaybackSession] Rewind failed, stopping\n";
        stop();
        return;
    }

    // Next frame bootstraps from scratch, like a freshly opened session
    next_index_ = 0;
    frame_counter_ = 0;
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        cached_line_.clear();
    }

    if (config_.verbose) {
        std::cout << "[PlaybackSession] End of stream, rewound to frame 0\n";
    }
}

void PlaybackSession::emit(TickResult&& result) {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        rendered_line_ = result.line;
        rendered_source_ = result.source;
        frames_emitted_++;
        display_meter_.addEvent();
    }

    // Sink runs unlocked so it can query getState()
    if (sink_) {
        sink_(result);
    }
}

long PlaybackSession::run(const std::function<bool()>& keep_running) {
    long emitted = 0;
    const auto poll = std::chrono::milliseconds(POLL_MS);

    while (keep_running()) {
        PlaybackState current = state_.load();
        if (current == PlaybackState::STOPPED) {
            break;
        }
        if (current == PlaybackState::PAUSED) {
            std::this_thread::sleep_for(poll);
            continue;
        }

        Clock::time_point deadline;
        {
            std::lock_guard<std::mutex> lock(params_mutex_);
            if (!timer_armed_) {
                next_deadline_ = Clock::now();
                timer_armed_ = true;
            }
            deadline = next_deadline_;
        }

        // Sleep in short slices so pause/stop and re-arming are noticed
        auto now = Clock::now();
        if (now < deadline) {
            std::this_thread::sleep_for(std::min<Clock::duration>(deadline - now, poll));
            continue;
        }

        if (tick() == TickOutcome::FRAME) {
            emitted++;
        }

        // Next deadline is scheduled only after the tick has completed
        std::lock_guard<std::mutex> lock(params_mutex_);
        if (!timer_armed_) {
            continue;
        }
        auto period = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double, std::milli>(timer_interval_ms_));
        auto after = Clock::now();
        if (next_deadline_ > deadline) {
            // Re-armed during the tick
            continue;
        }
        if (after - next_deadline_ > period) {
            next_deadline_ = after + period;
        } else {
            next_deadline_ += period;
        }
    }

    return emitted;
}

// =============================================================================
// STATUS
// =============================================================================

int PlaybackSession::stride() const {
    std::lock_guard<std::mutex> lock(params_mutex_);
    return stride_;
}

double PlaybackSession::timerIntervalMs() const {
    std::lock_guard<std::mutex> lock(params_mutex_);
    return timer_interval_ms_;
}

HorizonLine PlaybackSession::cachedLine() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return cached_line_;
}

bool PlaybackSession::isTimerArmed() const {
    std::lock_guard<std::mutex> lock(params_mutex_);
    return timer_armed_;
}

PlaybackStatus PlaybackSession::getState() const {
    PlaybackStatus status;
    status.state = state_.load();
    status.is_paused = (status.state == PlaybackState::PAUSED);
    {
        std::lock_guard<std::mutex> lock(params_mutex_);
        status.native_fps = native_fps_;
        status.stride = stride_;
        status.timer_interval_ms = timer_interval_ms_;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    status.current_frame_index = current_index_;
    status.total_frames = total_frames_;
    status.display_fps = display_meter_.rate();
    status.processing_fps = processing_meter_.rate();
    status.rendered_line = rendered_line_;
    status.line_source = rendered_source_;
    status.frames_emitted = frames_emitted_;
    status.fallback_count = fallback_count_;
    return status;
}

} // namespace skyline
