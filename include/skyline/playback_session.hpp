/**
 * @file playback_session.hpp
 * @brief Real-time scheduling of horizon tracking over a frame stream
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "frame_source.hpp"
#include "rate_meter.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace skyline {

/// Tracking step run on selected frames (defaults to trackFrame)
using FrameProcessor = std::function<HorizonResult(
    const cv::Mat& frame,
    const DetectorParameters& detector,
    const TrackerParameters& tracker)>;

/// Receives every emitted (frame, line) pair
using FrameSink = std::function<void(const TickResult&)>;

/**
 * @brief Outcome of a single tick
 */
enum class TickOutcome {
    IDLE,           ///< Not playing, nothing read
    FRAME,          ///< A frame was emitted
    END_OF_STREAM   ///< Source exhausted, rewound to frame 0
};

/**
 * @brief One video session: source, cadence, and cached horizon line
 *
 * Pulls frames at min(display cap, native fps) and tracks only every
 * `stride`-th frame, so the tracker runs at roughly the requested
 * processing rate. Skipped frames reuse the cached line. A failed tracking
 * call never reaches the sink as an error: the cached line is emitted and
 * the frame is marked LineSource::FALLBACK.
 *
 * Example usage:
 * ```cpp
 * PlaybackSession session(config);
 * session.setSink([](const TickResult& r) { draw(r.frame, r.line); });
 * session.open(openVideoSource("clip.mp4"));
 * session.play();
 * session.run([] { return !quitRequested(); });
 * ```
 *
 * Ticks run on the thread calling tick()/run(). Parameter setters, pause(),
 * resume() and the status getters may be called from another thread;
 * parameters are picked up at the next tick. open(), stop(), seek() and
 * step() touch the source and belong on the tick thread.
 */
class PlaybackSession {
public:
    explicit PlaybackSession(const Config& config = Config());
    PlaybackSession(const Config& config, FrameProcessor processor);
    ~PlaybackSession();

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    // =========================================================================
    // SESSION LIFECYCLE
    // =========================================================================

    /**
     * @brief Load a new source and reset all timing state
     *
     * Any previous source is released. The session is left STOPPED; call
     * play() to start pulling frames.
     *
     * @return false if the source is null or not opened
     */
    bool open(std::unique_ptr<FrameSource> source);

    /// STOPPED -> PLAYING (needs a source); on PAUSED behaves like resume()
    bool play();

    /// PLAYING -> PAUSED
    bool pause();

    /// PAUSED -> PLAYING
    bool resume();

    bool togglePause();

    /// Any state -> STOPPED, releases the source
    void stop();

    // =========================================================================
    // NAVIGATION
    // =========================================================================

    /**
     * @brief Jump to a frame
     *
     * While paused the frame is read, tracked unconditionally and emitted.
     * While playing the next tick continues from `index`.
     *
     * @return false when stopped or index out of range
     */
    bool seek(FrameIndex index);

    /**
     * @brief Read, track and emit the next frame while paused
     */
    bool step();

    // =========================================================================
    // PARAMETERS
    // =========================================================================

    /// @return false when stopped or fps <= 0
    bool setProcessingFrameRate(double fps);

    /// @return false when stopped or fps <= 0
    bool setDisplayFrameRateCap(double fps);

    void setDetectorParameters(const DetectorParameters& params);
    void setTrackerParameters(const TrackerParameters& params);

    void setSink(FrameSink sink);

    // =========================================================================
    // EXECUTION
    // =========================================================================

    /**
     * @brief Pull one frame and emit it (PLAYING only)
     */
    TickOutcome tick();

    /**
     * @brief Cooperative timer loop on the calling thread
     *
     * Sleeps until the next deadline, ticks, then schedules the next
     * deadline. Returns when the session stops or keep_running() is false.
     *
     * @return Number of frames emitted during the loop
     */
    long run(const std::function<bool()>& keep_running);

    // =========================================================================
    // STATUS
    // =========================================================================

    PlaybackStatus getState() const;
    PlaybackState state() const { return state_.load(); }

    int stride() const;
    double timerIntervalMs() const;
    bool isTimerArmed() const;

    HorizonLine cachedLine() const;

    /**
     * @brief Frames the tracker should run on per native frame cadence
     *
     * stride = max(1, round(min(display_cap, native_fps) / processing_fps)).
     * A native_fps <= 0 (unknown) uses the display cap alone.
     */
    static int computeStride(double native_fps, double display_fps_cap, double processing_fps);

    /// Pull rate: min(display_cap, native_fps), or the cap if native is unknown
    static double computeTimerFrameRate(double native_fps, double display_fps_cap);

private:
    using Clock = std::chrono::steady_clock;

    struct ParameterSnapshot {
        DetectorParameters detector;
        TrackerParameters tracker;
        int stride = 1;
    };

    TickOutcome advance(bool force_track);
    HorizonLine resolveLine(const cv::Mat& frame, const ParameterSnapshot& params,
                            bool track, LineSource& source);
    void handleEndOfStream();
    void emit(TickResult&& result);
    void resetTiming();
    void recomputeStrideLocked();
    void armTimer(bool immediate);
    void disarmTimer();
    ParameterSnapshot snapshot() const;

    Config config_;
    FrameProcessor processor_;
    FrameSink sink_;

    std::unique_ptr<FrameSource> source_;
    std::atomic<PlaybackState> state_{PlaybackState::STOPPED};

    // Guarded by params_mutex_
    mutable std::mutex params_mutex_;
    double native_fps_ = 0.0;
    int stride_ = 1;
    double timer_interval_ms_ = 0.0;

    bool timer_armed_ = false;
    Clock::time_point next_deadline_{};

    // Stream position, tick thread only
    FrameIndex next_index_ = 0;
    long frame_counter_ = 0;
    bool eos_pending_ = false;

    // Output, written on the tick thread under output_mutex_
    mutable std::mutex output_mutex_;
    FrameIndex current_index_ = -1;
    int total_frames_ = 0;
    HorizonLine cached_line_;
    HorizonLine rendered_line_;
    LineSource rendered_source_ = LineSource::NONE;
    long frames_emitted_ = 0;
    long fallback_count_ = 0;

    RateMeter display_meter_;
    RateMeter processing_meter_;

    static constexpr int POLL_MS = 10;
    static constexpr double DEFAULT_FRAME_RATE = 30.0;
};

} // namespace skyline
