/**
 * @file data_types.hpp
 * @brief Core data structures for edge maps, horizon results and playback
 */

#pragma once

#include "common.hpp"
#include <opencv2/core.hpp>
#include <cstdio>
#include <string>

namespace skyline {

/**
 * @brief Binary edge map derived from exactly one frame
 */
struct EdgeMap {
    cv::Mat edges;                        ///< CV_8UC1, non-zero = edge
    bool is_valid = false;
    TrackError error = TrackError::NONE;
    std::string message;
};

/**
 * @brief Result of tracking a horizon on one edge map or frame
 */
struct HorizonResult {
    HorizonLine line;         ///< One height per column, UNKNOWN_HEIGHT where undetected
    int image_width = 0;
    int image_height = 0;
    bool is_valid = false;
    TrackError error = TrackError::NONE;
    std::string message;

    /// Number of columns holding a real height
    int knownColumns() const {
        int n = 0;
        for (int h : line) {
            if (h != UNKNOWN_HEIGHT) n++;
        }
        return n;
    }

    std::string toString() const {
        char buffer[160];
        if (!is_valid) {
            snprintf(buffer, sizeof(buffer), "HorizonResult(invalid, error=%s)",
                     skyline::toString(error).c_str());
        } else {
            snprintf(buffer, sizeof(buffer), "HorizonResult(%dx%d, known=%d/%zu)",
                     image_width, image_height, knownColumns(), line.size());
        }
        return std::string(buffer);
    }
};

/**
 * @brief What a playback tick hands to the sink
 */
struct TickResult {
    FrameIndex frame_index = -1;
    cv::Mat frame;                        ///< Frame as read from the source
    HorizonLine line;                     ///< Line to draw over the frame (may be empty)
    LineSource source = LineSource::NONE;
};

/**
 * @brief Snapshot of a playback session
 */
struct PlaybackStatus {
    PlaybackState state = PlaybackState::STOPPED;
    FrameIndex current_frame_index = -1;
    int total_frames = 0;                 ///< 0 when the source cannot tell
    double native_fps = 0.0;
    double processing_fps = 0.0;          ///< Measured fresh tracking rate
    double display_fps = 0.0;             ///< Measured emitted frame rate
    bool is_paused = false;

    int stride = 1;
    double timer_interval_ms = 0.0;

    HorizonLine rendered_line;            ///< Line emitted with the last frame
    LineSource line_source = LineSource::NONE;

    long frames_emitted = 0;
    long fallback_count = 0;

    std::string toString() const {
        char buffer[200];
        snprintf(buffer, sizeof(buffer),
                 "Playback(%s, frame=%d/%d, native=%.1f, disp=%.1f, proc=%.1f, stride=%d, line=%s)",
                 skyline::toString(state).c_str(), current_frame_index, total_frames,
                 native_fps, display_fps, processing_fps, stride,
                 skyline::toString(line_source).c_str());
        return std::string(buffer);
    }
};

} // namespace skyline
