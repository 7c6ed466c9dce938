/**
 * @file common.hpp
 * @brief Common types, enums, and utilities for horizon tracking
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace skyline {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Horizon tracking algorithm
 */
enum class TrackerVariant {
    CLASSIC,     ///< Per-column nearest edge search around previous position
    VECTORIZED   ///< Top-most edge per column + continuity filter
};

/**
 * @brief Playback session state
 */
enum class PlaybackState {
    STOPPED,  ///< No session running (source released or not started)
    PLAYING,  ///< Timer armed, frames pulled on every tick
    PAUSED    ///< Timer disarmed, explicit step/seek only
};

/**
 * @brief Where the line emitted for a frame came from
 */
enum class LineSource {
    NONE,      ///< Nothing to show yet
    FRESH,     ///< Tracked on this frame
    CACHED,    ///< Reused because the frame was skipped by the stride
    FALLBACK   ///< Tracking failed on this frame, last good line reused
};

/**
 * @brief Input error taxonomy for per-frame operations
 */
enum class TrackError {
    NONE,
    EMPTY_FRAME,           ///< Frame empty or unreadable
    UNSUPPORTED_FORMAT,    ///< Channel layout not convertible to intensity
    DEGENERATE_EDGE_MAP,   ///< Zero width or height
    DETECTOR_FAILURE       ///< OpenCV raised inside the edge detector
};

// ============================================================================
// String conversions
// ============================================================================

inline std::string toString(TrackerVariant variant) {
    switch (variant) {
        case TrackerVariant::CLASSIC: return "classic";
        case TrackerVariant::VECTORIZED: return "vectorized";
        default: return "unknown";
    }
}

inline std::string toString(PlaybackState state) {
    switch (state) {
        case PlaybackState::STOPPED: return "STOPPED";
        case PlaybackState::PLAYING: return "PLAYING";
        case PlaybackState::PAUSED: return "PAUSED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(LineSource source) {
    switch (source) {
        case LineSource::NONE: return "NONE";
        case LineSource::FRESH: return "FRESH";
        case LineSource::CACHED: return "CACHED";
        case LineSource::FALLBACK: return "FALLBACK";
        default: return "UNKNOWN";
    }
}

inline std::string toString(TrackError error) {
    switch (error) {
        case TrackError::NONE: return "NONE";
        case TrackError::EMPTY_FRAME: return "EMPTY_FRAME";
        case TrackError::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case TrackError::DEGENERATE_EDGE_MAP: return "DEGENERATE_EDGE_MAP";
        case TrackError::DETECTOR_FAILURE: return "DETECTOR_FAILURE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Type aliases for clarity
// ============================================================================

using FrameIndex = int32_t;

/// Height from the bottom of the frame, one entry per column
using HorizonLine = std::vector<int>;

/// Column value meaning "no horizon known here"
constexpr int UNKNOWN_HEIGHT = -1;

} // namespace skyline
