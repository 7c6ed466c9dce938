/**
 * @file config.hpp
 * @brief Tunable parameters for edge extraction, tracking and playback
 */

#pragma once

#include "common.hpp"
#include <string>

namespace skyline {

/**
 * @brief Canny edge detector settings
 *
 * Changes take effect on the next extraction call only.
 */
struct DetectorParameters {
    double lower_threshold = 100.0;   ///< Hysteresis low threshold
    double upper_threshold = 200.0;   ///< Hysteresis high threshold
    int aperture_size = 3;            ///< Sobel kernel size, one of 3, 5, 7
    bool use_l2_gradient = false;     ///< L2 gradient magnitude (slower, more accurate)
};

/**
 * @brief Horizon continuity settings
 */
struct TrackerParameters {
    int line_jump_threshold = 15;     ///< Max vertical change between adjacent columns (pixels)
    TrackerVariant variant = TrackerVariant::CLASSIC;
};

/**
 * @brief Video cadence settings
 */
struct PlaybackParameters {
    double display_fps_cap = 30.0;    ///< Upper bound for the frame pull rate
    double processing_fps = 10.0;     ///< Desired tracking rate
};

/**
 * @brief System configuration with all tunable parameters
 */
struct Config {
    DetectorParameters detector;
    TrackerParameters tracker;
    PlaybackParameters playback;

    bool verbose = false;             ///< Print informational log lines
};

// ============================================================================
// Settings I/O (JSON)
// ============================================================================

/**
 * @brief Parse an algorithm name ("classic" / "vectorized", case-insensitive)
 *
 * @throws std::invalid_argument for unknown names
 */
TrackerVariant parseTrackerVariant(const std::string& name);

/**
 * @brief Merge a JSON settings document into an existing configuration
 *
 * Only keys present in the document are changed, so partial updates such as
 * {"horizon_line_params": {"line_jump_threshold": 30}} are valid.
 *
 * @throws std::invalid_argument on malformed JSON or wrongly typed values
 */
void applySettings(Config& config, const std::string& json_text);

/**
 * @brief Serialize the current parameters as a JSON document
 */
std::string settingsToJson(const Config& config, int indent = 2);

/**
 * @brief Load configuration from a JSON file on top of the defaults
 *
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument if its content is invalid
 */
Config loadConfig(const std::string& path);

/**
 * @brief Write configuration to a JSON file
 *
 * @throws std::runtime_error if the file cannot be written
 */
void saveConfig(const Config& config, const std::string& path);

} // namespace skyline
