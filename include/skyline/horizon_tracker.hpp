/**
 * @file horizon_tracker.hpp
 * @brief Column-wise horizon line tracking on binary edge maps
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace skyline {

/**
 * @brief Track a horizon line across an edge map
 *
 * Produces one height-from-bottom value per column. Columns before the first
 * edge found (the anchor) stay UNKNOWN_HEIGHT; every column after it holds a
 * real value, since a column without an acceptable edge repeats the previous
 * one. Adjacent accepted heights never differ by more than
 * params.line_jump_threshold.
 *
 * Stateless: the previous position only lives for the duration of the call.
 *
 * @param edges Single-channel edge map, non-zero = edge
 * @param params Jump threshold and algorithm variant
 * @return Invalid result with an empty line if the map has zero width or height
 */
HorizonResult trackHorizon(const cv::Mat& edges, const TrackerParameters& params);

/**
 * @brief Edge extraction followed by horizon tracking
 */
HorizonResult trackFrame(
    const cv::Mat& frame,
    const DetectorParameters& detector,
    const TrackerParameters& tracker
);

/**
 * @brief Load an image from disk and track its horizon
 *
 * An unreadable file is reported as TrackError::EMPTY_FRAME.
 */
HorizonResult trackImageFile(
    const std::string& path,
    const DetectorParameters& detector,
    const TrackerParameters& tracker
);

/**
 * @brief Nearest-edge search around the previous column's position
 *
 * For each column after the anchor, looks for the closest edge above and
 * below the previous height (ties go up) and accepts it if it lies within
 * the jump threshold.
 *
 * @param edges CV_8UC1 edge map with non-zero size
 */
HorizonLine trackClassic(const cv::Mat& edges, int line_jump_threshold);

/**
 * @brief Top-most edge per column, filtered by the same continuity rule
 *
 * @param edges CV_8UC1 edge map with non-zero size
 */
HorizonLine trackVectorized(const cv::Mat& edges, int line_jump_threshold);

/**
 * @brief Height of the top-most edge in every column (UNKNOWN_HEIGHT if none)
 *
 * Computed for all columns at once with a column-wise min reduction.
 */
std::vector<int> firstEdgeHeights(const cv::Mat& edges);

/**
 * @brief Index of the first column with a known height, -1 if none
 */
int firstAnchorColumn(const HorizonLine& line);

/**
 * @brief Convert known heights back to top-down image coordinates
 *
 * Unknown columns are skipped. Useful for drawing the line with cv::polylines.
 */
std::vector<cv::Point> toImagePoints(const HorizonLine& line, int image_height);

} // namespace skyline
