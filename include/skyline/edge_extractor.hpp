/**
 * @file edge_extractor.hpp
 * @brief Frame to binary edge map conversion
 */

#pragma once

#include "config.hpp"
#include "data_types.hpp"
#include <opencv2/core.hpp>

namespace skyline {

/**
 * @brief Run Canny edge detection on a color or grayscale frame
 *
 * Color input is reduced to luma first; grayscale passes through. Invalid
 * aperture sizes are clamped to 3. Never throws for bad input: an empty or
 * unconvertible frame yields an EdgeMap with is_valid == false.
 *
 * @param frame BGR, BGRA or single-channel image
 * @param params Detector thresholds, aperture and gradient norm
 * @return EdgeMap with a CV_8UC1 edge image of the frame's size
 */
EdgeMap extractEdges(const cv::Mat& frame, const DetectorParameters& params);

/**
 * @brief Map an aperture size onto {3, 5, 7}; anything else becomes 3
 */
int clampApertureSize(int aperture_size);

/**
 * @brief Convert a frame to 8-bit single-channel intensity
 *
 * @return false if the channel layout is not supported
 */
bool toGrayscale(const cv::Mat& frame, cv::Mat& gray);

} // namespace skyline
