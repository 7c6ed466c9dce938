/**
 * @file edge_extractor.cpp
 * @brief Implementation of Canny edge extraction
 */

#include "skyline/edge_extractor.hpp"
#include <opencv2/imgproc.hpp>

namespace skyline {

int clampApertureSize(int aperture_size) {
    if (aperture_size == 3 || aperture_size == 5 || aperture_size == 7) {
        return aperture_size;
    }
    return 3;
}

bool toGrayscale(const cv::Mat& frame, cv::Mat& gray) {
    cv::Mat single;
    switch (frame.channels()) {
        case 1:
            single = frame;
            break;
        case 3:
            cv::cvtColor(frame, single, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(frame, single, cv::COLOR_BGRA2GRAY);
            break;
        default:
            return false;
    }

    if (single.depth() == CV_8U) {
        gray = single;
        return true;
    }

    // Canny only accepts 8-bit input
    double scale = 1.0;
    if (single.depth() == CV_16U) {
        scale = 1.0 / 257.0;
    } else if (single.depth() == CV_32F || single.depth() == CV_64F) {
        scale = 255.0;  // float images are expected in [0, 1]
    }
    single.convertTo(gray, CV_8U, scale);
    return true;
}

EdgeMap extractEdges(const cv::Mat& frame, const DetectorParameters& params) {
    EdgeMap result;

    if (frame.empty()) {
        result.error = TrackError::EMPTY_FRAME;
        result.message = "Frame is empty";
        return result;
    }

    try {
        cv::Mat gray;
        if (!toGrayscale(frame, gray)) {
            result.error = TrackError::UNSUPPORTED_FORMAT;
            result.message = "Unsupported channel count: " + std::to_string(frame.channels());
            return result;
        }

        cv::Canny(
            gray,
            result.edges,
            params.lower_threshold,
            params.upper_threshold,
            clampApertureSize(params.aperture_size),
            params.use_l2_gradient
        );
    } catch (const cv::Exception& e) {
        result.edges.release();
        result.error = TrackError::DETECTOR_FAILURE;
        result.message = e.what();
        return result;
    }

    result.is_valid = true;
    return result;
}

} // namespace skyline
