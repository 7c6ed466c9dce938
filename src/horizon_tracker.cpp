/**
 * @file horizon_tracker.cpp
 * @brief Implementation of the classic and vectorized horizon trackers
 */

#include "skyline/horizon_tracker.hpp"
#include "skyline/edge_extractor.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cstdlib>

namespace skyline {

namespace {

/// Row of the first edge scanning top-down, -1 if the column has none
int firstEdgeRow(const cv::Mat& edges, int col) {
    for (int row = 0; row < edges.rows; ++row) {
        if (edges.ptr<uchar>(row)[col] != 0) {
            return row;
        }
    }
    return -1;
}

/// Accept candidate if within threshold of prev, otherwise keep prev
int applyJumpThreshold(int prev, int candidate, int line_jump_threshold) {
    if (candidate != UNKNOWN_HEIGHT && std::abs(prev - candidate) <= line_jump_threshold) {
        return candidate;
    }
    return prev;
}

} // namespace

// =============================================================================
// CLASSIC
// =============================================================================

HorizonLine trackClassic(const cv::Mat& edges, int line_jump_threshold) {
    const int height = edges.rows;
    const int width = edges.cols;
    HorizonLine line(width, UNKNOWN_HEIGHT);

    int prev = UNKNOWN_HEIGHT;
    for (int col = 0; col < width; ++col) {
        // No anchor yet: take the highest edge in this column
        if (prev == UNKNOWN_HEIGHT) {
            int row = firstEdgeRow(edges, col);
            if (row >= 0) {
                prev = height - row;
                line[col] = prev;
            }
            continue;
        }

        // prev is in [1, height], so its row is inside the image
        const int prev_row = height - prev;

        // Edges farther than the threshold can never be accepted, and a
        // closer edge on the other side would win anyway. The window is
        // limited to the image before adding, so huge thresholds cannot overflow.
        const int reach = std::max(0, std::min(line_jump_threshold, height));
        const int top_row = std::max(0, prev_row - reach);
        const int bottom_row = std::min(height - 1, prev_row + reach);

        int up = UNKNOWN_HEIGHT;
        for (int row = prev_row; row >= top_row; --row) {
            if (edges.ptr<uchar>(row)[col] != 0) {
                up = height - row;
                break;
            }
        }

        int down = UNKNOWN_HEIGHT;
        for (int row = prev_row; row <= bottom_row; ++row) {
            if (edges.ptr<uchar>(row)[col] != 0) {
                down = height - row;
                break;
            }
        }

        int candidate = UNKNOWN_HEIGHT;
        if (up != UNKNOWN_HEIGHT && down != UNKNOWN_HEIGHT) {
            candidate = (std::abs(prev - up) <= std::abs(prev - down)) ? up : down;
        } else if (up != UNKNOWN_HEIGHT) {
            candidate = up;
        } else {
            candidate = down;
        }

        prev = applyJumpThreshold(prev, candidate, line_jump_threshold);
        line[col] = prev;
    }

    return line;
}

// =============================================================================
// VECTORIZED
// =============================================================================

std::vector<int> firstEdgeHeights(const cv::Mat& edges) {
    const int height = edges.rows;
    const int width = edges.cols;
    std::vector<int> heights(width, UNKNOWN_HEIGHT);
    if (height == 0 || width == 0) {
        return heights;
    }

    // Row index per pixel, pushed past the image where there is no edge.
    // Floats are exact for any realistic image height.
    cv::Mat ramp(height, 1, CV_32F);
    for (int row = 0; row < height; ++row) {
        ramp.at<float>(row) = static_cast<float>(row);
    }
    cv::Mat row_index;
    cv::repeat(ramp, 1, width, row_index);
    row_index.setTo(cv::Scalar(static_cast<double>(height)), edges == 0);

    cv::Mat first_row;
    cv::reduce(row_index, first_row, 0, cv::REDUCE_MIN, CV_32F);

    const float* first = first_row.ptr<float>(0);
    for (int col = 0; col < width; ++col) {
        int row = static_cast<int>(first[col]);
        if (row < height) {
            heights[col] = height - row;
        }
    }
    return heights;
}

HorizonLine trackVectorized(const cv::Mat& edges, int line_jump_threshold) {
    const std::vector<int> candidates = firstEdgeHeights(edges);
    HorizonLine line(candidates.size(), UNKNOWN_HEIGHT);

    int prev = UNKNOWN_HEIGHT;
    for (size_t col = 0; col < candidates.size(); ++col) {
        if (prev == UNKNOWN_HEIGHT) {
            prev = candidates[col];
        } else {
            prev = applyJumpThreshold(prev, candidates[col], line_jump_threshold);
        }
        line[col] = prev;
    }
    return line;
}

// =============================================================================
// PUBLIC ENTRY POINTS
// =============================================================================

HorizonResult trackHorizon(const cv::Mat& edges, const TrackerParameters& params) {
    HorizonResult result;
    result.image_width = edges.cols;
    result.image_height = edges.rows;

    if (edges.empty() || edges.rows <= 0 || edges.cols <= 0) {
        result.error = TrackError::DEGENERATE_EDGE_MAP;
        result.message = "Edge map has zero width or height";
        return result;
    }
    if (edges.channels() != 1) {
        result.error = TrackError::UNSUPPORTED_FORMAT;
        result.message = "Edge map must be single-channel";
        return result;
    }

    cv::Mat binary = edges;
    if (edges.depth() != CV_8U) {
        binary = edges != 0;
    }

    switch (params.variant) {
        case TrackerVariant::VECTORIZED:
            result.line = trackVectorized(binary, params.line_jump_threshold);
            break;
        case TrackerVariant::CLASSIC:
        default:
            result.line = trackClassic(binary, params.line_jump_threshold);
            break;
    }

    result.is_valid = true;
    return result;
}

HorizonResult trackFrame(
    const cv::Mat& frame,
    const DetectorParameters& detector,
    const TrackerParameters& tracker
) {
    EdgeMap edges = extractEdges(frame, detector);
    if (!edges.is_valid) {
        HorizonResult result;
        result.image_width = frame.cols;
        result.image_height = frame.rows;
        result.error = edges.error;
        result.message = edges.message;
        return result;
    }
    return trackHorizon(edges.edges, tracker);
}

HorizonResult trackImageFile(
    const std::string& path,
    const DetectorParameters& detector,
    const TrackerParameters& tracker
) {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        HorizonResult result;
        result.error = TrackError::EMPTY_FRAME;
        result.message = "Could not read image: " + path;
        return result;
    }
    return trackFrame(image, detector, tracker);
}

// =============================================================================
// LINE HELPERS
// =============================================================================

int firstAnchorColumn(const HorizonLine& line) {
    for (size_t col = 0; col < line.size(); ++col) {
        if (line[col] != UNKNOWN_HEIGHT) {
            return static_cast<int>(col);
        }
    }
    return -1;
}

std::vector<cv::Point> toImagePoints(const HorizonLine& line, int image_height) {
    std::vector<cv::Point> points;
    points.reserve(line.size());
    for (size_t col = 0; col < line.size(); ++col) {
        if (line[col] != UNKNOWN_HEIGHT) {
            points.emplace_back(static_cast<int>(col), image_height - line[col]);
        }
    }
    return points;
}

} // namespace skyline
