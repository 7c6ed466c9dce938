/**
 * @file test_horizon_tracker.cpp
 * @brief Tests for the classic and vectorized horizon trackers
 */

#include "test_common.hpp"
#include <skyline/horizon_tracker.hpp>
#include <opencv2/core.hpp>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

using namespace skyline;
using skyline_test::TestReport;
using skyline_test::edgeMapFromRows;
using skyline_test::skyGroundFrame;

namespace {

TrackerParameters params(int threshold, TrackerVariant variant) {
    TrackerParameters p;
    p.line_jump_threshold = threshold;
    p.variant = variant;
    return p;
}

const TrackerVariant VARIANTS[] = {TrackerVariant::CLASSIC, TrackerVariant::VECTORIZED};

/// Every column after the anchor is known and moves by at most threshold
bool isContinuous(const HorizonLine& line, int threshold) {
    int anchor = firstAnchorColumn(line);
    if (anchor < 0) return true;
    for (size_t col = anchor + 1; col < line.size(); ++col) {
        if (line[col] == UNKNOWN_HEIGHT) return false;
        if (std::abs(line[col] - line[col - 1]) > threshold) return false;
    }
    return true;
}

void testReferenceExample(TestReport& report) {
    report.section("10x4 reference edge map");

    // One edge per column, rows counted from the top
    cv::Mat edges = edgeMapFromRows({1, 1, 1, 2, 2, 1, 1, 3, 1, 1}, 4);

    // Row 2 -> row 1 is a jump of one (accepted), row 1 -> row 3 is two (rejected)
    const HorizonLine expected = {3, 3, 3, 2, 2, 3, 3, 3, 3, 3};

    for (TrackerVariant variant : VARIANTS) {
        HorizonResult result = trackHorizon(edges, params(1, variant));
        report.expect(result.is_valid, toString(variant) + ": result valid");
        report.expectEqual(result.line, expected, toString(variant) + ": heights match");
        report.expectEqual(result.image_height, 4, toString(variant) + ": height recorded");
    }
}

void testLengthAndDegenerateInput(TestReport& report) {
    report.section("Length and degenerate maps");

    cv::Mat edges = cv::Mat::zeros(7, 13, CV_8UC1);
    edges.at<uchar>(3, 5) = 255;
    for (TrackerVariant variant : VARIANTS) {
        HorizonResult result = trackHorizon(edges, params(2, variant));
        report.expectEqual(result.line.size(), size_t(13), toString(variant) + ": one value per column");
    }

    HorizonResult empty = trackHorizon(cv::Mat(), params(5, TrackerVariant::CLASSIC));
    report.expect(!empty.is_valid, "empty map is invalid");
    report.expect(empty.error == TrackError::DEGENERATE_EDGE_MAP, "empty map reports DEGENERATE_EDGE_MAP");
    report.expect(empty.line.empty(), "empty map gives empty line");

    HorizonResult zero_width = trackHorizon(cv::Mat(5, 0, CV_8UC1), params(5, TrackerVariant::VECTORIZED));
    report.expect(!zero_width.is_valid && zero_width.line.empty(), "zero-width map gives invalid empty result");

    HorizonResult color = trackHorizon(cv::Mat::zeros(4, 4, CV_8UC3), params(5, TrackerVariant::CLASSIC));
    report.expect(color.error == TrackError::UNSUPPORTED_FORMAT, "three-channel map is rejected");

    cv::Mat no_edges = cv::Mat::zeros(6, 9, CV_8UC1);
    for (TrackerVariant variant : VARIANTS) {
        HorizonResult result = trackHorizon(no_edges, params(3, variant));
        report.expectEqual(result.line, HorizonLine(9, UNKNOWN_HEIGHT),
                           toString(variant) + ": no edges leaves every column unknown");
    }
}

void testBootstrap(TestReport& report) {
    report.section("Anchor bootstrap");

    // Columns 0-2 empty, first edge in column 3 at row 4 of 10
    cv::Mat edges = edgeMapFromRows({-1, -1, -1, 4, 5, -1, 5}, 10);
    edges.at<uchar>(8, 3) = 255;  // lower edge in the anchor column must be ignored

    for (TrackerVariant variant : VARIANTS) {
        HorizonLine line = trackHorizon(edges, params(2, variant)).line;
        report.expectEqual(firstAnchorColumn(line), 3, toString(variant) + ": anchor at column 3");
        report.expect(line[0] == UNKNOWN_HEIGHT && line[1] == UNKNOWN_HEIGHT && line[2] == UNKNOWN_HEIGHT,
                      toString(variant) + ": columns before anchor are unknown");
        report.expectEqual(line[3], 10 - 4, toString(variant) + ": anchor is height minus top edge row");
        report.expectEqual(line[5], line[4], toString(variant) + ": empty column carries previous height");
        report.expect(isContinuous(line, 2), toString(variant) + ": continuous after anchor");
    }
}

void testTieBreak(TestReport& report) {
    report.section("Tie-break between up and down");

    const int height = 21;
    const int threshold = 5;
    cv::Mat edges = cv::Mat::zeros(height, 2, CV_8UC1);
    edges.at<uchar>(10, 0) = 255;   // anchor: P = 11
    edges.at<uchar>(5, 1) = 255;    // up:   16 (distance 5)
    edges.at<uchar>(15, 1) = 255;   // down:  6 (distance 5)

    HorizonLine line = trackHorizon(edges, params(threshold, TrackerVariant::CLASSIC)).line;
    report.expectEqual(line[0], 11, "anchor height");
    report.expectEqual(line[1], 16, "equal distances resolve upward");

    // Slightly closer below wins
    edges.at<uchar>(15, 1) = 0;
    edges.at<uchar>(14, 1) = 255;   // down: 7 (distance 4)
    line = trackHorizon(edges, params(threshold, TrackerVariant::CLASSIC)).line;
    report.expectEqual(line[1], 7, "closer edge below wins");
}

void testJumpThreshold(TestReport& report) {
    report.section("Jump threshold");

    // Horizon at row 10, one column jumps to row 2
    cv::Mat edges = edgeMapFromRows({10, 10, 2, 10, 11, 12}, 20);

    for (TrackerVariant variant : VARIANTS) {
        HorizonLine line = trackHorizon(edges, params(3, variant)).line;
        report.expectEqual(line, HorizonLine({10, 10, 10, 10, 9, 8}),
                           toString(variant) + ": outlier rejected, slow drift tracked");
    }

    // Threshold 0 only accepts edges exactly at the previous height
    HorizonLine frozen = trackHorizon(edges, params(0, TrackerVariant::CLASSIC)).line;
    report.expectEqual(frozen, HorizonLine(6, 10), "threshold 0 freezes at the anchor");

    // Anchor at height 8, next column only has an edge below it
    cv::Mat below = edgeMapFromRows({2, 5}, 10);
    const int huge = std::numeric_limits<int>::max();
    for (TrackerVariant variant : VARIANTS) {
        HorizonLine line = trackHorizon(below, params(huge, variant)).line;
        report.expectEqual(line, HorizonLine({8, 5}), toString(variant) + ": INT_MAX threshold accepts the edge below");
    }

    for (TrackerVariant variant : VARIANTS) {
        HorizonLine line = trackHorizon(below, params(-4, variant)).line;
        report.expectEqual(line, HorizonLine({8, 8}), toString(variant) + ": negative threshold rejects every move");
    }
}

void testVariantsDiffer(TestReport& report) {
    report.section("Classic vs vectorized");

    // Horizon at row 10 everywhere; column 2 also has a weaker edge two rows higher
    cv::Mat edges = edgeMapFromRows({10, 10, 10, 10, 10}, 20);
    edges.at<uchar>(8, 2) = 255;

    HorizonLine classic = trackHorizon(edges, params(3, TrackerVariant::CLASSIC)).line;
    HorizonLine vectorized = trackHorizon(edges, params(3, TrackerVariant::VECTORIZED)).line;

    report.expectEqual(classic, HorizonLine(5, 10), "classic stays on the nearest edge");
    report.expectEqual(vectorized, HorizonLine({10, 10, 12, 10, 10}), "vectorized follows the top-most edge");
}

void testRandomMapsAreContinuous(TestReport& report) {
    report.section("Continuity and idempotence on random maps");

    cv::RNG rng(12345);
    bool all_continuous = true;
    bool all_idempotent = true;
    bool all_sized = true;

    for (int trial = 0; trial < 20; ++trial) {
        int height = rng.uniform(5, 80);
        int width = rng.uniform(1, 120);
        int threshold = rng.uniform(1, 15);

        cv::Mat noise(height, width, CV_8UC1);
        rng.fill(noise, cv::RNG::UNIFORM, cv::Scalar(0), cv::Scalar(100));
        cv::Mat edges = noise > 93;   // roughly 6% edge pixels

        for (TrackerVariant variant : VARIANTS) {
            TrackerParameters p = params(threshold, variant);
            HorizonLine first = trackHorizon(edges, p).line;
            HorizonLine second = trackHorizon(edges, p).line;

            all_sized = all_sized && (first.size() == static_cast<size_t>(width));
            all_idempotent = all_idempotent && (first == second);
            all_continuous = all_continuous && isContinuous(first, threshold);
        }
    }

    report.expect(all_sized, "length always equals width");
    report.expect(all_idempotent, "same map and parameters give the same line");
    report.expect(all_continuous, "adjacent heights never jump past the threshold");
}

void testFirstEdgeHeights(TestReport& report) {
    report.section("First edge heights");

    cv::Mat edges = edgeMapFromRows({0, -1, 5, 2}, 6);
    edges.at<uchar>(4, 3) = 255;   // below the top-most edge, ignored

    report.expectEqual(firstEdgeHeights(edges), std::vector<int>({6, UNKNOWN_HEIGHT, 1, 4}),
                       "top-most edge per column as height from bottom");

    cv::Mat as_float;
    edges.convertTo(as_float, CV_32F, 1.0 / 255.0);
    report.expectEqual(trackHorizon(as_float, params(10, TrackerVariant::CLASSIC)).line,
                       trackHorizon(edges, params(10, TrackerVariant::CLASSIC)).line,
                       "non-8-bit map is binarized");
}

void testLineHelpers(TestReport& report) {
    report.section("Line helpers");

    HorizonLine line = {UNKNOWN_HEIGHT, UNKNOWN_HEIGHT, 7, 8};
    report.expectEqual(firstAnchorColumn(line), 2, "first anchor column");
    report.expectEqual(firstAnchorColumn(HorizonLine(4, UNKNOWN_HEIGHT)), -1, "no anchor");

    std::vector<cv::Point> points = toImagePoints(line, 10);
    report.expectEqual(points.size(), size_t(2), "unknown columns skipped");
    report.expect(points.size() == 2 && points[0] == cv::Point(2, 3) && points[1] == cv::Point(3, 2),
                  "heights converted back to image rows");
}

void testTrackFrame(TestReport& report) {
    report.section("Frame pipeline");

    const int width = 100, height = 60, boundary = 40;
    cv::Mat frame = skyGroundFrame(width, height, boundary);

    for (TrackerVariant variant : VARIANTS) {
        HorizonResult result = trackFrame(frame, DetectorParameters(), params(15, variant));
        report.expect(result.is_valid, toString(variant) + ": " + result.toString());
        report.expect(result.knownColumns() >= width - 2, toString(variant) + ": line spans the frame");

        bool near_boundary = true;
        for (int h : result.line) {
            near_boundary = near_boundary && std::abs(h - (height - boundary)) <= 2;
        }
        report.expect(near_boundary, toString(variant) + ": line follows the sky/ground boundary");
    }

    HorizonResult empty = trackFrame(cv::Mat(), DetectorParameters(), TrackerParameters());
    report.expect(!empty.is_valid && empty.error == TrackError::EMPTY_FRAME, "empty frame surfaces EMPTY_FRAME");

    HorizonResult missing = trackImageFile("/nonexistent/skyline.png", DetectorParameters(), TrackerParameters());
    report.expect(!missing.is_valid && missing.error == TrackError::EMPTY_FRAME,
                  "unreadable image file surfaces EMPTY_FRAME");
    report.expect(!missing.message.empty(), "failure carries a message");
}

} // namespace

int main() {
    TestReport report("HORIZON TRACKER");

    testReferenceExample(report);
    testLengthAndDegenerateInput(report);
    testBootstrap(report);
    testTieBreak(report);
    testJumpThreshold(report);
    testVariantsDiffer(report);
    testRandomMapsAreContinuous(report);
    testFirstEdgeHeights(report);
    testLineHelpers(report);
    testTrackFrame(report);

    return report.summary();
}
