/**
 * @file example_simple.cpp
 * @brief Simple example showing basic horizon tracker usage
 */

#include <skyline/horizon_tracker.hpp>
#include <skyline/playback_session.hpp>
#include <opencv2/opencv.hpp>
#include <iostream>
#include <cmath>
#include <memory>
#include <vector>

using namespace skyline;

int main(int argc, char* argv[]) {
    std::cout << "=== Skyline Horizon Tracker Simple Example ===" << std::endl;
    std::cout << std::endl;

    int width = 640, height = 360;

    // Create synthetic images (sky over a rolling ridge line)
    auto createTestImage = [](int frame_num, int w, int h) {
        cv::Mat img(h, w, CV_8UC3, cv::Scalar(235, 206, 135));
        std::vector<cv::Point> ground;
        for (int x = 0; x < w; x += 4) {
            double ridge = 0.55 * h + 20.0 * std::sin((x + frame_num * 6) / 60.0);
            ground.emplace_back(x, static_cast<int>(ridge));
        }
        ground.emplace_back(w - 1, ground.back().y);
        ground.emplace_back(w - 1, h - 1);
        ground.emplace_back(0, h - 1);
        cv::fillPoly(img, std::vector<std::vector<cv::Point>>{ground}, cv::Scalar(40, 90, 50));

        // Add some noise for realism
        cv::Mat noise(h, w, CV_8UC3);
        cv::randn(noise, cv::Scalar::all(0), cv::Scalar::all(4));
        cv::add(img, noise, img);
        return img;
    };

    Config config;
    config.tracker.line_jump_threshold = 10;
    std::cout << "Image size: " << width << "x" << height << std::endl;
    std::cout << "Canny thresholds: " << config.detector.lower_threshold
              << "/" << config.detector.upper_threshold << std::endl;
    std::cout << "Jump threshold: " << config.tracker.line_jump_threshold << " px" << std::endl;

    // PHASE 1: Single frame, both algorithms
    std::cout << "\n--- SINGLE FRAME ---" << std::endl;
    cv::Mat image = createTestImage(0, width, height);
    for (TrackerVariant variant : {TrackerVariant::CLASSIC, TrackerVariant::VECTORIZED}) {
        TrackerParameters tracker = config.tracker;
        tracker.variant = variant;

        HorizonResult result = trackFrame(image, config.detector, tracker);
        std::cout << toString(variant) << ": " << result.toString() << std::endl;
        if (result.is_valid && !result.line.empty()) {
            std::cout << "  height at left/center/right: " << result.line.front() << " / "
                      << result.line[result.line.size() / 2] << " / " << result.line.back() << std::endl;
        }
    }

    // PHASE 2: Playback with frame skipping
    std::cout << "\n--- PLAYBACK ---" << std::endl;
    std::vector<cv::Mat> frames;
    for (int i = 0; i < 30; i++) {
        frames.push_back(createTestImage(i, width, height));
    }

    PlaybackSession session(config);
    cv::Mat last_frame;
    HorizonLine last_line;
    session.setSink([&](const TickResult& tick) {
        if (tick.frame_index % 5 == 0) {
            std::cout << "Frame " << tick.frame_index << ": [" << toString(tick.source) << "] "
                      << "center height " << (tick.line.empty() ? UNKNOWN_HEIGHT : tick.line[tick.line.size() / 2])
                      << std::endl;
        }
        last_frame = tick.frame;
        last_line = tick.line;
    });

    session.open(std::make_unique<MemoryFrameSource>(std::move(frames), 30.0));
    session.play();
    for (int i = 0; i < 30; i++) {
        session.tick();
    }

    // Print final status
    std::cout << "\n--- FINAL STATUS ---" << std::endl;
    std::cout << session.getState().toString() << std::endl;

    // Optionally save the last frame with its line drawn in
    if (argc > 1 && !last_frame.empty()) {
        cv::Mat out = last_frame.clone();
        std::vector<cv::Point> points = toImagePoints(last_line, out.rows);
        if (points.size() >= 2) {
            cv::polylines(out, points, false, cv::Scalar(0, 0, 255), 2);
        }
        if (cv::imwrite(argv[1], out)) {
            std::cout << "Annotated frame written to " << argv[1] << std::endl;
        } else {
            std::cerr << "Could not write " << argv[1] << std::endl;
        }
    }
    session.stop();

    std::cout << "\n=== Example Complete ===" << std::endl;
    std::cout << "\nNote: This example uses synthetic images. Run test_video" << std::endl;
    std::cout << "with --video to track a real clip." << std::endl;

    return 0;
}
