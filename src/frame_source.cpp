/**
 * @file frame_source.cpp
 * @brief Implementation of video and in-memory frame sources
 */

#include "skyline/frame_source.hpp"
#include <cmath>
#include <iostream>
#include <utility>

namespace skyline {

// =============================================================================
// VideoFileSource
// =============================================================================

VideoFileSource::VideoFileSource(const std::string& path) : path_(path) {
    try {
        cap_.open(path);
    } catch (const cv::Exception& e) {
        std::cerr << "[VideoFileSource] OpenCV error opening " << path << ": " << e.what() << "\n";
        return;
    }
    if (!cap_.isOpened()) {
        return;
    }

    double count = cap_.get(cv::CAP_PROP_FRAME_COUNT);
    frame_count_ = (std::isfinite(count) && count > 0) ? static_cast<int>(count) : 0;

    double fps = cap_.get(cv::CAP_PROP_FPS);
    native_fps_ = (std::isfinite(fps) && fps > 0) ? fps : 0.0;
}

VideoFileSource::~VideoFileSource() {
    cap_.release();
}

std::optional<cv::Mat> VideoFileSource::nextFrame() {
    cv::Mat frame;
    if (!cap_.isOpened() || !cap_.read(frame) || frame.empty()) {
        return std::nullopt;
    }
    return frame;
}

bool VideoFileSource::seek(FrameIndex index) {
    if (!cap_.isOpened() || index < 0) {
        return false;
    }
    if (frame_count_ > 0 && index >= frame_count_) {
        return false;
    }
    return cap_.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(index));
}

// =============================================================================
// MemoryFrameSource
// =============================================================================

MemoryFrameSource::MemoryFrameSource(std::vector<cv::Mat> frames, double fps)
    : frames_(std::move(frames)), fps_(fps) {
}

std::optional<cv::Mat> MemoryFrameSource::nextFrame() {
    if (position_ >= frames_.size()) {
        return std::nullopt;
    }
    // Sinks may draw on the frame; the stored copy must survive a rewind
    return frames_[position_++].clone();
}

bool MemoryFrameSource::seek(FrameIndex index) {
    if (index < 0 || static_cast<size_t>(index) >= frames_.size()) {
        return false;
    }
    position_ = static_cast<size_t>(index);
    return true;
}

std::string MemoryFrameSource::description() const {
    return "memory(" + std::to_string(frames_.size()) + " frames)";
}

// =============================================================================
// FACTORY
// =============================================================================

std::unique_ptr<FrameSource> openVideoSource(const std::string& path) {
    auto source = std::make_unique<VideoFileSource>(path);
    if (!source->isOpened()) {
        std::cerr << "[VideoFileSource] Could not open video: " << path << "\n";
        return nullptr;
    }
    return source;
}

} // namespace skyline
