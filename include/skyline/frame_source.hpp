/**
 * @file frame_source.hpp
 * @brief Frame stream abstraction consumed by the playback session
 */

#pragma once

#include "common.hpp"
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skyline {

/**
 * @brief Sequential source of frames with optional random access
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool isOpened() const = 0;

    /**
     * @brief Read the next frame
     * @return std::nullopt at end of stream
     */
    virtual std::optional<cv::Mat> nextFrame() = 0;

    /**
     * @brief Position the source so nextFrame() returns frame `index`
     */
    virtual bool seek(FrameIndex index) = 0;

    /// Total number of frames, 0 if unknown
    virtual int frameCount() const = 0;

    /// Frame rate the source was recorded at, 0 if unknown
    virtual double nativeFrameRate() const = 0;

    virtual std::string description() const = 0;
};

/**
 * @brief Video file or camera stream read through cv::VideoCapture
 */
class VideoFileSource : public FrameSource {
public:
    explicit VideoFileSource(const std::string& path);
    ~VideoFileSource() override;

    bool isOpened() const override { return cap_.isOpened(); }
    std::optional<cv::Mat> nextFrame() override;
    bool seek(FrameIndex index) override;
    int frameCount() const override { return frame_count_; }
    double nativeFrameRate() const override { return native_fps_; }
    std::string description() const override { return path_; }

private:
    std::string path_;
    cv::VideoCapture cap_;
    int frame_count_ = 0;
    double native_fps_ = 0.0;
};

/**
 * @brief Fixed list of frames held in memory (image sequences, tests)
 */
class MemoryFrameSource : public FrameSource {
public:
    MemoryFrameSource(std::vector<cv::Mat> frames, double fps);

    bool isOpened() const override { return true; }
    std::optional<cv::Mat> nextFrame() override;
    bool seek(FrameIndex index) override;
    int frameCount() const override { return static_cast<int>(frames_.size()); }
    double nativeFrameRate() const override { return fps_; }
    std::string description() const override;

private:
    std::vector<cv::Mat> frames_;
    double fps_;
    size_t position_ = 0;
};

/**
 * @brief Open a video file as a frame source
 * @return nullptr if the file cannot be opened
 */
std::unique_ptr<FrameSource> openVideoSource(const std::string& path);

} // namespace skyline
