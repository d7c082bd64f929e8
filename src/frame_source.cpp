#include "frame_source.hpp"
#include <filesystem>
#include <iostream>

namespace engagement {

VideoFrameSource::~VideoFrameSource() {
    release();
}

bool VideoFrameSource::openCamera(int index, int width, int height, int fps) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (!capture_.open(index)) {
            std::cerr << "[Session] Cannot open camera " << index << std::endl;
            return false;
        }
        capture_.set(cv::CAP_PROP_FRAME_WIDTH, width);
        capture_.set(cv::CAP_PROP_FRAME_HEIGHT, height);
        capture_.set(cv::CAP_PROP_FPS, fps);
        is_file_ = false;

        std::cout << "[Session] Camera " << index << " opened ("
                  << capture_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
                  << capture_.get(cv::CAP_PROP_FRAME_HEIGHT) << ")" << std::endl;
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "[Session] Error opening camera " << index << ": " << e.what() << std::endl;
        return false;
    }
}

bool VideoFrameSource::openFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (!std::filesystem::exists(path)) {
            std::cerr << "[Session] Video file not found: " << path << std::endl;
            return false;
        }

        if (!capture_.open(path)) {
            std::cerr << "[Session] Failed to open video file: " << path << std::endl;
            return false;
        }

        double fps = capture_.get(cv::CAP_PROP_FPS);
        int total_frames = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_COUNT));
        is_file_ = true;

        std::cout << "[Session] Video file opened: " << path
                  << " (" << total_frames << " frames, " << fps << " FPS)" << std::endl;
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "[Session] Error opening video file " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool VideoFrameSource::open(const SourceSpec& spec, int width, int height, int fps) {
    return spec.use_file ? openFile(spec.video_path) : openCamera(spec.camera_index, width, height, fps);
}

ReadStatus VideoFrameSource::read(cv::Mat& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!capture_.isOpened()) {
        return ReadStatus::CLOSED;
    }

    if (capture_.read(frame) && !frame.empty()) {
        return ReadStatus::OK;
    }

    // A file that stops yielding frames is done; a camera may recover
    return is_file_ ? ReadStatus::END_OF_STREAM : ReadStatus::FAILED;
}

bool VideoFrameSource::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capture_.isOpened();
}

void VideoFrameSource::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capture_.isOpened()) {
        capture_.release();
    }
}

} // namespace engagement
