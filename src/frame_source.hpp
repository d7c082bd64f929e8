#ifndef FRAME_SOURCE_HPP
#define FRAME_SOURCE_HPP

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <mutex>
#include <string>

namespace engagement {

enum class ReadStatus {
    OK,
    FAILED,          // transient: skip and read again
    END_OF_STREAM,   // video file exhausted
    CLOSED           // released or lost
};

// Where frames come from: a camera index or a video file.
struct SourceSpec {
    bool use_file = false;
    std::string video_path;
    int camera_index = 0;

    static SourceSpec camera(int index) {
        SourceSpec spec;
        spec.camera_index = index;
        return spec;
    }

    static SourceSpec file(const std::string& path) {
        SourceSpec spec;
        spec.use_file = true;
        spec.video_path = path;
        return spec;
    }

    std::string describe() const {
        return use_file ? "video " + video_path : "camera " + std::to_string(camera_index);
    }
};

// A stream of BGR frames. read() and release() may be called from different
// threads.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual ReadStatus read(cv::Mat& frame) = 0;
    virtual bool isOpen() const = 0;
    virtual void release() = 0;
};

// cv::VideoCapture behind a mutex, so a stopping caller can release the device
// while the capture thread is still inside read().
class VideoFrameSource : public FrameSource {
public:
    VideoFrameSource() : is_file_(false) {}
    ~VideoFrameSource() override;

    bool openCamera(int index, int width, int height, int fps);
    bool openFile(const std::string& path);

    // Opens whichever source `spec` names
    bool open(const SourceSpec& spec, int width, int height, int fps);

    ReadStatus read(cv::Mat& frame) override;
    bool isOpen() const override;
    void release() override;

    bool isFile() const { return is_file_; }

private:
    mutable std::mutex mutex_;
    cv::VideoCapture capture_;
    bool is_file_;
};

} // namespace engagement

#endif // FRAME_SOURCE_HPP
