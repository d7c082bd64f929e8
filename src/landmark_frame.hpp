#ifndef LANDMARK_FRAME_HPP
#define LANDMARK_FRAME_HPP

#include <opencv2/core.hpp>
#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace engagement {

// Thrown when a landmark set does not honour the collaborator contract
// (wrong point count, wrong layout). Never a recoverable per-frame condition.
class LandmarkContractError : public std::runtime_error {
public:
    explicit LandmarkContractError(const std::string& message)
        : std::runtime_error(message) {}
};

// Anchor table: point count plus the reserved semantic indices.
// Eye sets are ordered p1..p6 where p1/p4 are the horizontal corners,
// p2/p3 the upper lid and p6/p5 the lower lid points facing them.
struct LandmarkLayout {
    std::string name;
    size_t point_count = 0;

    std::array<int, 6> left_eye{};
    std::array<int, 6> right_eye{};
    int left_eye_outer = 0;
    int right_eye_outer = 0;
    int nose_tip = 0;
    int left_cheek = 0;
    int right_cheek = 0;
    int forehead = 0;
    int chin = 0;

    // MediaPipe Face Landmarker (468 mesh + 10 iris points)
    static LandmarkLayout mediaPipe478();

    // dlib / iBUG 300-W 68-point model
    static LandmarkLayout dlib68();

    static LandmarkLayout fromName(const std::string& name);

    // Highest index the detectors dereference
    int maxAnchorIndex() const;

    bool operator==(const LandmarkLayout& other) const;
    bool operator!=(const LandmarkLayout& other) const { return !(*this == other); }
};

// One face's landmarks in pixel coordinates. Immutable after construction.
class LandmarkFrame {
public:
    // Pixel-space points. Throws LandmarkContractError on a count mismatch.
    LandmarkFrame(std::vector<cv::Point2f> points, const LandmarkLayout& layout);

    // Normalized [0,1] points scaled by the frame size, as delivered by a
    // landmark model.
    static LandmarkFrame fromNormalized(const std::vector<cv::Point2f>& normalized,
                                        int frame_width, int frame_height,
                                        const LandmarkLayout& layout);

    const cv::Point2f& operator[](int index) const { return points_[static_cast<size_t>(index)]; }
    const std::vector<cv::Point2f>& points() const { return points_; }
    size_t size() const { return points_.size(); }
    const LandmarkLayout& layout() const { return layout_; }

private:
    std::vector<cv::Point2f> points_;
    LandmarkLayout layout_;
};

} // namespace engagement

#endif // LANDMARK_FRAME_HPP
