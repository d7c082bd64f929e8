#include "landmark_frame.hpp"
#include <algorithm>
#include <sstream>

namespace engagement {

LandmarkLayout LandmarkLayout::mediaPipe478() {
    LandmarkLayout layout;
    layout.name = "mediapipe478";
    layout.point_count = 478;
    layout.left_eye = {33, 160, 158, 133, 153, 144};
    layout.right_eye = {362, 385, 387, 263, 373, 380};
    layout.left_eye_outer = 33;
    layout.right_eye_outer = 263;
    layout.nose_tip = 4;
    layout.left_cheek = 234;
    layout.right_cheek = 454;
    layout.forehead = 10;
    layout.chin = 152;
    return layout;
}

LandmarkLayout LandmarkLayout::dlib68() {
    LandmarkLayout layout;
    layout.name = "dlib68";
    layout.point_count = 68;
    layout.left_eye = {36, 37, 38, 39, 40, 41};
    layout.right_eye = {45, 44, 43, 42, 47, 46};
    layout.left_eye_outer = 36;
    layout.right_eye_outer = 45;
    layout.nose_tip = 30;
    layout.left_cheek = 1;
    layout.right_cheek = 15;
    // No forehead point in the 68-point model; top of the nose bridge is the
    // highest midline landmark.
    layout.forehead = 27;
    layout.chin = 8;
    return layout;
}

LandmarkLayout LandmarkLayout::fromName(const std::string& name) {
    if (name == "mediapipe478") return mediaPipe478();
    if (name == "dlib68") return dlib68();
    throw std::invalid_argument("Unknown landmark layout: " + name);
}

int LandmarkLayout::maxAnchorIndex() const {
    int max_index = std::max({left_eye_outer, right_eye_outer, nose_tip,
                              left_cheek, right_cheek, forehead, chin});
    for (int i : left_eye) max_index = std::max(max_index, i);
    for (int i : right_eye) max_index = std::max(max_index, i);
    return max_index;
}

bool LandmarkLayout::operator==(const LandmarkLayout& other) const {
    return name == other.name && point_count == other.point_count &&
           left_eye == other.left_eye && right_eye == other.right_eye &&
           left_eye_outer == other.left_eye_outer && right_eye_outer == other.right_eye_outer &&
           nose_tip == other.nose_tip && left_cheek == other.left_cheek &&
           right_cheek == other.right_cheek && forehead == other.forehead &&
           chin == other.chin;
}

LandmarkFrame::LandmarkFrame(std::vector<cv::Point2f> points, const LandmarkLayout& layout)
    : points_(std::move(points)), layout_(layout) {
    if (points_.size() != layout_.point_count) {
        std::ostringstream oss;
        oss << "Landmark count mismatch for layout " << layout_.name
            << ": expected " << layout_.point_count << ", got " << points_.size();
        throw LandmarkContractError(oss.str());
    }
    if (layout_.maxAnchorIndex() >= static_cast<int>(points_.size())) {
        throw LandmarkContractError("Layout " + layout_.name + " references an index beyond its point count");
    }
}

LandmarkFrame LandmarkFrame::fromNormalized(const std::vector<cv::Point2f>& normalized,
                                            int frame_width, int frame_height,
                                            const LandmarkLayout& layout) {
    if (frame_width <= 0 || frame_height <= 0) {
        throw LandmarkContractError("Frame size must be positive to scale normalized landmarks");
    }

    std::vector<cv::Point2f> pixels;
    pixels.reserve(normalized.size());
    for (const auto& p : normalized) {
        pixels.emplace_back(p.x * static_cast<float>(frame_width),
                            p.y * static_cast<float>(frame_height));
    }
    return LandmarkFrame(std::move(pixels), layout);
}

} // namespace engagement
