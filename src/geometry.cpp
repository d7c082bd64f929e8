#include "geometry.hpp"
#include <cmath>

namespace engagement {
namespace geometry {

double euclidean(const cv::Point2f& a, const cv::Point2f& b) {
    double dx = static_cast<double>(a.x) - static_cast<double>(b.x);
    double dy = static_cast<double>(a.y) - static_cast<double>(b.y);
    return std::sqrt(dx * dx + dy * dy);
}

double eyeAspectRatio(const std::array<cv::Point2f, 6>& eye) {
    double vertical_a = euclidean(eye[1], eye[5]);
    double vertical_b = euclidean(eye[2], eye[4]);
    double horizontal = euclidean(eye[0], eye[3]);
    if (horizontal < EPSILON) {
        return 0.0;
    }
    return (vertical_a + vertical_b) / (2.0 * horizontal);
}

std::array<cv::Point2f, 6> eyePoints(const LandmarkFrame& frame, const std::array<int, 6>& indices) {
    std::array<cv::Point2f, 6> eye;
    for (size_t i = 0; i < indices.size(); ++i) {
        eye[i] = frame[indices[i]];
    }
    return eye;
}

double rollAngle(const cv::Point2f& left_eye_outer, const cv::Point2f& right_eye_outer) {
    double dx = static_cast<double>(right_eye_outer.x) - static_cast<double>(left_eye_outer.x);
    double dy = static_cast<double>(right_eye_outer.y) - static_cast<double>(left_eye_outer.y);
    return std::atan2(dy, dx) * 180.0 / CV_PI;
}

double noseDeviation(const LandmarkFrame& frame) {
    const LandmarkLayout& layout = frame.layout();
    double nose_x = frame[layout.nose_tip].x;
    double left_x = frame[layout.left_cheek].x;
    double right_x = frame[layout.right_cheek].x;

    double face_width = right_x - left_x;
    if (face_width < EPSILON) {
        return 0.0;
    }
    double face_center_x = (left_x + right_x) / 2.0;
    return (nose_x - face_center_x) / face_width;
}

cv::Point2d nosePositionNormalized(const LandmarkFrame& frame) {
    const LandmarkLayout& layout = frame.layout();
    const cv::Point2f& nose = frame[layout.nose_tip];
    double left_x = frame[layout.left_cheek].x;
    double right_x = frame[layout.right_cheek].x;
    double top_y = frame[layout.forehead].y;
    double bottom_y = frame[layout.chin].y;

    double face_w = right_x - left_x;
    double face_h = bottom_y - top_y;

    cv::Point2d position(0.0, 0.0);
    if (face_w >= EPSILON) {
        position.x = (nose.x - left_x) / face_w;
    }
    if (face_h >= EPSILON) {
        position.y = (nose.y - top_y) / face_h;
    }
    return position;
}

} // namespace geometry
} // namespace engagement
