#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "src/landmark_frame.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace test_support {

static int failures = 0;

inline void check(bool condition, const std::string& name) {
    std::cout << "  [" << (condition ? "✓" : "✗") << "] " << name << std::endl;
    if (!condition) {
        failures++;
    }
}

inline bool near(double a, double b, double tolerance = 1e-6) {
    return std::fabs(a - b) <= tolerance;
}

inline int finish(const std::string& suite) {
    std::cout << "\n==== " << suite << ": "
              << (failures == 0 ? "all checks passed" : std::to_string(failures) + " check(s) failed")
              << " ====" << std::endl;
    return failures == 0 ? 0 : 1;
}

// Pose of a synthetic 640x480 face
struct FaceParams {
    double ear = 0.30;        // both eyes
    double roll_deg = 0.0;    // rotation about the face center
    double nose_dx = 0.0;     // horizontal nose deviation, fraction of face width
    double nose_y = 0.45;     // nose height inside the forehead-chin box
};

// A landmark frame whose anchors give exactly the requested EAR, roll angle,
// nose deviation and nose height. Non-anchor points sit on the face center.
inline engagement::LandmarkFrame syntheticFace(
        const FaceParams& params,
        const engagement::LandmarkLayout& layout = engagement::LandmarkLayout::dlib68()) {
    const float cx = 320.0f;
    const float cy = 240.0f;
    const float face_half_width = 100.0f;
    const float top = 160.0f;
    const float bottom = 340.0f;
    const float eye_half_width = 15.0f;
    const float lid = static_cast<float>(params.ear * 2.0 * eye_half_width / 2.0);  // EAR = 2*lid / 30

    std::vector<cv::Point2f> points(layout.point_count, cv::Point2f(cx, cy));

    auto placeEye = [&](const std::array<int, 6>& eye, float eye_cx, float eye_cy) {
        points[eye[0]] = cv::Point2f(eye_cx - eye_half_width, eye_cy);
        points[eye[3]] = cv::Point2f(eye_cx + eye_half_width, eye_cy);
        points[eye[1]] = cv::Point2f(eye_cx - 5.0f, eye_cy - lid);
        points[eye[2]] = cv::Point2f(eye_cx + 5.0f, eye_cy - lid);
        points[eye[5]] = cv::Point2f(eye_cx - 5.0f, eye_cy + lid);
        points[eye[4]] = cv::Point2f(eye_cx + 5.0f, eye_cy + lid);
    };
    placeEye(layout.left_eye, cx - 50.0f, 200.0f);
    placeEye(layout.right_eye, cx + 50.0f, 200.0f);

    points[layout.left_cheek] = cv::Point2f(cx - face_half_width, cy);
    points[layout.right_cheek] = cv::Point2f(cx + face_half_width, cy);
    points[layout.forehead] = cv::Point2f(cx, top);
    points[layout.chin] = cv::Point2f(cx, bottom);
    points[layout.nose_tip] = cv::Point2f(
        cx + static_cast<float>(params.nose_dx * 2.0 * face_half_width),
        top + static_cast<float>(params.nose_y * (bottom - top)));

    if (params.roll_deg != 0.0) {
        double rad = params.roll_deg * CV_PI / 180.0;
        double c = std::cos(rad);
        double s = std::sin(rad);
        for (auto& p : points) {
            double x = p.x - cx;
            double y = p.y - cy;
            p = cv::Point2f(static_cast<float>(cx + x * c - y * s),
                            static_cast<float>(cy + x * s + y * c));
        }
    }

    return engagement::LandmarkFrame(std::move(points), layout);
}

} // namespace test_support

#endif // TEST_SUPPORT_HPP
