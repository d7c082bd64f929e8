#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "landmark_frame.hpp"
#include <opencv2/core.hpp>
#include <array>

namespace engagement {
namespace geometry {

// Denominators below this are treated as a degenerate face.
constexpr double EPSILON = 1e-6;

double euclidean(const cv::Point2f& a, const cv::Point2f& b);

// EAR = (|p2-p6| + |p3-p5|) / (2 |p1-p4|); 0 when |p1-p4| < EPSILON.
double eyeAspectRatio(const std::array<cv::Point2f, 6>& eye);

std::array<cv::Point2f, 6> eyePoints(const LandmarkFrame& frame, const std::array<int, 6>& indices);

// Roll of the eye-corner vector in degrees. Positive when the right corner sits
// lower in the image than the left one.
double rollAngle(const cv::Point2f& left_eye_outer, const cv::Point2f& right_eye_outer);

// (nose_x - face_center_x) / face_width using the cheek points; 0 on a
// degenerate face width.
double noseDeviation(const LandmarkFrame& frame);

// Nose tip inside the cheek/forehead/chin box, each axis in [0,1] for a nose
// inside the box. An axis whose extent is below EPSILON reads 0.
cv::Point2d nosePositionNormalized(const LandmarkFrame& frame);

} // namespace geometry
} // namespace engagement

#endif // GEOMETRY_HPP
