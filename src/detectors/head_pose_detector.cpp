#include "head_pose_detector.hpp"
#include "../geometry.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace engagement {

HeadPoseDetector::State::State(const EngagementConfig& config)
    : angle_history(static_cast<size_t>(config.smoothing_window)),
      var_history(static_cast<size_t>(config.confusion_window)) {}

bool HeadPoseDetector::State::operator==(const State& other) const {
    return std::tie(angle_history, var_history, tilt_counter, tilt_angle_deg, smoothed_angle,
                    is_tilted, angle_variance) ==
           std::tie(other.angle_history, other.var_history, other.tilt_counter,
                    other.tilt_angle_deg, other.smoothed_angle, other.is_tilted,
                    other.angle_variance);
}

HeadPoseDetector::HeadPoseDetector(ConfigPtr config)
    : config_(requireConfig(std::move(config), "HeadPoseDetector")),
      state_(*config_) {}

void HeadPoseDetector::update(const LandmarkFrame& frame) {
    const LandmarkLayout& layout = frame.layout();
    updateAngle(geometry::rollAngle(frame[layout.left_eye_outer], frame[layout.right_eye_outer]));
}

void HeadPoseDetector::updateAngle(double angle_deg) {
    const EngagementConfig& cfg = *config_;
    State& s = state_;

    s.tilt_angle_deg = angle_deg;
    s.angle_history.push(angle_deg);
    s.var_history.push(angle_deg);

    s.smoothed_angle = s.angle_history.mean();

    if (std::fabs(s.smoothed_angle) > cfg.tilt_threshold_deg) {
        s.tilt_counter = std::min(s.tilt_counter + 1, cfg.tilt_consec_frames);
    } else {
        s.tilt_counter = 0;
    }
    s.is_tilted = s.tilt_counter >= cfg.tilt_consec_frames;

    // Raw variance is in deg^2; head_variance_high deg^2 maps to 1
    s.angle_variance = std::min(s.var_history.variance() / cfg.head_variance_high, 1.0);
}

void HeadPoseDetector::reset() {
    *this = HeadPoseDetector(config_);
}

} // namespace engagement
