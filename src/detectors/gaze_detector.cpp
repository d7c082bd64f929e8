#include "gaze_detector.hpp"
#include "../geometry.hpp"
#include <cmath>
#include <tuple>

namespace engagement {

GazeDetector::State::State(const EngagementConfig& config)
    : deviation_history(static_cast<size_t>(config.smoothing_window)),
      contact_history(static_cast<size_t>(config.engagement_window)) {}

bool GazeDetector::State::operator==(const State& other) const {
    return std::tie(deviation_history, contact_history, deviation, smoothed_deviation,
                    eye_contact, contact_ratio) ==
           std::tie(other.deviation_history, other.contact_history, other.deviation,
                    other.smoothed_deviation, other.eye_contact, other.contact_ratio);
}

GazeDetector::GazeDetector(ConfigPtr config)
    : config_(requireConfig(std::move(config), "GazeDetector")),
      state_(*config_) {}

void GazeDetector::update(const LandmarkFrame& frame) {
    updateDeviation(geometry::noseDeviation(frame));
}

void GazeDetector::updateDeviation(double deviation) {
    State& s = state_;

    s.deviation = deviation;
    s.deviation_history.push(std::fabs(deviation));
    s.smoothed_deviation = s.deviation_history.mean();

    s.eye_contact = s.smoothed_deviation <= config_->eye_contact_tolerance;

    s.contact_history.push(s.eye_contact ? 1 : 0);
    s.contact_ratio = s.contact_history.mean();
}

void GazeDetector::reset() {
    *this = GazeDetector(config_);
}

} // namespace engagement
