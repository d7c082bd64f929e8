#include "gesture_detector.hpp"
#include "../geometry.hpp"
#include <cmath>
#include <iterator>
#include <tuple>
#include <vector>

namespace engagement {

GestureDetector::State::State(const EngagementConfig& config)
    : x_history(static_cast<size_t>(config.gesture_window)),
      y_history(static_cast<size_t>(config.gesture_window)) {}

bool GestureDetector::State::operator==(const State& other) const {
    return std::tie(x_history, y_history, nod_cooldown, shake_cooldown, head_nod, head_shake) ==
           std::tie(other.x_history, other.y_history, other.nod_cooldown, other.shake_cooldown,
                    other.head_nod, other.head_shake);
}

GestureDetector::GestureDetector(ConfigPtr config)
    : config_(requireConfig(std::move(config), "GestureDetector")),
      state_(*config_) {}

int GestureDetector::countOscillations(const RollingWindow<double>& history, double deadzone) {
    if (history.size() < 3) {
        return 0;
    }

    std::vector<int> signs;
    signs.reserve(history.size() - 1);

    auto prev = history.begin();
    for (auto it = std::next(prev); it != history.end(); ++it, ++prev) {
        double delta = *it - *prev;
        if (std::fabs(delta) < deadzone || delta == 0.0) {
            continue;
        }
        signs.push_back(delta > 0.0 ? 1 : -1);
    }

    if (signs.size() < 2) {
        return 0;
    }

    int flips = 0;
    for (size_t i = 1; i < signs.size(); i++) {
        if (signs[i] != signs[i - 1]) {
            flips++;
        }
    }
    // A full cycle is a rise and a fall
    return flips / 2;
}

void GestureDetector::update(const LandmarkFrame& frame) {
    cv::Point2d position = geometry::nosePositionNormalized(frame);
    updatePosition(position.x, position.y);
}

void GestureDetector::updatePosition(double x, double y) {
    const EngagementConfig& cfg = *config_;
    State& s = state_;

    s.x_history.push(x);
    s.y_history.push(y);

    if (s.nod_cooldown > 0) s.nod_cooldown--;
    if (s.shake_cooldown > 0) s.shake_cooldown--;

    int vertical = countOscillations(s.y_history, cfg.gesture_deadzone);
    int horizontal = countOscillations(s.x_history, cfg.gesture_deadzone);

    if (vertical >= cfg.nod_oscillations && s.nod_cooldown == 0) {
        s.head_nod = true;
        s.nod_cooldown = cfg.gesture_cooldown_frames;
    } else {
        s.head_nod = false;
    }

    if (horizontal >= cfg.shake_oscillations && s.shake_cooldown == 0) {
        s.head_shake = true;
        s.shake_cooldown = cfg.gesture_cooldown_frames;
    } else {
        s.head_shake = false;
    }
}

void GestureDetector::reset() {
    *this = GestureDetector(config_);
}

} // namespace engagement
