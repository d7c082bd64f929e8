#include "ear_detector.hpp"
#include "../geometry.hpp"
#include <algorithm>
#include <tuple>

namespace engagement {

EarDetector::State::State(const EngagementConfig& config)
    : ear_history(static_cast<size_t>(config.smoothing_window)),
      blink_frames(static_cast<size_t>(config.blink_history_capacity)) {}

bool EarDetector::State::operator==(const State& other) const {
    return std::tie(ear_history, blink_frames, blink_counter, sleep_counter, total_blinks,
                    current_frame, ear_left, ear_right, ear_avg, smoothed_ear, is_blinking,
                    is_sleeping, blinks_in_window, blinks_per_minute) ==
           std::tie(other.ear_history, other.blink_frames, other.blink_counter, other.sleep_counter,
                    other.total_blinks, other.current_frame, other.ear_left, other.ear_right,
                    other.ear_avg, other.smoothed_ear, other.is_blinking, other.is_sleeping,
                    other.blinks_in_window, other.blinks_per_minute);
}

EarDetector::EarDetector(ConfigPtr config)
    : config_(requireConfig(std::move(config), "EarDetector")),
      state_(*config_) {}

void EarDetector::update(const LandmarkFrame& frame) {
    const LandmarkLayout& layout = frame.layout();
    double left = geometry::eyeAspectRatio(geometry::eyePoints(frame, layout.left_eye));
    double right = geometry::eyeAspectRatio(geometry::eyePoints(frame, layout.right_eye));
    updateEar(left, right);
}

void EarDetector::updateEar(double ear_left, double ear_right) {
    const EngagementConfig& cfg = *config_;
    State& s = state_;

    s.current_frame++;

    s.ear_left = ear_left;
    s.ear_right = ear_right;
    s.ear_avg = (ear_left + ear_right) / 2.0;

    s.ear_history.push(s.ear_avg);
    s.smoothed_ear = s.ear_history.mean();

    // Blink: count closed frames, emit on the reopening edge
    // Counters saturate at their thresholds; only ">= threshold" matters
    if (s.smoothed_ear < cfg.ear_threshold) {
        s.blink_counter = std::min(s.blink_counter + 1, cfg.ear_consec_frames);
        s.is_blinking = true;
    } else {
        if (s.blink_counter >= cfg.ear_consec_frames) {
            s.total_blinks++;
            s.blink_frames.push(s.current_frame);
        }
        s.blink_counter = 0;
        s.is_blinking = false;
    }

    if (s.smoothed_ear < cfg.sleep_ear_threshold) {
        s.sleep_counter = std::min(s.sleep_counter + 1, cfg.sleep_consec_frames);
    } else {
        s.sleep_counter = 0;
    }
    s.is_sleeping = s.sleep_counter >= cfg.sleep_consec_frames;

    int64_t cutoff = s.current_frame - cfg.blink_window;
    while (!s.blink_frames.empty() && s.blink_frames.front() < cutoff) {
        s.blink_frames.popFront();
    }

    s.blinks_in_window = static_cast<int>(s.blink_frames.size());
    double window_seconds = static_cast<double>(cfg.blink_window) / std::max(cfg.target_fps, 1);
    s.blinks_per_minute = (s.blinks_in_window / window_seconds) * 60.0;
}

double EarDetector::normalizedOpenness() const {
    double openness = state_.ear_avg / config_->ear_open_reference;
    return std::max(0.0, std::min(openness, 1.0));
}

void EarDetector::reset() {
    *this = EarDetector(config_);
}

} // namespace engagement
