#ifndef ENGAGEMENT_CONFIG_HPP
#define ENGAGEMENT_CONFIG_HPP

#include "landmark_frame.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace engagement {

// Invalid configuration. Fatal at startup: the monitor refuses to run.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

struct ConfusionWeights {
    double blink_rate = 0.25;       // Rapid blinking signals cognitive load
    double head_variance = 0.30;    // Unstable head = searching
    double gaze_reduction = 0.25;   // Looking away from the content
    double micro_movement = 0.20;   // Fidgeting

    double sum() const { return blink_rate + head_variance + gaze_reduction + micro_movement; }
};

struct EngagementWeights {
    double eye_openness = 0.30;
    double head_stability = 0.25;
    double eye_contact = 0.30;
    double confusion_penalty = 0.15;  // Subtracted, scaled by confusion / 100

    double sum() const { return eye_openness + head_stability + eye_contact + confusion_penalty; }
};

// Thresholds, windows (in frames) and weights for the whole pipeline.
// Build it once, validate() it, then share it read-only.
struct EngagementConfig {
    // Timing
    int target_fps = 30;

    // Rolling windows (frames)
    int smoothing_window = 10;
    int blink_window = 90;
    int blink_history_capacity = 200;
    int gesture_window = 45;
    int confusion_window = 60;
    int engagement_window = 30;

    // Eye aspect ratio
    double ear_threshold = 0.21;
    int ear_consec_frames = 3;
    double sleep_ear_threshold = 0.18;
    int sleep_consec_frames = 150;
    double ear_open_reference = 0.30;

    // Head tilt
    double tilt_threshold_deg = 15.0;
    int tilt_consec_frames = 90;
    double head_variance_high = 50.0;   // deg^2 treated as "very unstable"

    // Eye contact
    double eye_contact_tolerance = 0.04;

    // Confusion
    ConfusionWeights confusion_weights;
    double blink_rate_low = 8.0;
    double blink_rate_high = 25.0;
    double micro_move_high = 0.003;

    // Engagement
    EngagementWeights engagement_weights;

    // Gestures
    int nod_oscillations = 2;
    int shake_oscillations = 2;
    double gesture_deadzone = 0.008;
    int gesture_cooldown_frames = 20;

    // Landmarks
    std::string landmark_layout = "dlib68";
    std::string landmark_model = "shape_predictor_68_face_landmarks.dat";

    // CSV logging
    std::string log_dir = "./logs";
    int log_interval_frames = 30;
    int log_flush_rows = 30;

    // Capture / session
    int camera_index = 0;
    int frame_width = 640;
    int frame_height = 480;
    int stop_timeout_ms = 5000;
    int max_consecutive_read_failures = 300;

    static constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

    // Throws ConfigError naming the first offending key.
    void validate() const;

    LandmarkLayout layout() const { return LandmarkLayout::fromName(landmark_layout); }

    json toJson() const;

    // Defaults overridden by the keys present in `j`. Unknown keys and wrong
    // types are rejected. The result is validated.
    static EngagementConfig fromJson(const json& j);

    static EngagementConfig loadFromFile(const std::string& path);

    // Validated defaults
    static std::shared_ptr<const EngagementConfig> defaults();
};

using ConfigPtr = std::shared_ptr<const EngagementConfig>;

// True for a JSON integer that converts to int without truncation
bool fitsInt(const json& value);

// Components keep the shared config for their whole life. A null one is a
// wiring error; an invalid one throws ConfigError before anything is built.
inline ConfigPtr requireConfig(ConfigPtr config, const char* owner) {
    if (!config) {
        throw std::invalid_argument(std::string(owner) + " requires a configuration");
    }
    config->validate();
    return config;
}

} // namespace engagement

#endif // ENGAGEMENT_CONFIG_HPP
