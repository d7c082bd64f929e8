#include "engagement_config.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>

namespace engagement {

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "target_fps", "smoothing_window", "blink_window", "blink_history_capacity",
    "gesture_window", "confusion_window", "engagement_window",
    "ear_threshold", "ear_consec_frames", "sleep_ear_threshold", "sleep_consec_frames",
    "ear_open_reference", "tilt_threshold_deg", "tilt_consec_frames", "head_variance_high",
    "eye_contact_tolerance", "confusion_weights", "blink_rate_low", "blink_rate_high",
    "micro_move_high", "engagement_weights", "nod_oscillations", "shake_oscillations",
    "gesture_deadzone", "gesture_cooldown_frames", "landmark_layout", "landmark_model",
    "log_dir", "log_interval_frames", "log_flush_rows", "camera_index", "frame_width",
    "frame_height", "stop_timeout_ms", "max_consecutive_read_failures"
};

} // namespace

bool fitsInt(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max());
    }
    if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        return v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    }
    return false;
}

namespace {

void readInt(const json& j, const char* key, int& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_number_integer()) {
        throw ConfigError(std::string("Config key '") + key + "' must be an integer");
    }
    if (!fitsInt(j[key])) {
        throw ConfigError(std::string("Config key '") + key + "' is out of range: " + j[key].dump());
    }
    out = j[key].get<int>();
}

void readDouble(const json& j, const char* key, double& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_number()) {
        throw ConfigError(std::string("Config key '") + key + "' must be a number");
    }
    out = j[key].get<double>();
}

void readString(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_string()) {
        throw ConfigError(std::string("Config key '") + key + "' must be a string");
    }
    out = j[key].get<std::string>();
}

// A weight map must name every weight exactly once; a partial map would
// silently mix file values with defaults and break the sum invariant.
void requireWeightKeys(const json& j, const char* key, const std::set<std::string>& names) {
    if (!j.is_object()) {
        throw ConfigError(std::string("Config key '") + key + "' must be an object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (names.count(it.key()) == 0) {
            throw ConfigError(std::string("Unknown weight '") + it.key() + "' in '" + key + "'");
        }
    }
    for (const auto& name : names) {
        if (!j.contains(name)) {
            throw ConfigError(std::string("Missing weight '") + name + "' in '" + key + "'");
        }
    }
}

void requirePositive(int value, const char* key) {
    if (value <= 0) {
        throw ConfigError(std::string("Config key '") + key + "' must be > 0, got " + std::to_string(value));
    }
}

void requirePositive(double value, const char* key) {
    if (!(value > 0.0)) {
        throw ConfigError(std::string("Config key '") + key + "' must be > 0, got " + std::to_string(value));
    }
}

void requireNonNegative(double value, const char* key) {
    if (!(value >= 0.0)) {
        throw ConfigError(std::string("Config key '") + key + "' must be >= 0, got " + std::to_string(value));
    }
}

void requireUnitSum(double sum, const char* key) {
    if (std::fabs(sum - 1.0) > EngagementConfig::WEIGHT_SUM_TOLERANCE) {
        throw ConfigError(std::string("Weights in '") + key + "' must sum to 1.0, got " + std::to_string(sum));
    }
}

} // namespace

void EngagementConfig::validate() const {
    requirePositive(target_fps, "target_fps");
    requirePositive(smoothing_window, "smoothing_window");
    requirePositive(blink_window, "blink_window");
    requirePositive(blink_history_capacity, "blink_history_capacity");
    requirePositive(gesture_window, "gesture_window");
    requirePositive(confusion_window, "confusion_window");
    requirePositive(engagement_window, "engagement_window");

    requirePositive(ear_threshold, "ear_threshold");
    requirePositive(ear_consec_frames, "ear_consec_frames");
    requirePositive(sleep_ear_threshold, "sleep_ear_threshold");
    requirePositive(sleep_consec_frames, "sleep_consec_frames");
    requirePositive(ear_open_reference, "ear_open_reference");

    requirePositive(tilt_threshold_deg, "tilt_threshold_deg");
    requirePositive(tilt_consec_frames, "tilt_consec_frames");
    requirePositive(head_variance_high, "head_variance_high");
    requireNonNegative(eye_contact_tolerance, "eye_contact_tolerance");

    requireNonNegative(confusion_weights.blink_rate, "confusion_weights.blink_rate");
    requireNonNegative(confusion_weights.head_variance, "confusion_weights.head_variance");
    requireNonNegative(confusion_weights.gaze_reduction, "confusion_weights.gaze_reduction");
    requireNonNegative(confusion_weights.micro_movement, "confusion_weights.micro_movement");
    requireUnitSum(confusion_weights.sum(), "confusion_weights");

    requireNonNegative(engagement_weights.eye_openness, "engagement_weights.eye_openness");
    requireNonNegative(engagement_weights.head_stability, "engagement_weights.head_stability");
    requireNonNegative(engagement_weights.eye_contact, "engagement_weights.eye_contact");
    requireNonNegative(engagement_weights.confusion_penalty, "engagement_weights.confusion_penalty");
    requireUnitSum(engagement_weights.sum(), "engagement_weights");

    requireNonNegative(blink_rate_low, "blink_rate_low");
    if (!(blink_rate_low < blink_rate_high)) {
        throw ConfigError("Config key 'blink_rate_low' must be below 'blink_rate_high'");
    }
    requirePositive(micro_move_high, "micro_move_high");

    requirePositive(nod_oscillations, "nod_oscillations");
    requirePositive(shake_oscillations, "shake_oscillations");
    requireNonNegative(gesture_deadzone, "gesture_deadzone");
    requireNonNegative(static_cast<double>(gesture_cooldown_frames), "gesture_cooldown_frames");

    try {
        LandmarkLayout::fromName(landmark_layout);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Config key 'landmark_layout': ") + e.what());
    }

    requirePositive(log_interval_frames, "log_interval_frames");
    requirePositive(log_flush_rows, "log_flush_rows");
    requireNonNegative(static_cast<double>(camera_index), "camera_index");
    requirePositive(frame_width, "frame_width");
    requirePositive(frame_height, "frame_height");
    requirePositive(stop_timeout_ms, "stop_timeout_ms");
    requirePositive(max_consecutive_read_failures, "max_consecutive_read_failures");
}

json EngagementConfig::toJson() const {
    json j;
    j["target_fps"] = target_fps;
    j["smoothing_window"] = smoothing_window;
    j["blink_window"] = blink_window;
    j["blink_history_capacity"] = blink_history_capacity;
    j["gesture_window"] = gesture_window;
    j["confusion_window"] = confusion_window;
    j["engagement_window"] = engagement_window;
    j["ear_threshold"] = ear_threshold;
    j["ear_consec_frames"] = ear_consec_frames;
    j["sleep_ear_threshold"] = sleep_ear_threshold;
    j["sleep_consec_frames"] = sleep_consec_frames;
    j["ear_open_reference"] = ear_open_reference;
    j["tilt_threshold_deg"] = tilt_threshold_deg;
    j["tilt_consec_frames"] = tilt_consec_frames;
    j["head_variance_high"] = head_variance_high;
    j["eye_contact_tolerance"] = eye_contact_tolerance;
    j["confusion_weights"] = {
        {"blink_rate", confusion_weights.blink_rate},
        {"head_variance", confusion_weights.head_variance},
        {"gaze_reduction", confusion_weights.gaze_reduction},
        {"micro_movement", confusion_weights.micro_movement}
    };
    j["blink_rate_low"] = blink_rate_low;
    j["blink_rate_high"] = blink_rate_high;
    j["micro_move_high"] = micro_move_high;
    j["engagement_weights"] = {
        {"eye_openness", engagement_weights.eye_openness},
        {"head_stability", engagement_weights.head_stability},
        {"eye_contact", engagement_weights.eye_contact},
        {"confusion_penalty", engagement_weights.confusion_penalty}
    };
    j["nod_oscillations"] = nod_oscillations;
    j["shake_oscillations"] = shake_oscillations;
    j["gesture_deadzone"] = gesture_deadzone;
    j["gesture_cooldown_frames"] = gesture_cooldown_frames;
    j["landmark_layout"] = landmark_layout;
    j["landmark_model"] = landmark_model;
    j["log_dir"] = log_dir;
    j["log_interval_frames"] = log_interval_frames;
    j["log_flush_rows"] = log_flush_rows;
    j["camera_index"] = camera_index;
    j["frame_width"] = frame_width;
    j["frame_height"] = frame_height;
    j["stop_timeout_ms"] = stop_timeout_ms;
    j["max_consecutive_read_failures"] = max_consecutive_read_failures;
    return j;
}

EngagementConfig EngagementConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (KNOWN_KEYS.count(it.key()) == 0) {
            throw ConfigError("Unknown config key '" + it.key() + "'");
        }
    }

    EngagementConfig cfg;
    readInt(j, "target_fps", cfg.target_fps);
    readInt(j, "smoothing_window", cfg.smoothing_window);
    readInt(j, "blink_window", cfg.blink_window);
    readInt(j, "blink_history_capacity", cfg.blink_history_capacity);
    readInt(j, "gesture_window", cfg.gesture_window);
    readInt(j, "confusion_window", cfg.confusion_window);
    readInt(j, "engagement_window", cfg.engagement_window);

    readDouble(j, "ear_threshold", cfg.ear_threshold);
    readInt(j, "ear_consec_frames", cfg.ear_consec_frames);
    readDouble(j, "sleep_ear_threshold", cfg.sleep_ear_threshold);
    readInt(j, "sleep_consec_frames", cfg.sleep_consec_frames);
    readDouble(j, "ear_open_reference", cfg.ear_open_reference);

    readDouble(j, "tilt_threshold_deg", cfg.tilt_threshold_deg);
    readInt(j, "tilt_consec_frames", cfg.tilt_consec_frames);
    readDouble(j, "head_variance_high", cfg.head_variance_high);
    readDouble(j, "eye_contact_tolerance", cfg.eye_contact_tolerance);

    if (j.contains("confusion_weights")) {
        const json& w = j["confusion_weights"];
        requireWeightKeys(w, "confusion_weights",
                          {"blink_rate", "head_variance", "gaze_reduction", "micro_movement"});
        readDouble(w, "blink_rate", cfg.confusion_weights.blink_rate);
        readDouble(w, "head_variance", cfg.confusion_weights.head_variance);
        readDouble(w, "gaze_reduction", cfg.confusion_weights.gaze_reduction);
        readDouble(w, "micro_movement", cfg.confusion_weights.micro_movement);
    }
    readDouble(j, "blink_rate_low", cfg.blink_rate_low);
    readDouble(j, "blink_rate_high", cfg.blink_rate_high);
    readDouble(j, "micro_move_high", cfg.micro_move_high);

    if (j.contains("engagement_weights")) {
        const json& w = j["engagement_weights"];
        requireWeightKeys(w, "engagement_weights",
                          {"eye_openness", "head_stability", "eye_contact", "confusion_penalty"});
        readDouble(w, "eye_openness", cfg.engagement_weights.eye_openness);
        readDouble(w, "head_stability", cfg.engagement_weights.head_stability);
        readDouble(w, "eye_contact", cfg.engagement_weights.eye_contact);
        readDouble(w, "confusion_penalty", cfg.engagement_weights.confusion_penalty);
    }

    readInt(j, "nod_oscillations", cfg.nod_oscillations);
    readInt(j, "shake_oscillations", cfg.shake_oscillations);
    readDouble(j, "gesture_deadzone", cfg.gesture_deadzone);
    readInt(j, "gesture_cooldown_frames", cfg.gesture_cooldown_frames);

    readString(j, "landmark_layout", cfg.landmark_layout);
    readString(j, "landmark_model", cfg.landmark_model);

    readString(j, "log_dir", cfg.log_dir);
    readInt(j, "log_interval_frames", cfg.log_interval_frames);
    readInt(j, "log_flush_rows", cfg.log_flush_rows);

    readInt(j, "camera_index", cfg.camera_index);
    readInt(j, "frame_width", cfg.frame_width);
    readInt(j, "frame_height", cfg.frame_height);
    readInt(j, "stop_timeout_ms", cfg.stop_timeout_ms);
    readInt(j, "max_consecutive_read_failures", cfg.max_consecutive_read_failures);

    cfg.validate();
    return cfg;
}

EngagementConfig EngagementConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in config file " + path + ": " + e.what());
    }

    EngagementConfig cfg = fromJson(j);
    std::cout << "[Config] Loaded " << path << std::endl;
    return cfg;
}

std::shared_ptr<const EngagementConfig> EngagementConfig::defaults() {
    auto cfg = std::make_shared<EngagementConfig>();
    cfg->validate();
    return cfg;
}

} // namespace engagement
