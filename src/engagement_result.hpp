#ifndef ENGAGEMENT_RESULT_HPP
#define ENGAGEMENT_RESULT_HPP

#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace engagement {

// Immutable per-frame snapshot. A default-constructed result is what a
// "no face" frame reports.
struct EngagementResult {
    int64_t frame_number = 0;
    bool face_detected = false;

    // Timing
    double fps = 0.0;
    double inference_ms = 0.0;

    // Eyes
    double ear_left = 0.0;
    double ear_right = 0.0;
    double ear_avg = 0.0;
    bool is_blinking = false;
    bool is_sleeping = false;
    int64_t blink_count = 0;
    int blinks_in_window = 0;
    double blinks_per_minute = 0.0;

    // Head pose
    double tilt_angle_deg = 0.0;
    double smoothed_tilt_deg = 0.0;
    bool is_tilted = false;

    // Gaze
    bool eye_contact = true;
    double contact_ratio = 1.0;
    double nose_deviation = 0.0;

    // Gestures
    bool head_nod = false;
    bool head_shake = false;

    // Scores
    double micro_movement = 0.0;
    double confusion_score = 0.0;
    double engagement_score = 50.0;
    double raw_engagement_score = 50.0;

    json toJson() const {
        json j;
        j["frame_number"] = frame_number;
        j["face_detected"] = face_detected;
        j["fps"] = fps;
        j["inference_ms"] = inference_ms;

        j["ear_left"] = ear_left;
        j["ear_right"] = ear_right;
        j["ear_avg"] = ear_avg;
        j["is_blinking"] = is_blinking;
        j["is_sleeping"] = is_sleeping;
        j["blink_count"] = blink_count;
        j["blinks_in_window"] = blinks_in_window;
        j["blinks_per_minute"] = blinks_per_minute;

        j["tilt_angle_deg"] = tilt_angle_deg;
        j["smoothed_tilt_deg"] = smoothed_tilt_deg;
        j["is_tilted"] = is_tilted;

        j["eye_contact"] = eye_contact;
        j["contact_ratio"] = contact_ratio;
        j["nose_deviation"] = nose_deviation;

        j["head_nod"] = head_nod;
        j["head_shake"] = head_shake;

        j["micro_movement"] = micro_movement;
        j["confusion_score"] = confusion_score;
        j["engagement_score"] = engagement_score;
        j["raw_engagement_score"] = raw_engagement_score;
        return j;
    }
};

} // namespace engagement

#endif // ENGAGEMENT_RESULT_HPP
