#ifndef EAR_DETECTOR_HPP
#define EAR_DETECTOR_HPP

#include "../engagement_config.hpp"
#include "../landmark_frame.hpp"
#include "../rolling_window.hpp"
#include <cstdint>

namespace engagement {

// Eye-aspect-ratio blink counter and sleep detector.
//
// Open eyes sit around EAR 0.25-0.32, a blink drops below ear_threshold for a
// few frames and sleep keeps it below sleep_ear_threshold for seconds. All
// decisions use the EAR averaged over smoothing_window frames.
//
// Sleep releases on the first frame the smoothed EAR is back above the sleep
// threshold; there is no release hysteresis, unlike the tilt state.
class EarDetector {
public:
    struct State {
        RollingWindow<double> ear_history;     // smoothing_window
        RollingWindow<int64_t> blink_frames;   // frame numbers of recent blinks
        int blink_counter = 0;                 // frames below ear_threshold, capped at ear_consec_frames
        int sleep_counter = 0;                 // frames below sleep_ear_threshold, capped at sleep_consec_frames
        int64_t total_blinks = 0;
        int64_t current_frame = 0;

        double ear_left = 0.0;
        double ear_right = 0.0;
        double ear_avg = 0.0;
        double smoothed_ear = 0.0;
        bool is_blinking = false;
        bool is_sleeping = false;
        int blinks_in_window = 0;
        double blinks_per_minute = 0.0;

        explicit State(const EngagementConfig& config);
        bool operator==(const State& other) const;
        bool operator!=(const State& other) const { return !(*this == other); }
    };

    explicit EarDetector(ConfigPtr config);

    // Process one frame's landmarks.
    void update(const LandmarkFrame& frame);

    // Same step from already computed per-eye EAR values.
    void updateEar(double ear_left, double ear_right);

    // EAR mapped to [0,1]; ear_open_reference and above read as fully open.
    double normalizedOpenness() const;

    // Back to construction defaults (session restart).
    void reset();

    double earLeft() const { return state_.ear_left; }
    double earRight() const { return state_.ear_right; }
    double earAvg() const { return state_.ear_avg; }
    double smoothedEar() const { return state_.smoothed_ear; }
    bool isBlinking() const { return state_.is_blinking; }
    bool isSleeping() const { return state_.is_sleeping; }
    int64_t totalBlinks() const { return state_.total_blinks; }
    int blinksInWindow() const { return state_.blinks_in_window; }
    double blinksPerMinute() const { return state_.blinks_per_minute; }

    const State& state() const { return state_; }

private:
    ConfigPtr config_;
    State state_;
};

} // namespace engagement

#endif // EAR_DETECTOR_HPP
