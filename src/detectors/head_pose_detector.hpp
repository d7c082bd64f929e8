#ifndef HEAD_POSE_DETECTOR_HPP
#define HEAD_POSE_DETECTOR_HPP

#include "../engagement_config.hpp"
#include "../landmark_frame.hpp"
#include "../rolling_window.hpp"

namespace engagement {

// Head roll from the eye-corner line plus its variance over the confusion
// window. Roll only: pitch and yaw would need a perspective solve.
class HeadPoseDetector {
public:
    struct State {
        RollingWindow<double> angle_history;   // smoothing_window
        RollingWindow<double> var_history;     // confusion_window
        int tilt_counter = 0;                  // capped at tilt_consec_frames

        double tilt_angle_deg = 0.0;
        double smoothed_angle = 0.0;
        bool is_tilted = false;
        double angle_variance = 0.0;           // normalized [0,1]

        explicit State(const EngagementConfig& config);
        bool operator==(const State& other) const;
        bool operator!=(const State& other) const { return !(*this == other); }
    };

    explicit HeadPoseDetector(ConfigPtr config);

    void update(const LandmarkFrame& frame);
    void updateAngle(double angle_deg);

    // 1 - angle variance: a still head reads 1.
    double stability() const { return 1.0 - state_.angle_variance; }

    void reset();

    double tiltAngleDeg() const { return state_.tilt_angle_deg; }
    double smoothedAngle() const { return state_.smoothed_angle; }
    bool isTilted() const { return state_.is_tilted; }
    double angleVariance() const { return state_.angle_variance; }

    const State& state() const { return state_; }

private:
    ConfigPtr config_;
    State state_;
};

} // namespace engagement

#endif // HEAD_POSE_DETECTOR_HPP
