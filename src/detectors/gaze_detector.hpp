#ifndef GAZE_DETECTOR_HPP
#define GAZE_DETECTOR_HPP

#include "../engagement_config.hpp"
#include "../landmark_frame.hpp"
#include "../rolling_window.hpp"

namespace engagement {

// On-screen gaze proxy: a nose tip close to the horizontal face center means
// the student faces the screen.
class GazeDetector {
public:
    struct State {
        RollingWindow<double> deviation_history;   // |deviation|, smoothing_window
        RollingWindow<int> contact_history;        // 0/1, engagement_window

        double deviation = 0.0;
        double smoothed_deviation = 0.0;
        bool eye_contact = true;
        double contact_ratio = 1.0;

        explicit State(const EngagementConfig& config);
        bool operator==(const State& other) const;
        bool operator!=(const State& other) const { return !(*this == other); }
    };

    explicit GazeDetector(ConfigPtr config);

    void update(const LandmarkFrame& frame);
    void updateDeviation(double deviation);

    // 1 = always off-screen, 0 = always on-screen.
    double gazeLoss() const { return 1.0 - state_.contact_ratio; }

    void reset();

    double deviation() const { return state_.deviation; }
    double smoothedDeviation() const { return state_.smoothed_deviation; }
    bool eyeContact() const { return state_.eye_contact; }
    double contactRatio() const { return state_.contact_ratio; }

    const State& state() const { return state_; }

private:
    ConfigPtr config_;
    State state_;
};

} // namespace engagement

#endif // GAZE_DETECTOR_HPP
