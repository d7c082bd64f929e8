#ifndef GESTURE_DETECTOR_HPP
#define GESTURE_DETECTOR_HPP

#include "../engagement_config.hpp"
#include "../landmark_frame.hpp"
#include "../rolling_window.hpp"

namespace engagement {

// Nod / shake detection from oscillation of the nose tip inside the face box.
// A nod is counted on the vertical axis, a shake on the horizontal one. Each
// gesture flag is true for exactly one frame, then held off for
// gesture_cooldown_frames.
class GestureDetector {
public:
    struct State {
        RollingWindow<double> x_history;   // gesture_window
        RollingWindow<double> y_history;   // gesture_window
        int nod_cooldown = 0;
        int shake_cooldown = 0;

        bool head_nod = false;
        bool head_shake = false;

        explicit State(const EngagementConfig& config);
        bool operator==(const State& other) const;
        bool operator!=(const State& other) const { return !(*this == other); }
    };

    explicit GestureDetector(ConfigPtr config);

    void update(const LandmarkFrame& frame);
    void updatePosition(double x, double y);

    // Direction reversals / 2 over consecutive differences, ignoring steps
    // smaller than deadzone.
    static int countOscillations(const RollingWindow<double>& history, double deadzone);

    void reset();

    bool headNod() const { return state_.head_nod; }
    bool headShake() const { return state_.head_shake; }
    int nodCooldown() const { return state_.nod_cooldown; }
    int shakeCooldown() const { return state_.shake_cooldown; }

    const State& state() const { return state_; }

private:
    ConfigPtr config_;
    State state_;
};

} // namespace engagement

#endif // GESTURE_DETECTOR_HPP
