#ifndef CONFUSION_SCORER_HPP
#define CONFUSION_SCORER_HPP

#include "../engagement_config.hpp"

namespace engagement {

// Confusion score in [0, 100] from four normalized cues. Holds no per-frame
// state: the same inputs always give the same score.
class ConfusionScorer {
public:
    explicit ConfusionScorer(ConfigPtr config);

    double compute(double blinks_per_minute, double head_variance, double gaze_loss,
                   double micro_movement) const;

    // 0 at/below blink_rate_low, 1 at/above blink_rate_high, linear between.
    double blinkRateSignal(double blinks_per_minute) const;

private:
    ConfigPtr config_;
};

} // namespace engagement

#endif // CONFUSION_SCORER_HPP
