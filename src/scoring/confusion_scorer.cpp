#include "confusion_scorer.hpp"
#include "score_math.hpp"
#include <algorithm>

namespace engagement {

ConfusionScorer::ConfusionScorer(ConfigPtr config)
    : config_(requireConfig(std::move(config), "ConfusionScorer")) {}

double ConfusionScorer::blinkRateSignal(double blinks_per_minute) const {
    double low = config_->blink_rate_low;
    double high = config_->blink_rate_high;
    if (blinks_per_minute <= low) return 0.0;
    if (blinks_per_minute >= high) return 1.0;
    return (blinks_per_minute - low) / (high - low);
}

double ConfusionScorer::compute(double blinks_per_minute, double head_variance, double gaze_loss,
                                double micro_movement) const {
    const ConfusionWeights& w = config_->confusion_weights;

    double raw = w.blink_rate * blinkRateSignal(blinks_per_minute) +
                 w.head_variance * clampUnit(head_variance) +
                 w.gaze_reduction * clampUnit(gaze_loss) +
                 w.micro_movement * clampUnit(micro_movement);

    return roundTo(std::min(raw * 100.0, 100.0), 1);
}

} // namespace engagement
