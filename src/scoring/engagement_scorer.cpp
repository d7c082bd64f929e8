#include "engagement_scorer.hpp"
#include "score_math.hpp"

namespace engagement {

EngagementScorer::EngagementScorer(ConfigPtr config)
    : config_(requireConfig(std::move(config), "EngagementScorer")),
      score_history_(static_cast<size_t>(config_->engagement_window)) {}

double EngagementScorer::compute(double openness, double stability, double contact_ratio,
                                 double confusion) {
    const EngagementWeights& w = config_->engagement_weights;

    double positive = w.eye_openness * openness +
                      w.head_stability * stability +
                      w.eye_contact * contact_ratio;
    double penalty = w.confusion_penalty * (confusion / 100.0);

    raw_score_ = roundTo(clampUnit(positive - penalty) * 100.0, 1);

    score_history_.push(raw_score_);
    score_ = roundTo(score_history_.mean(), 1);
    return score_;
}

void EngagementScorer::reset() {
    *this = EngagementScorer(config_);
}

bool EngagementScorer::operator==(const EngagementScorer& other) const {
    return score_history_ == other.score_history_ && score_ == other.score_ &&
           raw_score_ == other.raw_score_;
}

} // namespace engagement
