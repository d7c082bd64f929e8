#ifndef ENGAGEMENT_SCORER_HPP
#define ENGAGEMENT_SCORER_HPP

#include "../engagement_config.hpp"
#include "../rolling_window.hpp"

namespace engagement {

// Engagement score in [0, 100].
//
//   raw   = clamp(w_open*openness + w_stab*stability + w_contact*contact
//                 - w_penalty*confusion/100, 0, 1) * 100
//   score = mean of the last engagement_window raw values
//
// Both are rounded to one decimal.
class EngagementScorer {
public:
    explicit EngagementScorer(ConfigPtr config);

    // Returns the smoothed score.
    double compute(double openness, double stability, double contact_ratio, double confusion);

    double score() const { return score_; }
    double rawScore() const { return raw_score_; }
    const RollingWindow<double>& history() const { return score_history_; }

    void reset();

    bool operator==(const EngagementScorer& other) const;
    bool operator!=(const EngagementScorer& other) const { return !(*this == other); }

private:
    ConfigPtr config_;
    RollingWindow<double> score_history_;
    double score_ = 50.0;
    double raw_score_ = 50.0;
};

} // namespace engagement

#endif // ENGAGEMENT_SCORER_HPP
