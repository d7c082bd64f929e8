#ifndef ENGAGEMENT_PIPELINE_HPP
#define ENGAGEMENT_PIPELINE_HPP

#include "detectors/ear_detector.hpp"
#include "detectors/gaze_detector.hpp"
#include "detectors/gesture_detector.hpp"
#include "detectors/head_pose_detector.hpp"
#include "engagement_config.hpp"
#include "engagement_result.hpp"
#include "landmark_detector.hpp"
#include "rolling_window.hpp"
#include "scoring/confusion_scorer.hpp"
#include "scoring/engagement_scorer.hpp"
#include "session_logger.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace engagement {

// Per-frame orchestrator: landmarks -> four detectors -> micro-movement ->
// confusion -> engagement -> snapshot.
//
// Strictly sequential: one frame completes before the next starts. Not
// thread-safe; drive it from a single thread.
//
// A frame without a face only advances the frame sequence. Detector windows
// and counters are left exactly as they were.
class EngagementPipeline {
public:
    static constexpr size_t FPS_WINDOW = 30;

    explicit EngagementPipeline(ConfigPtr config);

    // Core step. Throws LandmarkContractError if the frame's layout is not the
    // configured one.
    EngagementResult processLandmarks(const std::optional<LandmarkFrame>& landmarks);

    // Runs the landmark collaborator on `frame`, fills fps / inference_ms and
    // delegates to processLandmarks. Collaborator exceptions propagate.
    EngagementResult processFrame(const cv::Mat& frame, LandmarkDetector& detector);

    // Sampled snapshots go to `logger` from now on. nullptr detaches.
    void attachLogger(std::unique_ptr<SessionLogger> logger);
    SessionLogger* logger() const { return logger_.get(); }

    // Fresh detectors, scorers and histories; frame sequence restarts at 0.
    // An attached logger stays attached.
    void reset();

    // Flushes and closes the attached logger
    void close();

    int64_t frameNumber() const { return frame_number_; }
    const EngagementConfig& config() const { return *config_; }

    const EarDetector& earDetector() const { return ear_; }
    const HeadPoseDetector& headPoseDetector() const { return head_pose_; }
    const GazeDetector& gazeDetector() const { return gaze_; }
    const GestureDetector& gestureDetector() const { return gesture_; }
    const EngagementScorer& engagementScorer() const { return engagement_; }
    const RollingWindow<double>& noseXHistory() const { return nose_x_history_; }
    const RollingWindow<double>& noseYHistory() const { return nose_y_history_; }

private:
    using Clock = std::chrono::steady_clock;

    EngagementResult step(const std::optional<LandmarkFrame>& landmarks, double fps,
                          double inference_ms);
    double updateMicroMovement(const LandmarkFrame& frame);
    double updateFps(Clock::time_point frame_start);

    ConfigPtr config_;
    LandmarkLayout layout_;

    EarDetector ear_;
    HeadPoseDetector head_pose_;
    GazeDetector gaze_;
    GestureDetector gesture_;
    ConfusionScorer confusion_;
    EngagementScorer engagement_;

    RollingWindow<double> nose_x_history_;
    RollingWindow<double> nose_y_history_;

    RollingWindow<Clock::time_point> frame_times_;
    int64_t frame_number_;

    std::unique_ptr<SessionLogger> logger_;
};

} // namespace engagement

#endif // ENGAGEMENT_PIPELINE_HPP
