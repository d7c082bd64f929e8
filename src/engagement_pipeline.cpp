#include "engagement_pipeline.hpp"
#include "geometry.hpp"
#include "scoring/score_math.hpp"
#include <algorithm>
#include <iostream>

namespace engagement {

EngagementPipeline::EngagementPipeline(ConfigPtr config)
    : config_(requireConfig(std::move(config), "EngagementPipeline")),
      layout_(config_->layout()),
      ear_(config_),
      head_pose_(config_),
      gaze_(config_),
      gesture_(config_),
      confusion_(config_),
      engagement_(config_),
      nose_x_history_(static_cast<size_t>(config_->confusion_window)),
      nose_y_history_(static_cast<size_t>(config_->confusion_window)),
      frame_times_(FPS_WINDOW),
      frame_number_(0) {}

EngagementResult EngagementPipeline::processLandmarks(const std::optional<LandmarkFrame>& landmarks) {
    return step(landmarks, 0.0, 0.0);
}

EngagementResult EngagementPipeline::processFrame(const cv::Mat& frame, LandmarkDetector& detector) {
    Clock::time_point start = Clock::now();
    double fps = updateFps(start);

    std::optional<LandmarkFrame> landmarks = detector.detect(frame);

    double inference_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    return step(landmarks, fps, roundTo(inference_ms, 1));
}

EngagementResult EngagementPipeline::step(const std::optional<LandmarkFrame>& landmarks,
                                          double fps, double inference_ms) {
    if (landmarks && landmarks->layout() != layout_) {
        throw LandmarkContractError("Landmark layout '" + landmarks->layout().name +
                                    "' does not match configured layout '" + layout_.name + "'");
    }

    frame_number_++;

    EngagementResult result;
    result.frame_number = frame_number_;
    result.fps = fps;
    result.inference_ms = inference_ms;

    if (!landmarks) {
        result.face_detected = false;
        return result;
    }

    const LandmarkFrame& frame = *landmarks;
    result.face_detected = true;

    ear_.update(frame);
    result.ear_left = ear_.earLeft();
    result.ear_right = ear_.earRight();
    result.ear_avg = ear_.earAvg();
    result.is_blinking = ear_.isBlinking();
    result.is_sleeping = ear_.isSleeping();
    result.blink_count = ear_.totalBlinks();
    result.blinks_in_window = ear_.blinksInWindow();
    result.blinks_per_minute = ear_.blinksPerMinute();

    head_pose_.update(frame);
    result.tilt_angle_deg = head_pose_.tiltAngleDeg();
    result.smoothed_tilt_deg = head_pose_.smoothedAngle();
    result.is_tilted = head_pose_.isTilted();

    gaze_.update(frame);
    result.eye_contact = gaze_.eyeContact();
    result.contact_ratio = gaze_.contactRatio();
    result.nose_deviation = gaze_.deviation();

    gesture_.update(frame);
    result.head_nod = gesture_.headNod();
    result.head_shake = gesture_.headShake();

    result.micro_movement = updateMicroMovement(frame);

    result.confusion_score = confusion_.compute(ear_.blinksPerMinute(), head_pose_.angleVariance(),
                                                gaze_.gazeLoss(), result.micro_movement);

    result.engagement_score = engagement_.compute(ear_.normalizedOpenness(), head_pose_.stability(),
                                                  gaze_.contactRatio(), result.confusion_score);
    result.raw_engagement_score = engagement_.rawScore();

    if (logger_ && frame_number_ % config_->log_interval_frames == 0) {
        logger_->writeRow(result);
    }

    return result;
}

double EngagementPipeline::updateMicroMovement(const LandmarkFrame& frame) {
    cv::Point2d nose = geometry::nosePositionNormalized(frame);
    nose_x_history_.push(nose.x);
    nose_y_history_.push(nose.y);

    if (nose_x_history_.size() < 2) {
        return 0.0;
    }

    double spread = nose_x_history_.variance() + nose_y_history_.variance();
    return std::min(spread / (2.0 * config_->micro_move_high), 1.0);
}

double EngagementPipeline::updateFps(Clock::time_point frame_start) {
    frame_times_.push(frame_start);
    if (frame_times_.size() < 2) {
        return 0.0;
    }

    double elapsed = std::chrono::duration<double>(frame_times_.back() - frame_times_.front()).count();
    double fps = static_cast<double>(frame_times_.size() - 1) / std::max(elapsed, 1e-6);
    return roundTo(fps, 1);
}

void EngagementPipeline::attachLogger(std::unique_ptr<SessionLogger> logger) {
    logger_ = std::move(logger);
}

void EngagementPipeline::reset() {
    ear_.reset();
    head_pose_.reset();
    gaze_.reset();
    gesture_.reset();
    engagement_.reset();

    nose_x_history_ = RollingWindow<double>(static_cast<size_t>(config_->confusion_window));
    nose_y_history_ = RollingWindow<double>(static_cast<size_t>(config_->confusion_window));
    frame_times_ = RollingWindow<Clock::time_point>(FPS_WINDOW);
    frame_number_ = 0;
}

void EngagementPipeline::close() {
    if (logger_) {
        logger_->close();
    }
}

} // namespace engagement
