#include "monitor_session.hpp"
#include "dlib_landmark_detector.hpp"
#include <iostream>

namespace engagement {

void LatestResultCell::publish(EngagementResult result) {
    auto snapshot = std::make_shared<const EngagementResult>(std::move(result));
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = std::move(snapshot);
}

std::shared_ptr<const EngagementResult> LatestResultCell::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

void MonitorSession::SharedState::setError(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex);
    error = message;
}

std::string MonitorSession::SharedState::getError() const {
    std::lock_guard<std::mutex> lock(error_mutex);
    return error;
}

MonitorSession::MonitorSession(std::string models_path)
    : models_path_(std::move(models_path)),
      shared_(std::make_shared<SharedState>()),
      stop_timeout_(5000) {}

MonitorSession::~MonitorSession() {
    if (isRunning()) {
        stop();
    }
    reapFinishedWorker();
}

bool MonitorSession::start(ConfigPtr config, const SourceSpec& source, bool log_enabled) {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (isRunning()) {
        std::cout << "[Session] Already running" << std::endl;
        return false;
    }
    // The previous capture must be released before the device is opened again
    reapFinishedWorker();

    config = requireConfig(std::move(config), "MonitorSession");

    auto frame_source = std::make_shared<VideoFrameSource>();
    if (!frame_source->open(source, config->frame_width, config->frame_height, config->target_fps)) {
        recordStartFailure("Cannot open " + source.describe());
        return false;
    }

    auto detector = std::make_unique<DlibLandmarkDetector>(config->landmark_model);
    if (!detector->initialize(models_path_)) {
        frame_source->release();
        recordStartFailure("Failed to load landmark model from " + models_path_);
        return false;
    }

    return startLocked(std::move(config), std::move(frame_source), std::move(detector), log_enabled);
}

bool MonitorSession::start(ConfigPtr config, std::shared_ptr<FrameSource> source,
                           std::unique_ptr<LandmarkDetector> detector, bool log_enabled) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return startLocked(std::move(config), std::move(source), std::move(detector), log_enabled);
}

bool MonitorSession::startLocked(ConfigPtr config, std::shared_ptr<FrameSource> source,
                                 std::unique_ptr<LandmarkDetector> detector, bool log_enabled) {
    if (isRunning()) {
        std::cout << "[Session] Already running" << std::endl;
        return false;
    }

    // An invalid configuration is a caller bug, not a session failure
    config = requireConfig(std::move(config), "MonitorSession");

    reapFinishedWorker();

    // New session: previous snapshot and error are dropped here
    auto shared = std::make_shared<SharedState>();
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        shared_ = shared;
    }

    try {
        if (!source || !detector) {
            throw std::invalid_argument("MonitorSession requires a frame source and a landmark detector");
        }
        if (detector->layout() != config->layout()) {
            throw LandmarkContractError("Landmark detector layout '" + detector->layout().name +
                                        "' does not match configured layout '" +
                                        config->landmark_layout + "'");
        }

        auto pipeline = std::make_unique<EngagementPipeline>(config);
        pipeline->reset();
        if (log_enabled) {
            pipeline->attachLogger(std::make_unique<SessionLogger>(
                SessionLogger::sessionFilePath(config->log_dir), config->log_flush_rows));
        }

        std::promise<void> done;
        worker_done_ = done.get_future();
        source_ = source;
        stop_timeout_ = std::chrono::milliseconds(config->stop_timeout_ms);
        shared->running = true;

        worker_ = std::thread(&MonitorSession::runWorker, shared, std::move(source),
                              std::move(detector), std::move(pipeline),
                              config->max_consecutive_read_failures, callback_, std::move(done));

        std::cout << "[Session] Pipeline started" << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Session] Failed to start: " << e.what() << std::endl;
        shared->running = false;
        shared->setError(e.what());
        if (source) {
            source->release();
        }
        return false;
    }
}

void MonitorSession::runWorker(std::shared_ptr<SharedState> shared,
                               std::shared_ptr<FrameSource> source,
                               std::unique_ptr<LandmarkDetector> detector,
                               std::unique_ptr<EngagementPipeline> pipeline,
                               int max_read_failures,
                               ResultCallback callback,
                               std::promise<void> done) {
    int consecutive_failures = 0;

    try {
        cv::Mat frame;
        while (!shared->stop_requested) {
            ReadStatus status = source->read(frame);

            if (status == ReadStatus::OK) {
                consecutive_failures = 0;
                EngagementResult result = pipeline->processFrame(frame, *detector);
                if (callback) {
                    callback(result);
                }
                shared->latest.publish(std::move(result));
                continue;
            }

            if (status == ReadStatus::END_OF_STREAM) {
                std::cout << "[Session] End of video after " << pipeline->frameNumber()
                          << " frames" << std::endl;
                break;
            }

            if (status == ReadStatus::CLOSED) {
                if (!shared->stop_requested) {
                    std::cerr << "[Session] Capture closed unexpectedly" << std::endl;
                    shared->setError(CAPTURE_UNAVAILABLE);
                }
                break;
            }

            // Transient read failure: skip and try the next frame
            if (++consecutive_failures > max_read_failures) {
                std::cerr << "[Session] " << consecutive_failures
                          << " consecutive read failures, giving up" << std::endl;
                shared->setError(CAPTURE_UNAVAILABLE);
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[Session] Capture loop error: " << e.what() << std::endl;
        shared->setError(e.what());
    }

    try {
        pipeline->close();
    } catch (const std::exception& e) {
        std::cerr << "[Session] Error closing session log: " << e.what() << std::endl;
    }

    shared->running = false;
    done.set_value();
}

bool MonitorSession::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    sharedState()->stop_requested = true;

    bool finished = true;
    if (worker_.joinable()) {
        if (worker_done_.valid() &&
            worker_done_.wait_for(stop_timeout_) == std::future_status::ready) {
            worker_.join();
        } else {
            std::cerr << "[Session] Capture thread did not stop within "
                      << stop_timeout_.count() << " ms, detaching" << std::endl;
            worker_.detach();
            finished = false;
        }
    }

    if (source_) {
        source_->release();
        source_.reset();
    }

    std::cout << "[Session] Pipeline stopped" << std::endl;
    return finished;
}

bool MonitorSession::waitFinished(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!worker_done_.valid()) {
        return true;
    }
    return worker_done_.wait_for(timeout) == std::future_status::ready;
}

void MonitorSession::reapFinishedWorker() {
    if (worker_.joinable()) {
        worker_.join();
    }
    if (source_) {
        source_->release();
        source_.reset();
    }
}

void MonitorSession::recordStartFailure(const std::string& message) {
    std::cerr << "[Session] Failed to start: " << message << std::endl;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (shared_->running) {
        return;
    }
    auto shared = std::make_shared<SharedState>();
    shared->setError(message);
    shared_ = std::move(shared);
}

std::shared_ptr<MonitorSession::SharedState> MonitorSession::sharedState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return shared_;
}

bool MonitorSession::isRunning() const {
    return sharedState()->running;
}

std::string MonitorSession::lastError() const {
    return sharedState()->getError();
}

std::shared_ptr<const EngagementResult> MonitorSession::latest() const {
    return sharedState()->latest.get();
}

} // namespace engagement
