#ifndef MONITOR_SESSION_HPP
#define MONITOR_SESSION_HPP

#include "engagement_pipeline.hpp"
#include "frame_source.hpp"
#include "landmark_detector.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace engagement {

// Latest completed snapshot, shared between the capture thread and readers.
// publish() swaps in a fully built result; get() hands out a pointer to an
// immutable one, so a reader never sees a half-written snapshot.
class LatestResultCell {
public:
    void publish(EngagementResult result);
    std::shared_ptr<const EngagementResult> get() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const EngagementResult> latest_;
};

// One monitoring session: a capture thread pulling frames from a FrameSource
// through an EngagementPipeline and publishing every snapshot.
//
// The thread stops cooperatively (stop flag checked once per frame). stop()
// waits a bounded time for it, then releases the capture no matter what.
// The last snapshot and any error stay readable until the next start().
class MonitorSession {
public:
    using ResultCallback = std::function<void(const EngagementResult&)>;

    static constexpr const char* CAPTURE_UNAVAILABLE = "capture_unavailable";

    explicit MonitorSession(std::string models_path = "./models");
    ~MonitorSession();

    MonitorSession(const MonitorSession&) = delete;
    MonitorSession& operator=(const MonitorSession&) = delete;

    // Opens the source named by `source`, loads the dlib landmark model and
    // starts the capture thread. Returns false when already running or when
    // something fails to open; the cause is in lastError(). An invalid
    // configuration throws ConfigError.
    bool start(ConfigPtr config, const SourceSpec& source, bool log_enabled);

    // Same with caller-provided, already opened collaborators.
    bool start(ConfigPtr config, std::shared_ptr<FrameSource> source,
               std::unique_ptr<LandmarkDetector> detector, bool log_enabled);

    // Returns true if the capture thread finished within stop_timeout_ms.
    bool stop();

    // Blocks until the capture thread ends or `timeout` passes.
    bool waitFinished(std::chrono::milliseconds timeout);

    bool isRunning() const;
    std::string lastError() const;
    std::shared_ptr<const EngagementResult> latest() const;

    // Called on the capture thread for every snapshot. Set before start().
    void setResultCallback(ResultCallback callback) { callback_ = std::move(callback); }

private:
    // State the capture thread co-owns. It outlives a detached thread.
    struct SharedState {
        std::atomic<bool> stop_requested{false};
        std::atomic<bool> running{false};
        LatestResultCell latest;

        mutable std::mutex error_mutex;
        std::string error;

        void setError(const std::string& message);
        std::string getError() const;
    };

    static void runWorker(std::shared_ptr<SharedState> shared,
                          std::shared_ptr<FrameSource> source,
                          std::unique_ptr<LandmarkDetector> detector,
                          std::unique_ptr<EngagementPipeline> pipeline,
                          int max_read_failures,
                          ResultCallback callback,
                          std::promise<void> done);

    // Caller holds control_mutex_
    bool startLocked(ConfigPtr config, std::shared_ptr<FrameSource> source,
                     std::unique_ptr<LandmarkDetector> detector, bool log_enabled);

    void reapFinishedWorker();
    void recordStartFailure(const std::string& message);
    std::shared_ptr<SharedState> sharedState() const;

    std::string models_path_;

    // Swapped by start(); read from any thread through sharedState()
    mutable std::mutex state_mutex_;
    std::shared_ptr<SharedState> shared_;
    std::shared_ptr<FrameSource> source_;
    std::thread worker_;
    std::future<void> worker_done_;
    std::chrono::milliseconds stop_timeout_;
    ResultCallback callback_;
    std::mutex control_mutex_;
};

} // namespace engagement

#endif // MONITOR_SESSION_HPP
