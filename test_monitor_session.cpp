#include "src/monitor_session.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace engagement;
using test_support::check;
using test_fakes::FakeDetector;
using test_fakes::FakeSource;

static ConfigPtr testConfig(int stop_timeout_ms = 2000) {
    auto config = std::make_shared<EngagementConfig>();
    config->max_consecutive_read_failures = 5;
    config->stop_timeout_ms = stop_timeout_ms;
    config->validate();
    return config;
}

static void testLatestResultCell() {
    std::cout << "Latest result cell" << std::endl;
    LatestResultCell cell;
    check(cell.get() == nullptr, "empty before the first publish");

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (int i = 1; i <= 5000; i++) {
            EngagementResult r;
            r.frame_number = i;
            r.blink_count = i;
            r.engagement_score = static_cast<double>(i % 100);
            cell.publish(r);
        }
        done = true;
    });

    bool consistent = true;
    int64_t last_seen = 0;
    while (!done) {
        auto snapshot = cell.get();
        if (snapshot) {
            consistent = consistent && snapshot->blink_count == snapshot->frame_number &&
                         snapshot->engagement_score == static_cast<double>(snapshot->frame_number % 100) &&
                         snapshot->frame_number >= last_seen;
            last_seen = snapshot->frame_number;
        }
    }
    writer.join();

    check(consistent, "readers only see whole snapshots, in order");
    check(cell.get() && cell.get()->frame_number == 5000, "last publish wins");
}

static void testEndOfVideo() {
    std::cout << "Video file runs to the end" << std::endl;
    MonitorSession session;
    auto source = std::make_shared<FakeSource>(25, ReadStatus::END_OF_STREAM);

    std::atomic<int> callbacks{0};
    session.setResultCallback([&](const EngagementResult&) { callbacks++; });

    check(session.start(testConfig(), source, std::make_unique<FakeDetector>(), false),
          "session starts with an opened source");
    check(session.waitFinished(std::chrono::milliseconds(5000)), "capture thread ends on its own");
    check(!session.isRunning(), "not running after the video ends");
    check(session.lastError().empty(), "end of video is not an error");
    check(session.latest() && session.latest()->frame_number == 25 && session.latest()->face_detected,
          "last snapshot is the final frame");
    check(callbacks == 25, "callback sees every snapshot");
    check(session.stop() && source->released(), "stop after the end releases the capture");
}

static void testCaptureFailure() {
    std::cout << "Camera stops delivering frames" << std::endl;
    MonitorSession session;
    auto source = std::make_shared<FakeSource>(3, ReadStatus::FAILED);

    check(session.start(testConfig(), source, std::make_unique<FakeDetector>(), false), "session starts");
    check(session.waitFinished(std::chrono::milliseconds(5000)), "gives up after repeated failures");
    check(session.lastError() == MonitorSession::CAPTURE_UNAVAILABLE, "error reads capture_unavailable");
    check(session.latest() && session.latest()->frame_number == 3, "snapshots before the failure kept");
    session.stop();
}

static void testDetectorError() {
    std::cout << "Detector error" << std::endl;
    MonitorSession session;
    auto source = std::make_shared<FakeSource>(100, ReadStatus::END_OF_STREAM);

    check(session.start(testConfig(), source, std::make_unique<FakeDetector>(true), false), "session starts");
    check(session.waitFinished(std::chrono::milliseconds(5000)), "capture thread ends");
    check(session.lastError() == "landmark model crashed", "error message kept for status");
    check(!session.isRunning(), "not running after the error");
    session.stop();
}

static void testStartStop() {
    std::cout << "Start and stop" << std::endl;
    MonitorSession session;
    auto source = std::make_shared<FakeSource>(1000000, ReadStatus::END_OF_STREAM, 2);

    check(session.start(testConfig(), source, std::make_unique<FakeDetector>(), false), "first start succeeds");
    auto second = std::make_shared<FakeSource>(10, ReadStatus::END_OF_STREAM);
    check(!session.start(testConfig(), second, std::make_unique<FakeDetector>(), false),
          "second start while running is refused");
    check(session.isRunning(), "first session keeps running");

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    check(session.stop(), "stop finishes within the timeout");
    check(!session.isRunning() && source->released(), "stopped and capture released");
    check(session.lastError().empty(), "a requested stop is not an error");

    auto mesh = std::make_shared<EngagementConfig>();
    mesh->landmark_layout = "mediapipe478";
    mesh->validate();
    auto third = std::make_shared<FakeSource>(10, ReadStatus::END_OF_STREAM);
    check(!session.start(mesh, third, std::make_unique<FakeDetector>(), false),
          "detector with the wrong landmark layout is refused");
    check(!session.lastError().empty() && third->released(), "refusal reported and source released");

    auto fourth = std::make_shared<FakeSource>(5, ReadStatus::END_OF_STREAM);
    check(session.start(testConfig(), fourth, std::make_unique<FakeDetector>(), false) &&
          session.waitFinished(std::chrono::milliseconds(5000)) &&
          session.lastError().empty() && session.latest()->frame_number == 5,
          "a new session starts from frame 1 with a clean error");
    session.stop();
}

static void testFailedStartKeepsRunningSession() {
    std::cout << "Failed start next to a running session" << std::endl;
    MonitorSession session;
    auto source = std::make_shared<FakeSource>(1000000, ReadStatus::END_OF_STREAM, 2);

    check(session.start(testConfig(), source, std::make_unique<FakeDetector>(), false), "session starts");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // Second start naming a video that cannot be opened
    check(!session.start(testConfig(), SourceSpec::file("/nonexistent/lecture.mp4"), false),
          "start with an unusable source is refused");
    check(session.isRunning(), "running session is still reported as running");
    check(session.lastError().empty(), "running session's error is untouched");
    check(session.latest() != nullptr && session.latest()->frame_number > 0,
          "running session's snapshots stay readable");
    check(session.stop(), "stop still reaches the capture thread");
    check(source->released(), "capture released");
}

static void testUnvalidatedConfig() {
    std::cout << "Unvalidated configuration" << std::endl;
    MonitorSession session;

    auto bad = std::make_shared<EngagementConfig>();
    bad->engagement_weights.eye_contact = 0.9;
    auto source = std::make_shared<FakeSource>(10, ReadStatus::END_OF_STREAM);

    bool threw = false;
    try {
        session.start(bad, source, std::make_unique<FakeDetector>(), false);
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw, "start with an invalid configuration throws ConfigError");
    check(!session.isRunning(), "nothing started");

    threw = false;
    try {
        session.start(bad, SourceSpec::file("/nonexistent/lecture.mp4"), false);
    } catch (const ConfigError&) {
        threw = true;
    }
    check(threw, "same for a source opened by the session");
}

static void testBoundedStop() {
    std::cout << "Bounded stop" << std::endl;
    MonitorSession session;
    auto source = std::make_shared<FakeSource>(1000000, ReadStatus::END_OF_STREAM, 500);

    check(session.start(testConfig(50), source, std::make_unique<FakeDetector>(), false), "session starts");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto begin = std::chrono::steady_clock::now();
    bool finished = session.stop();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin).count();

    check(!finished, "stuck capture thread reported as not finished");
    check(waited < 400, "stop returns after the timeout instead of waiting for the read");
    check(source->released(), "capture released even though the thread is stuck");

    // Let the detached thread see the stop flag and exit
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    check(!session.isRunning(), "detached thread exits after its read returns");
}

int main() {
    std::cout << "\n==== Monitor Session Test ====\n" << std::endl;

    testLatestResultCell();
    testEndOfVideo();
    testCaptureFailure();
    testDetectorError();
    testStartStop();
    testFailedStartKeepsRunningSession();
    testUnvalidatedConfig();
    testBoundedStop();

    return test_support::finish("Monitor session");
}
