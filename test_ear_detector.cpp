#include "src/detectors/ear_detector.hpp"
#include "test_support.hpp"
#include <iostream>

using namespace engagement;
using test_support::check;
using test_support::near;

static const double OPEN = 0.30;
static const double CLOSED = 0.15;   // below ear_threshold, above sleep threshold
static const double ASLEEP = 0.10;   // below sleep threshold

// Smoothing of one frame so each step sees the raw EAR
static ConfigPtr unsmoothedConfig() {
    auto config = std::make_shared<EngagementConfig>();
    config->smoothing_window = 1;
    config->validate();
    return config;
}

static void feed(EarDetector& detector, double ear, int frames) {
    for (int i = 0; i < frames; i++) {
        detector.updateEar(ear, ear);
    }
}

static void testBlinkThreshold() {
    std::cout << "Blink minimum duration" << std::endl;
    ConfigPtr config = unsmoothedConfig();

    EarDetector short_closure(config);
    feed(short_closure, OPEN, 5);
    feed(short_closure, CLOSED, config->ear_consec_frames - 1);
    check(short_closure.isBlinking(), "eyes marked closed while below threshold");
    feed(short_closure, OPEN, 1);
    check(short_closure.totalBlinks() == 0, "closure one frame too short is not a blink");
    check(!short_closure.isBlinking(), "reopened eyes clear the closed mark");

    EarDetector full_closure(config);
    feed(full_closure, OPEN, 5);
    feed(full_closure, CLOSED, config->ear_consec_frames);
    check(full_closure.totalBlinks() == 0, "blink is not counted while the eyes are still closed");
    feed(full_closure, OPEN, 1);
    check(full_closure.totalBlinks() == 1, "closure of exactly ear_consec_frames is one blink");
    feed(full_closure, OPEN, 10);
    check(full_closure.totalBlinks() == 1, "open eyes add no further blinks");
}

static void testBlinkRate() {
    std::cout << "Blink rate window" << std::endl;
    ConfigPtr config = unsmoothedConfig();
    EarDetector detector(config);

    // Frames 1-3 closed, frame 4 reopens: blink recorded at frame 4
    feed(detector, CLOSED, 3);
    feed(detector, OPEN, 1);
    check(detector.blinksInWindow() == 1, "blink enters the rate window");

    // 90-frame window at 30 fps is 3 s: one blink is 20 per minute
    check(near(detector.blinksPerMinute(), 20.0), "one blink in 3 s reads 20 per minute");

    feed(detector, OPEN, 90);   // frame 94: cutoff 4, blink at 4 still inside
    check(detector.blinksInWindow() == 1, "blink still counted on the window edge");
    feed(detector, OPEN, 1);    // frame 95: cutoff 5
    check(detector.blinksInWindow() == 0 && detector.blinksPerMinute() == 0.0,
          "blink older than the window is purged");
    check(detector.totalBlinks() == 1, "purging does not touch the cumulative total");

    EarDetector busy(config);
    for (int i = 0; i < 400; i++) {
        feed(busy, CLOSED, 3);
        feed(busy, OPEN, 1);
    }
    check(busy.state().blink_frames.size() <= busy.state().blink_frames.capacity(),
          "blink history stays within its capacity");
    check(busy.totalBlinks() == 400, "cumulative total keeps counting");
}

static void testSleep() {
    std::cout << "Sleep" << std::endl;
    ConfigPtr config = unsmoothedConfig();
    EarDetector detector(config);

    feed(detector, ASLEEP, config->sleep_consec_frames - 1);
    check(!detector.isSleeping(), "not asleep one frame before the threshold");
    feed(detector, ASLEEP, 1);
    check(detector.isSleeping(), "asleep on the sleep_consec_frames-th frame");
    feed(detector, ASLEEP, 30);
    check(detector.isSleeping(), "stays asleep while the eyes stay shut");
    feed(detector, OPEN, 1);
    check(!detector.isSleeping(), "wakes on the first frame above the sleep threshold");

    // The long closure ends in a (very long) blink
    check(detector.totalBlinks() == 1, "closure that ends sleep is also one blink");

    EarDetector long_sleep(config);
    feed(long_sleep, ASLEEP, config->sleep_consec_frames * 4);
    check(long_sleep.state().sleep_counter == config->sleep_consec_frames &&
          long_sleep.state().blink_counter == config->ear_consec_frames,
          "closed-eye counters stop at their thresholds");
    check(long_sleep.isSleeping() && long_sleep.isBlinking(), "capped counters still read as asleep");
    feed(long_sleep, OPEN, 1);
    check(!long_sleep.isSleeping() && long_sleep.totalBlinks() == 1 &&
          long_sleep.state().sleep_counter == 0 && long_sleep.state().blink_counter == 0,
          "reopening after a capped closure records the blink and clears the counters");
}

static void testSmoothingAndOpenness() {
    std::cout << "Smoothing and openness" << std::endl;
    ConfigPtr config = EngagementConfig::defaults();
    EarDetector detector(config);

    check(detector.normalizedOpenness() == 0.0, "no frame yet reads openness 0");

    detector.updateEar(0.20, 0.40);
    check(near(detector.earAvg(), 0.30) && near(detector.smoothedEar(), 0.30), "average of both eyes");
    check(near(detector.normalizedOpenness(), 1.0), "open reference maps to 1");

    feed(detector, 0.15, 9);
    check(near(detector.smoothedEar(), (0.30 + 9 * 0.15) / 10.0), "smoothed over the last 10 frames");
    check(near(detector.normalizedOpenness(), 0.5), "openness uses the unsmoothed average");

    feed(detector, 0.60, 1);
    check(detector.normalizedOpenness() == 1.0, "openness is capped at 1");

    EarDetector fresh(config);
    detector.reset();
    check(detector.state() == fresh.state(), "reset matches a freshly built detector");
}

int main() {
    std::cout << "\n==== EAR Detector Test ====\n" << std::endl;

    testBlinkThreshold();
    testBlinkRate();
    testSleep();
    testSmoothingAndOpenness();

    return test_support::finish("EAR detector");
}
