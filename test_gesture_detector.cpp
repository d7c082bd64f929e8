#include "src/detectors/gesture_detector.hpp"
#include "test_support.hpp"
#include <iostream>
#include <vector>

using namespace engagement;
using test_support::check;
using test_support::syntheticFace;
using test_support::FaceParams;

static RollingWindow<double> windowOf(const std::vector<double>& values) {
    RollingWindow<double> window(values.size() + 1);
    for (double v : values) {
        window.push(v);
    }
    return window;
}

static void testOscillationCount() {
    std::cout << "Oscillation count" << std::endl;
    const double deadzone = 0.008;

    check(GestureDetector::countOscillations(windowOf({0.5, 0.6}), deadzone) == 0,
          "fewer than three samples count nothing");
    check(GestureDetector::countOscillations(windowOf({0.5, 0.6, 0.7, 0.8}), deadzone) == 0,
          "steady drift is not an oscillation");
    check(GestureDetector::countOscillations(windowOf({0.5, 0.6, 0.5}), deadzone) == 0,
          "a single reversal is half a cycle");
    check(GestureDetector::countOscillations(windowOf({0.5, 0.6, 0.5, 0.6}), deadzone) == 1,
          "two reversals make one cycle");
    check(GestureDetector::countOscillations(windowOf({0.5, 0.6, 0.5, 0.6, 0.5, 0.6}), deadzone) == 2,
          "four reversals make two cycles");
    check(GestureDetector::countOscillations(windowOf({0.5, 0.504, 0.5, 0.504, 0.5, 0.504}), deadzone) == 0,
          "jitter inside the deadzone is ignored");
    check(GestureDetector::countOscillations(windowOf({0.5, 0.6, 0.6, 0.6, 0.5, 0.5, 0.6}), deadzone) == 1,
          "pauses between moves do not break the count");
}

static void testNodCooldown() {
    std::cout << "Nod fires once per cooldown" << std::endl;
    ConfigPtr config = EngagementConfig::defaults();
    GestureDetector detector(config);

    // Alternate the nose height by deadzone + 0.002: two full cycles after six frames
    const double low = 0.45;
    const double high = low + config->gesture_deadzone + 0.002;

    std::vector<int> fired;
    for (int frame = 1; frame <= 60; frame++) {
        detector.updatePosition(0.5, frame % 2 == 1 ? low : high);
        if (detector.headNod()) {
            fired.push_back(frame);
        }
        if (detector.headShake()) {
            fired.push_back(-frame);
        }
    }

    check(!fired.empty() && fired[0] == 6, "nod fires on the frame the second cycle completes");
    check(fired.size() >= 2 && fired[1] == 6 + config->gesture_cooldown_frames,
          "pattern continuing is ignored for cooldown - 1 frames, then fires again");
    bool no_shake = true;
    for (int f : fired) {
        no_shake = no_shake && f > 0;
    }
    check(no_shake, "vertical motion never reads as a shake");
}

static void testShake() {
    std::cout << "Shake" << std::endl;
    ConfigPtr config = EngagementConfig::defaults();
    GestureDetector detector(config);

    int shakes = 0;
    int nods = 0;
    for (int frame = 1; frame <= 6; frame++) {
        detector.updatePosition(frame % 2 == 1 ? 0.4 : 0.6, 0.45);
        shakes += detector.headShake() ? 1 : 0;
        nods += detector.headNod() ? 1 : 0;
    }
    check(shakes == 1 && nods == 0 && detector.headShake(), "side to side motion is one shake");
    check(detector.shakeCooldown() == config->gesture_cooldown_frames, "cooldown starts at its full length");

    detector.updatePosition(0.4, 0.45);
    check(!detector.headShake() && detector.shakeCooldown() == config->gesture_cooldown_frames - 1,
          "flag is true for one frame only");

    GestureDetector from_landmarks(config);
    for (int frame = 1; frame <= 6; frame++) {
        FaceParams params;
        params.nose_dx = frame % 2 == 1 ? -0.1 : 0.1;
        from_landmarks.update(syntheticFace(params));
    }
    check(from_landmarks.headShake(), "shake read from landmark frames");

    GestureDetector fresh(config);
    from_landmarks.reset();
    check(from_landmarks.state() == fresh.state(), "reset matches a freshly built detector");
}

int main() {
    std::cout << "\n==== Gesture Detector Test ====\n" << std::endl;

    testOscillationCount();
    testNodCooldown();
    testShake();

    return test_support::finish("Gesture detector");
}
