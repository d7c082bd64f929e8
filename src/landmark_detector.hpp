#ifndef LANDMARK_DETECTOR_HPP
#define LANDMARK_DETECTOR_HPP

#include "landmark_frame.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>

namespace engagement {

// Produces at most one landmark set per frame, for the single tracked face.
class LandmarkDetector {
public:
    virtual ~LandmarkDetector() = default;

    // Load models from `models_path`. Logs and returns false on failure.
    virtual bool initialize(const std::string& models_path) = 0;
    virtual bool isInitialized() const = 0;

    virtual const LandmarkLayout& layout() const = 0;

    // nullopt when no face is found. Throws std::runtime_error when the
    // detector cannot process the frame at all.
    virtual std::optional<LandmarkFrame> detect(const cv::Mat& frame) = 0;
};

} // namespace engagement

#endif // LANDMARK_DETECTOR_HPP
