#ifndef DLIB_LANDMARK_DETECTOR_HPP
#define DLIB_LANDMARK_DETECTOR_HPP

#include "landmark_detector.hpp"
#include <dlib/opencv.h>
#include <dlib/image_processing.h>
#include <dlib/image_processing/frontal_face_detector.h>
#include <string>

namespace engagement {

// HOG face detector + 68-point shape predictor. Tracks the largest face.
class DlibLandmarkDetector : public LandmarkDetector {
public:
    explicit DlibLandmarkDetector(std::string model_file = "shape_predictor_68_face_landmarks.dat");
    ~DlibLandmarkDetector() override = default;

    bool initialize(const std::string& models_path) override;
    bool isInitialized() const override { return initialized_; }

    const LandmarkLayout& layout() const override { return layout_; }

    std::optional<LandmarkFrame> detect(const cv::Mat& frame) override;

private:
    dlib::frontal_face_detector face_detector_;
    dlib::shape_predictor shape_predictor_;
    std::string model_file_;
    LandmarkLayout layout_;
    bool initialized_;
};

} // namespace engagement

#endif // DLIB_LANDMARK_DETECTOR_HPP
