#include "dlib_landmark_detector.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace engagement {

DlibLandmarkDetector::DlibLandmarkDetector(std::string model_file)
    : model_file_(std::move(model_file)),
      layout_(LandmarkLayout::dlib68()),
      initialized_(false) {
    face_detector_ = dlib::get_frontal_face_detector();
}

bool DlibLandmarkDetector::initialize(const std::string& models_path) {
    std::string shape_predictor_path = models_path.empty() ? model_file_ : models_path + "/" + model_file_;

    try {
        std::cout << "[Pipeline] Loading landmark model..." << std::endl;
        dlib::deserialize(shape_predictor_path) >> shape_predictor_;

        if (shape_predictor_.num_parts() != layout_.point_count) {
            std::cerr << "[Pipeline] Shape predictor has " << shape_predictor_.num_parts()
                      << " parts, expected " << layout_.point_count << std::endl;
            initialized_ = false;
            return false;
        }

        initialized_ = true;
        std::cout << "[Pipeline] Shape predictor loaded: " << shape_predictor_path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Error loading landmark model: " << e.what() << std::endl;
        initialized_ = false;
        return false;
    }
}

std::optional<LandmarkFrame> DlibLandmarkDetector::detect(const cv::Mat& frame) {
    if (!initialized_) {
        throw std::runtime_error("Landmark detector not initialized");
    }
    if (frame.empty()) {
        throw std::runtime_error("Empty frame passed to landmark detector");
    }
    if (frame.type() != CV_8UC3) {
        throw std::runtime_error("Landmark detector expects an 8-bit BGR frame");
    }

    dlib::cv_image<dlib::bgr_pixel> dlib_image(frame);
    std::vector<dlib::rectangle> faces = face_detector_(dlib_image);

    if (faces.empty()) {
        return std::nullopt;
    }

    // Single-face tracking: the largest face wins
    dlib::rectangle largest_face = faces[0];
    for (const auto& face : faces) {
        if (face.area() > largest_face.area()) {
            largest_face = face;
        }
    }

    dlib::full_object_detection shape = shape_predictor_(dlib_image, largest_face);

    // Hand points over normalized, the same contract any landmark model meets
    const float width = static_cast<float>(frame.cols);
    const float height = static_cast<float>(frame.rows);
    std::vector<cv::Point2f> normalized;
    normalized.reserve(shape.num_parts());
    for (unsigned long i = 0; i < shape.num_parts(); ++i) {
        const dlib::point& p = shape.part(i);
        normalized.emplace_back(static_cast<float>(p.x()) / width,
                                static_cast<float>(p.y()) / height);
    }

    return LandmarkFrame::fromNormalized(normalized, frame.cols, frame.rows, layout_);
}

} // namespace engagement
