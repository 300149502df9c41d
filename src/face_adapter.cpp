#include "face_adapter.hpp"

#include <iostream>

namespace spex {

SFaceAdapter::SFaceAdapter(const std::string& detect_model, const std::string& embed_model,
                           float score_threshold) {
    try {
        detector_ = cv::FaceDetectorYN::create(detect_model, "", cv::Size(320, 320), score_threshold, 0.3f, 5000);
        recognizer_ = cv::FaceRecognizerSF::create(embed_model, "");
        ready_ = !detector_.empty() && !recognizer_.empty();
        std::cout << "[INFO] Loaded face models: " << detect_model << ", " << embed_model << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Could not load face models: " << e.what() << std::endl;
        ready_ = false;
    }
}

std::vector<DetectionRecord> SFaceAdapter::detect(const Frame& frame) {
    std::vector<DetectionRecord> out;
    if (!ready_ || frame.empty()) return out;

    detector_->setInputSize(frame.image.size());
    cv::Mat faces;
    detector_->detect(frame.image, faces);
    if (faces.empty()) return out;

    const cv::Rect bounds(0, 0, frame.width(), frame.height());
    for (int i = 0; i < faces.rows; ++i) {
        // Row layout: x, y, w, h, five landmark pairs, score.
        const float* row = faces.ptr<float>(i);

        cv::Mat aligned;
        recognizer_->alignCrop(frame.image, faces.row(i), aligned);
        cv::Mat feature;
        recognizer_->feature(aligned, feature);
        cv::Mat unit;
        cv::normalize(feature.reshape(1, 1), unit);

        DetectionRecord rec;
        rec.modality = Modality::FACE;
        rec.label = "face";
        rec.confidence = row[14];
        rec.region = cv::Rect(static_cast<int>(row[0]), static_cast<int>(row[1]),
                              static_cast<int>(row[2]), static_cast<int>(row[3])) & bounds;
        rec.features.assign(unit.ptr<float>(0), unit.ptr<float>(0) + unit.cols);
        out.push_back(std::move(rec));
    }
    return out;
}

}  // namespace spex
