#pragma once

#include <string>
#include <vector>
#include <opencv2/objdetect.hpp>
#include "frame_types.hpp"

namespace spex {

// Face embedding collaborator: one record per detected face, carrying the
// identity embedding in `features` and the face box in `region`.
class FaceAdapter {
public:
    virtual ~FaceAdapter() = default;
    virtual std::vector<DetectionRecord> detect(const Frame& frame) = 0;
};

// YuNet detection + SFace embedding, both shipped with OpenCV's objdetect.
class SFaceAdapter : public FaceAdapter {
public:
    SFaceAdapter(const std::string& detect_model, const std::string& embed_model,
                 float score_threshold = 0.8f);

    bool ready() const { return ready_; }
    std::vector<DetectionRecord> detect(const Frame& frame) override;

private:
    cv::Ptr<cv::FaceDetectorYN> detector_;
    cv::Ptr<cv::FaceRecognizerSF> recognizer_;
    bool ready_{false};
};

}  // namespace spex
