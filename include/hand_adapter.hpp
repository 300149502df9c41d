#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/dnn.hpp>
#include "frame_types.hpp"

namespace spex {

constexpr int kHandLandmarks = 21;

// Hand landmark collaborator: one record per hand, `features` holding the
// 21 joints as x,y,z triples in frame pixels (MediaPipe joint order).
class HandAdapter {
public:
    virtual ~HandAdapter() = default;
    virtual std::vector<DetectionRecord> detect(const Frame& frame) = 0;
};

// MediaPipe-style landmark regressor (NHWC float input, outputs a 63-value
// landmark tensor and a hand presence score). The model sees one hand per
// input, so with max_hands >= 2 the left and right halves of the frame are
// searched separately and the full frame is the fallback.
class HandLandmarkAdapter : public HandAdapter {
public:
    HandLandmarkAdapter(const std::string& model_path, int input_size = 224,
                        float presence_threshold = 0.7f, int max_hands = 2);

    bool ready() const { return ready_; }
    std::vector<DetectionRecord> detect(const Frame& frame) override;

    static std::vector<cv::Rect> search_regions(const cv::Size& frame_size, int max_hands);

private:
    std::optional<DetectionRecord> detect_in(const cv::Mat& image, const cv::Rect& roi);

    cv::dnn::Net net_;
    std::vector<std::string> output_names_;
    int input_size_;
    float presence_threshold_;
    int max_hands_;
    bool ready_{false};
};

}  // namespace spex
