#include "hand_adapter.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/imgproc.hpp>

namespace spex {

HandLandmarkAdapter::HandLandmarkAdapter(const std::string& model_path, int input_size,
                                         float presence_threshold, int max_hands)
    : input_size_(input_size), presence_threshold_(presence_threshold), max_hands_(max_hands) {
    try {
        net_ = cv::dnn::readNet(model_path);
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        output_names_ = net_.getUnconnectedOutLayersNames();
        ready_ = true;
        std::cout << "[INFO] Loaded hand landmark model: " << model_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Could not load hand landmark model: " << e.what() << std::endl;
        ready_ = false;
    }
}

std::vector<cv::Rect> HandLandmarkAdapter::search_regions(const cv::Size& frame_size, int max_hands) {
    const cv::Rect full(0, 0, frame_size.width, frame_size.height);
    if (max_hands < 2 || frame_size.width < 2) return {full};
    const int half = frame_size.width / 2;
    return {cv::Rect(0, 0, half, frame_size.height),
            cv::Rect(half, 0, frame_size.width - half, frame_size.height)};
}

std::vector<DetectionRecord> HandLandmarkAdapter::detect(const Frame& frame) {
    std::vector<DetectionRecord> out;
    if (!ready_ || frame.empty()) return out;

    const cv::Rect full(0, 0, frame.width(), frame.height());
    for (const auto& roi : search_regions(frame.image.size(), max_hands_)) {
        if (static_cast<int>(out.size()) >= max_hands_) break;
        if (auto hand = detect_in(frame.image, roi)) out.push_back(std::move(*hand));
    }
    // A single hand straddling the split is only visible to the full frame.
    if (out.empty() && max_hands_ >= 2) {
        if (auto hand = detect_in(frame.image, full)) out.push_back(std::move(*hand));
    }
    return out;
}

std::optional<DetectionRecord> HandLandmarkAdapter::detect_in(const cv::Mat& image, const cv::Rect& roi) {
    cv::Mat resized;
    cv::resize(image(roi), resized, cv::Size(input_size_, input_size_));
    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32F, 1.0 / 255.0);

    const int blob_shape[] = {1, input_size_, input_size_, 3};
    cv::Mat blob(4, blob_shape, CV_32F, rgb.ptr<float>());
    net_.setInput(blob);

    std::vector<cv::Mat> outputs;
    net_.forward(outputs, output_names_);

    const float* landmarks = nullptr;
    float presence = 0.0f;
    for (const auto& o : outputs) {
        const size_t n = o.total();
        if (n == static_cast<size_t>(kHandLandmarks * 3) && landmarks == nullptr) {
            landmarks = o.ptr<float>();
        } else if (n == 1) {
            presence = std::max(presence, o.ptr<float>()[0]);
        }
    }
    if (landmarks == nullptr || presence < presence_threshold_) return std::nullopt;

    const float scale_x = static_cast<float>(roi.width) / static_cast<float>(input_size_);
    const float scale_y = static_cast<float>(roi.height) / static_cast<float>(input_size_);

    DetectionRecord rec;
    rec.modality = Modality::HAND;
    rec.label = "hand";
    rec.confidence = presence;
    rec.features.reserve(kHandLandmarks * 3);
    std::vector<cv::Point2f> points;
    for (int j = 0; j < kHandLandmarks; ++j) {
        const float x = landmarks[j * 3] * scale_x + static_cast<float>(roi.x);
        const float y = landmarks[j * 3 + 1] * scale_y + static_cast<float>(roi.y);
        rec.features.push_back(x);
        rec.features.push_back(y);
        rec.features.push_back(landmarks[j * 3 + 2]);
        points.emplace_back(x, y);
    }
    rec.region = cv::boundingRect(points) & cv::Rect(0, 0, image.cols, image.rows);
    return rec;
}

}  // namespace spex
