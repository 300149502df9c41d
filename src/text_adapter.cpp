#include "text_adapter.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <numeric>
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

namespace spex {

namespace {
cv::Mat otsu(const cv::Mat& gray) {
    cv::Mat out;
    cv::threshold(gray, out, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    return out;
}

// Grayscale clean-up tuned per kind of text, returned as 3 channels for the
// recognizer.
cv::Mat preprocess(const cv::Mat& bgr, TextMode mode) {
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

    cv::Mat processed;
    switch (mode) {
        case TextMode::DOCUMENT: {
            cv::Mat denoised;
            cv::fastNlMeansDenoising(gray, denoised);
            processed = otsu(denoised);
            break;
        }
        case TextMode::SIGN: {
            cv::Mat contrast;
            cv::convertScaleAbs(gray, contrast, 1.5, 0);
            cv::GaussianBlur(contrast, contrast, cv::Size(5, 5), 0);
            processed = otsu(contrast);
            break;
        }
        case TextMode::LABEL: {
            const cv::Mat kernel = (cv::Mat_<float>(3, 3) << -1, -1, -1, -1, 9, -1, -1, -1, -1);
            cv::Mat sharpened;
            cv::filter2D(gray, sharpened, -1, kernel);
            processed = otsu(sharpened);
            break;
        }
        case TextMode::DISPLAY: {
            cv::convertScaleAbs(gray, processed, 1.3, 40);
            cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);
            break;
        }
        case TextMode::SCENE: {
            auto clahe = cv::createCLAHE(2.0, cv::Size(8, 8));
            clahe->apply(gray, processed);
            break;
        }
    }

    cv::Mat out;
    cv::cvtColor(processed, out, cv::COLOR_GRAY2BGR);
    return out;
}
}  // namespace

std::string text_mode_to_string(TextMode mode) {
    switch (mode) {
        case TextMode::SIGN: return "sign";
        case TextMode::LABEL: return "label";
        case TextMode::DISPLAY: return "display";
        case TextMode::SCENE: return "scene";
        default: return "document";
    }
}

DnnTextAdapter::DnnTextAdapter(const std::string& detect_model, const std::string& recog_model,
                               const std::string& vocabulary_path) {
    std::ifstream vf(vocabulary_path);
    if (!vf) {
        std::cerr << "[ERROR] Unable to open text vocabulary: " << vocabulary_path << std::endl;
        return;
    }
    std::vector<std::string> vocabulary;
    std::string line;
    while (std::getline(vf, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        vocabulary.push_back(line);
    }

    try {
        detector_ = std::make_unique<cv::dnn::TextDetectionModel_DB>(detect_model);
        detector_->setBinaryThreshold(0.3f)
            .setPolygonThreshold(0.5f)
            .setMaxCandidates(200)
            .setUnclipRatio(2.0);
        detector_->setInputParams(1.0 / 255.0, cv::Size(736, 736),
                                  cv::Scalar(122.67891434, 116.66876762, 104.00698793));

        recognizer_ = std::make_unique<cv::dnn::TextRecognitionModel>(recog_model);
        recognizer_->setDecodeType("CTC-greedy");
        recognizer_->setVocabulary(vocabulary);
        recognizer_->setInputParams(1.0 / 127.5, cv::Size(100, 32), cv::Scalar(127.5, 127.5, 127.5));

        ready_ = true;
        std::cout << "[INFO] Loaded text models: " << detect_model << ", " << recog_model << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Could not load text models: " << e.what() << std::endl;
        detector_.reset();
        recognizer_.reset();
        ready_ = false;
    }
}

TextReading DnnTextAdapter::read(const Frame& frame, TextMode mode) {
    TextReading reading;
    if (!ready_ || frame.empty()) return reading;

    std::vector<std::vector<cv::Point>> polygons;
    std::vector<float> confidences;
    detector_->detect(frame.image, polygons, confidences);
    if (polygons.empty()) return reading;

    const cv::Rect bounds(0, 0, frame.width(), frame.height());
    std::vector<cv::Rect> rois;
    std::vector<float> kept_conf;
    for (size_t i = 0; i < polygons.size(); ++i) {
        cv::Rect r = cv::boundingRect(polygons[i]) & bounds;
        if (r.area() <= 0) continue;
        rois.push_back(r);
        kept_conf.push_back(i < confidences.size() ? confidences[i] : 0.0f);
    }
    if (rois.empty()) return reading;

    // Reading order: top to bottom in 20px bands, then left to right.
    std::vector<size_t> order(rois.size());
    std::iota(order.begin(), order.end(), 0);
    auto band = [&](size_t i) { return (rois[i].y + rois[i].height / 2) / 20; };
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (band(a) != band(b)) return band(a) < band(b);
        return rois[a].x < rois[b].x;
    });
    std::vector<cv::Rect> ordered;
    for (size_t idx : order) ordered.push_back(rois[idx]);

    std::vector<std::string> words;
    recognizer_->recognize(preprocess(frame.image, mode), ordered, words);

    float conf_sum = 0.0f;
    int count = 0;
    for (size_t i = 0; i < words.size(); ++i) {
        if (words[i].empty()) continue;
        if (!reading.text.empty()) reading.text += " ";
        reading.text += words[i];
        conf_sum += kept_conf[order[i]];
        ++count;
    }
    reading.confidence = count > 0 ? conf_sum / static_cast<float>(count) : 0.0f;
    return reading;
}

}  // namespace spex
