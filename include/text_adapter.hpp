#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/dnn.hpp>
#include "frame_types.hpp"

namespace spex {

enum class TextMode { DOCUMENT, SIGN, LABEL, DISPLAY, SCENE };

std::string text_mode_to_string(TextMode mode);

struct TextReading {
    std::string text;
    float confidence{0.0f};   // [0,1]
};

// OCR collaborator. The mode only selects collaborator-side preprocessing.
class TextAdapter {
public:
    virtual ~TextAdapter() = default;
    virtual TextReading read(const Frame& frame, TextMode mode) = 0;
};

// DB text detector + CRNN recognizer from OpenCV's dnn text models.
class DnnTextAdapter : public TextAdapter {
public:
    DnnTextAdapter(const std::string& detect_model, const std::string& recog_model,
                   const std::string& vocabulary_path);

    bool ready() const { return ready_; }
    TextReading read(const Frame& frame, TextMode mode) override;

private:
    std::unique_ptr<cv::dnn::TextDetectionModel_DB> detector_;
    std::unique_ptr<cv::dnn::TextRecognitionModel> recognizer_;
    bool ready_{false};
};

}  // namespace spex
