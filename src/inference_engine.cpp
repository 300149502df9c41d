#include "inference_engine.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <opencv2/imgproc.hpp>

namespace spex {

InferenceEngine::InferenceEngine(const std::string& model_path,
                                 const std::string& class_names_path,
                                 int img_size,
                                 float conf_threshold,
                                 bool use_onnxruntime)
    : input_size_(img_size),
      conf_threshold_(conf_threshold),
      use_ort_(use_onnxruntime) {
    class_names_ = {"person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck",
                    "boat",   "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
                    "bird",   "cat",           "dog",         "horse",     "sheep",         "cow",
                    "elephant", "bear", "zebra", "giraffe", "backpack", "umbrella",
                    "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard",
                    "sports ball", "kite", "baseball bat", "baseball glove", "skateboard",
                    "surfboard", "tennis racket", "bottle", "wine glass", "cup", "fork",
                    "knife", "spoon", "bowl", "banana", "apple", "sandwich", "orange",
                    "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair",
                    "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop",
                    "mouse", "remote", "keyboard", "cell phone", "microwave", "oven", "toaster",
                    "sink", "refrigerator", "book", "clock", "vase", "scissors", "teddy bear",
                    "hair drier", "toothbrush"};
    if (!class_names_path.empty()) {
        load_class_names(class_names_path);
    }

#ifdef USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            const size_t in_count = session_->GetInputCount();
            for (size_t i = 0; i < in_count; ++i) {
                auto name = session_->GetInputNameAllocated(i, allocator);
                input_name_strs_.push_back(name.get());
            }
            const size_t out_count = session_->GetOutputCount();
            for (size_t i = 0; i < out_count; ++i) {
                auto name = session_->GetOutputNameAllocated(i, allocator);
                output_name_strs_.push_back(name.get());
            }
            for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
            for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());

            ready_ = true;
            std::cout << "[INFO] Loaded ORT object model: " << model_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    if (!use_ort_) {
        try {
            net_ = cv::dnn::readNet(model_path);
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            ready_ = true;
            std::cout << "[INFO] Loaded OpenCV DNN object model: " << model_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Could not load object model: " << e.what() << std::endl;
            ready_ = false;
        }
    }
}

void InferenceEngine::load_class_names(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[WARN] Unable to open class names file: " << path << std::endl;
        return;
    }
    std::vector<std::string> names;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) names.push_back(line);
    }
    if (!names.empty()) class_names_ = std::move(names);
}

std::vector<DetectionRecord> InferenceEngine::detect(const Frame& frame) {
    if (!ready_ || frame.empty()) return {};
#ifdef USE_ONNXRUNTIME
    if (use_ort_ && session_) {
        return run_ort(frame);
    }
#endif
    return run_opencv(frame);
}

// Handles [1, rows, dims] and the transposed YOLOv8 layout [1, dims, rows].
// Rows carry cx, cy, w, h in input pixels, then an optional objectness score,
// then one score per class.
std::vector<DetectionRecord> InferenceEngine::decode(const float* data, const std::vector<int64_t>& shape,
                                                     const cv::Size& frame_size) const {
    std::vector<DetectionRecord> dets;

    int rows = 0;
    int dims = 0;
    bool channel_first = false;
    if (shape.size() == 3) {
        rows = static_cast<int>(shape[1]);
        dims = static_cast<int>(shape[2]);
        if (shape[2] > shape[1]) {
            rows = static_cast<int>(shape[2]);
            dims = static_cast<int>(shape[1]);
            channel_first = true;
        }
    } else if (shape.size() == 2) {
        rows = static_cast<int>(shape[0]);
        dims = static_cast<int>(shape[1]);
    } else {
        return dets;
    }
    if (dims < 5) return dets;

    const bool has_objectness = dims == static_cast<int>(class_names_.size()) + 5;
    const int class_start = has_objectness ? 5 : 4;
    const int classes = dims - class_start;
    const float scale_x = static_cast<float>(frame_size.width) / static_cast<float>(input_size_);
    const float scale_y = static_cast<float>(frame_size.height) / static_cast<float>(input_size_);
    const cv::Rect bounds(0, 0, frame_size.width, frame_size.height);

    for (int i = 0; i < rows; ++i) {
        const float* ptr = channel_first ? (data + i) : (data + i * dims);
        auto item = [&](int idx) -> float {
            return channel_first ? ptr[idx * rows] : ptr[idx];
        };

        int best_cls = -1;
        float best_score = 0.0f;
        const float objectness = has_objectness ? item(4) : 1.0f;
        for (int c = 0; c < classes; ++c) {
            float conf = objectness * item(class_start + c);
            if (conf > best_score) {
                best_score = conf;
                best_cls = c;
            }
        }

        if (best_score < conf_threshold_) continue;

        const float cx = item(0);
        const float cy = item(1);
        const float w = item(2);
        const float h = item(3);
        cv::Rect box(static_cast<int>((cx - 0.5f * w) * scale_x),
                     static_cast<int>((cy - 0.5f * h) * scale_y),
                     static_cast<int>(w * scale_x),
                     static_cast<int>(h * scale_y));
        box &= bounds;
        if (box.area() <= 0) continue;

        DetectionRecord rec;
        rec.modality = Modality::OBJECT;
        rec.label = (best_cls >= 0 && best_cls < static_cast<int>(class_names_.size()))
                        ? class_names_[best_cls]
                        : ("cls_" + std::to_string(best_cls));
        rec.confidence = best_score;
        rec.region = box;
        dets.push_back(std::move(rec));
    }
    return dets;
}

#ifdef USE_ONNXRUNTIME
std::vector<DetectionRecord> InferenceEngine::run_ort(const Frame& frame) {
    cv::Mat resized;
    cv::resize(frame.image, resized, cv::Size(input_size_, input_size_));
    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32F, 1.0 / 255.0);

    std::vector<float> blob;
    blob.reserve(3 * input_size_ * input_size_);
    std::vector<int64_t> input_shape{1, 3, input_size_, input_size_};
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < input_size_; ++y) {
            const float* row = rgb.ptr<float>(y);
            for (int x = 0; x < input_size_; ++x) {
                blob.push_back(row[x * 3 + c]);
            }
        }
    }

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.data(), blob.size(),
                                                              input_shape.data(), input_shape.size());
    auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                 input_names_.data(), &input_tensor, 1,
                                 output_names_.data(), output_names_.size());

    if (outputs.empty()) return {};
    auto& out = outputs.front();
    return decode(out.GetTensorData<float>(), out.GetTensorTypeAndShapeInfo().GetShape(), frame.image.size());
}
#endif

std::vector<DetectionRecord> InferenceEngine::run_opencv(const Frame& frame) {
    cv::Mat blob = cv::dnn::blobFromImage(frame.image, 1.0 / 255.0, cv::Size(input_size_, input_size_),
                                          cv::Scalar(), true, false);
    net_.setInput(blob);
    cv::Mat pred = net_.forward();

    std::vector<int64_t> shape;
    for (int d = 0; d < pred.dims; ++d) shape.push_back(pred.size[d]);
    return decode(reinterpret_cast<const float*>(pred.data), shape, frame.image.size());
}

}  // namespace spex
