#pragma once

#include <opencv2/dnn.hpp>
#include <string>
#include <vector>
#include <memory>

#include "frame_types.hpp"

#ifdef USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace spex {

// Object detection collaborator: labeled boxes with confidence.
class ObjectAdapter {
public:
    virtual ~ObjectAdapter() = default;
    virtual std::vector<DetectionRecord> detect(const Frame& frame) = 0;
};

// YOLO-style ONNX detector, ONNX Runtime first with an OpenCV DNN fallback.
class InferenceEngine : public ObjectAdapter {
public:
    InferenceEngine(const std::string& model_path,
                    const std::string& class_names_path,
                    int img_size,
                    float conf_threshold,
                    bool use_onnxruntime);

    bool ready() const { return ready_; }

    std::vector<DetectionRecord> detect(const Frame& frame) override;

private:
    void load_class_names(const std::string& path);
    std::vector<DetectionRecord> decode(const float* data, const std::vector<int64_t>& shape,
                                        const cv::Size& frame_size) const;

    cv::dnn::Net net_;
    std::vector<std::string> class_names_;
    int input_size_;
    float conf_threshold_;
    bool ready_{false};
    bool use_ort_{false};

#ifdef USE_ONNXRUNTIME
    std::vector<DetectionRecord> run_ort(const Frame& frame);
#endif
    std::vector<DetectionRecord> run_opencv(const Frame& frame);

#ifdef USE_ONNXRUNTIME
    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "spex"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace spex
