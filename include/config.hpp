#pragma once

#include <string>

namespace spex {

struct AppConfig {
    std::string source{"0"};          // camera index as string or URL
    std::string gallery_path{"models/face_gallery.db"};

    // Perception collaborators
    std::string object_model_path{"models/yolov8n.onnx"};
    std::string class_names_path{};   // optional path to names file
    int img_size{640};
    float detector_conf{0.25f};       // raw detector cut, triage applies its own floor
    bool use_ort{true};               // use ONNX Runtime when available
    std::string face_detect_model{"models/face_detection_yunet_2023mar.onnx"};
    std::string face_embed_model{"models/face_recognition_sface_2021dec.onnx"};
    std::string hand_model{"models/hand_landmark.onnx"};
    std::string text_detect_model{"models/DB_TD500_resnet18.onnx"};
    std::string text_recog_model{"models/crnn_cs.onnx"};
    std::string text_vocabulary{"models/alphabet_94.txt"};

    // Identity resolver
    float face_threshold{0.6f};       // lower means stricter matching
    double announce_cooldown_sec{5.0};

    // Gesture classifier
    double gesture_idle_sec{2.0};
    double gesture_watch_timeout_sec{30.0};

    // Object triage
    float object_floor{0.5f};
    float nms_iou{0.4f};
    double tracking_retention_sec{5.0};

    // Text reader
    float text_min_confidence{0.6f};

    // Coordinator
    double monitor_interval_sec{0.1};
    double alert_repeat_sec{5.0};
    double idle_timeout_sec{300.0};
    double listen_timeout_sec{5.0};
    double phrase_limit_sec{5.0};
    bool monitoring{true};

    // Voice and outputs
    std::string tts_command{};        // e.g. "espeak-ng", empty prints only
    std::string announcements_jsonl{"announcements.jsonl"};
    int http_port{8000};              // 0 disables the control surface
};

AppConfig parse_args(int argc, char** argv);

}  // namespace spex
