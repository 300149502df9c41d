#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace spex {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* env_src = std::getenv("SPEX_SOURCE")) cfg.source = env_src;
    if (const char* env_gallery = std::getenv("SPEX_GALLERY")) cfg.gallery_path = env_gallery;
    if (const char* env_model = std::getenv("SPEX_OBJECT_MODEL")) cfg.object_model_path = env_model;
    if (const char* env_hand = std::getenv("SPEX_HAND_MODEL")) cfg.hand_model = env_hand;
    if (const char* env_thr = std::getenv("SPEX_FACE_THRESHOLD")) cfg.face_threshold = static_cast<float>(std::atof(env_thr));
    if (const char* env_idle = std::getenv("SPEX_IDLE_TIMEOUT")) cfg.idle_timeout_sec = std::atof(env_idle);
    if (const char* env_tts = std::getenv("SPEX_TTS_CMD")) cfg.tts_command = env_tts;
    if (const char* env_port = std::getenv("SPEX_HTTP_PORT")) cfg.http_port = std::atoi(env_port);
    if (const char* env_log = std::getenv("SPEX_ANNOUNCEMENTS")) cfg.announcements_jsonl = env_log;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--gallery") && next()) {
            cfg.gallery_path = next();
            i++;
        } else if (arg_eq(arg, "--object-model") && next()) {
            cfg.object_model_path = next();
            i++;
        } else if (arg_eq(arg, "--class-names") && next()) {
            cfg.class_names_path = next();
            i++;
        } else if (arg_eq(arg, "--img") && next()) {
            cfg.img_size = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--face-detect-model") && next()) {
            cfg.face_detect_model = next();
            i++;
        } else if (arg_eq(arg, "--face-embed-model") && next()) {
            cfg.face_embed_model = next();
            i++;
        } else if (arg_eq(arg, "--hand-model") && next()) {
            cfg.hand_model = next();
            i++;
        } else if (arg_eq(arg, "--text-detect-model") && next()) {
            cfg.text_detect_model = next();
            i++;
        } else if (arg_eq(arg, "--text-recog-model") && next()) {
            cfg.text_recog_model = next();
            i++;
        } else if (arg_eq(arg, "--text-vocabulary") && next()) {
            cfg.text_vocabulary = next();
            i++;
        } else if (arg_eq(arg, "--face-threshold") && next()) {
            cfg.face_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--cooldown") && next()) {
            cfg.announce_cooldown_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--gesture-idle") && next()) {
            cfg.gesture_idle_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--idle-timeout") && next()) {
            cfg.idle_timeout_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--interval") && next()) {
            cfg.monitor_interval_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--tts") && next()) {
            cfg.tts_command = next();
            i++;
        } else if (arg_eq(arg, "--announcements") && next()) {
            cfg.announcements_jsonl = next();
            i++;
        } else if (arg_eq(arg, "--http-port") && next()) {
            cfg.http_port = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--no-monitor")) {
            cfg.monitoring = false;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: spex [--source <src>] [--gallery <db>] [--object-model <onnx>] [--class-names <file>]\n"
                      << "            [--img <size>] [--face-detect-model <onnx>] [--face-embed-model <onnx>]\n"
                      << "            [--hand-model <onnx>] [--text-detect-model <onnx>] [--text-recog-model <onnx>]\n"
                      << "            [--text-vocabulary <file>] [--face-threshold <dist>] [--cooldown <sec>]\n"
                      << "            [--gesture-idle <sec>] [--idle-timeout <sec>] [--interval <sec>]\n"
                      << "            [--tts <command>] [--announcements <path>] [--http-port <port>]\n"
                      << "            [--no-monitor] [--use-ort|--no-ort]\n";
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }

    return cfg;
}

}  // namespace spex
