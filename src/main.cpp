#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "announcement_log.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "face_adapter.hpp"
#include "frame_source.hpp"
#include "hand_adapter.hpp"
#include "identity_gallery.hpp"
#include "inference_engine.hpp"
#include "server_app.hpp"
#include "text_adapter.hpp"
#include "voice_channel.hpp"

using namespace std::chrono_literals;

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void on_signal(int) {
    g_interrupted = 1;
}
}  // namespace

int main(int argc, char** argv) {
    spex::AppConfig cfg = spex::parse_args(argc, argv);

    std::cout << "[INFO] Starting spex assistant\n";
    std::cout << "       source : " << cfg.source << "\n";
    std::cout << "       gallery: " << cfg.gallery_path << " (threshold " << cfg.face_threshold << ")\n";
    std::cout << "       objects: " << cfg.object_model_path << "\n";
    std::cout << "       hands  : " << cfg.hand_model << "\n";
    std::cout << "       log    : " << cfg.announcements_jsonl << "\n";
    std::cout << "       ORT    : " << (cfg.use_ort ? "enabled" : "disabled (OpenCV DNN fallback)") << "\n";
    std::cout << "       HTTP   : " << (cfg.http_port > 0 ? std::to_string(cfg.http_port) : "disabled") << std::endl;

    spex::SteadyClock clock;
    spex::CameraSource camera(cfg.source, clock);
    if (!camera.open()) {
        std::cerr << "[ERROR] Could not access camera: " << cfg.source << std::endl;
        return 1;
    }

    spex::IdentityGallery gallery;
    gallery.load(cfg.gallery_path);

    spex::SFaceAdapter faces(cfg.face_detect_model, cfg.face_embed_model);
    spex::HandLandmarkAdapter hands(cfg.hand_model);
    spex::InferenceEngine objects(cfg.object_model_path, cfg.class_names_path, cfg.img_size,
                                  cfg.detector_conf, cfg.use_ort);
    spex::DnnTextAdapter text(cfg.text_detect_model, cfg.text_recog_model, cfg.text_vocabulary);
    if (!faces.ready()) std::cerr << "[WARN] Face recognition unavailable" << std::endl;
    if (!hands.ready()) std::cerr << "[WARN] Gesture recognition unavailable" << std::endl;
    if (!objects.ready()) std::cerr << "[WARN] Object detection unavailable" << std::endl;
    if (!text.ready()) std::cerr << "[WARN] Text reading unavailable" << std::endl;

    spex::ConsoleVoice voice(cfg.tts_command);
    spex::AnnouncementLog log(cfg.announcements_jsonl);

    spex::Coordinator coordinator(cfg, clock, spex::Collaborators{camera, voice, faces, hands, objects, text},
                                  gallery, &log);

    std::unique_ptr<spex::ServerApp> server;
    if (cfg.http_port > 0) {
        server = std::make_unique<spex::ServerApp>(coordinator, log, "0.0.0.0", cfg.http_port);
        if (!server->start()) server.reset();
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done) {
            if (g_interrupted) {
                std::cout << "[INFO] Interrupted, shutting down" << std::endl;
                coordinator.request_stop();
                break;
            }
            std::this_thread::sleep_for(100ms);
        }
    });

    coordinator.run();

    done = true;
    watcher.join();
    if (server) server->stop();
    std::cout << "[INFO] Stopped spex assistant\n";
    return 0;
}
