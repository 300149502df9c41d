#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "announcement_log.hpp"
#include "clock.hpp"
#include "command_router.hpp"
#include "config.hpp"
#include "face_adapter.hpp"
#include "frame_buffer.hpp"
#include "frame_source.hpp"
#include "gesture_classifier.hpp"
#include "hand_adapter.hpp"
#include "identity_gallery.hpp"
#include "identity_resolver.hpp"
#include "inference_engine.hpp"
#include "object_triage.hpp"
#include "text_adapter.hpp"
#include "text_reader.hpp"
#include "voice_channel.hpp"

namespace spex {

// Everything one sense cycle learned from a frame.
struct Observation {
    std::vector<FaceRecognition> faces;
    std::vector<TriagedObject> objects;
    std::vector<std::string> gestures;
};

struct Announcement {
    std::string text;
    AnnouncementSource source{AnnouncementSource::MONITOR};
    PriorityTier tier{PriorityTier::HIGH};
};

struct CoordinatorStatus {
    bool running{false};
    double uptime_sec{0.0};
    double idle_sec{0.0};
    size_t gallery_size{0};
    size_t queued{0};
};

// Non-owning bundle of the hardware and model collaborators.
struct Collaborators {
    FrameSource& source;
    VoiceChannel& voice;
    FaceAdapter& faces;
    HandAdapter& hands;
    ObjectAdapter& objects;
    TextAdapter& text;
};

// Shares the one camera and the one voice channel between the perception
// modules, runs the background monitor and dispatches voice commands.
class Coordinator {
public:
    static constexpr size_t kFactQueueCapacity = 4;
    static constexpr size_t kInboundCapacity = 8;
    static constexpr const char* kSleepNotice = "No activity detected for a while. Going to sleep mode.";

    Coordinator(const AppConfig& cfg, const Clock& clock, Collaborators io,
                IdentityGallery& gallery, AnnouncementLog* log = nullptr);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Greets, starts the monitor and serves commands until exit, idle
    // timeout or request_stop(); cleans up before returning.
    void run();

    // One foreground step: flush queued facts, take one utterance (HTTP
    // first, then the voice channel) and dispatch it. False once stopping.
    bool poll_once();

    // Routes one utterance to one command. Returns true for exit.
    bool dispatch(const std::string& utterance);

    std::optional<Frame> capture();
    Observation sense(const Frame& frame);
    bool check_important_changes(const Observation& obs) const;
    std::string describe_environment(const Observation& obs) const;

    void start_monitoring();
    void stop_monitoring();
    // One iteration of the background monitor.
    void monitor_cycle();

    // Queues an utterance from outside the voice channel (HTTP). False when
    // the inbound queue is full or closed.
    bool submit_utterance(const std::string& utterance);

    // Speaks everything queued as one utterance, most urgent first. Repeated
    // texts are spoken once.
    void flush_pending();

    // Re-reads the gallery from disk and clears the announcement cooldowns.
    // Returns the number of embeddings loaded.
    size_t reload_gallery();
    void request_stop();
    // Stops the monitor, releases the camera and flushes what is pending.
    // Safe to call from several threads; the work runs once.
    void shutdown();

    bool running() const { return running_.load(); }
    CoordinatorStatus status() const;
    int cleanup_count() const { return cleanup_count_.load(); }

private:
    void speak(const std::string& text, AnnouncementSource source);
    bool check_idle();
    void monitor_loop();
    // True when the user asked to exit during the session.
    bool run_gesture_watch();
    bool say_goodbye();
    std::string clock_phrase(CommandKind kind) const;

    AppConfig cfg_;
    const Clock& clock_;
    Collaborators io_;
    IdentityGallery& gallery_;
    AnnouncementLog* log_;

    IdentityResolver resolver_;
    GestureClassifier gestures_;
    ObjectTriage triage_;
    TextReader text_reader_;

    std::mutex capture_mu_;
    mutable std::mutex perception_mu_;
    std::mutex voice_mu_;

    FrameBuffer<Announcement> facts_;
    FrameBuffer<std::string> inbound_;

    std::atomic<bool> running_{true};
    std::atomic<bool> monitoring_{false};
    std::atomic<bool> watching_{false};
    std::atomic<bool> idle_fired_{false};
    std::atomic<double> last_activity_;
    double started_at_;

    std::string last_alert_key_;
    double last_alert_time_{0.0};

    std::thread monitor_thread_;
    std::mutex wake_mu_;
    std::condition_variable wake_cv_;

    std::once_flag cleanup_once_;
    std::atomic<int> cleanup_count_{0};
};

}  // namespace spex
