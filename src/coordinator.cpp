#include "coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace spex {

namespace {
const char* kWelcome =
    "Hello! I'm your integrated assistance system. "
    "I can help you identify people, describe objects, read text, and recognize gestures. "
    "Say 'help' for available commands.";
const char* kGestureWatchIntro = "Watching for gestures. Say stop when done.";
const char* kGoodbye = "Goodbye! Stay safe!";

std::string strip_period(std::string s) {
    while (!s.empty() && (s.back() == '.' || s.back() == ' ')) s.pop_back();
    return s;
}

std::chrono::milliseconds to_ms(double sec) {
    return std::chrono::milliseconds(static_cast<long long>(sec * 1000.0));
}

bool is_urgent_gesture(const std::string& g) {
    return g == "wave" || g == "help";
}

// What made a scene important: hazard labels, unknown faces and urgent
// gestures. Positions, known faces and cooldowns do not change it.
std::string alert_key(const Observation& obs) {
    std::set<std::string> hazards;
    for (const auto& o : obs.objects) {
        if (o.tier == PriorityTier::HIGH) hazards.insert(o.detection.label);
    }
    size_t unknown = 0;
    for (const auto& f : obs.faces) {
        if (!f.known) ++unknown;
    }
    std::set<std::string> urgent;
    for (const auto& g : obs.gestures) {
        if (is_urgent_gesture(g)) urgent.insert(g);
    }

    std::string key;
    for (const auto& h : hazards) key += h + ",";
    key += "|" + std::to_string(unknown) + "|";
    for (const auto& g : urgent) key += g + ",";
    return key;
}
}  // namespace

Coordinator::Coordinator(const AppConfig& cfg, const Clock& clock, Collaborators io,
                         IdentityGallery& gallery, AnnouncementLog* log)
    : cfg_(cfg),
      clock_(clock),
      io_(io),
      gallery_(gallery),
      log_(log),
      resolver_(gallery, clock, cfg.face_threshold, cfg.announce_cooldown_sec),
      gestures_(clock, cfg.gesture_idle_sec),
      triage_(clock, cfg.object_floor, cfg.nms_iou, cfg.tracking_retention_sec),
      text_reader_(io.text, clock, cfg.text_min_confidence),
      facts_(kFactQueueCapacity),
      inbound_(kInboundCapacity),
      last_activity_(clock.now()),
      started_at_(clock.now()) {}

Coordinator::~Coordinator() {
    shutdown();
}

void Coordinator::run() {
    speak(kWelcome, AnnouncementSource::SYSTEM);
    if (cfg_.monitoring) start_monitoring();
    while (poll_once()) {
    }
    shutdown();
}

bool Coordinator::poll_once() {
    check_idle();
    flush_pending();
    if (!running_) return false;

    std::string utterance;
    if (!inbound_.pop_for(utterance, std::chrono::milliseconds(0))) {
        utterance = io_.voice.listen(cfg_.listen_timeout_sec, cfg_.phrase_limit_sec);
    }
    if (!running_) return false;
    if (!utterance.empty() && dispatch(utterance)) return false;
    return running_;
}

bool Coordinator::dispatch(const std::string& utterance) {
    if (utterance.find_first_not_of(" \t\r\n") == std::string::npos) return false;
    last_activity_ = clock_.now();

    const Command cmd = route_command(utterance);
    if (cmd.kind == CommandKind::NONE) {
        std::cout << "[INFO] No command in: " << utterance << std::endl;
        return false;
    }
    std::cout << "[INFO] Command " << command_kind_to_string(cmd.kind) << std::endl;

    try {
        switch (cmd.kind) {
            case CommandKind::IDENTIFY: {
                auto frame = capture();
                if (!frame) break;
                std::string reply;
                {
                    std::lock_guard<std::mutex> lock(perception_mu_);
                    size_t held = 0;
                    const auto faces = resolver_.resolve(io_.faces.detect(*frame), &held);
                    reply = resolver_.describe(faces, held);
                }
                speak(reply, AnnouncementSource::COMMAND);
                break;
            }
            case CommandKind::OBJECTS: {
                auto frame = capture();
                if (!frame) break;
                std::vector<TriagedObject> objects;
                {
                    std::lock_guard<std::mutex> lock(perception_mu_);
                    objects = triage_.triage(frame->image.size(), io_.objects.detect(*frame));
                }
                speak(triage_.describe(objects), AnnouncementSource::COMMAND);
                break;
            }
            case CommandKind::READ_TEXT: {
                auto frame = capture();
                if (!frame) break;
                std::string text;
                {
                    std::lock_guard<std::mutex> lock(perception_mu_);
                    text = text_reader_.read(*frame, cmd.text_mode);
                }
                speak(text, AnnouncementSource::COMMAND);
                break;
            }
            case CommandKind::GESTURE_WATCH:
                if (run_gesture_watch()) return say_goodbye();
                break;
            case CommandKind::DESCRIBE: {
                auto frame = capture();
                if (!frame) break;
                const Observation obs = sense(*frame);
                speak(describe_environment(obs), AnnouncementSource::COMMAND);
                std::lock_guard<std::mutex> lock(perception_mu_);
                resolver_.mark_announced(obs.faces);
                break;
            }
            case CommandKind::HELP:
                speak(kHelpText, AnnouncementSource::COMMAND);
                break;
            case CommandKind::EXIT:
                return say_goodbye();
            case CommandKind::TIME:
            case CommandKind::DATE:
                speak(clock_phrase(cmd.kind), AnnouncementSource::COMMAND);
                break;
            default:
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Command failed: " << e.what() << std::endl;
        speak(std::string("I encountered an error: ") + e.what(), AnnouncementSource::COMMAND);
    }
    return false;
}

std::optional<Frame> Coordinator::capture() {
    std::lock_guard<std::mutex> lock(capture_mu_);
    return io_.source.capture();
}

Observation Coordinator::sense(const Frame& frame) {
    std::lock_guard<std::mutex> lock(perception_mu_);
    Observation obs;
    obs.faces = resolver_.match(io_.faces.detect(frame));
    obs.objects = triage_.triage(frame.image.size(), io_.objects.detect(frame));
    obs.gestures = gestures_.update(io_.hands.detect(frame));
    return obs;
}

bool Coordinator::check_important_changes(const Observation& obs) const {
    for (const auto& o : obs.objects) {
        if (o.tier == PriorityTier::HIGH) return true;
    }
    for (const auto& f : obs.faces) {
        if (!f.known) return true;
    }
    for (const auto& g : obs.gestures) {
        if (is_urgent_gesture(g)) return true;
    }
    return false;
}

std::string Coordinator::describe_environment(const Observation& obs) const {
    std::vector<std::string> parts;

    std::string people;
    size_t unknown = 0;
    for (const auto& f : obs.faces) {
        if (!f.known) {
            ++unknown;
            continue;
        }
        people += people.empty() ? "I see " : ", ";
        people += f.relation.empty() ? f.name : f.name + " (" + f.relation + ")";
    }
    if (unknown > 0) {
        people += people.empty() ? "I see " : " and ";
        people += std::to_string(unknown) + " unknown person(s)";
    }
    if (!people.empty()) parts.push_back(people);

    if (!obs.objects.empty()) parts.push_back(strip_period(triage_.describe(obs.objects)));
    if (!obs.gestures.empty()) parts.push_back(GestureClassifier::describe(obs.gestures));

    if (parts.empty()) return "Nothing notable in view right now.";
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ". ";
        out += p;
    }
    return out + ".";
}

void Coordinator::start_monitoring() {
    if (monitoring_.exchange(true)) return;
    monitor_thread_ = std::thread(&Coordinator::monitor_loop, this);
    std::cout << "[INFO] Monitoring every " << cfg_.monitor_interval_sec << "s" << std::endl;
}

void Coordinator::stop_monitoring() {
    {
        std::lock_guard<std::mutex> lock(wake_mu_);
        monitoring_ = false;
    }
    wake_cv_.notify_all();
    if (monitor_thread_.joinable()) monitor_thread_.join();
}

void Coordinator::monitor_loop() {
    while (monitoring_ && running_) {
        try {
            monitor_cycle();
        } catch (const std::exception& e) {
            std::cerr << "[WARN] Monitoring cycle failed: " << e.what() << std::endl;
        }
        std::unique_lock<std::mutex> lock(wake_mu_);
        wake_cv_.wait_for(lock, to_ms(cfg_.monitor_interval_sec), [this] { return !monitoring_ || !running_; });
    }
}

void Coordinator::monitor_cycle() {
    if (check_idle() || !running_) return;
    // A gesture watch session owns the classifier while it runs.
    if (watching_) return;

    auto frame = capture();
    if (!frame) return;
    const Observation obs = sense(*frame);
    if (!check_important_changes(obs)) return;

    const std::string key = alert_key(obs);
    const double now = clock_.now();
    if (key == last_alert_key_ && now - last_alert_time_ < cfg_.alert_repeat_sec) return;
    if (facts_.try_push(Announcement{describe_environment(obs), AnnouncementSource::MONITOR})) {
        last_alert_key_ = key;
        last_alert_time_ = now;
        std::lock_guard<std::mutex> lock(perception_mu_);
        resolver_.mark_announced(obs.faces);
    }
}

bool Coordinator::check_idle() {
    if (idle_fired_) return true;
    if (clock_.now() - last_activity_.load() <= cfg_.idle_timeout_sec) return false;
    if (idle_fired_.exchange(true)) return true;

    std::cout << "[INFO] Idle timeout after " << cfg_.idle_timeout_sec << "s" << std::endl;
    // The sleep notice supersedes monitoring alerts still waiting.
    const Announcement notice{kSleepNotice, AnnouncementSource::SYSTEM, PriorityTier::NORMAL};
    if (!facts_.try_push(notice)) {
        facts_.drain();
        facts_.try_push(notice);
    }
    request_stop();
    return true;
}

bool Coordinator::run_gesture_watch() {
    speak(kGestureWatchIntro, AnnouncementSource::COMMAND);
    struct WatchFlag {
        std::atomic<bool>& flag;
        ~WatchFlag() { flag = false; }
    } watch{watching_};
    watching_ = true;
    {
        std::lock_guard<std::mutex> lock(perception_mu_);
        gestures_.reset();
    }

    const double deadline = clock_.now() + cfg_.gesture_watch_timeout_sec;
    std::vector<std::string> last_spoken;
    while (running_ && clock_.now() < deadline) {
        std::string utterance;
        if (!inbound_.pop_for(utterance, std::chrono::milliseconds(0))) {
            utterance = io_.voice.listen(cfg_.monitor_interval_sec, cfg_.phrase_limit_sec);
        }
        if (!utterance.empty()) {
            last_activity_ = clock_.now();
            if (route_command(utterance).kind == CommandKind::EXIT) return true;
            if (is_stop_utterance(utterance)) break;
        }

        auto frame = capture();
        if (!frame) continue;
        std::vector<std::string> labels;
        {
            std::lock_guard<std::mutex> lock(perception_mu_);
            labels = gestures_.update(io_.hands.detect(*frame));
        }
        if (std::find(labels.begin(), labels.end(), GestureClassifier::kStopLabel) != labels.end()) {
            speak(GestureClassifier::phrase(GestureClassifier::kStopLabel), AnnouncementSource::COMMAND);
            break;
        }
        if (!labels.empty() && labels != last_spoken) {
            speak(GestureClassifier::describe(labels), AnnouncementSource::COMMAND);
            last_spoken = labels;
        }
    }
    return false;
}

bool Coordinator::say_goodbye() {
    speak(kGoodbye, AnnouncementSource::COMMAND);
    request_stop();
    return true;
}

std::string Coordinator::clock_phrase(CommandKind kind) const {
    const std::time_t t = std::time(nullptr);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    if (kind == CommandKind::TIME) {
        oss << "It is " << std::put_time(&local, "%I:%M %p");
    } else {
        oss << "Today is " << std::put_time(&local, "%A, %B %d, %Y");
    }
    return oss.str();
}

bool Coordinator::submit_utterance(const std::string& utterance) {
    return inbound_.try_push(utterance);
}

void Coordinator::flush_pending() {
    const auto pending = facts_.drain();
    if (pending.empty()) return;

    std::vector<Fact> facts;
    std::set<std::string> seen;
    AnnouncementSource source = AnnouncementSource::MONITOR;
    for (const auto& a : pending) {
        if (a.source != AnnouncementSource::MONITOR) source = a.source;
        if (!seen.insert(a.text).second) continue;
        facts.push_back(Fact{a.text, a.tier});
    }
    speak(merge_facts(facts), source);
}

size_t Coordinator::reload_gallery() {
    std::lock_guard<std::mutex> lock(perception_mu_);
    const size_t loaded = gallery_.reload();
    resolver_.reset_cooldowns();
    std::cout << "[INFO] Gallery reloaded, " << loaded << " embeddings" << std::endl;
    return loaded;
}

void Coordinator::request_stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mu_);
        running_ = false;
    }
    wake_cv_.notify_all();
}

void Coordinator::shutdown() {
    std::call_once(cleanup_once_, [this] {
        request_stop();
        stop_monitoring();
        io_.source.release();
        flush_pending();
        facts_.stop();
        inbound_.stop();
        ++cleanup_count_;
        std::cout << "[INFO] Coordinator stopped" << std::endl;
    });
}

CoordinatorStatus Coordinator::status() const {
    CoordinatorStatus st;
    const double now = clock_.now();
    st.running = running_;
    st.uptime_sec = now - started_at_;
    st.idle_sec = now - last_activity_.load();
    {
        std::lock_guard<std::mutex> lock(perception_mu_);
        st.gallery_size = gallery_.size();
    }
    st.queued = facts_.size();
    return st;
}

void Coordinator::speak(const std::string& text, AnnouncementSource source) {
    if (text.empty()) return;
    std::lock_guard<std::mutex> lock(voice_mu_);
    io_.voice.speak(text);
    if (log_) log_->append(clock_.now(), source, text);
}

}  // namespace spex
