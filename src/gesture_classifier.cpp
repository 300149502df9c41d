#include "gesture_classifier.hpp"

#include <cmath>
#include <initializer_list>
#include <unordered_map>

#include "hand_adapter.hpp"

namespace spex {

namespace {
constexpr float kRadToDeg = 57.29577951308232f;

struct Point3 {
    float x, y, z;
};

Point3 landmark(const std::vector<float>& f, int idx) {
    return Point3{f[idx * 3], f[idx * 3 + 1], f[idx * 3 + 2]};
}

float planar_distance(const Point3& a, const Point3& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

// tip, middle joint, base joint per finger (MediaPipe numbering)
constexpr int kFingerJoints[5][3] = {
    {4, 3, 2},
    {8, 7, 6},
    {12, 11, 10},
    {16, 15, 14},
    {20, 19, 18},
};
constexpr int kWrist = 0;
constexpr int kPalmJoints[5] = {0, 5, 9, 13, 17};

bool none_of(const FingerStates& f, std::initializer_list<Finger> fingers) {
    for (Finger finger : fingers) {
        if (f[finger]) return false;
    }
    return true;
}
}  // namespace

std::optional<HandPose> pose_from_landmarks(const std::vector<float>& features) {
    if (features.size() < static_cast<size_t>(kHandLandmarks * 3)) return std::nullopt;

    Point3 palm{0.0f, 0.0f, 0.0f};
    for (int idx : kPalmJoints) {
        const Point3 p = landmark(features, idx);
        palm.x += p.x / 5.0f;
        palm.y += p.y / 5.0f;
        palm.z += p.z / 5.0f;
    }
    const Point3 wrist = landmark(features, kWrist);

    HandPose pose;
    for (int finger = 0; finger < 5; ++finger) {
        const Point3 tip = landmark(features, kFingerJoints[finger][0]);
        const Point3 mid = landmark(features, kFingerJoints[finger][1]);
        const Point3 base = landmark(features, kFingerJoints[finger][2]);

        const float d_tip = planar_distance(tip, palm);
        const float d_mid = planar_distance(mid, palm);
        const float d_base = planar_distance(base, palm);
        pose.extended[finger] = d_tip > d_mid && d_mid > d_base;
        pose.tip_angles_deg[finger] = std::atan2(tip.y - wrist.y, tip.x - wrist.x) * kRadToDeg;
    }
    return pose;
}

const std::vector<StaticGestureRule>& static_gesture_rules() {
    static const std::vector<StaticGestureRule> rules = {
        {"thumbs_up", [](const FingerStates& f) {
             return f[THUMB] && none_of(f, {INDEX, MIDDLE, RING, PINKY});
         }},
        {"thumbs_down", [](const FingerStates& f) {
             return !f[THUMB] && none_of(f, {INDEX, MIDDLE, RING, PINKY});
         }},
        {"peace", [](const FingerStates& f) {
             return f[INDEX] && f[MIDDLE] && none_of(f, {RING, PINKY});
         }},
        {"open_palm", [](const FingerStates& f) {
             return f[THUMB] && f[INDEX] && f[MIDDLE] && f[RING] && f[PINKY];
         }},
        {"pointing", [](const FingerStates& f) {
             return f[INDEX] && none_of(f, {MIDDLE, RING, PINKY});
         }},
    };
    return rules;
}

std::optional<std::string> classify_static(const FingerStates& fingers) {
    for (const auto& rule : static_gesture_rules()) {
        if (rule.matches(fingers)) return rule.label;
    }
    return std::nullopt;
}

GestureClassifier::GestureClassifier(const Clock& clock, double idle_sec)
    : clock_(clock), idle_sec_(idle_sec), last_hand_time_(clock.now()) {}

std::vector<std::string> GestureClassifier::update(const std::vector<DetectionRecord>& hands) {
    std::vector<HandPose> poses;
    for (const auto& hand : hands) {
        if (auto pose = pose_from_landmarks(hand.features)) poses.push_back(*pose);
    }
    return classify_frame(poses);
}

std::vector<std::string> GestureClassifier::classify_frame(const std::vector<HandPose>& poses) {
    const double now = clock_.now();
    std::vector<std::string> gestures;

    if (poses.empty()) {
        if (state_ == State::ACTIVE && now - last_hand_time_ > idle_sec_ && last_gesture_) {
            last_gesture_.reset();
            state_ = State::IDLE;
            gestures.push_back(kStopLabel);
        }
        return gestures;
    }

    last_hand_time_ = now;
    for (const auto& pose : poses) {
        if (auto wave = observe_motion(pose.tip_angles_deg[INDEX])) {
            gestures.push_back(*wave);
            continue;
        }
        if (auto label = classify_static(pose.extended)) {
            gestures.push_back(*label);
        }
    }

    // Two-handed greeting: only with both hands in view and neither already
    // classified; the two newest samples are then this frame's two hands.
    if (gestures.empty() && poses.size() >= 2) {
        if (auto namaste = namaste_check()) gestures.push_back(*namaste);
    }

    if (!gestures.empty()) {
        last_gesture_ = gestures.back();
        state_ = State::ACTIVE;
    }
    return gestures;
}

std::optional<std::string> GestureClassifier::observe_motion(float index_angle_deg) {
    history_.push_back(index_angle_deg);
    while (history_.size() > kHistoryCapacity) history_.pop_front();
    if (history_.size() < kWaveMinSamples) return std::nullopt;

    double mean = 0.0;
    for (float a : history_) mean += a;
    mean /= static_cast<double>(history_.size());
    double variance = 0.0;
    for (float a : history_) variance += (a - mean) * (a - mean);
    variance /= static_cast<double>(history_.size());

    if (variance > kWaveVariance) return std::string("wave");
    return std::nullopt;
}

std::optional<std::string> GestureClassifier::namaste_check() const {
    if (history_.size() < 2) return std::nullopt;
    const float a = history_[history_.size() - 1];
    const float b = history_[history_.size() - 2];
    if (std::fabs(a - b) < kNamasteTolerance) return std::string("namaste");
    return std::nullopt;
}

std::string GestureClassifier::phrase(const std::string& label) {
    static const std::unordered_map<std::string, std::string> phrases = {
        {"wave", "someone is waving"},
        {"thumbs_up", "a thumbs up, indicating approval"},
        {"thumbs_down", "a thumbs down, indicating disapproval"},
        {"peace", "a peace sign"},
        {"open_palm", "an open palm, possibly saying hello or stop"},
        {"pointing", "someone is pointing"},
        {"namaste", "someone is greeting with namaste"},
        {"gesture_stop", "no gestures currently detected"},
    };
    auto it = phrases.find(label);
    return it == phrases.end() ? "Unknown gesture" : it->second;
}

std::string GestureClassifier::describe(const std::vector<std::string>& labels) {
    if (labels.empty()) return "No gestures detected";
    std::string out;
    for (const auto& label : labels) {
        if (!out.empty()) out += ". ";
        out += phrase(label);
    }
    return out;
}

void GestureClassifier::reset() {
    history_.clear();
    last_gesture_.reset();
    state_ = State::IDLE;
    last_hand_time_ = clock_.now();
}

}  // namespace spex
