#pragma once

#include <array>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"
#include "frame_types.hpp"

namespace spex {

enum Finger { THUMB = 0, INDEX = 1, MIDDLE = 2, RING = 3, PINKY = 4 };

using FingerStates = std::array<bool, 5>;

// Per-frame summary of one hand.
struct HandPose {
    FingerStates extended{};
    std::array<float, 5> tip_angles_deg{};   // fingertip relative to the wrist
};

// Builds a pose from 21 landmarks stored as x,y,z triples. A finger is
// extended when tip, middle joint and base joint are strictly decreasing in
// distance from the palm centre.
std::optional<HandPose> pose_from_landmarks(const std::vector<float>& features);

struct StaticGestureRule {
    std::string label;
    std::function<bool(const FingerStates&)> matches;
};

// Fixed precedence: thumbs_up, thumbs_down, peace, open_palm, pointing.
const std::vector<StaticGestureRule>& static_gesture_rules();
std::optional<std::string> classify_static(const FingerStates& fingers);

class GestureClassifier {
public:
    enum class State { IDLE, ACTIVE };

    static constexpr size_t kHistoryCapacity = 30;
    static constexpr size_t kWaveMinSamples = 10;
    static constexpr float kWaveVariance = 500.0f;   // deg^2
    static constexpr float kNamasteTolerance = 20.0f;  // deg
    static constexpr const char* kStopLabel = "gesture_stop";

    explicit GestureClassifier(const Clock& clock, double idle_sec = 2.0);

    // Consumes one frame's hand records and returns the gestures to report.
    // With no hands for longer than the idle threshold after a gesture, the
    // result is {"gesture_stop"} exactly once.
    std::vector<std::string> update(const std::vector<DetectionRecord>& hands);

    // Classifies already summarised poses for one frame (same semantics as
    // update() minus the landmark decoding).
    std::vector<std::string> classify_frame(const std::vector<HandPose>& poses);

    // Appends the index angle and reports "wave" once the window is full
    // enough and its variance is above the threshold.
    std::optional<std::string> observe_motion(float index_angle_deg);

    static std::string phrase(const std::string& label);
    static std::string describe(const std::vector<std::string>& labels);

    void reset();

    State state() const { return state_; }
    const std::optional<std::string>& last_gesture() const { return last_gesture_; }
    const std::deque<float>& history() const { return history_; }

private:
    std::optional<std::string> namaste_check() const;

    const Clock& clock_;
    double idle_sec_;
    std::deque<float> history_;
    double last_hand_time_;
    std::optional<std::string> last_gesture_;
    State state_{State::IDLE};
};

}  // namespace spex
