#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace spex {

// Total order used whenever facts compete for the voice channel: HIGH first.
enum class PriorityTier { HIGH = 0, MEDIUM = 1, LOW = 2, NORMAL = 3 };

inline std::string tier_to_string(PriorityTier tier) {
    switch (tier) {
        case PriorityTier::HIGH: return "high";
        case PriorityTier::MEDIUM: return "medium";
        case PriorityTier::LOW: return "low";
        default: return "normal";
    }
}

inline int tier_rank(PriorityTier tier) {
    return static_cast<int>(tier);
}

enum class Modality { FACE, HAND, OBJECT, TEXT };

inline std::string modality_to_string(Modality m) {
    switch (m) {
        case Modality::FACE: return "face";
        case Modality::HAND: return "hand";
        case Modality::OBJECT: return "object";
        default: return "text";
    }
}

struct Frame {
    cv::Mat image;               // BGR image
    double timestamp_sec{0.0};   // monotonic clock seconds

    int width() const { return image.cols; }
    int height() const { return image.rows; }
    bool empty() const { return image.empty(); }
};

// Common shape for every adapter's output. `features` is modality specific:
// the identity embedding for faces, 21 landmarks as x,y,z triples for hands.
struct DetectionRecord {
    Modality modality{Modality::OBJECT};
    std::string label;
    float confidence{0.0f};
    std::optional<cv::Rect> region;
    std::vector<float> features;
};

struct Fact {
    std::string text;
    PriorityTier tier{PriorityTier::NORMAL};
};

// Stable sort by tier; facts of one tier keep their production order.
std::vector<Fact> order_facts(std::vector<Fact> facts);

// Joins ordered facts into one utterance: "a. b. c."
std::string merge_facts(const std::vector<Fact>& facts);

}  // namespace spex
