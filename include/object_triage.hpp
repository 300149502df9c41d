#pragma once

#include <deque>
#include <map>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

#include "clock.hpp"
#include "frame_types.hpp"

namespace spex {

struct TriagedObject {
    DetectionRecord detection;
    std::string location;          // "on the left top, very close"
    PriorityTier tier{PriorityTier::NORMAL};
};

struct TrackedObject {
    std::string label;
    std::deque<std::pair<double, DetectionRecord>> history;   // oldest first
    PriorityTier tier{PriorityTier::NORMAL};
};

// Filters, de-duplicates, ranks and narrates object detections, and keeps a
// short per-label history of what was seen.
class ObjectTriage {
public:
    ObjectTriage(const Clock& clock, float confidence_floor = 0.5f, float nms_iou = 0.4f,
                 double retention_sec = 5.0);

    // Floor + per-label NMS; survivors keep detection order. Also feeds the
    // tracking history.
    std::vector<TriagedObject> triage(const cv::Size& frame_size, const std::vector<DetectionRecord>& detections);

    std::vector<DetectionRecord> suppress(const std::vector<DetectionRecord>& detections) const;

    PriorityTier tier_for_label(const std::string& label) const;
    static std::string location_for(const cv::Rect& box, const cv::Size& frame_size);
    static float iou(const cv::Rect& a, const cv::Rect& b);

    std::string describe(const std::vector<TriagedObject>& objects) const;
    std::vector<Fact> facts(const std::vector<TriagedObject>& objects) const;

    void update_tracking(const std::vector<TriagedObject>& objects);
    std::vector<std::string> tracked_labels();
    std::vector<std::pair<double, DetectionRecord>> history(const std::string& label);
    bool is_tracked(const std::string& label);
    // True when the set of labels in `current` differs from the retained
    // tracked labels (something appeared or vanished).
    bool changed_since(const std::vector<std::string>& current);

private:
    void purge(double now);

    const Clock& clock_;
    float confidence_floor_;
    float nms_iou_;
    double retention_sec_;

    std::unordered_set<std::string> high_labels_;
    std::unordered_set<std::string> medium_labels_;
    std::unordered_set<std::string> low_labels_;

    std::map<std::string, TrackedObject> tracking_;
};

}  // namespace spex
