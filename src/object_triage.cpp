#include "object_triage.hpp"

#include <algorithm>
#include <set>

namespace spex {

ObjectTriage::ObjectTriage(const Clock& clock, float confidence_floor, float nms_iou, double retention_sec)
    : clock_(clock), confidence_floor_(confidence_floor), nms_iou_(nms_iou), retention_sec_(retention_sec),
      high_labels_{"person", "bicycle", "car", "motorcycle", "bus", "truck", "train",
                   "traffic light", "stop sign", "door"},
      medium_labels_{"chair", "table", "dining table", "stairs", "bed", "couch", "bench", "toilet"},
      low_labels_{"cup", "bottle", "book", "cell phone", "laptop", "remote", "keyboard", "mouse"} {}

PriorityTier ObjectTriage::tier_for_label(const std::string& label) const {
    if (high_labels_.count(label)) return PriorityTier::HIGH;
    if (medium_labels_.count(label)) return PriorityTier::MEDIUM;
    if (low_labels_.count(label)) return PriorityTier::LOW;
    return PriorityTier::NORMAL;
}

std::string ObjectTriage::location_for(const cv::Rect& box, const cv::Size& frame_size) {
    const double fw = std::max(frame_size.width, 1);
    const double fh = std::max(frame_size.height, 1);
    const double cx = box.x + box.width / 2.0;
    const double cy = box.y + box.height / 2.0;

    std::string h_pos;
    if (cx < fw / 3.0) h_pos = "on the left";
    else if (cx < 2.0 * fw / 3.0) h_pos = "in the center";
    else h_pos = "on the right";

    std::string v_pos;
    if (cy < fh / 3.0) v_pos = "top";
    else if (cy < 2.0 * fh / 3.0) v_pos = "middle";
    else v_pos = "bottom";

    const double area_ratio = static_cast<double>(box.area()) / (fw * fh);
    std::string distance;
    if (area_ratio > 0.3) distance = "very close";
    else if (area_ratio > 0.1) distance = "nearby";
    else distance = "further away";

    return h_pos + " " + v_pos + ", " + distance;
}

float ObjectTriage::iou(const cv::Rect& a, const cv::Rect& b) {
    const int inter = (a & b).area();
    const int uni = a.area() + b.area() - inter;
    if (uni <= 0) return 0.0f;
    return static_cast<float>(inter) / static_cast<float>(uni);
}

std::vector<DetectionRecord> ObjectTriage::suppress(const std::vector<DetectionRecord>& detections) const {
    std::vector<size_t> order;
    for (size_t i = 0; i < detections.size(); ++i) {
        if (detections[i].confidence >= confidence_floor_) order.push_back(i);
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return detections[a].confidence > detections[b].confidence;
    });

    std::vector<bool> keep(detections.size(), false);
    std::vector<size_t> kept;
    for (size_t idx : order) {
        const auto& cand = detections[idx];
        bool suppressed = false;
        if (cand.region) {
            for (size_t k : kept) {
                const auto& other = detections[k];
                if (other.label != cand.label || !other.region) continue;
                if (iou(*cand.region, *other.region) > nms_iou_) {
                    suppressed = true;
                    break;
                }
            }
        }
        if (!suppressed) {
            keep[idx] = true;
            kept.push_back(idx);
        }
    }

    std::vector<DetectionRecord> out;
    for (size_t i = 0; i < detections.size(); ++i) {
        if (keep[i]) out.push_back(detections[i]);
    }
    return out;
}

std::vector<TriagedObject> ObjectTriage::triage(const cv::Size& frame_size,
                                                const std::vector<DetectionRecord>& detections) {
    std::vector<TriagedObject> out;
    for (auto& det : suppress(detections)) {
        TriagedObject obj;
        obj.tier = tier_for_label(det.label);
        if (det.region) obj.location = location_for(*det.region, frame_size);
        obj.detection = std::move(det);
        out.push_back(std::move(obj));
    }
    update_tracking(out);
    return out;
}

std::string ObjectTriage::describe(const std::vector<TriagedObject>& objects) const {
    if (objects.empty()) return "No objects detected";

    auto item = [](const TriagedObject& o) {
        return o.location.empty() ? o.detection.label : o.detection.label + " " + o.location;
    };

    std::vector<std::string> important;
    std::vector<const TriagedObject*> others;
    for (const auto& o : objects) {
        if (o.tier == PriorityTier::HIGH) important.push_back(item(o));
        else others.push_back(&o);
    }
    std::stable_sort(others.begin(), others.end(), [](const TriagedObject* a, const TriagedObject* b) {
        return tier_rank(a->tier) < tier_rank(b->tier);
    });

    std::string out;
    auto join = [](const std::vector<std::string>& parts) {
        std::string s;
        for (const auto& p : parts) {
            if (!s.empty()) s += ", ";
            s += p;
        }
        return s;
    };
    if (!important.empty()) out = "Important: " + join(important);
    if (!others.empty()) {
        std::vector<std::string> seen;
        for (const auto* o : others) seen.push_back(item(*o));
        if (!out.empty()) out += ". ";
        out += "Also seen: " + join(seen);
    }
    return out + ".";
}

std::vector<Fact> ObjectTriage::facts(const std::vector<TriagedObject>& objects) const {
    std::vector<Fact> out;
    for (const auto& o : objects) {
        std::string text = o.detection.label;
        if (!o.location.empty()) text += " " + o.location;
        out.push_back(Fact{text, o.tier});
    }
    return out;
}

void ObjectTriage::purge(double now) {
    const double cutoff = now - retention_sec_;
    for (auto it = tracking_.begin(); it != tracking_.end();) {
        auto& hist = it->second.history;
        while (!hist.empty() && hist.front().first <= cutoff) hist.pop_front();
        if (hist.empty()) it = tracking_.erase(it);
        else ++it;
    }
}

void ObjectTriage::update_tracking(const std::vector<TriagedObject>& objects) {
    const double now = clock_.now();
    purge(now);
    for (const auto& o : objects) {
        auto& entry = tracking_[o.detection.label];
        entry.label = o.detection.label;
        entry.tier = o.tier;
        entry.history.emplace_back(now, o.detection);
    }
    purge(now);
}

std::vector<std::string> ObjectTriage::tracked_labels() {
    purge(clock_.now());
    std::vector<std::string> out;
    for (const auto& kv : tracking_) out.push_back(kv.first);
    return out;
}

std::vector<std::pair<double, DetectionRecord>> ObjectTriage::history(const std::string& label) {
    purge(clock_.now());
    auto it = tracking_.find(label);
    if (it == tracking_.end()) return {};
    return {it->second.history.begin(), it->second.history.end()};
}

bool ObjectTriage::is_tracked(const std::string& label) {
    purge(clock_.now());
    return tracking_.count(label) > 0;
}

bool ObjectTriage::changed_since(const std::vector<std::string>& current) {
    purge(clock_.now());
    const std::set<std::string> now_seen(current.begin(), current.end());
    std::set<std::string> tracked;
    for (const auto& kv : tracking_) tracked.insert(kv.first);
    return now_seen != tracked;
}

}  // namespace spex
