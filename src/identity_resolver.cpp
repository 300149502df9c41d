#include "identity_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <limits>

namespace spex {

namespace {
const char* kUnknownPhrase = "someone I don't recognize";

std::string lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

float euclidean(const std::vector<float>& a, const std::vector<float>& b) {
    float s = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        const float d = a[i] - b[i];
        s += d * d;
    }
    return std::sqrt(s);
}
}  // namespace

IdentityResolver::IdentityResolver(const IdentityGallery& gallery, const Clock& clock,
                                   float threshold, double cooldown_sec)
    : gallery_(gallery), clock_(clock), threshold_(threshold), cooldown_sec_(cooldown_sec) {}

bool IdentityResolver::is_close_relation(const std::string& relation) {
    const std::string r = lower(relation);
    return r == "mom" || r == "dad" || r == "mother" || r == "father" ||
           r == "brother" || r == "sister";
}

std::string IdentityResolver::phrase_for(const std::string& name, const std::string& relation) {
    if (relation.empty()) return name;
    if (is_close_relation(relation)) return "your " + relation + " " + name;
    return name + ", who is " + relation;
}

// Strict minimum: on equal distances the earlier gallery entry wins, so a
// face never maps to two names.
IdentityResolver::Match IdentityResolver::nearest(const std::vector<float>& embedding) const {
    Match best;
    best.distance = std::numeric_limits<float>::max();
    const auto& entries = gallery_.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].embedding.size() != embedding.size()) continue;
        const float d = euclidean(entries[i].embedding, embedding);
        if (d < best.distance) {
            best.distance = d;
            best.index = static_cast<int>(i);
        }
    }
    return best;
}

std::vector<FaceRecognition> IdentityResolver::match(const std::vector<DetectionRecord>& faces) const {
    std::vector<FaceRecognition> out;
    out.reserve(faces.size());

    for (const auto& face : faces) {
        const Match best = face.features.empty() ? Match{} : nearest(face.features);

        FaceRecognition rec;
        rec.region = face.region;
        if (best.index < 0 || best.distance >= threshold_) {
            rec.name = kUnknownName;
            rec.description = kUnknownPhrase;
            rec.distance = best.index < 0 ? 0.0f : best.distance;
        } else {
            const KnownIdentity& identity = gallery_.entries()[best.index];
            rec.name = identity.name;
            rec.relation = identity.relation;
            rec.description = phrase_for(identity.name, identity.relation);
            rec.distance = best.distance;
            rec.known = true;
        }
        out.push_back(std::move(rec));
    }
    return out;
}

std::vector<FaceRecognition> IdentityResolver::throttle(const std::vector<FaceRecognition>& recognitions,
                                                        size_t* suppressed) {
    std::vector<FaceRecognition> out;
    size_t held = 0;
    const double now = clock_.now();

    for (const auto& rec : recognitions) {
        if (!rec.known) {
            out.push_back(rec);
            continue;
        }
        auto it = last_spoken_.find(rec.name);
        if (it != last_spoken_.end() && now - it->second <= cooldown_sec_) {
            ++held;
            continue;
        }
        last_spoken_[rec.name] = now;
        std::cout << "[INFO] Recognized " << rec.name << " (distance " << rec.distance << ")" << std::endl;
        out.push_back(rec);
    }
    if (suppressed) *suppressed = held;
    return out;
}

std::vector<FaceRecognition> IdentityResolver::resolve(const std::vector<DetectionRecord>& faces,
                                                       size_t* suppressed) {
    return throttle(match(faces), suppressed);
}

void IdentityResolver::mark_announced(const std::vector<FaceRecognition>& recognitions) {
    const double now = clock_.now();
    for (const auto& rec : recognitions) {
        if (rec.known) last_spoken_[rec.name] = now;
    }
}

std::string IdentityResolver::describe(const std::vector<FaceRecognition>& recognitions, size_t suppressed) const {
    if (recognitions.empty()) {
        if (suppressed == 1) return "I still see the same person as a moment ago.";
        if (suppressed > 1) return "I still see the same " + std::to_string(suppressed) + " people as a moment ago.";
        return "I don't see any faces right now.";
    }

    std::vector<std::string> known;
    size_t unknown_count = 0;
    for (const auto& r : recognitions) {
        if (r.known) {
            known.push_back(r.description);
        } else {
            ++unknown_count;
        }
    }

    std::string out;
    if (!known.empty()) {
        out = "I see " + known.front();
        for (size_t i = 1; i < known.size(); ++i) {
            out += (i + 1 == known.size()) ? " and " : ", ";
            out += known[i];
        }
    }
    if (unknown_count > 0) {
        out += out.empty() ? "I see " : " and ";
        out += unknown_count == 1 ? std::string(kUnknownPhrase)
                                  : std::to_string(unknown_count) + " people I don't recognize";
    }
    return out;
}

std::vector<Fact> IdentityResolver::facts(const std::vector<FaceRecognition>& recognitions) const {
    std::vector<Fact> out;
    out.reserve(recognitions.size());
    for (const auto& r : recognitions) {
        out.push_back(Fact{r.description, r.known ? PriorityTier::NORMAL : PriorityTier::HIGH});
    }
    return out;
}

void IdentityResolver::reset_cooldowns() {
    last_spoken_.clear();
}

std::optional<double> IdentityResolver::last_announced(const std::string& name) const {
    auto it = last_spoken_.find(name);
    if (it == last_spoken_.end()) return std::nullopt;
    return it->second;
}

}  // namespace spex
