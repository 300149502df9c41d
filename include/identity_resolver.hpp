#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <opencv2/core.hpp>

#include "clock.hpp"
#include "frame_types.hpp"
#include "identity_gallery.hpp"

namespace spex {

struct FaceRecognition {
    std::string name;              // "Unknown" when no gallery match
    std::string relation;
    std::string description;       // spoken phrase for this face
    std::optional<cv::Rect> region;
    float distance{0.0f};          // to the best candidate, 0 when the gallery is empty
    bool known{false};
};

// Matches face embeddings against the gallery and throttles repeated
// announcements of the same known person.
class IdentityResolver {
public:
    static constexpr const char* kUnknownName = "Unknown";

    IdentityResolver(const IdentityGallery& gallery, const Clock& clock,
                     float threshold = 0.6f, double cooldown_sec = 5.0);

    // Every face with its gallery match. Touches no cooldown state, so
    // background sensing can call it freely.
    std::vector<FaceRecognition> match(const std::vector<DetectionRecord>& faces) const;

    // Keeps the recognitions that may be announced now and stamps the known
    // ones. Known faces inside their cooldown window are left out and counted
    // in `suppressed`; unknown faces are always kept.
    std::vector<FaceRecognition> throttle(const std::vector<FaceRecognition>& recognitions,
                                          size_t* suppressed = nullptr);

    // match() followed by throttle().
    std::vector<FaceRecognition> resolve(const std::vector<DetectionRecord>& faces,
                                         size_t* suppressed = nullptr);

    // Records that these known faces were just spoken about elsewhere.
    void mark_announced(const std::vector<FaceRecognition>& recognitions);

    // `suppressed` is the number of known faces held back by the cooldown;
    // they are still in view, so the reply must not claim nobody is there.
    std::string describe(const std::vector<FaceRecognition>& recognitions, size_t suppressed = 0) const;
    std::vector<Fact> facts(const std::vector<FaceRecognition>& recognitions) const;

    static std::string phrase_for(const std::string& name, const std::string& relation);
    static bool is_close_relation(const std::string& relation);

    void reset_cooldowns();
    std::optional<double> last_announced(const std::string& name) const;

private:
    struct Match {
        int index{-1};
        float distance{0.0f};
    };
    Match nearest(const std::vector<float>& embedding) const;

    const IdentityGallery& gallery_;
    const Clock& clock_;
    float threshold_;
    double cooldown_sec_;
    std::unordered_map<std::string, double> last_spoken_;
};

}  // namespace spex
