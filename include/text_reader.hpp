#pragma once

#include <deque>
#include <string>
#include <vector>

#include "clock.hpp"
#include "text_adapter.hpp"

namespace spex {

struct TextHistoryEntry {
    double timestamp_sec{0.0};
    std::string text;
    float confidence{0.0f};
    TextMode mode{TextMode::DOCUMENT};
};

// Reads text through the OCR adapter and phrases it for the chosen mode.
class TextReader {
public:
    static constexpr double kHistorySec = 5.0;

    TextReader(TextAdapter& adapter, const Clock& clock, float min_confidence = 0.6f);

    // Spoken result: "Sign reads: EXIT", "No text detected", ...
    std::string read(const Frame& frame, TextMode mode);

    static std::string format(const std::string& text, TextMode mode);
    static TextMode mode_from_utterance(const std::string& utterance);

    std::vector<TextHistoryEntry> history();

private:
    void clean_history(double now);

    TextAdapter& adapter_;
    const Clock& clock_;
    float min_confidence_;
    std::deque<TextHistoryEntry> history_;
};

}  // namespace spex
