#include "text_reader.hpp"

#include <algorithm>
#include <cctype>

namespace spex {

namespace {
std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
}  // namespace

TextReader::TextReader(TextAdapter& adapter, const Clock& clock, float min_confidence)
    : adapter_(adapter), clock_(clock), min_confidence_(min_confidence) {}

std::string TextReader::read(const Frame& frame, TextMode mode) {
    const TextReading reading = adapter_.read(frame, mode);
    const std::string text = trim(reading.text);
    if (text.empty() || reading.confidence < min_confidence_) return "No text detected";

    const double now = clock_.now();
    history_.push_back(TextHistoryEntry{now, text, reading.confidence, mode});
    clean_history(now);
    return format(text, mode);
}

std::string TextReader::format(const std::string& text, TextMode mode) {
    switch (mode) {
        case TextMode::SIGN: return "Sign reads: " + text;
        case TextMode::LABEL: return "Label says: " + text;
        case TextMode::DISPLAY: return "Display shows: " + text;
        case TextMode::SCENE: return "Detected text: " + text;
        default: return text;
    }
}

TextMode TextReader::mode_from_utterance(const std::string& utterance) {
    std::string u = utterance;
    std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (u.find("sign") != std::string::npos) return TextMode::SIGN;
    if (u.find("label") != std::string::npos) return TextMode::LABEL;
    if (u.find("display") != std::string::npos || u.find("screen") != std::string::npos) return TextMode::DISPLAY;
    if (u.find("scene") != std::string::npos) return TextMode::SCENE;
    return TextMode::DOCUMENT;
}

std::vector<TextHistoryEntry> TextReader::history() {
    clean_history(clock_.now());
    return {history_.begin(), history_.end()};
}

void TextReader::clean_history(double now) {
    while (!history_.empty() && now - history_.front().timestamp_sec >= kHistorySec) history_.pop_front();
}

}  // namespace spex
