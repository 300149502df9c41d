#include "command_router.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include "text_reader.hpp"

namespace spex {

const char* const kHelpText =
    "I can help you in several ways: "
    "Say 'who' or 'recognize' to identify people, "
    "Say 'what' or 'see' to describe objects around you, "
    "Say 'read' to read text, with options for signs, labels, or displays, "
    "Say 'gesture' to detect hand gestures, "
    "Say 'describe environment' for a complete description, "
    "Or say 'exit' to close the program.";

namespace {
std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}
}  // namespace

std::string command_kind_to_string(CommandKind kind) {
    switch (kind) {
        case CommandKind::IDENTIFY: return "identify";
        case CommandKind::OBJECTS: return "objects";
        case CommandKind::READ_TEXT: return "read_text";
        case CommandKind::GESTURE_WATCH: return "gesture_watch";
        case CommandKind::DESCRIBE: return "describe";
        case CommandKind::HELP: return "help";
        case CommandKind::EXIT: return "exit";
        case CommandKind::TIME: return "time";
        case CommandKind::DATE: return "date";
        default: return "none";
    }
}

Command route_command(const std::string& utterance) {
    const std::string u = lower(utterance);
    Command cmd;
    if (u.find_first_not_of(" \t\r\n") == std::string::npos) return cmd;

    // Time and date come before the object query so that "what time is it"
    // and "what is the date today" reach them.
    if (contains_any(u, {"who", "recognize"})) {
        cmd.kind = CommandKind::IDENTIFY;
    } else if (contains_any(u, {"time"})) {
        cmd.kind = CommandKind::TIME;
    } else if (contains_any(u, {"date", "today"})) {
        cmd.kind = CommandKind::DATE;
    } else if (contains_any(u, {"what", "see"})) {
        cmd.kind = CommandKind::OBJECTS;
    } else if (contains_any(u, {"read"})) {
        cmd.kind = CommandKind::READ_TEXT;
        cmd.text_mode = TextReader::mode_from_utterance(u);
    } else if (contains_any(u, {"gesture", "movement"})) {
        cmd.kind = CommandKind::GESTURE_WATCH;
    } else if (contains_any(u, {"describe", "environment", "surroundings"})) {
        cmd.kind = CommandKind::DESCRIBE;
    } else if (contains_any(u, {"help"})) {
        cmd.kind = CommandKind::HELP;
    } else if (contains_any(u, {"exit"})) {
        cmd.kind = CommandKind::EXIT;
    }
    return cmd;
}

bool is_stop_utterance(const std::string& utterance) {
    const std::string u = lower(utterance);
    return contains_any(u, {"stop"});
}

}  // namespace spex
