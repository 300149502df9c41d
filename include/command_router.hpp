#pragma once

#include <string>

#include "text_adapter.hpp"

namespace spex {

enum class CommandKind { NONE, IDENTIFY, OBJECTS, READ_TEXT, GESTURE_WATCH, DESCRIBE, HELP, EXIT, TIME, DATE };

std::string command_kind_to_string(CommandKind kind);

struct Command {
    CommandKind kind{CommandKind::NONE};
    TextMode text_mode{TextMode::DOCUMENT};   // only meaningful for READ_TEXT
};

// Maps one utterance to exactly one command by keyword, case-insensitive,
// first match wins: identify, time, date, objects, read, gesture watch,
// describe, help, exit.
Command route_command(const std::string& utterance);

// True for utterances that end a gesture watch session and return to the
// command loop. "exit" is routed as a command instead.
bool is_stop_utterance(const std::string& utterance);

extern const char* const kHelpText;

}  // namespace spex
