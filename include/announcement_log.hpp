#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace spex {

enum class AnnouncementSource { COMMAND, MONITOR, SYSTEM };

std::string announcement_source_to_string(AnnouncementSource source);

// Escapes a string for use inside a JSON string literal.
std::string json_escape(const std::string& s);

// Appends every spoken utterance to a JSONL file. An empty path disables it.
class AnnouncementLog {
public:
    explicit AnnouncementLog(const std::string& path);

    void append(double timestamp_sec, AnnouncementSource source, const std::string& text);

    // Non-empty lines of the file, oldest first.
    std::vector<std::string> lines() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mu_;
};

}  // namespace spex
