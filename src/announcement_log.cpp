#include "announcement_log.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace spex {

std::string announcement_source_to_string(AnnouncementSource source) {
    switch (source) {
        case AnnouncementSource::COMMAND: return "command";
        case AnnouncementSource::MONITOR: return "monitor";
        default: return "system";
    }
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

AnnouncementLog::AnnouncementLog(const std::string& path) : path_(path) {}

void AnnouncementLog::append(double timestamp_sec, AnnouncementSource source, const std::string& text) {
    if (path_.empty()) return;

    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"announcement\",";
    oss << "\"timestamp\":" << std::fixed << std::setprecision(3) << timestamp_sec << ",";
    oss << "\"source\":\"" << announcement_source_to_string(source) << "\",";
    oss << "\"text\":\"" << json_escape(text) << "\"";
    oss << "}\n";

    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        std::cerr << "[WARN] Unable to open announcements file: " << path_ << std::endl;
        return;
    }
    f << oss.str();
}

std::vector<std::string> AnnouncementLog::lines() const {
    std::vector<std::string> out;
    if (path_.empty()) return out;

    std::lock_guard<std::mutex> lock(mu_);
    std::ifstream f(path_);
    if (!f) return out;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

}  // namespace spex
