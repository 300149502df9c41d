#include "frame_source.hpp"

#include <iostream>

namespace spex {

CameraSource::CameraSource(const std::string& source, const Clock& clock)
    : source_(source), clock_(clock) {}

CameraSource::~CameraSource() {
    release();
}

bool CameraSource::open() {
    std::lock_guard<std::mutex> lock(mu_);
    if (cap_.isOpened()) return true;

    // Allow numeric index or URL
    bool numeric = !source_.empty() && source_.find_first_not_of("0123456789") == std::string::npos;
    try {
        if (numeric) {
            cap_.open(std::stoi(source_));
        } else {
            cap_.open(source_);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Unable to open video source " << source_ << ": " << e.what() << std::endl;
        return false;
    }

    if (!cap_.isOpened()) {
        std::cerr << "[ERROR] Unable to open video source: " << source_ << std::endl;
        return false;
    }
    std::cout << "[INFO] Opened video source: " << source_ << std::endl;
    return true;
}

std::optional<Frame> CameraSource::capture() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!cap_.isOpened()) return std::nullopt;

    cv::Mat image;
    if (!cap_.read(image) || image.empty()) {
        // Only report the first failure of a run of them.
        if (failed_reads_++ == 0) {
            std::cerr << "[WARN] Capture read failed, skipping cycle" << std::endl;
        }
        return std::nullopt;
    }
    failed_reads_ = 0;

    Frame frame;
    frame.image = image;
    frame.timestamp_sec = clock_.now();
    return frame;
}

void CameraSource::release() {
    std::lock_guard<std::mutex> lock(mu_);
    if (cap_.isOpened()) {
        cap_.release();
        std::cout << "[INFO] Released video source: " << source_ << std::endl;
    }
}

bool CameraSource::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cap_.isOpened();
}

}  // namespace spex
