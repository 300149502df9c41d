#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <opencv2/videoio.hpp>
#include "clock.hpp"
#include "frame_types.hpp"

namespace spex {

// Produces frames on demand. A failed capture is an empty optional, never a
// throw: the caller treats it as "no new information this cycle".
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual std::optional<Frame> capture() = 0;
    virtual void release() = 0;
    virtual bool is_open() const = 0;
};

class CameraSource : public FrameSource {
public:
    CameraSource(const std::string& source, const Clock& clock);
    ~CameraSource() override;

    bool open();
    std::optional<Frame> capture() override;
    void release() override;
    bool is_open() const override;

private:
    std::string source_;
    const Clock& clock_;
    cv::VideoCapture cap_;
    mutable std::mutex mu_;
    int failed_reads_{0};
};

}  // namespace spex
