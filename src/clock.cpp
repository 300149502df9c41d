#include "clock.hpp"

#include <opencv2/core/utility.hpp>

namespace spex {

double SteadyClock::now() const {
    return static_cast<double>(cv::getTickCount()) / cv::getTickFrequency();
}

}  // namespace spex
