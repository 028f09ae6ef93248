#include "core/FrameSource.hpp"
#include <thread>

namespace core {

ReplayFrameSource::ReplayFrameSource(std::vector<TrackedFrame> frames, bool realtime)
    : frames_(std::move(frames)), realtime_(realtime) {
    if (!frames_.empty()) {
        firstTimestampMs_ = frames_.front().timestampMs;
    }
}

bool ReplayFrameSource::next(TrackedFrame& frame) {
    if (finished()) return false;

    if (realtime_) {
        if (index_ == 0) {
            wallStart_ = std::chrono::steady_clock::now();
        }
        // Hold the frame back until its offset from the first frame has elapsed
        auto offset = std::chrono::duration<double, std::milli>(frames_[index_].timestampMs - firstTimestampMs_);
        auto due = wallStart_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(offset);
        std::this_thread::sleep_until(due);
    }

    frame = frames_[index_++];
    return true;
}

} // namespace core
