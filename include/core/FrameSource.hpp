#pragma once

#include <chrono>
#include <vector>
#include "Types.hpp"

namespace core {

/**
 * Where tracked frames come from. The live hand tracker and the
 * replay file both sit behind this interface.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * Blocks until the next frame is available.
     * @return false once the source is exhausted
     */
    virtual bool next(TrackedFrame& frame) = 0;

    [[nodiscard]] virtual bool finished() const = 0;
};

/**
 * Plays back recorded frames, optionally paced by their own timestamps
 */
class ReplayFrameSource : public FrameSource {
public:
    explicit ReplayFrameSource(std::vector<TrackedFrame> frames, bool realtime = false);

    bool next(TrackedFrame& frame) override;
    [[nodiscard]] bool finished() const override { return index_ >= frames_.size(); }

    [[nodiscard]] size_t size() const { return frames_.size(); }

private:
    std::vector<TrackedFrame> frames_;
    size_t index_ = 0;
    bool realtime_ = false;

    std::chrono::steady_clock::time_point wallStart_;
    TimestampMs firstTimestampMs_ = 0.0;
};

} // namespace core
