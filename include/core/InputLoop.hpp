#pragma once

#include <thread>
#include <atomic>
#include <memory>

#include "core/FrameSource.hpp"
#include "core/Types.hpp"

namespace core {

/**
 * Dedicated thread for receiving frames from the hand tracker.
 * Pushes every frame into the FrameQueue. Stale frames are dropped on the
 * consumer side by FrameLoop (pop_latest keeps the newest). The producer
 * may not pop, so a full queue can only refuse the incoming frame; that
 * counts as framesDropped().
 */
class InputLoop {
public:
    InputLoop(std::shared_ptr<FrameSource> source,
              std::shared_ptr<FrameQueue> outputQueue);

    ~InputLoop();

    void start();
    void stop();

    [[nodiscard]] bool hasError() const { return hasError_; }
    [[nodiscard]] bool isFinished() const { return finished_; }
    [[nodiscard]] uint64_t framesRead() const { return framesRead_; }
    [[nodiscard]] uint64_t framesDropped() const { return framesDropped_; }

private:
    void loop();

    std::shared_ptr<FrameSource> source_;
    std::shared_ptr<FrameQueue> outputQueue_; // To FrameLoop

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> hasError_{false};
    std::atomic<bool> finished_{false};
    std::atomic<uint64_t> framesRead_{0};
    std::atomic<uint64_t> framesDropped_{0};
};

} // namespace core
