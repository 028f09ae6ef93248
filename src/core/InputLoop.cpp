#include "core/InputLoop.hpp"
#include "core/Logger.hpp"

namespace core {

InputLoop::InputLoop(std::shared_ptr<FrameSource> source,
                     std::shared_ptr<FrameQueue> outputQueue)
    : source_(std::move(source)), outputQueue_(std::move(outputQueue)) {
}

InputLoop::~InputLoop() {
    stop();
}

void InputLoop::start() {
    if (running_) return;
    running_ = true;
    finished_ = false;
    hasError_ = false;
    thread_ = std::thread(&InputLoop::loop, this);
    Logger::info("InputLoop started.");
}

void InputLoop::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        Logger::info("InputLoop stopped. Frames read: ", framesRead_.load(),
                     ", dropped: ", framesDropped_.load());
    }
}

void InputLoop::loop() {
    while (running_) {
        try {
            TrackedFrame frame;
            if (!source_->next(frame)) {
                Logger::info("InputLoop: source exhausted after ", framesRead_.load(), " frames");
                finished_ = true;
                break;
            }
            framesRead_++;

            if (!outputQueue_->try_push(std::move(frame))) {
                // Queue full: FrameLoop is behind and will skip to the newest queued frame anyway
                framesDropped_++;
                Logger::warn("InputLoop: FrameQueue full, dropping frame #", framesRead_.load());
            }
        } catch (const std::exception& e) {
            Logger::error("InputLoop Critical Error (tracker lost?): ", e.what());
            hasError_ = true;
            break;
        }
    }
    running_ = false;
}

} // namespace core
