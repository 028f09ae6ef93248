#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include "Types.hpp"
#include "Logger.hpp"
#include "Session.hpp"

namespace core {

/**
 * FrameLoop - the single processing thread
 *
 * Takes the newest frame from the FrameQueue and runs the whole
 * Session pipeline on it (map → classify → resolve → sweep → score).
 * Older queued frames are dropped, never processed late.
 * Resolutions are forwarded to the OscQueue, if one is attached.
 *
 * The Session must not be touched by other threads while the loop runs;
 * poll sessionFinished() instead of Session::state().
 */
class FrameLoop {
public:
    FrameLoop(Session& session,
              std::shared_ptr<FrameQueue> inputQueue,
              std::shared_ptr<OscQueue> oscQueue = nullptr);
    ~FrameLoop();

    void start();
    void stop();
    bool isRunning() const;

    /**
     * Process at most one frame (the newest queued one).
     * @return false if the queue was empty
     */
    bool step();

    /**
     * Snapshot of the last processed frame (for the renderer thread)
     */
    FrameSnapshot lastSnapshot() const;

    /**
     * Set once a processed frame left the Session in Finished
     */
    [[nodiscard]] bool sessionFinished() const { return _sessionFinished; }

    [[nodiscard]] uint64_t framesProcessed() const { return _framesProcessed; }
    [[nodiscard]] uint64_t framesSkipped() const { return _framesSkipped; }
    [[nodiscard]] uint64_t oscDropped() const { return _oscDropped; }
    [[nodiscard]] float currentFps() const { return _currentFps; }

private:
    void loop();
    void publish(const TickResult& result);

    Session& _session;
    std::shared_ptr<FrameQueue> _inputQueue;
    std::shared_ptr<OscQueue> _oscQueue;

    std::atomic<bool> _running;
    std::thread _thread;

    mutable std::mutex _snapshotMutex;
    FrameSnapshot _lastSnapshot;

    std::atomic<bool> _sessionFinished{false};
    std::atomic<uint64_t> _framesProcessed{0};
    std::atomic<uint64_t> _framesSkipped{0};
    std::atomic<uint64_t> _oscDropped{0};

    // FPS Counting
    std::chrono::steady_clock::time_point _lastFpsTime;
    int _frameCount = 0;
    std::atomic<float> _currentFps{0.0f};
};

} // namespace core
