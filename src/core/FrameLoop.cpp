#include "core/FrameLoop.hpp"

namespace core {

FrameLoop::FrameLoop(Session& session,
                     std::shared_ptr<FrameQueue> inputQueue,
                     std::shared_ptr<OscQueue> oscQueue)
    : _session(session),
      _inputQueue(std::move(inputQueue)),
      _oscQueue(std::move(oscQueue)),
      _running(false) {
    _lastFpsTime = std::chrono::steady_clock::now();
}

FrameLoop::~FrameLoop() {
    stop();
}

void FrameLoop::start() {
    if (_running) return;
    _running = true;
    _lastFpsTime = std::chrono::steady_clock::now();
    _frameCount = 0;
    _thread = std::thread(&FrameLoop::loop, this);
    Logger::info("FrameLoop started.");
}

void FrameLoop::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    Logger::info("FrameLoop stopped. Processed: ", _framesProcessed.load(),
                 ", skipped: ", _framesSkipped.load());
}

bool FrameLoop::isRunning() const {
    return _running;
}

void FrameLoop::loop() {
    while (_running) {
        if (!step()) {
            // Faster than the camera: short sleep instead of a busy wait
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
}

bool FrameLoop::step() {
    TrackedFrame frame;
    size_t skipped = 0;
    if (!_inputQueue->pop_latest(frame, skipped)) {
        return false;
    }

    if (skipped > 0) {
        _framesSkipped += skipped;
        Logger::debug("FrameLoop: behind, skipped ", skipped, " stale frames");
    }

    TickResult result = _session.tick(frame);
    if (result.processed) {
        _framesProcessed++;
        publish(result);
        if (_session.state() == Session::State::Finished) {
            _sessionFinished = true;
        }
    }

    // FPS over 1s windows
    _frameCount++;
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<float>(now - _lastFpsTime).count();
    if (elapsed >= 1.0f) {
        _currentFps = static_cast<float>(_frameCount) / elapsed;
        _frameCount = 0;
        _lastFpsTime = now;
    }
    return true;
}

void FrameLoop::publish(const TickResult& result) {
    for (const auto& resolution : result.resolutions) {
        Logger::debug("FrameLoop: note ", resolution.noteId, " ", gradeName(resolution.grade));
        if (!_oscQueue) continue;

        ScoreUpdate update;
        update.resolution = resolution;
        update.score = result.snapshot.score;
        update.combo = result.snapshot.combo;
        update.maxCombo = result.snapshot.maxCombo;
        if (!_oscQueue->try_push(std::move(update))) {
            _oscDropped++;
            Logger::warn("FrameLoop: OscQueue full, dropping resolution of note ", resolution.noteId);
        }
    }

    std::lock_guard<std::mutex> lock(_snapshotMutex);
    _lastSnapshot = result.snapshot;
}

FrameSnapshot FrameLoop::lastSnapshot() const {
    std::lock_guard<std::mutex> lock(_snapshotMutex);
    return _lastSnapshot;
}

} // namespace core
