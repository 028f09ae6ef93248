#pragma once

#include "Types.hpp"

namespace core {

/**
 * GameClock: converts camera timestamps into game time.
 *
 * Synchronised once per session (sync); afterwards
 *   game = camera - origin - inputLatencyMs
 * The latency term shifts judgments back by the tracker's detection delay.
 */
class GameClock {
public:
    explicit GameClock(double inputLatencyMs = 0.0) : inputLatencyMs_(inputLatencyMs) {}

    void sync(TimestampMs cameraOriginMs) {
        originMs_ = cameraOriginMs;
        synced_ = true;
    }

    [[nodiscard]] TimestampMs toGame(TimestampMs cameraMs) const {
        return cameraMs - originMs_ - inputLatencyMs_;
    }

    [[nodiscard]] bool isSynced() const { return synced_; }
    [[nodiscard]] TimestampMs origin() const { return originMs_; }
    [[nodiscard]] double inputLatency() const { return inputLatencyMs_; }

    void reset() { synced_ = false; originMs_ = 0.0; }

private:
    double inputLatencyMs_ = 0.0;
    TimestampMs originMs_ = 0.0;
    bool synced_ = false;
};

} // namespace core
