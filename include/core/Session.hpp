#pragma once

#include <cstdint>
#include <vector>
#include "Types.hpp"
#include "Errors.hpp"
#include "SessionConfig.hpp"
#include "CalibrationMapper.hpp"
#include "GestureClassifier.hpp"
#include "GameClock.hpp"
#include "Timeline.hpp"
#include "HitResolver.hpp"
#include "ScoreAggregator.hpp"

namespace core {

/**
 * Read-only per-frame view for the renderer
 */
struct FrameSnapshot {
    TimestampMs nowMs = 0.0;
    std::vector<Note> liveNotes;
    std::vector<Resolution> recentResolutions;
    int score = 0;
    int combo = 0;
    int maxCombo = 0;
};

struct TickResult {
    bool processed = false;                   // false: not running, or stale frame dropped
    std::vector<InteractionEvent> events;
    std::vector<Resolution> resolutions;      // Hits first, then sweep misses
    FrameSnapshot snapshot;
};

/**
 * One resolution plus the running score after its frame, for the OSC output
 */
struct ScoreUpdate {
    Resolution resolution;
    int score = 0;
    int combo = 0;
    int maxCombo = 0;
};

using OscQueue = SpscQueue<ScoreUpdate, OSC_QUEUE_SIZE>;

/**
 * Session: one play session, from calibration to the final score.
 *
 * Owns mapper, classifier, clock, timeline, resolver and scores; nothing
 * lives in globals. tick() is the only per-frame entry point and runs the
 * whole pipeline synchronously with the frame's own timestamp, so a
 * recorded frame log replays to the exact same grades.
 */
class Session {
public:
    enum class State {
        AwaitingCalibration,
        AwaitingPattern,
        Ready,
        Running,
        Finished
    };

    struct Stats {
        uint64_t framesProcessed = 0;
        uint64_t staleFrames = 0;
        uint64_t lowConfidencePoints = 0;
        uint64_t unmappablePoints = 0;
        uint64_t events = 0;
        uint64_t profileSwaps = 0;
    };

    explicit Session(const SessionConfig& config = SessionConfig{});

    // Resolver holds a reference into this object
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Fit a calibration profile. Before start() it becomes active at once;
     * while running it is staged and swapped in once no gesture is in flight.
     * @return false (and keeps the previous profile) on CalibrationFailed
     */
    bool calibrate(const std::vector<CalibrationPair>& pairs);

    /**
     * Validate and install a pattern. Not allowed while running.
     * @return false on InvalidPattern; the session stays usable
     */
    bool loadPattern(std::vector<Note> notes);

    /**
     * Synchronise the game clock: camera time cameraOriginMs becomes game time 0
     * (before input latency compensation).
     * Throws SessionError(NotReady) without a profile or a pattern.
     */
    void start(TimestampMs cameraOriginMs);

    /**
     * Process one camera frame. Never throws for per-frame problems.
     */
    TickResult tick(const TrackedFrame& frame);

    /**
     * Stop the session and return the final score
     */
    ScoreSummary end();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] static const char* getStateName(State state);

    [[nodiscard]] const Timeline& timeline() const { return timeline_; }
    [[nodiscard]] const ScoreAggregator& scores() const { return scores_; }
    [[nodiscard]] const CalibrationMapper& mapper() const { return mapper_; }
    [[nodiscard]] const GestureClassifier& classifier() const { return classifier_; }
    [[nodiscard]] const GameClock& clock() const { return clock_; }
    [[nodiscard]] const Stats& stats() const { return stats_; }
    [[nodiscard]] const SessionConfig& config() const { return config_; }

private:
    SessionConfig config_;
    CalibrationMapper mapper_;
    GestureClassifier classifier_;
    GameClock clock_;
    Timeline timeline_;
    HitResolver resolver_;      // References timeline_, declared after it
    ScoreAggregator scores_;

    State state_ = State::AwaitingCalibration;
    bool patternLoaded_ = false;
    bool hasTicked_ = false;
    TimestampMs lastTickMs_ = 0.0;
    Stats stats_;

    void updateReadiness();
    void setState(State newState);
    FrameSnapshot makeSnapshot(TimestampMs now) const;
};

} // namespace core
