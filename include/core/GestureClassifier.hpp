#pragma once

#include "Types.hpp"
#include "PlayArea.hpp"
#include "math/Filters.hpp"
#include <deque>
#include <functional>
#include <map>
#include <vector>

namespace core {

/**
 * GestureClassifier: per-track finite state machine turning calibrated
 * fingertip positions into tap / slide interaction events.
 *
 * States: Idle → Candidate → {tap emitted | Holding | Sliding} → Idle
 *
 * Features:
 * - Multi-frame confirmation: a release needs N consecutive missing frames,
 *   so a single dropped or noisy frame never produces a tap
 * - Taps are timestamped at contact, not at confirmation
 * - Low-confidence frames carry no information; too many in a row reset the track
 * - Tracking-loss timeout resets the track to Idle
 */
class GestureClassifier {
public:
    enum class State {
        Idle = 0,
        Candidate = 1,   // Touching, not yet tap or slide
        Holding = 2,     // Stayed put past the tap window
        Sliding = 3      // Moved past the movement threshold
    };

    struct Config {
        float moveThreshold = 30.0f;        // Play-area units, tap vs slide
        double tapMaxDurationMs = 250.0;    // Contact longer than this is not a tap
        int releaseFrames = 2;              // Consecutive missing frames = release
        int lowConfidenceFrames = 3;        // Consecutive low-confidence frames = reset
        double trackingLostTimeoutMs = 300.0;
        bool smoothing = false;             // One Euro smoothing of positions
        double smoothingMinCutoff = 1.0;
        double smoothingBeta = 0.007;
    };

    /**
     * One per visible track and frame, produced by the calibration step
     */
    struct Observation {
        int trackId = 0;
        bool lowConfidence = false;
        Point2D position;   // Play-area space, valid when !lowConfidence
    };

    using TransitionCallback = std::function<void(int trackId, State from, State to)>;

    GestureClassifier();
    GestureClassifier(const Config& config, const PlayArea& area);

    /**
     * Advance every track by one frame.
     * @param now Game-clock time of this frame
     * @param observations Tracks seen this frame; absent tracks count as missing
     * @return Events in emission order (by track id, then transition order)
     */
    std::vector<InteractionEvent> update(TimestampMs now, const std::vector<Observation>& observations);

    /**
     * True while any track is Candidate, Holding or Sliding
     */
    [[nodiscard]] bool hasActiveGesture() const;

    [[nodiscard]] State getState(int trackId) const;
    [[nodiscard]] static const char* getStateName(State state);
    [[nodiscard]] size_t trackCount() const { return tracks_.size(); }
    [[nodiscard]] size_t historySize(int trackId) const;

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

    /**
     * Drop all tracks (session end / recalibration from scratch)
     */
    void reset();

private:
    struct Track {
        State state = State::Idle;
        TimestampMs startTs = 0.0;
        Point2D startPos;
        TimestampMs lastSeenTs = 0.0;
        Point2D lastPos;
        int missingFrames = 0;
        int lowConfidenceFrames = 0;
        std::deque<Point2D> history;     // Bounded by GESTURE_HISTORY_FRAMES
        math::PointFilter filter;
    };

    Config config_;
    PlayArea area_;
    std::map<int, Track> tracks_;     // Ordered: deterministic emission
    TransitionCallback transitionCallback_;

    void onValid(int trackId, Track& track, TimestampMs now, Point2D pos,
                 std::vector<InteractionEvent>& out);
    void onAbsent(int trackId, Track& track, TimestampMs now, bool leftArea,
                  std::vector<InteractionEvent>& out);
    void onLowConfidence(int trackId, Track& track, std::vector<InteractionEvent>& out);
    void checkTimeout(int trackId, Track& track, TimestampMs now, std::vector<InteractionEvent>& out);

    void beginSlide(int trackId, Track& track, TimestampMs now, const Point2D& pos,
                    std::vector<InteractionEvent>& out);
    void abandon(int trackId, Track& track, std::vector<InteractionEvent>& out);
    void remember(Track& track, TimestampMs now, const Point2D& pos);
    void transitionTo(int trackId, Track& track, State newState);
};

} // namespace core
