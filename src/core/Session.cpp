#include "core/Session.hpp"
#include "core/Logger.hpp"

namespace core {

namespace {

// A sweep grace shorter than the tap confirmation delay misses notes whose
// tap is still being confirmed
HitResolver::Config resolverConfigFor(const SessionConfig& config) {
    HitResolver::Config resolver = config.resolver;
    double minGrace = config.tapConfirmDelayMs();
    if (resolver.sweepGraceMs < minGrace) {
        Logger::warn("Session: sweep grace ", resolver.sweepGraceMs, "ms raised to ", minGrace,
                     "ms to cover tap confirmation");
        resolver.sweepGraceMs = minGrace;
    }
    return resolver;
}

} // namespace

Session::Session(const SessionConfig& config)
    : config_(config),
      mapper_(config.calibration),
      classifier_(config.gesture, config.area),
      clock_(config.inputLatencyMs),
      resolver_(timeline_, resolverConfigFor(config)),
      scores_(config.area) {

    if (config_.allowUncalibrated) {
        // Plain scaling of the camera frame onto the play area's bounding square
        float side = config_.area.radius * 2.0f;
        auto profile = CalibrationProfile::scaling(config_.cameraWidth, config_.cameraHeight, side, side,
                                                   config_.area.centerX - config_.area.radius,
                                                   config_.area.centerY - config_.area.radius);
        mapper_.commit(std::make_shared<const CalibrationProfile>(profile));
        Logger::warn("Session: running uncalibrated (camera ", config_.cameraWidth, "x",
                     config_.cameraHeight, " scaled to ", side, "x", side, ")");
    }
    updateReadiness();
}

const char* Session::getStateName(State state) {
    switch (state) {
        case State::AwaitingCalibration: return "AWAITING_CALIBRATION";
        case State::AwaitingPattern:     return "AWAITING_PATTERN";
        case State::Ready:               return "READY";
        case State::Running:             return "RUNNING";
        case State::Finished:            return "FINISHED";
    }
    return "UNKNOWN";
}

void Session::setState(State newState) {
    if (newState == state_) return;
    Logger::info("Session: ", getStateName(state_), " → ", getStateName(newState));
    state_ = newState;
}

void Session::updateReadiness() {
    if (state_ == State::Running || state_ == State::Finished) return;

    if (!mapper_.isCalibrated()) {
        setState(State::AwaitingCalibration);
    } else if (!patternLoaded_) {
        setState(State::AwaitingPattern);
    } else {
        setState(State::Ready);
    }
}

bool Session::calibrate(const std::vector<CalibrationPair>& pairs) {
    std::shared_ptr<const CalibrationProfile> profile;
    try {
        profile = mapper_.fit(pairs);
    } catch (const SessionError& e) {
        Logger::error("Session: calibration failed, recalibration required: ", e.what());
        return false;
    }

    if (state_ == State::Running) {
        mapper_.stage(std::move(profile));
        Logger::info("Session: recalibration staged, swapping at next idle frame");
    } else {
        mapper_.commit(std::move(profile));
        updateReadiness();
    }
    return true;
}

bool Session::loadPattern(std::vector<Note> notes) {
    if (state_ == State::Running) {
        Logger::warn("Session: cannot load a pattern while running");
        return false;
    }

    try {
        timeline_.load(std::move(notes));
    } catch (const SessionError& e) {
        Logger::error("Session: pattern rejected: ", e.what());
        return false;
    }

    patternLoaded_ = true;
    scores_.reset();
    if (state_ == State::Finished) {
        state_ = State::AwaitingPattern;
    }
    updateReadiness();
    return true;
}

void Session::start(TimestampMs cameraOriginMs) {
    if (state_ != State::Ready) {
        throw SessionError(ErrorCode::NotReady,
                           std::string("cannot start in state ") + getStateName(state_));
    }

    clock_.sync(cameraOriginMs);
    classifier_.reset();
    hasTicked_ = false;
    lastTickMs_ = 0.0;
    stats_ = Stats{};
    setState(State::Running);
    Logger::info("Session: started, camera origin ", cameraOriginMs, "ms, input latency ",
                 clock_.inputLatency(), "ms");
}

TickResult Session::tick(const TrackedFrame& frame) {
    TickResult result;
    if (state_ != State::Running) return result;

    TimestampMs now = clock_.toGame(frame.timestampMs);

    // Backpressure: never process a frame older than (or equal to) the last one
    if (hasTicked_ && now <= lastTickMs_) {
        stats_.staleFrames++;
        Logger::debug("Session: stale frame at ", now, "ms dropped (last ", lastTickMs_, "ms)");
        return result;
    }
    hasTicked_ = true;
    lastTickMs_ = now;

    // 1. Profile swap only between gestures
    if (mapper_.hasPending() && !classifier_.hasActiveGesture()) {
        if (mapper_.commitPending()) {
            stats_.profileSwaps++;
        }
    }

    // 2. Camera -> play area
    std::vector<GestureClassifier::Observation> observations;
    observations.reserve(frame.points.size());
    for (const auto& point : frame.points) {
        MapResult mapped = mapper_.map(point);
        if (mapped.ok()) {
            observations.push_back({point.trackId, false, mapped.point});
        } else if (mapped.status == ErrorCode::LowConfidence) {
            stats_.lowConfidencePoints++;
            observations.push_back({point.trackId, true, {}});
        } else {
            // Unmappable: treated as not seen this frame
            stats_.unmappablePoints++;
        }
    }

    // 3. Gestures
    result.events = classifier_.update(now, observations);
    stats_.events += result.events.size();

    // 4. Hits, then misses
    for (const auto& event : result.events) {
        if (auto resolution = resolver_.resolve(event)) {
            result.resolutions.push_back(*resolution);
        }
    }
    for (auto& missed : resolver_.sweep(now)) {
        result.resolutions.push_back(std::move(missed));
    }
    timeline_.advance(now);

    // 5. Score
    for (const auto& resolution : result.resolutions) {
        scores_.add(resolution);
    }

    stats_.framesProcessed++;
    result.processed = true;
    result.snapshot = makeSnapshot(now);

    if (timeline_.finished()) {
        Logger::info("Session: all notes resolved. ", scores_.summary().toString());
        setState(State::Finished);
    }
    return result;
}

ScoreSummary Session::end() {
    if (state_ == State::Running) {
        Logger::info("Session: ended with ", timeline_.pendingCount(), " notes unresolved");
    }
    classifier_.reset();
    setState(State::Finished);
    return scores_.summary();
}

FrameSnapshot Session::makeSnapshot(TimestampMs now) const {
    FrameSnapshot snapshot;
    snapshot.nowMs = now;
    for (const Note* note : timeline_.liveNotes(now)) {
        snapshot.liveNotes.push_back(*note);
    }
    snapshot.recentResolutions.assign(scores_.recent().begin(), scores_.recent().end());
    snapshot.score = scores_.score();
    snapshot.combo = scores_.combo();
    snapshot.maxCombo = scores_.maxCombo();
    return snapshot;
}

} // namespace core
