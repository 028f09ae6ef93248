#include "core/GestureClassifier.hpp"
#include "core/Logger.hpp"
#include "core/Errors.hpp"

namespace core {

GestureClassifier::GestureClassifier()
    : GestureClassifier(Config{}, getDefaultPlayArea()) {
}

GestureClassifier::GestureClassifier(const Config& config, const PlayArea& area)
    : config_(config), area_(area) {
}

void GestureClassifier::reset() {
    tracks_.clear();
}

const char* GestureClassifier::getStateName(State state) {
    switch (state) {
        case State::Idle:      return "IDLE";
        case State::Candidate: return "CANDIDATE";
        case State::Holding:   return "HOLDING";
        case State::Sliding:   return "SLIDING";
    }
    return "IDLE";
}

GestureClassifier::State GestureClassifier::getState(int trackId) const {
    auto it = tracks_.find(trackId);
    return it == tracks_.end() ? State::Idle : it->second.state;
}

size_t GestureClassifier::historySize(int trackId) const {
    auto it = tracks_.find(trackId);
    return it == tracks_.end() ? 0 : it->second.history.size();
}

bool GestureClassifier::hasActiveGesture() const {
    for (const auto& [id, track] : tracks_) {
        if (track.state != State::Idle) return true;
    }
    return false;
}

std::vector<InteractionEvent> GestureClassifier::update(TimestampMs now,
                                                        const std::vector<Observation>& observations) {
    std::vector<InteractionEvent> events;

    // Index this frame's observations; first one wins on duplicate ids
    std::map<int, const Observation*> seen;
    for (const auto& obs : observations) {
        if (!seen.emplace(obs.trackId, &obs).second) {
            Logger::debug("GestureClassifier: duplicate track ", obs.trackId, " in one frame, ignored");
            continue;
        }
        // Only a confident point inside the area can open a new track
        if (tracks_.count(obs.trackId) == 0 && !obs.lowConfidence && area_.contains(obs.position)) {
            Track track;
            track.filter = math::PointFilter(config_.smoothingMinCutoff, config_.smoothingBeta);
            tracks_.emplace(obs.trackId, std::move(track));
        }
    }

    for (auto it = tracks_.begin(); it != tracks_.end();) {
        int trackId = it->first;
        Track& track = it->second;

        auto obsIt = seen.find(trackId);
        if (obsIt == seen.end()) {
            onAbsent(trackId, track, now, false, events);
        } else if (obsIt->second->lowConfidence) {
            onLowConfidence(trackId, track, events);
        } else {
            onValid(trackId, track, now, obsIt->second->position, events);
        }

        checkTimeout(trackId, track, now, events);

        if (track.state == State::Idle) {
            it = tracks_.erase(it);
        } else {
            ++it;
        }
    }

    return events;
}

void GestureClassifier::onValid(int trackId, Track& track, TimestampMs now, Point2D pos,
                                std::vector<InteractionEvent>& out) {
    if (config_.smoothing) {
        track.filter.filter(pos.x, pos.y, now / 1000.0);
    }

    if (!area_.contains(pos)) {
        onAbsent(trackId, track, now, true, out);
        return;
    }

    track.missingFrames = 0;
    track.lowConfidenceFrames = 0;

    switch (track.state) {
        case State::Idle:
            track.startTs = now;
            track.startPos = pos;
            remember(track, now, pos);
            transitionTo(trackId, track, State::Candidate);
            break;

        case State::Candidate:
            remember(track, now, pos);
            if (distance(pos, track.startPos) > config_.moveThreshold) {
                beginSlide(trackId, track, now, pos, out);
            } else if (now - track.startTs > config_.tapMaxDurationMs) {
                transitionTo(trackId, track, State::Holding);
            }
            break;

        case State::Holding:
            remember(track, now, pos);
            if (distance(pos, track.startPos) > config_.moveThreshold) {
                beginSlide(trackId, track, now, pos, out);
            }
            break;

        case State::Sliding:
            remember(track, now, pos);
            out.push_back({InteractionKind::SlideMove, trackId, pos, now});
            break;
    }
}

void GestureClassifier::onAbsent(int trackId, Track& track, TimestampMs now, bool leftArea,
                                 std::vector<InteractionEvent>& out) {
    switch (track.state) {
        case State::Idle:
            break;

        case State::Candidate:
            if (++track.missingFrames >= config_.releaseFrames) {
                // Quick touch-and-release without travel: tap, judged at contact time
                if (track.lastSeenTs - track.startTs <= config_.tapMaxDurationMs) {
                    out.push_back({InteractionKind::Tap, trackId, track.startPos, track.startTs});
                }
                transitionTo(trackId, track, State::Idle);
            }
            break;

        case State::Holding:
            if (++track.missingFrames >= config_.releaseFrames) {
                transitionTo(trackId, track, State::Idle);
            }
            break;

        case State::Sliding:
            if (leftArea) {
                out.push_back({InteractionKind::SlideEnd, trackId, track.lastPos, now});
                transitionTo(trackId, track, State::Idle);
            } else if (++track.missingFrames >= config_.releaseFrames) {
                out.push_back({InteractionKind::SlideEnd, trackId, track.lastPos, track.lastSeenTs});
                transitionTo(trackId, track, State::Idle);
            }
            break;
    }
}

void GestureClassifier::onLowConfidence(int trackId, Track& track, std::vector<InteractionEvent>& out) {
    if (track.state == State::Idle) return;

    if (++track.lowConfidenceFrames > config_.lowConfidenceFrames) {
        Logger::debug("GestureClassifier: track ", trackId, " low confidence for ",
                      track.lowConfidenceFrames, " frames, resetting");
        abandon(trackId, track, out);
    }
}

void GestureClassifier::checkTimeout(int trackId, Track& track, TimestampMs now,
                                     std::vector<InteractionEvent>& out) {
    if (track.state == State::Idle) return;

    if (now - track.lastSeenTs > config_.trackingLostTimeoutMs) {
        Logger::debug("GestureClassifier: track ", trackId, " ", errorCodeName(ErrorCode::TrackingLost),
                      " after ", now - track.lastSeenTs, "ms");
        abandon(trackId, track, out);
    }
}

void GestureClassifier::beginSlide(int trackId, Track& track, TimestampMs now, const Point2D& pos,
                                   std::vector<InteractionEvent>& out) {
    transitionTo(trackId, track, State::Sliding);
    out.push_back({InteractionKind::SlideStart, trackId, track.startPos, track.startTs});
    out.push_back({InteractionKind::SlideMove, trackId, pos, now});
}

void GestureClassifier::abandon(int trackId, Track& track, std::vector<InteractionEvent>& out) {
    if (track.state == State::Sliding) {
        out.push_back({InteractionKind::SlideEnd, trackId, track.lastPos, track.lastSeenTs});
    }
    transitionTo(trackId, track, State::Idle);
}

void GestureClassifier::remember(Track& track, TimestampMs now, const Point2D& pos) {
    track.lastSeenTs = now;
    track.lastPos = pos;
    track.history.push_back(pos);
    while (track.history.size() > GESTURE_HISTORY_FRAMES) {
        track.history.pop_front();
    }
}

void GestureClassifier::transitionTo(int trackId, Track& track, State newState) {
    State oldState = track.state;
    track.state = newState;

    if (newState == State::Idle) {
        track.missingFrames = 0;
        track.lowConfidenceFrames = 0;
        track.history.clear();
        track.filter.reset();
    }

    Logger::debug("GestureClassifier: track ", trackId, " ", getStateName(oldState),
                  " → ", getStateName(newState));

    if (transitionCallback_) {
        transitionCallback_(trackId, oldState, newState);
    }
}

} // namespace core
