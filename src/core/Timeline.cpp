#include "core/Timeline.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace core {

namespace {

bool finitePoint(const Point2D& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

[[noreturn]] void reject(const Note& note, const std::string& reason) {
    std::ostringstream ss;
    ss << "note " << note.id << ": " << reason;
    throw SessionError(ErrorCode::InvalidPattern, ss.str());
}

} // namespace

void Timeline::validate(const std::vector<Note>& notes) {
    if (notes.empty()) {
        throw SessionError(ErrorCode::InvalidPattern, "pattern has no notes");
    }

    std::set<uint32_t> ids;
    TimestampMs previous = -INFINITY;

    for (const auto& note : notes) {
        if (!ids.insert(note.id).second) {
            reject(note, "duplicate id");
        }
        if (!std::isfinite(note.targetTimeMs) || !finitePoint(note.target)) {
            reject(note, "non-finite target");
        }
        if (!std::isfinite(note.hitWindowMs) || note.hitWindowMs <= 0.0) {
            reject(note, "hit window must be positive");
        }
        if (note.targetTimeMs < previous) {
            reject(note, "target time goes backwards (" + std::to_string(note.targetTimeMs) +
                         " after " + std::to_string(previous) + ")");
        }
        previous = note.targetTimeMs;

        if (note.kind == NoteKind::Tap) {
            if (!note.checkpoints.empty()) {
                reject(note, "tap note with checkpoints");
            }
            continue;
        }

        // Slide path
        if (note.checkpoints.empty()) {
            reject(note, "slide note without checkpoints");
        }
        const auto& first = note.checkpoints.front();
        if (first.timeMs != note.targetTimeMs ||
            first.position.x != note.target.x || first.position.y != note.target.y) {
            reject(note, "first checkpoint does not match the target");
        }
        TimestampMs last = first.timeMs;
        for (const auto& cp : note.checkpoints) {
            if (!std::isfinite(cp.timeMs) || !finitePoint(cp.position)) {
                reject(note, "non-finite checkpoint");
            }
            if (cp.timeMs < last) {
                reject(note, "checkpoint times go backwards");
            }
            last = cp.timeMs;
        }
    }
}

void Timeline::load(std::vector<Note> notes) {
    validate(notes);

    double maxWindow = 0.0;
    for (auto& note : notes) {
        note.status = NoteStatus::Pending;
        note.grade = Grade::Miss;
        note.nextCheckpoint = 0;
        note.checkpointGrades.clear();
        note.checkpointDeltas.clear();
        maxWindow = std::max(maxWindow, note.hitWindowMs);
    }

    notes_ = std::move(notes);
    maxWindow_ = maxWindow;
    cursor_ = 0;
    now_ = 0.0;
    started_ = false;

    Logger::info("Timeline: loaded ", notes_.size(), " notes");
}

bool Timeline::advance(TimestampMs now) {
    if (started_ && now < now_) {
        Logger::warn("Timeline: refusing to rewind from ", now_, "ms to ", now, "ms");
        return false;
    }
    now_ = now;
    started_ = true;

    while (cursor_ < notes_.size() && !notes_[cursor_].isPending()) {
        ++cursor_;
    }
    return true;
}

std::vector<const Note*> Timeline::liveNotes(TimestampMs at) const {
    std::vector<const Note*> live;

    for (size_t i = cursor_; i < notes_.size(); ++i) {
        const Note& note = notes_[i];
        // Sorted by target; nothing further can be live yet
        if (note.targetTimeMs - maxWindow_ > at) break;
        if (!note.isPending()) continue;

        if (std::abs(note.currentTimeMs() - at) <= note.hitWindowMs) {
            live.push_back(&note);
        }
    }
    return live;
}

const Note* Timeline::find(uint32_t id) const {
    auto it = std::find_if(notes_.begin(), notes_.end(),
                           [id](const Note& n) { return n.id == id; });
    return it == notes_.end() ? nullptr : &*it;
}

size_t Timeline::pendingCount() const {
    return static_cast<size_t>(std::count_if(notes_.begin() + static_cast<std::ptrdiff_t>(cursor_), notes_.end(),
                                             [](const Note& n) { return n.isPending(); }));
}

} // namespace core
