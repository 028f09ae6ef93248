#include "core/Note.hpp"
#include <cmath>

namespace core {

const char* gradeName(Grade grade) {
    switch (grade) {
        case Grade::Perfect: return "PERFECT";
        case Grade::Great:   return "GREAT";
        case Grade::Good:    return "GOOD";
        case Grade::Miss:    return "MISS";
    }
    return "MISS";
}

const char* noteKindName(NoteKind kind) {
    switch (kind) {
        case NoteKind::Tap:   return "TAP";
        case NoteKind::Slide: return "SLIDE";
    }
    return "TAP";
}

std::optional<Grade> gradeForDelta(double deltaMs) {
    double error = std::abs(deltaMs);
    if (!std::isfinite(error)) return std::nullopt;
    if (error <= PERFECT_WINDOW_MS) return Grade::Perfect;
    if (error <= GREAT_WINDOW_MS) return Grade::Great;
    if (error <= GOOD_WINDOW_MS) return Grade::Good;
    return std::nullopt;
}

Note Note::tap(uint32_t id, TimestampMs timeMs, Point2D position, double hitWindowMs) {
    Note note;
    note.id = id;
    note.kind = NoteKind::Tap;
    note.target = position;
    note.targetTimeMs = timeMs;
    note.hitWindowMs = hitWindowMs;
    return note;
}

Note Note::slide(uint32_t id, std::vector<Checkpoint> path, double hitWindowMs) {
    Note note;
    note.id = id;
    note.kind = NoteKind::Slide;
    note.hitWindowMs = hitWindowMs;
    if (!path.empty()) {
        note.target = path.front().position;
        note.targetTimeMs = path.front().timeMs;
    }
    note.checkpoints = std::move(path);
    return note;
}

Point2D Note::currentPosition() const {
    if (kind == NoteKind::Slide && nextCheckpoint < checkpoints.size()) {
        return checkpoints[nextCheckpoint].position;
    }
    return target;
}

TimestampMs Note::currentTimeMs() const {
    if (kind == NoteKind::Slide && nextCheckpoint < checkpoints.size()) {
        return checkpoints[nextCheckpoint].timeMs;
    }
    return targetTimeMs;
}

TimestampMs Note::latestTimeMs() const {
    if (kind == NoteKind::Slide && !checkpoints.empty()) {
        return checkpoints.back().timeMs + hitWindowMs;
    }
    return targetTimeMs + hitWindowMs;
}

} // namespace core
