#include "core/HitResolver.hpp"
#include "core/Logger.hpp"
#include <cmath>

namespace core {

HitResolver::HitResolver(Timeline& timeline)
    : HitResolver(timeline, Config{}) {
}

HitResolver::HitResolver(Timeline& timeline, const Config& config)
    : timeline_(timeline), config_(config) {
}

Note* HitResolver::findCandidate(const InteractionEvent& event, NoteKind kind, double& delta) {
    Note* best = nullptr;
    double bestError = 0.0;

    for (const Note* live : timeline_.liveNotes(event.timestampMs)) {
        if (live->kind != kind) continue;
        if (distance(live->currentPosition(), event.position) > config_.hitRadius) continue;

        double d = event.timestampMs - live->currentTimeMs();
        if (!gradeForDelta(d)) continue;

        double error = std::abs(d);
        if (!best || error < bestError || (error == bestError && live->id < best->id)) {
            // Live notes live inside timeline_.notes_; recover the mutable slot
            best = &timeline_.notes_[static_cast<size_t>(live - timeline_.notes_.data())];
            bestError = error;
            delta = d;
        }
    }
    return best;
}

std::optional<Resolution> HitResolver::resolve(const InteractionEvent& event) {
    NoteKind kind;
    switch (event.kind) {
        case InteractionKind::Tap:
            kind = NoteKind::Tap;
            break;
        case InteractionKind::SlideStart:
        case InteractionKind::SlideMove:
            kind = NoteKind::Slide;
            break;
        case InteractionKind::SlideEnd:
        default:
            return std::nullopt;
    }

    double delta = 0.0;
    Note* note = findCandidate(event, kind, delta);
    if (!note) return std::nullopt;

    Grade grade = *gradeForDelta(delta);

    if (kind == NoteKind::Tap) {
        note->status = NoteStatus::Hit;
        note->grade = grade;
        Logger::debug("HitResolver: note ", note->id, " ", gradeName(grade), " (", delta, "ms)");
        return Resolution{note->id, note->kind, grade, delta, event.timestampMs, note->target};
    }

    // One checkpoint per event
    note->checkpointGrades.push_back(grade);
    note->checkpointDeltas.push_back(delta);
    ++note->nextCheckpoint;
    ++checkpointsConsumed_;

    if (note->nextCheckpoint >= note->checkpoints.size()) {
        return finishSlide(*note, event.timestampMs);
    }
    return std::nullopt;
}

std::vector<Resolution> HitResolver::sweep(TimestampMs now) {
    std::vector<Resolution> missed;
    auto& notes = timeline_.notes_;

    for (size_t i = timeline_.cursor_; i < notes.size(); ++i) {
        Note& note = notes[i];
        // Sorted by target: later notes cannot have expired either
        if (note.targetTimeMs + config_.sweepGraceMs >= now) break;
        if (!note.isPending()) continue;

        if (note.kind == NoteKind::Tap) {
            if (note.targetTimeMs + note.hitWindowMs + config_.sweepGraceMs < now) {
                note.status = NoteStatus::Missed;
                note.grade = Grade::Miss;
                Logger::debug("HitResolver: note ", note.id, " MISS (window elapsed)");
                missed.push_back(Resolution{note.id, note.kind, Grade::Miss, std::nullopt, now, note.target});
            }
            continue;
        }

        while (note.nextCheckpoint < note.checkpoints.size() &&
               note.checkpoints[note.nextCheckpoint].timeMs + note.hitWindowMs + config_.sweepGraceMs < now) {
            note.checkpointGrades.push_back(Grade::Miss);
            note.checkpointDeltas.push_back(std::nullopt);
            ++note.nextCheckpoint;
            ++checkpointsConsumed_;
        }
        if (note.nextCheckpoint >= note.checkpoints.size()) {
            missed.push_back(finishSlide(note, now));
        }
    }
    return missed;
}

Resolution HitResolver::finishSlide(Note& note, TimestampMs now) {
    Grade worst = Grade::Perfect;
    std::optional<double> worstDelta;
    for (size_t i = 0; i < note.checkpointGrades.size(); ++i) {
        Grade g = note.checkpointGrades[i];
        if (i == 0 || static_cast<int>(g) > static_cast<int>(worst)) {
            worst = g;
            worstDelta = note.checkpointDeltas[i];
        }
    }

    note.grade = worst;
    note.status = worst == Grade::Miss ? NoteStatus::Missed : NoteStatus::Hit;
    Logger::debug("HitResolver: slide ", note.id, " finished ", gradeName(worst));
    return Resolution{note.id, note.kind, worst, worstDelta, now, note.target};
}

} // namespace core
