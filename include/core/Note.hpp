#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "Types.hpp"

namespace core {

enum class Grade {
    Perfect = 0,
    Great = 1,
    Good = 2,
    Miss = 3
};

enum class NoteKind {
    Tap = 0,
    Slide = 1
};

enum class NoteStatus {
    Pending = 0,
    Hit = 1,
    Missed = 2
};

const char* gradeName(Grade grade);
const char* noteKindName(NoteKind kind);

/**
 * Grade for a timing error. Closed windows: |delta| <= 50 Perfect,
 * <= 150 Great, <= 200 Good. Anything wider is not a hit at all.
 */
std::optional<Grade> gradeForDelta(double deltaMs);

struct Checkpoint {
    Point2D position;
    TimestampMs timeMs = 0.0;
};

/**
 * One scheduled target. Target data is immutable after load; status and
 * slide progress are written by the HitResolver only.
 */
struct Note {
    uint32_t id = 0;
    NoteKind kind = NoteKind::Tap;
    Point2D target;
    TimestampMs targetTimeMs = 0.0;
    double hitWindowMs = DEFAULT_HIT_WINDOW_MS;
    std::vector<Checkpoint> checkpoints;   // Slide only; front() == target

    // Resolution state
    NoteStatus status = NoteStatus::Pending;
    Grade grade = Grade::Miss;             // Valid once status != Pending
    size_t nextCheckpoint = 0;             // Slide progress
    std::vector<Grade> checkpointGrades;
    std::vector<std::optional<double>> checkpointDeltas;

    static Note tap(uint32_t id, TimestampMs timeMs, Point2D position,
                    double hitWindowMs = DEFAULT_HIT_WINDOW_MS);

    /**
     * Slide along the given path; target is taken from the first checkpoint
     */
    static Note slide(uint32_t id, std::vector<Checkpoint> path,
                      double hitWindowMs = DEFAULT_HIT_WINDOW_MS);

    [[nodiscard]] bool isPending() const { return status == NoteStatus::Pending; }

    /**
     * Where and when the note currently expects input
     * (the target for taps, the next unconsumed checkpoint for slides)
     */
    [[nodiscard]] Point2D currentPosition() const;
    [[nodiscard]] TimestampMs currentTimeMs() const;

    /**
     * Last moment any part of the note can still be judged
     */
    [[nodiscard]] TimestampMs latestTimeMs() const;
};

/**
 * One entry of the (note id, Grade) stream
 */
struct Resolution {
    uint32_t noteId = 0;
    NoteKind kind = NoteKind::Tap;
    Grade grade = Grade::Miss;
    std::optional<double> deltaMs;   // Signed event - target; empty for sweep misses
    TimestampMs timestampMs = 0.0;   // Game time the resolution happened
    Point2D position;                // Note target
};

} // namespace core
