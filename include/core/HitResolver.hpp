#pragma once

#include <optional>
#include <vector>
#include "Types.hpp"
#include "Timeline.hpp"

namespace core {

/**
 * HitResolver: matches interaction events against live notes and grades them.
 *
 * Matching:
 * - Tap events -> tap notes, SlideStart/SlideMove -> next slide checkpoint
 * - Candidate must be live at the event time, within hitRadius of the event,
 *   and |event - target| <= 200ms
 * - Tie-break: smallest |delta|, then lowest note id
 *
 * Slides resolve checkpoint by checkpoint; the final grade is the worst
 * checkpoint grade.
 */
class HitResolver {
public:
    struct Config {
        float hitRadius = HIT_RADIUS;
        // Extra time before the sweep declares a miss, so a tap confirmed
        // late by the classifier can still land inside its window
        double sweepGraceMs = 350.0;
    };

    explicit HitResolver(Timeline& timeline);
    HitResolver(Timeline& timeline, const Config& config);

    /**
     * Resolve one event. Returns the resolution when a note is finished by it
     * (a tap hit, or the last checkpoint of a slide).
     */
    std::optional<Resolution> resolve(const InteractionEvent& event);

    /**
     * Mark every pending note (or slide checkpoint) whose window plus grace
     * has elapsed before now as missed. Returns finished notes.
     */
    std::vector<Resolution> sweep(TimestampMs now);

    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * Slide checkpoints consumed so far (hits and misses)
     */
    [[nodiscard]] size_t checkpointsConsumed() const { return checkpointsConsumed_; }

private:
    Timeline& timeline_;
    Config config_;
    size_t checkpointsConsumed_ = 0;

    Note* findCandidate(const InteractionEvent& event, NoteKind kind, double& delta);
    Resolution finishSlide(Note& note, TimestampMs now);
};

} // namespace core
