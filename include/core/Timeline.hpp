#pragma once

#include <vector>
#include "Note.hpp"
#include "Errors.hpp"

namespace core {

class HitResolver;

/**
 * Timeline: the loaded pattern plus the scheduler play-head.
 *
 * Invariants after load():
 * - notes sorted by targetTimeMs (non-decreasing), ids unique
 * - the play-head never rewinds; advance() to an older time is a no-op
 * - notes before cursor() are resolved (archived)
 */
class Timeline {
public:
    Timeline() = default;

    /**
     * Validate and take ownership of a pattern. Runtime state of every note is reset.
     * Throws SessionError(InvalidPattern); the previous pattern is kept on failure.
     */
    void load(std::vector<Note> notes);

    /**
     * Throws SessionError(InvalidPattern) describing the first violation
     */
    static void validate(const std::vector<Note>& notes);

    /**
     * Move the play-head forward and archive resolved notes at the front.
     * Returns false (and changes nothing) if now is older than the play-head.
     */
    bool advance(TimestampMs now);

    /**
     * Pending notes whose current target time lies within
     * [at - hitWindowMs, at + hitWindowMs], in timeline order
     */
    [[nodiscard]] std::vector<const Note*> liveNotes(TimestampMs at) const;

    [[nodiscard]] const std::vector<Note>& notes() const { return notes_; }
    [[nodiscard]] const Note* find(uint32_t id) const;
    [[nodiscard]] TimestampMs now() const { return now_; }
    [[nodiscard]] bool started() const { return started_; }
    [[nodiscard]] size_t cursor() const { return cursor_; }
    [[nodiscard]] size_t pendingCount() const;
    [[nodiscard]] bool finished() const { return pendingCount() == 0; }
    [[nodiscard]] bool empty() const { return notes_.empty(); }

    /**
     * Widest hit window in the pattern
     */
    [[nodiscard]] double maxHitWindowMs() const { return maxWindow_; }

private:
    // Note status is written by the resolver only
    friend class HitResolver;

    std::vector<Note> notes_;
    size_t cursor_ = 0;
    TimestampMs now_ = 0.0;
    bool started_ = false;
    double maxWindow_ = 0.0;
};

} // namespace core
