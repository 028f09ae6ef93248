#pragma once

#include <array>
#include <deque>
#include <string>
#include "Note.hpp"
#include "PlayArea.hpp"

namespace core {

struct ScoreSummary {
    int score = 0;
    int combo = 0;
    int maxCombo = 0;
    std::array<int, 4> gradeCounts{};                      // Indexed by Grade
    std::array<int, PLAY_AREA_SECTIONS> sectionHits{};      // Non-miss hits per button
    double accuracy = 0.0;                                 // Percent, 0 when empty

    [[nodiscard]] int count(Grade grade) const { return gradeCounts[static_cast<size_t>(grade)]; }
    [[nodiscard]] int total() const;
    [[nodiscard]] std::string toString() const;
};

/**
 * ScoreAggregator: consumes the (note id, Grade) stream
 *
 * Perfect 100 / Great 80 / Good 50 / Miss 0 points.
 * Any hit extends the combo, a miss resets it.
 */
class ScoreAggregator {
public:
    explicit ScoreAggregator(const PlayArea& area = getDefaultPlayArea());

    void add(const Resolution& resolution);
    void reset();

    [[nodiscard]] int score() const { return summary_.score; }
    [[nodiscard]] int combo() const { return summary_.combo; }
    [[nodiscard]] int maxCombo() const { return summary_.maxCombo; }

    /**
     * Snapshot including accuracy
     */
    [[nodiscard]] ScoreSummary summary() const;

    /**
     * Last RECENT_RESOLUTIONS resolutions, oldest first
     */
    [[nodiscard]] const std::deque<Resolution>& recent() const { return recent_; }

    static int pointsFor(Grade grade);

private:
    PlayArea area_;
    ScoreSummary summary_;
    std::deque<Resolution> recent_;
};

} // namespace core
