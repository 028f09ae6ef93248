#include "core/ScoreAggregator.hpp"
#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace core {

int ScoreSummary::total() const {
    return std::accumulate(gradeCounts.begin(), gradeCounts.end(), 0);
}

std::string ScoreSummary::toString() const {
    std::ostringstream ss;
    ss << "Score: " << score
       << " MaxCombo: " << maxCombo
       << " Perfect: " << count(Grade::Perfect)
       << " Great: " << count(Grade::Great)
       << " Good: " << count(Grade::Good)
       << " Miss: " << count(Grade::Miss)
       << " Accuracy: " << std::fixed << std::setprecision(1) << accuracy << "%";
    return ss.str();
}

ScoreAggregator::ScoreAggregator(const PlayArea& area)
    : area_(area) {
}

int ScoreAggregator::pointsFor(Grade grade) {
    switch (grade) {
        case Grade::Perfect: return PERFECT_POINTS;
        case Grade::Great:   return GREAT_POINTS;
        case Grade::Good:    return GOOD_POINTS;
        case Grade::Miss:    return 0;
    }
    return 0;
}

void ScoreAggregator::add(const Resolution& resolution) {
    summary_.gradeCounts[static_cast<size_t>(resolution.grade)]++;
    summary_.score += pointsFor(resolution.grade);

    if (resolution.grade == Grade::Miss) {
        summary_.combo = 0;
    } else {
        summary_.combo++;
        summary_.sectionHits[static_cast<size_t>(area_.sectionOf(resolution.position))]++;
    }
    summary_.maxCombo = std::max(summary_.maxCombo, summary_.combo);

    recent_.push_back(resolution);
    while (recent_.size() > RECENT_RESOLUTIONS) {
        recent_.pop_front();
    }
}

void ScoreAggregator::reset() {
    summary_ = ScoreSummary{};
    recent_.clear();
}

ScoreSummary ScoreAggregator::summary() const {
    ScoreSummary out = summary_;
    int total = out.total();
    if (total > 0) {
        int hits = total - out.count(Grade::Miss);
        out.accuracy = static_cast<double>(hits) / static_cast<double>(total) * 100.0;
    }
    return out;
}

} // namespace core
