#pragma once

#include <istream>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Note.hpp"
#include "CalibrationMapper.hpp"

namespace core {

/**
 * A recorded session: calibration touches, the pattern and the raw
 * tracker frames. Line-oriented text, '#' starts a comment line:
 *
 *   calib cx cy ax ay                  camera point -> play-area point
 *   tap id t x y [w]                   tap note
 *   slide id w t x y t x y ...         slide note, first checkpoint = target
 *   frame t [track x y conf]...        one camera frame
 *
 * Times are milliseconds: notes in game time, frames in camera time.
 */
struct ReplayLog {
    std::vector<CalibrationPair> calibration;
    std::vector<Note> notes;
    std::vector<TrackedFrame> frames;

    /**
     * Throws SessionError(InvalidConfig) on unreadable files or malformed
     * calib / frame lines, SessionError(InvalidPattern) on malformed notes
     */
    static ReplayLog loadFromFile(const std::string& path);
    static ReplayLog parse(std::istream& in, const std::string& name = "<stream>");
};

} // namespace core
