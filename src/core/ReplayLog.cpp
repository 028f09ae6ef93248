#include "core/ReplayLog.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace core {

namespace {

[[noreturn]] void malformed(ErrorCode code, const std::string& name, int lineNo, const std::string& what) {
    throw SessionError(code, name + ":" + std::to_string(lineNo) + ": " + what);
}

// Read every remaining number on the line; fails on trailing garbage
bool readNumbers(std::istringstream& iss, std::vector<double>& out) {
    double value;
    while (iss >> value) {
        out.push_back(value);
    }
    return iss.eof();
}

// Whole number within [lo, hi]; rejects NaN, infinities and fractions
bool isIntegral(double value, double lo, double hi) {
    return std::isfinite(value) && value == std::floor(value) && value >= lo && value <= hi;
}

bool isNoteId(double value) {
    return isIntegral(value, 0.0, static_cast<double>(std::numeric_limits<uint32_t>::max()));
}

bool isTrackId(double value) {
    return isIntegral(value, static_cast<double>(std::numeric_limits<int>::min()),
                      static_cast<double>(std::numeric_limits<int>::max()));
}

} // namespace

ReplayLog ReplayLog::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SessionError(ErrorCode::InvalidConfig, "cannot open replay " + path);
    }
    return parse(file, path);
}

ReplayLog ReplayLog::parse(std::istream& in, const std::string& name) {
    ReplayLog log;
    std::string line;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string tag;
        if (!(iss >> tag)) continue;

        std::vector<double> v;
        if (!readNumbers(iss, v)) {
            malformed(tag == "tap" || tag == "slide" ? ErrorCode::InvalidPattern : ErrorCode::InvalidConfig,
                      name, lineNo, "non-numeric field in '" + tag + "' line");
        }

        if (tag == "calib") {
            if (v.size() != 4) {
                malformed(ErrorCode::InvalidConfig, name, lineNo, "calib needs cx cy ax ay");
            }
            CalibrationPair pair;
            pair.camera = {static_cast<float>(v[0]), static_cast<float>(v[1])};
            pair.playArea = {static_cast<float>(v[2]), static_cast<float>(v[3])};
            log.calibration.push_back(pair);
        } else if (tag == "tap") {
            if (v.size() != 4 && v.size() != 5) {
                malformed(ErrorCode::InvalidPattern, name, lineNo, "tap needs id t x y [w]");
            }
            if (!isNoteId(v[0])) {
                malformed(ErrorCode::InvalidPattern, name, lineNo, "note id must be a whole number in uint32 range");
            }
            double window = v.size() == 5 ? v[4] : DEFAULT_HIT_WINDOW_MS;
            log.notes.push_back(Note::tap(static_cast<uint32_t>(v[0]), v[1],
                                          {static_cast<float>(v[2]), static_cast<float>(v[3])}, window));
        } else if (tag == "slide") {
            if (v.size() < 5 || (v.size() - 2) % 3 != 0) {
                malformed(ErrorCode::InvalidPattern, name, lineNo, "slide needs id w followed by t x y triples");
            }
            if (!isNoteId(v[0])) {
                malformed(ErrorCode::InvalidPattern, name, lineNo, "note id must be a whole number in uint32 range");
            }
            std::vector<Checkpoint> path;
            for (size_t i = 2; i + 2 < v.size(); i += 3) {
                Checkpoint cp;
                cp.timeMs = v[i];
                cp.position = {static_cast<float>(v[i + 1]), static_cast<float>(v[i + 2])};
                path.push_back(cp);
            }
            log.notes.push_back(Note::slide(static_cast<uint32_t>(v[0]), std::move(path), v[1]));
        } else if (tag == "frame") {
            if (v.empty() || (v.size() - 1) % 4 != 0) {
                malformed(ErrorCode::InvalidConfig, name, lineNo, "frame needs t followed by track x y conf groups");
            }
            TrackedFrame frame;
            frame.timestampMs = v[0];
            for (size_t i = 1; i + 3 < v.size(); i += 4) {
                if (!isTrackId(v[i])) {
                    malformed(ErrorCode::InvalidConfig, name, lineNo, "track id must be a whole number in int range");
                }
                TrackedPoint point;
                point.trackId = static_cast<int>(v[i]);
                point.x = static_cast<float>(v[i + 1]);
                point.y = static_cast<float>(v[i + 2]);
                point.confidence = static_cast<float>(v[i + 3]);
                point.timestampMs = frame.timestampMs;
                frame.points.push_back(point);
            }
            log.frames.push_back(std::move(frame));
        } else {
            malformed(ErrorCode::InvalidConfig, name, lineNo, "unknown record '" + tag + "'");
        }
    }

    Logger::info("ReplayLog: ", name, ": ", log.calibration.size(), " calibration pairs, ",
                 log.notes.size(), " notes, ", log.frames.size(), " frames");
    return log;
}

} // namespace core
