#include "core/SessionConfig.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <sstream>

namespace core {

namespace {

template<typename T>
void readValue(std::istringstream& iss, T& out, const std::string& key, int lineNo) {
    T value;
    if (!(iss >> value)) {
        throw SessionError(ErrorCode::InvalidConfig,
                           "line " + std::to_string(lineNo) + ": bad value for '" + key + "'");
    }
    out = value;
}

bool fail(std::string* reason, const char* message) {
    if (reason) *reason = message;
    return false;
}

} // namespace

bool SessionConfig::validate(std::string* reason) const {
    if (!(area.radius > 0.0f)) return fail(reason, "area_radius must be positive");
    if (!(calibration.maxResidual >= 0.0)) return fail(reason, "max_residual must be >= 0");
    if (calibration.minConfidence < 0.0f || calibration.minConfidence > 1.0f)
        return fail(reason, "min_confidence must be within [0, 1]");
    if (!(gesture.moveThreshold > 0.0f)) return fail(reason, "move_threshold must be positive");
    if (!(gesture.tapMaxDurationMs > 0.0)) return fail(reason, "tap_max_duration_ms must be positive");
    if (gesture.releaseFrames < 1) return fail(reason, "release_frames must be >= 1");
    if (gesture.lowConfidenceFrames < 0) return fail(reason, "low_confidence_frames must be >= 0");
    if (!(gesture.trackingLostTimeoutMs > 0.0)) return fail(reason, "tracking_lost_timeout_ms must be positive");
    if (!(resolver.hitRadius > 0.0f)) return fail(reason, "hit_radius must be positive");
    if (!(cameraWidth > 0.0f) || !(cameraHeight > 0.0f)) return fail(reason, "camera size must be positive");
    if (!(cameraFps > 0.0f)) return fail(reason, "camera_fps must be positive");
    if (!(resolver.sweepGraceMs >= tapConfirmDelayMs()))
        return fail(reason, "sweep_grace_ms must cover tap_max_duration_ms plus release_frames");
    if (oscHost.empty() || oscPort.empty()) return fail(reason, "osc_host / osc_port must not be empty");
    return true;
}

double SessionConfig::tapConfirmDelayMs() const {
    return gesture.tapMaxDurationMs + (gesture.releaseFrames * 1000.0) / cameraFps;
}

SessionConfig SessionConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SessionError(ErrorCode::InvalidConfig, "cannot open " + path);
    }

    SessionConfig cfg;
    std::string line;
    int lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        if (key == "area_center_x") readValue(iss, cfg.area.centerX, key, lineNo);
        else if (key == "area_center_y") readValue(iss, cfg.area.centerY, key, lineNo);
        else if (key == "area_radius") readValue(iss, cfg.area.radius, key, lineNo);
        else if (key == "max_residual") readValue(iss, cfg.calibration.maxResidual, key, lineNo);
        else if (key == "min_confidence") readValue(iss, cfg.calibration.minConfidence, key, lineNo);
        else if (key == "move_threshold") readValue(iss, cfg.gesture.moveThreshold, key, lineNo);
        else if (key == "tap_max_duration_ms") readValue(iss, cfg.gesture.tapMaxDurationMs, key, lineNo);
        else if (key == "release_frames") readValue(iss, cfg.gesture.releaseFrames, key, lineNo);
        else if (key == "low_confidence_frames") readValue(iss, cfg.gesture.lowConfidenceFrames, key, lineNo);
        else if (key == "tracking_lost_timeout_ms") readValue(iss, cfg.gesture.trackingLostTimeoutMs, key, lineNo);
        else if (key == "smoothing") readValue(iss, cfg.gesture.smoothing, key, lineNo);
        else if (key == "smoothing_min_cutoff") readValue(iss, cfg.gesture.smoothingMinCutoff, key, lineNo);
        else if (key == "smoothing_beta") readValue(iss, cfg.gesture.smoothingBeta, key, lineNo);
        else if (key == "hit_radius") readValue(iss, cfg.resolver.hitRadius, key, lineNo);
        else if (key == "sweep_grace_ms") readValue(iss, cfg.resolver.sweepGraceMs, key, lineNo);
        else if (key == "input_latency_ms") readValue(iss, cfg.inputLatencyMs, key, lineNo);
        else if (key == "allow_uncalibrated") readValue(iss, cfg.allowUncalibrated, key, lineNo);
        else if (key == "camera_width") readValue(iss, cfg.cameraWidth, key, lineNo);
        else if (key == "camera_height") readValue(iss, cfg.cameraHeight, key, lineNo);
        else if (key == "camera_fps") readValue(iss, cfg.cameraFps, key, lineNo);
        else if (key == "osc_host") readValue(iss, cfg.oscHost, key, lineNo);
        else if (key == "osc_port") readValue(iss, cfg.oscPort, key, lineNo);
        else if (key == "log_level") {
            std::string name;
            readValue(iss, name, key, lineNo);
            if (!Logger::parseLevel(name, cfg.logLevel)) {
                throw SessionError(ErrorCode::InvalidConfig,
                                   "line " + std::to_string(lineNo) + ": unknown log level '" + name + "'");
            }
        } else {
            Logger::warn("SessionConfig: ", path, ":", lineNo, " unknown key '", key, "' ignored");
        }
    }

    std::string reason;
    if (!cfg.validate(&reason)) {
        throw SessionError(ErrorCode::InvalidConfig, path + ": " + reason);
    }
    return cfg;
}

} // namespace core
