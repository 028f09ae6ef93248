#pragma once

#include <string>
#include "Types.hpp"
#include "Logger.hpp"
#include "PlayArea.hpp"
#include "CalibrationMapper.hpp"
#include "GestureClassifier.hpp"
#include "HitResolver.hpp"

namespace core {

/**
 * Everything a Session needs, with working defaults.
 *
 * File format: one "key value" per line, '#' starts a comment line.
 *   move_threshold 30
 *   input_latency_ms 45
 */
struct SessionConfig {
    PlayArea area = getDefaultPlayArea();
    CalibrationMapper::Config calibration;
    GestureClassifier::Config gesture;
    HitResolver::Config resolver;

    double inputLatencyMs = 0.0;       // Tracker detection delay, subtracted from camera time
    bool allowUncalibrated = false;    // Fall back to plain camera -> area scaling
    float cameraWidth = CAMERA_WIDTH;
    float cameraHeight = CAMERA_HEIGHT;
    float cameraFps = CAMERA_FPS;

    // OSC output (scoring / rendering collaborators)
    std::string oscHost = "127.0.0.1";
    std::string oscPort = "9000";

    LogLevel logLevel = LogLevel::INFO;

    /**
     * Load from file on top of the defaults.
     * Throws SessionError(InvalidConfig) on unreadable file, bad value or failed validation.
     */
    static SessionConfig loadFromFile(const std::string& path);

    /**
     * @param reason receives the first violation, if any
     */
    [[nodiscard]] bool validate(std::string* reason = nullptr) const;

    /**
     * Latest a tap can be confirmed after its contact: the longest tap plus
     * the release frames. The miss sweep grace must cover it.
     */
    [[nodiscard]] double tapConfirmDelayMs() const;
};

} // namespace core
