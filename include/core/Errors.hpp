#pragma once

#include <stdexcept>
#include <string>

namespace core {

enum class ErrorCode {
    None = 0,
    LowConfidence,         // Tracking point below usability threshold (dropped)
    NotCalibrated,         // No profile committed yet
    DegenerateProjection,  // Point maps to infinity under the profile
    CalibrationFailed,     // Residual too high / degenerate pairs
    InvalidPattern,        // Pattern failed validation at load time
    TrackingLost,          // Track timed out, gesture reset
    NotReady,              // Session started without profile or pattern
    InvalidConfig          // Config file unreadable or out of range
};

const char* errorCodeName(ErrorCode code);

/**
 * Load-time failure. Per-frame failures are never thrown.
 */
class SessionError : public std::runtime_error {
public:
    SessionError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(errorCodeName(code)) + ": " + message), code_(code) {}

    [[nodiscard]] ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace core
