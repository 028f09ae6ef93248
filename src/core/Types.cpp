#include "core/Types.hpp"
#include "core/Errors.hpp"
#include <cmath>

namespace core {

const char* interactionKindName(InteractionKind kind) {
    switch (kind) {
        case InteractionKind::Tap:        return "TAP";
        case InteractionKind::SlideStart: return "SLIDE_START";
        case InteractionKind::SlideMove:  return "SLIDE_MOVE";
        case InteractionKind::SlideEnd:   return "SLIDE_END";
    }
    return "TAP";
}

float distance(const Point2D& a, const Point2D& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "None";
        case ErrorCode::LowConfidence:        return "LowConfidence";
        case ErrorCode::NotCalibrated:        return "NotCalibrated";
        case ErrorCode::DegenerateProjection: return "DegenerateProjection";
        case ErrorCode::CalibrationFailed:    return "CalibrationFailed";
        case ErrorCode::InvalidPattern:       return "InvalidPattern";
        case ErrorCode::TrackingLost:         return "TrackingLost";
        case ErrorCode::NotReady:             return "NotReady";
        case ErrorCode::InvalidConfig:        return "InvalidConfig";
    }
    return "Unknown";
}

} // namespace core
