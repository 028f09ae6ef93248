#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "SpscQueue.hpp"

namespace core {

// ============================================================
// Constants - Trainer Configuration
// ============================================================

// Camera Configuration (uncalibrated fallback scaling)
constexpr float CAMERA_WIDTH = 640.0f;
constexpr float CAMERA_HEIGHT = 480.0f;
constexpr float CAMERA_FPS = 30.0f;

// Play Area: 600x600 virtual square holding the circular screen
constexpr float PLAY_AREA_SIZE = 600.0f;
constexpr float PLAY_AREA_RADIUS = 300.0f;
constexpr int PLAY_AREA_SECTIONS = 8;          // Cabinet buttons around the ring

// Timing windows (ms, closed intervals)
constexpr double PERFECT_WINDOW_MS = 50.0;
constexpr double GREAT_WINDOW_MS = 150.0;
constexpr double GOOD_WINDOW_MS = 200.0;
constexpr double DEFAULT_HIT_WINDOW_MS = 200.0;
constexpr float HIT_RADIUS = 50.0f;            // Play-area units

// Scoring (points per grade)
constexpr int PERFECT_POINTS = 100;
constexpr int GREAT_POINTS = 80;
constexpr int GOOD_POINTS = 50;

// Gesture Configuration
constexpr size_t GESTURE_HISTORY_FRAMES = 8;   // Bounded per-track window
constexpr float MIN_TRACK_CONFIDENCE = 0.5f;

// Queue sizing
constexpr size_t QUEUE_SIZE = 16;
constexpr size_t OSC_QUEUE_SIZE = 64;
constexpr size_t RECENT_RESOLUTIONS = 16;

// ============================================================
// Data Structures
// ============================================================

using TimestampMs = double;

struct Point2D {
    float x = 0.0f;
    float y = 0.0f;
};

/**
 * One fingertip observation from the external hand tracker.
 * Camera pixel space, camera clock.
 */
struct TrackedPoint {
    int trackId = 0;          // hand/finger id assigned by the tracker
    float x = 0.0f;
    float y = 0.0f;
    TimestampMs timestampMs = 0.0;
    float confidence = 0.0f;
};

struct TrackedFrame {
    TimestampMs timestampMs = 0.0;
    std::vector<TrackedPoint> points;
};

enum class InteractionKind {
    Tap = 0,
    SlideStart = 1,
    SlideMove = 2,
    SlideEnd = 3
};

struct InteractionEvent {
    InteractionKind kind = InteractionKind::Tap;
    int trackId = 0;
    Point2D position;          // Play-area space
    TimestampMs timestampMs = 0.0; // Game clock
};

const char* interactionKindName(InteractionKind kind);

float distance(const Point2D& a, const Point2D& b);

// Queue aliases
using FrameQueue = SpscQueue<TrackedFrame, QUEUE_SIZE>;

} // namespace core
