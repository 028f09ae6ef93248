#pragma once

#include <cmath>
#include "Types.hpp"

namespace core {

/**
 * PlayArea: the virtual circular screen notes travel across.
 *
 * Coordinates are play-area units (y grows downwards, like the camera).
 * The ring is split into 8 cabinet buttons, TOP first, clockwise.
 */
struct PlayArea {
    float centerX = PLAY_AREA_SIZE / 2.0f;
    float centerY = PLAY_AREA_SIZE / 2.0f;
    float radius = PLAY_AREA_RADIUS;

    enum class Section {
        Top = 0,
        TopRight = 1,
        Right = 2,
        BottomRight = 3,
        Bottom = 4,
        BottomLeft = 5,
        Left = 6,
        TopLeft = 7
    };

    /**
     * Check if a point is inside the circle (boundary included)
     */
    bool contains(const Point2D& p) const {
        return distanceFromCenter(p) <= radius;
    }

    float distanceFromCenter(const Point2D& p) const {
        float dx = p.x - centerX;
        float dy = p.y - centerY;
        return std::sqrt(dx * dx + dy * dy);
    }

    /**
     * Angle in degrees, clockwise from TOP, in [0, 360)
     */
    float angleOf(const Point2D& p) const {
        float deg = std::atan2(p.x - centerX, centerY - p.y) * 180.0f / static_cast<float>(M_PI);
        if (deg < 0.0f) deg += 360.0f;
        return deg;
    }

    /**
     * Button section a point belongs to. Each section spans 45 degrees
     * centred on its button (TOP covers 337.5 .. 22.5).
     */
    Section sectionOf(const Point2D& p) const {
        int index = static_cast<int>(std::floor((angleOf(p) + 22.5f) / 45.0f)) % PLAY_AREA_SECTIONS;
        return static_cast<Section>(index);
    }

    /**
     * Position of a button on the ring, at the given fraction of the radius
     */
    Point2D buttonPosition(Section section, float radiusFraction = 1.0f) const {
        float rad = static_cast<float>(static_cast<int>(section)) * 45.0f * static_cast<float>(M_PI) / 180.0f;
        float r = radius * radiusFraction;
        return {centerX + std::sin(rad) * r, centerY - std::cos(rad) * r};
    }

    static const char* sectionName(Section section) {
        switch (section) {
            case Section::Top:         return "TOP";
            case Section::TopRight:    return "TOP_RIGHT";
            case Section::Right:       return "RIGHT";
            case Section::BottomRight: return "BOTTOM_RIGHT";
            case Section::Bottom:      return "BOTTOM";
            case Section::BottomLeft:  return "BOTTOM_LEFT";
            case Section::Left:        return "LEFT";
            case Section::TopLeft:     return "TOP_LEFT";
        }
        return "TOP";
    }
};

/**
 * Default play area: 600x600 square, circle of radius 300 in the middle
 */
inline PlayArea getDefaultPlayArea() {
    return PlayArea{};
}

} // namespace core
