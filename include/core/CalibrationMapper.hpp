#pragma once

#include <memory>
#include <mutex>
#include <vector>
#include <opencv2/core.hpp>

#include "Types.hpp"
#include "Errors.hpp"

namespace core {

/**
 * One calibration correspondence collected while the player touches
 * a known target on the play area.
 */
struct CalibrationPair {
    Point2D camera;    // Camera pixels
    Point2D playArea;  // Play-area units
};

/**
 * Camera -> play-area transform. Immutable once built, shared by pointer.
 */
class CalibrationProfile {
public:
    CalibrationProfile(const cv::Matx33d& homography, double maxResidual, size_t pairCount)
        : homography_(homography), maxResidual_(maxResidual), pairCount_(pairCount) {}

    /**
     * Plain axis scaling, used when the session runs uncalibrated.
     */
    static CalibrationProfile scaling(float cameraWidth, float cameraHeight,
                                      float areaWidth, float areaHeight,
                                      float offsetX = 0.0f, float offsetY = 0.0f);

    /**
     * Apply the transform. Returns false when the projective divisor vanishes.
     */
    [[nodiscard]] bool apply(const Point2D& camera, Point2D& out) const;

    [[nodiscard]] const cv::Matx33d& homography() const { return homography_; }
    [[nodiscard]] double maxResidual() const { return maxResidual_; }
    [[nodiscard]] size_t pairCount() const { return pairCount_; }

private:
    cv::Matx33d homography_;
    double maxResidual_ = 0.0;
    size_t pairCount_ = 0;
};

struct MapResult {
    ErrorCode status = ErrorCode::None;
    Point2D point;

    [[nodiscard]] bool ok() const { return status == ErrorCode::None; }
};

/**
 * CalibrationMapper: fits and applies the camera -> play-area transform.
 *
 * Fit:
 * - 3 pairs  -> affine (exact)
 * - 4 pairs  -> perspective (exact)
 * - 5+ pairs -> least-squares homography
 * The max re-projection residual must stay under Config::maxResidual.
 *
 * Swap:
 * - stage() may be called from any thread
 * - commitPending() / map() belong to the frame loop thread
 */
class CalibrationMapper {
public:
    struct Config {
        double maxResidual = 5.0;                    // Play-area units
        float minConfidence = MIN_TRACK_CONFIDENCE;
    };

    CalibrationMapper() = default;
    explicit CalibrationMapper(const Config& config) : config_(config) {}

    /**
     * Fit a profile from correspondence pairs.
     * Throws SessionError(CalibrationFailed) on degenerate input or residual overflow.
     */
    [[nodiscard]] std::shared_ptr<const CalibrationProfile> fit(const std::vector<CalibrationPair>& pairs) const;

    /**
     * Map a tracked point. Fails with LowConfidence, NotCalibrated or DegenerateProjection.
     */
    [[nodiscard]] MapResult map(const TrackedPoint& point) const;

    /**
     * Replace the active profile immediately (frame loop thread / not running)
     */
    void commit(std::shared_ptr<const CalibrationProfile> profile);

    /**
     * Queue a profile for the next commitPending() call
     */
    void stage(std::shared_ptr<const CalibrationProfile> profile);

    /**
     * Swap in the staged profile, if any. Returns true when a swap happened.
     */
    bool commitPending();

    [[nodiscard]] bool hasPending() const;
    [[nodiscard]] bool isCalibrated() const { return active_ != nullptr; }
    [[nodiscard]] std::shared_ptr<const CalibrationProfile> activeProfile() const { return active_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    std::shared_ptr<const CalibrationProfile> active_;

    mutable std::mutex pendingMutex_;
    std::shared_ptr<const CalibrationProfile> pending_;
};

} // namespace core
