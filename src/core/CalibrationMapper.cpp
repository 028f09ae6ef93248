#include "core/CalibrationMapper.hpp"
#include "core/Logger.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <cmath>

namespace core {

namespace {

constexpr double DIVISOR_EPSILON = 1e-9;
constexpr double DETERMINANT_EPSILON = 1e-9;

cv::Matx33d toMatx33(const cv::Mat& m) {
    cv::Matx33d out = cv::Matx33d::eye();
    for (int r = 0; r < m.rows && r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            out(r, c) = m.at<double>(r, c);
        }
    }
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// CalibrationProfile
// ═══════════════════════════════════════════════════════════════════════════

CalibrationProfile CalibrationProfile::scaling(float cameraWidth, float cameraHeight,
                                               float areaWidth, float areaHeight,
                                               float offsetX, float offsetY) {
    cv::Matx33d h = cv::Matx33d::eye();
    h(0, 0) = static_cast<double>(areaWidth) / cameraWidth;
    h(1, 1) = static_cast<double>(areaHeight) / cameraHeight;
    h(0, 2) = offsetX;
    h(1, 2) = offsetY;
    return CalibrationProfile(h, 0.0, 0);
}

bool CalibrationProfile::apply(const Point2D& camera, Point2D& out) const {
    const auto& h = homography_;
    double x = camera.x;
    double y = camera.y;

    double w = h(2, 0) * x + h(2, 1) * y + h(2, 2);
    if (std::abs(w) < DIVISOR_EPSILON) {
        return false;
    }

    out.x = static_cast<float>((h(0, 0) * x + h(0, 1) * y + h(0, 2)) / w);
    out.y = static_cast<float>((h(1, 0) * x + h(1, 1) * y + h(1, 2)) / w);
    return std::isfinite(out.x) && std::isfinite(out.y);
}

// ═══════════════════════════════════════════════════════════════════════════
// CalibrationMapper
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<const CalibrationProfile> CalibrationMapper::fit(const std::vector<CalibrationPair>& pairs) const {
    if (pairs.size() < 3) {
        throw SessionError(ErrorCode::CalibrationFailed,
                           "need at least 3 calibration pairs, got " + std::to_string(pairs.size()));
    }

    std::vector<cv::Point2f> src;
    std::vector<cv::Point2f> dst;
    src.reserve(pairs.size());
    dst.reserve(pairs.size());
    for (const auto& pair : pairs) {
        src.emplace_back(pair.camera.x, pair.camera.y);
        dst.emplace_back(pair.playArea.x, pair.playArea.y);
    }

    cv::Mat fitted;
    try {
        if (pairs.size() == 3) {
            fitted = cv::getAffineTransform(src.data(), dst.data());
        } else if (pairs.size() == 4) {
            fitted = cv::getPerspectiveTransform(src, dst);
        } else {
            fitted = cv::findHomography(src, dst, 0);
        }
    } catch (const cv::Exception& e) {
        throw SessionError(ErrorCode::CalibrationFailed, std::string("transform fit failed: ") + e.what());
    }

    if (fitted.empty()) {
        throw SessionError(ErrorCode::CalibrationFailed, "transform fit returned no solution");
    }

    fitted.convertTo(fitted, CV_64F);
    cv::Matx33d homography = toMatx33(fitted);

    double det = cv::determinant(homography);
    if (!std::isfinite(det) || std::abs(det) < DETERMINANT_EPSILON) {
        throw SessionError(ErrorCode::CalibrationFailed, "degenerate calibration (singular transform)");
    }

    // Re-projection residual over every pair
    std::vector<cv::Point2f> projected;
    cv::perspectiveTransform(src, projected, cv::Mat(homography));

    double maxResidual = 0.0;
    for (size_t i = 0; i < projected.size(); ++i) {
        double residual = cv::norm(projected[i] - dst[i]);
        if (!std::isfinite(residual)) {
            throw SessionError(ErrorCode::CalibrationFailed, "calibration pair projects to infinity");
        }
        maxResidual = std::max(maxResidual, residual);
    }

    if (maxResidual > config_.maxResidual) {
        throw SessionError(ErrorCode::CalibrationFailed,
                           "max residual " + std::to_string(maxResidual) +
                           " exceeds threshold " + std::to_string(config_.maxResidual));
    }

    Logger::info("CalibrationMapper: fitted ", pairs.size(), " pairs, max residual ", maxResidual);
    return std::make_shared<const CalibrationProfile>(homography, maxResidual, pairs.size());
}

MapResult CalibrationMapper::map(const TrackedPoint& point) const {
    MapResult result;

    if (!(point.confidence >= config_.minConfidence)) {
        result.status = ErrorCode::LowConfidence;
        return result;
    }

    if (!active_) {
        result.status = ErrorCode::NotCalibrated;
        return result;
    }

    if (!active_->apply({point.x, point.y}, result.point)) {
        result.status = ErrorCode::DegenerateProjection;
    }
    return result;
}

void CalibrationMapper::commit(std::shared_ptr<const CalibrationProfile> profile) {
    active_ = std::move(profile);
    std::lock_guard<std::mutex> lock(pendingMutex_);
    pending_.reset();
}

void CalibrationMapper::stage(std::shared_ptr<const CalibrationProfile> profile) {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    pending_ = std::move(profile);
}

bool CalibrationMapper::commitPending() {
    std::shared_ptr<const CalibrationProfile> next;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        next = std::move(pending_);
        pending_.reset();
    }
    if (!next) return false;

    active_ = std::move(next);
    Logger::info("CalibrationMapper: new profile committed (", active_->pairCount(), " pairs)");
    return true;
}

bool CalibrationMapper::hasPending() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_ != nullptr;
}

} // namespace core
