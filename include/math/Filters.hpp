#pragma once

#include <cmath>

namespace math {

/**
 * One Euro filter (Casiez et al.): adaptive low-pass that smooths jitter
 * at low speed and follows quickly at high speed.
 * Timestamps are in seconds.
 */
class OneEuroFilter {
public:
    OneEuroFilter(double minCutoff = 1.0, double beta = 0.007, double dCutoff = 1.0);
    double filter(double value, double timestamp);
    void reset();

private:
    struct LowPassFilter {
        double y = 0.0;
        double s = 0.0;
        bool initialized = false;

        double filter(double value, double alpha) {
            if (!initialized) {
                y = value;
                s = value;
                initialized = true;
                return value;
            }
            y = value;
            double result = alpha * value + (1.0 - alpha) * s;
            s = result;
            return result;
        }

        void reset() { initialized = false; }
    };

    double _minCutoff;
    double _beta;
    double _dCutoff;
    LowPassFilter _xFilter;
    LowPassFilter _dxFilter;
    double _lastTimestamp = -1.0;

    double alpha(double cutoff, double dt) {
        double tau = 1.0 / (2 * M_PI * cutoff);
        return 1.0 / (1.0 + tau / dt);
    }
};

/**
 * Two independent One Euro filters for a 2D fingertip position
 */
class PointFilter {
public:
    PointFilter(double minCutoff = 1.0, double beta = 0.007)
        : _fx(minCutoff, beta), _fy(minCutoff, beta) {}

    void filter(float& x, float& y, double timestamp) {
        x = static_cast<float>(_fx.filter(x, timestamp));
        y = static_cast<float>(_fy.filter(y, timestamp));
    }

    void reset() {
        _fx.reset();
        _fy.reset();
    }

private:
    OneEuroFilter _fx;
    OneEuroFilter _fy;
};

} // namespace math
