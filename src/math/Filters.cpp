#include "math/Filters.hpp"
#include <cmath>

namespace math {

OneEuroFilter::OneEuroFilter(double minCutoff, double beta, double dCutoff)
    : _minCutoff(minCutoff), _beta(beta), _dCutoff(dCutoff) {
    reset();
}

double OneEuroFilter::filter(double value, double timestamp) {
    if (_lastTimestamp != -1.0 && timestamp != -1.0 && _xFilter.initialized) {
        double dt = timestamp - _lastTimestamp;
        if (dt > 0) {
            // Filtered derivative of the signal
            double dx = (value - _xFilter.y) / dt;
            double edx = _dxFilter.filter(dx, alpha(_dCutoff, dt));

            // Speed raises the cutoff: less lag while moving
            double cutoff = _minCutoff + _beta * std::abs(edx);

            double result = _xFilter.filter(value, alpha(cutoff, dt));

            _lastTimestamp = timestamp;
            return result;
        }
    }

    _lastTimestamp = timestamp;
    // First sample or non-increasing timestamp: pass through
    return _xFilter.filter(value, 1.0);
}

void OneEuroFilter::reset() {
    _xFilter.reset();
    _dxFilter.reset();
    _lastTimestamp = -1.0;
}

} // namespace math
