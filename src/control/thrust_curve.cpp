#include "control/thrust_curve.hpp"
#include <algorithm>

namespace pursuit::control {

ThrustCurve::ThrustCurve(std::vector<Key> keys) : keys_(std::move(keys)) {
    std::stable_sort(keys_.begin(), keys_.end(),
                     [](const Key& a, const Key& b) { return a.time_s < b.time_s; });
}

ThrustCurve ThrustCurve::linear(double t0, double n0, double t1, double n1) {
    return ThrustCurve({Key{t0, n0}, Key{t1, n1}});
}

ThrustCurve ThrustCurve::default_motor() {
    return linear(0.0, 600.0, 2.0, 0.0);
}

double ThrustCurve::evaluate(double t) const {
    if (keys_.empty()) return 0.0;
    if (t <= keys_.front().time_s) return keys_.front().newtons;
    if (t >= keys_.back().time_s) return keys_.back().newtons;

    auto hi = std::upper_bound(keys_.begin(), keys_.end(), t,
                               [](double v, const Key& k) { return v < k.time_s; });
    auto lo = hi - 1;
    double span = hi->time_s - lo->time_s;
    if (span <= 0.0) return hi->newtons;
    double a = (t - lo->time_s) / span;
    return lo->newtons + (hi->newtons - lo->newtons) * a;
}

} // namespace pursuit::control
