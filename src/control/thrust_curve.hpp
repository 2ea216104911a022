#ifndef PURSUIT_THRUST_CURVE_HPP
#define PURSUIT_THRUST_CURVE_HPP

#include <vector>

namespace pursuit::control {

/**
 * @brief Piecewise-linear thrust profile over burn time
 *
 * Keys are sorted by time on construction. Evaluation clamps to the first
 * and last key outside the covered range.
 */
class ThrustCurve {
public:
    struct Key {
        double time_s;
        double newtons;
    };

    ThrustCurve() = default;
    explicit ThrustCurve(std::vector<Key> keys);

    static ThrustCurve linear(double t0, double n0, double t1, double n1);

    /// 600 N falling linearly to 0 N over 2 s
    static ThrustCurve default_motor();

    double evaluate(double t) const;

    bool empty() const { return keys_.empty(); }
    const std::vector<Key>& keys() const { return keys_; }

private:
    std::vector<Key> keys_;
};

} // namespace pursuit::control

#endif // PURSUIT_THRUST_CURVE_HPP
