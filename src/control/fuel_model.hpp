#ifndef PURSUIT_FUEL_MODEL_HPP
#define PURSUIT_FUEL_MODEL_HPP

namespace pursuit::control {

struct FuelParams {
    double fuel_kg = 25.0;          // initial load
    double mass_flow_kg_s = 0.5;    // burn rate at any throttle
};

/**
 * @brief Consumable propellant mass
 *
 * Remaining mass never increases while burning and floors at zero.
 */
class FuelModel {
public:
    explicit FuelModel(const FuelParams& params = FuelParams{});

    /// Burn for dt seconds; returns the mass consumed [kg]
    double consume(double dt);

    bool is_empty() const { return remaining_kg_ <= 0.0; }
    double remaining_kg() const { return remaining_kg_; }
    double initial_kg() const { return params_.fuel_kg; }

    /// remaining / initial, in [0, 1]
    double fraction() const;

    void reset();

private:
    FuelParams params_;
    double remaining_kg_;
};

} // namespace pursuit::control

#endif // PURSUIT_FUEL_MODEL_HPP
