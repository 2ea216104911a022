#include "control/fuel_model.hpp"
#include <algorithm>
#include <cmath>

namespace pursuit::control {

// Residue below this is treated as an empty tank
static constexpr double EMPTY_EPS_KG = 1e-9;

FuelModel::FuelModel(const FuelParams& params)
    : params_(params),
      remaining_kg_(std::max(0.0, params.fuel_kg)) {}

double FuelModel::consume(double dt) {
    if (!(dt > 0.0) || !std::isfinite(dt) || is_empty()) return 0.0;

    double used = std::min(remaining_kg_, std::max(0.0, params_.mass_flow_kg_s) * dt);
    remaining_kg_ -= used;
    if (remaining_kg_ < EMPTY_EPS_KG) {
        used += remaining_kg_;
        remaining_kg_ = 0.0;
    }
    return used;
}

double FuelModel::fraction() const {
    if (params_.fuel_kg <= 0.0) return 0.0;
    return std::clamp(remaining_kg_ / params_.fuel_kg, 0.0, 1.0);
}

void FuelModel::reset() {
    remaining_kg_ = std::max(0.0, params_.fuel_kg);
}

} // namespace pursuit::control
