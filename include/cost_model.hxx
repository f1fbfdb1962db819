#ifndef GREENHAUL_COST_MODEL
#define GREENHAUL_COST_MODEL

#include "transport.hxx"

namespace greenhaul {

/**
 * @brief Monetary cost of moving cargo, in local currency units.
 *
 * A leg costs a fixed amount per mode plus a per-km rate, with a surcharge
 * per tonne above the heavy-load threshold. Urgent requests sent by train pay
 * a scheduling premium on their whole route.
 */
class CostModel
{
public:
  static constexpr double HEAVY_LOAD_TONNES = 10.0;
  static constexpr double HEAVY_LOAD_SURCHARGE = 0.02;
  static constexpr double URGENT_RAIL_PREMIUM = 1.2;

  static constexpr double INFEASIBLE_COST = 1'000'000.0;
  static constexpr double INFEASIBLE_CO2_KG = 10'000.0;

  [[nodiscard]] static auto fixed_cost(Mode) -> double;

  [[nodiscard]] static auto cost_per_km(Mode) -> double;

  [[nodiscard]] auto leg_cost(Mode, double distanceKm, double cargoTonnes) const
    -> double;

  [[nodiscard]] auto request_cost(double routeCost, Mode, int priority) const
    -> double;
};

}

#endif
