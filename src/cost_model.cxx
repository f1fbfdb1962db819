#include "cost_model.hxx"

namespace greenhaul {

auto
CostModel::fixed_cost(Mode mode) -> double
{
  switch (mode) {
    case Mode::TRAIN:
      return 50'000.0;
    case Mode::TRUCK_SMALL:
      return 5'000.0;
    case Mode::TRUCK_MEDIUM:
      return 8'000.0;
    case Mode::TRUCK_LARGE:
      return 12'000.0;
    case Mode::MULTIMODAL:
      return 15'000.0;
  }
  return 12'000.0;
}

auto
CostModel::cost_per_km(Mode mode) -> double
{
  switch (mode) {
    case Mode::TRAIN:
      return 15.0;
    case Mode::TRUCK_SMALL:
      return 45.0;
    case Mode::TRUCK_MEDIUM:
      return 35.0;
    case Mode::TRUCK_LARGE:
      return 28.0;
    case Mode::MULTIMODAL:
      return 22.0;
  }
  return 28.0;
}

auto
CostModel::leg_cost(Mode mode, double distanceKm, double cargoTonnes) const
  -> double
{
  double cost = fixed_cost(mode) + cost_per_km(mode) * distanceKm;
  if (cargoTonnes > HEAVY_LOAD_TONNES) {
    cost *= 1.0 + (cargoTonnes - HEAVY_LOAD_TONNES) * HEAVY_LOAD_SURCHARGE;
  }
  return cost;
}

auto
CostModel::request_cost(double routeCost, Mode mode, int priority) const
  -> double
{
  if (priority > 1 and mode == Mode::TRAIN) {
    return routeCost * URGENT_RAIL_PREMIUM;
  }
  return routeCost;
}

}
