#include "carbon_rules.hxx"
#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/format.h>

namespace greenhaul {

namespace {

constexpr double BEST_FACTOR = 0.020 * 0.85;
constexpr double WORST_FACTOR = 0.180 * 1.40 * 2.5;

constexpr double EMPTY_RETURN_LOAD = 10.0;
constexpr double EMPTY_RETURN_MULTIPLIER = 1.7;
constexpr double LONG_HAUL_KM = 300.0;
constexpr double LONG_HAUL_MULTIPLIER = 0.85;
constexpr double REMOTE_MULTIPLIER = 1.25;

auto
base_rule(const RuleInput& input) -> Adjustment
{
  const auto mode = input.context.mode;
  const double factor = CarbonRules::base_factor(mode);
  return { factor,
           fmt::format("Mode {}: base factor {:.3f} kg CO2/t.km",
                       name(mode),
                       factor) };
}

auto
destination_zone_rule(const RuleInput& input) -> std::optional<Adjustment>
{
  const double multiplier =
    CarbonRules::zone_multiplier(input.destination_zone);
  return Adjustment{ multiplier,
                     fmt::format("Destination zone {}: x{:.2f}",
                                 name(input.destination_zone),
                                 multiplier) };
}

// Average of both zones, expressed relative to the destination zone already
// applied.
auto
zone_crossing_rule(const RuleInput& input) -> std::optional<Adjustment>
{
  if (input.origin_zone == input.destination_zone) {
    return std::nullopt;
  }

  const double origin = CarbonRules::zone_multiplier(input.origin_zone);
  const double destination =
    CarbonRules::zone_multiplier(input.destination_zone);
  const double multiplier = (origin + destination) / 2.0 / destination;

  return Adjustment{ multiplier,
                     fmt::format("Zone crossing {} -> {}: x{:.3f}",
                                 name(input.origin_zone),
                                 name(input.destination_zone),
                                 multiplier) };
}

auto
load_rule(const RuleInput& input) -> std::optional<Adjustment>
{
  const double multiplier = CarbonRules::load_multiplier(input.load_percentage);
  return Adjustment{ multiplier,
                     fmt::format("Load {:.1f}%: x{:.2f}",
                                 input.load_percentage,
                                 multiplier) };
}

auto
cargo_rule(const RuleInput& input) -> std::optional<Adjustment>
{
  const auto cargo = input.context.cargo;
  const double multiplier = CarbonRules::cargo_multiplier(cargo);
  return Adjustment{
    multiplier, fmt::format("Cargo {}: x{:.2f}", name(cargo), multiplier)
  };
}

auto
empty_return_rule(const RuleInput& input) -> std::optional<Adjustment>
{
  if (not input.context.return_trip or
      input.load_percentage >= EMPTY_RETURN_LOAD) {
    return std::nullopt;
  }
  return Adjustment{ EMPTY_RETURN_MULTIPLIER,
                     fmt::format("Empty return leg: x{:.2f}",
                                 EMPTY_RETURN_MULTIPLIER) };
}

auto
long_haul_rail_rule(const RuleInput& input) -> std::optional<Adjustment>
{
  if (input.context.mode != Mode::TRAIN or
      input.distance_km <= LONG_HAUL_KM) {
    return std::nullopt;
  }
  return Adjustment{ LONG_HAUL_MULTIPLIER,
                     fmt::format("Long-haul rail ({:.0f} km): x{:.2f}",
                                 input.distance_km,
                                 LONG_HAUL_MULTIPLIER) };
}

auto
remote_zone_rule(const RuleInput& input) -> std::optional<Adjustment>
{
  if (not input.remote) {
    return std::nullopt;
  }
  return Adjustment{ REMOTE_MULTIPLIER,
                     fmt::format("Extreme remote endpoint: x{:.2f}",
                                 REMOTE_MULTIPLIER) };
}

void
check_cargo_mass(double tonnes)
{
  if (not(tonnes > 0.0)) {
    throw InputError(
      fmt::format("Cargo mass must be positive, got {}", tonnes));
  }
  if (tonnes > MAX_CARGO_TONNES) {
    throw InputError(fmt::format(
      "Cargo mass {} exceeds the {} t limit", tonnes, MAX_CARGO_TONNES));
  }
}

constexpr std::array<CarbonRules::rule_t, 7> MULTIPLIERS{
  destination_zone_rule, zone_crossing_rule, load_rule,
  cargo_rule,            empty_return_rule,  long_haul_rail_rule,
  remote_zone_rule,
};

}

CarbonRules::CarbonRules(const GeoService& geo)
  : CarbonRules(geo, default_extreme_locations())
{}

CarbonRules::CarbonRules(const GeoService& geo,
                         std::set<std::string, std::less<>> extreme)
  : mGeo(geo)
  , mExtremeLocations(std::move(extreme))
{}

auto
CarbonRules::base_factor(Mode mode) -> double
{
  switch (mode) {
    case Mode::TRAIN:
      return 0.020;
    case Mode::TRUCK_SMALL:
      return 0.180;
    case Mode::TRUCK_MEDIUM:
      return 0.100;
    case Mode::TRUCK_LARGE:
      return 0.062;
    case Mode::MULTIMODAL:
      return 0.040;
  }
  return 0.062;
}

auto
CarbonRules::zone_multiplier(Zone zone) -> double
{
  switch (zone) {
    case Zone::NORTH:
      return 1.00;
    case Zone::HIGHLANDS:
      return 1.15;
    case Zone::SOUTH:
      return 1.40;
  }
  return 1.00;
}

auto
CarbonRules::load_multiplier(double loadPercentage) -> double
{
  if (loadPercentage < 25.0) {
    return 2.5;
  }
  if (loadPercentage < 50.0) {
    return 1.6;
  }
  if (loadPercentage < 75.0) {
    return 1.2;
  }
  return 1.0;
}

auto
CarbonRules::cargo_multiplier(Cargo cargo) -> double
{
  switch (cargo) {
    case Cargo::GENERAL:
      return 1.00;
    case Cargo::REFRIGERATED:
      return 1.35;
    case Cargo::HAZARDOUS:
      return 1.10;
    case Cargo::BULK:
      return 0.90;
    case Cargo::FRAGILE:
      return 1.05;
  }
  return 1.00;
}

auto
CarbonRules::default_extreme_locations() -> std::set<std::string, std::less<>>
{
  return { "Tamanrasset",
           "In Guezzam",
           "Djanet",
           "Illizi",
           "Bordj Badji Mokhtar" };
}

auto
CarbonRules::extreme_locations() const
  -> const std::set<std::string, std::less<>>&
{
  return mExtremeLocations;
}

void
CarbonRules::validate(const TransportContext& context) const
{
  check_cargo_mass(context.cargo_tonnes);
  if (not(context.vehicle_capacity > 0.0)) {
    throw InputError(fmt::format("Vehicle capacity must be positive, got {}",
                                 context.vehicle_capacity));
  }
}

auto
CarbonRules::evaluate(const TransportContext& context) const -> Footprint
{
  validate(context);

  for (const auto& location : { context.origin, context.destination }) {
    if (not mGeo.contains(location)) {
      throw InputError(fmt::format("Unknown location <{}>", location));
    }
  }

  auto distance = mGeo.distance(context.origin, context.destination);
  if (not distance) {
    throw InputError(fmt::format("No distance between <{}> and <{}>",
                                 context.origin,
                                 context.destination));
  }
  return footprint(context, *distance);
}

auto
CarbonRules::try_evaluate(const TransportContext& context) const
  -> std::optional<Footprint>
{
  validate(context);

  auto distance = mGeo.distance(context.origin, context.destination);
  if (not distance) {
    logger().debug(fmt::format("Infeasible leg <{}> -> <{}>",
                               context.origin,
                               context.destination));
    return std::nullopt;
  }
  return footprint(context, *distance);
}

auto
CarbonRules::footprint(TransportContext context, double distance) const
  -> Footprint
{
  Footprint result;
  result.origin = context.origin;
  result.destination = context.destination;
  result.distance_km = distance;
  result.cargo_tonnes = context.cargo_tonnes;

  if (requires_rail(context.mode) and
      not mGeo.rail_distance(context.origin, context.destination)) {
    auto message =
      fmt::format("No rail between {} and {}: {} replaced by {}",
                  context.origin,
                  context.destination,
                  name(context.mode),
                  name(Mode::TRUCK_LARGE));
    logger().debug(message);
    result.rules.push_back(std::move(message));
    result.fallback = true;
    context.mode = Mode::TRUCK_LARGE;
  }
  result.mode = context.mode;

  const RuleInput input{
    context,
    mGeo.zone(context.origin),
    mGeo.zone(context.destination),
    distance,
    context.cargo_tonnes / context.vehicle_capacity * 100.0,
    mExtremeLocations.contains(context.origin) or
      mExtremeLocations.contains(context.destination),
  };

  auto seed = base_rule(input);
  result.rules.push_back(std::move(seed.description));

  double factor = seed.value;
  for (const auto rule : MULTIPLIERS) {
    if (auto adjustment = rule(input)) {
      factor *= adjustment->value;
      result.rules.push_back(std::move(adjustment->description));
    }
  }

  const double tonneKm = context.cargo_tonnes * distance;

  result.emission_factor = factor;
  result.total_co2_kg = factor * tonneKm;
  result.best_case_co2_kg = BEST_FACTOR * tonneKm;
  result.worst_case_co2_kg = WORST_FACTOR * tonneKm;

  const double span = result.worst_case_co2_kg - result.best_case_co2_kg;
  result.efficiency_score =
    span > 0.0
      ? 100.0 * (1.0 - (result.total_co2_kg - result.best_case_co2_kg) / span)
      : 100.0;

  return result;
}

auto
CarbonRules::compare_modes(std::string_view origin,
                           std::string_view destination,
                           double cargoTonnes,
                           Cargo cargo) const -> ModeComparison
{
  check_cargo_mass(cargoTonnes);

  ModeComparison comparison;
  comparison.origin = origin;
  comparison.destination = destination;
  comparison.cargo_tonnes = cargoTonnes;
  comparison.cargo = cargo;

  std::optional<double> best;
  std::optional<double> worst;

  for (const auto mode : MODES) {
    const double capacity = typical_capacity(mode);
    const std::size_t vehicles =
      cargoTonnes > capacity
        ? static_cast<std::size_t>(std::ceil(cargoTonnes / capacity))
        : 1;

    auto footprint = evaluate(TransportContext{
      std::string(origin),
      std::string(destination),
      mode,
      cargoTonnes / static_cast<double>(vehicles),
      capacity,
      cargo,
      false,
    });

    const double total = footprint.total_co2_kg * static_cast<double>(vehicles);
    if (not best or total < *best) {
      best = total;
      comparison.best_mode = mode;
    }
    if (not worst or total > *worst) {
      worst = total;
      comparison.worst_mode = mode;
    }

    comparison.modes.emplace(
      mode, ModeFootprint{ std::move(footprint), vehicles, total });
  }

  comparison.savings_kg = *worst - *best;
  comparison.savings_percent =
    *worst > 0.0 ? comparison.savings_kg / *worst * 100.0 : 0.0;

  return comparison;
}

auto
CarbonRules::logger() const -> Poco::Logger&
{
  return Poco::Logger::get("carbon-rules");
}

}
