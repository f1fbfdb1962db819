#ifndef GREENHAUL_CARBON_RULES
#define GREENHAUL_CARBON_RULES

#include "concepts.hxx"
#include "errors.hxx"
#include "geo_service.hxx"
#include "pairwise_iterator.hxx"
#include "transport.hxx"
#include <Poco/Logger.h>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace greenhaul {

struct TransportContext
{
  std::string origin;
  std::string destination;
  Mode mode = Mode::TRUCK_LARGE;
  double cargo_tonnes = 0.0;
  double vehicle_capacity = 25.0;
  Cargo cargo = Cargo::GENERAL;
  bool return_trip = false;
};

struct Footprint
{
  std::string origin;
  std::string destination;
  Mode mode = Mode::TRUCK_LARGE;
  bool fallback = false;
  double distance_km = 0.0;
  double cargo_tonnes = 0.0;
  double emission_factor = 0.0;
  double total_co2_kg = 0.0;
  double efficiency_score = 0.0;
  double best_case_co2_kg = 0.0;
  double worst_case_co2_kg = 0.0;
  std::vector<std::string> rules;
};

struct ModeFootprint
{
  Footprint footprint;
  std::size_t vehicles = 1;
  double total_co2_kg = 0.0;
};

struct ModeComparison
{
  std::string origin;
  std::string destination;
  double cargo_tonnes = 0.0;
  Cargo cargo = Cargo::GENERAL;
  std::map<Mode, ModeFootprint> modes;
  Mode best_mode = Mode::TRAIN;
  Mode worst_mode = Mode::TRAIN;
  double savings_kg = 0.0;
  double savings_percent = 0.0;
};

struct RouteSegment
{
  std::string from;
  std::string to;
  double distance_km = 0.0;
  double co2_kg = 0.0;
};

struct RouteFootprint
{
  std::vector<std::string> route;
  Mode mode = Mode::TRUCK_LARGE;
  double cargo_tonnes = 0.0;
  std::vector<RouteSegment> segments;
  double total_distance_km = 0.0;
  double total_co2_kg = 0.0;
  double co2_per_km = 0.0;
};

/// A single step of the rule cascade: a factor and its human-readable trace.
struct Adjustment
{
  double value = 1.0;
  std::string description;
};

/// Everything a rule may look at, resolved once per evaluation.
struct RuleInput
{
  const TransportContext& context;
  Zone origin_zone;
  Zone destination_zone;
  double distance_km;
  double load_percentage;
  bool remote;
};

/**
 * @brief Emission factor rule engine.
 *
 * The base rule turns the transport mode into a factor in kg CO2 per
 * tonne-km. Every further rule is an unconditional multiplier that either
 * fires or stays silent; the product of the base factor and all multipliers
 * that fired is the final factor. Footprints carry the descriptions of every
 * rule that fired, in order.
 *
 * Rail-dependent modes between locations the rail network does not connect
 * are evaluated as a large truck; the substitution heads the rule trace.
 *
 * The engine keeps no mutable state and may be shared between threads.
 */
class CarbonRules
{
public:
  using rule_t = auto (*)(const RuleInput&) -> std::optional<Adjustment>;

private:
  const GeoService& mGeo;
  std::set<std::string, std::less<>> mExtremeLocations;

public:
  explicit CarbonRules(const GeoService&);

  CarbonRules(const GeoService&, std::set<std::string, std::less<>>);

  [[nodiscard]] static auto base_factor(Mode) -> double;

  [[nodiscard]] static auto zone_multiplier(Zone) -> double;

  [[nodiscard]] static auto load_multiplier(double loadPercentage) -> double;

  [[nodiscard]] static auto cargo_multiplier(Cargo) -> double;

  [[nodiscard]] static auto default_extreme_locations()
    -> std::set<std::string, std::less<>>;

  [[nodiscard]] auto extreme_locations() const
    -> const std::set<std::string, std::less<>>&;

  /**
   * @brief Footprint of one vehicle moving a cargo between two locations.
   *
   * @throws InputError when a location is unknown or the cargo mass or the
   *         vehicle capacity is not positive
   */
  [[nodiscard]] auto evaluate(const TransportContext&) const -> Footprint;

  /// Like evaluate, but an unknown location yields no footprint.
  [[nodiscard]] auto try_evaluate(const TransportContext&) const
    -> std::optional<Footprint>;

  /**
   * @brief Footprint of a cargo under every mode at that mode's typical
   * capacity, splitting the cargo over as many vehicles as needed.
   */
  [[nodiscard]] auto compare_modes(std::string_view origin,
                                   std::string_view destination,
                                   double cargoTonnes,
                                   Cargo cargo = Cargo::GENERAL) const
    -> ModeComparison;

  /// Sum of the legs between consecutive locations of @p route.
  template<location_range RangeT>
  [[nodiscard]] auto route_footprint(const RangeT& route,
                                     double cargoTonnes,
                                     Mode mode = Mode::TRUCK_LARGE,
                                     Cargo cargo = Cargo::GENERAL) const
    -> RouteFootprint
  {
    if (std::ranges::size(route) < 2) {
      throw InputError("A route needs at least two locations");
    }

    RouteFootprint result;
    result.mode = mode;
    result.cargo_tonnes = cargoTonnes;
    for (const auto& stop : route) {
      result.route.emplace_back(stop);
    }

    for (const auto& [from, to] : make_pairwise_range(result.route)) {
      auto footprint = evaluate(TransportContext{ from,
                                                  to,
                                                  mode,
                                                  cargoTonnes,
                                                  typical_capacity(mode),
                                                  cargo,
                                                  false });

      result.total_distance_km += footprint.distance_km;
      result.total_co2_kg += footprint.total_co2_kg;
      result.segments.push_back(RouteSegment{
        from, to, footprint.distance_km, footprint.total_co2_kg });
    }

    if (result.total_distance_km > 0.0) {
      result.co2_per_km = result.total_co2_kg / result.total_distance_km;
    }
    return result;
  }

private:
  void validate(const TransportContext&) const;

  [[nodiscard]] auto footprint(TransportContext, double distance) const
    -> Footprint;

  auto logger() const -> Poco::Logger&;
};

}

#endif
