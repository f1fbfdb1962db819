#ifndef GREENHAUL_TOUR_SOLVER
#define GREENHAUL_TOUR_SOLVER

#include "carbon_rules.hxx"
#include "geo_service.hxx"
#include <Poco/Logger.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace greenhaul {

struct TourConfig
{
  std::size_t population_size = 100;
  std::size_t generations = 150;
  double mutation_rate = 0.15;
  std::size_t elite_size = 10;
  std::size_t tournament_size = 3;
  std::uint64_t seed = 42;
};

struct TourRequest
{
  std::vector<std::string> stops;
  std::optional<std::string> depot;
  std::optional<std::string> end;
  bool round_trip = false;
};

struct TourLeg
{
  std::size_t number = 0;
  std::string from;
  std::string to;
  double distance_km = 0.0;
};

struct TourResult
{
  std::vector<std::string> order;
  std::vector<TourLeg> legs;
  double total_distance_km = 0.0;
  double original_distance_km = 0.0;
  double improvement_percent = 0.0;
};

struct LegAssessment
{
  TourLeg leg;
  Mode recommended_mode = Mode::TRUCK_LARGE;
  double co2_kg = 0.0;
  std::map<Mode, double> co2_by_mode;
};

struct TourAssessment
{
  TourResult tour;
  double cargo_tonnes = 0.0;
  Cargo cargo = Cargo::GENERAL;
  std::vector<LegAssessment> legs;
  double total_co2_kg = 0.0;
};

/**
 * @brief Orders delivery stops to shorten the distance driven.
 *
 * The first stop of the tour is the depot, or the first stop given when no
 * depot is named; a depot missing from the stops is added in front. An
 * explicit end stays last. A round trip closes with a return to the first
 * stop. Only the stops in between are reordered.
 *
 * The input order competes in the initial population and the best tour ever
 * seen is returned, so the result is never longer than the input.
 */
class TourSolver
{
private:
  const GeoService& mGeo;
  TourConfig mConfig;

public:
  explicit TourSolver(const GeoService&, TourConfig = {});

  [[nodiscard]] auto config() const -> const TourConfig&;

  /// @throws InputError on empty, duplicate or unknown stops
  [[nodiscard]] auto optimize(const TourRequest&) const -> TourResult;

private:
  auto logger() const -> Poco::Logger&;
};

/// Lowest-CO2 mode and footprint for every leg of @p tour.
[[nodiscard]] auto
assess_tour(const TourResult& tour,
            const CarbonRules& rules,
            double cargoTonnes,
            Cargo cargo = Cargo::GENERAL) -> TourAssessment;

}

#endif
