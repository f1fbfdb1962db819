#include "tour_solver.hxx"
#include "errors.hxx"
#include "pairwise_iterator.hxx"
#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <numeric>
#include <random>
#include <set>

namespace greenhaul {

namespace {

using Route = std::vector<std::size_t>;
using Matrix = std::vector<std::vector<double>>;

/// Stops after endpoint normalisation; index 0 is always the fixed start.
struct Layout
{
  std::vector<std::string> sites;
  std::optional<std::size_t> last;
  bool closed = false;

  [[nodiscard]] auto interior() const -> Route
  {
    Route route(sites.size() - (last ? 2 : 1));
    std::iota(route.begin(), route.end(), 1);
    return route;
  }

  [[nodiscard]] auto assemble(const Route& interior) const -> Route
  {
    Route route;
    route.reserve(interior.size() + 3);
    route.push_back(0);
    route.insert(route.end(), interior.begin(), interior.end());
    if (last) {
      route.push_back(*last);
    }
    if (closed) {
      route.push_back(0);
    }
    return route;
  }
};

auto
layout(const TourRequest& request, const GeoService& geo) -> Layout
{
  if (request.stops.empty()) {
    throw InputError("A tour needs at least one stop");
  }

  std::set<std::string, std::less<>> seen;
  for (const auto& stop : request.stops) {
    if (not geo.contains(stop)) {
      throw InputError(fmt::format("Unknown location <{}>", stop));
    }
    if (not seen.insert(stop).second) {
      throw InputError(fmt::format("Stop <{}> listed twice", stop));
    }
  }

  Layout result;
  result.sites = request.stops;
  result.closed = request.round_trip;

  auto move_to = [&](const std::string& name, bool front) {
    if (not geo.contains(name)) {
      throw InputError(fmt::format("Unknown location <{}>", name));
    }
    auto found = std::find(result.sites.begin(), result.sites.end(), name);
    if (found != result.sites.end()) {
      result.sites.erase(found);
    }
    if (front) {
      result.sites.insert(result.sites.begin(), name);
    } else {
      result.sites.push_back(name);
    }
  };

  if (request.depot) {
    move_to(*request.depot, true);
  }

  if (request.end) {
    if (*request.end == result.sites.front()) {
      result.closed = true;
    } else {
      move_to(*request.end, false);
      result.last = result.sites.size() - 1;
    }
  }

  return result;
}

auto
distances(const std::vector<std::string>& sites, const GeoService& geo)
  -> Matrix
{
  Matrix matrix(sites.size(), std::vector<double>(sites.size(), 0.0));
  for (std::size_t lhs = 0; lhs < sites.size(); ++lhs) {
    for (std::size_t rhs = lhs + 1; rhs < sites.size(); ++rhs) {
      auto km = geo.distance(sites[lhs], sites[rhs]);
      if (not km) {
        throw InputError(fmt::format(
          "No distance between <{}> and <{}>", sites[lhs], sites[rhs]));
      }
      matrix[lhs][rhs] = *km;
      matrix[rhs][lhs] = *km;
    }
  }
  return matrix;
}

auto
length(const Route& route, const Matrix& matrix) -> double
{
  double total = 0.0;
  for (const auto& [from, to] : make_pairwise_range(route)) {
    total += matrix[from][to];
  }
  return total;
}

auto
describe(const Route& route, const Layout& layout, const Matrix& matrix)
  -> TourResult
{
  TourResult result;
  result.order.reserve(route.size());
  for (auto idx : route) {
    result.order.push_back(layout.sites[idx]);
  }

  std::size_t number = 0;
  for (const auto& [from, to] : make_pairwise_range(route)) {
    result.legs.push_back(TourLeg{
      ++number, layout.sites[from], layout.sites[to], matrix[from][to] });
  }
  result.total_distance_km = length(route, matrix);
  return result;
}

/// Permutation search over the interior stops.
class TourSearch
{
private:
  const Layout& mLayout;
  const Matrix& mMatrix;
  const TourConfig& mConfig;
  std::mt19937_64& mRng;

public:
  TourSearch(const Layout& layout,
             const Matrix& matrix,
             const TourConfig& config,
             std::mt19937_64& rng)
    : mLayout(layout)
    , mMatrix(matrix)
    , mConfig(config)
    , mRng(rng)
  {}

  auto fitness(const Route& interior) const -> double
  {
    return 1.0 / (length(mLayout.assemble(interior), mMatrix) + 1.0);
  }

  auto select(const std::vector<Route>& population,
              const std::vector<double>& fitnesses) const -> const Route&
  {
    std::vector<std::size_t> indices(population.size());
    std::iota(indices.begin(), indices.end(), 0);

    std::vector<std::size_t> contestants;
    std::sample(indices.begin(),
                indices.end(),
                std::back_inserter(contestants),
                std::clamp<std::size_t>(
                  mConfig.tournament_size, 1, population.size()),
                mRng);

    auto winner = contestants.front();
    for (auto idx : contestants) {
      if (fitnesses[idx] > fitnesses[winner]) {
        winner = idx;
      }
    }
    return population[winner];
  }

  // Ordered crossover: the segment between the cuts comes from the first
  // parent, the remaining stops follow in the order of the second parent
  // starting after the second cut.
  auto crossover(const Route& first, const Route& second) const -> Route
  {
    const auto size = first.size();
    if (size <= 2) {
      return first;
    }

    std::uniform_int_distribution<std::size_t> draw(0, size - 1);
    auto lower = draw(mRng);
    auto upper = draw(mRng);
    while (upper == lower) {
      upper = draw(mRng);
    }
    if (upper < lower) {
      std::swap(lower, upper);
    }

    Route child(size, 0);
    std::vector<bool> filled(size, false);
    std::set<std::size_t> taken;
    for (auto pos = lower; pos < upper; ++pos) {
      child[pos] = first[pos];
      filled[pos] = true;
      taken.insert(first[pos]);
    }

    auto slot = upper % size;
    for (std::size_t offset = 0; offset < size; ++offset) {
      const auto stop = second[(upper + offset) % size];
      if (taken.contains(stop)) {
        continue;
      }
      while (filled[slot]) {
        slot = (slot + 1) % size;
      }
      child[slot] = stop;
      filled[slot] = true;
      taken.insert(stop);
    }
    return child;
  }

  void mutate(Route& interior) const
  {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    if (interior.size() < 2 or unit(mRng) >= mConfig.mutation_rate) {
      return;
    }

    std::uniform_int_distribution<std::size_t> draw(0, interior.size() - 1);
    auto lhs = draw(mRng);
    auto rhs = draw(mRng);
    while (rhs == lhs) {
      rhs = draw(mRng);
    }
    std::swap(interior[lhs], interior[rhs]);
  }

  auto run(const Route& initial) const -> Route
  {
    const auto size = std::max<std::size_t>(mConfig.population_size, 2);
    const auto elites = std::min(mConfig.elite_size, size);

    std::vector<Route> population;
    population.reserve(size);
    population.push_back(initial);
    while (population.size() < size) {
      auto shuffled = initial;
      std::shuffle(shuffled.begin(), shuffled.end(), mRng);
      population.push_back(std::move(shuffled));
    }

    Route best = initial;
    double bestFitness = fitness(initial);

    auto score = [&](const std::vector<Route>& candidates) {
      std::vector<double> fitnesses;
      fitnesses.reserve(candidates.size());
      for (const auto& candidate : candidates) {
        fitnesses.push_back(fitness(candidate));
        if (fitnesses.back() > bestFitness) {
          bestFitness = fitnesses.back();
          best = candidate;
        }
      }
      return fitnesses;
    };

    for (std::size_t generation = 0; generation < mConfig.generations;
         ++generation) {
      const auto fitnesses = score(population);

      std::vector<std::size_t> ranking(population.size());
      std::iota(ranking.begin(), ranking.end(), 0);
      std::stable_sort(ranking.begin(), ranking.end(), [&](auto lhs, auto rhs) {
        return fitnesses[lhs] > fitnesses[rhs];
      });

      std::vector<Route> next;
      next.reserve(size);
      for (std::size_t idx = 0; idx < elites; ++idx) {
        next.push_back(population[ranking[idx]]);
      }

      while (next.size() < size) {
        const auto& first = select(population, fitnesses);
        const auto& second = select(population, fitnesses);
        auto child = crossover(first, second);
        mutate(child);
        next.push_back(std::move(child));
      }

      population = std::move(next);
    }
    score(population);

    return best;
  }
};

}

TourSolver::TourSolver(const GeoService& geo, TourConfig config)
  : mGeo(geo)
  , mConfig(config)
{}

auto
TourSolver::config() const -> const TourConfig&
{
  return mConfig;
}

auto
TourSolver::optimize(const TourRequest& request) const -> TourResult
{
  const auto plan = layout(request, mGeo);
  const auto matrix = distances(plan.sites, mGeo);
  const auto initial = plan.interior();
  const auto original = length(plan.assemble(initial), matrix);

  Route interior = initial;
  if (initial.size() >= 2) {
    std::mt19937_64 rng(mConfig.seed);
    interior = TourSearch(plan, matrix, mConfig, rng).run(initial);
  }

  auto result = describe(plan.assemble(interior), plan, matrix);
  result.original_distance_km = original;
  result.improvement_percent =
    original > 0.0
      ? (original - result.total_distance_km) / original * 100.0
      : 0.0;

  logger().information(
    fmt::format("Tour of {} stops: {:.1f} km, {:.1f}% shorter than given",
                plan.sites.size(),
                result.total_distance_km,
                result.improvement_percent));
  return result;
}

auto
TourSolver::logger() const -> Poco::Logger&
{
  return Poco::Logger::get("tour-solver");
}

auto
assess_tour(const TourResult& tour,
            const CarbonRules& rules,
            double cargoTonnes,
            Cargo cargo) -> TourAssessment
{
  TourAssessment assessment;
  assessment.tour = tour;
  assessment.cargo_tonnes = cargoTonnes;
  assessment.cargo = cargo;

  for (const auto& leg : tour.legs) {
    auto comparison = rules.compare_modes(leg.from, leg.to, cargoTonnes, cargo);

    LegAssessment entry;
    entry.leg = leg;
    entry.recommended_mode = comparison.best_mode;
    entry.co2_kg = comparison.modes.at(comparison.best_mode).total_co2_kg;
    for (const auto& [mode, footprint] : comparison.modes) {
      entry.co2_by_mode[mode] = footprint.total_co2_kg;
    }

    assessment.total_co2_kg += entry.co2_kg;
    assessment.legs.push_back(std::move(entry));
  }

  return assessment;
}

}
