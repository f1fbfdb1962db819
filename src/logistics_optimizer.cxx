#include "logistics_optimizer.hxx"
#include "errors.hxx"
#include <algorithm>
#include <fmt/format.h>

namespace greenhaul {

namespace {

constexpr std::size_t PROGRESS_INTERVAL = 10;

}

LogisticsOptimizer::LogisticsOptimizer(const GeoService& geo,
                                       const CarbonRules& rules,
                                       OptimizerConfig config)
  : mGeo(geo)
  , mRules(rules)
  , mConfig(config)
{}

auto
LogisticsOptimizer::config() const -> const OptimizerConfig&
{
  return mConfig;
}

auto
LogisticsOptimizer::optimize(const std::vector<DeliveryRequest>& requests,
                             const std::vector<std::string>& hubs,
                             double alpha,
                             const std::atomic<bool>* cancel) const
  -> OptimizationResult
{
  if (not(alpha >= 0.0 and alpha <= 1.0)) {
    throw InputError(fmt::format("Weight alpha {} outside [0, 1]", alpha));
  }
  validate(requests, mGeo);
  validate_hubs(hubs, mGeo);

  DeliveryPlanning problem(requests, hubs, mGeo, mRules, mConfig.planning);
  evolution::Nsga2<DeliveryPlanning, 2> engine(problem, mConfig.evolution);
  evolution::Random rng(mConfig.seed);

  logger().information(
    fmt::format("Optimising {} requests over {} hubs: population {}, {} "
                "generations, seed {}",
                requests.size(),
                hubs.size(),
                engine.population_size(),
                mConfig.evolution.generations,
                mConfig.seed));

  auto outcome = engine.run(
    rng,
    [this](const evolution::GenerationStats<2>& stats) {
      if ((stats.generation + 1) % PROGRESS_INTERVAL == 0) {
        logger().information(
          fmt::format("Generation {}: min cost {:.0f}, min CO2 {:.1f} kg",
                      stats.generation + 1,
                      stats.minimum[0],
                      stats.minimum[1]));
      }
    },
    cancel);

  OptimizationResult result;
  result.alpha = alpha;
  result.history = std::move(outcome.history);
  result.population_size = engine.population_size();
  result.generations = outcome.generations;
  result.cancelled = outcome.cancelled;

  for (auto idx : engine.first_front(outcome.population)) {
    const auto& individual = outcome.population[idx];
    result.pareto_front.push_back(
      Solution{ (*individual.objectives)[0],
                (*individual.objectives)[1],
                decode(individual.genome, requests, hubs),
                std::nullopt });
  }

  std::stable_sort(result.pareto_front.begin(),
                   result.pareto_front.end(),
                   [](const Solution& lhs, const Solution& rhs) {
                     return lhs.total_cost < rhs.total_cost;
                   });

  scalarise(result.pareto_front, alpha);
  result.recommended = recommend(result.pareto_front);

  if (result.recommended) {
    logger().information(
      fmt::format("{} trade-offs found, recommended cost {:.0f} for {:.1f} kg "
                  "CO2 at alpha {:.2f}",
                  result.pareto_front.size(),
                  result.recommended->total_cost,
                  result.recommended->total_co2_kg,
                  alpha));
  }
  if (result.cancelled) {
    logger().information(
      fmt::format("Run cancelled after {} generations", result.generations));
  }

  return result;
}

auto
LogisticsOptimizer::pareto_curve(const std::vector<DeliveryRequest>& requests,
                                 const std::vector<std::string>& hubs,
                                 std::size_t steps) const
  -> std::vector<CurvePoint>
{
  if (steps == 0) {
    throw InputError("A trade-off curve needs at least one step");
  }

  std::vector<CurvePoint> curve;
  curve.reserve(steps + 1);

  for (std::size_t step = 0; step <= steps; ++step) {
    const double alpha =
      static_cast<double>(step) / static_cast<double>(steps);
    auto result = optimize(requests, hubs, alpha);
    if (result.recommended) {
      curve.push_back(CurvePoint{ alpha,
                                  result.recommended->total_cost,
                                  result.recommended->total_co2_kg });
    }
  }
  return curve;
}

auto
LogisticsOptimizer::logger() const -> Poco::Logger&
{
  return Poco::Logger::get("logistics-optimizer");
}

}
