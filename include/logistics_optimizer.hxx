#ifndef GREENHAUL_LOGISTICS_OPTIMIZER
#define GREENHAUL_LOGISTICS_OPTIMIZER

#include "carbon_rules.hxx"
#include "decision_support.hxx"
#include "delivery.hxx"
#include "delivery_planning.hxx"
#include <Poco/Logger.h>
#include <atomic>
#include <cstdint>
#include <greenhaul/evolution/nsga2.hxx>
#include <optional>
#include <string>
#include <vector>

namespace greenhaul {

struct OptimizerConfig
{
  evolution::Config evolution;
  PlanningConfig planning;
  std::uint64_t seed = 42;
};

struct OptimizationResult
{
  std::vector<Solution> pareto_front;
  std::optional<Solution> recommended;
  double alpha = 0.5;
  std::vector<evolution::GenerationStats<2>> history;
  std::size_t population_size = 0;
  std::size_t generations = 0;
  bool cancelled = false;
};

struct CurvePoint
{
  double alpha = 0.0;
  double total_cost = 0.0;
  double total_co2_kg = 0.0;
};

/**
 * @brief Finds cost/CO2 trade-offs for a batch of delivery requests.
 *
 * Every call is an independent run with its own population and a generator
 * seeded from the configuration, so equal inputs give equal results whether
 * evaluation runs sequentially or in parallel.
 */
class LogisticsOptimizer
{
private:
  const GeoService& mGeo;
  const CarbonRules& mRules;
  OptimizerConfig mConfig;

public:
  LogisticsOptimizer(const GeoService&, const CarbonRules&, OptimizerConfig = {});

  [[nodiscard]] auto config() const -> const OptimizerConfig&;

  /**
   * @brief Evolves plans for @p requests, relaying through @p hubs.
   *
   * @param alpha  weight of cost against CO2 in the recommendation
   * @param cancel checked between generations
   * @throws InputError on an invalid request, hub or weight
   */
  [[nodiscard]] auto optimize(const std::vector<DeliveryRequest>& requests,
                              const std::vector<std::string>& hubs,
                              double alpha = 0.5,
                              const std::atomic<bool>* cancel = nullptr) const
    -> OptimizationResult;

  /// Recommended trade-off for alpha = 0, 1/steps, ..., 1.
  [[nodiscard]] auto pareto_curve(const std::vector<DeliveryRequest>& requests,
                                  const std::vector<std::string>& hubs,
                                  std::size_t steps = 5) const
    -> std::vector<CurvePoint>;

private:
  auto logger() const -> Poco::Logger&;
};

}

#endif
