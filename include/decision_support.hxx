#ifndef GREENHAUL_DECISION_SUPPORT
#define GREENHAUL_DECISION_SUPPORT

#include "plan.hxx"
#include "transport.hxx"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace greenhaul {

struct Solution
{
  double total_cost = 0.0;
  double total_co2_kg = 0.0;
  std::vector<RoutedDecision> decisions;
  std::optional<double> weighted_score;
};

struct ModeUsage
{
  std::size_t requests = 0;
  double cargo_tonnes = 0.0;
};

struct SolutionAnalysis
{
  std::map<Mode, ModeUsage> modes;
  std::map<std::string, std::size_t> hubs;
  std::size_t direct_routes = 0;
  std::size_t hub_routes = 0;
};

/**
 * @brief Scores every solution of a front as
 * `alpha * cost + (1 - alpha) * co2`, both normalised to [0, 1] over the
 * front. An objective without spread normalises to 0.
 *
 * @throws InputError when @p alpha is outside [0, 1]
 */
void
scalarise(std::vector<Solution>& front, double alpha);

/// Lowest weighted score, the first one on ties; empty for an empty front.
[[nodiscard]] auto
recommend(const std::vector<Solution>& front) -> std::optional<Solution>;

[[nodiscard]] auto
analyse(const Solution& solution) -> SolutionAnalysis;

}

#endif
