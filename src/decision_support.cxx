#include "decision_support.hxx"
#include "errors.hxx"
#include <algorithm>
#include <fmt/format.h>

namespace greenhaul {

namespace {

struct Bounds
{
  double low;
  double high;

  [[nodiscard]] auto normalise(double value) const -> double
  {
    return high > low ? (value - low) / (high - low) : 0.0;
  }
};

template<typename Projection>
auto
bounds(const std::vector<Solution>& front, Projection projection) -> Bounds
{
  auto [low, high] = std::minmax_element(
    front.begin(), front.end(), [&](const auto& lhs, const auto& rhs) {
      return projection(lhs) < projection(rhs);
    });
  return { projection(*low), projection(*high) };
}

}

void
scalarise(std::vector<Solution>& front, double alpha)
{
  if (not(alpha >= 0.0 and alpha <= 1.0)) {
    throw InputError(fmt::format("Weight alpha {} outside [0, 1]", alpha));
  }
  if (front.empty()) {
    return;
  }

  const auto cost =
    bounds(front, [](const Solution& sol) { return sol.total_cost; });
  const auto co2 =
    bounds(front, [](const Solution& sol) { return sol.total_co2_kg; });

  for (auto& solution : front) {
    solution.weighted_score =
      alpha * cost.normalise(solution.total_cost) +
      (1.0 - alpha) * co2.normalise(solution.total_co2_kg);
  }
}

auto
recommend(const std::vector<Solution>& front) -> std::optional<Solution>
{
  const Solution* best = nullptr;
  for (const auto& solution : front) {
    if (not solution.weighted_score) {
      continue;
    }
    if (best == nullptr or *solution.weighted_score < *best->weighted_score) {
      best = &solution;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

auto
analyse(const Solution& solution) -> SolutionAnalysis
{
  SolutionAnalysis analysis;

  for (const auto& decision : solution.decisions) {
    auto& usage = analysis.modes[decision.mode];
    ++usage.requests;
    usage.cargo_tonnes += decision.cargo_tonnes;

    if (decision.hub and *decision.hub != decision.origin and
        *decision.hub != decision.destination) {
      ++analysis.hubs[*decision.hub];
      ++analysis.hub_routes;
    } else {
      ++analysis.direct_routes;
    }
  }

  return analysis;
}

}
