#include "delivery_planning.hxx"
#include <algorithm>
#include <random>

namespace greenhaul {

namespace {

template<typename T>
auto
pick(const std::vector<T>& choices, evolution::Random& rng) -> const T&
{
  std::uniform_int_distribution<std::size_t> draw(0, choices.size() - 1);
  return choices[draw(rng)];
}

}

DeliveryPlanning::DeliveryPlanning(const std::vector<DeliveryRequest>& requests,
                                   const std::vector<std::string>& hubs,
                                   const GeoService& geo,
                                   const CarbonRules& rules,
                                   PlanningConfig config)
  : mRequests(requests)
  , mHubs(hubs)
  , mGeo(geo)
  , mRules(rules)
  , mConfig(config)
{
  mPermittedModes.reserve(mRequests.size());
  mCandidateHubs.reserve(mRequests.size());

  for (const auto& request : mRequests) {
    const bool rail = mGeo.has_rail_access(request.origin) and
                      mGeo.has_rail_access(request.destination);

    auto& modes = mPermittedModes.emplace_back();
    for (const auto mode : MODES) {
      if (rail or not requires_rail(mode)) {
        modes.push_back(mode);
      }
    }

    auto& candidates = mCandidateHubs.emplace_back();
    for (std::size_t idx = 0; idx < mHubs.size(); ++idx) {
      if (mHubs[idx] != request.origin and mHubs[idx] != request.destination) {
        candidates.push_back(idx);
      }
    }
  }
}

auto
DeliveryPlanning::create(evolution::Random& rng) const -> Plan
{
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  Plan plan;
  plan.reserve(mRequests.size());

  for (std::size_t idx = 0; idx < mRequests.size(); ++idx) {
    Decision decision{ pick(mPermittedModes[idx], rng), std::nullopt };

    if (unit(rng) < mConfig.hub_probability and
        not mCandidateHubs[idx].empty()) {
      decision.hub = pick(mCandidateHubs[idx], rng);
    }
    plan.push_back(decision);
  }
  return plan;
}

auto
DeliveryPlanning::legs(std::size_t request, const Decision& decision) const
  -> std::vector<Leg>
{
  const auto& delivery = mRequests[request];
  std::string_view origin = delivery.origin;
  std::string_view destination = delivery.destination;

  if (decision.hub and *decision.hub < mHubs.size()) {
    std::string_view hub = mHubs[*decision.hub];
    if (hub != origin and hub != destination) {
      return { { origin, hub }, { hub, destination } };
    }
  }
  return { { origin, destination } };
}

auto
DeliveryPlanning::evaluate(const Plan& plan) const -> evolution::Objectives<2>
{
  double cost = 0.0;
  double co2 = 0.0;

  for (std::size_t idx = 0; idx < plan.size(); ++idx) {
    const auto& request = mRequests[idx];
    const auto& decision = plan[idx];

    double routeCost = 0.0;
    for (const auto& [from, to] : legs(idx, decision)) {
      auto footprint = mRules.try_evaluate(TransportContext{
        std::string(from),
        std::string(to),
        decision.mode,
        request.cargo_tonnes,
        typical_capacity(decision.mode),
        request.cargo,
        false,
      });

      if (not footprint) {
        routeCost += CostModel::INFEASIBLE_COST;
        co2 += CostModel::INFEASIBLE_CO2_KG;
        continue;
      }

      routeCost += mCosts.leg_cost(
        decision.mode, footprint->distance_km, request.cargo_tonnes);
      co2 += footprint->total_co2_kg;
    }

    cost += mCosts.request_cost(routeCost, decision.mode, request.priority);
  }

  return { cost, co2 };
}

void
DeliveryPlanning::crossover(Plan& lhs, Plan& rhs, evolution::Random& rng) const
{
  const auto size = std::min(lhs.size(), rhs.size());
  if (size < 2) {
    return;
  }

  std::uniform_int_distribution<std::size_t> draw(0, size - 1);
  auto first = draw(rng);
  auto second = draw(rng);
  while (second == first) {
    second = draw(rng);
  }
  if (second < first) {
    std::swap(first, second);
  }

  std::swap_ranges(lhs.begin() + static_cast<std::ptrdiff_t>(first),
                   lhs.begin() + static_cast<std::ptrdiff_t>(second),
                   rhs.begin() + static_cast<std::ptrdiff_t>(first));
}

void
DeliveryPlanning::mutate(Plan& plan, evolution::Random& rng) const
{
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  const double probability = mConfig.gene_mutation_probability;

  for (std::size_t idx = 0; idx < plan.size(); ++idx) {
    auto& decision = plan[idx];

    if (unit(rng) < probability) {
      decision.mode = pick(mPermittedModes[idx], rng);
    }

    if (unit(rng) < probability) {
      if (unit(rng) < 0.5 or mHubs.empty()) {
        decision.hub.reset();
      } else {
        std::uniform_int_distribution<std::size_t> draw(0, mHubs.size() - 1);
        decision.hub = draw(rng);
      }
    }
  }
}

auto
DeliveryPlanning::permitted_modes(std::size_t request) const
  -> const std::vector<Mode>&
{
  return mPermittedModes.at(request);
}

auto
DeliveryPlanning::requests() const -> const std::vector<DeliveryRequest>&
{
  return mRequests;
}

auto
DeliveryPlanning::hubs() const -> const std::vector<std::string>&
{
  return mHubs;
}

}
