#ifndef GREENHAUL_DELIVERY_PLANNING
#define GREENHAUL_DELIVERY_PLANNING

#include "carbon_rules.hxx"
#include "cost_model.hxx"
#include "delivery.hxx"
#include "plan.hxx"
#include <greenhaul/evolution/concepts.hxx>
#include <string_view>
#include <utility>
#include <vector>

namespace greenhaul {

struct PlanningConfig
{
  double hub_probability = 0.3;
  double gene_mutation_probability = 0.1;
};

using Leg = std::pair<std::string_view, std::string_view>;

/**
 * @brief Multi-modal delivery planning as a two-objective problem: total
 * cost and total kg CO2 of a plan, both minimised.
 *
 * Rail-dependent modes are only ever proposed for requests whose two
 * endpoints have rail access. A hub equal to an endpoint of its request
 * means a direct route.
 *
 * Holds references to the requests, hubs, geo service and rules; all must
 * outlive the problem.
 */
class DeliveryPlanning
{
public:
  using genome_t = Plan;

private:
  const std::vector<DeliveryRequest>& mRequests;
  const std::vector<std::string>& mHubs;
  const GeoService& mGeo;
  const CarbonRules& mRules;
  CostModel mCosts;
  PlanningConfig mConfig;

  std::vector<std::vector<Mode>> mPermittedModes;
  std::vector<std::vector<std::size_t>> mCandidateHubs;

public:
  DeliveryPlanning(const std::vector<DeliveryRequest>&,
                   const std::vector<std::string>&,
                   const GeoService&,
                   const CarbonRules&,
                   PlanningConfig = {});

  [[nodiscard]] auto create(evolution::Random&) const -> Plan;

  [[nodiscard]] auto evaluate(const Plan&) const -> evolution::Objectives<2>;

  /// Swaps the decisions between two distinct cut points.
  void crossover(Plan&, Plan&, evolution::Random&) const;

  void mutate(Plan&, evolution::Random&) const;

  [[nodiscard]] auto permitted_modes(std::size_t request) const
    -> const std::vector<Mode>&;

  /// Legs actually driven for request @p request under @p decision.
  [[nodiscard]] auto legs(std::size_t request, const Decision& decision) const
    -> std::vector<Leg>;

  [[nodiscard]] auto requests() const -> const std::vector<DeliveryRequest>&;

  [[nodiscard]] auto hubs() const -> const std::vector<std::string>&;
};

}

#endif
