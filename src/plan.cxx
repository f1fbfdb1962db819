#include "plan.hxx"
#include "enumerate.hxx"
#include "errors.hxx"
#include <algorithm>
#include <fmt/format.h>

namespace greenhaul {

auto
decode(const Plan& plan,
       const std::vector<DeliveryRequest>& requests,
       const std::vector<std::string>& hubs) -> std::vector<RoutedDecision>
{
  if (plan.size() != requests.size()) {
    throw InputError(fmt::format("Plan of {} decisions for {} requests",
                                 plan.size(),
                                 requests.size()));
  }

  std::vector<RoutedDecision> decisions;
  decisions.reserve(plan.size());

  for (auto [idx, decision] : enumerate(plan)) {
    const auto& request = requests[idx];

    RoutedDecision routed{ request.id,
                           request.origin,
                           request.destination,
                           request.cargo_tonnes,
                           decision->mode,
                           std::nullopt };
    if (decision->hub) {
      if (*decision->hub >= hubs.size()) {
        throw InputError(fmt::format("Request {}: hub index {} out of range",
                                     request.id,
                                     *decision->hub));
      }
      routed.hub = hubs[*decision->hub];
    }
    decisions.push_back(std::move(routed));
  }
  return decisions;
}

auto
encode(const std::vector<RoutedDecision>& decisions,
       const std::vector<DeliveryRequest>& requests,
       const std::vector<std::string>& hubs) -> Plan
{
  if (decisions.size() != requests.size()) {
    throw InputError(fmt::format("{} decisions for {} requests",
                                 decisions.size(),
                                 requests.size()));
  }

  Plan plan;
  plan.reserve(decisions.size());

  for (auto [idx, routed] : enumerate(decisions)) {
    if (routed->request_id != requests[idx].id) {
      throw InputError(fmt::format("Decision for request {} where {} expected",
                                   routed->request_id,
                                   requests[idx].id));
    }

    Decision decision{ routed->mode, std::nullopt };
    if (routed->hub) {
      auto found = std::find(hubs.begin(), hubs.end(), *routed->hub);
      if (found == hubs.end()) {
        throw InputError(fmt::format("Unknown hub <{}>", *routed->hub));
      }
      decision.hub = static_cast<std::size_t>(found - hubs.begin());
    }
    plan.push_back(decision);
  }
  return plan;
}

}
