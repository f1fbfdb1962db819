#ifndef GREENHAUL_PLAN
#define GREENHAUL_PLAN

#include "delivery.hxx"
#include "transport.hxx"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace greenhaul {

/// Mode and optional relay hub for one request; the hub indexes the hub list
/// of the run.
struct Decision
{
  Mode mode = Mode::TRUCK_LARGE;
  std::optional<std::size_t> hub;

  auto operator==(const Decision&) const -> bool = default;
};

/// One decision per request, in request order.
using Plan = std::vector<Decision>;

/// A decision spelled out against its request.
struct RoutedDecision
{
  std::int64_t request_id = 0;
  std::string origin;
  std::string destination;
  double cargo_tonnes = 0.0;
  Mode mode = Mode::TRUCK_LARGE;
  std::optional<std::string> hub;

  auto operator==(const RoutedDecision&) const -> bool = default;
};

[[nodiscard]] auto
decode(const Plan& plan,
       const std::vector<DeliveryRequest>& requests,
       const std::vector<std::string>& hubs) -> std::vector<RoutedDecision>;

/**
 * @brief Inverse of decode.
 *
 * @throws InputError when the decisions do not line up with @p requests or
 *         name a hub missing from @p hubs
 */
[[nodiscard]] auto
encode(const std::vector<RoutedDecision>& decisions,
       const std::vector<DeliveryRequest>& requests,
       const std::vector<std::string>& hubs) -> Plan;

}

#endif
