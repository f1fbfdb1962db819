#include "delivery.hxx"
#include "errors.hxx"
#include <fmt/format.h>
#include <set>

namespace greenhaul {

void
validate(const DeliveryRequest& request, const GeoService& geo)
{
  for (const auto& location : { request.origin, request.destination }) {
    if (not geo.contains(location)) {
      throw InputError(fmt::format(
        "Request {}: unknown location <{}>", request.id, location));
    }
  }
  if (not(request.cargo_tonnes > 0.0)) {
    throw InputError(fmt::format("Request {}: cargo mass must be positive",
                                 request.id));
  }
  if (request.cargo_tonnes > MAX_CARGO_TONNES) {
    throw InputError(fmt::format("Request {}: cargo mass {} exceeds {} t",
                                 request.id,
                                 request.cargo_tonnes,
                                 MAX_CARGO_TONNES));
  }
  if (request.priority < 1 or request.priority > 3) {
    throw InputError(fmt::format("Request {}: priority {} outside 1..3",
                                 request.id,
                                 request.priority));
  }
}

void
validate(const std::vector<DeliveryRequest>& requests, const GeoService& geo)
{
  if (requests.empty()) {
    throw InputError("No delivery requests to plan");
  }

  std::set<std::int64_t> ids;
  for (const auto& request : requests) {
    validate(request, geo);
    if (not ids.insert(request.id).second) {
      throw InputError(fmt::format("Duplicate request id {}", request.id));
    }
  }
}

void
validate_hubs(const std::vector<std::string>& hubs, const GeoService& geo)
{
  for (const auto& hub : hubs) {
    if (not geo.contains(hub)) {
      throw InputError(fmt::format("Unknown hub <{}>", hub));
    }
  }
}

}
