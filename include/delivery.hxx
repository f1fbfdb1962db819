#ifndef GREENHAUL_DELIVERY
#define GREENHAUL_DELIVERY

#include "geo_service.hxx"
#include "transport.hxx"
#include <cstdint>
#include <string>
#include <vector>

namespace greenhaul {

struct DeliveryRequest
{
  std::int64_t id = 0;
  std::string origin;
  std::string destination;
  double cargo_tonnes = 0.0;
  Cargo cargo = Cargo::GENERAL;
  // 1 normal, 2 urgent, 3 very urgent
  int priority = 1;
};

/// Throws InputError unless @p request can be planned against @p geo.
void
validate(const DeliveryRequest& request, const GeoService& geo);

/// Validates every request and rejects an empty batch or duplicate ids.
void
validate(const std::vector<DeliveryRequest>& requests, const GeoService& geo);

/// Throws InputError for hubs @p geo does not know.
void
validate_hubs(const std::vector<std::string>& hubs, const GeoService& geo);

}

#endif
