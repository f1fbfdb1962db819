#include "sample_requests.hxx"
#include "errors.hxx"
#include <algorithm>
#include <cmath>
#include <random>

namespace greenhaul {

auto
generate_sample_requests(const LocationCatalog& catalog,
                         std::size_t count,
                         std::uint64_t seed) -> std::vector<DeliveryRequest>
{
  const auto& locations = catalog.locations();
  if (locations.size() < 2) {
    throw InputError("Sample requests need at least two locations");
  }

  std::vector<double> weights;
  weights.reserve(locations.size());
  for (const auto& location : locations) {
    weights.push_back(static_cast<double>(location.population));
  }
  if (std::all_of(weights.begin(), weights.end(), [](double weight) {
        return weight <= 0.0;
      })) {
    std::fill(weights.begin(), weights.end(), 1.0);
  }

  std::mt19937_64 rng(seed);
  std::discrete_distribution<std::size_t> origins(weights.begin(),
                                                  weights.end());
  std::uniform_int_distribution<std::size_t> others(0, locations.size() - 2);
  std::uniform_real_distribution<double> tonnes(2.0, 50.0);
  std::discrete_distribution<int> priorities({ 0.7, 0.2, 0.1 });
  std::uniform_int_distribution<std::size_t> cargos(0, CARGOS.size() - 1);

  std::vector<DeliveryRequest> requests;
  requests.reserve(count);

  for (std::size_t idx = 0; idx < count; ++idx) {
    const auto origin = origins(rng);
    auto destination = others(rng);
    if (destination >= origin) {
      ++destination;
    }

    requests.push_back(DeliveryRequest{
      static_cast<std::int64_t>(idx + 1),
      locations[origin].name,
      locations[destination].name,
      std::round(tonnes(rng) * 10.0) / 10.0,
      CARGOS[cargos(rng)],
      priorities(rng) + 1,
    });
  }

  return requests;
}

}
