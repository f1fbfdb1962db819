#ifndef GREENHAUL_SAMPLE_REQUESTS
#define GREENHAUL_SAMPLE_REQUESTS

#include "delivery.hxx"
#include "location_catalog.hxx"
#include <cstdint>
#include <vector>

namespace greenhaul {

/**
 * @brief Synthetic request batch for demonstrations and benchmarks.
 *
 * Origins are drawn proportionally to population, destinations uniformly
 * among the other locations. Masses are uniform in [2, 50] t rounded to
 * 0.1 t; priorities 1, 2 and 3 come with weights 0.7, 0.2 and 0.1. Ids run
 * from 1.
 *
 * @throws InputError when the catalog has fewer than two locations
 */
[[nodiscard]] auto
generate_sample_requests(const LocationCatalog& catalog,
                         std::size_t count,
                         std::uint64_t seed) -> std::vector<DeliveryRequest>;

}

#endif
