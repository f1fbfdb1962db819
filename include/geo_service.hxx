#ifndef GREENHAUL_GEO_SERVICE
#define GREENHAUL_GEO_SERVICE

#include "transport.hxx"
#include <optional>
#include <string_view>

namespace greenhaul {

/**
 * @brief Geographic reference data the planners consult.
 *
 * Implementations are queried concurrently during parallel evaluation and
 * must be safe for concurrent const access.
 */
class GeoService
{
public:
  virtual ~GeoService() = default;

  [[nodiscard]] virtual auto contains(std::string_view location) const
    -> bool = 0;

  /// Road distance in km; empty when either location is unknown.
  [[nodiscard]] virtual auto distance(std::string_view from,
                                      std::string_view to) const
    -> std::optional<double> = 0;

  /// Rail distance in km; empty when the rail network does not connect them.
  [[nodiscard]] virtual auto rail_distance(std::string_view from,
                                           std::string_view to) const
    -> std::optional<double> = 0;

  /// Climatic zone; unknown locations fall in Zone::NORTH.
  [[nodiscard]] virtual auto zone(std::string_view location) const
    -> Zone = 0;

  [[nodiscard]] virtual auto has_rail_access(std::string_view location) const
    -> bool = 0;
};

}

#endif
