#ifndef GREENHAUL_LOCATION_CATALOG
#define GREENHAUL_LOCATION_CATALOG

#include "geo_service.hxx"
#include <Poco/Logger.h>
#include <boost/graph/adjacency_list.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace greenhaul {

struct Location
{
  std::string name;
  double latitude = 0.0;
  double longitude = 0.0;
  std::uint64_t population = 0;
  Zone zone = Zone::NORTH;
  bool rail = false;
};

using RailLink = std::pair<std::string, std::string>;

using RailNetwork =
  boost::adjacency_list<boost::vecS,
                        boost::vecS,
                        boost::undirectedS,
                        boost::no_property,
                        boost::property<boost::edge_weight_t, double>>;

template<class G>
using VertexD = typename boost::graph_traits<G>::vertex_descriptor;

/// Great-circle distance in km between two coordinates in degrees.
[[nodiscard]] auto
great_circle(double fromLatitude,
             double fromLongitude,
             double toLatitude,
             double toLongitude) -> double;

/**
 * @brief In-memory geo service over a fixed set of locations.
 *
 * Road distances are great-circle distances. Rail distances are shortest
 * paths over the rail network, a graph whose vertices are the locations with
 * rail access and whose edges are the declared rail links weighted by their
 * great-circle length. Without declared links every pair of rail locations
 * is linked directly.
 *
 * All-pairs rail distances are computed once at construction, so every query
 * afterwards is a read-only lookup.
 */
class LocationCatalog : public GeoService
{
private:
  std::vector<Location> mLocations;
  std::map<std::string, std::size_t, std::less<>> mIndex;
  std::vector<std::string> mHubs;

  RailNetwork mRail;
  std::map<std::string, VertexD<RailNetwork>, std::less<>> mNamedVertexMap;
  std::vector<std::vector<double>> mRailDistances;

public:
  LocationCatalog(std::vector<Location>,
                  const std::optional<std::vector<RailLink>>&,
                  std::vector<std::string>);

  [[nodiscard]] static auto from_json(const nlohmann::json&) -> LocationCatalog;

  [[nodiscard]] static auto load(const std::filesystem::path&)
    -> LocationCatalog;

  [[nodiscard]] auto contains(std::string_view) const -> bool override;

  [[nodiscard]] auto distance(std::string_view, std::string_view) const
    -> std::optional<double> override;

  [[nodiscard]] auto rail_distance(std::string_view, std::string_view) const
    -> std::optional<double> override;

  [[nodiscard]] auto zone(std::string_view) const -> Zone override;

  [[nodiscard]] auto has_rail_access(std::string_view) const -> bool override;

  /// Throws InputError for unknown names.
  [[nodiscard]] auto location(std::string_view) const -> const Location&;

  [[nodiscard]] auto locations() const -> const std::vector<Location>&;

  [[nodiscard]] auto default_hubs() const -> const std::vector<std::string>&;

  [[nodiscard]] auto rail_network() const -> const RailNetwork&;

private:
  [[nodiscard]] auto find(std::string_view) const -> const Location*;

  void link(const Location&, const Location&);

  void compute_rail_distances();

  auto logger() const -> Poco::Logger&;
};

}

#endif
