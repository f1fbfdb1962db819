#include "location_catalog.hxx"
#include "errors.hxx"
#include <boost/graph/dijkstra_shortest_paths.hpp>
#include <cmath>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <numbers>

namespace greenhaul {

namespace {

constexpr double EARTH_RADIUS_KM = 6371.0;

auto
radians(double degrees) -> double
{
  return degrees * std::numbers::pi / 180.0;
}

auto
parse_location(const nlohmann::json& data) -> Location
{
  Location location;
  location.name = data.at("name").get<std::string>();
  location.latitude = data.at("latitude").get<double>();
  location.longitude = data.at("longitude").get<double>();
  location.population = data.value("population", std::uint64_t{ 0 });
  location.zone = parse_zone(data.value("zone", std::string{ "north" }));
  location.rail = data.value("rail", false);
  return location;
}

}

auto
great_circle(double fromLatitude,
             double fromLongitude,
             double toLatitude,
             double toLongitude) -> double
{
  const double dLat = radians(toLatitude - fromLatitude);
  const double dLon = radians(toLongitude - fromLongitude);

  const double chord =
    std::pow(std::sin(dLat / 2.0), 2) + std::cos(radians(fromLatitude)) *
                                          std::cos(radians(toLatitude)) *
                                          std::pow(std::sin(dLon / 2.0), 2);

  return 2.0 * EARTH_RADIUS_KM *
         std::atan2(std::sqrt(chord), std::sqrt(1.0 - chord));
}

LocationCatalog::LocationCatalog(
  std::vector<Location> locations,
  const std::optional<std::vector<RailLink>>& links,
  std::vector<std::string> hubs)
  : mLocations(std::move(locations))
  , mHubs(std::move(hubs))
{
  for (std::size_t idx = 0; idx < mLocations.size(); ++idx) {
    const auto& location = mLocations[idx];
    if (location.name.empty()) {
      throw InputError("Location without a name");
    }

    if (not mIndex.emplace(location.name, idx).second) {
      throw InputError(fmt::format("Duplicate location <{}>", location.name));
    }

    if (location.rail) {
      mNamedVertexMap[location.name] = boost::add_vertex(mRail);
    }
  }

  if (links) {
    for (const auto& [from, to] : *links) {
      const auto& source = this->location(from);
      const auto& target = this->location(to);
      if (not source.rail or not target.rail) {
        throw InputError(fmt::format(
          "Rail link <{}>-<{}> touches a location without rail access",
          from,
          to));
      }
      link(source, target);
    }
  } else {
    for (auto lhs = mLocations.begin(); lhs != mLocations.end(); ++lhs) {
      for (auto rhs = std::next(lhs); rhs != mLocations.end(); ++rhs) {
        if (lhs->rail and rhs->rail) {
          link(*lhs, *rhs);
        }
      }
    }
  }

  for (const auto& hub : mHubs) {
    if (not contains(hub)) {
      throw InputError(fmt::format("Unknown hub <{}>", hub));
    }
  }

  compute_rail_distances();

  logger().debug(fmt::format("Catalog of {} locations, {} on {} rail links",
                             mLocations.size(),
                             boost::num_vertices(mRail),
                             boost::num_edges(mRail)));
}

auto
LocationCatalog::from_json(const nlohmann::json& data) -> LocationCatalog
{
  try {
    std::vector<Location> locations;
    for (const auto& entry : data.at("locations")) {
      locations.push_back(parse_location(entry));
    }

    std::optional<std::vector<RailLink>> links;
    if (data.contains("rail_links")) {
      links.emplace();
      for (const auto& entry : data.at("rail_links")) {
        if (not entry.is_array() or entry.size() != 2) {
          throw InputError("Rail links are pairs of location names");
        }
        links->emplace_back(entry.at(0).get<std::string>(),
                            entry.at(1).get<std::string>());
      }
    }

    auto hubs = data.value("hubs", std::vector<std::string>{});

    return LocationCatalog(std::move(locations), links, std::move(hubs));
  } catch (const nlohmann::json::exception& exc) {
    throw InputError(fmt::format("Malformed location catalog: {}", exc.what()));
  }
}

auto
LocationCatalog::load(const std::filesystem::path& path) -> LocationCatalog
{
  std::ifstream stream(path);
  if (not stream) {
    throw InputError(
      fmt::format("Unable to open location catalog <{}>", path.string()));
  }

  nlohmann::json data;
  try {
    data = nlohmann::json::parse(stream);
  } catch (const nlohmann::json::parse_error& exc) {
    throw InputError(fmt::format(
      "Unable to parse location catalog <{}>: {}", path.string(), exc.what()));
  }
  return from_json(data);
}

auto
LocationCatalog::find(std::string_view name) const -> const Location*
{
  auto iter = mIndex.find(name);
  return iter == mIndex.end() ? nullptr : &mLocations[iter->second];
}

auto
LocationCatalog::contains(std::string_view name) const -> bool
{
  return mIndex.contains(name);
}

auto
LocationCatalog::distance(std::string_view from, std::string_view to) const
  -> std::optional<double>
{
  const auto* source = find(from);
  const auto* target = find(to);
  if (source == nullptr or target == nullptr) {
    return std::nullopt;
  }
  if (source == target) {
    return 0.0;
  }
  return great_circle(
    source->latitude, source->longitude, target->latitude, target->longitude);
}

auto
LocationCatalog::rail_distance(std::string_view from, std::string_view to) const
  -> std::optional<double>
{
  auto source = mNamedVertexMap.find(from);
  auto target = mNamedVertexMap.find(to);
  if (source == mNamedVertexMap.end() or target == mNamedVertexMap.end()) {
    return std::nullopt;
  }

  const double km = mRailDistances[source->second][target->second];
  if (km == std::numeric_limits<double>::infinity()) {
    return std::nullopt;
  }
  return km;
}

auto
LocationCatalog::zone(std::string_view name) const -> Zone
{
  const auto* location = find(name);
  return location == nullptr ? Zone::NORTH : location->zone;
}

auto
LocationCatalog::has_rail_access(std::string_view name) const -> bool
{
  const auto* location = find(name);
  return location != nullptr and location->rail;
}

auto
LocationCatalog::location(std::string_view name) const -> const Location&
{
  const auto* location = find(name);
  if (location == nullptr) {
    throw InputError(fmt::format("Unknown location <{}>", name));
  }
  return *location;
}

auto
LocationCatalog::locations() const -> const std::vector<Location>&
{
  return mLocations;
}

auto
LocationCatalog::default_hubs() const -> const std::vector<std::string>&
{
  return mHubs;
}

auto
LocationCatalog::rail_network() const -> const RailNetwork&
{
  return mRail;
}

void
LocationCatalog::link(const Location& source, const Location& target)
{
  if (source.name == target.name) {
    return;
  }

  const double km = great_circle(
    source.latitude, source.longitude, target.latitude, target.longitude);
  boost::add_edge(mNamedVertexMap.at(source.name),
                  mNamedVertexMap.at(target.name),
                  km,
                  mRail);
}

void
LocationCatalog::compute_rail_distances()
{
  const auto size = boost::num_vertices(mRail);
  mRailDistances.assign(
    size, std::vector<double>(size, std::numeric_limits<double>::infinity()));

  for (VertexD<RailNetwork> source = 0; source < size; ++source) {
    auto& distances = mRailDistances[source];
    boost::dijkstra_shortest_paths(
      mRail,
      source,
      boost::distance_map(
        boost::make_iterator_property_map(
          distances.begin(), boost::get(boost::vertex_index, mRail)))
        .distance_inf(std::numeric_limits<double>::infinity()));
  }
}

auto
LocationCatalog::logger() const -> Poco::Logger&
{
  return Poco::Logger::get("location-catalog");
}

}
