#ifndef GREENHAUL_TESTS_FAKE_GEO
#define GREENHAUL_TESTS_FAKE_GEO

#include "geo_service.hxx"
#include <map>
#include <set>
#include <string>
#include <utility>

namespace greenhaul::fixtures {

/// Geo service over hand-written distances; pairs are symmetric.
class FakeGeo : public GeoService
{
private:
  struct Site
  {
    Zone zone;
    bool rail;
  };

  std::map<std::string, Site, std::less<>> mSites;
  std::map<std::pair<std::string, std::string>, double> mDistances;
  std::set<std::pair<std::string, std::string>> mRailLinks;

  static auto key(std::string_view lhs, std::string_view rhs)
    -> std::pair<std::string, std::string>
  {
    return lhs < rhs ? std::pair{ std::string(lhs), std::string(rhs) }
                     : std::pair{ std::string(rhs), std::string(lhs) };
  }

public:
  auto add(std::string name, Zone zone = Zone::NORTH, bool rail = false)
    -> FakeGeo&
  {
    mSites[std::move(name)] = Site{ zone, rail };
    return *this;
  }

  auto road(std::string_view lhs, std::string_view rhs, double km) -> FakeGeo&
  {
    mDistances[key(lhs, rhs)] = km;
    return *this;
  }

  /// Rail connection over the road distance.
  auto rail(std::string_view lhs, std::string_view rhs) -> FakeGeo&
  {
    mRailLinks.insert(key(lhs, rhs));
    return *this;
  }

  [[nodiscard]] auto contains(std::string_view name) const -> bool override
  {
    return mSites.contains(name);
  }

  [[nodiscard]] auto distance(std::string_view from, std::string_view to) const
    -> std::optional<double> override
  {
    if (not contains(from) or not contains(to)) {
      return std::nullopt;
    }
    if (from == to) {
      return 0.0;
    }
    auto found = mDistances.find(key(from, to));
    if (found == mDistances.end()) {
      return std::nullopt;
    }
    return found->second;
  }

  [[nodiscard]] auto rail_distance(std::string_view from,
                                   std::string_view to) const
    -> std::optional<double> override
  {
    if (not has_rail_access(from) or not has_rail_access(to)) {
      return std::nullopt;
    }
    if (from != to and not mRailLinks.contains(key(from, to))) {
      return std::nullopt;
    }
    return distance(from, to);
  }

  [[nodiscard]] auto zone(std::string_view name) const -> Zone override
  {
    auto found = mSites.find(name);
    return found == mSites.end() ? Zone::NORTH : found->second.zone;
  }

  [[nodiscard]] auto has_rail_access(std::string_view name) const
    -> bool override
  {
    auto found = mSites.find(name);
    return found != mSites.end() and found->second.rail;
  }
};

/// Small network used across the suites.
///
/// Alger, Oran and Constantine are northern rail cities linked by rail;
/// Biskra (highlands) has rail access but no link; Tamanrasset and
/// In Guezzam are southern and off the network.
inline auto
algeria() -> FakeGeo
{
  FakeGeo geo;
  geo.add("Alger", Zone::NORTH, true)
    .add("Oran", Zone::NORTH, true)
    .add("Constantine", Zone::NORTH, true)
    .add("Biskra", Zone::HIGHLANDS, true)
    .add("Tamanrasset", Zone::SOUTH, false)
    .add("In Guezzam", Zone::SOUTH, false)
    .road("Alger", "Oran", 420.0)
    .road("Alger", "Constantine", 430.0)
    .road("Oran", "Constantine", 850.0)
    .road("Alger", "Biskra", 400.0)
    .road("Constantine", "Biskra", 230.0)
    .road("Oran", "Biskra", 760.0)
    .road("Alger", "Tamanrasset", 1900.0)
    .road("Biskra", "Tamanrasset", 1550.0)
    .road("Tamanrasset", "In Guezzam", 2000.0)
    .rail("Alger", "Oran")
    .rail("Alger", "Constantine")
    .rail("Oran", "Constantine");
  return geo;
}

}

#endif
