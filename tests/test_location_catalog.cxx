#include "errors.hxx"
#include "location_catalog.hxx"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace greenhaul;

namespace {

auto
catalog_json() -> nlohmann::json
{
  return nlohmann::json::parse(R"({
    "locations": [
      { "name": "Alger", "latitude": 36.7538, "longitude": 3.0588,
        "population": 3415811, "zone": "north", "rail": true },
      { "name": "Oran", "latitude": 35.6971, "longitude": -0.6308,
        "population": 1454078, "zone": "north", "rail": true },
      { "name": "Constantine", "latitude": 36.365, "longitude": 6.6147,
        "population": 938475, "zone": "north", "rail": true },
      { "name": "Tamanrasset", "latitude": 22.785, "longitude": 5.5228,
        "population": 92635, "zone": "south" }
    ],
    "rail_links": [ [ "Alger", "Oran" ], [ "Alger", "Constantine" ] ],
    "hubs": [ "Alger" ]
  })");
}

}

TEST(LocationCatalog, GreatCircleDistance)
{
  auto catalog = LocationCatalog::from_json(catalog_json());

  auto km = catalog.distance("Alger", "Oran");
  ASSERT_TRUE(km.has_value());
  EXPECT_GT(*km, 330.0);
  EXPECT_LT(*km, 370.0);
  EXPECT_DOUBLE_EQ(*km, *catalog.distance("Oran", "Alger"));
  EXPECT_DOUBLE_EQ(*catalog.distance("Oran", "Oran"), 0.0);

  EXPECT_FALSE(catalog.distance("Alger", "Ouargla").has_value());
}

TEST(LocationCatalog, RailFollowsShortestPath)
{
  auto catalog = LocationCatalog::from_json(catalog_json());

  auto direct = catalog.rail_distance("Alger", "Oran");
  ASSERT_TRUE(direct.has_value());
  EXPECT_DOUBLE_EQ(*direct, *catalog.distance("Alger", "Oran"));

  // Oran and Constantine only meet through Alger
  auto relayed = catalog.rail_distance("Oran", "Constantine");
  ASSERT_TRUE(relayed.has_value());
  EXPECT_NEAR(*relayed,
              *catalog.distance("Oran", "Alger") +
                *catalog.distance("Alger", "Constantine"),
              1e-6);
  EXPECT_GT(*relayed, *catalog.distance("Oran", "Constantine"));

  EXPECT_EQ(boost::num_vertices(catalog.rail_network()), 3U);
  EXPECT_EQ(boost::num_edges(catalog.rail_network()), 2U);
}

TEST(LocationCatalog, NoRailOffNetwork)
{
  auto catalog = LocationCatalog::from_json(catalog_json());

  EXPECT_FALSE(catalog.has_rail_access("Tamanrasset"));
  EXPECT_FALSE(catalog.rail_distance("Alger", "Tamanrasset").has_value());
  EXPECT_FALSE(catalog.rail_distance("Alger", "Ouargla").has_value());
}

TEST(LocationCatalog, ImplicitLinksJoinAllRailLocations)
{
  auto data = catalog_json();
  data.erase("rail_links");
  auto catalog = LocationCatalog::from_json(data);

  EXPECT_EQ(boost::num_edges(catalog.rail_network()), 3U);
  EXPECT_NEAR(*catalog.rail_distance("Oran", "Constantine"),
              *catalog.distance("Oran", "Constantine"),
              1e-6);
}

TEST(LocationCatalog, ZonesAndLookups)
{
  auto catalog = LocationCatalog::from_json(catalog_json());

  EXPECT_EQ(catalog.zone("Tamanrasset"), Zone::SOUTH);
  EXPECT_EQ(catalog.zone("Ouargla"), Zone::NORTH);
  EXPECT_EQ(catalog.location("Oran").population, 1454078U);
  EXPECT_EQ(catalog.locations().size(), 4U);
  EXPECT_EQ(catalog.default_hubs(), (std::vector<std::string>{ "Alger" }));
  EXPECT_THROW(static_cast<void>(catalog.location("Ouargla")), InputError);
}

TEST(LocationCatalog, RejectsMalformedCatalogs)
{
  EXPECT_THROW(
    static_cast<void>(LocationCatalog::from_json(nlohmann::json::object())),
    InputError);

  auto badZone = catalog_json();
  badZone["locations"][0]["zone"] = "coast";
  EXPECT_THROW(static_cast<void>(LocationCatalog::from_json(badZone)),
               InputError);

  auto duplicate = catalog_json();
  auto alger = duplicate["locations"][0];
  duplicate["locations"].push_back(alger);
  EXPECT_THROW(static_cast<void>(LocationCatalog::from_json(duplicate)),
               InputError);

  auto offNetwork = catalog_json();
  offNetwork["rail_links"].push_back(
    nlohmann::json::array({ "Alger", "Tamanrasset" }));
  EXPECT_THROW(static_cast<void>(LocationCatalog::from_json(offNetwork)),
               InputError);

  auto unknownHub = catalog_json();
  unknownHub["hubs"] = nlohmann::json::array({ "Ouargla" });
  EXPECT_THROW(static_cast<void>(LocationCatalog::from_json(unknownHub)),
               InputError);

  auto missingLatitude = catalog_json();
  missingLatitude["locations"][1].erase("latitude");
  EXPECT_THROW(static_cast<void>(LocationCatalog::from_json(missingLatitude)),
               InputError);
}

TEST(LocationCatalog, MissingFile)
{
  EXPECT_THROW(
    static_cast<void>(LocationCatalog::load("/nonexistent/catalog.json")),
    InputError);
}
