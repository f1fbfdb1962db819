#include "fake_geo.hxx"
#include "serialization.hxx"
#include <gtest/gtest.h>

using namespace greenhaul;

TEST(Serialization, EnumerationsUseNames)
{
  EXPECT_EQ(nlohmann::json(Mode::TRUCK_MEDIUM), "truck_medium");
  EXPECT_EQ(nlohmann::json(Zone::HIGHLANDS), "highlands");
  EXPECT_EQ(nlohmann::json(Cargo::REFRIGERATED), "refrigerated");

  EXPECT_EQ(nlohmann::json("multimodal").get<Mode>(), Mode::MULTIMODAL);
  EXPECT_EQ(parse_cargo("hazardous"), Cargo::HAZARDOUS);
}

TEST(Serialization, UnknownNamesAreInputErrors)
{
  EXPECT_THROW(static_cast<void>(parse<Mode>("plane", "transport mode")),
               InputError);
  EXPECT_THROW(static_cast<void>(parse_zone("coast")), InputError);
  EXPECT_THROW(static_cast<void>(parse<Cargo>(42, "cargo type")), InputError);
}

TEST(Serialization, RequestDefaults)
{
  auto request = parse<DeliveryRequest>(
    nlohmann::json{
      { "id", 7 }, { "origin", "Alger" }, { "destination", "Oran" },
      { "cargo_tonnes", 12.5 } },
    "delivery request");

  EXPECT_EQ(request.id, 7);
  EXPECT_EQ(request.cargo, Cargo::GENERAL);
  EXPECT_EQ(request.priority, 1);

  nlohmann::json data = request;
  EXPECT_EQ(data.at("cargo_type"), "general");
  EXPECT_EQ(data.at("destination"), "Oran");

  EXPECT_THROW(static_cast<void>(parse<DeliveryRequest>(
                 nlohmann::json{ { "id", 7 } }, "delivery request")),
               InputError);
}

TEST(Serialization, TransportContextCapacityFollowsMode)
{
  auto context = parse<TransportContext>(
    nlohmann::json{ { "origin", "Alger" },
                    { "destination", "Oran" },
                    { "transport_mode", "truck_small" },
                    { "cargo_tonnes", 2.0 },
                    { "return_trip", true } },
    "transport context");

  EXPECT_EQ(context.mode, Mode::TRUCK_SMALL);
  EXPECT_DOUBLE_EQ(context.vehicle_capacity, typical_capacity(Mode::TRUCK_SMALL));
  EXPECT_TRUE(context.return_trip);
  EXPECT_EQ(context.cargo, Cargo::GENERAL);
}

TEST(Serialization, TourRequestKeys)
{
  auto request = parse<TourRequest>(
    nlohmann::json{ { "stops", { "Oran", "Constantine" } },
                    { "depot", "Alger" },
                    { "end", nullptr },
                    { "return_to_depot", true } },
    "tour request");

  EXPECT_EQ(request.stops.size(), 2U);
  EXPECT_EQ(request.depot, "Alger");
  EXPECT_FALSE(request.end.has_value());
  EXPECT_TRUE(request.round_trip);
}

TEST(Serialization, FootprintKeys)
{
  auto geo = fixtures::algeria();
  CarbonRules rules(geo);

  nlohmann::json data = rules.evaluate(
    TransportContext{ "Alger", "Biskra", Mode::TRAIN, 10.0, 1000.0 });

  for (const auto* key : { "origin",
                           "destination",
                           "transport_mode",
                           "rail_fallback",
                           "distance_km",
                           "cargo_tonnes",
                           "emission_factor",
                           "total_co2_kg",
                           "efficiency_score",
                           "best_case_co2_kg",
                           "worst_case_co2_kg",
                           "applied_rules" }) {
    EXPECT_TRUE(data.contains(key)) << key;
  }
  EXPECT_EQ(data.at("transport_mode"), "truck_large");
  EXPECT_EQ(data.at("rail_fallback"), true);
  EXPECT_TRUE(data.at("applied_rules").is_array());
}

TEST(Serialization, DecisionWithoutHubIsNull)
{
  nlohmann::json direct =
    RoutedDecision{ 3, "Alger", "Oran", 4.0, Mode::TRAIN, std::nullopt };
  EXPECT_TRUE(direct.at("via_hub").is_null());
  EXPECT_EQ(direct.at("transport_mode"), "train");

  nlohmann::json relayed =
    RoutedDecision{ 3, "Alger", "Oran", 4.0, Mode::TRAIN, "Constantine" };
  EXPECT_EQ(relayed.at("via_hub"), "Constantine");
}

TEST(Serialization, OptimizationResultCarriesStatistics)
{
  OptimizationResult result;
  result.pareto_front.push_back(
    Solution{ 10.0, 2.0, { { 1, "Alger", "Oran", 4.0, Mode::TRAIN, std::nullopt } }, 0.0 });
  result.recommended = result.pareto_front.front();
  result.history.push_back({ 0, { 10.0, 2.0 }, { 12.0, 3.0 } });
  result.generations = 1;

  nlohmann::json data = result;

  ASSERT_EQ(data.at("statistics").size(), 1U);
  EXPECT_EQ(data.at("statistics")[0].at("min_cost"), 10.0);
  EXPECT_EQ(data.at("statistics")[0].at("avg_co2_kg"), 3.0);
  EXPECT_EQ(data.at("recommended").at("total_cost"), 10.0);
  EXPECT_EQ(data.at("analysis").at("direct_routes"), 1);
  EXPECT_EQ(data.at("analysis").at("modes").at("train").at("requests"), 1);
}
