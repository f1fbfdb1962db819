#include "fake_geo.hxx"
#include "settings.hxx"
#include <Poco/AutoPtr.h>
#include <Poco/Util/MapConfiguration.h>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>

using namespace greenhaul;

namespace {

class SettingsTest : public ::testing::Test
{
protected:
  Poco::AutoPtr<Poco::Util::MapConfiguration> mConfig{
    new Poco::Util::MapConfiguration
  };
};

auto
logger() -> Poco::Logger&
{
  return Poco::Logger::get("settings-test");
}

}

TEST_F(SettingsTest, OptimizerDefaults)
{
  auto settings = optimizer_config(*mConfig, nlohmann::json::object());

  EXPECT_EQ(settings.evolution.population_size, 100U);
  EXPECT_EQ(settings.evolution.generations, 50U);
  EXPECT_DOUBLE_EQ(settings.evolution.crossover_probability, 0.8);
  EXPECT_DOUBLE_EQ(settings.evolution.mutation_probability, 0.2);
  EXPECT_FALSE(settings.evolution.parallel);
  EXPECT_DOUBLE_EQ(settings.planning.gene_mutation_probability, 0.1);
  EXPECT_DOUBLE_EQ(settings.planning.hub_probability, 0.3);
  EXPECT_EQ(settings.seed, 42U);
}

TEST_F(SettingsTest, RequestOverridesConfiguration)
{
  mConfig->setUInt("optimizer.population_size", 40);
  mConfig->setUInt("optimizer.generations", 10);
  mConfig->setString("optimizer.seed", "7");
  mConfig->setDouble("optimizer.hub_probability", 0.5);

  auto configured = optimizer_config(*mConfig, nlohmann::json::object());
  EXPECT_EQ(configured.evolution.population_size, 40U);
  EXPECT_EQ(configured.evolution.generations, 10U);
  EXPECT_EQ(configured.seed, 7U);
  EXPECT_DOUBLE_EQ(configured.planning.hub_probability, 0.5);

  auto request = nlohmann::json::parse(R"({
    "population_size": 16, "generations": 3, "seed": 99, "parallel": true
  })");
  auto overridden = optimizer_config(*mConfig, request);
  EXPECT_EQ(overridden.evolution.population_size, 16U);
  EXPECT_EQ(overridden.evolution.generations, 3U);
  EXPECT_EQ(overridden.seed, 99U);
  EXPECT_TRUE(overridden.evolution.parallel);
  EXPECT_DOUBLE_EQ(overridden.planning.hub_probability, 0.5);

  // null leaves the configured value in place
  auto nulls = optimizer_config(
    *mConfig, nlohmann::json{ { "generations", nullptr } });
  EXPECT_EQ(nulls.evolution.generations, 10U);
}

TEST_F(SettingsTest, NegativeRunSettingsAreInputErrors)
{
  for (const auto* key : { "population_size", "generations", "seed" }) {
    auto request = nlohmann::json{ { key, -1 } };
    EXPECT_THROW(static_cast<void>(optimizer_config(*mConfig, request)),
                 InputError)
      << key;
    EXPECT_THROW(static_cast<void>(tour_config(*mConfig, request)), InputError)
      << key;
  }

  EXPECT_THROW(static_cast<void>(optimizer_config(
                 *mConfig, nlohmann::json::parse(R"({"generations": 2.5})"))),
               InputError);
  EXPECT_THROW(
    static_cast<void>(optimizer_config(
      *mConfig, nlohmann::json::parse(R"({"population_size": "many"})"))),
    InputError);
}

TEST_F(SettingsTest, TourOverrides)
{
  mConfig->setUInt("tour.elite_size", 4);
  mConfig->setUInt("tour.tournament_size", 5);

  auto settings = tour_config(
    *mConfig,
    nlohmann::json::parse(R"({"population_size": 30, "generations": 0})"));

  EXPECT_EQ(settings.population_size, 30U);
  EXPECT_EQ(settings.generations, 0U);
  EXPECT_EQ(settings.elite_size, 4U);
  EXPECT_EQ(settings.tournament_size, 5U);
  EXPECT_DOUBLE_EQ(settings.mutation_rate, 0.15);
  EXPECT_EQ(settings.seed, 42U);
}

TEST(CountSetting, HonoursMinimum)
{
  auto request = nlohmann::json::parse(R"({"count": 0, "steps": 4})");

  EXPECT_EQ(count_setting(request, "steps", 5, 1), 4U);
  EXPECT_EQ(count_setting(request, "missing", 20, 1), 20U);
  EXPECT_EQ(count_setting(nlohmann::json::array(), "count", 20, 1), 20U);
  EXPECT_THROW(static_cast<void>(count_setting(request, "count", 20, 1)),
               InputError);
  EXPECT_THROW(static_cast<void>(count_setting(
                 nlohmann::json{ { "count", -1 } }, "count", 20, 1)),
               InputError);
}

TEST_F(SettingsTest, ExtremeLocationsAreTokenised)
{
  auto geo = fixtures::algeria();

  EXPECT_EQ(carbon_rules(geo, *mConfig).extreme_locations(),
            CarbonRules::default_extreme_locations());

  mConfig->setString("rules.extreme_locations", " Oran , ,Biskra,");
  auto rules = carbon_rules(geo, *mConfig);
  EXPECT_EQ(rules.extreme_locations(),
            (std::set<std::string, std::less<>>{ "Biskra", "Oran" }));

  mConfig->setString("rules.extreme_locations", "");
  EXPECT_TRUE(carbon_rules(geo, *mConfig).extreme_locations().empty());
}

TEST(Guarded, MapsFailuresToExitCodes)
{
  EXPECT_EQ(guarded(logger(), [] {}), Poco::Util::Application::EXIT_OK);

  EXPECT_EQ(guarded(logger(), [] { throw InputError("unknown location"); }),
            Poco::Util::Application::EXIT_DATAERR);
  EXPECT_EQ(guarded(logger(),
                    [] { static_cast<void>(nlohmann::json::parse("{")); }),
            Poco::Util::Application::EXIT_DATAERR);
  EXPECT_EQ(guarded(logger(), [] { throw std::runtime_error("disk full"); }),
            Poco::Util::Application::EXIT_SOFTWARE);
}

TEST_F(SettingsTest, NegativeGenerationsEndAsDataError)
{
  auto request = nlohmann::json::parse(R"({"generations": -1})");

  EXPECT_EQ(guarded(logger(),
                    [&] {
                      static_cast<void>(optimizer_config(*mConfig, request));
                    }),
            Poco::Util::Application::EXIT_DATAERR);
}
