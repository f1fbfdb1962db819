#include "errors.hxx"
#include "sample_requests.hxx"
#include <cmath>
#include <gtest/gtest.h>

using namespace greenhaul;

namespace {

auto
catalog() -> LocationCatalog
{
  return LocationCatalog(
    {
      { "Alger", 36.7538, 3.0588, 3'415'811, Zone::NORTH, true },
      { "Oran", 35.6971, -0.6308, 1'454'078, Zone::NORTH, true },
      { "Biskra", 34.85, 5.7333, 258'514, Zone::HIGHLANDS, true },
      { "Djanet", 24.5546, 9.4849, 0, Zone::SOUTH, false },
    },
    std::nullopt,
    {});
}

}

TEST(SampleRequests, GeneratesValidBatch)
{
  auto locations = catalog();
  auto requests = generate_sample_requests(locations, 60, 42);

  ASSERT_EQ(requests.size(), 60U);
  for (std::size_t idx = 0; idx < requests.size(); ++idx) {
    const auto& request = requests[idx];
    EXPECT_EQ(request.id, static_cast<std::int64_t>(idx + 1));
    EXPECT_NE(request.origin, request.destination);
    EXPECT_GE(request.cargo_tonnes, 2.0);
    EXPECT_LE(request.cargo_tonnes, 50.0);
    EXPECT_NEAR(request.cargo_tonnes * 10.0,
                std::round(request.cargo_tonnes * 10.0),
                1e-9);
    EXPECT_GE(request.priority, 1);
    EXPECT_LE(request.priority, 3);
    // without population Djanet is never drawn as an origin
    EXPECT_NE(request.origin, "Djanet");
  }

  EXPECT_NO_THROW(validate(requests, locations));
}

TEST(SampleRequests, SeedDeterminesBatch)
{
  auto locations = catalog();
  auto first = generate_sample_requests(locations, 20, 5);
  auto second = generate_sample_requests(locations, 20, 5);

  ASSERT_EQ(first.size(), second.size());
  for (std::size_t idx = 0; idx < first.size(); ++idx) {
    EXPECT_EQ(first[idx].origin, second[idx].origin);
    EXPECT_EQ(first[idx].destination, second[idx].destination);
    EXPECT_DOUBLE_EQ(first[idx].cargo_tonnes, second[idx].cargo_tonnes);
    EXPECT_EQ(first[idx].priority, second[idx].priority);
  }
}

TEST(SampleRequests, NeedsTwoLocations)
{
  LocationCatalog lonely(
    { { "Alger", 36.7538, 3.0588, 1, Zone::NORTH, true } }, std::nullopt, {});

  EXPECT_THROW(static_cast<void>(generate_sample_requests(lonely, 3, 1)),
               InputError);
  EXPECT_TRUE(generate_sample_requests(catalog(), 0, 1).empty());
}
