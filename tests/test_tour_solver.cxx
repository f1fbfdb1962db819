#include "carbon_rules.hxx"
#include "errors.hxx"
#include "fake_geo.hxx"
#include "tour_solver.hxx"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>

using namespace greenhaul;

namespace {

/// Four stops on a straight road, A at km 0, B at 3, C at 1 and D at 2.
auto
line() -> fixtures::FakeGeo
{
  fixtures::FakeGeo geo;
  const std::vector<std::pair<std::string, double>> sites{
    { "A", 0.0 }, { "B", 3.0 }, { "C", 1.0 }, { "D", 2.0 }
  };
  for (const auto& site : sites) {
    geo.add(site.first);
  }
  for (const auto& [lhs, lhsKm] : sites) {
    for (const auto& [rhs, rhsKm] : sites) {
      if (lhs < rhs) {
        geo.road(lhs, rhs, std::abs(lhsKm - rhsKm));
      }
    }
  }
  return geo;
}

class TourSolverTest : public ::testing::Test
{
protected:
  fixtures::FakeGeo mGeo = fixtures::algeria();
  TourSolver mSolver{ mGeo, TourConfig{ 30, 40, 0.15, 4, 3, 42 } };

  std::vector<std::string> mStops{ "Alger", "Oran", "Constantine", "Biskra" };
};

}

TEST(TourSolver, FindsLineOptimum)
{
  auto geo = line();
  TourSolver solver(geo);

  auto tour = solver.optimize(TourRequest{ { "A", "B", "C", "D" } });

  EXPECT_EQ(tour.order, (std::vector<std::string>{ "A", "C", "D", "B" }));
  EXPECT_DOUBLE_EQ(tour.total_distance_km, 3.0);
  EXPECT_DOUBLE_EQ(tour.original_distance_km, 6.0);
  EXPECT_DOUBLE_EQ(tour.improvement_percent, 50.0);

  ASSERT_EQ(tour.legs.size(), 3U);
  EXPECT_EQ(tour.legs[0].number, 1U);
  EXPECT_EQ(tour.legs[2].from, "D");
  EXPECT_EQ(tour.legs[2].to, "B");
}

TEST_F(TourSolverTest, NeverLongerThanGiven)
{
  auto tour = mSolver.optimize(TourRequest{ mStops });

  EXPECT_GE(tour.improvement_percent, 0.0);
  EXPECT_LE(tour.total_distance_km, tour.original_distance_km);
  EXPECT_EQ(tour.order.front(), "Alger");
  EXPECT_EQ(tour.order.size(), mStops.size());

  auto sorted = tour.order;
  std::sort(sorted.begin(), sorted.end());
  auto expected = mStops;
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(sorted, expected);
}

TEST_F(TourSolverTest, RoundTripReturnsToStart)
{
  TourRequest request{ mStops };
  request.round_trip = true;

  auto tour = mSolver.optimize(request);

  ASSERT_EQ(tour.order.size(), mStops.size() + 1);
  EXPECT_EQ(tour.order.front(), "Alger");
  EXPECT_EQ(tour.order.back(), "Alger");
  EXPECT_EQ(tour.legs.size(), mStops.size());
}

TEST_F(TourSolverTest, DepotOutsideStopsIsPrepended)
{
  TourRequest request{ { "Oran", "Constantine", "Alger" } };
  request.depot = "Biskra";

  auto tour = mSolver.optimize(request);

  ASSERT_EQ(tour.order.size(), 4U);
  EXPECT_EQ(tour.order.front(), "Biskra");
}

TEST_F(TourSolverTest, DepotInsideStopsMovesToFront)
{
  TourRequest request{ mStops };
  request.depot = "Constantine";

  auto tour = mSolver.optimize(request);

  ASSERT_EQ(tour.order.size(), mStops.size());
  EXPECT_EQ(tour.order.front(), "Constantine");
}

TEST_F(TourSolverTest, ExplicitEndStaysLast)
{
  TourRequest request{ mStops };
  request.end = "Oran";

  auto tour = mSolver.optimize(request);

  ASSERT_EQ(tour.order.size(), mStops.size());
  EXPECT_EQ(tour.order.front(), "Alger");
  EXPECT_EQ(tour.order.back(), "Oran");
}

TEST_F(TourSolverTest, EndAtStartClosesTour)
{
  TourRequest request{ mStops };
  request.end = "Alger";

  auto tour = mSolver.optimize(request);

  EXPECT_EQ(tour.order.back(), "Alger");
  EXPECT_EQ(tour.legs.size(), mStops.size());
}

TEST_F(TourSolverTest, DegenerateTours)
{
  auto single = mSolver.optimize(TourRequest{ { "Oran" } });
  EXPECT_EQ(single.order, (std::vector<std::string>{ "Oran" }));
  EXPECT_TRUE(single.legs.empty());
  EXPECT_DOUBLE_EQ(single.total_distance_km, 0.0);
  EXPECT_DOUBLE_EQ(single.improvement_percent, 0.0);

  auto pair = mSolver.optimize(TourRequest{ { "Oran", "Alger" } });
  EXPECT_EQ(pair.order, (std::vector<std::string>{ "Oran", "Alger" }));
  EXPECT_DOUBLE_EQ(pair.total_distance_km, 420.0);
}

TEST_F(TourSolverTest, RejectsInvalidStops)
{
  EXPECT_THROW(static_cast<void>(mSolver.optimize(TourRequest{})), InputError);
  EXPECT_THROW(
    static_cast<void>(mSolver.optimize(TourRequest{ { "Alger", "Alger" } })),
    InputError);
  EXPECT_THROW(
    static_cast<void>(mSolver.optimize(TourRequest{ { "Alger", "Ouargla" } })),
    InputError);

  TourRequest request{ mStops };
  request.depot = "Ouargla";
  EXPECT_THROW(static_cast<void>(mSolver.optimize(request)), InputError);

  // no road between Oran and In Guezzam
  EXPECT_THROW(static_cast<void>(mSolver.optimize(
                 TourRequest{ { "Oran", "In Guezzam" } })),
               InputError);
}

TEST_F(TourSolverTest, SeedMakesToursRepeatable)
{
  auto first = mSolver.optimize(TourRequest{ mStops });
  auto second = mSolver.optimize(TourRequest{ mStops });
  EXPECT_EQ(first.order, second.order);
}

TEST_F(TourSolverTest, AssessPicksLowestCarbonPerLeg)
{
  CarbonRules rules(mGeo);
  auto tour = mSolver.optimize(TourRequest{ mStops });

  auto assessment = assess_tour(tour, rules, 10.0, Cargo::FRAGILE);

  ASSERT_EQ(assessment.legs.size(), tour.legs.size());
  EXPECT_EQ(assessment.cargo, Cargo::FRAGILE);

  double total = 0.0;
  for (const auto& leg : assessment.legs) {
    ASSERT_EQ(leg.co2_by_mode.size(), MODES.size());
    for (const auto& [mode, co2] : leg.co2_by_mode) {
      EXPECT_LE(leg.co2_kg, co2);
    }
    EXPECT_DOUBLE_EQ(leg.co2_by_mode.at(leg.recommended_mode), leg.co2_kg);
    total += leg.co2_kg;
  }
  EXPECT_NEAR(assessment.total_co2_kg, total, 1e-9);
}
