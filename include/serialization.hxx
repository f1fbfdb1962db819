#ifndef GREENHAUL_SERIALIZATION
#define GREENHAUL_SERIALIZATION

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#ifndef JSON_HAS_RANGES
#define JSON_HAS_RANGES 1
#endif

#include "carbon_rules.hxx"
#include "decision_support.hxx"
#include "delivery.hxx"
#include "errors.hxx"
#include "logistics_optimizer.hxx"
#include "plan.hxx"
#include "tour_solver.hxx"
#include "transport.hxx"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <string_view>

namespace greenhaul {

// Enumerations travel as their lower-case names.

void
to_json(nlohmann::json&, Mode);

void
from_json(const nlohmann::json&, Mode&);

void
to_json(nlohmann::json&, Zone);

void
from_json(const nlohmann::json&, Zone&);

void
to_json(nlohmann::json&, Cargo);

void
from_json(const nlohmann::json&, Cargo&);

// Requests

void
to_json(nlohmann::json&, const DeliveryRequest&);

void
from_json(const nlohmann::json&, DeliveryRequest&);

void
to_json(nlohmann::json&, const TransportContext&);

/// A missing vehicle capacity defaults to the typical capacity of the mode.
void
from_json(const nlohmann::json&, TransportContext&);

void
from_json(const nlohmann::json&, TourRequest&);

// Results

void
to_json(nlohmann::json&, const Footprint&);

void
to_json(nlohmann::json&, const ModeComparison&);

void
to_json(nlohmann::json&, const RouteSegment&);

void
to_json(nlohmann::json&, const RouteFootprint&);

void
to_json(nlohmann::json&, const RoutedDecision&);

void
to_json(nlohmann::json&, const Solution&);

void
to_json(nlohmann::json&, const SolutionAnalysis&);

void
to_json(nlohmann::json&, const OptimizationResult&);

void
to_json(nlohmann::json&, const CurvePoint&);

void
to_json(nlohmann::json&, const TourLeg&);

void
to_json(nlohmann::json&, const TourResult&);

void
to_json(nlohmann::json&, const LegAssessment&);

void
to_json(nlohmann::json&, const TourAssessment&);

/**
 * @brief Converts @p data to @p T, reporting malformed input as InputError.
 *
 * @param what names the document in the error message
 */
template<typename T>
auto
parse(const nlohmann::json& data, std::string_view what) -> T
{
  try {
    return data.get<T>();
  } catch (const nlohmann::json::exception& exc) {
    throw InputError(fmt::format("Malformed {}: {}", what, exc.what()));
  }
}

}

#endif
