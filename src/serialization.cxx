#include "serialization.hxx"
#include <algorithm>

namespace greenhaul {

namespace {

template<typename ValueT>
auto
by_mode(const std::map<Mode, ValueT>& values) -> nlohmann::json
{
  nlohmann::json data = nlohmann::json::object();
  for (const auto& [mode, value] : values) {
    data[std::string(name(mode))] = value;
  }
  return data;
}

template<typename ValueT>
auto
optional_value(const std::optional<ValueT>& value) -> nlohmann::json
{
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}

void
to_json(nlohmann::json& data, Mode mode)
{
  data = std::string(name(mode));
}

void
from_json(const nlohmann::json& data, Mode& mode)
{
  mode = parse_mode(data.get<std::string>());
}

void
to_json(nlohmann::json& data, Zone zone)
{
  data = std::string(name(zone));
}

void
from_json(const nlohmann::json& data, Zone& zone)
{
  zone = parse_zone(data.get<std::string>());
}

void
to_json(nlohmann::json& data, Cargo cargo)
{
  data = std::string(name(cargo));
}

void
from_json(const nlohmann::json& data, Cargo& cargo)
{
  cargo = parse_cargo(data.get<std::string>());
}

void
to_json(nlohmann::json& data, const DeliveryRequest& request)
{
  data = nlohmann::json{ { "id", request.id },
                         { "origin", request.origin },
                         { "destination", request.destination },
                         { "cargo_tonnes", request.cargo_tonnes },
                         { "cargo_type", request.cargo },
                         { "priority", request.priority } };
}

void
from_json(const nlohmann::json& data, DeliveryRequest& request)
{
  data.at("id").get_to(request.id);
  data.at("origin").get_to(request.origin);
  data.at("destination").get_to(request.destination);
  data.at("cargo_tonnes").get_to(request.cargo_tonnes);
  request.cargo = data.value("cargo_type", Cargo::GENERAL);
  request.priority = data.value("priority", 1);
}

void
to_json(nlohmann::json& data, const TransportContext& context)
{
  data = nlohmann::json{ { "origin", context.origin },
                         { "destination", context.destination },
                         { "transport_mode", context.mode },
                         { "cargo_tonnes", context.cargo_tonnes },
                         { "vehicle_capacity", context.vehicle_capacity },
                         { "cargo_type", context.cargo },
                         { "return_trip", context.return_trip } };
}

void
from_json(const nlohmann::json& data, TransportContext& context)
{
  data.at("origin").get_to(context.origin);
  data.at("destination").get_to(context.destination);
  data.at("transport_mode").get_to(context.mode);
  data.at("cargo_tonnes").get_to(context.cargo_tonnes);
  context.vehicle_capacity =
    data.value("vehicle_capacity", typical_capacity(context.mode));
  context.cargo = data.value("cargo_type", Cargo::GENERAL);
  context.return_trip = data.value("return_trip", false);
}

void
from_json(const nlohmann::json& data, TourRequest& request)
{
  data.at("stops").get_to(request.stops);

  request.depot.reset();
  if (data.contains("depot") and not data.at("depot").is_null()) {
    request.depot = data.at("depot").get<std::string>();
  }

  request.end.reset();
  if (data.contains("end") and not data.at("end").is_null()) {
    request.end = data.at("end").get<std::string>();
  }

  request.round_trip = data.value("return_to_depot", false);
}

void
to_json(nlohmann::json& data, const Footprint& footprint)
{
  data = nlohmann::json{ { "origin", footprint.origin },
                         { "destination", footprint.destination },
                         { "transport_mode", footprint.mode },
                         { "rail_fallback", footprint.fallback },
                         { "distance_km", footprint.distance_km },
                         { "cargo_tonnes", footprint.cargo_tonnes },
                         { "emission_factor", footprint.emission_factor },
                         { "total_co2_kg", footprint.total_co2_kg },
                         { "efficiency_score", footprint.efficiency_score },
                         { "best_case_co2_kg", footprint.best_case_co2_kg },
                         { "worst_case_co2_kg", footprint.worst_case_co2_kg },
                         { "applied_rules", footprint.rules } };
}

void
to_json(nlohmann::json& data, const ModeComparison& comparison)
{
  nlohmann::json modes = nlohmann::json::object();
  for (const auto& [mode, entry] : comparison.modes) {
    modes[std::string(name(mode))] =
      nlohmann::json{ { "footprint", entry.footprint },
                      { "vehicles", entry.vehicles },
                      { "total_co2_kg", entry.total_co2_kg } };
  }

  data = nlohmann::json{ { "origin", comparison.origin },
                         { "destination", comparison.destination },
                         { "cargo_tonnes", comparison.cargo_tonnes },
                         { "cargo_type", comparison.cargo },
                         { "modes", std::move(modes) },
                         { "best_mode", comparison.best_mode },
                         { "worst_mode", comparison.worst_mode },
                         { "savings_kg", comparison.savings_kg },
                         { "savings_percent", comparison.savings_percent } };
}

void
to_json(nlohmann::json& data, const RouteSegment& segment)
{
  data = nlohmann::json{ { "from", segment.from },
                         { "to", segment.to },
                         { "distance_km", segment.distance_km },
                         { "co2_kg", segment.co2_kg } };
}

void
to_json(nlohmann::json& data, const RouteFootprint& route)
{
  data = nlohmann::json{ { "route", route.route },
                         { "transport_mode", route.mode },
                         { "cargo_tonnes", route.cargo_tonnes },
                         { "segments", route.segments },
                         { "total_distance_km", route.total_distance_km },
                         { "total_co2_kg", route.total_co2_kg },
                         { "co2_per_km", route.co2_per_km } };
}

void
to_json(nlohmann::json& data, const RoutedDecision& decision)
{
  data = nlohmann::json{ { "request_id", decision.request_id },
                         { "origin", decision.origin },
                         { "destination", decision.destination },
                         { "cargo_tonnes", decision.cargo_tonnes },
                         { "transport_mode", decision.mode },
                         { "via_hub", optional_value(decision.hub) } };
}

void
to_json(nlohmann::json& data, const Solution& solution)
{
  data = nlohmann::json{ { "total_cost", solution.total_cost },
                         { "total_co2_kg", solution.total_co2_kg },
                         { "decisions", solution.decisions },
                         { "weighted_score",
                           optional_value(solution.weighted_score) } };
}

void
to_json(nlohmann::json& data, const SolutionAnalysis& analysis)
{
  nlohmann::json modes = nlohmann::json::object();
  for (const auto& [mode, usage] : analysis.modes) {
    modes[std::string(name(mode))] =
      nlohmann::json{ { "requests", usage.requests },
                      { "cargo_tonnes", usage.cargo_tonnes } };
  }

  data = nlohmann::json{ { "modes", std::move(modes) },
                         { "hubs", analysis.hubs },
                         { "direct_routes", analysis.direct_routes },
                         { "hub_routes", analysis.hub_routes } };
}

void
to_json(nlohmann::json& data, const OptimizationResult& result)
{
  nlohmann::json history = nlohmann::json::array();
  for (const auto& stats : result.history) {
    history.push_back({ { "generation", stats.generation },
                        { "min_cost", stats.minimum[0] },
                        { "min_co2_kg", stats.minimum[1] },
                        { "avg_cost", stats.mean[0] },
                        { "avg_co2_kg", stats.mean[1] } });
  }

  data = nlohmann::json{ { "pareto_front", result.pareto_front },
                         { "recommended", optional_value(result.recommended) },
                         { "alpha", result.alpha },
                         { "statistics", std::move(history) },
                         { "population_size", result.population_size },
                         { "generations", result.generations },
                         { "cancelled", result.cancelled } };

  if (result.recommended) {
    data["analysis"] = analyse(*result.recommended);
  }
}

void
to_json(nlohmann::json& data, const CurvePoint& point)
{
  data = nlohmann::json{ { "alpha", point.alpha },
                         { "total_cost", point.total_cost },
                         { "total_co2_kg", point.total_co2_kg } };
}

void
to_json(nlohmann::json& data, const TourLeg& leg)
{
  data = nlohmann::json{ { "leg", leg.number },
                         { "from", leg.from },
                         { "to", leg.to },
                         { "distance_km", leg.distance_km } };
}

void
to_json(nlohmann::json& data, const TourResult& tour)
{
  data = nlohmann::json{ { "order", tour.order },
                         { "legs", tour.legs },
                         { "total_distance_km", tour.total_distance_km },
                         { "original_distance_km", tour.original_distance_km },
                         { "improvement_percent", tour.improvement_percent } };
}

void
to_json(nlohmann::json& data, const LegAssessment& assessment)
{
  data = assessment.leg;
  data["recommended_mode"] = assessment.recommended_mode;
  data["co2_kg"] = assessment.co2_kg;
  data["co2_by_mode"] = by_mode(assessment.co2_by_mode);
}

void
to_json(nlohmann::json& data, const TourAssessment& assessment)
{
  data = nlohmann::json{ { "tour", assessment.tour },
                         { "cargo_tonnes", assessment.cargo_tonnes },
                         { "cargo_type", assessment.cargo },
                         { "legs", assessment.legs },
                         { "total_co2_kg", assessment.total_co2_kg } };
}

}
