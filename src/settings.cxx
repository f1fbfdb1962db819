#include "settings.hxx"
#include <Poco/StringTokenizer.h>
#include <set>

namespace greenhaul {

auto
count_setting(const nlohmann::json& request,
              const std::string& key,
              std::uint64_t fallback,
              std::uint64_t minimum) -> std::uint64_t
{
  if (not request.is_object()) {
    return fallback;
  }
  auto found = request.find(key);
  if (found == request.end() or found->is_null()) {
    return fallback;
  }

  if (not found->is_number_integer()) {
    throw InputError(
      fmt::format("<{}> must be a whole number, got {}", key, found->dump()));
  }

  std::uint64_t value = 0;
  if (found->is_number_unsigned()) {
    value = found->get<std::uint64_t>();
  } else {
    auto signedValue = found->get<std::int64_t>();
    if (signedValue < 0) {
      throw InputError(
        fmt::format("<{}> must not be negative, got {}", key, signedValue));
    }
    value = static_cast<std::uint64_t>(signedValue);
  }

  if (value < minimum) {
    throw InputError(
      fmt::format("<{}> must be at least {}, got {}", key, minimum, value));
  }
  return value;
}

auto
optimizer_config(const Poco::Util::AbstractConfiguration& config,
                 const nlohmann::json& request) -> OptimizerConfig
{
  OptimizerConfig settings;

  auto& evolution = settings.evolution;
  evolution.population_size = config.getUInt("optimizer.population_size", 100);
  evolution.generations = config.getUInt("optimizer.generations", 50);
  evolution.crossover_probability =
    config.getDouble("optimizer.crossover_probability", 0.8);
  evolution.mutation_probability =
    config.getDouble("optimizer.mutation_probability", 0.2);
  evolution.parallel = config.getBool("optimizer.parallel", false);

  settings.planning.gene_mutation_probability =
    config.getDouble("optimizer.gene_mutation_probability", 0.1);
  settings.planning.hub_probability =
    config.getDouble("optimizer.hub_probability", 0.3);
  settings.seed = config.getUInt64("optimizer.seed", 42);

  evolution.population_size =
    count_setting(request, "population_size", evolution.population_size);
  evolution.generations =
    count_setting(request, "generations", evolution.generations);
  settings.seed = count_setting(request, "seed", settings.seed);
  if (request.is_object()) {
    evolution.parallel = request.value("parallel", evolution.parallel);
  }

  return settings;
}

auto
tour_config(const Poco::Util::AbstractConfiguration& config,
            const nlohmann::json& request) -> TourConfig
{
  TourConfig settings;
  settings.population_size = config.getUInt("tour.population_size", 100);
  settings.generations = config.getUInt("tour.generations", 150);
  settings.mutation_rate = config.getDouble("tour.mutation_rate", 0.15);
  settings.elite_size = config.getUInt("tour.elite_size", 10);
  settings.tournament_size = config.getUInt("tour.tournament_size", 3);
  settings.seed = config.getUInt64("tour.seed", 42);

  settings.population_size =
    count_setting(request, "population_size", settings.population_size);
  settings.generations =
    count_setting(request, "generations", settings.generations);
  settings.seed = count_setting(request, "seed", settings.seed);

  return settings;
}

auto
carbon_rules(const GeoService& geo,
             const Poco::Util::AbstractConfiguration& config) -> CarbonRules
{
  if (not config.hasProperty("rules.extreme_locations")) {
    return CarbonRules(geo);
  }

  std::set<std::string, std::less<>> extreme;
  Poco::StringTokenizer tokens(config.getString("rules.extreme_locations"),
                               ",",
                               Poco::StringTokenizer::TOK_TRIM |
                                 Poco::StringTokenizer::TOK_IGNORE_EMPTY);
  for (const auto& token : tokens) {
    extreme.insert(token);
  }
  return CarbonRules(geo, std::move(extreme));
}

}
