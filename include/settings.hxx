#ifndef GREENHAUL_SETTINGS
#define GREENHAUL_SETTINGS

#include "carbon_rules.hxx"
#include "errors.hxx"
#include "geo_service.hxx"
#include "logistics_optimizer.hxx"
#include "tour_solver.hxx"
#include <Poco/Logger.h>
#include <Poco/Util/AbstractConfiguration.h>
#include <Poco/Util/Application.h>
#include <cstdint>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <utility>

namespace greenhaul {

/**
 * @brief Whole-number run setting @p key of a request, @p fallback when the
 * request leaves it out.
 *
 * Throws InputError for anything but an integer of at least @p minimum.
 */
[[nodiscard]] auto
count_setting(const nlohmann::json& request,
              const std::string& key,
              std::uint64_t fallback,
              std::uint64_t minimum = 0) -> std::uint64_t;

/**
 * @brief Optimiser settings: the `optimizer.*` configuration keys, then the
 * request's `population_size`, `generations`, `seed` and `parallel`.
 */
[[nodiscard]] auto
optimizer_config(const Poco::Util::AbstractConfiguration& config,
                 const nlohmann::json& request) -> OptimizerConfig;

/// Tour solver settings from the `tour.*` keys and the request overrides.
[[nodiscard]] auto
tour_config(const Poco::Util::AbstractConfiguration& config,
            const nlohmann::json& request) -> TourConfig;

/// Rule engine honouring the comma separated `rules.extreme_locations`.
[[nodiscard]] auto
carbon_rules(const GeoService& geo,
             const Poco::Util::AbstractConfiguration& config) -> CarbonRules;

/**
 * @brief Runs @p command and turns its outcome into a process exit code.
 *
 * Bad input, ours or the JSON library's, is a data error. Anything else
 * that escapes is a software error.
 */
template<typename Command>
auto
guarded(Poco::Logger& logger, Command&& command) -> int
{
  try {
    std::forward<Command>(command)();
  } catch (const InputError& exc) {
    logger.error(fmt::format("Invalid input: {}", exc.what()));
    return Poco::Util::Application::EXIT_DATAERR;
  } catch (const nlohmann::json::exception& exc) {
    logger.error(fmt::format("Invalid input: {}", exc.what()));
    return Poco::Util::Application::EXIT_DATAERR;
  } catch (const std::exception& exc) {
    logger.error(fmt::format("Error occurred: {}", exc.what()));
    return Poco::Util::Application::EXIT_SOFTWARE;
  }
  return Poco::Util::Application::EXIT_OK;
}

}

#endif
