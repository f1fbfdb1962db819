#include "application.hxx"
#include "errors.hxx"
#include "sample_requests.hxx"
#include "serialization.hxx"
#include "settings.hxx"
#include <Poco/Exception.h>
#include <Poco/Util/HelpFormatter.h>
#include <fmt/format.h>
#include <fstream>
#include <greenhaul/greenhaul.hxx>
#include <iostream>
#include <stdexcept>

using namespace greenhaul;

void
Greenhaul::display_help()
{
  Poco::Util::HelpFormatter helpFormatter(options());
  helpFormatter.setCommand(commandName());
  helpFormatter.setUsage("OPTIONS");
  helpFormatter.setHeader(fmt::format(
    "{}: cost and carbon aware freight planning. Commands: optimize, "
    "footprint, compare, route, tour, tour-carbon, sample, curve",
    usage()));
  helpFormatter.format(std::cout);
}

void
Greenhaul::initialize(Poco::Util::Application& self)
{
  loadConfiguration();
  Poco::Util::Application::initialize(self);
  logger().debug("Starting up");
}

void
Greenhaul::uninitialize()
{
  logger().debug("Shutting down");
  Poco::Util::Application::uninitialize();
}

void
Greenhaul::defineOptions(Poco::Util::OptionSet& options)
{
  Poco::Util::Application::defineOptions(options);

  options.addOption(
    Poco::Util::Option(
      "help", "h", "display help information on command line arguments")
      .required(false)
      .repeatable(false)
      .callback(
        Poco::Util::OptionCallback<Greenhaul>(this, &Greenhaul::handle_help)));

  options.addOption(
    Poco::Util::Option("config", "f", "Configuration file")
      .required(false)
      .repeatable(true)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<Greenhaul>(
        this, &Greenhaul::set_config_file)));

  options.addOption(
    Poco::Util::Option("catalog", "l", "Location catalog file")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<Greenhaul>(
        this, &Greenhaul::set_catalog_file)));

  options.addOption(
    Poco::Util::Option("command", "c", "Command to run, optimize by default")
      .required(false)
      .repeatable(false)
      .argument("<name>", true)
      .callback(
        Poco::Util::OptionCallback<Greenhaul>(this, &Greenhaul::set_command)));

  options.addOption(
    Poco::Util::Option("input", "i", "JSON request file, stdin by default")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<Greenhaul>(
        this, &Greenhaul::set_input_file)));

  options.addOption(
    Poco::Util::Option("output", "o", "JSON answer file, stdout by default")
      .required(false)
      .repeatable(false)
      .argument("<filepath>", true)
      .callback(Poco::Util::OptionCallback<Greenhaul>(
        this, &Greenhaul::set_output_file)));

  options.addOption(
    Poco::Util::Option("seed", "s", "Random seed of the evolutionary solvers")
      .required(false)
      .repeatable(false)
      .argument("<int>", true)
      .callback(
        Poco::Util::OptionCallback<Greenhaul>(this, &Greenhaul::set_seed)));

  options.addOption(
    Poco::Util::Option("parallel", "p", "Evaluate plans on all cores")
      .required(false)
      .repeatable(false)
      .callback(
        Poco::Util::OptionCallback<Greenhaul>(this, &Greenhaul::set_parallel)));
}

void
Greenhaul::handle_help(const std::string& name, const std::string& value)
{
  mHelpRequested = true;
  display_help();
  stopOptionsProcessing();
}

void
Greenhaul::set_config_file(const std::string& name, const std::string& value)
{
  loadConfiguration(value);
}

void
Greenhaul::set_catalog_file(const std::string& name, const std::string& value)
{
  mCatalogFile = value;
}

void
Greenhaul::set_command(const std::string& name, const std::string& value)
{
  mCommand = value;
}

void
Greenhaul::set_input_file(const std::string& name, const std::string& value)
{
  mInputFile = value;
}

void
Greenhaul::set_output_file(const std::string& name, const std::string& value)
{
  mOutputFile = value;
}

void
Greenhaul::set_seed(const std::string& name, const std::string& value)
{
  config().setString("optimizer.seed", value);
  config().setString("tour.seed", value);
}

void
Greenhaul::set_parallel(const std::string& name, const std::string& value)
{
  config().setBool("optimizer.parallel", true);
}

auto
Greenhaul::read_input() const -> nlohmann::json
{
  try {
    if (mInputFile.empty() or mInputFile == "-") {
      return nlohmann::json::parse(std::cin);
    }

    std::ifstream stream(mInputFile);
    if (not stream) {
      throw InputError(fmt::format("Unable to open request <{}>", mInputFile));
    }
    return nlohmann::json::parse(stream);
  } catch (const nlohmann::json::parse_error& exc) {
    throw InputError(fmt::format("Unable to parse request: {}", exc.what()));
  }
}

void
Greenhaul::write_output(const nlohmann::json& answer) const
{
  if (mOutputFile.empty() or mOutputFile == "-") {
    std::cout << answer.dump(2) << std::endl;
    return;
  }

  std::ofstream stream(mOutputFile);
  if (not stream) {
    throw std::runtime_error(
      fmt::format("Unable to open output <{}>", mOutputFile));
  }
  stream << answer.dump(2) << std::endl;
}

auto
Greenhaul::handlers() -> const std::map<std::string, handler_t, std::less<>>&
{
  static const std::map<std::string, handler_t, std::less<>> commands{
    { "optimize", &Greenhaul::optimize },
    { "footprint", &Greenhaul::footprint },
    { "compare", &Greenhaul::compare },
    { "route", &Greenhaul::route },
    { "tour", &Greenhaul::tour },
    { "tour-carbon", &Greenhaul::tour_carbon },
    { "sample", &Greenhaul::sample },
    { "curve", &Greenhaul::curve },
  };
  return commands;
}

auto
Greenhaul::run_command(const LocationCatalog& catalog,
                       const nlohmann::json& request) const -> nlohmann::json
{
  auto handler = handlers().at(mCommand);
  return (this->*handler)(catalog, request);
}

auto
Greenhaul::optimize(const LocationCatalog& catalog,
                    const nlohmann::json& request) const -> nlohmann::json
{
  auto requests = parse<std::vector<DeliveryRequest>>(request.at("requests"),
                                                      "delivery requests");
  auto hubs = request.value("hubs", catalog.default_hubs());
  auto alpha = request.value("alpha", 0.5);

  auto carbon = carbon_rules(catalog, config());
  LogisticsOptimizer optimizer(
    catalog, carbon, optimizer_config(config(), request));
  return optimizer.optimize(requests, hubs, alpha);
}

auto
Greenhaul::footprint(const LocationCatalog& catalog,
                     const nlohmann::json& request) const -> nlohmann::json
{
  auto context = parse<TransportContext>(request, "transport context");
  return carbon_rules(catalog, config()).evaluate(context);
}

auto
Greenhaul::compare(const LocationCatalog& catalog,
                   const nlohmann::json& request) const -> nlohmann::json
{
  return carbon_rules(catalog, config()).compare_modes(
    request.at("origin").get<std::string>(),
    request.at("destination").get<std::string>(),
    request.at("cargo_tonnes").get<double>(),
    parse<Cargo>(request.value("cargo_type", nlohmann::json("general")),
                 "cargo type"));
}

auto
Greenhaul::route(const LocationCatalog& catalog,
                 const nlohmann::json& request) const -> nlohmann::json
{
  auto stops = request.at("route").get<std::vector<std::string>>();
  auto mode = parse<Mode>(
    request.value("transport_mode", nlohmann::json("truck_large")),
    "transport mode");
  auto cargo = parse<Cargo>(
    request.value("cargo_type", nlohmann::json("general")), "cargo type");

  return carbon_rules(catalog, config()).route_footprint(
    stops, request.at("cargo_tonnes").get<double>(), mode, cargo);
}

auto
Greenhaul::tour(const LocationCatalog& catalog,
                const nlohmann::json& request) const -> nlohmann::json
{
  auto tour = parse<TourRequest>(request, "tour request");
  return TourSolver(catalog, tour_config(config(), request)).optimize(tour);
}

auto
Greenhaul::tour_carbon(const LocationCatalog& catalog,
                       const nlohmann::json& request) const -> nlohmann::json
{
  auto tour = parse<TourRequest>(request, "tour request");
  auto cargo = parse<Cargo>(
    request.value("cargo_type", nlohmann::json("general")), "cargo type");

  auto result =
    TourSolver(catalog, tour_config(config(), request)).optimize(tour);
  return assess_tour(result,
                     carbon_rules(catalog, config()),
                     request.value("cargo_tonnes", 10.0),
                     cargo);
}

auto
Greenhaul::sample(const LocationCatalog& catalog,
                  const nlohmann::json& request) const -> nlohmann::json
{
  auto settings = optimizer_config(config(), request);
  auto requests = generate_sample_requests(
    catalog, count_setting(request, "count", 20, 1), settings.seed);

  nlohmann::json answer{ { "requests", requests } };
  if (request.value("optimize", false)) {
    auto carbon = carbon_rules(catalog, config());
    LogisticsOptimizer optimizer(catalog, carbon, settings);
    answer["result"] = optimizer.optimize(requests,
                                          catalog.default_hubs(),
                                          request.value("alpha", 0.5));
  }
  return answer;
}

auto
Greenhaul::curve(const LocationCatalog& catalog,
                 const nlohmann::json& request) const -> nlohmann::json
{
  auto requests = parse<std::vector<DeliveryRequest>>(request.at("requests"),
                                                      "delivery requests");
  auto hubs = request.value("hubs", catalog.default_hubs());

  auto carbon = carbon_rules(catalog, config());
  LogisticsOptimizer optimizer(
    catalog, carbon, optimizer_config(config(), request));
  return nlohmann::json{
    { "curve",
      optimizer.pareto_curve(
        requests, hubs, count_setting(request, "steps", 5, 1)) }
  };
}

auto
Greenhaul::main(const ArgVec& args) -> int
{
  if (mHelpRequested) {
    return Poco::Util::Application::EXIT_OK;
  }

  if (mCatalogFile.empty()) {
    logger().error("A location catalog is required (--catalog)");
    display_help();
    return Poco::Util::Application::EXIT_USAGE;
  }

  if (not handlers().contains(mCommand)) {
    logger().error(fmt::format("Unknown command <{}>", mCommand));
    display_help();
    return Poco::Util::Application::EXIT_USAGE;
  }

  return guarded(logger(), [this] {
    const auto catalog = LocationCatalog::load(mCatalogFile);
    logger().information(fmt::format("Running {} against {} locations",
                                     mCommand,
                                     catalog.locations().size()));

    write_output(run_command(catalog, read_input()));
  });
}

auto
main(int argc, char** argv) -> int
{
  Greenhaul app;
  try {
    app.init(argc, argv);
  } catch (const Poco::Exception& exc) {
    app.logger().log(exc);
    return Poco::Util::Application::EXIT_CONFIG;
  }
  return app.run();
}
