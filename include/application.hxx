#ifndef GREENHAUL_APPLICATION
#define GREENHAUL_APPLICATION

#include "location_catalog.hxx"
#include <Poco/Util/Application.h>
#include <filesystem>
#include <functional>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <string>

/**
 * @brief Command line front end: reads a JSON request, runs one command
 * against a location catalog and writes the JSON answer.
 */
class Greenhaul : public Poco::Util::Application
{
  using handler_t = auto (Greenhaul::*)(const greenhaul::LocationCatalog&,
                                        const nlohmann::json&) const
    -> nlohmann::json;

private:
  std::filesystem::path mCatalogFile;
  std::string mCommand = "optimize";
  std::string mInputFile;
  std::string mOutputFile;

  bool mHelpRequested = false;

public:
  Greenhaul() = default;

  ~Greenhaul() override = default;

private:
  void display_help();

  [[nodiscard]] auto read_input() const -> nlohmann::json;

  void write_output(const nlohmann::json&) const;

  [[nodiscard]] static auto handlers()
    -> const std::map<std::string, handler_t, std::less<>>&;

  [[nodiscard]] auto run_command(const greenhaul::LocationCatalog&,
                                 const nlohmann::json&) const
    -> nlohmann::json;

  [[nodiscard]] auto optimize(const greenhaul::LocationCatalog&,
                              const nlohmann::json&) const -> nlohmann::json;

  [[nodiscard]] auto footprint(const greenhaul::LocationCatalog&,
                               const nlohmann::json&) const -> nlohmann::json;

  [[nodiscard]] auto compare(const greenhaul::LocationCatalog&,
                             const nlohmann::json&) const -> nlohmann::json;

  [[nodiscard]] auto route(const greenhaul::LocationCatalog&,
                           const nlohmann::json&) const -> nlohmann::json;

  [[nodiscard]] auto tour(const greenhaul::LocationCatalog&,
                          const nlohmann::json&) const -> nlohmann::json;

  [[nodiscard]] auto tour_carbon(const greenhaul::LocationCatalog&,
                                 const nlohmann::json&) const -> nlohmann::json;

  [[nodiscard]] auto sample(const greenhaul::LocationCatalog&,
                            const nlohmann::json&) const -> nlohmann::json;

  [[nodiscard]] auto curve(const greenhaul::LocationCatalog&,
                           const nlohmann::json&) const -> nlohmann::json;

protected:
  void initialize(Poco::Util::Application& self) override;

  void uninitialize() override;

  void defineOptions(Poco::Util::OptionSet& options) override;

  void handle_help(const std::string&, const std::string&);

  void set_config_file(const std::string&, const std::string&);

  void set_catalog_file(const std::string&, const std::string&);

  void set_command(const std::string&, const std::string&);

  void set_input_file(const std::string&, const std::string&);

  void set_output_file(const std::string&, const std::string&);

  void set_seed(const std::string&, const std::string&);

  void set_parallel(const std::string&, const std::string&);

  auto main(const ArgVec& args) -> int override;
};

#endif
