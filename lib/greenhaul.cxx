#include <fmt/format.h>
#include <greenhaul/greenhaul.hxx>
#include <greenhaul/version.hxx>

namespace greenhaul {

auto
project() -> const char*
{
  return GREENHAUL_PROJECT_NAME;
}

auto
version() -> const char*
{
  return GREENHAUL_VERSION_STRING;
}

auto
usage() -> std::string
{
  return fmt::format("{}-{}", project(), version());
}

}
