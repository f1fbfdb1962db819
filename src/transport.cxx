#include "transport.hxx"
#include "errors.hxx"
#include <fmt/format.h>
#include <utility>

namespace greenhaul {

namespace {

constexpr std::array<std::pair<Mode, std::string_view>, 5> MODE_NAMES{ {
  { Mode::TRAIN, "train" },
  { Mode::TRUCK_SMALL, "truck_small" },
  { Mode::TRUCK_MEDIUM, "truck_medium" },
  { Mode::TRUCK_LARGE, "truck_large" },
  { Mode::MULTIMODAL, "multimodal" },
} };

constexpr std::array<std::pair<Zone, std::string_view>, 3> ZONE_NAMES{ {
  { Zone::NORTH, "north" },
  { Zone::HIGHLANDS, "highlands" },
  { Zone::SOUTH, "south" },
} };

constexpr std::array<std::pair<Cargo, std::string_view>, 5> CARGO_NAMES{ {
  { Cargo::GENERAL, "general" },
  { Cargo::REFRIGERATED, "refrigerated" },
  { Cargo::HAZARDOUS, "hazardous" },
  { Cargo::BULK, "bulk" },
  { Cargo::FRAGILE, "fragile" },
} };

template<typename EnumT, std::size_t Size>
auto
lookup_name(const std::array<std::pair<EnumT, std::string_view>, Size>& table,
            EnumT value) -> std::string_view
{
  for (const auto& [key, label] : table) {
    if (key == value) {
      return label;
    }
  }
  return "unknown";
}

template<typename EnumT, std::size_t Size>
auto
lookup_value(const std::array<std::pair<EnumT, std::string_view>, Size>& table,
             std::string_view label,
             std::string_view kind) -> EnumT
{
  for (const auto& [key, candidate] : table) {
    if (candidate == label) {
      return key;
    }
  }
  throw InputError(fmt::format("Unknown {} <{}>", kind, label));
}

}

auto
typical_capacity(Mode mode) -> double
{
  switch (mode) {
    case Mode::TRAIN:
      return 1000.0;
    case Mode::TRUCK_SMALL:
      return 2.5;
    case Mode::TRUCK_MEDIUM:
      return 8.0;
    case Mode::TRUCK_LARGE:
    case Mode::MULTIMODAL:
      return 25.0;
  }
  return 25.0;
}

auto
name(Mode mode) -> std::string_view
{
  return lookup_name(MODE_NAMES, mode);
}

auto
name(Zone zone) -> std::string_view
{
  return lookup_name(ZONE_NAMES, zone);
}

auto
name(Cargo cargo) -> std::string_view
{
  return lookup_name(CARGO_NAMES, cargo);
}

auto
parse_mode(std::string_view label) -> Mode
{
  return lookup_value(MODE_NAMES, label, "transport mode");
}

auto
parse_zone(std::string_view label) -> Zone
{
  return lookup_value(ZONE_NAMES, label, "zone");
}

auto
parse_cargo(std::string_view label) -> Cargo
{
  return lookup_value(CARGO_NAMES, label, "cargo type");
}

}
