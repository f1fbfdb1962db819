#ifndef GREENHAUL_TRANSPORT
#define GREENHAUL_TRANSPORT

#include <array>
#include <cstdint>
#include <string_view>

namespace greenhaul {

enum class Mode : uint8_t
{
  TRAIN = 0,
  TRUCK_SMALL = 1,
  TRUCK_MEDIUM = 2,
  TRUCK_LARGE = 3,
  MULTIMODAL = 4
};

enum class Zone : uint8_t
{
  NORTH = 0,
  HIGHLANDS = 1,
  SOUTH = 2
};

enum class Cargo : uint8_t
{
  GENERAL = 0,
  REFRIGERATED = 1,
  HAZARDOUS = 2,
  BULK = 3,
  FRAGILE = 4
};

inline constexpr std::array<Mode, 5> MODES{ Mode::TRAIN,
                                             Mode::TRUCK_SMALL,
                                             Mode::TRUCK_MEDIUM,
                                             Mode::TRUCK_LARGE,
                                             Mode::MULTIMODAL };

inline constexpr std::array<Cargo, 5> CARGOS{ Cargo::GENERAL,
                                              Cargo::REFRIGERATED,
                                              Cargo::HAZARDOUS,
                                              Cargo::BULK,
                                              Cargo::FRAGILE };

/// Heaviest consignment accepted anywhere, in tonnes.
inline constexpr double MAX_CARGO_TONNES = 100'000.0;

/// Modes that can only run where the rail network connects both ends.
[[nodiscard]] constexpr auto
requires_rail(Mode mode) noexcept -> bool
{
  return mode == Mode::TRAIN or mode == Mode::MULTIMODAL;
}

/// Tonnes one vehicle of @p mode carries.
[[nodiscard]] auto
typical_capacity(Mode mode) -> double;

[[nodiscard]] auto
name(Mode) -> std::string_view;

[[nodiscard]] auto
name(Zone) -> std::string_view;

[[nodiscard]] auto
name(Cargo) -> std::string_view;

// Parsers throw InputError on names they do not know.

[[nodiscard]] auto
parse_mode(std::string_view) -> Mode;

[[nodiscard]] auto
parse_zone(std::string_view) -> Zone;

[[nodiscard]] auto
parse_cargo(std::string_view) -> Cargo;

}

#endif
