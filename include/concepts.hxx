#ifndef GREENHAUL_CONCEPTS
#define GREENHAUL_CONCEPTS

#include <concepts>
#include <ranges>
#include <string>
#include <string_view>

namespace greenhaul {

template<typename RangeT, typename ValueT>
concept range_of = std::ranges::range<RangeT> and
  std::same_as<std::decay_t<std::ranges::range_value_t<RangeT>>, ValueT>;

template<typename RangeT, typename ValueT>
concept sized_range_of = std::ranges::sized_range<RangeT> and
  std::same_as<std::decay_t<std::ranges::range_value_t<RangeT>>, ValueT>;

/// Ranges of location names: owned strings or views into them.
template<typename RangeT>
concept location_range = sized_range_of<RangeT, std::string> or
  sized_range_of<RangeT, std::string_view>;

}

#endif
