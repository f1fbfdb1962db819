#ifndef GREENHAUL_EVOLUTION_DOMINANCE
#define GREENHAUL_EVOLUTION_DOMINANCE

#include <algorithm>
#include <array>
#include <cstddef>
#include <limits>
#include <numeric>
#include <vector>

namespace greenhaul::evolution {

template<std::size_t N>
using Objectives = std::array<double, N>;

using Front = std::vector<std::size_t>;

/**
 * @brief Pareto dominance for minimised objectives.
 *
 * @p lhs dominates @p rhs when it is no worse in every objective and strictly
 * better in at least one.
 */
template<std::size_t N>
[[nodiscard]] constexpr auto
dominates(const Objectives<N>& lhs, const Objectives<N>& rhs) noexcept -> bool
{
  bool strictly = false;
  for (std::size_t idx = 0; idx < N; ++idx) {
    if (lhs[idx] > rhs[idx]) {
      return false;
    }
    if (lhs[idx] < rhs[idx]) {
      strictly = true;
    }
  }
  return strictly;
}

/**
 * @brief Fast non-dominated sort.
 *
 * Partitions @p points into fronts of mutually non-dominated indices. The
 * first front holds every point nobody dominates, the next one every point
 * dominated only by the first front, and so on. Indices inside a front are
 * ascending.
 */
template<std::size_t N>
[[nodiscard]] auto
non_dominated_sort(const std::vector<Objectives<N>>& points)
  -> std::vector<Front>
{
  const std::size_t size = points.size();
  std::vector<Front> fronts;

  if (size == 0) {
    return fronts;
  }

  std::vector<Front> dominated(size);
  std::vector<std::size_t> counts(size, 0);

  for (std::size_t lhs = 0; lhs < size; ++lhs) {
    for (std::size_t rhs = lhs + 1; rhs < size; ++rhs) {
      if (dominates<N>(points[lhs], points[rhs])) {
        dominated[lhs].push_back(rhs);
        ++counts[rhs];
      } else if (dominates<N>(points[rhs], points[lhs])) {
        dominated[rhs].push_back(lhs);
        ++counts[lhs];
      }
    }
  }

  Front current;
  for (std::size_t idx = 0; idx < size; ++idx) {
    if (counts[idx] == 0) {
      current.push_back(idx);
    }
  }

  while (not current.empty()) {
    Front next;
    for (auto idx : current) {
      for (auto other : dominated[idx]) {
        if (--counts[other] == 0) {
          next.push_back(other);
        }
      }
    }
    std::sort(next.begin(), next.end());
    fronts.push_back(std::move(current));
    current = std::move(next);
  }

  return fronts;
}

/**
 * @brief Crowding distance of every member of @p front.
 *
 * Per objective the members are ordered by value; both boundary members get
 * an infinite distance and interior members accumulate the normalised gap
 * between their neighbours. Objectives with no spread contribute nothing.
 * The result is parallel to @p front.
 */
template<std::size_t N>
[[nodiscard]] auto
crowding_distance(const std::vector<Objectives<N>>& points, const Front& front)
  -> std::vector<double>
{
  constexpr auto infinity = std::numeric_limits<double>::infinity();

  std::vector<double> distances(front.size(), 0.0);
  if (front.empty()) {
    return distances;
  }

  std::vector<std::size_t> order(front.size());

  for (std::size_t objective = 0; objective < N; ++objective) {
    auto value = [&](std::size_t position) {
      return points[front[position]][objective];
    };

    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](auto lhs, auto rhs) {
      return value(lhs) < value(rhs);
    });

    distances[order.front()] = infinity;
    distances[order.back()] = infinity;

    const double spread = value(order.back()) - value(order.front());
    if (spread <= 0.0) {
      continue;
    }

    const double norm = static_cast<double>(N) * spread;
    for (std::size_t pos = 1; pos + 1 < order.size(); ++pos) {
      distances[order[pos]] +=
        (value(order[pos + 1]) - value(order[pos - 1])) / norm;
    }
  }

  return distances;
}

}

#endif
