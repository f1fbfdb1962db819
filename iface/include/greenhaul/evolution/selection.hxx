#ifndef GREENHAUL_EVOLUTION_SELECTION
#define GREENHAUL_EVOLUTION_SELECTION

#include "concepts.hxx"
#include <random>
#include <vector>

namespace greenhaul::evolution {

/**
 * @brief Two contestants drawn with replacement, the one whose objective
 * vector compares lexicographically smaller wins.
 *
 * Ties go to the first contestant.
 */
struct BinaryTournament
{
  template<typename IndividualT>
  auto operator()(const std::vector<IndividualT>& pool,
                  std::size_t count,
                  Random& rng) const -> std::vector<std::size_t>
  {
    std::vector<std::size_t> chosen;
    if (pool.empty()) {
      return chosen;
    }

    std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);
    chosen.reserve(count);

    for (std::size_t idx = 0; idx < count; ++idx) {
      const auto first = pick(rng);
      const auto second = pick(rng);
      chosen.push_back(*pool[second].objectives < *pool[first].objectives
                         ? second
                         : first);
    }
    return chosen;
  }
};

/**
 * @brief Crowded-comparison tournament: lower rank wins, larger crowding
 * distance breaks rank ties.
 */
struct CrowdedTournament
{
  template<typename IndividualT>
  auto operator()(const std::vector<IndividualT>& pool,
                  std::size_t count,
                  Random& rng) const -> std::vector<std::size_t>
  {
    std::vector<std::size_t> chosen;
    if (pool.empty()) {
      return chosen;
    }

    std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);
    chosen.reserve(count);

    for (std::size_t idx = 0; idx < count; ++idx) {
      const auto first = pick(rng);
      const auto second = pick(rng);
      const auto& lhs = pool[first];
      const auto& rhs = pool[second];

      bool takeSecond = rhs.rank < lhs.rank or
                        (rhs.rank == lhs.rank and rhs.crowding > lhs.crowding);
      chosen.push_back(takeSecond ? second : first);
    }
    return chosen;
  }
};

}

#endif
