#ifndef GREENHAUL_EVOLUTION_CONCEPTS
#define GREENHAUL_EVOLUTION_CONCEPTS

#include "dominance.hxx"
#include <concepts>
#include <optional>
#include <random>
#include <vector>

namespace greenhaul::evolution {

using Random = std::mt19937_64;

template<typename GenomeT, std::size_t N>
struct Individual
{
  GenomeT genome;
  std::optional<Objectives<N>> objectives;
  std::size_t rank = 0;
  double crowding = 0.0;

  [[nodiscard]] auto valid() const -> bool { return objectives.has_value(); }

  void invalidate() { objectives.reset(); }
};

/**
 * @brief What the engine needs from an optimisation problem.
 *
 * `evaluate` has to be pure: it is called concurrently on distinct genomes
 * when parallel evaluation is enabled.
 */
template<typename ProblemT, std::size_t N>
concept Problem = requires(const ProblemT& problem,
                           typename ProblemT::genome_t& genome,
                           const typename ProblemT::genome_t& frozen,
                           Random& rng) {
  { problem.create(rng) } -> std::same_as<typename ProblemT::genome_t>;
  { problem.evaluate(frozen) } -> std::same_as<Objectives<N>>;
  { problem.crossover(genome, genome, rng) } -> std::same_as<void>;
  { problem.mutate(genome, rng) } -> std::same_as<void>;
};

/// Parent selection: picks @c count indices into an evaluated pool.
template<typename SelectionT, typename IndividualT>
concept Selection = requires(const SelectionT& select,
                             const std::vector<IndividualT>& pool,
                             std::size_t count,
                             Random& rng) {
  { select(pool, count, rng) } -> std::same_as<std::vector<std::size_t>>;
};

}

#endif
