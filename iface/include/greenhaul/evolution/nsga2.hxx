#ifndef GREENHAUL_EVOLUTION_NSGA2
#define GREENHAUL_EVOLUTION_NSGA2

#include "concepts.hxx"
#include "dominance.hxx"
#include "selection.hxx"
#include <algorithm>
#include <atomic>
#include <execution>
#include <functional>
#include <iterator>
#include <limits>
#include <numeric>
#include <random>
#include <vector>

namespace greenhaul::evolution {

struct Config
{
  std::size_t population_size = 100;
  std::size_t generations = 50;
  double crossover_probability = 0.8;
  double mutation_probability = 0.2;
  bool parallel = false;
};

template<std::size_t N>
struct GenerationStats
{
  std::size_t generation = 0;
  Objectives<N> minimum{};
  Objectives<N> mean{};
};

/**
 * @brief Population size actually used for a requested size: the next
 * multiple of four, at least four.
 */
[[nodiscard]] constexpr auto
round_up(std::size_t requested) noexcept -> std::size_t
{
  const std::size_t rounded = (requested + 3) / 4 * 4;
  return rounded < 4 ? 4 : rounded;
}

/**
 * @brief Elitist non-dominated sorting genetic algorithm.
 *
 * The engine owns no random state and no problem data; every run receives
 * its generator and works on a population of its own, so one engine can
 * serve concurrent runs.
 *
 * @tparam ProblemT   genome factory, evaluator and variation operators
 * @tparam N          number of minimised objectives
 * @tparam SelectionT parent selection strategy
 */
template<typename ProblemT, std::size_t N, typename SelectionT = BinaryTournament>
  requires Problem<ProblemT, N>
class Nsga2
{
public:
  using genome_t = typename ProblemT::genome_t;
  using individual_t = Individual<genome_t, N>;
  using population_t = std::vector<individual_t>;
  using stats_t = GenerationStats<N>;
  using observer_t = std::function<void(const stats_t&)>;

  static_assert(Selection<SelectionT, individual_t>);

  struct Outcome
  {
    population_t population;
    std::vector<stats_t> history;
    std::size_t generations = 0;
    bool cancelled = false;
  };

private:
  const ProblemT& mProblem;
  Config mConfig;
  SelectionT mSelection;

public:
  Nsga2(const ProblemT& problem, Config config, SelectionT selection = {})
    : mProblem(problem)
    , mConfig(config)
    , mSelection(selection)
  {}

  [[nodiscard]] auto config() const -> const Config& { return mConfig; }

  [[nodiscard]] auto population_size() const -> std::size_t
  {
    return round_up(mConfig.population_size);
  }

  /**
   * @brief Evolves a fresh population for the configured number of
   * generations.
   *
   * @param rng      generator consumed by creation, selection and variation
   * @param observer called after every completed generation
   * @param cancel   polled between generations; a set flag ends the run with
   *                 the population of the last completed generation
   */
  auto run(Random& rng,
           const observer_t& observer = {},
           const std::atomic<bool>* cancel = nullptr) const -> Outcome
  {
    const auto size = population_size();

    Outcome outcome;
    population_t population;
    population.reserve(size);

    for (std::size_t idx = 0; idx < size; ++idx) {
      population.push_back(individual_t{ mProblem.create(rng) });
    }
    evaluate(population);
    population = replace(std::move(population), size);

    for (std::size_t generation = 0; generation < mConfig.generations;
         ++generation) {
      if (cancel != nullptr and cancel->load()) {
        outcome.cancelled = true;
        break;
      }

      auto offspring = vary(population, rng);
      evaluate(offspring);

      population_t merged = std::move(population);
      merged.insert(merged.end(),
                    std::make_move_iterator(offspring.begin()),
                    std::make_move_iterator(offspring.end()));
      population = replace(std::move(merged), size);

      auto stats = statistics(population, generation);
      if (observer) {
        observer(stats);
      }
      outcome.history.push_back(stats);
      ++outcome.generations;
    }

    outcome.population = std::move(population);
    return outcome;
  }

  /// Indices of the first non-dominated front of an evaluated population.
  [[nodiscard]] static auto first_front(const population_t& population)
    -> Front
  {
    auto fronts = non_dominated_sort<N>(objectives(population));
    return fronts.empty() ? Front{} : fronts.front();
  }

private:
  [[nodiscard]] static auto objectives(const population_t& population)
    -> std::vector<Objectives<N>>
  {
    std::vector<Objectives<N>> points;
    points.reserve(population.size());
    for (const auto& individual : population) {
      points.push_back(*individual.objectives);
    }
    return points;
  }

  void evaluate(population_t& population) const
  {
    auto assign = [this](individual_t& individual) {
      if (not individual.valid()) {
        individual.objectives = mProblem.evaluate(individual.genome);
      }
    };

    if (mConfig.parallel) {
      std::for_each(
        std::execution::par, population.begin(), population.end(), assign);
    } else {
      std::for_each(population.begin(), population.end(), assign);
    }
  }

  auto vary(const population_t& population, Random& rng) const -> population_t
  {
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    population_t offspring;
    offspring.reserve(population.size());
    for (auto idx : mSelection(population, population.size(), rng)) {
      offspring.push_back(population[idx]);
    }

    for (std::size_t idx = 0; idx + 1 < offspring.size(); idx += 2) {
      if (unit(rng) < mConfig.crossover_probability) {
        mProblem.crossover(offspring[idx].genome, offspring[idx + 1].genome, rng);
        offspring[idx].invalidate();
        offspring[idx + 1].invalidate();
      }
    }

    for (auto& child : offspring) {
      if (unit(rng) < mConfig.mutation_probability) {
        mProblem.mutate(child.genome, rng);
        child.invalidate();
      }
    }

    return offspring;
  }

  /// Survivors: whole fronts while they fit, then the most isolated members
  /// of the front that overflows.
  auto replace(population_t merged, std::size_t size) const -> population_t
  {
    const auto points = objectives(merged);
    const auto fronts = non_dominated_sort<N>(points);

    population_t survivors;
    survivors.reserve(size);

    for (std::size_t rank = 0; rank < fronts.size(); ++rank) {
      const auto& front = fronts[rank];
      const auto distances = crowding_distance<N>(points, front);

      std::vector<std::size_t> order(front.size());
      std::iota(order.begin(), order.end(), 0);

      const bool overflow = survivors.size() + front.size() > size;
      if (overflow) {
        std::stable_sort(order.begin(), order.end(), [&](auto lhs, auto rhs) {
          return distances[lhs] > distances[rhs];
        });
      }

      for (auto position : order) {
        if (survivors.size() == size) {
          break;
        }
        auto& individual = merged[front[position]];
        individual.rank = rank;
        individual.crowding = distances[position];
        survivors.push_back(std::move(individual));
      }

      if (overflow) {
        break;
      }
    }

    return survivors;
  }

  static auto statistics(const population_t& population,
                         std::size_t generation) -> stats_t
  {
    stats_t stats;
    stats.generation = generation;
    stats.minimum.fill(std::numeric_limits<double>::infinity());
    stats.mean.fill(0.0);

    if (population.empty()) {
      stats.minimum.fill(0.0);
      return stats;
    }

    for (const auto& individual : population) {
      const auto& values = *individual.objectives;
      for (std::size_t objective = 0; objective < N; ++objective) {
        stats.minimum[objective] =
          std::min(stats.minimum[objective], values[objective]);
        stats.mean[objective] += values[objective];
      }
    }

    for (auto& value : stats.mean) {
      value /= static_cast<double>(population.size());
    }
    return stats;
  }
};

}

#endif
