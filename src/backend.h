#pragma once

#include "simulation.h"
#include "random.h"
#include <memory>

namespace Particula {

/**
 * @brief Brownian-like random walk
 *
 * Each step, every off-lattice particle is displaced by a normal distributed
 * vector with standard deviation `displacement` per dimension. Lattice
 * particles hop to a neighbouring site, i.e. their `site` changes by +/-1
 * and the first position coordinate follows. Positions are folded into the
 * cell only if `fold` is set; otherwise they remain unfolded, as required
 * for displacement analysis.
 *
 * Input example:
 *
 * ```{.yaml}
 *     backend:
 *       randomwalk: {displacement: 0.1, fold: false}
 * ```
 */
class RandomWalk : public Backend {
    System walkers;
    double displacement;
    bool fold;
    Random& random;
    void step();

  public:
    RandomWalk(System system, double displacement, bool fold = false, Random& random = Particula::random);
    System& system() override;
    void advance(long steps) override;
    std::string name() const override;
    void to_json(json& j) const override;
};

/**
 * @brief Ballistic motion without forces, `x += v dt`
 *
 * All particles must have velocities. Positions are optionally folded into
 * the cell after each batch of steps.
 */
class FreeFlight : public Backend {
    System flying;
    double timestep;
    bool fold;

  public:
    FreeFlight(System system, double timestep, bool fold = false);
    System& system() override;
    void advance(long steps) override;
    std::string name() const override;
    void to_json(json& j) const override;
};

/**
 * @brief Create backend from json
 * @param j Single-key object naming the backend, e.g. `{"freeflight": {"timestep": 0.01}}`
 * @param system System to be propagated; moved into the backend
 * @throw ConfigurationError if unknown or if the configuration is invalid
 */
std::unique_ptr<Backend> createBackend(const json& j, System system);

} // namespace Particula
