#pragma once
#include "core.h"
#include "geometry.h"
#include "particle.h"
#include <map>
#include <optional>
#include <cereal/types/vector.hpp>
#include <cereal/types/optional.hpp>

namespace Particula {

/**
 * @brief Thermodynamic boundary conditions
 *
 * Reservoirs represent externally imposed state variables rather than
 * dynamical particles. They are independent, optional attachments to a
 * `System` and carry only their target state.
 */
namespace Reservoir {

//! Heat bath with a target temperature; unrelated to the kinetic temperature
struct Thermostat {
    double temperature = 1.0; //!< Target temperature
    template <class Archive> void serialize(Archive& archive) { archive(temperature); }
};

//! Pressure bath with a target pressure
struct Barostat {
    double pressure = 0.0; //!< Target pressure
    template <class Archive> void serialize(Archive& archive) { archive(pressure); }
};

//! Particle reservoir with a target chemical potential
struct ParticleReservoir {
    double chemical_potential = 0.0; //!< Target chemical potential
    template <class Archive> void serialize(Archive& archive) { archive(chemical_potential); }
};

void from_json(const json& j, Thermostat& thermostat);
void to_json(json& j, const Thermostat& thermostat);
void from_json(const json& j, Barostat& barostat);
void to_json(json& j, const Barostat& barostat);
void from_json(const json& j, ParticleReservoir& reservoir);
void to_json(json& j, const ParticleReservoir& reservoir);

} // namespace Reservoir

/**
 * @brief Aggregate of particles, an optional periodic cell and optional reservoirs
 *
 * A null `cell` means an unbounded, non-periodic system. The particle vector
 * may be mutated freely; no cross-particle consistency is enforced.
 *
 * Derived properties:
 *
 * Property      | Getter            | Setter
 * :------------ | :---------------- | :-------------------------------------------
 * density       | N / cell volume   | rescales cell sides uniformly (not positions)
 * temperature   | 2 KE / (D N)      | rescales all velocities by a common factor
 */
class System {
  public:
    ParticleVector particles;                                 //!< All particles in insertion order
    std::optional<Cell> cell;                                 //!< Periodic cell; null if unbounded
    std::optional<Reservoir::Thermostat> thermostat;          //!< Heat bath, if any
    std::optional<Reservoir::Barostat> barostat;              //!< Pressure bath, if any
    std::optional<Reservoir::ParticleReservoir> reservoir;    //!< Particle reservoir, if any

    System() = default;
    explicit System(ParticleVector particles, std::optional<Cell> cell = std::nullopt);

    size_t size() const;              //!< Number of particles
    Eigen::Index dimensions() const;  //!< Spatial dimensions
    double density() const;           //!< Number density
    void setDensity(double density);  //!< Rescale cell to match density
    double kineticEnergy() const;     //!< Total kinetic energy
    double temperature() const;       //!< Kinetic temperature
    void setTemperature(double temperature); //!< Rescale velocities to match temperature
    std::map<std::string, size_t> composition() const; //!< Number of particles per species
    double meanSquareDisplacement(const System& reference) const; //!< MSD relative to reference

    template <class Archive> void serialize(Archive& archive) {
        archive(particles, cell, thermostat, barostat, reservoir);
    } //!< Cereal serialisation
};

void from_json(const json& j, System& system);
void to_json(json& j, const System& system);

} // namespace Particula
