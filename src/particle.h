#pragma once
#include "core.h"
#include "geometry.h"
#include "aux/eigensupport.h"
#include <map>
#include <optional>
#include <cereal/types/map.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>

namespace Particula {

/**
 * @brief Particle class for storing position, velocity, species and other properties
 *
 * Particles carry `pos`, `mass` by default; velocity, species and radius are
 * optional and may be reset to null at any time. Particles on a lattice store
 * an integer `site` which has no periodic-wrap meaning. Attributes added at
 * runtime, e.g. a charge, are stored by name in the `extra` side table.
 *
 * @warning If `vel` is set it must have the same dimension as `pos`
 */
class Particle {
  public:
    Point pos = zeroPoint();                //!< Position vector (default: 3D origin)
    std::optional<Point> vel;               //!< Velocity vector, if any
    std::optional<std::string> species;     //!< Species label, if any
    double mass = 1.0;                      //!< Mass
    std::optional<double> radius;           //!< Radius; null for point particles
    std::optional<long> site;               //!< Lattice site index (lattice models only)
    std::map<std::string, double> extra;    //!< Additional named attributes, e.g. "charge"

    Particle() = default;
    explicit Particle(const Point& position, std::optional<std::string> species = std::nullopt, double mass = 1.0);

    Eigen::Index dimension() const; //!< Dimension of position vector
    bool isLattice() const;         //!< True if particle lives on a lattice site

    Particle& fold(const Cell& cell); //!< Fold position into canonical cell centered at origin
    Particle nearestImage(Particle& other, const Cell& cell, bool copy = false) const;
    Particle& maxwellian(double temperature, Random& random); //!< Draw Maxwell-Boltzmann velocity
    double kineticEnergy() const;                              //!< Kinetic energy
    double squaredDisplacement(const Particle& other) const;   //!< |pos - other.pos|^2

    /**
     * @brief Cereal serialisation
     * @param archive Archive to serialize to/from
     */
    template <class Archive> void serialize(Archive& archive) { archive(pos, vel, species, mass, radius, site, extra); }
};

//! Storage type for collections of particles
using ParticleVector = std::vector<Particle>;

Point cmVelocity(const ParticleVector& particles);   //!< Mass-weighted average velocity
void fixTotalMomentum(ParticleVector& particles);    //!< Subtract center of mass velocity from all particles

void from_json(const json&, Particle&);
void to_json(json&, const Particle&);

} // namespace Particula
