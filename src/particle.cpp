#include <doctest/doctest.h>
#include "particle.h"
#include "random.h"
#include <cmath>
#include <limits>
#include <sstream>
#include <range/v3/view/transform.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <cereal/archives/binary.hpp>

namespace Particula {

Particle::Particle(const Point& position, std::optional<std::string> species, const double mass)
    : pos(position)
    , species(std::move(species))
    , mass(mass)
{
}

Eigen::Index Particle::dimension() const
{
    return pos.size();
}

bool Particle::isLattice() const
{
    return site.has_value();
}

/**
 * Each coordinate is mapped as `x -= side * round(x / side)` so that it
 * lies in `[-side/2, side/2]` and is congruent to the original value.
 *
 * @throw ConfigurationError for lattice particles or if dimensions mismatch
 */
Particle& Particle::fold(const Cell& cell)
{
    if (isLattice()) {
        throw ConfigurationError("lattice site {} cannot be folded", *site);
    }
    cell.boundary(pos);
    return *this;
}

/**
 * @param other Particle to find the periodic image of
 * @param cell Periodic cell
 * @param copy If true, `other` is left untouched and the shifted image is returned
 * @return Image of `other` closest to this particle
 *
 * The separation `pos - image.pos` is the minimum image vector, i.e. each
 * component is at most half the cell side in magnitude.
 */
Particle Particle::nearestImage(Particle& other, const Cell& cell, const bool copy) const
{
    if (isLattice() || other.isLattice()) {
        throw ConfigurationError("nearest image undefined for lattice particles");
    }
    const Point image = pos - cell.vdist(pos, other.pos);
    if (copy) {
        auto shifted = other;
        shifted.pos = image;
        return shifted;
    }
    other.pos = image;
    return other;
}

/**
 * Velocity components are drawn independently from a normal distribution
 * with zero mean and variance `temperature / mass`. The total momentum
 * of a set of particles is not fixed; see `fixTotalMomentum()`.
 */
Particle& Particle::maxwellian(const double temperature, Random& random)
{
    if (temperature < 0.0 || mass <= 0.0) {
        throw ConfigurationError("maxwellian requires non-negative temperature and positive mass");
    }
    const auto stddev = std::sqrt(temperature / mass);
    Point velocity(pos.size());
    for (Eigen::Index d = 0; d < velocity.size(); ++d) {
        velocity[d] = random.normal(0.0, stddev);
    }
    vel = velocity;
    return *this;
}

double Particle::kineticEnergy() const
{
    if (!vel) {
        throw ConfigurationError("kinetic energy undefined: particle has no velocity");
    }
    return 0.5 * mass * vel->squaredNorm();
}

double Particle::squaredDisplacement(const Particle& other) const
{
    if (pos.size() != other.pos.size()) {
        throw ConfigurationError("displacement between {}D and {}D particles", pos.size(), other.pos.size());
    }
    return (pos - other.pos).squaredNorm();
}

/**
 * @throw ConfigurationError if empty, if any velocity is missing, or if the total mass is zero
 */
Point cmVelocity(const ParticleVector& particles)
{
    namespace rv = ranges::cpp20::views;
    if (particles.empty()) {
        throw ConfigurationError("center of mass velocity of empty particle set");
    }
    const auto dimension = particles.front().dimension();
    if (ranges::any_of(particles, [&](const auto& particle) {
            return !particle.vel || particle.vel->size() != dimension;
        })) {
        throw ConfigurationError("center of mass velocity requires velocities of equal dimension");
    }
    const auto total_mass = ranges::accumulate(particles | rv::transform(&Particle::mass), 0.0);
    if (std::fabs(total_mass) < std::numeric_limits<double>::epsilon()) {
        throw ConfigurationError("center of mass velocity undefined for zero total mass");
    }
    Point momentum = Point::Zero(dimension);
    for (const auto& particle : particles) {
        momentum += particle.mass * *particle.vel;
    }
    return momentum / total_mass;
}

void fixTotalMomentum(ParticleVector& particles)
{
    const auto cm_velocity = cmVelocity(particles);
    for (auto& particle : particles) {
        *particle.vel -= cm_velocity;
    }
}

void from_json(const json& j, Particle& particle)
{
    particle.pos = j.value("pos", zeroPoint());
    particle.vel.reset();
    if (auto it = j.find("vel"); it != j.end() && !it->is_null()) {
        particle.vel = it->get<Point>();
        if (particle.vel->size() != particle.pos.size()) {
            throw ConfigurationError("velocity and position dimensions differ").attachJson(j);
        }
    }
    particle.species.reset();
    if (auto it = j.find("species"); it != j.end() && !it->is_null()) {
        particle.species = it->get<std::string>();
    }
    particle.mass = j.value("mass", 1.0);
    particle.radius.reset();
    if (auto it = j.find("radius"); it != j.end() && !it->is_null()) {
        particle.radius = it->get<double>();
    }
    particle.site.reset();
    if (auto it = j.find("site"); it != j.end() && !it->is_null()) {
        particle.site = it->get<long>();
    }
    particle.extra = j.value("extra", std::map<std::string, double>());
}

void to_json(json& j, const Particle& particle)
{
    j["pos"] = particle.pos;
    j["vel"] = particle.vel ? json(*particle.vel) : json(nullptr);
    j["species"] = particle.species ? json(*particle.species) : json(nullptr);
    j["mass"] = particle.mass;
    j["radius"] = particle.radius ? json(*particle.radius) : json(nullptr);
    if (particle.site) {
        j["site"] = *particle.site;
    }
    if (!particle.extra.empty()) {
        j["extra"] = particle.extra;
    }
}

TEST_SUITE_BEGIN("Particle");

TEST_CASE("[Particula] Particle")
{
    using doctest::Approx;

    Particle p1;
    CHECK(p1.dimension() == 3);
    CHECK(p1.pos.isZero());
    CHECK(p1.mass == 1.0);
    CHECK_FALSE(p1.vel.has_value());
    CHECK_FALSE(p1.species.has_value());
    CHECK_FALSE(p1.radius.has_value());
    CHECK_FALSE(p1.isLattice());
    CHECK_THROWS_AS(p1.kineticEnergy(), ConfigurationError);

    p1.vel = Point::Ones(3);
    p1.mass = 2.0;
    CHECK(p1.kineticEnergy() == Approx(3.0));
    p1.vel.reset(); // fields may be reset to null
    CHECK_THROWS_AS(p1.kineticEnergy(), ConfigurationError);

    SUBCASE("fold")
    {
        Cell cell(2.0);
        Particle particle;
        particle.pos << 1.5, -3.2, 0.4;
        particle.fold(cell);
        CHECK(particle.pos.x() == Approx(-0.5));
        CHECK(particle.pos.y() == Approx(0.8));
        CHECK(particle.pos.z() == Approx(0.4));

        Random slump;
        Point side(2);
        side << 3.0, 7.0;
        Cell rectangle(side);
        for (int i = 0; i < 1000; i++) {
            Point original(2);
            original << (slump() - 0.5) * 100, (slump() - 0.5) * 100;
            Particle q(original);
            q.fold(rectangle);
            for (Eigen::Index d = 0; d < 2; ++d) {
                CHECK(std::fabs(q.pos[d]) <= 0.5 * side[d] + 1e-12);
                const auto images = (original[d] - q.pos[d]) / side[d];
                CHECK(images == Approx(std::round(images))); // congruent modulo side
            }
        }

        Particle lattice;
        lattice.site = 4;
        CHECK_THROWS_AS(lattice.fold(cell), ConfigurationError);
    }

    SUBCASE("nearestImage")
    {
        Cell cell(10.0);
        Particle a, b;
        a.pos << 4.5, 0.0, -1.0;
        b.pos << -4.5, 3.0, 8.0;

        auto image = a.nearestImage(b, cell, true);
        CHECK(b.pos.x() == Approx(-4.5)); // untouched when copying
        CHECK(image.pos.x() == Approx(5.5));
        CHECK(image.pos.y() == Approx(3.0));
        CHECK(image.pos.z() == Approx(-2.0));

        a.nearestImage(b, cell);
        CHECK(b.pos.x() == Approx(5.5)); // mutated in place

        Random slump;
        for (int i = 0; i < 1000; i++) {
            Particle p(cell.randomPosition(slump) * 3.0);
            Particle q(cell.randomPosition(slump) * 3.0);
            p.nearestImage(q, cell);
            const Point separation = p.pos - q.pos;
            CHECK(separation.cwiseAbs().maxCoeff() <= 5.0 + 1e-12);
        }
    }

    SUBCASE("maxwellian")
    {
        Random slump;
        ParticleVector particles(20000, Particle(zeroPoint(3), "A", 2.0));
        for (auto& particle : particles) {
            particle.maxwellian(1.5, slump);
        }
        double sum2 = 0.0;
        for (const auto& particle : particles) {
            REQUIRE(particle.vel.has_value());
            CHECK(particle.vel->size() == 3);
            sum2 += particle.vel->squaredNorm();
        }
        CHECK(sum2 / (3.0 * particles.size()) == Approx(1.5 / 2.0).epsilon(0.03)); // variance = T/m
        CHECK_THROWS_AS(particles.front().maxwellian(-1.0, slump), ConfigurationError);
    }

    SUBCASE("json")
    {
        Particle p;
        p.pos = Point::Constant(2, 1.5);
        p.vel = Point::Constant(2, -1.0);
        p.species = "B";
        p.radius = 0.5;
        p.extra["charge"] = -1.0;
        Particle q = json(p);
        CHECK(json(p) == json(q));
        CHECK(q.pos.size() == 2);
        CHECK(*q.species == "B");
        CHECK(*q.radius == 0.5);
        CHECK(q.extra.at("charge") == -1.0);

        Particle r = R"( {"pos": [1, 2, 3], "species": null} )"_json;
        CHECK_FALSE(r.species.has_value());
        CHECK_FALSE(r.vel.has_value());
        CHECK_THROWS_AS(r = R"( {"pos": [1, 2, 3], "vel": [1, 2]} )"_json, ConfigurationError);
    }

    SUBCASE("Cereal serialisation")
    {
        Particle p;
        p.pos = Point::Constant(4, 10.0);
        p.species = "C";
        p.site = 12;
        p.extra["charge"] = 2.0;
        std::stringstream stream;
        {
            cereal::BinaryOutputArchive archive(stream);
            archive(p);
        }
        Particle q;
        {
            cereal::BinaryInputArchive archive(stream);
            archive(q);
        }
        CHECK(q.pos.size() == 4);
        CHECK(q.pos[3] == 10.0);
        CHECK(*q.species == "C");
        CHECK(*q.site == 12);
        CHECK_FALSE(q.vel.has_value());
        CHECK(q.extra.at("charge") == 2.0);
    }
}

TEST_CASE("[Particula] cmVelocity and fixTotalMomentum")
{
    using doctest::Approx;
    Random slump;

    SUBCASE("equal masses")
    {
        ParticleVector particles(2);
        particles[0].vel = Point::Constant(3, 1.0);
        particles[1].vel = Point::Constant(3, 3.0);
        CHECK(cmVelocity(particles).x() == Approx(2.0));
    }

    SUBCASE("unequal masses")
    {
        ParticleVector particles(100);
        for (auto& particle : particles) {
            particle.mass = 0.5 + 5.0 * slump();
            particle.maxwellian(2.0, slump);
        }
        CHECK(cmVelocity(particles).norm() > 1e-6);
        fixTotalMomentum(particles);
        CHECK(cmVelocity(particles).norm() < 1e-10);
    }

    CHECK_THROWS_AS(cmVelocity(ParticleVector()), ConfigurationError);
    ParticleVector no_velocities(2);
    CHECK_THROWS_AS(fixTotalMomentum(no_velocities), ConfigurationError);
}

TEST_SUITE_END();

} // namespace Particula
