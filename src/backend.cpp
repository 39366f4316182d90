#include <doctest/doctest.h>
#include "backend.h"
#include <cmath>
#include <spdlog/spdlog.h>
#include <range/v3/algorithm/any_of.hpp>

namespace Particula {

RandomWalk::RandomWalk(System system, const double displacement, const bool fold, Random& random)
    : walkers(std::move(system))
    , displacement(displacement)
    , fold(fold)
    , random(random) {
    if (displacement < 0.0) {
        throw ConfigurationError("displacement must be non-negative");
    }
    if (fold && !walkers.cell) {
        throw ConfigurationError("folding requires a cell");
    }
}

System& RandomWalk::system() { return walkers; }

void RandomWalk::step() {
    for (auto& particle : walkers.particles) {
        if (particle.isLattice()) {
            *particle.site += random.range(0, 1) == 0 ? -1 : 1;
            if (particle.pos.size() > 0) {
                particle.pos[0] = static_cast<double>(*particle.site);
            }
            continue;
        }
        for (auto& x : particle.pos) {
            x += random.normal(0.0, displacement);
        }
        if (fold) {
            particle.fold(*walkers.cell);
        }
    }
}

void RandomWalk::advance(const long steps) {
    for (long i = 0; i < steps; i++) {
        step();
    }
}

std::string RandomWalk::name() const { return "random walk"; }

void RandomWalk::to_json(json& j) const {
    j["displacement"] = displacement;
    j["fold"] = fold;
}

/**
 * @throw ConfigurationError if any particle lacks a velocity or is on a lattice
 */
FreeFlight::FreeFlight(System system, const double timestep, const bool fold)
    : flying(std::move(system))
    , timestep(timestep)
    , fold(fold) {
    if (ranges::any_of(flying.particles, [](const auto& particle) { return !particle.vel || particle.isLattice(); })) {
        throw ConfigurationError("free flight requires off-lattice particles with velocities");
    }
    if (fold && !flying.cell) {
        throw ConfigurationError("folding requires a cell");
    }
}

System& FreeFlight::system() { return flying; }

void FreeFlight::advance(const long steps) {
    const auto time = timestep * static_cast<double>(steps);
    for (auto& particle : flying.particles) {
        particle.pos += *particle.vel * time;
        if (fold) {
            particle.fold(*flying.cell);
        }
    }
}

std::string FreeFlight::name() const { return "free flight"; }

void FreeFlight::to_json(json& j) const {
    j["timestep"] = timestep;
    j["fold"] = fold;
}

std::unique_ptr<Backend> createBackend(const json& j, System system) {
    if (!j.is_object() || j.size() != 1) {
        throw ConfigurationError("backend must be a single-key object").attachJson(j);
    }
    const auto name = j.begin().key();
    const auto& parameters = j.begin().value();
    try {
        std::unique_ptr<Backend> backend;
        if (name == "randomwalk") {
            backend = std::make_unique<RandomWalk>(std::move(system), parameters.value("displacement", 0.1),
                                                   parameters.value("fold", false));
        } else if (name == "freeflight") {
            backend = std::make_unique<FreeFlight>(std::move(system), parameters.at("timestep").get<double>(),
                                                   parameters.value("fold", false));
        } else {
            throw ConfigurationError("unknown backend");
        }
        particula_logger->info("created backend {}", backend->name());
        return backend;
    } catch (std::exception& e) {
        throw ConfigurationError("{}: {}", name, e.what()).attachJson(j);
    }
}

TEST_SUITE_BEGIN("Backend");

TEST_CASE("[Particula] RandomWalk") {
    using doctest::Approx;
    Random slump;

    SUBCASE("mean square displacement") {
        const double displacement = 0.1;
        RandomWalk backend(System(ParticleVector(2000)), displacement, false, slump);
        const auto initial = backend.system();
        backend.advance(10);
        const auto expected = 3 * 10 * displacement * displacement;
        CHECK(backend.system().meanSquareDisplacement(initial) == Approx(expected).epsilon(0.05));
    }

    SUBCASE("folding") {
        System system(ParticleVector(100), Cell(1.0));
        RandomWalk backend(system, 0.5, true, slump);
        backend.advance(20);
        for (const auto& particle : backend.system().particles) {
            CHECK(particle.pos.cwiseAbs().maxCoeff() <= 0.5 + 1e-12);
        }
        CHECK_THROWS_AS(RandomWalk(System(ParticleVector(1)), 0.1, true, slump), ConfigurationError);
        CHECK_THROWS_AS(RandomWalk(system, -0.1, false, slump), ConfigurationError);
    }

    SUBCASE("lattice") {
        Particle walker(zeroPoint(1));
        walker.site = 5;
        walker.pos[0] = 5.0;
        RandomWalk backend(System(ParticleVector{walker}), 1.0, false, slump);
        backend.advance(1);
        const auto& particle = backend.system().particles.front();
        CHECK(std::abs(*particle.site - 5) == 1);
        CHECK(particle.pos[0] == static_cast<double>(*particle.site));
    }
}

TEST_CASE("[Particula] FreeFlight") {
    using doctest::Approx;
    Particle particle;
    particle.vel = Point::Zero(3);
    particle.vel->x() = 1.0;

    FreeFlight unbounded(System(ParticleVector{particle}), 0.5);
    unbounded.advance(4);
    CHECK(unbounded.system().particles[0].pos.x() == Approx(2.0));

    FreeFlight folded(System(ParticleVector{particle}, Cell(3.0)), 0.5, true);
    folded.advance(4);
    CHECK(folded.system().particles[0].pos.x() == Approx(-1.0));

    Simulation simulation(unbounded);
    simulation.run(6);
    CHECK(simulation.rmsd() == Approx(3.0));

    CHECK_THROWS_AS(FreeFlight(System(ParticleVector(1)), 0.5), ConfigurationError);
}

TEST_CASE("[Particula] createBackend") {
    System system(ParticleVector(3), Cell(2.0));
    auto backend = createBackend(R"({"randomwalk": {"displacement": 0.2, "fold": true}})"_json, system);
    CHECK(backend->name() == "random walk");
    CHECK(backend->system().size() == 3);
    json j = *backend;
    CHECK(j.at("displacement") == 0.2);
    CHECK(j.at("name") == "random walk");

    CHECK_THROWS_AS(createBackend(R"({"unicorn": {}})"_json, system), ConfigurationError);
    CHECK_THROWS_AS(createBackend(R"({"freeflight": {"timestep": 0.1}})"_json, system), ConfigurationError);
    CHECK_THROWS_AS(createBackend(R"({"randomwalk": {}, "freeflight": {}})"_json, system), ConfigurationError);
}

TEST_SUITE_END();

} // namespace Particula
