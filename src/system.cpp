#include <doctest/doctest.h>
#include "system.h"
#include "random.h"
#include <cmath>
#include <sstream>
#include <spdlog/spdlog.h>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <cereal/archives/binary.hpp>

namespace Particula {

namespace Reservoir {

void from_json(const json& j, Thermostat& thermostat) { thermostat.temperature = j.at("temperature").get<double>(); }
void to_json(json& j, const Thermostat& thermostat) { j = {{"temperature", thermostat.temperature}}; }
void from_json(const json& j, Barostat& barostat) { barostat.pressure = j.at("pressure").get<double>(); }
void to_json(json& j, const Barostat& barostat) { j = {{"pressure", barostat.pressure}}; }

void from_json(const json& j, ParticleReservoir& reservoir) {
    reservoir.chemical_potential = j.at("chemical_potential").get<double>();
}

void to_json(json& j, const ParticleReservoir& reservoir) {
    j = {{"chemical_potential", reservoir.chemical_potential}};
}

} // namespace Reservoir

System::System(ParticleVector particles, std::optional<Cell> cell)
    : particles(std::move(particles))
    , cell(std::move(cell)) {}

size_t System::size() const { return particles.size(); }

/**
 * Taken from the cell if present, otherwise from the first particle. An
 * empty, unbounded system defaults to three dimensions.
 */
Eigen::Index System::dimensions() const {
    if (cell) {
        return cell->dimension();
    }
    if (!particles.empty()) {
        return particles.front().dimension();
    }
    return 3;
}

/**
 * @throw ConfigurationError if there is no cell
 */
double System::density() const {
    if (!cell) {
        throw ConfigurationError("density undefined without a cell");
    }
    return static_cast<double>(particles.size()) / cell->volume();
}

/**
 * The cell sides are scaled uniformly by `(V_new / V_old)^(1/D)` while the
 * particle positions are left untouched.
 *
 * @throw ConfigurationError if there is no cell, no particles, or if the density is not positive
 */
void System::setDensity(const double density) {
    if (!cell) {
        throw ConfigurationError("cannot set density without a cell");
    }
    if (particles.empty()) {
        throw ConfigurationError("cannot set density of a system without particles");
    }
    if (!(density > 0.0) || !std::isfinite(density)) {
        throw ConfigurationError("density must be positive, got {}", density);
    }
    const auto new_volume = static_cast<double>(particles.size()) / density;
    const auto scaling = std::pow(new_volume / cell->volume(), 1.0 / static_cast<double>(cell->dimension()));
    cell->setSide(cell->getSide() * scaling);
    particula_logger->debug("density set to {:.4g}; cell sides scaled by {:.4g}", density, scaling);
}

double System::kineticEnergy() const {
    namespace rv = ranges::cpp20::views;
    return ranges::accumulate(particles | rv::transform([](const auto& particle) { return particle.kineticEnergy(); }),
                              0.0);
}

/**
 * Kinetic temperature from the equipartition relation, `T = 2 KE / ndof` with
 * `ndof = D N`.
 *
 * @throw ConfigurationError if there are no particles or if any velocity is missing
 */
double System::temperature() const {
    if (particles.empty()) {
        throw ConfigurationError("temperature undefined without particles");
    }
    const auto degrees_of_freedom = static_cast<double>(dimensions() * static_cast<Eigen::Index>(particles.size()));
    return 2.0 * kineticEnergy() / degrees_of_freedom;
}

/**
 * All velocities are scaled by `sqrt(T_new / T_old)`. Any thermostat target
 * temperature is left unchanged.
 *
 * @throw ConfigurationError if the temperature is negative or if the kinetic energy is zero
 */
void System::setTemperature(const double temperature) {
    if (!(temperature >= 0.0) || !std::isfinite(temperature)) {
        throw ConfigurationError("temperature must be non-negative, got {}", temperature);
    }
    const auto current_temperature = this->temperature();
    if (current_temperature <= 0.0) {
        throw ConfigurationError("cannot rescale velocities of a system with zero kinetic energy");
    }
    const auto scaling = std::sqrt(temperature / current_temperature);
    for (auto& particle : particles) {
        *particle.vel *= scaling;
    }
}

/**
 * Particles without species are counted under "-".
 */
std::map<std::string, size_t> System::composition() const {
    std::map<std::string, size_t> count;
    for (const auto& particle : particles) {
        count[particle.species.value_or("-")]++;
    }
    return count;
}

/**
 * Displacements are taken as-is, i.e. positions are assumed to be unfolded.
 *
 * @throw ConfigurationError if the number of particles differ or is zero
 */
double System::meanSquareDisplacement(const System& reference) const {
    namespace rv = ranges::cpp20::views;
    if (particles.size() != reference.particles.size() || particles.empty()) {
        throw ConfigurationError("mean square displacement requires equal, non-zero particle counts");
    }
    const auto squared_displacements = ranges::views::zip(particles, reference.particles) |
                                       rv::transform([](const auto& pair) {
                                           const auto& [particle, reference_particle] = pair;
                                           return particle.squaredDisplacement(reference_particle);
                                       });
    return ranges::accumulate(squared_displacements, 0.0) / static_cast<double>(particles.size());
}

/**
 * Particles are either given explicitly as an array, or generated at random
 * positions inside the cell:
 *
 * ~~~ yaml
 *     cell: {side: 10.0}
 *     particles: {count: 100, species: A, mass: 1.0}
 *     density: 0.8       # optional; rescales the cell
 *     temperature: 1.5   # optional; draws Maxwellian velocities if absent
 *     thermostat: {temperature: 2.0}
 * ~~~
 */
void from_json(const json& j, System& system) {
    try {
        system = System();
        if (auto it = j.find("cell"); it != j.end() && !it->is_null()) {
            system.cell = it->get<Cell>();
        }
        if (auto it = j.find("particles"); it != j.end()) {
            if (it->is_array()) {
                system.particles = it->get<ParticleVector>();
            } else if (it->is_object()) {
                if (!system.cell) {
                    throw ConfigurationError("generating particles requires a cell");
                }
                const auto count = it->at("count").get<size_t>();
                Particle prototype(zeroPoint(system.cell->dimension()), it->value("species", "A"s),
                                   it->value("mass", 1.0));
                system.particles.reserve(count);
                for (size_t i = 0; i < count; i++) {
                    prototype.pos = system.cell->randomPosition(Particula::random);
                    system.particles.push_back(prototype);
                }
            } else {
                throw ConfigurationError("particles must be an array or an object");
            }
        }
        if (auto it = j.find("thermostat"); it != j.end()) {
            system.thermostat = it->get<Reservoir::Thermostat>();
        }
        if (auto it = j.find("barostat"); it != j.end()) {
            system.barostat = it->get<Reservoir::Barostat>();
        }
        if (auto it = j.find("reservoir"); it != j.end()) {
            system.reservoir = it->get<Reservoir::ParticleReservoir>();
        }
        if (auto it = j.find("density"); it != j.end()) {
            system.setDensity(it->get<double>());
        }
        if (auto it = j.find("temperature"); it != j.end()) {
            const auto temperature = it->get<double>();
            const bool has_velocities =
                ranges::all_of(system.particles, [](const auto& particle) { return particle.vel.has_value(); });
            if (!has_velocities) {
                for (auto& particle : system.particles) {
                    particle.maxwellian(temperature, Particula::random);
                }
                if (system.particles.size() > 1) {
                    fixTotalMomentum(system.particles);
                }
            }
            system.setTemperature(temperature);
        }
    } catch (ConfigurationError& e) {
        if (e.attachedJson().empty()) {
            e.attachJson(j);
        }
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationError("system: {}", e.what()).attachJson(j);
    }
}

void to_json(json& j, const System& system) {
    j["particles"] = system.particles;
    j["number of particles"] = system.size();
    j["composition"] = system.composition();
    if (system.cell) {
        j["cell"] = *system.cell;
        if (!system.particles.empty()) { // zero density cannot be set on read
            j["density"] = system.density();
        }
    }
    const bool has_velocities = !system.particles.empty() && ranges::all_of(system.particles, [](const auto& particle) {
        return particle.vel.has_value();
    });
    if (has_velocities) {
        j["kinetic energy"] = system.kineticEnergy();
        if (system.kineticEnergy() > 0.0) { // zero temperature cannot be set on read
            j["temperature"] = system.temperature();
        }
    }
    if (system.thermostat) {
        j["thermostat"] = *system.thermostat;
    }
    if (system.barostat) {
        j["barostat"] = *system.barostat;
    }
    if (system.reservoir) {
        j["reservoir"] = *system.reservoir;
    }
}

TEST_SUITE_BEGIN("System");

TEST_CASE("[Particula] System") {
    using doctest::Approx;
    Random slump;

    ParticleVector particles(4);
    for (auto& particle : particles) {
        particle.pos = Cell(2.0).randomPosition(slump);
        particle.species = "A";
    }
    System system(particles, Cell(2.0));
    CHECK(system.size() == 4);
    CHECK(system.dimensions() == 3);

    SUBCASE("density") {
        CHECK(system.density() == Approx(0.5));
        const Point old_position = system.particles[0].pos;
        system.setDensity(4.0);
        CHECK(system.density() == Approx(4.0));
        CHECK(system.cell->getSide().x() == Approx(1.0));
        CHECK(system.particles[0].pos == old_position); // positions are not rescaled
        CHECK_THROWS_AS(system.setDensity(0.0), ConfigurationError);
        CHECK_THROWS_AS(system.setDensity(-1.0), ConfigurationError);

        System empty(ParticleVector(), Cell(2.0));
        CHECK(empty.density() == 0.0);
        CHECK_THROWS_AS(empty.setDensity(1.0), ConfigurationError);

        System unbounded(particles);
        CHECK_THROWS_AS(unbounded.density(), ConfigurationError);
        CHECK_THROWS_AS(unbounded.setDensity(1.0), ConfigurationError);
    }

    SUBCASE("temperature") {
        for (auto& particle : system.particles) {
            particle.maxwellian(1.0, slump);
        }
        for (const double target : {0.1, 1.0, 2.5, 100.0}) {
            system.setTemperature(target);
            CHECK(system.temperature() == Approx(target));
        }
        system.thermostat = Reservoir::Thermostat{3.0};
        system.setTemperature(0.5);
        CHECK(system.thermostat->temperature == 3.0); // independent of kinetic temperature
        CHECK(system.kineticEnergy() == Approx(0.5 * 0.5 * 3 * 4));

        for (auto& particle : system.particles) {
            particle.vel = zeroPoint(3);
        }
        CHECK(system.temperature() == 0.0);
        CHECK_THROWS_AS(system.setTemperature(1.0), ConfigurationError);

        System empty;
        CHECK_THROWS_AS(empty.temperature(), ConfigurationError);
        CHECK_THROWS_AS(empty.setTemperature(1.0), ConfigurationError);
    }

    SUBCASE("mutation and composition") {
        Particle b(zeroPoint(3), "B");
        system.particles.push_back(b);
        system.particles.erase(system.particles.begin());
        system.particles.push_back(Particle());
        auto composition = system.composition();
        CHECK(composition["A"] == 3);
        CHECK(composition["B"] == 1);
        CHECK(composition["-"] == 1);
    }

    SUBCASE("meanSquareDisplacement") {
        auto moved = system;
        for (auto& particle : moved.particles) {
            particle.pos.x() += 2.0;
        }
        CHECK(moved.meanSquareDisplacement(system) == Approx(4.0));
        moved.particles.pop_back();
        CHECK_THROWS_AS(moved.meanSquareDisplacement(system), ConfigurationError);
    }

    SUBCASE("Cereal serialisation") {
        system.thermostat = Reservoir::Thermostat{2.0};
        std::stringstream stream;
        {
            cereal::BinaryOutputArchive archive(stream);
            archive(system);
        }
        System copy;
        {
            cereal::BinaryInputArchive archive(stream);
            archive(copy);
        }
        CHECK(copy.size() == 4);
        CHECK(copy.particles[2].pos == system.particles[2].pos);
        CHECK(copy.cell->volume() == Approx(8.0));
        CHECK(copy.thermostat->temperature == 2.0);
        CHECK_FALSE(copy.barostat.has_value());
    }
}

TEST_CASE("[Particula] System json") {
    using doctest::Approx;
    System system = R"({
        "cell": {"side": 10.0},
        "particles": {"count": 100, "species": "A"},
        "density": 0.5,
        "temperature": 2.0,
        "thermostat": {"temperature": 1.0},
        "barostat": {"pressure": 0.3}
    })"_json;
    CHECK(system.size() == 100);
    CHECK(system.density() == Approx(0.5));
    CHECK(system.temperature() == Approx(2.0));
    CHECK(cmVelocity(system.particles).norm() < 1e-10);
    CHECK(system.thermostat->temperature == 1.0);
    CHECK(system.barostat->pressure == 0.3);
    CHECK_FALSE(system.reservoir.has_value());

    json j = system;
    CHECK(j.at("number of particles") == 100);
    CHECK(j.at("composition").at("A") == 100);
    System copy = j;
    CHECK(copy.size() == 100);
    CHECK(copy.temperature() == Approx(2.0));

    SUBCASE("empty and resting systems read back") {
        System empty(ParticleVector(), Cell(3.0));
        json j_empty = empty;
        CHECK_FALSE(j_empty.contains("density"));
        System empty_copy = j_empty;
        CHECK(empty_copy.size() == 0);
        CHECK(empty_copy.cell->volume() == Approx(27.0));

        System resting(ParticleVector(4), Cell(2.0));
        for (auto& particle : resting.particles) {
            particle.vel = zeroPoint();
        }
        json j_resting = resting;
        CHECK_FALSE(j_resting.contains("temperature"));
        CHECK(j_resting.at("kinetic energy") == 0.0);
        System resting_copy = j_resting;
        CHECK(resting_copy.kineticEnergy() == 0.0);
        CHECK(resting_copy.density() == Approx(0.5));
    }

    CHECK_THROWS_AS(system = R"({"particles": {"count": 10}})"_json, ConfigurationError);
    CHECK_THROWS_AS(system = R"({"cell": {"side": 2.0}, "particles": 7})"_json, ConfigurationError);
}

TEST_SUITE_END();

} // namespace Particula
