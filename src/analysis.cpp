#include <doctest/doctest.h>
#include "analysis.h"
#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>
#include <spdlog/spdlog.h>
#include <range/v3/algorithm/all_of.hpp>
#include <cereal/archives/binary.hpp>

namespace Particula {

/**
 * The checkpoint is first written to a temporary file which then replaces
 * `filename`, so that an existing checkpoint is never left half written.
 *
 * @throw IOError on failure
 */
void saveCheckpoint(const std::string& filename, const Checkpoint& checkpoint) {
    const auto temporary_filename = filename + ".tmp";
    {
        std::ofstream stream(temporary_filename, std::ios::binary | std::ios::trunc);
        if (!stream) {
            throw IOError("cannot open checkpoint file '{}' for writing", temporary_filename);
        }
        cereal::BinaryOutputArchive archive(stream);
        archive(checkpoint);
        if (!stream) {
            throw IOError("error writing checkpoint file '{}'", temporary_filename);
        }
    }
    std::error_code error;
    std::filesystem::rename(temporary_filename, filename, error);
    if (error) {
        throw IOError("cannot replace checkpoint '{}': {}", filename, error.message());
    }
    particula_logger->debug("saved checkpoint for step {} to {}", checkpoint.step, filename);
}

/**
 * @throw IOError if the file cannot be opened or decoded
 */
Checkpoint loadCheckpoint(const std::string& filename) {
    std::ifstream stream(filename, std::ios::binary);
    if (!stream) {
        throw IOError("cannot open checkpoint file '{}'", filename);
    }
    try {
        Checkpoint checkpoint;
        cereal::BinaryInputArchive archive(stream);
        archive(checkpoint);
        particula_logger->info("loaded checkpoint for step {} from {}", checkpoint.step, filename);
        return checkpoint;
    } catch (const std::exception& e) {
        throw IOError("cannot decode checkpoint file '{}': {}", filename, e.what());
    }
}

namespace Analysis {

void Observer::_to_json(json&) const {}

/**
 * Stop signals are rethrown as is; any other error is nested in a
 * `GenericError` with the observer's name and the current step.
 */
void Observer::operator()(Simulation& simulation) {
    number_of_samples++;
    timer.start();
    try {
        _sample(simulation);
    } catch (const SimulationEnd&) {
        timer.stop();
        throw;
    } catch (const std::exception&) {
        timer.stop();
        std::throw_with_nested(GenericError("{}: error at step {}", name, simulation.currentStep()));
    }
    timer.stop();
}

void Observer::to_json(json& json_output) const {
    auto& j = json_output[name];
    _to_json(j); // fill in info from derived classes
    j["scheduler"] = scheduler;
    j["samples"] = number_of_samples;
    if (timer.result() > 0.01) { // only print if more than 1% of the time
        j["relative time"] = roundValue(timer.result());
    }
}

int Observer::getNumberOfSamples() const { return number_of_samples; }

Observer::Observer(std::string_view name, Scheduler scheduler)
    : name(name)
    , scheduler(scheduler) {}

void to_json(json& j, const Observer& observer) { observer.to_json(j); }

TargetSteps::TargetSteps(const long target_steps)
    : Observer("target_steps", Scheduler(target_steps))
    , target_steps(target_steps) {}

void TargetSteps::_sample(Simulation& simulation) {
    if (simulation.currentStep() >= target_steps) {
        throw SimulationEnd("achieved target steps: {}", target_steps);
    }
}

void TargetSteps::_to_json(json& j) const { j["steps"] = target_steps; }

TargetRMSD::TargetRMSD(const double target_rmsd, Scheduler scheduler)
    : Observer("target_rmsd", scheduler)
    , target_rmsd(target_rmsd) {}

void TargetRMSD::_sample(Simulation& simulation) {
    const auto rmsd = simulation.rmsd();
    simulation_logger->debug("targeting rmsd {:.3g}, now {:.3g}", target_rmsd, rmsd);
    if (rmsd >= target_rmsd) {
        throw SimulationEnd("achieved target rmsd: {}", target_rmsd);
    }
}

void TargetRMSD::_to_json(json& j) const { j["rmsd"] = target_rmsd; }

TargetWallTime::TargetWallTime(const double wall_time_limit, Scheduler scheduler)
    : Observer("target_walltime", scheduler)
    , wall_time_limit(wall_time_limit) {}

void TargetWallTime::_sample(Simulation& simulation) {
    const auto elapsed = simulation.elapsedWallTime();
    if (elapsed >= wall_time_limit) {
        throw WallTimeLimit("target wall time reached: {} s", wall_time_limit);
    }
    simulation_logger->debug("elapsed time {:.1f} s, remaining time {:.1f} s", elapsed, wall_time_limit - elapsed);
}

void TargetWallTime::_to_json(json& j) const { j["seconds"] = wall_time_limit; }

WriterThermo::WriterThermo(const std::string& filename, Scheduler scheduler)
    : Observer("thermo", scheduler)
    , filename(filename)
    , stream(std::make_unique<std::ofstream>(filename)) {
    if (!*stream) {
        throw IOError("cannot open '{}' for writing", filename);
    }
    *stream << "# step temperature density kinetic_energy\n";
}

void WriterThermo::_sample(Simulation& simulation) {
    const auto& system = simulation.system();
    const bool has_velocities = !system.particles.empty() && ranges::all_of(system.particles, [](const auto& particle) {
        return particle.vel.has_value();
    });
    const auto temperature = has_velocities ? fmt::format("{}", system.temperature()) : "-"s;
    const auto kinetic_energy = has_velocities ? fmt::format("{}", system.kineticEnergy()) : "-"s;
    const auto density = system.cell ? fmt::format("{}", system.density()) : "-"s;
    *stream << fmt::format("{} {} {} {}\n", simulation.currentStep(), temperature, density, kinetic_energy);
    if (!*stream) {
        throw IOError("error writing to '{}'", filename);
    }
}

void WriterThermo::_to_json(json& j) const { j["file"] = filename; }

WriterConfig::WriterConfig(const std::string& filename, const std::vector<std::string>& fields, Scheduler scheduler)
    : Observer("trajectory", scheduler)
    , trajectory(filename, TrajectoryXYZ::Mode::WRITE) {
    if (!fields.empty()) {
        trajectory.fields = fields;
    }
}

void WriterConfig::_sample(Simulation& simulation) { trajectory.write(simulation.system(), simulation.currentStep()); }

void WriterConfig::_to_json(json& j) const {
    j["file"] = trajectory.getFilename();
    j["fields"] = trajectory.fields;
    j["frames"] = trajectory.size();
}

WriterCheckpoint::WriterCheckpoint(const std::string& filename, Scheduler scheduler)
    : Observer("checkpoint", scheduler)
    , filename(filename) {}

void WriterCheckpoint::_sample(Simulation& simulation) {
    saveCheckpoint(filename, {simulation.currentStep(), simulation.system()});
}

void WriterCheckpoint::_to_json(json& j) const { j["file"] = filename; }

void MeanSquareDisplacement::operator()(Simulation& simulation, std::map<long, double>& msd) const {
    msd[simulation.currentStep()] = simulation.system().meanSquareDisplacement(simulation.initialSystem());
}

DisplacementAnalysis::DisplacementAnalysis(Scheduler scheduler)
    : Observer("msd", scheduler) {}

void DisplacementAnalysis::_sample(Simulation& simulation) { MeanSquareDisplacement()(simulation, msd); }

void DisplacementAnalysis::_to_json(json& j) const {
    j["msd"] = json::array();
    for (const auto& [step, value] : msd) {
        j["msd"].push_back({step, value});
    }
}

const std::map<long, double>& DisplacementAnalysis::getMeanSquareDisplacement() const { return msd; }

namespace {
/**
 * `interval` or `calls`; the latter distributed over `target_steps` unless a
 * `target` is given explicitly.
 */
Scheduler makeScheduler(const json& j, const long target_steps, const bool at_end = false) {
    auto scheduler_json = j;
    if (j.contains("calls") && !j.contains("target")) {
        scheduler_json["target"] = target_steps;
    }
    auto scheduler = scheduler_json.get<Scheduler>();
    if (!j.contains("at_end")) {
        scheduler.at_end = at_end;
    }
    return scheduler;
}
} // namespace

std::unique_ptr<Observer> createObserver(const std::string& name, const json& j, const long target_steps) {
    try {
        if (name == "target_steps") {
            return std::make_unique<TargetSteps>(j.at("steps").get<long>());
        } else if (name == "target_rmsd") {
            return std::make_unique<TargetRMSD>(j.at("rmsd").get<double>(), makeScheduler(j, target_steps));
        } else if (name == "target_walltime") {
            return std::make_unique<TargetWallTime>(j.at("seconds").get<double>(), makeScheduler(j, target_steps));
        } else if (name == "thermo") {
            return std::make_unique<WriterThermo>(j.at("file").get<std::string>(), makeScheduler(j, target_steps));
        } else if (name == "trajectory") {
            return std::make_unique<WriterConfig>(j.at("file").get<std::string>(),
                                                  j.value("fields", std::vector<std::string>()),
                                                  makeScheduler(j, target_steps));
        } else if (name == "checkpoint") {
            return std::make_unique<WriterCheckpoint>(j.at("file").get<std::string>(),
                                                      makeScheduler(j, target_steps, true));
        } else if (name == "msd") {
            return std::make_unique<DisplacementAnalysis>(makeScheduler(j, target_steps));
        }
        // append more observers here...
        throw ConfigurationError("unknown observer");
    } catch (std::exception& e) {
        throw ConfigurationError("{}: {}", name, e.what()).attachJson(j);
    }
}

/**
 * @param j The `simulation` section, e.g. `{"steps": 1000, "thermo": {"file": "thermo.dat", "interval": 10}}`
 * @param target_steps Number of steps of the run
 */
CombinedObservers::CombinedObservers(const json& j, const long target_steps) {
    const std::vector<std::pair<std::string, std::string>> keys_and_names = {
        {"thermo", "thermo"},          {"trajectory", "trajectory"}, {"msd", "msd"},
        {"rmsd", "target_rmsd"},       {"walltime", "target_walltime"}, {"checkpoint", "checkpoint"}};
    for (const auto& [key, name] : keys_and_names) {
        if (auto it = j.find(key); it != j.end()) {
            observers.push_back(createObserver(name, *it, target_steps));
            particula_logger->debug("added observer {}", name);
        }
    }
}

/**
 * The observers must outlive the simulation.
 */
void CombinedObservers::attach(Simulation& simulation) {
    for (auto& observer : observers) {
        simulation.add([&observer = *observer](Simulation& s) { observer(s); }, observer->scheduler);
    }
}

size_t CombinedObservers::size() const { return observers.size(); }

void to_json(json& j, const CombinedObservers& combined) {
    j = json::array();
    for (const auto& observer : combined.observers) {
        json j_observer;
        observer->to_json(j_observer);
        j.push_back(j_observer);
    }
}

TEST_SUITE_BEGIN("Analysis");

namespace {
//! Translates all particles by a unit step along x per step
class ShiftBackend : public Backend {
    System shifted_system;

  public:
    ShiftBackend()
        : shifted_system(ParticleVector(3), Cell(10.0)) {}
    System& system() override { return shifted_system; }
    void advance(long steps) override {
        for (auto& particle : shifted_system.particles) {
            particle.pos.x() += static_cast<double>(steps);
        }
    }
};

//! Unique name in the temporary directory so that concurrent test runs do not collide
std::string temporaryFilename(const std::string& basename) {
    return (std::filesystem::temp_directory_path() / fmt::format("{}-{}", std::random_device()(), basename)).string();
}
} // namespace

TEST_CASE("[Particula] Targets") {
    ShiftBackend backend;
    Simulation simulation(backend);

    SUBCASE("steps") {
        TargetSteps target(20);
        simulation.add([&](Simulation& s) { target(s); }, target.scheduler);
        const auto report = simulation.run(100);
        CHECK(report.stopped());
        CHECK(simulation.currentStep() == 20);
        CHECK(target.getNumberOfSamples() == 1);
    }

    SUBCASE("rmsd") {
        TargetRMSD target(5.0, Scheduler(1));
        simulation.add([&](Simulation& s) { target(s); }, target.scheduler);
        const auto report = simulation.run(100);
        CHECK(report.termination == RunReport::Termination::STOPPED);
        CHECK(simulation.currentStep() == 5);
        CHECK(simulation.rmsd() == doctest::Approx(5.0));
    }

    SUBCASE("wall time") {
        TargetWallTime target(0.0, Scheduler(10));
        simulation.add([&](Simulation& s) { target(s); }, target.scheduler);
        const auto report = simulation.run(100);
        CHECK(report.termination == RunReport::Termination::WALL_TIME_LIMIT);
        CHECK(simulation.currentStep() == 10);
    }
}

TEST_CASE("[Particula] Writers") {
    ShiftBackend backend;
    Simulation simulation(backend);

    SUBCASE("thermo") {
        const auto filename = temporaryFilename("particula_thermo.dat");
        {
            WriterThermo writer(filename, Scheduler(10));
            simulation.add([&](Simulation& s) { writer(s); }, writer.scheduler);
            simulation.run(20);
        }
        std::ifstream stream(filename);
        std::string line;
        std::vector<std::string> lines;
        while (std::getline(stream, line)) {
            lines.push_back(line);
        }
        REQUIRE(lines.size() == 3);
        CHECK(lines[0].front() == '#');
        CHECK(lines[1] == "10 - 0.003 -");
        std::filesystem::remove(filename);
    }

    SUBCASE("trajectory") {
        const auto filename = temporaryFilename("particula_writer.xyz");
        {
            WriterConfig writer(filename, {"species", "position", "mass"}, Scheduler(10));
            simulation.add([&](Simulation& s) { writer(s); }, writer.scheduler);
            simulation.run(30);
        }
        TrajectoryXYZ trajectory(filename, TrajectoryXYZ::Mode::READ);
        CHECK(trajectory.steps() == std::vector<long>{10, 20, 30});
        CHECK(trajectory.fields.size() == 3);
        CHECK(trajectory[-1].particles[0].pos.x() == 30.0);
        CHECK(trajectory[0].cell->volume() == doctest::Approx(1000.0));
        trajectory.close();
        std::filesystem::remove(filename);
    }

    SUBCASE("checkpoint") {
        const auto filename = temporaryFilename("particula_checkpoint.bin");
        Scheduler scheduler(10);
        scheduler.at_end = true;
        WriterCheckpoint writer(filename, scheduler);
        simulation.add([&](Simulation& s) { writer(s); }, writer.scheduler);
        simulation.run(25);
        CHECK(writer.getNumberOfSamples() == 3);
        const auto checkpoint = loadCheckpoint(filename);
        CHECK(checkpoint.step == 25);
        CHECK(checkpoint.system.size() == 3);
        CHECK(checkpoint.system.particles[1].pos.x() == 25.0);
        CHECK(checkpoint.system.cell.has_value());
        CHECK_THROWS_AS(loadCheckpoint(filename + ".missing"), IOError);
        std::filesystem::remove(filename);
    }
}

TEST_CASE("[Particula] MeanSquareDisplacement") {
    ShiftBackend backend;
    Simulation simulation(backend);
    std::map<long, double> msd;
    simulation.add(MeanSquareDisplacement(), 5, msd);
    DisplacementAnalysis analysis(Scheduler(10));
    simulation.add([&](Simulation& s) { analysis(s); }, analysis.scheduler);
    simulation.run(20);
    CHECK(msd.size() == 4);
    CHECK(msd.at(5) == doctest::Approx(25.0));
    CHECK(msd.at(20) == doctest::Approx(400.0));
    CHECK(analysis.getMeanSquareDisplacement().size() == 2);
    json j = analysis;
    CHECK(j.at("msd").at("msd").size() == 2);
    CHECK(j.at("msd").at("samples") == 2);
}

TEST_CASE("[Particula] Observer errors") {
    ShiftBackend backend;
    Simulation simulation(backend);

    //! Observer failing on every sample
    class Failing : public Observer {
        void _sample(Simulation&) override {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            throw std::runtime_error("failure");
        }

      public:
        Failing()
            : Observer("failing", Scheduler(5)) {}
    } failing;

    simulation.add([&](Simulation& s) { failing(s); }, failing.scheduler);
    CHECK_THROWS_AS(simulation.run(10), GenericError);
    CHECK(simulation.currentStep() == 5);
    CHECK(failing.getNumberOfSamples() == 1);
    json j = failing;
    CHECK(j.at("failing").contains("relative time")); // failed samples are timed, too
}

TEST_CASE("[Particula] createObserver") {
    CHECK_THROWS_AS(createObserver("unicorn", json::object(), 100), ConfigurationError);
    CHECK_THROWS_AS(createObserver("target_rmsd", R"({"rmsd": 1.0})"_json, 100), ConfigurationError);

    auto observer = createObserver("target_walltime", R"({"seconds": 10, "calls": 4})"_json, 100);
    CHECK(observer->name == "target_walltime");
    CHECK(observer->scheduler.getInterval() == 25);

    const auto filename = temporaryFilename("particula_checkpoint.bin");
    observer = createObserver("checkpoint", {{"file", filename}, {"interval", 10}}, 100);
    CHECK(observer->scheduler.at_end); // checkpoints are saved at the end of a run by default

    CombinedObservers combined(R"({"steps": 100, "msd": {"interval": 10}, "rmsd": {"rmsd": 3.0, "interval": 1}})"_json,
                               100);
    CHECK(combined.size() == 2);
    ShiftBackend backend;
    Simulation simulation(backend);
    combined.attach(simulation);
    const auto report = simulation.run(100);
    CHECK(report.stopped());
    CHECK(simulation.currentStep() == 3);
    json j = combined;
    CHECK(j.size() == 2);
}

TEST_SUITE_END();

} // namespace Analysis
} // namespace Particula
