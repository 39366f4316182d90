#include <doctest/doctest.h>
#include "simulation.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/chrono.h>

namespace Particula {

std::string Backend::name() const { return "backend"; }

void Backend::to_json([[maybe_unused]] json& j) const {}

void to_json(json& j, const Backend& backend) {
    j = json::object();
    backend.to_json(j);
    j["name"] = backend.name();
}

Scheduler::Scheduler(const long interval)
    : interval(interval) {
    if (interval <= 0) {
        throw PreconditionError("scheduler interval must be positive, got {}", interval);
    }
}

/**
 * @param calls Number of calls over the target
 * @param target_steps Number of steps over which to distribute the calls
 * @throw PreconditionError if `calls` is not positive or if `target_steps` is negative
 */
Scheduler Scheduler::fromCalls(const long calls, const long target_steps) {
    if (calls <= 0 || target_steps < 0) {
        throw PreconditionError("cannot schedule {} calls over {} steps", calls, target_steps);
    }
    return Scheduler(std::max(1L, target_steps / calls));
}

long Scheduler::getInterval() const { return interval; }

bool Scheduler::enabled() const { return interval > 0; }

bool Scheduler::now(const long step) const { return enabled() && step % interval == 0; }

/**
 * Disabled schedulers return the largest representable step.
 */
long Scheduler::next(const long step) const {
    if (!enabled()) {
        return std::numeric_limits<long>::max();
    }
    return (step / interval + 1) * interval;
}

void from_json(const json& j, Scheduler& scheduler) {
    try {
        if (j.is_number_integer()) {
            scheduler = Scheduler(j.get<long>());
        } else if (auto it = j.find("interval"); it != j.end()) {
            scheduler = Scheduler(it->get<long>());
        } else if (auto it = j.find("calls"); it != j.end()) {
            if (!j.contains("target")) {
                throw ConfigurationError("scheduling by number of calls requires a target");
            }
            scheduler = Scheduler::fromCalls(it->get<long>(), j.at("target").get<long>());
        } else {
            throw ConfigurationError("'interval' or 'calls' expected");
        }
        if (j.is_object()) {
            scheduler.at_end = j.value("at_end", false);
        }
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationError("scheduler: {}", e.what()).attachJson(j);
    }
}

void to_json(json& j, const Scheduler& scheduler) {
    j = {{"interval", scheduler.getInterval()}};
    if (scheduler.at_end) {
        j["at_end"] = true;
    }
}

bool RunReport::stopped() const { return termination != Termination::COMPLETED; }

void to_json(json& j, const RunReport& report) {
    const std::map<RunReport::Termination, std::string> names = {{RunReport::Termination::COMPLETED, "completed"},
                                                                 {RunReport::Termination::STOPPED, "stopped"},
                                                                 {RunReport::Termination::WALL_TIME_LIMIT,
                                                                  "wall time limit"}};
    j = {{"backend", report.backend},
         {"termination", names.at(report.termination)},
         {"initial step", report.initial_step},
         {"target step", report.target_step},
         {"final step", report.final_step},
         {"number of particles", report.number_of_particles},
         {"start time", report.start_time},
         {"end time", report.end_time},
         {"wall time", roundValue(report.wall_time)},
         {"wall time per step and particle", roundValue(report.wall_time_per_step_and_particle)}};
    if (!report.message.empty()) {
        j["message"] = report.message;
    }
}

namespace {
std::string timeStamp() {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}",
                       std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}
} // namespace

/**
 * @param backend Backend to drive; must outlive the simulation
 * @param current_step Initial step, e.g. when restarting from a checkpoint
 */
Simulation::Simulation(Backend& backend, const long current_step)
    : backend(backend)
    , current_step(current_step)
    , initial_step(current_step)
    , reference_system(backend.system()) {}

Backend& Simulation::getBackend() { return backend; }

const Backend& Simulation::getBackend() const { return backend; }

System& Simulation::system() { return backend.system(); }

const System& Simulation::initialSystem() const { return reference_system; }

long Simulation::currentStep() const { return current_step; }

double Simulation::elapsedWallTime() const { return stopwatch.seconds(); }

/**
 * Zero if no steps have been taken in the current or last run.
 */
double Simulation::wallTimePerStep() const {
    const auto steps = current_step - initial_step;
    return steps > 0 ? elapsedWallTime() / static_cast<double>(steps) : 0.0;
}

double Simulation::rmsd() const { return std::sqrt(backend.system().meanSquareDisplacement(reference_system)); }

void Simulation::add(Callback callback, const long interval) { add(std::move(callback), Scheduler(interval)); }

/**
 * @throw PreconditionError if the callback is empty
 */
void Simulation::add(Callback callback, Scheduler scheduler) {
    if (!callback) {
        throw PreconditionError("cannot add empty callback");
    }
    observers.push_back({std::move(callback), scheduler});
    simulation_logger->debug("added callback #{} with interval {}", observers.size(), scheduler.getInterval());
}

void Simulation::notify() {
    for (auto& observer : observers) {
        if (observer.scheduler.now(current_step)) {
            observer.last_call = current_step;
            observer.callback(*this);
        }
    }
}

namespace {
//! Store the first stop signal of a run in the report
void recordStop(RunReport& report, const SimulationEnd& signal) {
    if (report.stopped()) {
        return;
    }
    report.termination = dynamic_cast<const WallTimeLimit*>(&signal) != nullptr
                             ? RunReport::Termination::WALL_TIME_LIMIT
                             : RunReport::Termination::STOPPED;
    report.message = signal.what();
}
} // namespace

/**
 * Every `at_end` callback is invoked even if an earlier one raises a stop signal.
 */
void Simulation::finalize(RunReport& report) {
    for (auto& observer : observers) {
        if (observer.scheduler.at_end && observer.last_call != current_step) {
            observer.last_call = current_step;
            try {
                observer.callback(*this);
            } catch (const SimulationEnd& signal) {
                recordStop(report, signal);
            }
        }
    }
}

/**
 * @throw PreconditionError if `steps` is negative
 */
RunReport Simulation::run(const long steps) {
    if (steps < 0) {
        throw PreconditionError("number of steps must be non-negative, got {}", steps);
    }
    return runUntil(current_step + steps);
}

/**
 * If a stop signal is raised by the backend, the steps of the unfinished
 * batch are not counted.
 *
 * @throw PreconditionError if `target_step` is behind the current step
 */
RunReport Simulation::runUntil(const long target_step) {
    if (target_step < current_step) {
        throw PreconditionError("target step {} is behind current step {}", target_step, current_step);
    }
    RunReport report;
    report.backend = backend.name();
    report.initial_step = current_step;
    report.target_step = target_step;
    report.start_time = timeStamp();
    initial_step = current_step;
    stopwatch.start();

    simulation_logger->info("backend: {}", report.backend);
    simulation_logger->info("running from step {} to {} with {} callback(s)", current_step, target_step,
                            observers.size());
    try {
        while (current_step < target_step) {
            auto next_step = target_step;
            for (const auto& observer : observers) {
                next_step = std::min(next_step, observer.scheduler.next(current_step));
            }
            backend.advance(next_step - current_step);
            current_step = next_step;
            simulation_logger->debug("step = {}/{}, wall time per step = {:.2e} s", current_step, target_step,
                                     wallTimePerStep());
            notify();
        }
    } catch (const SimulationEnd& signal) {
        recordStop(report, signal);
    }
    finalize(report);

    report.final_step = current_step;
    report.end_time = timeStamp();
    report.wall_time = elapsedWallTime();
    report.number_of_particles = backend.system().size();
    const auto particle_steps = static_cast<double>(current_step - initial_step) *
                                static_cast<double>(report.number_of_particles);
    if (particle_steps > 0.0) {
        report.wall_time_per_step_and_particle = report.wall_time / particle_steps;
    }

    if (report.stopped()) {
        simulation_logger->info("simulation stopped at step {}: {}", current_step, report.message);
    } else {
        simulation_logger->info("simulation completed at step {}", current_step);
    }
    simulation_logger->info("started {}, ended {}", report.start_time, report.end_time);
    simulation_logger->info("wall time = {:.3f} s; {:.3e} s per step and particle", report.wall_time,
                            report.wall_time_per_step_and_particle);
    return report;
}

void to_json(json& j, const Simulation& simulation) {
    to_json(j["backend"], simulation.getBackend());
    j["current step"] = simulation.currentStep();
}

TEST_SUITE_BEGIN("Simulation");

namespace {
//! Backend that only records how it is advanced
class CountingBackend : public Backend {
    System particles;

  public:
    std::vector<long> batches;  //!< Requested batch sizes
    long stop_after = -1;       //!< Raise stop signal once this many steps have been taken
    long steps_taken = 0;
    explicit CountingBackend(size_t number_of_particles = 2)
        : particles(ParticleVector(number_of_particles)) {}
    System& system() override { return particles; }
    void advance(long steps) override {
        batches.push_back(steps);
        steps_taken += steps;
        for (auto& particle : particles.particles) {
            particle.pos.x() += static_cast<double>(steps);
        }
        if (stop_after >= 0 && steps_taken >= stop_after) {
            throw SimulationEnd("backend reached {} steps", steps_taken);
        }
    }
    std::string name() const override { return "counter"; }
};
} // namespace

TEST_CASE("[Particula] Scheduler") {
    Scheduler scheduler(10);
    CHECK(scheduler.now(0));
    CHECK(scheduler.now(20));
    CHECK_FALSE(scheduler.now(5));
    CHECK(scheduler.next(0) == 10);
    CHECK(scheduler.next(9) == 10);
    CHECK(scheduler.next(10) == 20);

    Scheduler disabled;
    CHECK_FALSE(disabled.enabled());
    CHECK_FALSE(disabled.now(0));
    CHECK(disabled.next(100) == std::numeric_limits<long>::max());

    CHECK(Scheduler::fromCalls(10, 5000).getInterval() == 500);
    CHECK(Scheduler::fromCalls(10, 5).getInterval() == 1);
    CHECK_THROWS_AS(Scheduler(0), PreconditionError);
    CHECK_THROWS_AS(Scheduler::fromCalls(0, 100), PreconditionError);

    scheduler = R"( {"calls": 4, "target": 100, "at_end": true} )"_json;
    CHECK(scheduler.getInterval() == 25);
    CHECK(scheduler.at_end);
    scheduler = R"( {"interval": 3} )"_json;
    CHECK(scheduler.getInterval() == 3);
    CHECK_THROWS_AS(scheduler = R"( {"calls": 4} )"_json, ConfigurationError);
    CHECK_THROWS_AS(scheduler = R"( {"interval": -1} )"_json, ConfigurationError);
}

TEST_CASE("[Particula] Simulation") {
    CountingBackend backend;
    Simulation simulation(backend);
    CHECK(simulation.currentStep() == 0);

    SUBCASE("steps accumulate") {
        simulation.run(10);
        simulation.run(20);
        CHECK(simulation.currentStep() == 30);
        CHECK(backend.steps_taken == 30);
        simulation.runUntil(45);
        CHECK(simulation.currentStep() == 45);
        simulation.run(0);
        simulation.runUntil(45);
        CHECK(simulation.currentStep() == 45);
    }

    SUBCASE("run then runUntil") {
        simulation.run(10);
        const auto report = simulation.runUntil(30);
        CHECK(simulation.currentStep() == 30);
        CHECK(report.initial_step == 10);
        CHECK(report.final_step == 30);
        CHECK(report.backend == "counter");
        CHECK(report.number_of_particles == 2);
        CHECK_FALSE(report.stopped());
    }

    SUBCASE("preconditions") {
        CHECK_THROWS_AS(simulation.run(-1), PreconditionError);
        simulation.run(5);
        CHECK_THROWS_AS(simulation.runUntil(simulation.currentStep() - 1), PreconditionError);
        CHECK(simulation.currentStep() == 5);
        CHECK_THROWS_AS(simulation.add(Simulation::Callback(), 10), PreconditionError);
        CHECK_THROWS_AS(simulation.add([](Simulation&) {}, 0), PreconditionError);
    }

    SUBCASE("callbacks fire at multiples of the interval") {
        std::vector<long> calls;
        simulation.add([&](Simulation& s) { calls.push_back(s.currentStep()); }, 10);
        simulation.run(30);
        CHECK(calls == std::vector<long>{10, 20, 30});
        CHECK(backend.batches == std::vector<long>{10, 10, 10}); // batch advance to next due step
        simulation.run(5); // resume; nothing due
        CHECK(calls.size() == 3);
        simulation.run(5);
        CHECK(calls.back() == 40);
    }

    SUBCASE("registration order and mixed intervals") {
        std::vector<std::string> calls;
        simulation.add([&](Simulation& s) { calls.push_back(fmt::format("a{}", s.currentStep())); }, 2);
        simulation.add([&](Simulation& s) { calls.push_back(fmt::format("b{}", s.currentStep())); }, 3);
        simulation.run(6);
        CHECK(calls == std::vector<std::string>{"a2", "b3", "a4", "a6", "b6"});
        CHECK(backend.batches == std::vector<long>{2, 1, 1, 2});
    }

    SUBCASE("bound arguments are shared") {
        std::map<long, double> accumulator;
        int counter = 0;
        auto function = [](Simulation& s, std::map<long, double>& values, int& count) {
            values[s.currentStep()] = s.system().particles.front().pos.x();
            count++;
        };
        simulation.add(function, 5, accumulator, counter);
        simulation.run(20);
        CHECK(counter == 4);
        CHECK(accumulator.size() == 4);
        CHECK(accumulator.at(15) == 15.0);
        simulation.run(5);
        CHECK(counter == 5); // keeps accumulating across runs
    }

    SUBCASE("stop signal from callback") {
        std::vector<long> calls;
        simulation.add([&](Simulation& s) { calls.push_back(s.currentStep()); }, 10);
        simulation.add(
            [](Simulation& s) {
                if (s.currentStep() >= 20) {
                    throw SimulationEnd("enough");
                }
            },
            10);
        simulation.add([&](Simulation& s) { calls.push_back(-s.currentStep()); }, 10);
        RunReport report;
        CHECK_NOTHROW(report = simulation.run(100));
        CHECK(report.stopped());
        CHECK(report.termination == RunReport::Termination::STOPPED);
        CHECK(report.message == "enough");
        CHECK(report.final_step == 20);
        CHECK(simulation.currentStep() == 20);
        CHECK(calls == std::vector<long>{10, -10, 20}); // callbacks after the stop are skipped
        json j = report;
        CHECK(j.at("termination") == "stopped");
    }

    SUBCASE("stop signal from backend") {
        backend.stop_after = 15;
        const auto report = simulation.run(100);
        CHECK(report.stopped());
        CHECK(simulation.currentStep() == 0); // unfinished batch is not counted
        CHECK(backend.batches.size() == 1);
    }

    SUBCASE("wall time limit") {
        simulation.add([](Simulation&) { throw WallTimeLimit("out of time"); }, 1);
        const auto report = simulation.run(10);
        CHECK(report.termination == RunReport::Termination::WALL_TIME_LIMIT);
        CHECK(simulation.currentStep() == 1);
    }

    SUBCASE("other errors propagate") {
        simulation.add([](Simulation&) { throw std::runtime_error("broken"); }, 10);
        CHECK_THROWS_AS(simulation.run(100), std::runtime_error);
        CHECK(simulation.currentStep() == 10);
    }

    SUBCASE("at_end callbacks") {
        std::vector<long> calls;
        Scheduler scheduler(10);
        scheduler.at_end = true;
        simulation.add([&](Simulation& s) { calls.push_back(s.currentStep()); }, scheduler);
        simulation.run(25);
        CHECK(calls == std::vector<long>{10, 20, 25});
        simulation.run(5);
        CHECK(calls == std::vector<long>{10, 20, 25, 30}); // not called twice at step 30
    }

    SUBCASE("stop signal from at_end callback") {
        std::vector<long> calls;
        Scheduler scheduler(10);
        scheduler.at_end = true;
        simulation.add([](Simulation&) { throw WallTimeLimit("out of time"); }, scheduler);
        simulation.add([&](Simulation& s) { calls.push_back(s.currentStep()); }, scheduler);
        RunReport report;
        CHECK_NOTHROW(report = simulation.run(5));
        CHECK(report.stopped());
        CHECK(report.termination == RunReport::Termination::WALL_TIME_LIMIT);
        CHECK(report.message == "out of time");
        CHECK(report.final_step == 5);
        CHECK(calls == std::vector<long>{5}); // later at_end callbacks still run
    }

    SUBCASE("restart from a given step") {
        Simulation restarted(backend, 100);
        std::vector<long> calls;
        restarted.add([&](Simulation& s) { calls.push_back(s.currentStep()); }, 30);
        restarted.run(50);
        CHECK(restarted.currentStep() == 150);
        CHECK(calls == std::vector<long>{120, 150});
    }

    SUBCASE("wall time and rmsd") {
        simulation.run(3);
        CHECK(simulation.elapsedWallTime() >= 0.0);
        CHECK(simulation.wallTimePerStep() >= 0.0);
        CHECK(simulation.rmsd() == doctest::Approx(3.0));
        CHECK(simulation.initialSystem().particles.front().pos.x() == 0.0);
        json j = simulation;
        CHECK(j.at("current step") == 3);
        CHECK(j.at("backend").at("name") == "counter");
    }
}

TEST_SUITE_END();

} // namespace Particula
