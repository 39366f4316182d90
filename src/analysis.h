#pragma once

#include "simulation.h"
#include "io.h"
#include <map>
#include <memory>
#include <string_view>

namespace Particula {

//! Step and system stored in a binary checkpoint
struct Checkpoint {
    long step = 0;
    System system;
    template <class Archive> void serialize(Archive& archive) { archive(step, system); }
};

void saveCheckpoint(const std::string& filename, const Checkpoint& checkpoint); //!< Write cereal binary checkpoint
Checkpoint loadCheckpoint(const std::string& filename);                        //!< Read cereal binary checkpoint

/**
 * @brief Observers that are notified by a `Simulation` at scheduled steps
 *
 * Observers either stop the simulation (targets), write to disk (writers)
 * or accumulate statistics. All are created from json by name:
 *
 * Name              | Description
 * :---------------- | :----------------------------------------------------------
 * `target_steps`    | Stop when `steps` is reached
 * `target_rmsd`     | Stop when root mean square displacement reaches `rmsd`
 * `target_walltime` | Stop when `seconds` of wall time have elapsed
 * `thermo`          | Write step, temperature, density and kinetic energy to `file`
 * `trajectory`      | Append frames with `fields` to xyz `file`
 * `checkpoint`      | Save binary checkpoint to `file`; also at the end of a run
 * `msd`             | Mean square displacement as a function of step
 */
namespace Analysis {

/**
 * @brief Base class for all observers
 *
 * `operator()` is registered with a `Simulation` and times the derived
 * class' `_sample()`. Stop signals are passed on unchanged; other errors
 * are nested in a `GenericError` naming the observer.
 */
class Observer {
  private:
    virtual void _sample(Simulation& simulation) = 0; //!< Perform sample event
    virtual void _to_json(json& j) const;             //!< Provide json information
    int number_of_samples = 0;                        //!< Counter for number of samples
    TimeRelativeOfTotal<std::chrono::microseconds> timer; //!< Timer to benchmark `_sample()`

  public:
    const std::string name; //!< Descriptive name
    Scheduler scheduler;    //!< When to sample
    void operator()(Simulation& simulation); //!< Sample
    void to_json(json& j) const;             //!< JSON report w. statistics, output etc.
    int getNumberOfSamples() const;
    Observer(std::string_view name, Scheduler scheduler);
    virtual ~Observer() = default;
};

void to_json(json& j, const Observer& observer);

//! Stop simulation when the current step reaches a target
class TargetSteps : public Observer {
    long target_steps;
    void _sample(Simulation& simulation) override;
    void _to_json(json& j) const override;

  public:
    explicit TargetSteps(long target_steps);
};

//! Stop simulation when the root mean square displacement reaches a target
class TargetRMSD : public Observer {
    double target_rmsd;
    void _sample(Simulation& simulation) override;
    void _to_json(json& j) const override;

  public:
    TargetRMSD(double target_rmsd, Scheduler scheduler);
};

//! Stop simulation with a `WallTimeLimit` when the elapsed wall time exceeds a limit
class TargetWallTime : public Observer {
    double wall_time_limit; //!< Seconds
    void _sample(Simulation& simulation) override;
    void _to_json(json& j) const override;

  public:
    TargetWallTime(double wall_time_limit, Scheduler scheduler);
};

/**
 * @brief Write thermodynamic properties to a text file
 *
 * Columns are step, kinetic temperature, density and kinetic energy. Values
 * that are undefined, e.g. temperature without velocities, are written as `-`.
 */
class WriterThermo : public Observer {
    std::string filename;
    std::unique_ptr<std::ostream> stream;
    void _sample(Simulation& simulation) override;
    void _to_json(json& j) const override;

  public:
    WriterThermo(const std::string& filename, Scheduler scheduler);
};

//! Append the current system to an xyz trajectory
class WriterConfig : public Observer {
    TrajectoryXYZ trajectory;
    void _sample(Simulation& simulation) override;
    void _to_json(json& j) const override;

  public:
    WriterConfig(const std::string& filename, const std::vector<std::string>& fields, Scheduler scheduler);
};

//! Save binary checkpoint of step and system; the file is replaced on each call
class WriterCheckpoint : public Observer {
    std::string filename;
    void _sample(Simulation& simulation) override;
    void _to_json(json& j) const override;

  public:
    WriterCheckpoint(const std::string& filename, Scheduler scheduler);
};

/**
 * @brief Mean square displacement relative to the initial system, keyed by step
 *
 * May be used directly with a shared accumulator:
 *
 * ```{.cpp}
 *     std::map<long, double> msd;
 *     simulation.add(MeanSquareDisplacement(), 100, msd);
 * ```
 */
struct MeanSquareDisplacement {
    void operator()(Simulation& simulation, std::map<long, double>& msd) const;
};

//! Observer wrapping `MeanSquareDisplacement` with its own accumulator
class DisplacementAnalysis : public Observer {
    std::map<long, double> msd;
    void _sample(Simulation& simulation) override;
    void _to_json(json& j) const override;

  public:
    explicit DisplacementAnalysis(Scheduler scheduler);
    const std::map<long, double>& getMeanSquareDisplacement() const;
};

/**
 * @brief Create observer from json
 * @param name Name of observer
 * @param j Configuration of observer
 * @param target_steps Number of steps of the run; used for `calls` scheduling
 * @throw ConfigurationError if unknown or if the configuration is invalid
 */
std::unique_ptr<Observer> createObserver(const std::string& name, const json& j, long target_steps);

/**
 * @brief Collection of observers set up from the `simulation` section of the input
 *
 * Writers are registered before targets, and checkpoints last so that they
 * see the final state.
 */
class CombinedObservers {
    std::vector<std::unique_ptr<Observer>> observers;

  public:
    CombinedObservers(const json& j, long target_steps);
    void attach(Simulation& simulation); //!< Register all observers with a simulation
    size_t size() const;
    friend void to_json(json& j, const CombinedObservers& combined);
};

} // namespace Analysis
} // namespace Particula
