#pragma once

#include "core.h"
#include "system.h"
#include "aux/timers.h"
#include <functional>
#include <limits>

namespace Particula {

/**
 * @brief Cooperative stop signal
 *
 * May be thrown by a backend or by a callback to end a run early. The
 * runner catches it, stops advancing and reports the message as the
 * termination reason. It is never propagated to the caller.
 */
struct SimulationEnd : public GenericError {
    using GenericError::GenericError;
};

//! Stop signal raised when the wall time budget of a run is exhausted
struct WallTimeLimit : public SimulationEnd {
    using SimulationEnd::SimulationEnd;
};

/**
 * @brief Anything that owns a `System` and can advance it in steps
 *
 * The runner requests batches of steps via `advance()`. Checkpointing
 * or trajectory output is the responsibility of the backend or of
 * registered callbacks and is never invoked implicitly.
 */
class Backend {
  public:
    virtual ~Backend() = default;
    virtual System& system() = 0;             //!< System propagated by the backend
    virtual void advance(long steps) = 0;     //!< Propagate the system by `steps` steps
    virtual std::string name() const;         //!< Descriptive name used in reports
    virtual void to_json(json& j) const;      //!< Backend specific information
};

void to_json(json& j, const Backend& backend);

/**
 * @brief Decides at which steps a callback is due
 *
 * Either a fixed interval or a fixed number of calls distributed over a
 * known target step, in which case `interval = max(1, target / calls)`.
 * A default constructed scheduler is disabled and never fires.
 *
 * ```{.cpp}
 *     Scheduler a(100);                                       // every 100 steps
 *     Scheduler b = Scheduler::fromCalls(10, 5000);           // every 500 steps
 *     Scheduler c = R"( {"calls": 10, "target": 5000} )"_json; // same as b
 * ```
 */
class Scheduler {
    long interval = 0; //!< Steps between calls; zero if disabled

  public:
    bool at_end = false; //!< Also fire when a run ends at an unscheduled step

    Scheduler() = default;
    explicit Scheduler(long interval);
    static Scheduler fromCalls(long calls, long target_steps);
    long getInterval() const;
    bool enabled() const;
    bool now(long step) const;  //!< True if due at `step`
    long next(long step) const; //!< First step after `step` where due
};

void from_json(const json& j, Scheduler& scheduler);
void to_json(json& j, const Scheduler& scheduler);

/**
 * @brief Outcome of a call to `Simulation::run()` or `Simulation::runUntil()`
 */
struct RunReport {
    enum class Termination { COMPLETED, STOPPED, WALL_TIME_LIMIT };
    Termination termination = Termination::COMPLETED;
    std::string message;           //!< Message of the stop signal, if any
    std::string backend;           //!< Backend name
    long initial_step = 0;         //!< Step at which the run started
    long target_step = 0;          //!< Requested final step
    long final_step = 0;           //!< Step at which the run ended
    size_t number_of_particles = 0;
    std::string start_time;        //!< Local time stamp at start
    std::string end_time;          //!< Local time stamp at end
    double wall_time = 0.0;        //!< Seconds
    double wall_time_per_step_and_particle = 0.0; //!< Seconds; zero if no steps or particles

    bool stopped() const; //!< True if ended by a stop signal
};

void to_json(json& j, const RunReport& report);

/**
 * @brief Drives a backend and notifies callbacks at scheduled steps
 *
 * The runner advances the backend in one batch to the next step where any
 * callback is due, or to the target, and then invokes the due callbacks
 * in registration order. Callbacks never fire at the step where a run
 * starts. Repeated runs resume from the current step.
 *
 * ```{.cpp}
 *     RandomWalk backend(system, 0.1);
 *     Simulation simulation(backend);
 *     std::map<long, double> msd;
 *     simulation.add(MeanSquareDisplacement(), 10, msd); // msd is shared by reference
 *     simulation.run(1000);
 * ```
 *
 * Any exception other than `SimulationEnd` propagates to the caller.
 */
class Simulation {
  public:
    using Callback = std::function<void(Simulation&)>;

  private:
    struct Observer {
        Callback callback;
        Scheduler scheduler;
        long last_call = std::numeric_limits<long>::min(); //!< Step of last invocation
    };
    Backend& backend;
    std::vector<Observer> observers; //!< In registration order
    long current_step = 0;
    long initial_step = 0;     //!< Step at which the last run started
    System reference_system;   //!< Copy of the system upon construction
    Stopwatch stopwatch;       //!< Started at the beginning of each run
    void notify();             //!< Invoke due callbacks
    void finalize(RunReport& report); //!< Invoke unscheduled `at_end` callbacks

  public:
    explicit Simulation(Backend& backend, long current_step = 0);
    Backend& getBackend();
    const Backend& getBackend() const;
    System& system();               //!< Shortcut to the system of the backend
    const System& initialSystem() const; //!< System at construction
    long currentStep() const;
    RunReport run(long steps);            //!< Advance by `steps` steps (must be non-negative)
    RunReport runUntil(long target_step); //!< Advance to `target_step` (must not be behind current step)
    double elapsedWallTime() const;       //!< Seconds since start of current or last run
    double wallTimePerStep() const;       //!< Seconds per step in current or last run
    double rmsd() const;                  //!< Root mean square displacement relative to initial system

    void add(Callback callback, long interval); //!< Fire every `interval` steps
    void add(Callback callback, Scheduler scheduler);

    /**
     * @brief Register function with additional arguments bound by reference
     *
     * The function is called as `function(simulation, args...)`. The arguments
     * must outlive the simulation; mutations made by the function accumulate.
     */
    template <typename Function, typename... Args>
        requires(sizeof...(Args) > 0)
    void add(Function function, long interval, Args&... args) {
        add(Callback([function, &args...](Simulation& simulation) mutable { function(simulation, args...); }),
            interval);
    }
};

void to_json(json& j, const Simulation& simulation);

} // namespace Particula
