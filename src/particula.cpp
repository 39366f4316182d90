#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "analysis.h"
#include "backend.h"
#include <docopt.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>

using namespace Particula;

int runUnittests(int argc, const char* const* argv);
void setInformationLevelAndLoggers(bool quiet, docopt::Options& args);
json getUserInput(docopt::Options& args);
std::optional<Checkpoint> loadState(docopt::Options& args);
void showErrorMessage(const std::exception& exception);
void saveOutput(std::chrono::steady_clock::time_point starting_time, docopt::Options& args,
                Simulation& simulation, const RunReport& report,
                const Analysis::CombinedObservers& observers);

static const char USAGE[] =
    R"(Particula - particle simulation toolkit

    Usage:
      particula [-q] [--verbosity <N>] [--state=<file>] [--input=<file>] [--output=<file>]
      particula (-h | --help)
      particula --version
      particula test <doctest-options>...

    Options:
      -i <file> --input <file>   Input file [default: /dev/stdin].
      -o <file> --output <file>  Output file [default: out.json].
      -s <file> --state <file>   Binary checkpoint to start from.
      -v <N> --verbosity <N>     Log verbosity level (0 = off, 1 = critical, ..., 6 = trace) [default: 4]
      -q --quiet                 Less verbose output. It implicates -v0.
      -h --help                  Show this screen.
      --version                  Show version.
)";

int main(int argc, const char** argv) {
    if (argc > 1) { // run unittests if the first argument equals "test"
        if (std::string(argv[1]) == "test") {
            return runUnittests(argc, argv);
        }
    }
    try {
        const auto starting_time = std::chrono::steady_clock::now();
        auto args = docopt::docopt(USAGE, {argv + 1, argv + argc}, true, "Particula");
        const bool quiet = args["--quiet"].asBool();
        setInformationLevelAndLoggers(quiet, args);

        const auto input = getUserInput(args);
        if (auto it = input.find("random"); it != input.end()) {
            it->get_to(Particula::random);
        }
        long initial_step = 0;
        System system;
        if (auto checkpoint = loadState(args)) {
            initial_step = checkpoint->step;
            system = std::move(checkpoint->system);
        } else {
            system = input.at("system").get<System>();
        }
        auto backend = createBackend(input.at("backend"), std::move(system));
        Simulation simulation(*backend, initial_step);

        const auto& settings = input.at("simulation");
        const auto steps = settings.at("steps").get<long>();
        Analysis::CombinedObservers observers(settings, steps);
        observers.attach(simulation);

        const auto report = simulation.run(steps); // run simulation!

        saveOutput(starting_time, args, simulation, report, observers);
        return EXIT_SUCCESS;

    } catch (std::exception& e) {
        showErrorMessage(e);
        return EXIT_FAILURE;
    }
}

void showErrorMessage(const std::exception& exception) {
    std::cerr << exception.what() << std::endl;
    displayError(*particula_logger, exception); // nested errors and attached json snippets
}

int runUnittests(int argc, const char* const* argv) {
#ifdef DOCTEST_CONFIG_DISABLE
    std::cerr << "this version of particula does not include unittests" << std::endl;
    return EXIT_FAILURE;
#else
    particula_logger = spdlog::basic_logger_mt("particula", "unittests.log", true);
    particula_logger->set_pattern("%L: %v");
    particula_logger->set_level(spdlog::level::debug);
    simulation_logger = particula_logger;
    return doctest::Context(argc, argv).run();
#endif
}

void setInformationLevelAndLoggers(bool quiet, docopt::Options& args) {
    particula_logger = spdlog::stderr_color_mt("particula");
    particula_logger->set_pattern("[%n %P] %^%L: %v%$");
    simulation_logger = spdlog::stderr_color_mt("simulation");
    simulation_logger->set_pattern("[%n %P] [%E.%f] %L: %v");

    const long log_level = spdlog::level::off - (quiet ? 0 : args["--verbosity"].asLong()); // reverse: 0 → 6 to 6 → 0
    spdlog::set_level(static_cast<spdlog::level::level_enum>(log_level));
    if (quiet) {
        std::cout.setstate(std::ios_base::failbit); // muffle stdout
    }
}

json getUserInput(docopt::Options& args) {
    try {
        json j;
        if (const auto filename = args["--input"].asString(); filename == "/dev/stdin") {
            std::cin >> j;
        } else {
            j = loadJSON(filename);
        }
        return j;
    } catch (json::parse_error& e) {
        particula_logger->error(e.what());
        throw ConfigurationError("invalid input -> {}", e.what());
    }
}

/**
 * If given, the checkpoint replaces the `system` section of the input and
 * the simulation resumes from the stored step.
 */
std::optional<Checkpoint> loadState(docopt::Options& args) {
    if (args["--state"]) {
        const auto filename = args["--state"].asString();
        particula_logger->info("loading checkpoint {}", filename);
        return loadCheckpoint(filename);
    }
    return std::nullopt;
}

void saveOutput(const std::chrono::steady_clock::time_point starting_time, docopt::Options& args,
                Simulation& simulation, const RunReport& report,
                const Analysis::CombinedObservers& observers) {
    const auto filename = args["--output"].asString();
    std::ofstream stream(filename);
    if (!stream) {
        throw IOError("could not write output file {}", filename);
    }
    json j;
    to_json(j, simulation);
    j["system"] = simulation.getBackend().system();
    j["system"].erase("particles"); // summary only
    j["run"] = report;
    j["observers"] = observers;
    j["random"] = Particula::random;
#ifdef __VERSION__
    j["compiler"] = __VERSION__;
#endif
    { // report on total simulation time
        const auto ending_time = std::chrono::steady_clock::now();
        const auto elapsed_seconds =
            std::chrono::duration_cast<std::chrono::seconds>(ending_time - starting_time).count();
        j["simulation time"] = {{"in minutes", elapsed_seconds / 60.0}, {"in seconds", elapsed_seconds}};
    }
    stream << std::setw(2) << j << std::endl;
}
