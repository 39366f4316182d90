#define DOCTEST_CONFIG_IMPLEMENT
#define DOCTEST_CONFIG_SUPER_FAST_ASSERTS

#include <doctest/doctest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "core.h"

int main(int argc, char** argv) {
    Particula::particula_logger = spdlog::basic_logger_mt("particula", "unittests.log", true);
    Particula::particula_logger->set_pattern("%L: %v");
    Particula::particula_logger->set_level(spdlog::level::debug);
    Particula::simulation_logger = Particula::particula_logger;

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
