#include <doctest/doctest.h>
#include "core.h"
#include <stdexcept>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>

namespace Particula {

double roundValue(double value, const int number_of_digits) {
    std::stringstream o;
    o << std::setprecision(number_of_digits) << value;
    return std::stod(o.str());
}

/**
 * @brief Reads content of a JSON file into a JSON object
 * @param filename
 * @return json object from the file
 * @throw IOError when file cannot be read
 * @throw json::parse_error when json ill-formatted
 */
json loadJSON(const std::string& filename) {
    if (std::ifstream stream(filename); stream) {
        json j;
        stream >> j;
        return j;
    }
    throw IOError("cannot open file '{}'", filename);
}

// global loggers as a dummy instance
// they should be replaced with proper instances in particula and unittests if desired
std::shared_ptr<spdlog::logger> particula_logger = spdlog::create<spdlog::sinks::null_sink_st>("null");
std::shared_ptr<spdlog::logger> simulation_logger = particula_logger;

GenericError::GenericError(const std::exception& e) : GenericError(e.what()) {}
GenericError::GenericError(const std::runtime_error& e) : std::runtime_error(e) {}
GenericError::GenericError(const std::string& msg) : std::runtime_error(msg) {}
GenericError::GenericError(const char* msg) : std::runtime_error(msg) {}

const json& ConfigurationError::attachedJson() const { return attached_json; }

ConfigurationError& ConfigurationError::attachJson(const json& j) {
    attached_json = j;
    return *this;
}

void displayError(spdlog::logger& logger, const std::exception& e, int level) {
    const std::string padding = level > 0 ? "... " : "";
    logger.error(padding + e.what());

    // ConfigurationError can carry a JSON snippet which should be shown for debugging.
    if (const auto* config_error = dynamic_cast<const ConfigurationError*>(&e);
        config_error != nullptr && !config_error->attachedJson().empty()) {
        if (level > 0) {
            logger.debug("... JSON snippet:\n{}", config_error->attachedJson().dump(4));
        } else {
            logger.debug("JSON snippet:\n{}", config_error->attachedJson().dump(4));
        }
    }

    // Process nested exceptions in a tail recursion.
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& e) { displayError(logger, e, level + 1); }
}

TEST_SUITE_BEGIN("Core");

TEST_CASE("[Particula] Errors") {
    CHECK_THROWS_AS(throw FormatError("line {}: bad record", 3), IOError);
    CHECK_THROWS_AS(throw FormatError("line {}: bad record", 3), GenericError);
    CHECK_THROWS_AS(throw PreconditionError("negative steps"), std::runtime_error);
    try {
        throw ConfigurationError("side {} must be positive", -1.0);
    } catch (const ConfigurationError& e) {
        CHECK(std::string(e.what()) == "side -1 must be positive");
    }
    auto error = ConfigurationError("oops").attachJson({{"side", -1}});
    CHECK(error.attachedJson().at("side") == -1);
}

TEST_CASE("[Particula] Point json") {
    Point a = json::parse("[1.0, 2.0]").get<Point>();
    CHECK(a.size() == 2);
    CHECK(a.y() == doctest::Approx(2.0));
    CHECK(json(a) == json::parse("[1.0, 2.0]"));
    CHECK(zeroPoint().size() == 3);
    CHECK_THROWS(json::parse("{}").get<Point>());
    CHECK(roundValue(1.23456) == doctest::Approx(1.23));
}

TEST_SUITE_END();

} // namespace Particula

namespace Eigen {

void to_json(nlohmann::json& j, const Particula::Point& point) {
    j = nlohmann::json::array();
    for (Eigen::Index i = 0; i < point.size(); ++i) {
        j.push_back(point[i]);
    }
}

void from_json(const nlohmann::json& j, Particula::Point& point) {
    if (!j.is_array()) {
        throw std::runtime_error("JSON->Eigen conversion error: array expected");
    }
    const auto values = j.get<std::vector<double>>();
    point = Eigen::Map<const Particula::Point>(values.data(), static_cast<Eigen::Index>(values.size()));
}

} // namespace Eigen

template class nlohmann::basic_json<>;
