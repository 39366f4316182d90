#pragma once

#include <vector>
#include <string>
#include <memory>
#include <Eigen/Core>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

// forward declare logger
namespace spdlog {
class logger;
}

extern template class nlohmann::basic_json<>;

/** @brief Particula main namespace */
namespace Particula {

using Point = Eigen::VectorXd;          //!< D-dimensional vector used for positions, velocities etc.
using json = nlohmann::json;            //!< JSON object
class Random;

using namespace std::string_literals;

json loadJSON(const std::string& filename); //!< Read json filename into json object (w. syntax check)

double roundValue(double value, int number_of_digits = 3); //!< Round to n number of significant digits

/**
 * @brief Zero vector of given dimension
 *
 * Positions default to three dimensions, but a `Point` can have any size.
 */
inline Point zeroPoint(Eigen::Index dimension = 3) { return Point::Zero(dimension); }

extern std::shared_ptr<spdlog::logger> particula_logger;  // global instance
extern std::shared_ptr<spdlog::logger> simulation_logger; // global instance

//! Common ancestor of Particula specific runtime errors
struct GenericError : public std::runtime_error {
    explicit GenericError(const std::exception& e);
    explicit GenericError(const std::runtime_error& e);
    explicit GenericError(const std::string& msg);
    explicit GenericError(const char* msg);
    template <class... Args>
    explicit GenericError(std::string_view fmt, const Args&... args)
        : std::runtime_error(fmt::vformat(fmt, fmt::make_format_args(args...))) {}
};

/**
 * @brief Exception to be thrown on invalid configuration
 *
 * Raised for invalid cell sides, violated preconditions of the
 * density and temperature setters, and when parsing json input.
 */
struct ConfigurationError : public GenericError {
    using GenericError::GenericError;
    const json& attachedJson() const;
    ConfigurationError& attachJson(const json& j);

  private:
    json attached_json;
};

//! Exception to be thrown on IO errors
struct IOError : public GenericError {
    using GenericError::GenericError;
};

//! Exception to be thrown on missing, malformed or truncated trajectory records
struct FormatError : public IOError {
    using IOError::IOError;
};

//! Exception to be thrown when a caller violates a precondition, e.g. negative number of steps
struct PreconditionError : public GenericError {
    using GenericError::GenericError;
};

/**
 * @brief Nicely displays nested exceptions using a logger
 *
 * @param logger  logger to display the exception with
 * @param e  exception to display (possibly nested)
 * @param level  internal counter for recursion
 */
void displayError(spdlog::logger& logger, const std::exception& e, int level = 0);
} // namespace Particula

namespace Eigen {
void to_json(nlohmann::json& j, const Particula::Point& point);   //!< Point to json array
void from_json(const nlohmann::json& j, Particula::Point& point); //!< json array to Point
} // namespace Eigen
