#pragma once
#include <random>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace Particula {

using RandomNumberEngine = std::mt19937;

/**
 * @brief Random number generator
 *
 * Example code:
 *
 * ```{.cpp}
 *     Random r1;                                     // default deterministic seed
 *     Random r2 = R"( {"seed" : "hardware"} )"_json; // non-deterministic seed
 *     r1.seed();                                     // non-deterministic seed
 * ```
 */
class Random {
  private:
    std::uniform_real_distribution<double> dist01; //!< Uniform real distribution [0,1)
    std::normal_distribution<double> gaussian;     //!< Standard normal distribution
  public:
    RandomNumberEngine engine; //!< Random number engine used for all operations
    Random();                  //!< Constructor with deterministic seed
    void seed();               //!< Set a non-deterministic ("hardware") seed
    double operator()();       //!< Random double in uniform range [0,1)

    /**
     * @brief Normal distributed number
     * @param mean Mean value
     * @param stddev Standard deviation
     */
    double normal(double mean = 0.0, double stddev = 1.0);

    /**
     * @brief Integer in uniform range [min:max]
     * @param min minimum value
     * @param max maximum value
     * @return random integer in [min:max] range
     */
    template <typename IntType = int> IntType range(IntType min, IntType max) {
        static_assert(std::is_integral<IntType>::value, "Integral required");
        return std::uniform_int_distribution<IntType>(min, max)(engine);
    }
};

void to_json(nlohmann::json&, const Random&);   //!< Random to json conversion
void from_json(const nlohmann::json&, Random&); //!< json to Random conversion

extern Random random; //!< global instance of Random

} // namespace Particula
