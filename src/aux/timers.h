#pragma once
#include <chrono>

namespace Particula {
/**
 * @brief Timer for measuring relative time consumption
 *
 * Time t=0 is set upon construction whereafter combined `start()`/
 * `stop()` calls can be made multiple times. The result is
 * the fraction of total time, consumed in between start/stop calls.
 */
template <typename Tunit = std::chrono::microseconds> class TimeRelativeOfTotal {
  private:
    Tunit delta;
    std::chrono::steady_clock::time_point t0, tx;

  public:
    TimeRelativeOfTotal()
        : delta(0) {
        t0 = std::chrono::steady_clock::now();
    }

    operator bool() const { return delta.count() != 0; }

    void start() { tx = std::chrono::steady_clock::now(); }

    void stop() { delta += std::chrono::duration_cast<Tunit>(std::chrono::steady_clock::now() - tx); }

    double result() const {
        auto now = std::chrono::steady_clock::now();
        auto total = std::chrono::duration_cast<Tunit>(now - t0);
        return total.count() > 0 ? delta.count() / double(total.count()) : 0.0;
    }
};

/**
 * @brief Wall clock time since the last `start()`
 *
 * Example:
 *
 * ~~~ cpp
 * Stopwatch w;      // started on construction
 * // do something expensive...
 * w.seconds();      // elapsed wall time
 * ~~~
 */
class Stopwatch {
    using clock = std::chrono::steady_clock;
    clock::time_point starting_time;

  public:
    inline Stopwatch() { start(); }
    inline void start() { starting_time = clock::now(); }
    inline double seconds() const { return std::chrono::duration<double>(clock::now() - starting_time).count(); }
};

} // namespace Particula
