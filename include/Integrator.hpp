#pragma once
/**
 * @file Integrator.hpp
 * @brief Initial-value-problem contract used by the reactor driver.
 *
 * @details
 * The driver depends only on `integrate(rhs, y0, times) -> grid`; the
 * stepping algorithm behind it is interchangeable (see ODEStepper for the
 * adaptive implicit Runge–Kutta implementation).
 */

#include "common.hpp"

/**
 * @brief Right-hand side dy/dt = f(y, t).
 *
 * Arguments: state y, output dydt (pre-sized to y.size()), time t.
 */
using RhsFunction = std::function<void(const vec_real&, vec_real&, real_t)>;

/**
 * @class Integrator
 * @brief Abstract ODE integrator sampling the solution on a caller-given grid.
 */
class Integrator
{
  public:
    virtual ~Integrator() = default;

    /**
     * @brief Integrate y' = rhs(y, t) from times.front() to times.back().
     * @param rhs   Right-hand side; may be called at any intermediate time.
     * @param y0    State at times.front().
     * @param times Output times, at least two, strictly increasing.
     * @return Grid with times.size() rows; row k is the state at times[k],
     *         row 0 equals y0.
     *
     * @throws std::invalid_argument for malformed time grids or empty y0.
     * @throws std::runtime_error if the integration cannot proceed.
     */
    virtual mat_real integrate(const RhsFunction& rhs, const vec_real& y0, const vec_real& times) = 0;
};
