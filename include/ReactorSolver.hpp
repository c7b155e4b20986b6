#pragma once
/**
 * @file ReactorSolver.hpp
 * @brief Derivative assembly and integration driver for reactor transients.
 *
 * @details
 * - `stateDerivArray` maps a flat state array to its flat time derivative by
 *   calling every Dynamics function and the drum control rule once.
 * - `solve` builds the initial state (reactivities derived from the initial
 *   temperatures and drum angle), the output grid, runs the integrator and
 *   wraps the result in a Solution.
 * - `ReactorSolver` binds a SimulationConfig to an Integrator (ODEStepper by
 *   default) and adds progress output and run metadata.
 */

#include "common.hpp"
#include "State.hpp"
#include "Dynamics.hpp"
#include "ReactorParameters.hpp"
#include "ControlRule.hpp"
#include "Integrator.hpp"
#include "ODEStepper.hpp"
#include "Solution.hpp"
#include "SimulationConfig.hpp"

/**
 * @brief Time derivative of the reactor state.
 * @param stateArray Flat state in StateComponent order.
 * @param t          Time [s]; forwarded to the control rule.
 * @param params     Constants bundle.
 * @param rule       Drum speed policy, queried exactly once.
 * @return d(state)/dt in StateComponent order.
 *
 * @throws std::invalid_argument if stateArray has the wrong length.
 */
vec_real stateDerivArray(const vec_real& stateArray, real_t t,
                         const ReactorParameters& params, const ControlRule& rule);

/**
 * @brief Initial State with reactivities consistent with temperatures and angle.
 */
State buildInitialState(const InitialConditions& initial, const ReactorParameters& params);

/**
 * @brief Integrate the reactor model over [tStart, tMax].
 * @param initial     Initial power, precursors, temperatures, drum angle.
 * @param params      Constants bundle.
 * @param rule        Drum speed policy.
 * @param tStart      Start time [s].
 * @param tMax        End time [s], > tStart.
 * @param numIters    Output samples (>= 2), evenly spaced, both ends included.
 * @param integrator  IVP integrator.
 * @return Solution with numIters rows; its time vector is the one handed to
 *         the integrator.
 *
 * @throws std::invalid_argument if numIters < 2 or tMax <= tStart.
 */
Solution solve(const InitialConditions& initial, const ReactorParameters& params,
               const ControlRule& rule, real_t tStart, real_t tMax, size_t numIters,
               Integrator& integrator);

/**
 * @class ReactorSolver
 * @brief Runs one configured transient.
 *
 * @section workflow Workflow
 * - Construct from a SimulationConfig (optionally with a custom Integrator).
 * - run() integrates and returns the Solution.
 * - resultToJson() packs configuration, statistics and series for output.
 */
class ReactorSolver
{
  private:
    SimulationConfig config;                  ///< Run configuration.
    std::unique_ptr<Integrator> integrator;   ///< IVP integrator.
    real_t wallTime = 0.0;                    ///< Duration of the last run [s].

  public:
    /// Use an ODEStepper configured from the integrator settings of configIn.
    explicit ReactorSolver(SimulationConfig configIn);

    /// Use the supplied integrator instead of the configured ODEStepper.
    ReactorSolver(SimulationConfig configIn, std::unique_ptr<Integrator> integratorIn);

    /**
     * @brief Integrate the configured transient.
     * @throws std::invalid_argument on a malformed time span.
     * @throws std::runtime_error if the integrator fails.
     */
    Solution run();

    /// Configuration, wall time, integrator statistics and the solution series.
    json resultToJson(const Solution& solution) const;

    const SimulationConfig& getConfig() const { return config; }
    real_t getWallTime() const { return wallTime; }
};
