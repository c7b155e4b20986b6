//==============================================================================
// ReactorSolver.cpp
// Couples the reactor dynamics to the IVP integrator.
// Responsibilities:
//   • Unpack state → evaluate kinetics, heat balance, feedback → repack.
//   • Query the drum control rule once per derivative evaluation.
//   • Build the initial state and the (single) output time grid.
//   • Wrap integrator output into a Solution; report run statistics.
//==============================================================================

#include "ReactorSolver.hpp"

//------------------------------------------------------------------------------
// stateDerivArray
// No caching between calls: the integrator evaluates this at arbitrary
// stage times, including rejected steps.
//------------------------------------------------------------------------------
vec_real stateDerivArray(const vec_real& stateArray, real_t t,
                         const ReactorParameters& params, const ControlRule& rule)
{
    const State state = State::fromArray(stateArray);

    const real_t power = state.getNeutronPopulation();
    const real_t tFuel = state.getTFuel();
    const real_t tMod  = state.getTMod();

    const real_t dndt = total_neutron_deriv(params.totalBeta, params.period, power,
                                            params.precursorConstants, state.getPrecursorDensities(),
                                            state.getRhoFuelTemp(), state.getRhoModTemp(),
                                            state.getRhoConDrum());

    const group_vec dcdt = delay_neutron_deriv(params.betaVector, params.period, power,
                                               params.precursorConstants, state.getPrecursorDensities());

    const real_t dTModdt = mod_temp_deriv(params.heatCoeff, params.massMod, params.heatCapMod,
                                          params.massFlow, tFuel, tMod, params.tempIn);

    const real_t dTFueldt = fuel_temp_deriv(power, params.massFuel, params.heatCapFuel,
                                            params.heatCoeff, tFuel, tMod);

    const real_t dRhoFueldt = temp_fuel_reactivity_deriv(power, params.totalBeta, params.massFuel,
                                                         params.heatCapFuel, params.heatCoeff, tFuel, tMod);

    const real_t dRhoModdt = temp_mod_reactivity_deriv(params.totalBeta, params.heatCoeff, params.massMod,
                                                       params.heatCapMod, params.massFlow, tFuel, tMod,
                                                       params.tempIn);

    const real_t drumSpeed = rule.drumSpeed(t, state);

    const real_t dRhoDrumdt = con_drum_reactivity_deriv(params.totalBeta, drumSpeed, state.getDrumAngle());

    const State deriv(dndt, dcdt, dTModdt, dTFueldt, dRhoFueldt, dRhoModdt, drumSpeed, dRhoDrumdt);
    return deriv.toArray();
}

State buildInitialState(const InitialConditions& initial, const ReactorParameters& params)
{
    const real_t rhoFuelTemp = temp_fuel_reactivity(params.totalBeta, initial.tempFuel);
    const real_t rhoModTemp  = temp_mod_reactivity(params.totalBeta, initial.tempMod);
    const real_t rhoConDrum  = con_drum_reactivity(params.totalBeta, initial.drumAngle);

    return State(initial.power, initial.precursorDensities, initial.tempMod, initial.tempFuel,
                 rhoFuelTemp, rhoModTemp, initial.drumAngle, rhoConDrum);
}

//------------------------------------------------------------------------------
// solve
// The time grid is built once and shared by the integrator call and the
// returned Solution.
//------------------------------------------------------------------------------
Solution solve(const InitialConditions& initial, const ReactorParameters& params,
               const ControlRule& rule, real_t tStart, real_t tMax, size_t numIters,
               Integrator& integrator)
{
    if (numIters < 2)
    {
        throw std::invalid_argument("numIters must be at least 2, got " + std::to_string(numIters));
    }
    if (!(tMax > tStart))
    {
        throw std::invalid_argument("tMax (" + std::to_string(tMax) + ") must exceed tStart ("
                                    + std::to_string(tStart) + ")");
    }

    const State initialState = buildInitialState(initial, params);
    vec_real t = linspace(tStart, tMax, numIters);

    RhsFunction deriv = [&params, &rule](const vec_real& y, vec_real& dydt, real_t time)
    {
        dydt = stateDerivArray(y, time, params, rule);
    };

    mat_real grid = integrator.integrate(deriv, initialState.toArray(), t);

    return Solution(std::move(grid), std::move(t));
}

//------------------------------------------------------------------------------
// ReactorSolver
//------------------------------------------------------------------------------
ReactorSolver::ReactorSolver(SimulationConfig configIn)
    : config(std::move(configIn))
{
    integrator = std::make_unique<ODEStepper>(config.SchemeIRK, config.RelTol, config.AbsTol,
                                              config.MaxIterNewton, config.MaxSteps, config.Verbose);
}

ReactorSolver::ReactorSolver(SimulationConfig configIn, std::unique_ptr<Integrator> integratorIn)
    : config(std::move(configIn)), integrator(std::move(integratorIn))
{
    if (!integrator)
    {
        throw std::invalid_argument("ReactorSolver needs an integrator!");
    }
}

Solution ReactorSolver::run()
{
    if (config.Verbose)
    {
        std::cout << "Integrating reactor transient over [" << config.TStart << ", "
                  << config.TMax << "] s with " << config.NumIters << " output samples." << std::endl;
    }

    auto toc = std::chrono::high_resolution_clock::now();

    Solution solution = solve(config.Initial, config.Reactor, *config.Rule,
                              config.TStart, config.TMax, config.NumIters, *integrator);

    auto tic = std::chrono::high_resolution_clock::now();
    wallTime = static_cast<real_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(tic-toc).count()) / 1e9;

    if (config.Verbose)
    {
        const vec_real power = solution.neutronPopulation();
        const auto peak = std::max_element(power.begin(), power.end());
        std::cout << "Finished in " << wallTime << " s. Final power: " << power.back()
                  << ", peak power: " << *peak << " at t = "
                  << solution.getT()[static_cast<size_t>(std::distance(power.begin(), peak))]
                  << " s." << std::endl << std::endl;
    }

    return solution;
}

json ReactorSolver::resultToJson(const Solution& solution) const
{
    json resultDict;
    resultDict["Config"] = config.toJson();
    resultDict["WallTime"] = wallTime;

    if (const auto* stepper = dynamic_cast<const ODEStepper*>(integrator.get()))
    {
        resultDict["Integrator"]["AcceptedSteps"]  = stepper->getAcceptedSteps();
        resultDict["Integrator"]["RejectedSteps"]  = stepper->getRejectedSteps();
        resultDict["Integrator"]["RhsEvaluations"] = stepper->getRhsEvaluations();
    }

    resultDict["Solution"] = solution.toJson();
    return resultDict;
}
