//==============================================================================
// test_solver.cpp
// Derivative assembly and the integration driver.
//
//  1) stateDerivArray matches the individual Dynamics functions and queries
//     the control rule exactly once per call.
//  2) solve() validates its time span and returns numIters × 13 rows on
//     t = linspace(tStart, tMax, numIters).
//  3) Any Integrator implementation can be substituted.
//  4) Zero reactivity with equilibrium precursors keeps the power constant.
//  5) One-group step reactivity (temperatures frozen) follows the analytic
//     two-exponential solution n(t) = A1 e^{w1 t} + A2 e^{w2 t}.
//  6) Degenerate constants (Λ = 0) give NaN rows instead of an exception.
//  7) ReactorSolver end to end on a drum schedule.
//  8) ReactorSolver end to end with the state-dependent power setpoint rule:
//     power settles inside the band and the drums stay within their limits.
//==============================================================================

#include <cassert>
#include "ReactorSolver.hpp"

namespace
{
    //--------------------------------------------------------------------------
    // Fixed-step explicit Euler; records the grid it was asked for.
    //--------------------------------------------------------------------------
    class ForwardEuler : public Integrator
    {
      public:
        size_t substeps;
        size_t rhsCalls = 0;
        vec_real requestedTimes;

        explicit ForwardEuler(size_t substeps_) : substeps(substeps_) {}

        mat_real integrate(const RhsFunction& rhs, const vec_real& y0, const vec_real& times) override
        {
            requestedTimes = times;
            mat_real grid(times.size());
            grid[0] = y0;

            vec_real y = y0, dydt(y0.size());
            for (size_t k=1; k<times.size(); ++k)
            {
                const real_t dt = (times[k] - times[k-1]) / static_cast<real_t>(substeps);
                for (size_t s=0; s<substeps; ++s)
                {
                    rhs(y, dydt, times[k-1] + static_cast<real_t>(s) * dt);
                    ++rhsCalls;
                    for (size_t i=0; i<y.size(); ++i) y[i] += dt * dydt[i];
                }
                grid[k] = y;
            }
            return grid;
        }
    };

    //--------------------------------------------------------------------------
    // Constant speed that counts how often it is asked.
    //--------------------------------------------------------------------------
    class CountingRule : public ControlRule
    {
      public:
        mutable size_t calls = 0;
        real_t speed;

        explicit CountingRule(real_t speed_) : speed(speed_) {}

        real_t drumSpeed(real_t, const State&) const override
        {
            ++calls;
            return speed;
        }

        json toJson() const override { return json{{"Type", "Constant"}, {"Speed", speed}}; }
    };

    //--------------------------------------------------------------------------
    // Reactor with one delayed group and frozen temperatures: no heat transfer,
    // no flow, practically infinite fuel heat capacity.
    //--------------------------------------------------------------------------
    ReactorParameters oneGroupReactor()
    {
        ReactorParameters p;
        p.betaVector         = {0.0075, 0.0, 0.0, 0.0, 0.0, 0.0};
        p.precursorConstants = {0.08, 0.0305, 0.111, 0.3011, 1.14, 3.01};
        p.totalBeta   = 0.0075;
        p.period      = 6e-5;
        p.heatCoeff   = 0.0;
        p.massMod     = 500.0;
        p.heatCapMod  = 1500.0;
        p.massFlow    = 0.0;
        p.massFuel    = 1e30;
        p.heatCapFuel = 1.0;
        p.tempIn      = feedback::MOD_TEMP_REF;
        return p;
    }

    InitialConditions equilibriumStart(const ReactorParameters& p, real_t power, real_t drumAngle)
    {
        InitialConditions init;
        init.power = power;
        init.precursorDensities = p.equilibriumPrecursors(power);
        init.tempMod = feedback::MOD_TEMP_REF;
        init.tempFuel = feedback::FUEL_TEMP_REF;
        init.drumAngle = drumAngle;
        return init;
    }

    template <typename Exception, typename Fn>
    bool throws(Fn fn)
    {
        try { fn(); } catch (const Exception&) { return true; }
        return false;
    }
}

int main()
{
    const ReactorParameters params = oneGroupReactor();

    //--------------------------------------------------------------------------
    // 1) Derivative assembly
    //--------------------------------------------------------------------------
    {
        ReactorParameters p = params;
        p.heatCoeff = 27777.78;
        p.massFlow  = 13.889;
        p.massFuel  = 1000.0;
        p.heatCapFuel = 200.0;
        p.tempIn = 840.0;

        const group_vec c = {5000, 6000, 5600, 4700, 7800, 6578};
        const State s(4000.0, c, 870.0, 910.0, 1e-4, -2e-4, 81.0, 3e-4);
        CountingRule rule(0.25);

        vec_real d = stateDerivArray(s.toArray(), 2.0, p, rule);
        assert(rule.calls == 1);
        assert(d.size() == NumComponents);

        assert(d[NeutronPopulation] == total_neutron_deriv(p.totalBeta, p.period, 4000.0, p.precursorConstants,
                                                           c, 1e-4, -2e-4, 3e-4));
        group_vec dc = delay_neutron_deriv(p.betaVector, p.period, 4000.0, p.precursorConstants, c);
        for (size_t i=0; i<NUM_PRECURSOR_GROUPS; ++i)
        {
            assert(d[PrecursorDensity1 + i] == dc[i]);
        }
        assert(d[TMod] == mod_temp_deriv(p.heatCoeff, p.massMod, p.heatCapMod, p.massFlow, 910.0, 870.0, p.tempIn));
        assert(d[TFuel] == fuel_temp_deriv(4000.0, p.massFuel, p.heatCapFuel, p.heatCoeff, 910.0, 870.0));
        assert(d[RhoFuelTemp] == temp_fuel_reactivity_deriv(4000.0, p.totalBeta, p.massFuel, p.heatCapFuel,
                                                            p.heatCoeff, 910.0, 870.0));
        assert(d[RhoModTemp] == temp_mod_reactivity_deriv(p.totalBeta, p.heatCoeff, p.massMod, p.heatCapMod,
                                                          p.massFlow, 910.0, 870.0, p.tempIn));
        assert(d[DrumAngle] == 0.25);
        assert(d[RhoConDrum] == con_drum_reactivity_deriv(p.totalBeta, 0.25, 81.0));

        // Stateless: repeated and out-of-order calls give the same result
        vec_real again = stateDerivArray(s.toArray(), -5.0, p, rule);
        assert(again == d);
        assert(rule.calls == 2);

        assert(throws<std::invalid_argument>([&]{ stateDerivArray(vec_real(12, 0.0), 0.0, p, rule); }));
    }

    //--------------------------------------------------------------------------
    // 2) Time span validation and grid shape; 3) custom integrator
    //--------------------------------------------------------------------------
    {
        const InitialConditions init = equilibriumStart(params, 1000.0, 80.0);
        ConstantSpeedRule parked;
        ForwardEuler euler(10);

        assert(throws<std::invalid_argument>([&]{ solve(init, params, parked, 0.0, 1.0, 1, euler); }));
        assert(throws<std::invalid_argument>([&]{ solve(init, params, parked, 0.0, 1.0, 0, euler); }));
        assert(throws<std::invalid_argument>([&]{ solve(init, params, parked, 1.0, 1.0, 5, euler); }));
        assert(throws<std::invalid_argument>([&]{ solve(init, params, parked, 2.0, 1.0, 5, euler); }));
        assert(euler.rhsCalls == 0);

        CountingRule rule(0.0);
        Solution sol = solve(init, params, rule, 0.5, 0.6, 7, euler);

        assert(sol.size() == 7);
        assert(sol.getArray().size() == 7);
        for (const auto& row : sol.getArray())
        {
            assert(row.size() == 13);
        }
        assert(sol.getT().front() == 0.5);
        assert(sol.getT().back() == 0.6);
        assert(sol.getT() == linspace(0.5, 0.6, 7));
        assert(euler.requestedTimes == sol.getT());
        assert(rule.calls == euler.rhsCalls);
        assert(euler.rhsCalls == 6 * 10);

        // Row 0 is the initial state with reactivities derived from temperatures/angle
        State s0 = sol.stateAt(0);
        assert(s0.getNeutronPopulation() == 1000.0);
        assert(s0.getRhoFuelTemp() == 0.0);
        assert(s0.getRhoModTemp() == 0.0);
        assert(s0.getRhoConDrum() == con_drum_reactivity(params.totalBeta, 80.0));
        assert(s0.getPrecursorDensities() == init.precursorDensities);
    }

    //--------------------------------------------------------------------------
    // 4) Zero reactivity: flat power
    //--------------------------------------------------------------------------
    {
        const InitialConditions init = equilibriumStart(params, 1000.0, feedback::DRUM_ANGLE_REF);
        ConstantSpeedRule parked;
        ODEStepper stepper(Scheme::IRK2, 1e-10, 1e-12);

        Solution sol = solve(init, params, parked, 0.0, 10.0, 21, stepper);
        for (size_t k=0; k<sol.size(); ++k)
        {
            assert(relative_equal(sol.neutronPopulation()[k], 1000.0, 1e-8));
            assert(relative_equal(sol.precursorDensity(1)[k], init.precursorDensities[0], 1e-8));
            assert(std::abs(sol.tempMod()[k] - feedback::MOD_TEMP_REF) < 1e-9);
            assert(std::abs(sol.tempFuel()[k] - feedback::FUEL_TEMP_REF) < 1e-9);
            assert(std::abs(sol.drumAngle()[k] - feedback::DRUM_ANGLE_REF) < 1e-12);
        }
    }

    //--------------------------------------------------------------------------
    // 5) Step reactivity against the analytic one-group solution.
    //    w^2 + w (λ + (β-ρ)/Λ) - λρ/Λ = 0,
    //    A1 + A2 = n0,  w1 A1 + w2 A2 = ρ n0 / Λ.
    //--------------------------------------------------------------------------
    for (Scheme scheme : {Scheme::IRK1, Scheme::IRK2, Scheme::IRK3})
    {
        const real_t n0 = 1000.0;
        const real_t angle = 80.0;
        const InitialConditions init = equilibriumStart(params, n0, angle);

        const real_t rho = con_drum_reactivity(params.totalBeta, angle);
        const real_t beta = params.totalBeta;
        const real_t lambda = params.precursorConstants[0];
        const real_t Lambda = params.period;
        assert(rho > 0.0 && rho < beta);

        const real_t bq = lambda + (beta - rho) / Lambda;
        const real_t cq = -lambda * rho / Lambda;
        const real_t disc = std::sqrt(bq*bq - 4.0*cq);
        const real_t w2 = 0.5 * (-bq - disc);
        const real_t w1 = cq / w2;               // product of the roots, avoids cancellation
        const real_t A1 = (rho * n0 / Lambda - w2 * n0) / (w1 - w2);
        const real_t A2 = n0 - A1;

        ConstantSpeedRule parked;
        ODEStepper stepper(scheme, 1e-10, 1e-12);
        Solution sol = solve(init, params, parked, 0.0, 2.0, 41, stepper);

        const vec_real& t = sol.getT();
        const vec_real n = sol.neutronPopulation();
        for (size_t k=0; k<sol.size(); ++k)
        {
            const real_t exact = A1 * std::exp(w1 * t[k]) + A2 * std::exp(w2 * t[k]);
            assert(relative_equal(n[k], exact, 5e-6));
        }

        // Prompt jump then slow rise: n(2 s) > n0 / (1 - ρ/β)
        assert(n.back() > n0 * beta / (beta - rho));
        assert(std::abs(sol.rhoConDrum().back() - rho) < 1e-14);
    }

    //--------------------------------------------------------------------------
    // 6) Λ = 0: NaN rows, no exception
    //--------------------------------------------------------------------------
    {
        ReactorParameters p = params;
        InitialConditions init = equilibriumStart(params, 1000.0, 80.0);
        p.period = 0.0;

        ConstantSpeedRule parked;
        ODEStepper stepper;
        Solution sol = solve(init, p, parked, 0.0, 1.0, 5, stepper);

        assert(sol.size() == 5);
        assert(sol.neutronPopulation()[0] == 1000.0);
        for (size_t k=1; k<sol.size(); ++k)
        {
            assert(std::isnan(sol.neutronPopulation()[k]));
        }
    }

    //--------------------------------------------------------------------------
    // 7) ReactorSolver: drums rotate out by 5 degrees between t = 10 s and 15 s
    //--------------------------------------------------------------------------
    {
        json j = json::parse(R"({
            "Reactor": {
                "BetaVector": [0.0002475, 0.0016425, 0.00147, 0.0029625, 0.0008625, 0.000315],
                "PrecursorConstants": [0.0124, 0.0305, 0.111, 0.3011, 1.14, 3.01],
                "TotalBeta": 0.0075,
                "Period": 6e-5,
                "HeatCoeff": 27777.78,
                "MassMod": 500.0,
                "HeatCapMod": 1500.0,
                "MassFlow": 13.889,
                "MassFuel": 1000.0,
                "HeatCapFuel": 200.0,
                "TempIn": 840.0
            },
            "Initial_Conditions": {
                "Power": 1000000.0,
                "PrecursorDensities": null,
                "TempMod": 864.0,
                "TempFuel": 900.0,
                "DrumAngle": 77.56
            },
            "TMax": 20.0,
            "NumIters": 41,
            "ControlRule": { "Type": "Schedule", "Times": [0.0, 10.0, 15.0], "Speeds": [0.0, 1.0, 0.0] }
        })");

        ReactorSolver solver{SimulationConfig(j)};
        Solution sol = solver.run();

        assert(sol.size() == 41);
        assert(sol.getT().back() == 20.0);

        const vec_real angle = sol.drumAngle();
        const vec_real n = sol.neutronPopulation();
        assert(std::abs(angle[20] - 77.56) < 1e-9);
        assert(std::abs(angle.back() - 82.56) < 1e-4);

        // Nearly steady before the drums move
        assert(relative_equal(n[20], 1e6, 1e-4));

        // Positive drum reactivity raises the power; hotter fuel pushes back
        assert(*std::max_element(n.begin(), n.end()) > 1.01e6);
        assert(sol.tempFuel().back() > 900.0);
        assert(sol.rhoFuelTemp().back() < 0.0);
        assert(sol.rhoConDrum().back() > 0.0);

        json result = solver.resultToJson(sol);
        assert(result.contains("Config"));
        assert(result["Solution"]["t"].size() == 41);
        assert(result["Integrator"]["AcceptedSteps"].get<size_t>() > 0);
        assert(solver.getWallTime() > 0.0);

        assert(throws<std::invalid_argument>([&]{ ReactorSolver bad(SimulationConfig(j), nullptr); }));
    }

    //--------------------------------------------------------------------------
    // 8) Power setpoint controller raises the power by 10 % and holds it
    //--------------------------------------------------------------------------
    {
        json j = json::parse(R"({
            "Reactor": {
                "BetaVector": [0.0002475, 0.0016425, 0.00147, 0.0029625, 0.0008625, 0.000315],
                "PrecursorConstants": [0.0124, 0.0305, 0.111, 0.3011, 1.14, 3.01],
                "TotalBeta": 0.0075,
                "Period": 6e-5,
                "HeatCoeff": 27777.78,
                "MassMod": 500.0,
                "HeatCapMod": 1500.0,
                "MassFlow": 13.889,
                "MassFuel": 1000.0,
                "HeatCapFuel": 200.0,
                "TempIn": 840.0
            },
            "Initial_Conditions": {
                "Power": 1000000.0,
                "PrecursorDensities": null,
                "TempMod": 864.0,
                "TempFuel": 900.0,
                "DrumAngle": 77.56
            },
            "TMax": 60.0,
            "NumIters": 601,
            "Integrator": { "SchemeIRK": 1, "RelTol": 1e-6, "AbsTol": 1e-8, "MaxSteps": 200000 },
            "ControlRule": {
                "Type": "PowerSetpoint", "Setpoint": 1100000.0, "Band": 10000.0,
                "Speed": 0.5, "MinAngle": 0.0, "MaxAngle": 120.0
            }
        })");

        for (int schemeIRK : {1, 2})
        {
            j["Integrator"]["SchemeIRK"] = schemeIRK;
            ReactorSolver solver{SimulationConfig(j)};
            assert(solver.getConfig().NumIters == 601);
            assert(solver.getConfig().Rule->toJson()["Type"] == "PowerSetpoint");

            Solution sol = solver.run();
            assert(sol.size() == 601);

            const vec_real& t = sol.getT();
            const vec_real n = sol.neutronPopulation();
            const vec_real angle = sol.drumAngle();

            for (size_t k=0; k<sol.size(); ++k)
            {
                assert(std::isfinite(n[k]));
                assert(angle[k] >= 0.0 && angle[k] <= 120.0);
            }

            // Drums turned out to raise the power
            assert(angle.back() > 77.56);
            assert(sol.rhoConDrum().back() > 0.0);

            // Settled inside the band over the last 20 s
            for (size_t k=0; k<sol.size(); ++k)
            {
                if (t[k] >= 40.0)
                {
                    assert(std::abs(n[k] - 1.1e6) <= 1e4);
                }
            }
        }
    }

    std::cout << "test_solver passed." << std::endl;
    return 0;
}
