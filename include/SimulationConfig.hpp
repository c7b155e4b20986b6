#pragma once
/**
 * @file SimulationConfig.hpp
 * @brief Data structures for loading and organizing one reactor transient run.
 *
 * @details
 * - **InitialConditions**: power, precursor densities, temperatures and drum
 *   angle at t = TStart. The three reactivities are not inputs; the driver
 *   derives them from the temperatures and the angle.
 * - **SimulationConfig**: container that initializes itself from a JSON object
 *   (or file) and exposes everything the driver needs (constants bundle,
 *   initial conditions, time span, integrator settings, drum control rule).
 */

#include "common.hpp"
#include "ReactorParameters.hpp"
#include "ControlRule.hpp"

/**
 * @struct InitialConditions
 * @brief Reactor condition at the start of the transient.
 */
struct InitialConditions
{
    real_t power;                  ///< Initial neutron population / power.
    group_vec precursorDensities;  ///< Initial precursor densities c_1..c_6.
    real_t tempMod;                ///< Initial moderator temperature [K].
    real_t tempFuel;               ///< Initial fuel temperature [K].
    real_t drumAngle;              ///< Initial drum angle [deg].
};

/**
 * @struct SimulationConfig
 * @brief Single-run configuration.
 *
 * @section fields Key Fields
 * - `Reactor`       : Constants bundle (see ReactorParameters).
 * - `Initial`       : Initial conditions.
 * - `TStart/TMax`   : Time span [s].
 * - `NumIters`      : Number of output samples over [TStart, TMax] (default 100).
 * - `SchemeIRK`     : Gauss–Legendre scheme (1: order 2, 2: order 4, 3: order 6).
 * - `RelTol/AbsTol` : Local error tolerances of the adaptive stepper.
 * - `MaxIterNewton` : Newton iterations per implicit step.
 * - `MaxSteps`      : Step attempts allowed per run.
 * - `Rule`          : Drum speed policy.
 * - `Verbose`       : Progress output on stdout.
 */
struct SimulationConfig
{
    ReactorParameters Reactor;
    InitialConditions Initial;
    real_t TStart, TMax;
    size_t NumIters;
    Scheme SchemeIRK;
    real_t RelTol, AbsTol;
    int    MaxIterNewton;
    size_t MaxSteps;
    std::shared_ptr<ControlRule> Rule;
    bool   Verbose;

    /**
     * @brief Construct from a JSON object.
     *
     * Expected layout ("Integrator", "ControlRule", "TStart", "NumIters",
     * "Verbose" and "PrecursorDensities" may be omitted or null):
     * ```
     * {
     *   "Reactor": { ... see ReactorParameters ... },
     *   "Initial_Conditions": {
     *     "Power": ..., "PrecursorDensities": <array or null>,
     *     "TempMod": ..., "TempFuel": ..., "DrumAngle": ...
     *   },
     *   "TStart": 0.0, "TMax": ..., "NumIters": ...,
     *   "Integrator": { "SchemeIRK": 2, "RelTol": 1e-8, "AbsTol": 1e-10,
     *                   "MaxIterNewton": 20, "MaxSteps": 1000000 },
     *   "ControlRule": { "Type": "Constant", "Speed": 0.0 },
     *   "Verbose": false
     * }
     * ```
     * A null "PrecursorDensities" selects the equilibrium densities for the
     * initial power.
     *
     * @throws std::invalid_argument on a wrong IRK scheme, group vector size,
     *         negative NumIters or an unknown control rule.
     */
    SimulationConfig(const json& simConfigIn)
        : Reactor(simConfigIn.at("Reactor"))
    {
        const json& init = simConfigIn.at("Initial_Conditions");
        Initial.power     = init.at("Power").get<real_t>();
        Initial.tempMod   = init.at("TempMod").get<real_t>();
        Initial.tempFuel  = init.at("TempFuel").get<real_t>();
        Initial.drumAngle = init.at("DrumAngle").get<real_t>();

        if (init.contains("PrecursorDensities") && !init["PrecursorDensities"].is_null())
        {
            Initial.precursorDensities = to_group_vec(init["PrecursorDensities"], "PrecursorDensities");
        }
        else
        {
            Initial.precursorDensities = Reactor.equilibriumPrecursors(Initial.power);
        }

        TStart = simConfigIn.value("TStart", 0.0);
        TMax   = simConfigIn.at("TMax").get<real_t>();

        const long long numIters = simConfigIn.value("NumIters", 100LL);
        if (numIters < 0)
        {
            throw std::invalid_argument("NumIters must not be negative!");
        }
        NumIters = static_cast<size_t>(numIters);

        const json integrator = simConfigIn.value("Integrator", json::object());

        switch (integrator.value("SchemeIRK", 2))
        {
            case 1: SchemeIRK = Scheme::IRK1; break;
            case 2: SchemeIRK = Scheme::IRK2; break;
            case 3: SchemeIRK = Scheme::IRK3; break;
            default: throw std::invalid_argument("Wrong IRK Scheme stage supplied!");
        }

        RelTol        = integrator.value("RelTol", 1e-8);
        AbsTol        = integrator.value("AbsTol", 1e-10);
        MaxIterNewton = integrator.value("MaxIterNewton", 20);
        MaxSteps      = integrator.value("MaxSteps", static_cast<size_t>(1000000));

        if (simConfigIn.contains("ControlRule") && !simConfigIn["ControlRule"].is_null())
        {
            Rule = ControlRule::fromJson(simConfigIn["ControlRule"]);
        }
        else
        {
            Rule = std::make_shared<ConstantSpeedRule>(0.0);
        }

        Verbose = simConfigIn.value("Verbose", false);
    }

    /**
     * @brief Load configuration from a JSON file.
     * @throws std::runtime_error if file cannot be opened.
     */
    static SimulationConfig loadFromJson(const std::string& filename)
    {
        std::ifstream inFile(filename);
        if (!inFile)
        {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        json j;
        inFile >> j;

        return SimulationConfig(j);
    }

    /// Serialize back to the layout accepted by the constructor.
    json toJson() const
    {
        json out;
        out["Reactor"] = Reactor.toJson();
        out["Initial_Conditions"]["Power"]              = Initial.power;
        out["Initial_Conditions"]["PrecursorDensities"] = Initial.precursorDensities;
        out["Initial_Conditions"]["TempMod"]            = Initial.tempMod;
        out["Initial_Conditions"]["TempFuel"]           = Initial.tempFuel;
        out["Initial_Conditions"]["DrumAngle"]          = Initial.drumAngle;
        out["TStart"]   = TStart;
        out["TMax"]     = TMax;
        out["NumIters"] = NumIters;
        out["Integrator"]["SchemeIRK"]     = int(SchemeIRK)+1;
        out["Integrator"]["RelTol"]        = RelTol;
        out["Integrator"]["AbsTol"]        = AbsTol;
        out["Integrator"]["MaxIterNewton"] = MaxIterNewton;
        out["Integrator"]["MaxSteps"]      = MaxSteps;
        out["ControlRule"] = Rule->toJson();
        out["Verbose"]     = Verbose;
        return out;
    }

    /// Print a human-readable configuration summary to stdout.
    void print_config() const
    {
        std::cout << "Simulation configuration:" << std::endl;
        std::cout << "TotalBeta: " << Reactor.totalBeta << std::endl;
        std::cout << "Period: " << Reactor.period << std::endl;
        std::cout << "HeatCoeff: " << Reactor.heatCoeff << std::endl;
        std::cout << "MassMod: " << Reactor.massMod << ", HeatCapMod: " << Reactor.heatCapMod << std::endl;
        std::cout << "MassFuel: " << Reactor.massFuel << ", HeatCapFuel: " << Reactor.heatCapFuel << std::endl;
        std::cout << "MassFlow: " << Reactor.massFlow << ", TempIn: " << Reactor.tempIn << std::endl;
        std::cout << "Power: " << Initial.power << std::endl;
        std::cout << "TempMod: " << Initial.tempMod << ", TempFuel: " << Initial.tempFuel << std::endl;
        std::cout << "DrumAngle: " << Initial.drumAngle << std::endl;
        std::cout << "TStart: " << TStart << ", TMax: " << TMax << ", NumIters: " << NumIters << std::endl;
        std::cout << "SchemeIRK: " << int(SchemeIRK)+1 << std::endl;
        std::cout << "RelTol: " << RelTol << ", AbsTol: " << AbsTol << std::endl;
        std::cout << "MaxIterNewton: " << MaxIterNewton << ", MaxSteps: " << MaxSteps << std::endl;
        std::cout << "ControlRule: " << Rule->toJson().dump() << std::endl;
        std::cout << "Verbose: " << Verbose << std::endl;
    }
};
