#pragma once
/**
 * @file ReactorParameters.hpp
 * @brief Physical constants of one simulation run.
 *
 * @details
 * Quantities that do not evolve in time (precursor data, generation time,
 * heat-transfer and flow data). Built once from the "Reactor" node of the
 * run configuration and handed by const reference to the derivative
 * assembly; never modified during integration.
 *
 * No physical validation is done: zero or negative masses / period are
 * accepted and show up as inf/NaN in the derivatives.
 */

#include "common.hpp"

/**
 * @struct ReactorParameters
 * @brief Constants bundle of the lumped reactor model.
 *
 * @section fields Key Fields
 * - `betaVector`         : Delayed-neutron fraction per group β_i.
 * - `precursorConstants` : Decay constant per group λ_i [1/s].
 * - `totalBeta`          : Total delayed-neutron fraction β.
 * - `period`             : Effective neutron generation time Λ [s].
 * - `heatCoeff`          : Fuel–moderator heat transfer coefficient [J/K/s].
 * - `massMod/heatCapMod` : Moderator mass [kg] and specific heat [J/kg/K].
 * - `massFlow`           : Coolant mass flow rate [kg/s].
 * - `massFuel/heatCapFuel`: Fuel mass [kg] and specific heat [J/kg/K].
 * - `tempIn`             : Coolant inlet temperature [K].
 */
struct ReactorParameters
{
    group_vec betaVector;
    group_vec precursorConstants;
    real_t totalBeta;
    real_t period;
    real_t heatCoeff;
    real_t massMod, heatCapMod;
    real_t massFlow;
    real_t massFuel, heatCapFuel;
    real_t tempIn;

    ReactorParameters() = default;

    /**
     * @brief Construct from a JSON object.
     *
     * Expected layout (all keys required):
     * ```
     * {
     *   "BetaVector": [6], "PrecursorConstants": [6],
     *   "TotalBeta": ..., "Period": ...,
     *   "HeatCoeff": ..., "MassMod": ..., "HeatCapMod": ..., "MassFlow": ...,
     *   "MassFuel": ..., "HeatCapFuel": ..., "TempIn": ...
     * }
     * ```
     * @throws std::invalid_argument if a group vector does not have 6 entries.
     * @throws nlohmann::json::exception if a key is missing or not a number.
     */
    explicit ReactorParameters(const json& reactorIn)
    {
        betaVector         = to_group_vec(reactorIn.at("BetaVector"), "BetaVector");
        precursorConstants = to_group_vec(reactorIn.at("PrecursorConstants"), "PrecursorConstants");
        totalBeta   = reactorIn.at("TotalBeta").get<real_t>();
        period      = reactorIn.at("Period").get<real_t>();
        heatCoeff   = reactorIn.at("HeatCoeff").get<real_t>();
        massMod     = reactorIn.at("MassMod").get<real_t>();
        heatCapMod  = reactorIn.at("HeatCapMod").get<real_t>();
        massFlow    = reactorIn.at("MassFlow").get<real_t>();
        massFuel    = reactorIn.at("MassFuel").get<real_t>();
        heatCapFuel = reactorIn.at("HeatCapFuel").get<real_t>();
        tempIn      = reactorIn.at("TempIn").get<real_t>();
    }

    /// Serialize back to the layout accepted by the constructor.
    json toJson() const
    {
        json out;
        out["BetaVector"]         = betaVector;
        out["PrecursorConstants"] = precursorConstants;
        out["TotalBeta"]   = totalBeta;
        out["Period"]      = period;
        out["HeatCoeff"]   = heatCoeff;
        out["MassMod"]     = massMod;
        out["HeatCapMod"]  = heatCapMod;
        out["MassFlow"]    = massFlow;
        out["MassFuel"]    = massFuel;
        out["HeatCapFuel"] = heatCapFuel;
        out["TempIn"]      = tempIn;
        return out;
    }

    /**
     * @brief Precursor densities in equilibrium with a constant power.
     *
     * c_i = β_i n / (λ_i Λ), i.e. dc_i/dt = 0.
     */
    group_vec equilibriumPrecursors(real_t power) const
    {
        group_vec c{};
        for (size_t i=0; i<NUM_PRECURSOR_GROUPS; ++i)
        {
            c[i] = betaVector[i] * power / (precursorConstants[i] * period);
        }
        return c;
    }
};
