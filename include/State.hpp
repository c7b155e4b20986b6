#pragma once
/**
 * @file State.hpp
 * @brief Fixed-layout reactor state vector and its flat-array conversions.
 *
 * @details
 * The State bundles every time-dependent quantity of the lumped reactor model:
 * neutron population, six precursor group densities, moderator and fuel
 * temperatures, the three reactivity contributions, and the control-drum angle.
 * The integrator only sees flat `vec_real` arrays; `toArray()` / `fromArray()`
 * are exact inverses that fix the component order given by StateComponent.
 */

#include "common.hpp"

/**
 * @enum StateComponent
 * @brief Column index of every state quantity inside the flat array.
 *
 * Precursor densities occupy the contiguous block
 * [PrecursorDensity1, PrecursorDensity6].
 */
enum StateComponent : size_t
{
    NeutronPopulation = 0,
    PrecursorDensity1,
    PrecursorDensity2,
    PrecursorDensity3,
    PrecursorDensity4,
    PrecursorDensity5,
    PrecursorDensity6,
    TMod,
    TFuel,
    RhoFuelTemp,
    RhoModTemp,
    DrumAngle,
    RhoConDrum,
    NumComponents
};

/**
 * @class State
 * @brief Immutable snapshot of the reactor at one instant.
 *
 * A State is also used to carry time derivatives: the derivative assembly
 * packs dX/dt into a State so that the field order matches by construction.
 */
class State
{
  private:
    real_t neutronPopulation;     ///< Neutron population / power.
    group_vec precursorDensities; ///< Precursor group densities c_1..c_6.
    real_t tMod;                  ///< Moderator temperature [K].
    real_t tFuel;                 ///< Fuel temperature [K].
    real_t rhoFuelTemp;           ///< Fuel-temperature reactivity [dk].
    real_t rhoModTemp;            ///< Moderator-temperature reactivity [dk].
    real_t drumAngle;             ///< Control-drum angle [deg].
    real_t rhoConDrum;            ///< Control-drum reactivity [dk].

  public:
    State(real_t neutronPopulation_, const group_vec& precursorDensities_,
          real_t tMod_, real_t tFuel_, real_t rhoFuelTemp_, real_t rhoModTemp_,
          real_t drumAngle_, real_t rhoConDrum_);

    real_t getNeutronPopulation() const { return neutronPopulation; }
    const group_vec& getPrecursorDensities() const { return precursorDensities; }
    real_t getTMod() const { return tMod; }
    real_t getTFuel() const { return tFuel; }
    real_t getRhoFuelTemp() const { return rhoFuelTemp; }
    real_t getRhoModTemp() const { return rhoModTemp; }
    real_t getDrumAngle() const { return drumAngle; }
    real_t getRhoConDrum() const { return rhoConDrum; }

    /**
     * @brief Precursor density of group i (1-indexed, as in c_i).
     * @throws std::out_of_range if i is outside [1, 6].
     */
    real_t getPrecursorDensity(size_t i) const;

    /// Sum of the three reactivity contributions.
    real_t totalReactivity() const { return rhoFuelTemp + rhoModTemp + rhoConDrum; }

    /// Flatten into the StateComponent order.
    vec_real toArray() const;

    /**
     * @brief Rebuild a State from a flat array in StateComponent order.
     * @throws std::invalid_argument if the array does not have NumComponents entries.
     */
    static State fromArray(const vec_real& array);

    /// Column names in StateComponent order (CSV headers, JSON keys).
    static const std::vector<std::string>& componentNames();
};
