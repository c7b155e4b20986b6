//==============================================================================
// State.cpp
// Reactor state snapshot and the flat-array layout shared with the integrator
// and the Solution grid.
//==============================================================================

#include "State.hpp"

State::State(real_t neutronPopulation_, const group_vec& precursorDensities_,
             real_t tMod_, real_t tFuel_, real_t rhoFuelTemp_, real_t rhoModTemp_,
             real_t drumAngle_, real_t rhoConDrum_)
    : neutronPopulation(neutronPopulation_), precursorDensities(precursorDensities_),
      tMod(tMod_), tFuel(tFuel_), rhoFuelTemp(rhoFuelTemp_), rhoModTemp(rhoModTemp_),
      drumAngle(drumAngle_), rhoConDrum(rhoConDrum_) {}

real_t State::getPrecursorDensity(size_t i) const
{
    if (i < 1 || i > NUM_PRECURSOR_GROUPS)
    {
        throw std::out_of_range("Precursor group index " + std::to_string(i)
                                + " outside of [1, " + std::to_string(NUM_PRECURSOR_GROUPS) + "]");
    }
    return precursorDensities[i-1];
}

//------------------------------------------------------------------------------
// toArray: [n, c1..c6, T_mod, T_fuel, rho_fuel, rho_mod, theta, rho_drum]
//------------------------------------------------------------------------------
vec_real State::toArray() const
{
    vec_real array(NumComponents);

    array[NeutronPopulation] = neutronPopulation;
    std::copy(precursorDensities.begin(), precursorDensities.end(),
              array.begin() + PrecursorDensity1);
    array[TMod]        = tMod;
    array[TFuel]       = tFuel;
    array[RhoFuelTemp] = rhoFuelTemp;
    array[RhoModTemp]  = rhoModTemp;
    array[DrumAngle]   = drumAngle;
    array[RhoConDrum]  = rhoConDrum;

    return array;
}

State State::fromArray(const vec_real& array)
{
    if (array.size() != NumComponents)
    {
        throw std::invalid_argument("State array must have " + std::to_string(NumComponents)
                                    + " entries, got " + std::to_string(array.size()));
    }

    group_vec densities{};
    std::copy(array.begin() + PrecursorDensity1, array.begin() + PrecursorDensity6 + 1,
              densities.begin());

    return State(array[NeutronPopulation], densities, array[TMod], array[TFuel],
                 array[RhoFuelTemp], array[RhoModTemp], array[DrumAngle], array[RhoConDrum]);
}

const std::vector<std::string>& State::componentNames()
{
    static const std::vector<std::string> names = {
        "neutron_population",
        "precursor_density_1", "precursor_density_2", "precursor_density_3",
        "precursor_density_4", "precursor_density_5", "precursor_density_6",
        "temp_mod", "temp_fuel",
        "rho_fuel_temp", "rho_mod_temp",
        "drum_angle", "rho_con_drum"
    };
    return names;
}
