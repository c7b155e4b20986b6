//==============================================================================
// Dynamics.cpp
// Right-hand sides of the lumped reactor model:
//   • six-group point kinetics (n, c_i)
//   • two-node fuel/moderator heat balance
//   • temperature and control-drum reactivity feedback
// No input checks here; inf/NaN from degenerate constants propagate.
//==============================================================================

#include "Dynamics.hpp"

real_t total_neutron_deriv(real_t beta_total, real_t period, real_t power,
                           const group_vec& precursor_constants, const group_vec& precursor_density,
                           real_t rho_fuel_temp, real_t rho_mod_temp, real_t rho_con_drum)
{
    const real_t rho = rho_fuel_temp + rho_mod_temp + rho_con_drum;

    real_t decaySource = 0.0;
    for (size_t i=0; i<NUM_PRECURSOR_GROUPS; ++i)
    {
        decaySource += precursor_constants[i] * precursor_density[i];
    }

    return ((rho - beta_total) / period) * power + decaySource;
}

group_vec delay_neutron_deriv(const group_vec& beta_vector, real_t period, real_t power,
                              const group_vec& precursor_constants, const group_vec& precursor_density)
{
    group_vec dcdt{};
    for (size_t i=0; i<NUM_PRECURSOR_GROUPS; ++i)
    {
        dcdt[i] = beta_vector[i] * power / period - precursor_constants[i] * precursor_density[i];
    }
    return dcdt;
}

real_t mod_temp_deriv(real_t heat_coeff, real_t mass_mod, real_t heat_cap_mod, real_t mass_flow,
                      real_t temp_fuel, real_t temp_mod, real_t temp_in)
{
    return (heat_coeff / (mass_mod * heat_cap_mod)) * (temp_fuel - temp_mod)
           - (2.0 * mass_flow / mass_mod) * (temp_mod - temp_in);
}

real_t fuel_temp_deriv(real_t power, real_t mass_fuel, real_t heat_cap_fuel, real_t heat_coeff,
                       real_t temp_fuel, real_t temp_mod)
{
    return power / (mass_fuel * heat_cap_fuel)
           - (heat_coeff / (mass_fuel * heat_cap_fuel)) * (temp_fuel - temp_mod);
}

//------------------------------------------------------------------------------
// Temperature feedback: quadratic in the deviation from the reference
// temperature, expressed in dollars and converted to dk with β.
//------------------------------------------------------------------------------
real_t temp_fuel_reactivity(real_t beta_total, real_t temp_fuel)
{
    const real_t dT = temp_fuel - feedback::FUEL_TEMP_REF;
    return beta_total * (feedback::FUEL_COEFF_LIN * dT + feedback::FUEL_COEFF_QUAD * dT * dT);
}

real_t temp_fuel_reactivity_deriv(real_t power, real_t beta_total, real_t mass_fuel, real_t heat_cap_fuel,
                                  real_t heat_coeff, real_t temp_fuel, real_t temp_mod)
{
    const real_t dT = temp_fuel - feedback::FUEL_TEMP_REF;
    const real_t dRhodT = beta_total * (feedback::FUEL_COEFF_LIN + 2.0 * feedback::FUEL_COEFF_QUAD * dT);

    return dRhodT * fuel_temp_deriv(power, mass_fuel, heat_cap_fuel, heat_coeff, temp_fuel, temp_mod);
}

real_t temp_mod_reactivity(real_t beta_total, real_t temp_mod)
{
    const real_t dT = temp_mod - feedback::MOD_TEMP_REF;
    return beta_total * (feedback::MOD_COEFF_LIN * dT + feedback::MOD_COEFF_QUAD * dT * dT);
}

real_t temp_mod_reactivity_deriv(real_t beta_total, real_t heat_coeff, real_t mass_mod, real_t heat_cap_mod,
                                 real_t mass_flow, real_t temp_fuel, real_t temp_mod, real_t temp_in)
{
    const real_t dT = temp_mod - feedback::MOD_TEMP_REF;
    const real_t dRhodT = beta_total * (feedback::MOD_COEFF_LIN + 2.0 * feedback::MOD_COEFF_QUAD * dT);

    return dRhodT * mod_temp_deriv(heat_coeff, mass_mod, heat_cap_mod, mass_flow, temp_fuel, temp_mod, temp_in);
}

//------------------------------------------------------------------------------
// Drum worth curve: half-cosine over 0..180 degrees, zero at DRUM_ANGLE_REF.
//------------------------------------------------------------------------------
real_t con_drum_reactivity(real_t beta_total, real_t drum_angle)
{
    return beta_total * 0.5 * feedback::DRUM_WORTH
           * (std::cos(feedback::DRUM_ANGLE_REF * feedback::DEG_TO_RAD)
              - std::cos(drum_angle * feedback::DEG_TO_RAD));
}

real_t con_drum_reactivity_deriv(real_t beta_total, real_t drum_speed, real_t drum_angle)
{
    return beta_total * 0.5 * feedback::DRUM_WORTH
           * std::sin(drum_angle * feedback::DEG_TO_RAD) * feedback::DEG_TO_RAD * drum_speed;
}
