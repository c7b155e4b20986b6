#pragma once
/**
 * @file Dynamics.hpp
 * @brief Point-kinetics, heat-transport and reactivity-feedback equations.
 *
 * @details
 * Pure functions: identical inputs give identical outputs, nothing is cached.
 * Invalid physical inputs (zero period, zero mass, ...) are not trapped; the
 * resulting inf/NaN values propagate to the caller.
 *
 * Reactivity feedback model (coefficients in dollars, scaled by β):
 *  - fuel:      ρ_f(T) = β [a1 (T - T_f,ref) + a2 (T - T_f,ref)^2]
 *  - moderator: ρ_m(T) = β [b1 (T - T_m,ref) + b2 (T - T_m,ref)^2]
 *  - drum:      ρ_d(θ) = β W/2 [cos θ_ref - cos θ]      (θ in degrees)
 * Each *_deriv function is the chain-rule time derivative of its partner.
 */

#include "common.hpp"

namespace feedback
{
    constexpr real_t FUEL_TEMP_REF     = 900.0;     ///< [K]
    constexpr real_t FUEL_COEFF_LIN    = -2.875e-3; ///< [$/K]
    constexpr real_t FUEL_COEFF_QUAD   = 1.15e-6;   ///< [$/K^2]

    constexpr real_t MOD_TEMP_REF      = 864.0;     ///< [K]
    constexpr real_t MOD_COEFF_LIN     = -1.95e-3;  ///< [$/K]
    constexpr real_t MOD_COEFF_QUAD    = 4.2e-7;    ///< [$/K^2]

    constexpr real_t DRUM_WORTH        = 8.0;       ///< Total drum worth over 0..180 deg [$]
    constexpr real_t DRUM_ANGLE_REF    = 77.56;     ///< Angle with zero drum reactivity [deg]

    constexpr real_t DEG_TO_RAD        = M_PI / 180.0;
}

/**
 * @brief Neutron population rate dn/dt = ((ρ - β)/Λ) n + Σ λ_i c_i.
 * @param beta_total          Total delayed-neutron fraction β.
 * @param period              Generation time Λ [s].
 * @param power               Neutron population n.
 * @param precursor_constants Decay constants λ_i.
 * @param precursor_density   Precursor densities c_i.
 * @param rho_fuel_temp, rho_mod_temp, rho_con_drum Reactivity contributions (summed to ρ).
 */
real_t total_neutron_deriv(real_t beta_total, real_t period, real_t power,
                           const group_vec& precursor_constants, const group_vec& precursor_density,
                           real_t rho_fuel_temp, real_t rho_mod_temp, real_t rho_con_drum);

/**
 * @brief Precursor rates dc_i/dt = β_i n / Λ - λ_i c_i for all six groups.
 */
group_vec delay_neutron_deriv(const group_vec& beta_vector, real_t period, real_t power,
                              const group_vec& precursor_constants, const group_vec& precursor_density);

/**
 * @brief Moderator temperature rate
 *        dT_mod/dt = h/(M C) (T_fuel - T_mod) - 2 W/M (T_mod - T_in).
 */
real_t mod_temp_deriv(real_t heat_coeff, real_t mass_mod, real_t heat_cap_mod, real_t mass_flow,
                      real_t temp_fuel, real_t temp_mod, real_t temp_in);

/**
 * @brief Fuel temperature rate
 *        dT_fuel/dt = n/(M C) - h/(M C) (T_fuel - T_mod).
 */
real_t fuel_temp_deriv(real_t power, real_t mass_fuel, real_t heat_cap_fuel, real_t heat_coeff,
                       real_t temp_fuel, real_t temp_mod);

/// Fuel-temperature reactivity ρ_f(T_fuel) [dk].
real_t temp_fuel_reactivity(real_t beta_total, real_t temp_fuel);

/// dρ_f/dt = ρ_f'(T_fuel) * dT_fuel/dt.
real_t temp_fuel_reactivity_deriv(real_t power, real_t beta_total, real_t mass_fuel, real_t heat_cap_fuel,
                                  real_t heat_coeff, real_t temp_fuel, real_t temp_mod);

/// Moderator-temperature reactivity ρ_m(T_mod) [dk].
real_t temp_mod_reactivity(real_t beta_total, real_t temp_mod);

/// dρ_m/dt = ρ_m'(T_mod) * dT_mod/dt.
real_t temp_mod_reactivity_deriv(real_t beta_total, real_t heat_coeff, real_t mass_mod, real_t heat_cap_mod,
                                 real_t mass_flow, real_t temp_fuel, real_t temp_mod, real_t temp_in);

/// Control-drum reactivity ρ_d(θ) [dk], θ in degrees.
real_t con_drum_reactivity(real_t beta_total, real_t drum_angle);

/// dρ_d/dt = ρ_d'(θ) * ω, ω = drum speed [deg/s].
real_t con_drum_reactivity_deriv(real_t beta_total, real_t drum_speed, real_t drum_angle);
