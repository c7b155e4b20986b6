//==============================================================================
// test_dynamics.cpp
// Checks of the point-kinetics, heat-balance and feedback equations.
//
//  1) Neutron and precursor rates against hand-computed reference values
//     (six groups, λ = [0.0124, 0.0305, 0.111, 0.3011, 1.14, 3.01]).
//  2) Each reactivity-rate function equals d(rho)/dT * dT/dt, with d(rho)/dT
//     taken by central differences of the matching reactivity function.
//  3) Zero reactivity at the reference temperatures / drum angle.
//  4) heat_coeff = 0 decouples the fuel and moderator temperature rates.
//  5) Degenerate constants (Λ = 0) propagate as non-finite values.
//==============================================================================

#include <cassert>
#include "Dynamics.hpp"

int main()
{
    const group_vec lambda    = {0.0124, 0.0305, 0.1110, 0.3011, 1.1400, 3.0100};
    const group_vec precursor = {5000, 6000, 5600, 4700, 7800, 6578};

    //--------------------------------------------------------------------------
    // 1) Reference rates
    //--------------------------------------------------------------------------
    {
        // ρ = 0.00375 split over the three mechanisms; only the sum matters
        real_t dndt = total_neutron_deriv(0.0075, 6e-5, 4000.0, lambda, precursor,
                                          0.00125, 0.00125, 0.00125);
        assert(relative_equal(dndt, -219026.45, 1e-10));

        real_t dndtSingle = total_neutron_deriv(0.0075, 6e-5, 4000.0, lambda, precursor,
                                                0.00375, 0.0, 0.0);
        assert(relative_equal(dndtSingle, -219026.45, 1e-10));
    }
    {
        const group_vec beta = {0.033, 0.219, 0.196, 0.395, 0.115, 0.042};
        const group_vec ref  = {17538.0, 116617.0, 103911.73333333333,
                                209251.49666666667, 52441.333333333333, 2600.22};

        group_vec dcdt = delay_neutron_deriv(beta, 0.0075, 4000.0, lambda, precursor);
        for (size_t i=0; i<NUM_PRECURSOR_GROUPS; ++i)
        {
            assert(relative_equal(dcdt[i], ref[i], 1e-10));
        }
    }

    //--------------------------------------------------------------------------
    // 2) Reactivity rates vs. finite differences of the reactivity curves
    //--------------------------------------------------------------------------
    const real_t beta = 0.0075;
    const real_t power = 1.2e6, massFuel = 1000.0, heatCapFuel = 200.0;
    const real_t heatCoeff = 27777.78, massMod = 500.0, heatCapMod = 1500.0;
    const real_t massFlow = 13.889, tempIn = 840.0;
    const real_t h = 1e-3;

    for (real_t tFuel : {850.0, 900.0, 1012.5})
    {
        for (real_t tMod : {840.0, 864.0, 901.0})
        {
            real_t dRhodT = (temp_fuel_reactivity(beta, tFuel + h)
                             - temp_fuel_reactivity(beta, tFuel - h)) / (2.0*h);
            real_t expected = dRhodT * fuel_temp_deriv(power, massFuel, heatCapFuel, heatCoeff, tFuel, tMod);
            real_t actual = temp_fuel_reactivity_deriv(power, beta, massFuel, heatCapFuel, heatCoeff, tFuel, tMod);
            assert(std::abs(actual - expected) <= 1e-6 * std::abs(expected) + 1e-14);

            dRhodT = (temp_mod_reactivity(beta, tMod + h) - temp_mod_reactivity(beta, tMod - h)) / (2.0*h);
            expected = dRhodT * mod_temp_deriv(heatCoeff, massMod, heatCapMod, massFlow, tFuel, tMod, tempIn);
            actual = temp_mod_reactivity_deriv(beta, heatCoeff, massMod, heatCapMod, massFlow, tFuel, tMod, tempIn);
            assert(std::abs(actual - expected) <= 1e-6 * std::abs(expected) + 1e-14);
        }
    }

    for (real_t angle : {10.0, 77.56, 95.0, 170.0})
    {
        const real_t speed = 0.75;
        real_t dRhodTheta = (con_drum_reactivity(beta, angle + h)
                             - con_drum_reactivity(beta, angle - h)) / (2.0*h);
        real_t actual = con_drum_reactivity_deriv(beta, speed, angle);
        assert(std::abs(actual - dRhodTheta * speed) <= 1e-6 * std::abs(actual) + 1e-14);

        // Parked drums do not change the reactivity
        assert(con_drum_reactivity_deriv(beta, 0.0, angle) == 0.0);
    }

    //--------------------------------------------------------------------------
    // 3) Reference points
    //--------------------------------------------------------------------------
    assert(temp_fuel_reactivity(beta, feedback::FUEL_TEMP_REF) == 0.0);
    assert(temp_mod_reactivity(beta, feedback::MOD_TEMP_REF) == 0.0);
    assert(con_drum_reactivity(beta, feedback::DRUM_ANGLE_REF) == 0.0);

    // Hotter fuel / moderator is less reactive; turning the drums out adds reactivity
    assert(temp_fuel_reactivity(beta, 950.0) < 0.0);
    assert(temp_mod_reactivity(beta, 900.0) < 0.0);
    assert(con_drum_reactivity(beta, 90.0) > 0.0);
    assert(con_drum_reactivity(beta, 60.0) < 0.0);

    //--------------------------------------------------------------------------
    // 4) heat_coeff = 0: no fuel/moderator coupling
    //--------------------------------------------------------------------------
    {
        real_t modA = mod_temp_deriv(0.0, massMod, heatCapMod, massFlow, 900.0, 870.0, tempIn);
        real_t modB = mod_temp_deriv(0.0, massMod, heatCapMod, massFlow, 1500.0, 870.0, tempIn);
        assert(modA == modB);
        assert(almost_equal(modA, -2.0 * massFlow / massMod * (870.0 - tempIn), 1e-12));

        real_t fuelA = fuel_temp_deriv(power, massFuel, heatCapFuel, 0.0, 900.0, 870.0);
        real_t fuelB = fuel_temp_deriv(power, massFuel, heatCapFuel, 0.0, 900.0, 300.0);
        assert(fuelA == fuelB);
        assert(relative_equal(fuelA, power / (massFuel * heatCapFuel), 1e-14));
    }

    //--------------------------------------------------------------------------
    // 5) Λ = 0 is not trapped
    //--------------------------------------------------------------------------
    {
        real_t dndt = total_neutron_deriv(beta, 0.0, 4000.0, lambda, precursor, 0.0, 0.0, 0.0);
        assert(!std::isfinite(dndt));

        group_vec dcdt = delay_neutron_deriv(lambda, 0.0, 4000.0, lambda, precursor);
        assert(!std::isfinite(dcdt[0]));
    }

    std::cout << "test_dynamics passed." << std::endl;
    return 0;
}
