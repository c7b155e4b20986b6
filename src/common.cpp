//==============================================================================
// common.cpp
// Utility functions: approximate equality, evenly spaced grids and
// JSON → group vector conversion.
//==============================================================================

#include "common.hpp"

//------------------------------------------------------------------------------
// Return true if |a - b| < tol (absolute tolerance).
//------------------------------------------------------------------------------
bool almost_equal(double a, double b, double tol)
{
    return std::abs(a - b) < tol;
}

//------------------------------------------------------------------------------
// Return true if |a - b| < tol * max(|a|, |b|, 1).
//------------------------------------------------------------------------------
bool relative_equal(double a, double b, double tol)
{
    real_t scale = std::max({std::abs(a), std::abs(b), 1.0});
    return std::abs(a - b) < tol * scale;
}

//------------------------------------------------------------------------------
// Closed-interval grid; the final sample is assigned `stop` directly so the
// endpoint never drifts by round-off.
//------------------------------------------------------------------------------
vec_real linspace(real_t start, real_t stop, size_t num)
{
    vec_real grid(num);
    if (num == 0)
    {
        return grid;
    }
    if (num == 1)
    {
        grid[0] = start;
        return grid;
    }

    const real_t step = (stop - start) / static_cast<real_t>(num - 1);
    for (size_t i=0; i<num-1; ++i)
    {
        grid[i] = start + static_cast<real_t>(i) * step;
    }
    grid[num-1] = stop;

    return grid;
}

//------------------------------------------------------------------------------
// JSON array → std::array of six reals, with a size check.
//------------------------------------------------------------------------------
group_vec to_group_vec(const json& array, const std::string& name)
{
    if (!array.is_array() || array.size() != NUM_PRECURSOR_GROUPS)
    {
        throw std::invalid_argument("'" + name + "' must be an array of "
                                    + std::to_string(NUM_PRECURSOR_GROUPS) + " numbers!");
    }

    group_vec out{};
    for (size_t i=0; i<NUM_PRECURSOR_GROUPS; ++i)
    {
        out[i] = array[i].get<real_t>();
    }
    return out;
}
