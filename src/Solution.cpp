//==============================================================================
// Solution.cpp
// Column projections over the output grid of a reactor transient.
//==============================================================================

#include "Solution.hpp"

Solution::Solution(mat_real array_, vec_real t_)
    : array(std::move(array_)), t(std::move(t_))
{
    if (array.size() != t.size())
    {
        throw std::invalid_argument("Solution grid has " + std::to_string(array.size())
                                    + " rows but " + std::to_string(t.size()) + " times");
    }
    for (const auto& row : array)
    {
        if (row.size() != NumComponents)
        {
            throw std::invalid_argument("Solution rows must have " + std::to_string(NumComponents) + " columns");
        }
    }
}

vec_real Solution::column(size_t idx) const
{
    vec_real out(array.size());
    std::transform(array.begin(), array.end(), out.begin(),
                   [idx](const vec_real& row){ return row[idx]; });
    return out;
}

vec_real Solution::neutronPopulation() const { return column(NeutronPopulation); }

mat_real Solution::precursorDensities() const
{
    mat_real out(array.size(), vec_real(NUM_PRECURSOR_GROUPS));
    for (size_t k=0; k<array.size(); ++k)
    {
        std::copy(array[k].begin() + PrecursorDensity1, array[k].begin() + PrecursorDensity6 + 1,
                  out[k].begin());
    }
    return out;
}

vec_real Solution::precursorDensity(size_t i) const
{
    if (i < 1 || i > NUM_PRECURSOR_GROUPS)
    {
        throw std::out_of_range("Precursor group index " + std::to_string(i)
                                + " outside of [1, " + std::to_string(NUM_PRECURSOR_GROUPS) + "]");
    }
    return column(PrecursorDensity1 + i - 1);
}

vec_real Solution::tempMod() const { return column(TMod); }
vec_real Solution::tempFuel() const { return column(TFuel); }
vec_real Solution::rhoFuelTemp() const { return column(RhoFuelTemp); }
vec_real Solution::rhoModTemp() const { return column(RhoModTemp); }
vec_real Solution::drumAngle() const { return column(DrumAngle); }
vec_real Solution::rhoConDrum() const { return column(RhoConDrum); }

json Solution::toJson() const
{
    json out;
    out["t"] = t;

    const auto& names = State::componentNames();
    for (size_t idx=0; idx<NumComponents; ++idx)
    {
        out[names[idx]] = column(idx);
    }
    return out;
}
