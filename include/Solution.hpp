#pragma once
/**
 * @file Solution.hpp
 * @brief Read-only view over the integrated reactor trajectory.
 *
 * @details
 * Holds the output times and the dense grid (one row per time, one column
 * per StateComponent). Every accessor is a pure column projection.
 */

#include "common.hpp"
#include "State.hpp"

/**
 * @class Solution
 * @brief Time series of reactor states on the output grid.
 */
class Solution
{
  private:
    mat_real array;   ///< rows = times, columns = StateComponent order.
    vec_real t;       ///< Output times.

    vec_real column(size_t idx) const;

  public:
    /**
     * @brief Take ownership of the grid and its time vector.
     * @throws std::invalid_argument if array.size() != t.size() or a row does
     *         not have NumComponents columns.
     */
    Solution(mat_real array_, vec_real t_);

    const mat_real& getArray() const { return array; }
    const vec_real& getT() const { return t; }
    size_t size() const { return t.size(); }

    /// State at output row k.
    State stateAt(size_t k) const { return State::fromArray(array.at(k)); }

    vec_real neutronPopulation() const;

    /// All six precursor series, rows = times.
    mat_real precursorDensities() const;

    /**
     * @brief Precursor density series of group i.
     * @param i 1-indexed group, to match the c_i notation.
     * @throws std::out_of_range if i is outside [1, 6].
     */
    vec_real precursorDensity(size_t i) const;

    vec_real tempMod() const;
    vec_real tempFuel() const;
    vec_real rhoFuelTemp() const;
    vec_real rhoModTemp() const;
    vec_real drumAngle() const;
    vec_real rhoConDrum() const;

    /// {"t": [...], "<component name>": [...], ...} for plotting tools.
    json toJson() const;
};
