#pragma once
/**
 * @file common.hpp
 * @brief Common type aliases, utility functions, and third-party includes
 *        for the reactor point-kinetics solver.
 *
 * @details
 * This header centralizes:
 *  - Standard library and third-party includes.
 *  - Type aliases for reals, vectors and dense row-major grids.
 *  - Enumerations shared between configuration and integrator.
 *  - Shared numerical/IO utility functions (approximate equality checks,
 *    evenly spaced grids, JSON group vectors).
 *
 * It is intended to be included across the project for consistent types
 * and helper functions.
 */

// ========== Standard Library ==========
#include <iostream>
#include <iomanip>
#include <cmath>
#include <vector>
#include <array>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <functional>
#include <memory>
#include <cstring>
#include <string>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <limits>
#include <chrono>

// ========== Third-Party Libraries ==========
#include <nlohmann/json.hpp> ///< JSON for Modern C++

// ========== LAPACK ==========
#include <lapacke.h>        ///< LAPACK C interface

// ========== ENUM CLASSES ==========
/**
 * @enum Scheme
 * @brief Available implicit Runge–Kutta (Gauss–Legendre) integration schemes.
 */
enum class Scheme { IRK1, IRK2, IRK3 };

// ========== Aliases ===============
using real_t     = double;                     ///< Floating point type used globally.
using vec_real   = std::vector<real_t>;        ///< Vector of real values.
using mat_real   = std::vector<std::vector<real_t>>;   ///< Matrix of real values (row-major rows).
using json       = nlohmann::json;             ///< JSON type alias.

/// Number of delayed-neutron precursor groups.
constexpr size_t NUM_PRECURSOR_GROUPS = 6;

/// Fixed-size vector over the six precursor groups.
using group_vec  = std::array<real_t, NUM_PRECURSOR_GROUPS>;

// ============ Common Functions =======

/**
 * @brief Check approximate equality of two real numbers.
 * @param a First number.
 * @param b Second number.
 * @param tol Absolute tolerance (default 1e-15).
 * @return true if |a-b| < tol.
 */
bool almost_equal(double a, double b, double tol = 1e-15);

/**
 * @brief Check approximate equality of two real numbers relative to their size.
 * @return true if |a-b| < tol * max(|a|, |b|, 1).
 */
bool relative_equal(double a, double b, double tol = 1e-12);

/**
 * @brief Evenly spaced samples over [start, stop], both endpoints included.
 *
 * @param start First sample.
 * @param stop  Last sample.
 * @param num   Number of samples.
 * @return Vector of length num; the last entry is exactly `stop`.
 */
vec_real linspace(real_t start, real_t stop, size_t num);

/**
 * @brief Convert a JSON array into a fixed-size group vector.
 * @throws std::invalid_argument if the array does not hold exactly six numbers.
 */
group_vec to_group_vec(const json& array, const std::string& name);
