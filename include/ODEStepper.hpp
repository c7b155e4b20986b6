#pragma once
/**
 * @file ODEStepper.hpp
 * @brief Adaptive implicit Runge–Kutta (Gauss–Legendre) integrator for the
 *        stiff reactor kinetics system.
 *
 * @details
 * Prompt-neutron dynamics evolve on the generation time Λ (~1e-5 s) while
 * temperatures and precursors evolve over seconds to minutes, so the system
 * is stiff. The ODEStepper therefore uses implicit collocation schemes and
 * solves the stage equations with a simplified Newton iteration.
 *
 * Responsibilities:
 *  - Hold Butcher tableau coefficients (a,b,c) for selected IRK scheme.
 *  - Assemble a finite-difference Jacobian of the right-hand side.
 *  - Factor I - dt (A ⊗ J) with LAPACK and iterate the stage equations.
 *  - Control the step size by step doubling against relTol/absTol and land
 *    exactly on every requested output time.
 */

#include "common.hpp"
#include "Integrator.hpp"

/**
 * @class ODEStepper
 * @brief Implicit Runge–Kutta solver with adaptive step size.
 *
 * @section usage Usage
 * - Construct with scheme, tolerances, Newton iteration limit and step budget.
 * - Call integrate() with a right-hand side, initial state and output grid.
 *
 * @section notes Notes
 * - Supported schemes: IRK1 (implicit midpoint, order 2), IRK2 (order 4),
 *   IRK3 (order 6).
 * - A rejected Newton solve (no convergence, divergence, singular matrix)
 *   shrinks the step by a factor of four and retries.
 * - Non-finite states or derivatives are reported on std::cerr and the rest
 *   of the output grid is filled with NaN instead of throwing.
 */
class ODEStepper : public Integrator
{
  private:
    Scheme scheme;                  ///< Selected implicit Runge–Kutta scheme.
    real_t relTol;                  ///< Relative local error tolerance.
    real_t absTol;                  ///< Absolute local error tolerance.
    int maxIts;                     ///< Newton iterations per stage solve.
    size_t maxSteps;                ///< Step attempts allowed per integrate() call.
    bool verbose;                   ///< Print step statistics after integrate().
    int order;                      ///< Classical order of the scheme.

    std::vector<vec_real> a;        ///< Butcher matrix.
    vec_real b;                     ///< Quadrature weights.
    vec_real c;                     ///< Stage abscissae.

    size_t acceptedSteps = 0;       ///< Accepted steps of the last run.
    size_t rejectedSteps = 0;       ///< Rejected attempts of the last run.
    size_t rhsEvaluations = 0;      ///< Right-hand side calls of the last run.

    /**
     * @brief One implicit step yIn@tIn → yOut@(tIn+dt).
     * @param rhs       Right-hand side.
     * @param jacobian  Approximation of df/dy near (tIn, yIn).
     * @param[out] itsReached Newton iterations used.
     * @param[out] converged  True if the stage equations were solved.
     */
    void stepIRK(const RhsFunction& rhs, const mat_real& jacobian,
                 const vec_real& yIn, vec_real& yOut, real_t tIn, real_t dt,
                 int& itsReached, bool& converged);

    /**
     * @brief Forward-difference Jacobian J_ij = d f_i / d y_j at (t, y).
     * @param f0 rhs(y, t), already evaluated.
     */
    void assembleJacobian(const RhsFunction& rhs, const vec_real& y, const vec_real& f0,
                          real_t t, mat_real& jacobian);

    /// Weighted RMS norm of (yFine - yCoarse) using the tolerances.
    real_t errorNorm(const vec_real& yOld, const vec_real& yCoarse, const vec_real& yFine) const;

    /// Starting step from the scale of y and f (Hairer–Wanner heuristic).
    real_t initialStepSize(const vec_real& y, const vec_real& f0, real_t span) const;

  public:
    /**
     * @brief Construct the stepper and its Butcher tableau.
     * @param method_   IRK1, IRK2 or IRK3.
     * @param relTol_   Relative tolerance (> 0).
     * @param absTol_   Absolute tolerance (> 0).
     * @param maxIts_   Newton iterations per step (> 0).
     * @param maxSteps_ Step attempts per integrate() call (> 0).
     * @param verbose_  Print statistics after each integrate().
     *
     * @throws std::invalid_argument for non-positive tolerances or limits.
     */
    ODEStepper(Scheme method_=Scheme::IRK2, real_t relTol_=1e-8, real_t absTol_=1e-10,
               int maxIts_=20, size_t maxSteps_=1000000, bool verbose_=false);

    mat_real integrate(const RhsFunction& rhs, const vec_real& y0, const vec_real& times) override;

    size_t getAcceptedSteps() const { return acceptedSteps; }
    size_t getRejectedSteps() const { return rejectedSteps; }
    size_t getRhsEvaluations() const { return rhsEvaluations; }
    int getOrder() const { return order; }
};
