//==============================================================================
// ODEStepper.cpp
// Adaptive implicit Runge–Kutta (Gauss–Legendre) integrator for the stiff
// reactor kinetics system. Supports IRK1/IRK2/IRK3 collocation.
// Responsibilities:
//   • Hold Butcher tableau (a,b,c) for chosen IRK scheme.
//   • Finite-difference Jacobian of the RHS, reused for one step attempt.
//   • Simplified Newton on the stage increments, I - dt (A ⊗ J) via LAPACK.
//   • Step doubling error estimate; steps clipped to the output grid.
//==============================================================================

#include "ODEStepper.hpp"

namespace
{
    /// Newton convergence threshold on the tolerance-weighted update norm.
    constexpr real_t NEWTON_TOL = 1e-4;

    /// Step growth/shrink limits and safety factor of the controller.
    constexpr real_t FAC_MAX    = 5.0;
    constexpr real_t FAC_MIN    = 0.2;
    constexpr real_t FAC_SAFETY = 0.9;

    bool all_finite(const vec_real& v)
    {
        return std::all_of(v.begin(), v.end(), [](real_t x){ return std::isfinite(x); });
    }
}

//------------------------------------------------------------------------------
// Ctor: choose IRK scheme and build its Butcher tableau.
//  - IRK1: 1-stage Gauss (midpoint)
//  - IRK2: 2-stage Gauss (order 4)
//  - IRK3: 3-stage Gauss (order 6)
//------------------------------------------------------------------------------
ODEStepper::ODEStepper(Scheme method_, real_t relTol_, real_t absTol_, int maxIts_,
                       size_t maxSteps_, bool verbose_)
    : scheme(method_), relTol(relTol_), absTol(absTol_), maxIts(maxIts_),
      maxSteps(maxSteps_), verbose(verbose_), order(0)
{
    if (!(relTol > 0.0) || !(absTol > 0.0))
    {
        throw std::invalid_argument("ODEStepper tolerances must be positive!");
    }
    if (maxIts <= 0 || maxSteps == 0)
    {
        throw std::invalid_argument("ODEStepper iteration and step limits must be positive!");
    }

    size_t stage {};

    switch (scheme)
    {
        case Scheme::IRK1:
            stage = 1;
            order = 2;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=1
            a[0][0] = 0.5;
            b[0]    = 1.0;
            c[0]    = 0.5;
            break;

        case Scheme::IRK2:
            stage = 2;
            order = 4;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=2
            a[0][0] = 0.25;
            a[0][1] = 0.25 - 0.5 / std::sqrt(3.0);
            a[1][0] = 0.25 + 0.5 / std::sqrt(3.0);
            a[1][1] = 0.25;
            b[0] = b[1] = 0.5;
            c[0] = 0.5 - 0.5 / std::sqrt(3.0);
            c[1] = 0.5 + 0.5 / std::sqrt(3.0);
            break;

        case Scheme::IRK3:
            stage = 3;
            order = 6;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=3
            a[0][0] = 5.0 / 36.0;
            a[0][1] = 2.0 / 9.0 - std::sqrt(15.0) / 15.0;
            a[0][2] = 5.0 / 36.0 - std::sqrt(15.0) / 30.0;
            a[1][0] = 5.0 / 36.0 + std::sqrt(15.0) / 24.0;
            a[1][1] = 2.0 / 9.0;
            a[1][2] = 5.0 / 36.0 - std::sqrt(15.0) / 24.0;
            a[2][0] = 5.0 / 36.0 + std::sqrt(15.0) / 30.0;
            a[2][1] = 2.0 / 9.0 + std::sqrt(15.0) / 15.0;
            a[2][2] = 5.0 / 36.0;
            b[0] = b[2] = 5.0 / 18.0;
            b[1]        = 4.0 / 9.0;
            c[0] = 0.5 - std::sqrt(15.0) / 10.0;
            c[1] = 0.5;
            c[2] = 0.5 + std::sqrt(15.0) / 10.0;
            break;
    }
}

//------------------------------------------------------------------------------
// integrate
// March through the output grid. Each step attempt:
//   1) f0 = rhs(y, t); stop with NaN rows if y or f0 is non-finite.
//   2) J at (t, y) by forward differences.
//   3) One step of size dt and two of dt/2; error = |y_2 - y_1| / (2^p - 1).
//   4) Accept (keep the two half steps) or reject; new dt from the error.
//------------------------------------------------------------------------------
mat_real ODEStepper::integrate(const RhsFunction& rhs, const vec_real& y0, const vec_real& times)
{
    if (times.size() < 2)
    {
        throw std::invalid_argument("At least two output times are required!");
    }
    for (size_t k=1; k<times.size(); ++k)
    {
        if (!(times[k] > times[k-1]))
        {
            throw std::invalid_argument("Output times must be strictly increasing!");
        }
    }
    if (y0.empty())
    {
        throw std::invalid_argument("Initial state must not be empty!");
    }

    acceptedSteps = 0;
    rejectedSteps = 0;
    rhsEvaluations = 0;

    const size_t N = y0.size();
    const real_t errScale = std::pow(2.0, order) - 1.0;

    RhsFunction countedRhs = [this, &rhs](const vec_real& y, vec_real& dydt, real_t t)
    {
        ++rhsEvaluations;
        rhs(y, dydt, t);
    };

    auto toc = std::chrono::high_resolution_clock::now();

    mat_real grid(times.size(), vec_real(N));
    grid[0] = y0;

    vec_real y = y0, f0(N), yCoarse(N), yHalf(N), yFine(N);
    mat_real J(N, vec_real(N));
    real_t t = times[0];
    real_t h = 0.0;

    for (size_t k=1; k<times.size(); ++k)
    {
        const real_t tOut = times[k];

        while (t < tOut)
        {
            countedRhs(y, f0, t);

            if (!all_finite(y) || !all_finite(f0))
            {
                std::cerr << "WARNING: Non-finite state or derivative at t = " << t
                          << "; remaining output rows set to NaN." << std::endl;
                for (size_t r=k; r<times.size(); ++r)
                {
                    grid[r].assign(N, std::numeric_limits<real_t>::quiet_NaN());
                }
                return grid;
            }

            if (h <= 0.0)
            {
                h = initialStepSize(y, f0, times.back() - times.front());
            }

            assembleJacobian(countedRhs, y, f0, t, J);

            bool accepted = false;
            while (!accepted)
            {
                if (acceptedSteps + rejectedSteps >= maxSteps)
                {
                    throw std::runtime_error("ODEStepper exceeded " + std::to_string(maxSteps)
                                             + " step attempts at t = " + std::to_string(t));
                }

                // Swallow a remainder of less than 1% of h into this step
                const bool lastStep = (t + 1.01 * h >= tOut);
                const real_t dt = lastStep ? tOut - t : h;

                if (dt < 1e-14 * std::max(std::abs(t), 1.0))
                {
                    throw std::runtime_error("ODEStepper step size underflow at t = " + std::to_string(t));
                }

                int its = 0;
                bool converged = false;
                stepIRK(countedRhs, J, y, yCoarse, t, dt, its, converged);
                if (converged) stepIRK(countedRhs, J, y, yHalf, t, 0.5*dt, its, converged);
                if (converged) stepIRK(countedRhs, J, yHalf, yFine, t + 0.5*dt, 0.5*dt, its, converged);

                if (!converged)
                {
                    ++rejectedSteps;
                    h = 0.25 * dt;
                    continue;
                }

                const real_t err = errorNorm(y, yCoarse, yFine) / errScale;

                real_t fac = (err > 0.0) ? FAC_SAFETY * std::pow(err, -1.0 / (order + 1)) : FAC_MAX;
                if (!std::isfinite(fac)) fac = FAC_MIN;
                fac = std::min(FAC_MAX, std::max(FAC_MIN, fac));

                if (err <= 1.0)
                {
                    accepted = true;
                    ++acceptedSteps;
                    t = lastStep ? tOut : t + dt;
                    y = yFine;
                    // A step shortened to hit tOut says nothing about the next one
                    h = lastStep ? std::max(h, dt * fac) : dt * fac;
                }
                else
                {
                    ++rejectedSteps;
                    h = dt * fac;
                }
            }
        }

        grid[k] = y;
    }

    if (verbose)
    {
        auto tic = std::chrono::high_resolution_clock::now();
        std::cout << "IRK" << static_cast<int>(scheme)+1 << " integration: "
                  << acceptedSteps << " accepted / " << rejectedSteps << " rejected steps, "
                  << rhsEvaluations << " RHS evaluations in "
                  << static_cast<real_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(tic-toc).count()) / 1e9
                  << " s." << std::endl;
    }

    return grid;
}

//------------------------------------------------------------------------------
// stepIRK
// Unknowns are the stage increments Z_i = Y_i - y (stage × N, interleaved by
// stage). Simplified Newton:
//   (I - dt A⊗J) ΔZ = -Z + dt Σ_k a_ik f(t + c_k dt, y + Z_k)
// with the matrix factored once per call (dgetrf) and reused (dgetrs).
// After convergence: y_out = y + dt Σ_i b_i f_i.
//------------------------------------------------------------------------------
void ODEStepper::stepIRK(const RhsFunction& rhs, const mat_real& jacobian,
                         const vec_real& yIn, vec_real& yOut, real_t tIn, real_t dt,
                         int& itsReached, bool& converged)
{
    const size_t N = yIn.size();
    const size_t stage = b.size();
    const size_t dim = stage * N;

    itsReached = 0;
    converged = false;

    // Iteration matrix, row-major
    vec_real M(dim * dim, 0.0);
    for (size_t i=0; i<stage; ++i)
    {
        for (size_t p=0; p<N; ++p)
        {
            const size_t row = i*N + p;
            for (size_t k=0; k<stage; ++k)
            {
                for (size_t q=0; q<N; ++q)
                {
                    M[row*dim + k*N + q] = -dt * a[i][k] * jacobian[p][q];
                }
            }
            M[row*dim + row] += 1.0;
        }
    }

    std::vector<lapack_int> ipiv(dim);
    lapack_int info = LAPACKE_dgetrf(LAPACK_ROW_MAJOR, static_cast<lapack_int>(dim), static_cast<lapack_int>(dim),
                                     M.data(), static_cast<lapack_int>(dim), ipiv.data());
    if (info < 0)
    {
        throw std::runtime_error("LAPACKE_dgetrf failed with info = " + std::to_string(info));
    }
    if (info > 0)
    {
        // Singular iteration matrix; the caller retries with a smaller step
        return;
    }

    mat_real Z(stage, vec_real(N, 0.0)), f(stage, vec_real(N));
    vec_real yStage(N), res(dim);
    real_t normOld = 0.0;

    for (int its=0; its<maxIts; ++its)
    {
        ++itsReached;

        // Evaluate RHS at current stage guesses
        for (size_t i=0; i<stage; ++i)
        {
            for (size_t p=0; p<N; ++p)
            {
                yStage[p] = yIn[p] + Z[i][p];
            }
            rhs(yStage, f[i], tIn + c[i]*dt);
        }

        // Negative residual of the stage equations
        for (size_t i=0; i<stage; ++i)
        {
            for (size_t p=0; p<N; ++p)
            {
                real_t tmp = -Z[i][p];
                for (size_t k=0; k<stage; ++k)
                {
                    tmp += dt * a[i][k] * f[k][p];
                }
                res[i*N + p] = tmp;
            }
        }

        info = LAPACKE_dgetrs(LAPACK_ROW_MAJOR, 'N', static_cast<lapack_int>(dim), 1, M.data(),
                              static_cast<lapack_int>(dim), ipiv.data(), res.data(), 1);
        if (info != 0)
        {
            throw std::runtime_error("LAPACKE_dgetrs failed with info = " + std::to_string(info));
        }

        // Update and tolerance-weighted RMS of the correction
        real_t norm2 = 0.0;
        for (size_t i=0; i<stage; ++i)
        {
            for (size_t p=0; p<N; ++p)
            {
                Z[i][p] += res[i*N + p];
                const real_t sc = absTol + relTol * std::abs(yIn[p]);
                norm2 += std::pow(res[i*N + p] / sc, 2);
            }
        }
        const real_t norm = std::sqrt(norm2 / static_cast<real_t>(dim));

        if (!std::isfinite(norm))
        {
            return;
        }
        if (norm < NEWTON_TOL)
        {
            converged = true;
            break;
        }
        // Corrections growing again: give up on this dt
        if (its >= 2 && norm > normOld)
        {
            return;
        }
        normOld = norm;
    }

    if (!converged)
    {
        return;
    }

    // Final combination: y^{n+1} = y + dt * Σ_i b_i f_i at the converged stages
    for (size_t i=0; i<stage; ++i)
    {
        for (size_t p=0; p<N; ++p)
        {
            yStage[p] = yIn[p] + Z[i][p];
        }
        rhs(yStage, f[i], tIn + c[i]*dt);
    }

    yOut = yIn;
    for (size_t i=0; i<stage; ++i)
    {
        for (size_t p=0; p<N; ++p)
        {
            yOut[p] += dt * b[i] * f[i][p];
        }
    }

    if (!all_finite(yOut))
    {
        converged = false;
    }
}

//------------------------------------------------------------------------------
// assembleJacobian
// Column j ≈ (f(y + ε_j e_j) - f(y)) / ε_j, ε_j = sqrt(eps) * max(|y_j|, 1).
// Filled as jacobian[row][col] for the row-major iteration matrix.
//------------------------------------------------------------------------------
void ODEStepper::assembleJacobian(const RhsFunction& rhs, const vec_real& y, const vec_real& f0,
                                  real_t t, mat_real& jacobian)
{
    const size_t N = y.size();
    const real_t sqrtEps = std::sqrt(std::numeric_limits<real_t>::epsilon());

    vec_real perturbed = y;
    vec_real fPerturbed(N);

    for (size_t j=0; j<N; ++j)
    {
        const real_t eps = sqrtEps * std::max(std::abs(y[j]), 1.0);
        perturbed[j] = y[j] + eps;

        rhs(perturbed, fPerturbed, t);

        for (size_t i=0; i<N; ++i)
        {
            jacobian[i][j] = (fPerturbed[i] - f0[i]) / eps;
        }
        perturbed[j] = y[j];
    }
}

//------------------------------------------------------------------------------
// errorNorm: sqrt( mean( ((yFine - yCoarse) / sc)^2 ) ),
// sc = absTol + relTol * max(|yOld|, |yFine|).
//------------------------------------------------------------------------------
real_t ODEStepper::errorNorm(const vec_real& yOld, const vec_real& yCoarse, const vec_real& yFine) const
{
    real_t sum = 0.0;
    for (size_t i=0; i<yOld.size(); ++i)
    {
        const real_t sc = absTol + relTol * std::max(std::abs(yOld[i]), std::abs(yFine[i]));
        sum += std::pow((yFine[i] - yCoarse[i]) / sc, 2);
    }
    return std::sqrt(sum / static_cast<real_t>(yOld.size()));
}

//------------------------------------------------------------------------------
// initialStepSize: h = 0.01 * |y|_sc / |f|_sc, bounded by the full span.
//------------------------------------------------------------------------------
real_t ODEStepper::initialStepSize(const vec_real& y, const vec_real& f0, real_t span) const
{
    real_t d0 = 0.0, d1 = 0.0;
    for (size_t i=0; i<y.size(); ++i)
    {
        const real_t sc = absTol + relTol * std::abs(y[i]);
        d0 += std::pow(y[i] / sc, 2);
        d1 += std::pow(f0[i] / sc, 2);
    }
    d0 = std::sqrt(d0 / static_cast<real_t>(y.size()));
    d1 = std::sqrt(d1 / static_cast<real_t>(y.size()));

    real_t h0 = (d0 < 1e-5 || d1 < 1e-5) ? 1e-6 : 0.01 * d0 / d1;
    return std::min(h0, span);
}
