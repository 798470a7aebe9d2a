#pragma once
#include "Types.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <vector>

namespace lyacorr {

/* ---------------------------  user visible bits  --------------------------- */
/*  A value ≤ 0 means "determine automatically".                              */

struct LMSolverOptions {
    int    max_iterations     = 200;
    double gradient_tolerance = 0;       // auto
    double step_tolerance     = 0;       // auto
    double chi2_tolerance     = 0;       // auto
    double initial_lambda     = 0;       // auto
    bool   verbose            = false;
};

struct LMSolverSummary {
    int    iterations   = 0;
    double initial_chi2 = 0.0;
    double final_chi2   = 0.0;
    bool   converged    = false;
    std::vector<double> param_uncertainties;   // 1-σ; 0 = fixed
};

/* --------------------  internal helper (column selection)  ----------------- */

inline int build_free_index(const std::vector<bool>& mask,
                            Eigen::Index             n,
                            std::vector<int>&        full_to_free)
{
    full_to_free.assign(static_cast<std::size_t>(n), -1);
    int n_free = 0;
    for (Eigen::Index j = 0; j < n; ++j) {
        if (mask.empty() || mask[static_cast<std::size_t>(j)])
            full_to_free[static_cast<std::size_t>(j)] = n_free++;
    }
    return n_free;
}

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  func(x, &r, &J) fills the residual vector and its Jacobian.
 *  Parameters with free_mask[j] == false are held at their input value,
 *  even outside [lower, upper]; the others are projected into the bounds
 *  after every step.
 */
template <typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                  func,
                    Vector&                    x,
                    const std::vector<bool>&   free_mask,
                    const std::vector<double>& lower,
                    const std::vector<double>& upper,
                    const LMSolverOptions&     user_opt = {})
{
    LMSolverSummary summ;
    const Eigen::Index n = x.size();
    LMSolverOptions opt = user_opt;

    std::vector<int> col;
    const int n_free = build_free_index(free_mask, n, col);
    if (n_free == 0) {
        if (opt.verbose) std::cout << "[LM] all parameters fixed, nothing to fit\n";
        summ.converged = true;
        summ.param_uncertainties.assign(static_cast<std::size_t>(n), 0.0);
        return summ;
    }

    // bounds apply to free parameters only; fixed ones keep their value
    auto project = [&](Vector& p) {
        for (Eigen::Index j = 0; j < n; ++j) {
            const auto k = static_cast<std::size_t>(j);
            if (col[k] < 0) continue;
            if (!lower.empty()) p[j] = std::max(p[j], lower[k]);
            if (!upper.empty()) p[j] = std::min(p[j], upper[k]);
        }
    };
    auto reduce = [&](const Matrix& J) {
        Matrix Jf(J.rows(), n_free);
        for (Eigen::Index j = 0; j < n; ++j) {
            const int c = col[static_cast<std::size_t>(j)];
            if (c >= 0) Jf.col(c) = J.col(j);
        }
        return Jf;
    };

    /* ---------------------- first evaluation ------------------------ */
    project(x);
    Vector r;
    Matrix J;
    func(x, &r, &J);
    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;

    Matrix Jf = reduce(J);
    const double eps = std::numeric_limits<double>::epsilon();

    if (opt.gradient_tolerance <= 0.0) {
        const double gmax0 = (Jf.transpose() * r).cwiseAbs().maxCoeff();
        opt.gradient_tolerance = gmax0 > 0.0 ? 1e-10 * gmax0 : 1e-14;
    }
    if (opt.step_tolerance <= 0.0)
        opt.step_tolerance = 1e-10 * std::max(1.0, x.lpNorm<Eigen::Infinity>());
    if (opt.chi2_tolerance <= 0.0)
        opt.chi2_tolerance = 1e-12 * std::max(1.0, chi2);
    if (opt.initial_lambda <= 0.0) {
        opt.initial_lambda = 1e-3 * (Jf.transpose() * Jf).diagonal().maxCoeff();
        if (opt.initial_lambda <= 0.0) opt.initial_lambda = 1e-3;
    }
    double lambda = opt.initial_lambda;

    /* ------------------------ iteration loop ------------------------ */
    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        const Vector g = Jf.transpose() * r;
        if (g.cwiseAbs().maxCoeff() < opt.gradient_tolerance) {
            summ.converged = true;
            break;
        }

        Matrix       JTJ  = Jf.transpose() * Jf;
        const Vector diag = JTJ.diagonal();
        JTJ.diagonal().array() += lambda * (diag.array() + 1e-20);   // Fletcher scaling

        const Vector dx_free = -JTJ.ldlt().solve(g);
        if (!dx_free.allFinite()) {
            if (opt.verbose) std::cout << "[LM] non-finite step, stopping\n";
            break;
        }

        Vector x_try = x;
        for (Eigen::Index j = 0; j < n; ++j) {
            const int c = col[static_cast<std::size_t>(j)];
            if (c >= 0) x_try[j] += dx_free[c];
        }
        project(x_try);

        Vector step_free(n_free);
        for (Eigen::Index j = 0; j < n; ++j) {
            const int c = col[static_cast<std::size_t>(j)];
            if (c >= 0) step_free[c] = x_try[j] - x[j];
        }
        if (step_free.cwiseAbs().maxCoeff() < opt.step_tolerance) {
            summ.converged = true;             // pinned on a bound or at the minimum
            break;
        }

        Vector r_try;
        Matrix J_try;
        func(x_try, &r_try, &J_try);
        const double chi2_try = r_try.squaredNorm();

        /* predicted reduction of the (projected) step */
        double pred = -(2.0 * g.dot(step_free) +
                        (Jf * step_free).squaredNorm());
        if (pred <= 0.0) pred = eps;
        const double rho = (chi2 - chi2_try) / pred;

        if (rho > 0.0 && chi2_try < chi2) {
            const double gain = chi2 - chi2_try;
            x.swap(x_try);
            r.swap(r_try);
            Jf   = reduce(J_try);
            chi2 = chi2_try;
            lambda *= std::max(1.0 / 3.0, 1.0 - std::pow(2.0 * rho - 1.0, 3.0));
            lambda  = std::max(lambda, 1e-18);

            if (opt.verbose)
                std::cout << "[LM] iter " << it
                          << "  rho=" << std::setprecision(3) << rho
                          << "  chi2=" << chi2 << "  lambda=" << lambda << '\n';

            if (gain < opt.chi2_tolerance) {
                summ.converged = true;
                break;
            }
        } else {
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << "[LM] iter " << it << "  rejected, lambda=" << lambda << '\n';
        }
    }

    summ.final_chi2 = chi2;

    /* ------------------- 1-σ from the curvature --------------------- */
    summ.param_uncertainties.assign(static_cast<std::size_t>(n), 0.0);
    const double dof = std::max<double>(static_cast<double>(r.size()) - n_free, 1.0);
    Matrix cov = (Jf.transpose() * Jf).ldlt()
                     .solve(Matrix::Identity(n_free, n_free)) * (chi2 / dof);
    for (Eigen::Index j = 0; j < n; ++j) {
        const int c = col[static_cast<std::size_t>(j)];
        if (c >= 0)
            summ.param_uncertainties[static_cast<std::size_t>(j)] =
                std::sqrt(std::max(0.0, cov(c, c)));
    }
    return summ;
}

} // namespace lyacorr
