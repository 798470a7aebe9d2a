#pragma once
#include "Types.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace lyacorr {

/* ---------------------------  user visible bits  --------------------------- */

struct PowellOptions {
    int    max_iterations     = 200;
    int    max_function_evals = 20000;
    double relative_tolerance = 1e-8;     // on the objective
    double absolute_tolerance = 1e-12;
    double line_tolerance     = 1e-8;     // relative, along a direction
    bool   verbose            = false;
};

struct PowellSummary {
    int    iterations     = 0;
    int    function_evals = 0;
    double initial_value  = 0.0;
    double final_value    = 0.0;
    bool   converged      = false;
};

/* ------------------------  internal helper functions  ----------------------- */

namespace detail {

// feasible step range [t_lo, t_hi] of  p + t * dir  inside the box
inline void step_range(const Vector& p, const Vector& dir,
                       const Vector& lower, const Vector& upper,
                       double& t_lo, double& t_hi)
{
    t_lo = -std::numeric_limits<double>::infinity();
    t_hi =  std::numeric_limits<double>::infinity();
    for (Eigen::Index i = 0; i < p.size(); ++i) {
        if (std::abs(dir[i]) <= std::numeric_limits<double>::epsilon()) continue;
        const double a = (lower[i] - p[i]) / dir[i];
        const double b = (upper[i] - p[i]) / dir[i];
        t_lo = std::max(t_lo, std::min(a, b));
        t_hi = std::min(t_hi, std::max(a, b));
    }
}

/* Brent's method on [a, b] starting from the interior point x (value fx). */
template <typename F1>
void brent(F1& f, double a, double b, double& x, double& fx,
           double tol, int& nfe, int max_nfe)
{
    constexpr double cgold = 0.3819660112501051;
    double w = x, v = x, fw = fx, fv = fx;
    double d = 0.0, e = 0.0;

    for (int it = 0; it < 100 && nfe < max_nfe; ++it) {
        const double xm   = 0.5 * (a + b);
        const double tol1 = tol * std::abs(x) + 1e-14;
        const double tol2 = 2.0 * tol1;
        if (std::abs(x - xm) <= tol2 - 0.5 * (b - a)) break;

        bool golden = true;
        if (std::abs(e) > tol1) {
            double r = (x - w) * (fx - fv);
            double q = (x - v) * (fx - fw);
            double p = (x - v) * q - (x - w) * r;
            q = 2.0 * (q - r);
            if (q > 0.0) p = -p;
            q = std::abs(q);
            const double e_old = e;
            e = d;
            if (std::abs(p) < std::abs(0.5 * q * e_old) &&
                p > q * (a - x) && p < q * (b - x)) {
                d = p / q;
                const double u = x + d;
                if (u - a < tol2 || b - u < tol2) d = (xm >= x) ? tol1 : -tol1;
                golden = false;
            }
        }
        if (golden) {
            e = (x >= xm) ? a - x : b - x;
            d = cgold * e;
        }

        const double u  = (std::abs(d) >= tol1) ? x + d : x + (d >= 0.0 ? tol1 : -tol1);
        const double fu = f(u);
        ++nfe;

        if (fu <= fx) {
            if (u >= x) a = x; else b = x;
            v = w; fv = fw;
            w = x; fw = fx;
            x = u; fx = fu;
        } else {
            if (u < x) a = u; else b = u;
            if (fu <= fw || w == x) {
                v = w; fv = fw;
                w = u; fw = fu;
            } else if (fu <= fv || v == x || v == w) {
                v = u; fv = fu;
            }
        }
    }
}

/*
 * Minimise along p + t * dir.  Returns the step t (0 if nothing better was
 * found) and updates f0 to the value reached.
 */
template <typename Objective>
double line_minimize(Objective& func, const Vector& p, const Vector& dir,
                     const Vector& lower, const Vector& upper,
                     double step, double& f0, double tol,
                     int& nfe, int max_nfe)
{
    double t_lo, t_hi;
    step_range(p, dir, lower, upper, t_lo, t_hi);
    if (!(t_lo < t_hi)) return 0.0;

    auto f1 = [&](double t) {
        const double v = func(Vector(p + t * dir));
        return std::isfinite(v) ? v : std::numeric_limits<double>::max();
    };
    auto clamp = [&](double t) { return std::clamp(t, t_lo, t_hi); };

    /* ---- bracket: downhill from 0, expanding by the golden ratio ---- */
    constexpr double grow = 1.618033988749895;
    double ta = 0.0, fa = f0;
    double tb = clamp(step), fb = f1(tb);
    ++nfe;
    if (fb > fa) {
        const double tm = clamp(-step);
        const double fm = f1(tm);
        ++nfe;
        if (fm >= fa) {
            /* minimum between the two probes */
            double x = 0.0, fx = f0;
            brent(f1, std::min(tm, tb), std::max(tm, tb), x, fx, tol, nfe, max_nfe);
            if (fx < f0) { f0 = fx; return x; }
            return 0.0;
        }
        tb = tm; fb = fm;
    }

    double tc = clamp(tb + grow * (tb - ta));
    double fc = (tc == tb) ? fb : f1(tc);
    ++nfe;
    while (fc < fb && tc != tb && nfe < max_nfe) {
        ta = tb; fa = fb;
        tb = tc; fb = fc;
        tc = clamp(tb + grow * (tb - ta));
        if (tc == tb) break;                        // sitting on a bound
        fc = f1(tc);
        ++nfe;
    }

    double x = tb, fx = fb;
    if (tc != tb)
        brent(f1, std::min(ta, tc), std::max(ta, tc), x, fx, tol, nfe, max_nfe);

    if (fx < f0) { f0 = fx; return x; }
    return 0.0;
}

} // namespace detail

/* -------------------  Powell's method driver routine  ---------------------- */
/*  Derivative-free minimisation of a scalar objective inside a box.          */
/*  lower / upper may be empty (unbounded).                                   */

template <typename Objective>
PowellSummary
powell(Objective&&                func,
       Vector&                    x,
       const std::vector<double>& lower = {},
       const std::vector<double>& upper = {},
       const PowellOptions&       opt   = {})
{
    PowellSummary summ;
    const Eigen::Index n = x.size();
    if (n == 0) {
        summ.converged = true;
        return summ;
    }

    const double big = std::numeric_limits<double>::infinity();
    Vector lo = Vector::Constant(n, -big);
    Vector hi = Vector::Constant(n,  big);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (!lower.empty()) lo[i] = lower[static_cast<std::size_t>(i)];
        if (!upper.empty()) hi[i] = upper[static_cast<std::size_t>(i)];
        x[i] = std::clamp(x[i], lo[i], hi[i]);
    }

    double fx = func(x);
    summ.initial_value  = fx;
    summ.function_evals = 1;

    /* coordinate directions, initial step 1% of the parameter (or 0.01) */
    Matrix dirs = Matrix::Identity(n, n);
    std::vector<double> steps(static_cast<std::size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i)
        steps[static_cast<std::size_t>(i)] = x[i] != 0.0 ? 0.01 * std::abs(x[i]) : 0.01;

    for (int iter = 0; iter < opt.max_iterations; ++iter) {
        summ.iterations = iter + 1;
        if (summ.function_evals >= opt.max_function_evals) {
            if (opt.verbose) std::cout << "[Powell] max function evaluations reached\n";
            break;
        }

        const Vector x_start = x;
        const double f_start = fx;
        double       biggest = 0.0;
        Eigen::Index i_big   = 0;

        for (Eigen::Index i = 0; i < n; ++i) {
            const double f_before = fx;
            const double t = detail::line_minimize(func, x, dirs.col(i), lo, hi,
                                                   steps[static_cast<std::size_t>(i)],
                                                   fx, opt.line_tolerance,
                                                   summ.function_evals,
                                                   opt.max_function_evals);
            if (t != 0.0) {
                x += t * dirs.col(i);
                steps[static_cast<std::size_t>(i)] = std::abs(t);
            }
            if (f_before - fx > biggest) {
                biggest = f_before - fx;
                i_big   = i;
            }
        }

        if (opt.verbose)
            std::cout << "[Powell] iter " << iter << " f=" << fx
                      << " nfe=" << summ.function_evals << '\n';

        if (2.0 * (f_start - fx) <=
            opt.relative_tolerance * (std::abs(f_start) + std::abs(fx)) +
            opt.absolute_tolerance) {
            summ.converged = true;
            break;
        }

        /* replace the direction of largest decrease by the net displacement */
        Vector new_dir = x - x_start;
        const double len = new_dir.norm();
        if (len > 0.0) {
            new_dir /= len;
            const double t = detail::line_minimize(func, x, new_dir, lo, hi,
                                                   0.5 * len, fx, opt.line_tolerance,
                                                   summ.function_evals,
                                                   opt.max_function_evals);
            if (t != 0.0) {
                x += t * new_dir;
                dirs.col(i_big) = new_dir;
                steps[static_cast<std::size_t>(i_big)] = std::abs(t);
            }
        }
    }

    summ.final_value = fx;
    if (!summ.converged && opt.verbose)
        std::cout << "[Powell] stopped without convergence\n";
    return summ;
}

} // namespace lyacorr
