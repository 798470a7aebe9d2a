#include "lyacorr/ContinuumFitter.hpp"
#include "lyacorr/Errors.hpp"
#include "lyacorr/Powell.hpp"
#include "lyacorr/SimpleLM.hpp"

#include <omp.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace lyacorr {

namespace {

constexpr double kLogVarPipeMin = -5.0;

double log_var_pipe_max() { return std::log10(2.0); }

VarianceModel initial_variance(const ContinuumConfig& c)
{
    return VarianceModel(std::log10(c.lambda_min), std::log10(c.lambda_max),
                         c.num_bins_variance,
                         c.eta_value, c.var_lss_value, c.fudge_value);
}

MeanContinuum initial_mean_continuum(const ContinuumConfig& c)
{
    return MeanContinuum(std::log10(c.lambda_min_rest), std::log10(c.lambda_max_rest),
                         c.num_bins_mean_cont);
}

inline double log_rest(const ForestRecord& f, Eigen::Index i)
{
    return f.log_lambda[i] - std::log10(1.0 + f.z_qso);
}

inline bool is_good(const ForestRecord& f)
{
    return !f.bad_continuum_reason && f.continuum.size() == f.size();
}

} // namespace

const char* to_string(FitState s)
{
    switch (s) {
        case FitState::Initialized:          return "Initialized";
        case FitState::Fitting:              return "Fitting";
        case FitState::Converged:            return "Converged";
        case FitState::MaxIterationsReached: return "MaxIterationsReached";
    }
    return "Unknown";
}

ContinuumFitter::ContinuumFitter(const ContinuumConfig& config)
    : ContinuumFitter(config, initial_variance(config), initial_mean_continuum(config))
{}

ContinuumFitter::ContinuumFitter(const ContinuumConfig& config,
                                 VarianceModel          variance,
                                 MeanContinuum          mean_continuum)
    : cfg_(config)
    , variance_(std::move(variance))
    , mean_cont_(std::move(mean_continuum))
{
    cfg_.validate();
}

/* ------------------------------------------------------------------ */
/*  per-forest continuum                                               */
/* ------------------------------------------------------------------ */
Vector ContinuumFitter::continuum_of(const ForestRecord& f, double a, double b) const
{
    const Eigen::Index n = f.size();
    Vector c(n);
    if (n == 0) return c;

    const double ll_lo = f.log_lambda.minCoeff();
    const double span  = f.log_lambda.maxCoeff() - ll_lo;
    for (Eigen::Index i = 0; i < n; ++i) {
        const double t = span > 0.0 ? (f.log_lambda[i] - ll_lo) / span : 0.0;
        c[i] = mean_cont_.evaluate(log_rest(f, i)) * (a + b * t);
    }
    return c;
}

bool ContinuumFitter::fit_forest_continuum(ForestRecord& f, bool warm_start) const
{
    f.bad_continuum_reason.reset();
    f.validate_spectrum();

    const Eigen::Index n = f.size();
    std::vector<Eigen::Index> use;
    use.reserve(static_cast<std::size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i)
        if (f.ivar[i] > 0.0 && std::isfinite(f.flux[i])) use.push_back(i);

    if (static_cast<int>(use.size()) < cfg_.min_num_pix) {
        f.bad_continuum_reason = "short forest";
        f.continuum.resize(0);
        return false;
    }

    const double ll_lo = f.log_lambda.minCoeff();
    const double span  = f.log_lambda.maxCoeff() - ll_lo;

    /* everything but (a, b) is fixed during the fit */
    const std::size_t m = use.size();
    std::vector<double> mc(m), t(m), flux(m), ivar(m), eta(m), vlss(m), fudge(m);
    double sum_wf = 0.0, sum_wm = 0.0;
    for (std::size_t k = 0; k < m; ++k) {
        const Eigen::Index i = use[k];
        const double ll = f.log_lambda[i];
        mc[k]    = mean_cont_.evaluate(log_rest(f, i));
        t[k]     = span > 0.0 ? (ll - ll_lo) / span : 0.0;
        flux[k]  = f.flux[i];
        ivar[k]  = f.ivar[i];
        eta[k]   = variance_.eta(ll);
        vlss[k]  = variance_.var_lss(ll);
        fudge[k] = variance_.fudge(ll);
        sum_wf  += ivar[k] * flux[k];
        sum_wm  += ivar[k] * mc[k];
    }

    /*  Σ w (f - C)² - Σ log w,   1/w = C²σ² = η/ivar + C²σ²_LSS + ε·ivar·C⁴  */
    auto chi2 = [&](const Vector& p) {
        double s = 0.0;
        for (std::size_t k = 0; k < m; ++k) {
            const double c   = mc[k] * (p[0] + p[1] * t[k]);
            const double c2  = c * c;
            const double inv = eta[k] / ivar[k] + c2 * vlss[k] + fudge[k] * ivar[k] * c2 * c2;
            if (!(inv > 0.0)) return std::numeric_limits<double>::infinity();
            const double d = flux[k] - c;
            s += d * d / inv + std::log(inv);
        }
        return s;
    };

    Vector p(2);
    if (warm_start && f.continuum.size() == n) {
        p << f.cont_amplitude, f.cont_slope;
    } else {
        const double a0 = sum_wm > 0.0 ? sum_wf / sum_wm : 1.0;
        p << (std::isfinite(a0) && a0 > 0.0 ? a0 : 1.0), 0.0;
    }

    PowellOptions opt;
    opt.verbose = false;
    const auto summ = powell(chi2, p, {0.0, -std::numeric_limits<double>::infinity()}, {}, opt);
    if (!std::isfinite(summ.final_value)) {
        f.bad_continuum_reason = "continuum fit failed";
        f.continuum.resize(0);
        return false;
    }

    Vector c = continuum_of(f, p[0], p[1]);
    f.cont_amplitude = p[0];
    f.cont_slope     = p[1];
    if (!(c.minCoeff() > 0.0)) {
        f.bad_continuum_reason = "negative continuum";
        f.continuum.resize(0);
        return false;
    }
    f.continuum = std::move(c);
    return true;
}

double ContinuumFitter::pixel_variance(const ForestRecord& f, Eigen::Index i) const
{
    const double c        = f.continuum[i];
    const double var_pipe = 1.0 / (f.ivar[i] * c * c);
    return variance_.variance(var_pipe, f.log_lambda[i]);
}

/* ------------------------------------------------------------------ */
/*  mean continuum: weighted stack of f/C in rest-frame bins           */
/* ------------------------------------------------------------------ */
double ContinuumFitter::update_mean_continuum(const std::vector<ForestRecord>& forests)
{
    const int nb  = mean_cont_.num_bins();
    const int nth = omp_get_max_threads();
    std::vector<Vector> stack(nth, Vector::Zero(nb)), wsum(nth, Vector::Zero(nb));

    const long nf = static_cast<long>(forests.size());
#pragma omp parallel for schedule(static)
    for (long k = 0; k < nf; ++k) {
        const ForestRecord& f = forests[static_cast<std::size_t>(k)];
        if (!is_good(f)) continue;
        const int tid = omp_get_thread_num();
        for (Eigen::Index i = 0; i < f.size(); ++i) {
            if (!(f.ivar[i] > 0.0)) continue;
            const int b = mean_cont_.bin_of(log_rest(f, i));
            if (b < 0) continue;
            const double var = pixel_variance(f, i);
            if (!(var > 0.0) || !std::isfinite(var)) continue;
            const double w = 1.0 / var;
            stack[tid][b] += w * f.flux[i] / f.continuum[i];
            wsum[tid][b]  += w;
        }
    }

    Vector s = Vector::Zero(nb), w = Vector::Zero(nb);
    for (int t = 0; t < nth; ++t) {
        s += stack[t];
        w += wsum[t];
    }

    Vector factor = Vector::Ones(nb);
    for (int b = 0; b < nb; ++b)
        if (w[b] > 0.0) factor[b] = s[b] / w[b];

    /* a tilt linear in log λ_rest is absorbed by the per-forest slopes */
    const Vector& x = mean_cont_.nodes();
    const double  sw = w.sum();
    if (sw > 0.0) {
        double xm = 0.0, fm = 0.0;
        for (int b = 0; b < nb; ++b) {
            xm += w[b] * x[b];
            fm += w[b] * factor[b];
        }
        xm /= sw;
        fm /= sw;

        double sxy = 0.0, sxx = 0.0;
        for (int b = 0; b < nb; ++b) {
            sxy += w[b] * (x[b] - xm) * (factor[b] - fm);
            sxx += w[b] * (x[b] - xm) * (x[b] - xm);
        }
        if (sxx > 0.0) {
            const double tilt = sxy / sxx;
            for (int b = 0; b < nb; ++b)
                if (w[b] > 0.0) factor[b] -= tilt * (x[b] - xm);
        }
    }

    const Vector old = mean_cont_.values();
    mean_cont_.update(factor);
    return (mean_cont_.values() - old).cwiseAbs().maxCoeff();
}

/* ------------------------------------------------------------------ */
/*  δ statistics in (λ, σ²_pipe) bins                                  */
/* ------------------------------------------------------------------ */
std::vector<VarianceBin>
ContinuumFitter::variance_statistics(const std::vector<ForestRecord>& forests) const
{
    const int nw = cfg_.num_bins_variance;
    const int nv = cfg_.num_var_pipe_bins;
    const std::size_t ntot = static_cast<std::size_t>(nw) * nv;
    const double lv_lo = kLogVarPipeMin;
    const double lv_hi = log_var_pipe_max();

    struct Sums {
        std::vector<double>      s1, s2, s4, vp;
        std::vector<std::size_t> n, nqso;
        explicit Sums(std::size_t k) : s1(k), s2(k), s4(k), vp(k), n(k), nqso(k) {}
    };

    const int nth = omp_get_max_threads();
    std::vector<Sums> sums(nth, Sums(ntot));

    const long nf = static_cast<long>(forests.size());
#pragma omp parallel
    {
        Sums& acc = sums[omp_get_thread_num()];
        std::vector<char>        seen(ntot, 0);
        std::vector<std::size_t> touched;

#pragma omp for schedule(static)
        for (long k = 0; k < nf; ++k) {
            const ForestRecord& f = forests[static_cast<std::size_t>(k)];
            if (!is_good(f)) continue;
            touched.clear();
            for (Eigen::Index i = 0; i < f.size(); ++i) {
                if (!(f.ivar[i] > 0.0)) continue;
                const int iw = variance_.bin_of(f.log_lambda[i]);
                if (iw < 0) continue;
                const double c        = f.continuum[i];
                const double var_pipe = 1.0 / (f.ivar[i] * c * c);
                const double lv       = std::log10(var_pipe);
                if (!(lv >= lv_lo) || lv >= lv_hi) continue;
                const int iv = std::min(nv - 1, static_cast<int>((lv - lv_lo) / (lv_hi - lv_lo) * nv));

                const std::size_t b = static_cast<std::size_t>(iw) * nv + iv;
                const double d  = f.flux[i] / c - 1.0;
                const double d2 = d * d;
                acc.s1[b] += d;
                acc.s2[b] += d2;
                acc.s4[b] += d2 * d2;
                acc.vp[b] += var_pipe;
                acc.n[b]  += 1;
                if (!seen[b]) {
                    seen[b] = 1;
                    touched.push_back(b);
                }
            }
            for (std::size_t b : touched) {
                acc.nqso[b] += 1;
                seen[b] = 0;
            }
        }
    }

    std::vector<VarianceBin> out(ntot);
    for (std::size_t b = 0; b < ntot; ++b) {
        double s1 = 0, s2 = 0, s4 = 0, vp = 0;
        std::size_t n = 0, nq = 0;
        for (const auto& acc : sums) {
            s1 += acc.s1[b]; s2 += acc.s2[b]; s4 += acc.s4[b]; vp += acc.vp[b];
            n  += acc.n[b];  nq += acc.nqso[b];
        }
        VarianceBin& vb = out[b];
        vb.num_pixels = n;
        vb.num_qso    = nq;
        if (n == 0) {
            vb.var_pipe = std::pow(10.0, lv_lo + (b % nv + 0.5) * (lv_hi - lv_lo) / nv);
            continue;
        }
        const double dn = static_cast<double>(n);
        const double m2 = s2 / dn;
        vb.var_pipe   = vp / dn;
        vb.mean_delta = s1 / dn;
        vb.var_delta  = m2 - vb.mean_delta * vb.mean_delta;
        vb.var2_delta = (s4 / dn - m2 * m2) / dn;
    }
    return out;
}

/* ------------------------------------------------------------------ */
/*  η, σ²_LSS, ε per wavelength node                                   */
/* ------------------------------------------------------------------ */
double ContinuumFitter::update_variance_model(const std::vector<ForestRecord>& forests)
{
    const std::vector<bool> free_mask{cfg_.fit_eta, cfg_.fit_var_lss, cfg_.fit_fudge};
    const int n_free = static_cast<int>(std::count(free_mask.begin(), free_mask.end(), true));
    if (n_free == 0) return 0.0;

    const std::vector<double> lower{cfg_.eta_limits[0], cfg_.var_lss_limits[0], cfg_.fudge_limits[0]};
    const std::vector<double> upper{cfg_.eta_limits[1], cfg_.var_lss_limits[1], cfg_.fudge_limits[1]};

    const auto stats = variance_statistics(forests);
    const int nw = cfg_.num_bins_variance;
    const int nv = cfg_.num_var_pipe_bins;

    LMSolverOptions opt;
    opt.verbose = cfg_.verbose;

    double change = 0.0;
    for (int iw = 0; iw < nw; ++iw) {
        std::vector<const VarianceBin*> bins;
        for (int iv = 0; iv < nv; ++iv) {
            const VarianceBin& vb = stats[static_cast<std::size_t>(iw) * nv + iv];
            if (static_cast<int>(vb.num_qso) >= cfg_.min_num_qso_in_fit &&
                vb.num_pixels > 1 && vb.var2_delta > 0.0)
                bins.push_back(&vb);
        }

        const double eta0 = variance_.eta_values()[iw];
        const double vl0  = variance_.var_lss_values()[iw];
        const double fu0  = variance_.fudge_values()[iw];

        if (static_cast<int>(bins.size()) <= n_free) {
            std::cerr << "Warning: [Continuum] wavelength bin " << iw << " has "
                      << bins.size() << " usable variance bins, keeping eta="
                      << eta0 << " var_lss=" << vl0 << " fudge=" << fu0 << '\n';
            continue;
        }

        auto residuals = [&](const Vector& p, Vector* r, Matrix* J) {
            const Eigen::Index m = static_cast<Eigen::Index>(bins.size());
            r->resize(m);
            if (J) J->resize(m, 3);
            for (Eigen::Index k = 0; k < m; ++k) {
                const VarianceBin& vb = *bins[static_cast<std::size_t>(k)];
                const double err   = std::sqrt(vb.var2_delta);
                const double model = p[0] * vb.var_pipe + p[1] + p[2] / vb.var_pipe;
                (*r)[k] = (vb.var_delta - model) / err;
                if (J) {
                    (*J)(k, 0) = -vb.var_pipe / err;
                    (*J)(k, 1) = -1.0 / err;
                    (*J)(k, 2) = -1.0 / (vb.var_pipe * err);
                }
            }
        };

        Vector p(3);
        p << eta0, vl0, fu0;
        const auto summ = levenberg_marquardt(residuals, p, free_mask, lower, upper, opt);

        if (!p.allFinite()) {
            std::cerr << "Warning: [Continuum] variance fit failed in wavelength bin "
                      << iw << ", keeping previous values\n";
            continue;
        }
        if (cfg_.verbose) {
            std::cout << "[Continuum] bin " << iw
                      << "  eta=" << p[0] << " +- " << summ.param_uncertainties[0]
                      << "  var_lss=" << p[1] << " +- " << summ.param_uncertainties[1]
                      << "  fudge=" << p[2] << " +- " << summ.param_uncertainties[2]
                      << "  chi2=" << summ.final_chi2 << '\n';
        }

        change = std::max({change, std::abs(p[0] - eta0), std::abs(p[1] - vl0),
                           std::abs(p[2] - fu0)});
        variance_.set_node(iw, p[0], p[1], p[2]);
    }
    return change;
}

/* ------------------------------------------------------------------ */
/*  iteration driver                                                   */
/* ------------------------------------------------------------------ */
const ContinuumFitReport& ContinuumFitter::fit(std::vector<ForestRecord>& forests)
{
    report_       = ContinuumFitReport{};
    report_.state = FitState::Fitting;

    const long nf = static_cast<long>(forests.size());
    for (int it = 1; it <= cfg_.max_iterations; ++it) {
        report_.iterations = it;

        std::size_t        n_good = 0;
        std::exception_ptr error;
#pragma omp parallel for schedule(dynamic) reduction(+:n_good)
        for (long k = 0; k < nf; ++k) {
            try {
                if (fit_forest_continuum(forests[static_cast<std::size_t>(k)], it > 1)) ++n_good;
            } catch (...) {
#pragma omp critical(lyacorr_fit_error)
                if (!error) error = std::current_exception();
            }
        }
        if (error) std::rethrow_exception(error);
        report_.num_good = n_good;
        report_.num_bad  = forests.size() - n_good;

        if (n_good == 0)
            throw DataIntegrityError("no forest with a usable continuum");

        const double d_mean = update_mean_continuum(forests);
        const double d_var  = update_variance_model(forests);
        report_.last_change = std::max(d_mean, d_var);

        std::cout << "[Continuum] iteration " << it << ": " << n_good << " good, "
                  << report_.num_bad << " bad, change " << std::scientific
                  << std::setprecision(3) << report_.last_change << std::defaultfloat
                  << '\n';

        if (report_.last_change < cfg_.tolerance) {
            report_.state = FitState::Converged;
            return report_;
        }
    }

    report_.state = FitState::MaxIterationsReached;
    std::ostringstream msg;
    msg << "continuum fit did not converge in " << cfg_.max_iterations
        << " iterations (last change " << report_.last_change
        << ", tolerance " << cfg_.tolerance << ")";
    report_.convergence_warning = msg.str();
    std::cerr << "Warning: [Continuum] " << report_.convergence_warning << '\n';
    return report_;
}

void ContinuumFitter::compute_deltas(std::vector<ForestRecord>& forests) const
{
    const long nf = static_cast<long>(forests.size());
#pragma omp parallel for schedule(dynamic)
    for (long k = 0; k < nf; ++k) {
        ForestRecord& f = forests[static_cast<std::size_t>(k)];
        const Eigen::Index n = f.size();
        f.delta  = Vector::Zero(n);
        f.weight = Vector::Zero(n);
        if (!is_good(f)) continue;

        for (Eigen::Index i = 0; i < n; ++i) {
            f.delta[i] = f.flux[i] / f.continuum[i] - 1.0;
            if (!(f.ivar[i] > 0.0)) continue;
            const double var = pixel_variance(f, i);
            f.weight[i] = (var > 0.0 && std::isfinite(var)) ? 1.0 / var : 0.0;
        }
    }
}

} // namespace lyacorr
