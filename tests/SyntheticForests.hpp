#pragma once
#include "lyacorr/BinnedCorrelation.hpp"
#include "lyacorr/Config.hpp"
#include "lyacorr/Forest.hpp"
#include "lyacorr/MeanContinuum.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

namespace lyacorr::testing {

/* delta forest with explicit distances; z is set to 2 everywhere */
inline ForestRecord make_delta_forest(std::int64_t               id,
                                      double                     ra,
                                      double                     dec,
                                      const std::vector<double>& r,
                                      const std::vector<double>& delta,
                                      const std::vector<double>& weight)
{
    const auto n = static_cast<Eigen::Index>(r.size());
    ForestRecord f;
    f.object_id  = id;
    f.ra         = ra;
    f.dec        = dec;
    f.z_qso      = 2.5;
    f.r_comov    = Eigen::Map<const Vector>(r.data(), n);
    f.delta      = Eigen::Map<const Vector>(delta.data(), n);
    f.weight     = Eigen::Map<const Vector>(weight.data(), n);
    f.z          = Vector::Constant(n, 2.0);
    f.log_lambda = Vector::Constant(n, std::log10(3.0 * kLyaRestWavelength));
    return f;
}

/*
 * Random catalogue in a small sky patch: `num_forests` forests with
 * `num_pix` pixels at increasing distance from r0, Gaussian deltas and
 * weights in [0.5, 1.5] with a few masked pixels.
 */
inline std::vector<ForestRecord> random_catalogue(int           num_forests,
                                                  int           num_pix,
                                                  double        patch,
                                                  unsigned      seed,
                                                  double        r0 = 3000.0)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    std::normal_distribution<double>       gauss(0.0, 0.3);

    std::vector<ForestRecord> out;
    out.reserve(static_cast<std::size_t>(num_forests));
    for (int k = 0; k < num_forests; ++k) {
        const double ra  = 0.2 + patch * u01(rng);
        const double dec = -0.5 * patch + patch * u01(rng);
        const double r_start = r0 + 20.0 * u01(rng);

        std::vector<double> r(num_pix), d(num_pix), w(num_pix);
        for (int i = 0; i < num_pix; ++i) {
            r[i] = r_start + 4.0 * i;
            d[i] = gauss(rng);
            w[i] = (u01(rng) < 0.05) ? 0.0 : 0.5 + u01(rng);
        }
        out.push_back(make_delta_forest(1000 + k, ra, dec, r, d, w));
    }
    return out;
}

/* smooth, non-flat continuum shape on the rest-frame grid of `cfg` */
inline MeanContinuum true_mean_continuum(const ContinuumConfig& cfg)
{
    MeanContinuum flat(std::log10(cfg.lambda_min_rest), std::log10(cfg.lambda_max_rest),
                       cfg.num_bins_mean_cont);
    Vector v(flat.num_bins());
    for (int i = 0; i < flat.num_bins(); ++i) {
        const double x = static_cast<double>(i) / (flat.num_bins() - 1);
        v[i] = 1.0 + 0.3 * std::sin(6.0 * x) + 0.2 * x;
    }
    return MeanContinuum(flat.ll_min(), flat.ll_max(), v);
}

/*
 * Quasar spectrum over the rest-frame window of `cfg` with pixels of 1e-4
 * in log10 λ:  flux = amp·M(λ_rest)·(1 + δ) + n, with δ of variance
 * var_lss and n of variance 1/ivar.  The noise terms vanish for a null rng.
 */
inline ForestRecord make_spectrum(std::int64_t          id,
                                  double                z_qso,
                                  const MeanContinuum&  mean_cont,
                                  const ContinuumConfig& cfg,
                                  double                amp,
                                  double                ivar,
                                  double                var_lss = 0.0,
                                  std::mt19937*         rng = nullptr)
{
    std::normal_distribution<double> gauss(0.0, 1.0);
    const double shift  = std::log10(1.0 + z_qso);
    const double ll_lo  = std::max(std::log10(cfg.lambda_min), std::log10(cfg.lambda_min_rest) + shift);
    const double ll_hi  = std::min(std::log10(cfg.lambda_max), std::log10(cfg.lambda_max_rest) + shift);

    std::vector<double> ll, fl, iv;
    for (double x = ll_lo + 0.5e-4; x < ll_hi; x += 1e-4) {
        const double c = amp * mean_cont.evaluate(x - shift);
        double f = c;
        if (rng) f = c * (1.0 + std::sqrt(var_lss) * gauss(*rng)) + gauss(*rng) / std::sqrt(ivar);
        ll.push_back(x);
        fl.push_back(f);
        iv.push_back(ivar);
    }

    const auto n = static_cast<Eigen::Index>(ll.size());
    ForestRecord s;
    s.object_id  = id;
    s.ra         = 0.01 * static_cast<double>(id % 500);
    s.dec        = 0.1;
    s.z_qso      = z_qso;
    s.log_lambda = Eigen::Map<const Vector>(ll.data(), n);
    s.flux       = Eigen::Map<const Vector>(fl.data(), n);
    s.ivar       = Eigen::Map<const Vector>(iv.data(), n);
    return s;
}

/* O(N²) reference count over all catalogue pairs i < j */
inline BinnedCorrelation brute_force(const std::vector<ForestRecord>& forests,
                                     const CorrelationConfig&         cfg,
                                     double                           ang_max)
{
    BinnedCorrelation out(cfg.np, cfg.nt);
    for (std::size_t a = 0; a < forests.size(); ++a) {
        for (std::size_t b = a + 1; b < forests.size(); ++b) {
            const ForestRecord& f1 = forests[a];
            const ForestRecord& f2 = forests[b];
            if (f1.object_id == f2.object_id) continue;
            const double ang = angular_separation(f1.unit_vector(), f2.unit_vector());
            if (ang >= ang_max) continue;

            for (Eigen::Index i = 0; i < f1.size(); ++i) {
                for (Eigen::Index j = 0; j < f2.size(); ++j) {
                    const double w = f1.weight[i] * f2.weight[j];
                    if (f1.weight[i] <= 0.0 || f2.weight[j] <= 0.0) continue;
                    const double rp = std::abs(f1.r_comov[i] - f2.r_comov[j]) * std::cos(ang / 2);
                    const double rt = (f1.r_comov[i] + f2.r_comov[j]) * std::sin(ang / 2);
                    if (rp >= cfg.rp_max || rt >= cfg.rt_max) continue;
                    const int bp = std::min(cfg.np - 1, static_cast<int>(rp / (cfg.rp_max / cfg.np)));
                    const int bt = std::min(cfg.nt - 1, static_cast<int>(rt / (cfg.rt_max / cfg.nt)));
                    const int bin = bt + cfg.nt * bp;
                    out.weights[bin]     += w;
                    out.weighted_xi[bin] += w * f1.delta[i] * f2.delta[j];
                    out.weighted_rp[bin] += w * rp;
                    out.weighted_rt[bin] += w * rt;
                    out.weighted_z[bin]  += w * 0.5 * (f1.z[i] + f2.z[j]);
                    out.num_pairs[bin]   += 1.0;
                }
            }
        }
    }
    return out;
}

/* NaN-aware exact comparison */
inline bool same_values(const Vector& a, const Vector& b)
{
    if (a.size() != b.size()) return false;
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        if (std::isnan(a[i]) && std::isnan(b[i])) continue;
        if (a[i] != b[i]) return false;
    }
    return true;
}

} // namespace lyacorr::testing
