#include "lyacorr/PairAccumulator.hpp"
#include "lyacorr/Cosmology.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace lyacorr {

PairAccumulator::PairAccumulator(const std::vector<ForestRecord>& forests,
                                 const SkyPartition&              partition,
                                 const SpatialIndex&              index,
                                 const CorrelationConfig&         config,
                                 double                           ang_max)
    : forests_(forests)
    , partition_(partition)
    , index_(index)
    , config_(config)
    , ang_max_(ang_max)
{
    config_.validate();
    // any forest may be read as a partner by another cell's task
    unit_.reserve(forests_.size());
    for (const auto& f : forests_) {
        f.validate();
        unit_.push_back(f.unit_vector());
    }
}

double PairAccumulator::max_angle(const CorrelationConfig& config,
                                  const Cosmology&         cosmo)
{
    const double r_min = cosmo.comoving_distance(config.z_min());
    if (r_min <= config.rt_max) return std::numbers::pi;
    return std::asin(config.rt_max / r_min);
}

/* ------------------------------------------------------------------ */
/*  forests of every populated cell that may hold a partner            */
/* ------------------------------------------------------------------ */
std::vector<std::size_t> PairAccumulator::neighbourhood(CellId cell) const
{
    std::vector<std::size_t> out;
    for (CellId c : index_.cells_within(cell, ang_max_)) {
        const auto& m = partition_.members(c);
        out.insert(out.end(), m.begin(), m.end());
    }
    std::sort(out.begin(), out.end());
    return out;
}

BinnedCorrelation PairAccumulator::accumulate(CellId cell) const
{
    BinnedCorrelation out(config_.np, config_.nt);

    const auto& members = partition_.members(cell);
    if (members.empty()) return out;

    const std::vector<std::size_t> neigh = neighbourhood(cell);

    for (std::size_t i1 : members) {
        const ForestRecord& d1 = forests_[i1];

        /* partners with a larger catalogue index only */
        auto first = std::upper_bound(neigh.begin(), neigh.end(), i1);
        for (auto it = first; it != neigh.end(); ++it) {
            const std::size_t   i2 = *it;
            const ForestRecord& d2 = forests_[i2];
            if (d2.object_id == d1.object_id) continue;

            const double ang = angular_separation(unit_[i1], unit_[i2]);
            if (ang >= ang_max_) continue;

            accumulate_pair(d1, d2, ang, out);
        }
    }
    return out;
}

/* ------------------------------------------------------------------ */
/*  pixel-pair loop                                                    */
/* ------------------------------------------------------------------ */
void PairAccumulator::accumulate_pair(const ForestRecord& d1,
                                      const ForestRecord& d2,
                                      double              ang,
                                      BinnedCorrelation&  out) const
{
    const double rp_max   = config_.rp_max;
    const double rt_max   = config_.rt_max;
    const int    np       = config_.np;
    const int    nt       = config_.nt;
    const double bin_p    = rp_max / np;
    const double bin_t    = rt_max / nt;
    const double cos_half = std::cos(0.5 * ang);
    const double sin_half = std::sin(0.5 * ang);

    for (Eigen::Index i = 0; i < d1.size(); ++i) {
        const double w1 = d1.weight[i];
        if (w1 <= 0.0) continue;
        const double r1   = d1.r_comov[i];
        const double z1   = d1.z[i];
        const double del1 = d1.delta[i];

        for (Eigen::Index j = 0; j < d2.size(); ++j) {
            const double w2 = d2.weight[j];
            if (w2 <= 0.0) continue;

            const double r2 = d2.r_comov[j];
            const double rp = std::abs(r1 - r2) * cos_half;
            if (rp >= rp_max) continue;
            const double rt = (r1 + r2) * sin_half;
            if (rt >= rt_max) continue;

            const int bp = std::min(static_cast<int>(rp / bin_p), np - 1);
            const int bt = std::min(static_cast<int>(rt / bin_t), nt - 1);
            const int b  = bt + nt * bp;

            const double w = w1 * w2;
            out.weights[b]     += w;
            out.weighted_xi[b] += w * del1 * d2.delta[j];
            out.weighted_rp[b] += w * rp;
            out.weighted_rt[b] += w * rt;
            out.weighted_z[b]  += w * 0.5 * (z1 + d2.z[j]);
            out.num_pairs[b]   += 1.0;
        }
    }
}

} // namespace lyacorr
