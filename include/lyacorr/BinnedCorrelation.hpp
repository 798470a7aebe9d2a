#pragma once
#include "Types.hpp"
#include <vector>

namespace lyacorr {

/*
 * Raw (unnormalised) 2D histogram over (r_parallel, r_transverse).
 * Bins are flattened as  bin = bt + nt * bp.  Accumulators only grow by
 * addition, so partial histograms of independent cells can be summed in
 * any grouping.
 */
struct BinnedCorrelation {
    int    np = 0;
    int    nt = 0;
    Vector weights;          // Σ w1 w2
    Vector weighted_xi;      // Σ w1 w2 δ1 δ2
    Vector weighted_rp;      // Σ w1 w2 rp
    Vector weighted_rt;      // Σ w1 w2 rt
    Vector weighted_z;       // Σ w1 w2 (z1+z2)/2
    Vector num_pairs;        // number of pixel pairs

    BinnedCorrelation() = default;
    BinnedCorrelation(int np_, int nt_);

    int  num_bins() const { return np * nt; }
    bool empty() const { return weights.size() == 0 || weights.sum() == 0.0; }

    BinnedCorrelation& operator+=(const BinnedCorrelation& other);
};

/* Normalised correlation function and per-cell sub-samples. */
struct CorrelationResult {
    int    np = 0;
    int    nt = 0;
    Vector rp;               // weighted mean separations, NaN for empty bins
    Vector rt;
    Vector z;
    Vector xi;               // NaN for empty bins
    Vector weights;          // Σ weights, 0 for empty bins
    Vector num_pairs;

    std::vector<CellId> cells;       // sub-sample ids, ascending
    Matrix cell_weights;             // (n_cells, n_bins)
    Matrix cell_xi;                  // (n_cells, n_bins), 0 where the cell bin is empty

    std::size_t num_populated_bins() const;
};

// value[i] / weights[i] or NaN where weights[i] == 0
Vector normalise(const Vector& weighted, const Vector& weights);

} // namespace lyacorr
