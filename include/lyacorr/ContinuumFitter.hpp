#pragma once
#include "Config.hpp"
#include "Forest.hpp"
#include "MeanContinuum.hpp"
#include "Types.hpp"
#include "VarianceModel.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace lyacorr {

enum class FitState { Initialized, Fitting, Converged, MaxIterationsReached };

const char* to_string(FitState s);

struct ContinuumFitReport {
    FitState    state       = FitState::Initialized;
    int         iterations  = 0;
    double      last_change = 0.0;     // largest parameter change of the last iteration
    std::size_t num_good    = 0;
    std::size_t num_bad     = 0;
    std::string convergence_warning;   // empty unless MaxIterationsReached
};

/* Binned statistics of δ in one (wavelength, pipeline variance) bin. */
struct VarianceBin {
    double      var_pipe   = 0.0;      // mean pipeline variance of the pixels
    double      mean_delta = 0.0;
    double      var_delta  = 0.0;
    double      var2_delta = 0.0;      // variance of var_delta
    std::size_t num_pixels = 0;
    std::size_t num_qso    = 0;
};

/*
 * Iterative estimate of the expected flux of every forest.
 *
 *   C(λ) = M(λ_rest) · (a + b·(log λ - log λ_min)/(log λ_max - log λ_min))
 *
 * with M the universal mean continuum and (a, b) per forest, together with
 * the pixel variance model of VarianceModel.  Each of η, σ²_LSS and ε is
 * either re-estimated or held at its configured value.
 */
class ContinuumFitter {
public:
    explicit ContinuumFitter(const ContinuumConfig& config);

    // start from an earlier estimate
    ContinuumFitter(const ContinuumConfig& config,
                    VarianceModel          variance,
                    MeanContinuum          mean_continuum);

    // runs the iteration; marks forests without a usable continuum as bad
    const ContinuumFitReport& fit(std::vector<ForestRecord>& forests);

    // δ = f/C - 1 and w = 1/σ² for good forests, zeros for bad ones
    void compute_deltas(std::vector<ForestRecord>& forests) const;

    /* ---- single steps of an iteration ---- */

    // false (and bad_continuum_reason set) when the forest is unusable
    bool fit_forest_continuum(ForestRecord& forest, bool warm_start) const;

    // returns the largest change of a mean continuum node
    double update_mean_continuum(const std::vector<ForestRecord>& forests);

    // returns the largest change of a fitted variance parameter
    double update_variance_model(const std::vector<ForestRecord>& forests);

    // (num_bins_variance x num_var_pipe_bins) table, row-major in wavelength
    std::vector<VarianceBin> variance_statistics(const std::vector<ForestRecord>& forests) const;

    Vector continuum_of(const ForestRecord& forest, double a, double b) const;

    FitState                  state()  const { return report_.state; }
    const ContinuumFitReport& report() const { return report_; }
    const ContinuumConfig&    config() const { return cfg_; }
    const VarianceModel&      variance_model() const { return variance_; }
    const MeanContinuum&      mean_continuum() const { return mean_cont_; }

private:
    double pixel_variance(const ForestRecord& f, Eigen::Index i) const;

    const ContinuumConfig cfg_;
    VarianceModel         variance_;
    MeanContinuum         mean_cont_;
    ContinuumFitReport    report_;
};

} // namespace lyacorr
