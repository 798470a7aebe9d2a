#pragma once
#include "Types.hpp"

namespace lyacorr {

/*
 * Pixel variance model  σ² = η·σ²_pipe + σ²_LSS + ε/σ²_pipe.
 *
 * η, σ²_LSS and ε are tabulated at the centres of equal bins in observed
 * log10(λ) (i.e. absorber redshift) and linearly interpolated, clamped at
 * the ends.
 */
class VarianceModel {
public:
    VarianceModel(double ll_min, double ll_max, int num_bins,
                  double eta, double var_lss, double fudge);

    VarianceModel(double ll_min, double ll_max,
                  const Vector& eta, const Vector& var_lss, const Vector& fudge);

    double eta(double log_lambda)     const;
    double var_lss(double log_lambda) const;
    double fudge(double log_lambda)   const;

    double variance(double var_pipe, double log_lambda) const;

    // node index holding ll, -1 outside [ll_min, ll_max)
    int bin_of(double log_lambda) const;

    void set_node(int i, double eta, double var_lss, double fudge);

    const Vector& nodes()          const { return x_; }
    const Vector& eta_values()     const { return eta_; }
    const Vector& var_lss_values() const { return var_lss_; }
    const Vector& fudge_values()   const { return fudge_; }
    int    num_bins() const { return static_cast<int>(x_.size()); }
    double ll_min()   const { return ll_min_; }
    double ll_max()   const { return ll_max_; }

private:
    double ll_min_, ll_max_;
    Vector x_, eta_, var_lss_, fudge_;
};

} // namespace lyacorr
