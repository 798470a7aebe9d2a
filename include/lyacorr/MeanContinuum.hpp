#pragma once
#include "Types.hpp"

namespace lyacorr {

/*
 * Universal quasar continuum shape in the rest frame, tabulated at the
 * centres of equal bins in log10(λ_rest) and linearly interpolated.
 * Normalised to unit mean over the nodes.
 */
class MeanContinuum {
public:
    // flat continuum on `num_bins` bins spanning [ll_min, ll_max]
    MeanContinuum(double ll_min, double ll_max, int num_bins);
    MeanContinuum(double ll_min, double ll_max, const Vector& values);

    double evaluate(double log_lambda_rest) const;          // multiplicative factor

    // node index holding ll, -1 outside [ll_min, ll_max)
    int bin_of(double log_lambda_rest) const;

    // values *= factor node by node, then renormalise
    void update(const Vector& factor);
    void set_values(const Vector& values);

    const Vector& nodes()  const { return x_; }
    const Vector& values() const { return y_; }
    int    num_bins() const { return static_cast<int>(x_.size()); }
    double ll_min()   const { return ll_min_; }
    double ll_max()   const { return ll_max_; }

private:
    void normalise();

    double ll_min_, ll_max_;
    Vector x_, y_;
};

} // namespace lyacorr
