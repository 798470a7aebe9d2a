#pragma once
#include "Types.hpp"

namespace lyacorr {

/**
 * Linear interpolation y(x) on a table sorted in ascending x_in.
 * Outside the table the end values are returned (no extrapolation).
 */
double interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     double        x);

/* bin centres of `n` equal bins spanning [lo, hi] */
Vector bin_centres(double lo, double hi, int n);

} // namespace lyacorr
