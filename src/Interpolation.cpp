#include "lyacorr/Interpolation.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace lyacorr {

double interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     double        x)
{
    const Eigen::Index n = x_in.size();
    if (n == 0) return std::numeric_limits<double>::quiet_NaN();
    if (n == 1 || x <= x_in[0]) return y_in[0];
    if (x >= x_in[n - 1])       return y_in[n - 1];

    // binary search for x_in[lo] <= x < x_in[hi]
    const auto* first = x_in.data();
    const auto* last  = x_in.data() + n;
    const auto* it    = std::upper_bound(first, last, x);
    const Eigen::Index hi = static_cast<Eigen::Index>(it - first);
    const Eigen::Index lo = hi - 1;

    const double dx = x_in[hi] - x_in[lo];
    if (std::abs(dx) < 1e-12) return y_in[lo];

    const double t = (x - x_in[lo]) / dx;                 // 0 … 1
    return (1.0 - t) * y_in[lo] + t * y_in[hi];
}

Vector bin_centres(double lo, double hi, int n)
{
    Vector c(n);
    const double step = (hi - lo) / n;
    for (int i = 0; i < n; ++i) c[i] = lo + (i + 0.5) * step;
    return c;
}

} // namespace lyacorr
