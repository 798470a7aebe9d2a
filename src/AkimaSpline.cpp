#include "lyacorr/AkimaSpline.hpp"
#include <stdexcept>
#include <utility>

namespace lyacorr {

AkimaSpline::Makima AkimaSpline::make(std::vector<Real> x, std::vector<Real> y)
{
    if (x.size() != y.size())
        throw std::invalid_argument("AkimaSpline: x and y differ in length");
    if (x.size() < 4)
        throw std::invalid_argument("AkimaSpline: at least four nodes required");
    return Makima(std::move(x), std::move(y));
}

AkimaSpline::AkimaSpline(std::vector<Real> x, std::vector<Real> y)
    : spline_(make(x, y)),
      x_min_(x.front()),
      x_max_(x.back())
{
    // end values and slopes for the linear continuation
    y_min_     = spline_(x_min_);
    y_max_     = spline_(x_max_);
    slope_min_ = spline_.prime(x_min_);
    slope_max_ = spline_.prime(x_max_);
}

AkimaSpline::AkimaSpline(const Vector& x, const Vector& y)
    : AkimaSpline(std::vector<Real>(x.data(), x.data() + x.size()),
                  std::vector<Real>(y.data(), y.data() + y.size()))
{}

Real AkimaSpline::operator()(Real x) const
{
    if (x < x_min_) return y_min_ + slope_min_ * (x - x_min_);
    if (x > x_max_) return y_max_ + slope_max_ * (x - x_max_);
    return spline_(x);
}

Vector AkimaSpline::operator()(const Vector& x) const
{
    Vector out(x.size());
    for (Eigen::Index i = 0; i < x.size(); ++i)
        out[i] = operator()(x[i]);
    return out;
}

} // namespace lyacorr
