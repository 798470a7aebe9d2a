#pragma once

#include "Types.hpp"
#include <boost/math/interpolators/makima.hpp>
#include <vector>

namespace lyacorr {

/*
 * Modified Akima spline over a tabulated function, linear continuation
 * outside the tabulated range. At least four nodes are required.
 */
class AkimaSpline {
public:
    AkimaSpline(std::vector<Real> x, std::vector<Real> y);
    AkimaSpline(const Vector& x, const Vector& y);

    Real operator()(Real x) const;
    Vector operator()(const Vector& x) const;

    Real x_min() const { return x_min_; }
    Real x_max() const { return x_max_; }

private:
    using Makima = boost::math::interpolators::makima<std::vector<Real>>;

    static Makima make(std::vector<Real> x, std::vector<Real> y);

    Makima spline_;
    Real x_min_, x_max_;
    Real y_min_, y_max_;
    Real slope_min_, slope_max_;
};

} // namespace lyacorr
