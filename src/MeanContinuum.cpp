#include "lyacorr/MeanContinuum.hpp"
#include "lyacorr/Errors.hpp"
#include "lyacorr/Interpolation.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace lyacorr {

MeanContinuum::MeanContinuum(double ll_min, double ll_max, int num_bins)
    : MeanContinuum(ll_min, ll_max, Vector::Ones(std::max(num_bins, 0)))
{}

MeanContinuum::MeanContinuum(double ll_min, double ll_max, const Vector& values)
    : ll_min_(ll_min), ll_max_(ll_max)
{
    if (!(ll_max > ll_min))
        throw ConfigurationError("mean continuum range is empty");
    if (values.size() < 1)
        throw ConfigurationError("mean continuum needs at least one bin");
    x_ = bin_centres(ll_min, ll_max, static_cast<int>(values.size()));
    set_values(values);
}

double MeanContinuum::evaluate(double log_lambda_rest) const
{
    return interp_linear(x_, y_, log_lambda_rest);
}

int MeanContinuum::bin_of(double ll) const
{
    if (!(ll >= ll_min_) || ll >= ll_max_) return -1;
    const int b = static_cast<int>((ll - ll_min_) / (ll_max_ - ll_min_) * num_bins());
    return std::min(b, num_bins() - 1);
}

void MeanContinuum::update(const Vector& factor)
{
    if (factor.size() != y_.size())
        throw DataIntegrityError("mean continuum update has " +
                                 std::to_string(factor.size()) + " bins, expected " +
                                 std::to_string(y_.size()));
    y_ = y_.cwiseProduct(factor);
    normalise();
}

void MeanContinuum::set_values(const Vector& values)
{
    if (values.size() != x_.size())
        throw DataIntegrityError("mean continuum values do not match the nodes");
    if (!values.allFinite())
        throw DataIntegrityError("non-finite mean continuum");
    y_ = values;
    normalise();
}

void MeanContinuum::normalise()
{
    const double mean = y_.mean();
    if (!(mean > 0.0) || !std::isfinite(mean))
        throw DataIntegrityError("mean continuum has non-positive mean");
    y_ /= mean;
}

} // namespace lyacorr
