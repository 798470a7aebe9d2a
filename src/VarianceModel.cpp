#include "lyacorr/VarianceModel.hpp"
#include "lyacorr/Errors.hpp"
#include "lyacorr/Interpolation.hpp"

#include <algorithm>

namespace lyacorr {

VarianceModel::VarianceModel(double ll_min, double ll_max, int num_bins,
                             double eta, double var_lss, double fudge)
    : VarianceModel(ll_min, ll_max,
                    Vector::Constant(std::max(num_bins, 0), eta),
                    Vector::Constant(std::max(num_bins, 0), var_lss),
                    Vector::Constant(std::max(num_bins, 0), fudge))
{}

VarianceModel::VarianceModel(double ll_min, double ll_max,
                             const Vector& eta, const Vector& var_lss,
                             const Vector& fudge)
    : ll_min_(ll_min), ll_max_(ll_max), eta_(eta), var_lss_(var_lss), fudge_(fudge)
{
    if (!(ll_max > ll_min))
        throw ConfigurationError("variance model range is empty");
    if (eta.size() < 1)
        throw ConfigurationError("variance model needs at least one bin");
    if (var_lss.size() != eta.size() || fudge.size() != eta.size())
        throw DataIntegrityError("variance model tables differ in length");
    x_ = bin_centres(ll_min, ll_max, static_cast<int>(eta.size()));
}

double VarianceModel::eta(double ll)     const { return interp_linear(x_, eta_, ll); }
double VarianceModel::var_lss(double ll) const { return interp_linear(x_, var_lss_, ll); }
double VarianceModel::fudge(double ll)   const { return interp_linear(x_, fudge_, ll); }

double VarianceModel::variance(double var_pipe, double ll) const
{
    return eta(ll) * var_pipe + var_lss(ll) + fudge(ll) / var_pipe;
}

int VarianceModel::bin_of(double ll) const
{
    if (!(ll >= ll_min_) || ll >= ll_max_) return -1;
    const int b = static_cast<int>((ll - ll_min_) / (ll_max_ - ll_min_) * num_bins());
    return std::min(b, num_bins() - 1);
}

void VarianceModel::set_node(int i, double eta, double var_lss, double fudge)
{
    eta_[i]     = eta;
    var_lss_[i] = var_lss;
    fudge_[i]   = fudge;
}

} // namespace lyacorr
