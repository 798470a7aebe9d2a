#include "lyacorr/BinnedCorrelation.hpp"
#include "lyacorr/Errors.hpp"

#include <limits>
#include <string>

namespace lyacorr {

BinnedCorrelation::BinnedCorrelation(int np_, int nt_)
    : np(np_), nt(nt_)
{
    const int n = np * nt;
    weights     = Vector::Zero(n);
    weighted_xi = Vector::Zero(n);
    weighted_rp = Vector::Zero(n);
    weighted_rt = Vector::Zero(n);
    weighted_z  = Vector::Zero(n);
    num_pairs   = Vector::Zero(n);
}

BinnedCorrelation& BinnedCorrelation::operator+=(const BinnedCorrelation& other)
{
    if (other.np != np || other.nt != nt)
        throw DataIntegrityError("cannot add histograms of shape (" +
                                 std::to_string(other.np) + "," + std::to_string(other.nt) +
                                 ") and (" + std::to_string(np) + "," +
                                 std::to_string(nt) + ")");
    weights     += other.weights;
    weighted_xi += other.weighted_xi;
    weighted_rp += other.weighted_rp;
    weighted_rt += other.weighted_rt;
    weighted_z  += other.weighted_z;
    num_pairs   += other.num_pairs;
    return *this;
}

Vector normalise(const Vector& weighted, const Vector& weights)
{
    Vector out(weighted.size());
    for (Eigen::Index i = 0; i < weighted.size(); ++i)
        out[i] = weights[i] > 0.0 ? weighted[i] / weights[i]
                                  : std::numeric_limits<double>::quiet_NaN();
    return out;
}

std::size_t CorrelationResult::num_populated_bins() const
{
    return static_cast<std::size_t>((weights.array() > 0.0).count());
}

} // namespace lyacorr
