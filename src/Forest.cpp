#include "lyacorr/Forest.hpp"
#include "lyacorr/Cosmology.hpp"
#include "lyacorr/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace lyacorr {

namespace {

std::string describe(const ForestRecord& f)
{
    return "forest " + std::to_string(f.object_id);
}

void require_length(const ForestRecord& f, const Vector& v, const char* name)
{
    if (v.size() != f.size())
        throw DataIntegrityError(describe(f) + ": array '" + name + "' has " +
                                 std::to_string(v.size()) + " pixels, expected " +
                                 std::to_string(f.size()));
}

Vector select(const Vector& v, const std::vector<bool>& mask, Eigen::Index n_keep)
{
    if (v.size() == 0) return v;
    if (static_cast<std::size_t>(v.size()) != mask.size())
        throw DataIntegrityError("per-pixel array does not match the pixel mask");
    Vector out(n_keep);
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < v.size(); ++i)
        if (mask[static_cast<std::size_t>(i)]) out[k++] = v[i];
    return out;
}

} // namespace

void ForestRecord::validate() const
{
    require_length(*this, delta,   "delta");
    require_length(*this, weight,  "weight");
    require_length(*this, z,       "z");
    require_length(*this, r_comov, "r_comov");

    for (Eigen::Index i = 0; i < size(); ++i) {
        if (!std::isfinite(weight[i]))
            throw DataIntegrityError(describe(*this) + ": non-finite weight at pixel " +
                                     std::to_string(i));
        if (weight[i] < 0.0)
            throw DataIntegrityError(describe(*this) + ": negative weight at pixel " +
                                     std::to_string(i));
        if (weight[i] > 0.0 && !std::isfinite(delta[i]))
            throw DataIntegrityError(describe(*this) + ": non-finite delta at pixel " +
                                     std::to_string(i));
        if (!std::isfinite(r_comov[i]) || !std::isfinite(z[i]))
            throw DataIntegrityError(describe(*this) + ": non-finite distance at pixel " +
                                     std::to_string(i));
    }
}

void ForestRecord::validate_spectrum() const
{
    require_length(*this, flux, "flux");
    require_length(*this, ivar, "ivar");
    if (size() > 0 && ivar.minCoeff() < 0.0)
        throw DataIntegrityError(describe(*this) + ": negative inverse variance");
}

Vec3 ForestRecord::unit_vector() const
{
    return { std::cos(dec) * std::cos(ra),
             std::cos(dec) * std::sin(ra),
             std::sin(dec) };
}

double angular_separation(const Vec3& u1, const Vec3& u2)
{
    const double c = std::clamp(u1.dot(u2), -1.0, 1.0);
    return std::acos(c);
}

void ForestRecord::assign_geometry(const Cosmology& cosmo, double lambda_abs)
{
    z.resize(size());
    for (Eigen::Index i = 0; i < size(); ++i)
        z[i] = std::pow(10.0, log_lambda[i]) / lambda_abs - 1.0;
    r_comov = cosmo.comoving_distance(z);
}

void ForestRecord::apply_redshift_evolution(double z_ref, double alpha)
{
    require_length(*this, weight, "weight");
    require_length(*this, z,      "z");
    weight.array() *= ((1.0 + z.array()) / (1.0 + z_ref)).pow(alpha - 1.0);
}

void ForestRecord::project_continuum_modes()
{
    require_length(*this, delta,  "delta");
    require_length(*this, weight, "weight");

    const double wsum = weight.sum();
    if (wsum <= 0.0) return;

    const double mean_delta = weight.dot(delta) / wsum;
    const double mean_ll    = weight.dot(log_lambda) / wsum;

    const Vector dll   = log_lambda.array() - mean_ll;
    const double denom = weight.dot(dll.cwiseProduct(dll));
    const double slope = denom > 0.0
                       ? weight.cwiseProduct(delta).dot(dll) / denom
                       : 0.0;

    delta.array() -= mean_delta + slope * dll.array();
}

void ForestRecord::select_pixels(const std::vector<bool>& mask)
{
    if (mask.size() != static_cast<std::size_t>(size()))
        throw DataIntegrityError(describe(*this) + ": pixel mask has wrong length");

    const Eigen::Index n_keep = std::count(mask.begin(), mask.end(), true);
    log_lambda = select(log_lambda, mask, n_keep);
    flux       = select(flux,       mask, n_keep);
    ivar       = select(ivar,       mask, n_keep);
    continuum  = select(continuum,  mask, n_keep);
    delta      = select(delta,      mask, n_keep);
    weight     = select(weight,     mask, n_keep);
    z          = select(z,          mask, n_keep);
    r_comov    = select(r_comov,    mask, n_keep);
}

} // namespace lyacorr
