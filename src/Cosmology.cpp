#include "lyacorr/Cosmology.hpp"
#include "lyacorr/Errors.hpp"

#include <boost/math/quadrature/gauss_kronrod.hpp>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace lyacorr {

namespace {

constexpr int    kTableNodes = 1001;
constexpr double kHubbleDistance = Cosmology::speed_of_light_kms / 100.0;  // c/H0 in Mpc/h

double inverse_efunc(double om, double z)
{
    const double a = 1.0 + z;
    return 1.0 / std::sqrt(om * a * a * a + (1.0 - om));
}

double integrate_inverse_efunc(double om, double z_lo, double z_hi)
{
    using boost::math::quadrature::gauss_kronrod;
    return gauss_kronrod<double, 31>::integrate(
        [om](double z) { return inverse_efunc(om, z); }, z_lo, z_hi, 5, 1e-12);
}

double checked_omega_m(double om)
{
    if (!(om > 0.0 && om < 1.0))
        throw ConfigurationError("fiducial Omega_m must lie in (0, 1), got " +
                                 std::to_string(om));
    return om;
}

} // namespace

/* ------------------------------------------------------------------ */
/*  cumulative table  r(z_i)  on a uniform redshift grid               */
/* ------------------------------------------------------------------ */
AkimaSpline Cosmology::build_table(double om, double z_max)
{
    std::vector<Real> zs(kTableNodes), rs(kTableNodes);
    const double dz = z_max / (kTableNodes - 1);

    double acc = 0.0;
    zs[0] = 0.0;
    rs[0] = 0.0;
    for (int i = 1; i < kTableNodes; ++i) {
        zs[i] = i * dz;
        acc  += integrate_inverse_efunc(om, zs[i - 1], zs[i]);
        rs[i] = kHubbleDistance * acc;
    }
    return AkimaSpline(std::move(zs), std::move(rs));
}

Cosmology::Cosmology(double omega_m, double z_table_max)
    : om_(checked_omega_m(omega_m)),
      z_table_max_(z_table_max),
      table_(build_table(om_, z_table_max))
{}

double Cosmology::efunc(double z) const
{
    return 1.0 / inverse_efunc(om_, z);
}

double Cosmology::integrate(double z_lo, double z_hi) const
{
    return kHubbleDistance * integrate_inverse_efunc(om_, z_lo, z_hi);
}

double Cosmology::comoving_distance(double z) const
{
    if (z >= 0.0 && z <= z_table_max_) return table_(z);
    if (z > z_table_max_) return table_(z_table_max_) + integrate(z_table_max_, z);
    return -integrate(z, 0.0);
}

Vector Cosmology::comoving_distance(const Vector& z) const
{
    Vector r(z.size());
    for (Eigen::Index i = 0; i < z.size(); ++i) r[i] = comoving_distance(z[i]);
    return r;
}

} // namespace lyacorr
