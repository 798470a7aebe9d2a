#pragma once
#include "AkimaSpline.hpp"
#include "Types.hpp"

namespace lyacorr {

/*
 * Flat Lambda-CDM fiducial cosmology. Distances are comoving, in Mpc/h.
 */
class Cosmology {
public:
    static constexpr double speed_of_light_kms = 299792.458;

    explicit Cosmology(double omega_m, double z_table_max = 10.0);

    double omega_m() const { return om_; }

    // H(z)/H0
    double efunc(double z) const;

    double comoving_distance(double z) const;
    Vector comoving_distance(const Vector& z) const;

private:
    double integrate(double z_lo, double z_hi) const;

    double      om_;
    double      z_table_max_;
    AkimaSpline table_;

    static AkimaSpline build_table(double om, double z_max);
};

} // namespace lyacorr
