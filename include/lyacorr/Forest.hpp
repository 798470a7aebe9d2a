#pragma once
#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lyacorr {

class Cosmology;

// One quasar sightline: the usable pixel range of its absorption spectrum
struct ForestRecord {
    std::int64_t object_id = 0;      // THING_ID / TARGETID
    double       ra        = 0.0;    // rad
    double       dec       = 0.0;    // rad
    double       z_qso     = 0.0;
    CellId       cell      = -1;     // spatial-index cell, -1 = unassigned

    /* per-pixel arrays, all of identical length                          */
    Vector log_lambda;               // log10(λ / Å), observed frame
    Vector flux;
    Vector ivar;
    Vector continuum;                // filled by the continuum fit
    Vector delta;                    // flux / continuum - 1
    Vector weight;
    Vector z;                        // absorber redshift per pixel
    Vector r_comov;                  // Mpc/h

    /* continuum shape  a + b * (ll - ll_min) / (ll_max - ll_min)         */
    double cont_amplitude = 1.0;
    double cont_slope     = 0.0;
    std::optional<std::string> bad_continuum_reason;

    Eigen::Index size() const { return log_lambda.size(); }

    /* throws DataIntegrityError when the record cannot enter a pair count */
    void validate() const;

    /* throws DataIntegrityError on inconsistent flux / ivar arrays        */
    void validate_spectrum() const;

    Vec3 unit_vector() const;

    // z = λ/λ_abs - 1 and the comoving distance of every pixel
    void assign_geometry(const Cosmology& cosmo, double lambda_abs);

    // w *= ((1+z)/(1+z_ref))^(alpha-1)
    void apply_redshift_evolution(double z_ref, double alpha);

    // remove the weighted mean and the weighted linear trend in log λ
    void project_continuum_modes();

    // keep pixels with mask[i] == true in every per-pixel array
    void select_pixels(const std::vector<bool>& mask);
};

double angular_separation(const Vec3& u1, const Vec3& u2);

} // namespace lyacorr
