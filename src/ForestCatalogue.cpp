#include "lyacorr/ForestCatalogue.hpp"
#include "lyacorr/Cosmology.hpp"
#include "lyacorr/Errors.hpp"
#include "lyacorr/SpatialIndex.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

namespace lyacorr {

void apply_wavelength_cuts(ForestRecord& f, const ContinuumConfig& c)
{
    f.validate_spectrum();

    const double ll_min      = std::log10(c.lambda_min);
    const double ll_max      = std::log10(c.lambda_max);
    const double ll_rest_min = std::log10(c.lambda_min_rest);
    const double ll_rest_max = std::log10(c.lambda_max_rest);
    const double ll_shift    = std::log10(1.0 + f.z_qso);

    std::vector<bool> keep(static_cast<std::size_t>(f.size()));
    for (Eigen::Index i = 0; i < f.size(); ++i) {
        const double ll   = f.log_lambda[i];
        const double rest = ll - ll_shift;
        keep[static_cast<std::size_t>(i)] = ll >= ll_min && ll <= ll_max &&
                                            rest >= ll_rest_min && rest <= ll_rest_max;
    }
    f.select_pixels(keep);
}

std::size_t filter_forests(std::vector<ForestRecord>& forests, int min_num_pix)
{
    const auto reject = [min_num_pix](const ForestRecord& f) {
        if (f.size() < min_num_pix) {
            std::cout << "[deltas] rejected forest " << f.object_id
                      << ": short forest (" << f.size() << " pixels)\n";
            return true;
        }
        if (std::isnan(f.flux.dot(f.ivar))) {
            std::cout << "[deltas] rejected forest " << f.object_id
                      << ": NaN in flux or ivar\n";
            return true;
        }
        return false;
    };

    const std::size_t before = forests.size();
    forests.erase(std::remove_if(forests.begin(), forests.end(), reject), forests.end());
    return before - forests.size();
}

std::size_t filter_bad_continuum(std::vector<ForestRecord>& forests)
{
    const std::size_t before = forests.size();
    forests.erase(std::remove_if(forests.begin(), forests.end(),
                                 [](const ForestRecord& f) {
                                     if (!f.bad_continuum_reason) return false;
                                     std::cout << "[deltas] rejected forest " << f.object_id
                                               << ": " << *f.bad_continuum_reason << '\n';
                                     return true;
                                 }),
                  forests.end());
    return before - forests.size();
}

int find_nside(const std::vector<ForestRecord>& forests)
{
    constexpr int    kStartNside  = 256;
    constexpr int    kMinNside    = 8;
    constexpr double kTargetCount = 500.0;

    if (forests.empty())
        throw DataIntegrityError("cannot choose nside for an empty catalogue");

    auto mean_count = [&](int nside) {
        const HealpixRingIndex index(nside);
        ankerl::unordered_dense::set<CellId> pixels;
        for (const auto& f : forests) pixels.insert(index.cell_of(f.ra, f.dec));
        return static_cast<double>(forests.size()) / static_cast<double>(pixels.size());
    };

    int    nside = kStartNside;
    double mean  = mean_count(nside);
    while (mean < kTargetCount && nside >= kMinNside) {
        nside /= 2;
        mean = mean_count(nside);
    }
    std::cout << "[cf] nside " << nside << ", " << mean << " forests per pixel\n";
    return nside;
}

void prepare_for_correlation(std::vector<ForestRecord>& forests,
                             const Cosmology&           cosmo,
                             const CorrelationConfig&   config)
{
    const long         nf = static_cast<long>(forests.size());
    std::exception_ptr error;

#pragma omp parallel for schedule(dynamic)
    for (long k = 0; k < nf; ++k) {
        try {
            ForestRecord& f = forests[static_cast<std::size_t>(k)];
            f.assign_geometry(cosmo, config.lambda_abs);
            f.apply_redshift_evolution(config.z_ref, config.z_evol);
            if (config.project) f.project_continuum_modes();
        } catch (...) {
#pragma omp critical(lyacorr_prepare_error)
            if (!error) error = std::current_exception();
        }
    }
    if (error) std::rethrow_exception(error);
}

} // namespace lyacorr
