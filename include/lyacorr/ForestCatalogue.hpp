#pragma once
#include "Config.hpp"
#include "Forest.hpp"

#include <cstddef>
#include <vector>

namespace lyacorr {

class Cosmology;

/* ---- preparation of spectra for the continuum fit ---- */

// keep pixels inside the observed and rest-frame windows of the config
void apply_wavelength_cuts(ForestRecord& forest, const ContinuumConfig& config);

// drops forests shorter than min_num_pix or with a NaN Σ flux·ivar; returns the number dropped
std::size_t filter_forests(std::vector<ForestRecord>& forests, int min_num_pix);

// drops forests whose continuum fit failed; returns the number dropped
std::size_t filter_bad_continuum(std::vector<ForestRecord>& forests);

/* ---- preparation of deltas for the pair count ---- */

/*
 * HEALPix resolution for the sub-samples: starting from nside 256, halve
 * while the mean number of forests per populated pixel is below 500 and
 * nside >= 8.
 */
int find_nside(const std::vector<ForestRecord>& forests);

// redshift and distance of every pixel, weight evolution, optional projection
void prepare_for_correlation(std::vector<ForestRecord>& forests,
                             const Cosmology&           cosmo,
                             const CorrelationConfig&   config);

} // namespace lyacorr
