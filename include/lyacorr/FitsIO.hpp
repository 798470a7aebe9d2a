#pragma once
#include "BinnedCorrelation.hpp"
#include "Config.hpp"
#include "Forest.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace lyacorr {

class ContinuumFitter;

/*
 * Forest files hold one binary-table HDU per forest.  Header keys
 * RA, DEC (rad), Z (quasar redshift) and THING_ID; columns
 *
 *   Spectra : LOGLAM (or LAMBDA), FLUX, IVAR
 *   Deltas  : LOGLAM (or LAMBDA), DELTA, WEIGHT, CONT (optional)
 */
enum class ForestFileKind { Spectra, Deltas };

std::vector<ForestRecord> read_forest_file(const std::string& path, ForestFileKind kind);

// every *.fits / *.fits.gz in dir, in file-name order; max_forests = 0 reads all
std::vector<ForestRecord> read_forest_directory(const std::string& dir,
                                                ForestFileKind     kind,
                                                std::size_t        max_forests = 0);

// one file delta-<cell>.fits.gz per spatial cell; returns the number of files
std::size_t write_deltas(const std::string& out_dir,
                         const std::vector<ForestRecord>& forests);

/*
 * HDU "ATTRI": RP, RT, Z, NB per bin, keys RPMAX RTMAX NP NT Z_REF Z_EVOL OMEGAM
 * HDU "COR"  : HEALPID, WE and DA per sub-sample
 */
void write_correlation(const std::string&       path,
                       const CorrelationResult& result,
                       const CorrelationConfig& config);

// <prefix>-variance.csv and <prefix>-mean_continuum.csv
void write_continuum_attributes(const std::string& prefix, const ContinuumFitter& fitter);

} // namespace lyacorr
