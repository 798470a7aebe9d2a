#pragma once
#include <nlohmann/json.hpp>
#include <array>
#include <string>

namespace lyacorr {

constexpr double kLyaRestWavelength = 1215.67;    // Å

/* Binning, cosmology and weighting of the correlation run. */
struct CorrelationConfig {
    double   rp_max         = 200.0;     // Mpc/h
    double   rt_max         = 200.0;     // Mpc/h
    int      np             = 50;
    int      nt             = 50;
    double   lambda_abs     = kLyaRestWavelength;
    double   fid_om         = 0.315;
    int      nside          = 16;        // 0 = choose from the catalogue
    unsigned nproc          = 0;         // 0 = hardware concurrency
    double   z_ref          = 2.25;
    double   z_evol         = 2.9;
    bool     project        = true;
    double   lambda_min_obs = 3600.0;    // Å, bluest usable observed pixel
    long     max_spectra    = 0;         // 0 = read everything

    void validate() const;

    int    num_bins() const { return np * nt; }
    double z_min() const { return lambda_min_obs / lambda_abs - 1.0; }
    unsigned resolved_nproc() const;
};

/* Expected-flux model.  fit_* select which variance groups are re-estimated. */
struct ContinuumConfig {
    double lambda_min       = 3600.0;    // Å, observed frame
    double lambda_max       = 5500.0;
    double lambda_min_rest  = 1040.0;    // Å, rest frame
    double lambda_max_rest  = 1200.0;
    double lambda_abs       = kLyaRestWavelength;

    int    num_bins_variance   = 20;
    int    num_var_pipe_bins   = 100;
    int    num_bins_mean_cont  = 200;
    int    min_num_pix         = 50;
    int    min_num_qso_in_fit  = 100;

    int    max_iterations   = 5;
    double tolerance        = 1e-4;

    bool   fit_eta          = true;
    bool   fit_var_lss      = true;
    bool   fit_fudge        = true;

    double eta_value        = 1.0;
    double var_lss_value    = 0.2;
    double fudge_value      = 0.0;

    std::array<double, 2> eta_limits     {0.5, 1.5};
    std::array<double, 2> var_lss_limits {0.0, 0.3};
    std::array<double, 2> fudge_limits   {0.0, 1.0};

    bool   verbose          = false;

    void validate() const;
};

struct RunConfig {
    CorrelationConfig correlation;
    ContinuumConfig   continuum;
};

/*
 * Build configs from JSON.  Missing keys keep their defaults, unknown keys
 * and wrongly typed or out-of-range values raise ConfigurationError.
 *
 *   { "correlation": { "rp_max": 200, "nproc": "auto", ... },
 *     "continuum":   { "fit_eta": false, "eta_value": 1.0, ... } }
 */
CorrelationConfig parse_correlation_config(const nlohmann::json& j,
                                           CorrelationConfig base = {});
ContinuumConfig   parse_continuum_config(const nlohmann::json& j,
                                         ContinuumConfig base = {});
RunConfig         parse_run_config(const nlohmann::json& j);

unsigned parse_nproc(const nlohmann::json& j);

// command-line form of parse_nproc: "auto" or a positive integer
unsigned parse_nproc_text(const std::string& text);

} // namespace lyacorr
