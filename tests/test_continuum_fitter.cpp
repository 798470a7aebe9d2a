#include "lyacorr/ContinuumFitter.hpp"
#include "lyacorr/Errors.hpp"
#include "lyacorr/ForestCatalogue.hpp"

#include "SyntheticForests.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace lyacorr;
using lyacorr::testing::make_spectrum;
using lyacorr::testing::true_mean_continuum;

namespace {

ContinuumConfig fixed_variance_config()
{
    ContinuumConfig cfg;
    cfg.fit_eta       = false;
    cfg.fit_var_lss   = false;
    cfg.fit_fudge     = false;
    cfg.eta_value     = 1.0;
    cfg.var_lss_value = 0.0;
    cfg.fudge_value   = 0.0;
    return cfg;
}

std::vector<ForestRecord> noiseless_catalogue(const ContinuumConfig& cfg,
                                              const MeanContinuum&   mc,
                                              int                    n)
{
    std::vector<ForestRecord> out;
    for (int k = 0; k < n; ++k) {
        const double z = 2.3 + 1.2 * k / std::max(1, n - 1);
        out.push_back(make_spectrum(100 + k, z, mc, cfg, 1.0, 1.0));
    }
    return out;
}

VarianceModel fixed_model(const ContinuumConfig& cfg)
{
    return VarianceModel(std::log10(cfg.lambda_min), std::log10(cfg.lambda_max),
                         cfg.num_bins_variance,
                         cfg.eta_value, cfg.var_lss_value, cfg.fudge_value);
}

} // namespace

TEST_CASE("state names") {
    REQUIRE(std::string(to_string(FitState::Initialized)) == "Initialized");
    REQUIRE(std::string(to_string(FitState::MaxIterationsReached)) == "MaxIterationsReached");
}

TEST_CASE("refitting converged output reproduces it") {
    const ContinuumConfig cfg = fixed_variance_config();
    const MeanContinuum   truth = true_mean_continuum(cfg);

    auto forests = noiseless_catalogue(cfg, truth, 12);
    ContinuumFitter first(cfg, fixed_model(cfg), truth);
    REQUIRE(first.state() == FitState::Initialized);

    const auto& report = first.fit(forests);
    REQUIRE(report.state == FitState::Converged);
    REQUIRE(report.iterations == 1);
    REQUIRE(report.convergence_warning.empty());
    REQUIRE(report.num_bad == 0);

    first.compute_deltas(forests);
    for (const auto& f : forests) {
        REQUIRE(f.cont_amplitude == Catch::Approx(1.0).epsilon(1e-9));
        REQUIRE(f.cont_slope == Catch::Approx(0.0).margin(1e-9));
        REQUIRE(f.delta.cwiseAbs().maxCoeff() < 1e-9);
        REQUIRE(f.weight.minCoeff() > 0.0);
    }

    /* second pass seeded with the first one's estimate */
    auto again = noiseless_catalogue(cfg, truth, 12);
    ContinuumFitter second(cfg, first.variance_model(), first.mean_continuum());
    REQUIRE(second.fit(again).state == FitState::Converged);
    second.compute_deltas(again);

    const Vector& m1 = first.mean_continuum().values();
    const Vector& m2 = second.mean_continuum().values();
    REQUIRE((m1 - m2).cwiseAbs().maxCoeff() < 1e-10);
    for (std::size_t k = 0; k < forests.size(); ++k) {
        REQUIRE((forests[k].delta - again[k].delta).cwiseAbs().maxCoeff() < 1e-10);
        REQUIRE((forests[k].weight - again[k].weight).cwiseAbs().maxCoeff() < 1e-10);
    }
}

TEST_CASE("fixed variance groups keep their configured values") {
    ContinuumConfig cfg = fixed_variance_config();
    cfg.eta_value     = 1.2;
    cfg.var_lss_value = 0.05;
    cfg.fudge_value   = 0.01;
    cfg.max_iterations = 3;

    const MeanContinuum truth = true_mean_continuum(cfg);
    std::mt19937 rng(3);
    std::vector<ForestRecord> forests;
    for (int k = 0; k < 20; ++k)
        forests.push_back(make_spectrum(k, 2.4 + 0.05 * k, truth, cfg, 1.0, 50.0, 0.01, &rng));

    ContinuumFitter fitter(cfg);
    fitter.fit(forests);

    const VarianceModel& v = fitter.variance_model();
    for (int i = 0; i < v.num_bins(); ++i) {
        REQUIRE(v.eta_values()[i] == 1.2);
        REQUIRE(v.var_lss_values()[i] == 0.05);
        REQUIRE(v.fudge_values()[i] == 0.01);
    }
    REQUIRE(v.variance(0.1, 3.6) == Catch::Approx(1.2 * 0.1 + 0.05 + 0.01 / 0.1));
}

TEST_CASE("free variance groups recover the input noise model") {
    ContinuumConfig cfg;
    cfg.fit_eta            = true;
    cfg.fit_var_lss        = true;
    cfg.fit_fudge          = false;
    cfg.eta_value          = 1.0;
    cfg.var_lss_value      = 0.05;
    cfg.fudge_value        = 0.0;
    cfg.num_bins_variance  = 2;
    cfg.num_var_pipe_bins  = 20;
    cfg.min_num_qso_in_fit = 3;
    cfg.max_iterations     = 2;

    const MeanContinuum truth = true_mean_continuum(cfg);
    std::mt19937 rng(17);
    std::uniform_real_distribution<double> u01(0.0, 1.0);

    std::vector<ForestRecord> forests;
    for (int k = 0; k < 80; ++k) {
        const double z    = 2.5 + 1.1 * u01(rng);
        const double ivar = std::pow(10.0, 0.6 + 2.0 * u01(rng));
        forests.push_back(make_spectrum(k, z, truth, cfg, 1.0, ivar, 0.01, &rng));
    }

    ContinuumFitter fitter(cfg, fixed_model(cfg), truth);
    fitter.fit(forests);

    const VarianceModel& v = fitter.variance_model();
    for (int i = 0; i < v.num_bins(); ++i) {
        REQUIRE(v.eta_values()[i] == Catch::Approx(1.0).margin(0.15));
        REQUIRE(v.var_lss_values()[i] == Catch::Approx(0.01).margin(0.005));
        REQUIRE(v.fudge_values()[i] == 0.0);
        REQUIRE(v.eta_values()[i] >= cfg.eta_limits[0]);
        REQUIRE(v.eta_values()[i] <= cfg.eta_limits[1]);
    }

    const auto stats = fitter.variance_statistics(forests);
    REQUIRE(stats.size() == static_cast<std::size_t>(cfg.num_bins_variance * cfg.num_var_pipe_bins));
    std::size_t pixels = 0;
    for (const auto& b : stats) pixels += b.num_pixels;
    REQUIRE(pixels > 0);
}

TEST_CASE("a noisy fit with free variance settles and reproduces itself") {
    ContinuumConfig cfg;
    cfg.fit_eta            = true;
    cfg.fit_var_lss        = true;
    cfg.fit_fudge          = false;
    cfg.eta_value          = 1.0;
    cfg.var_lss_value      = 0.05;
    cfg.fudge_value        = 0.0;
    cfg.num_bins_variance  = 2;
    cfg.num_var_pipe_bins  = 20;
    cfg.min_num_qso_in_fit = 3;
    cfg.max_iterations     = 30;

    const MeanContinuum truth = true_mean_continuum(cfg);
    auto noisy_catalogue = [&] {
        std::mt19937 rng(17);
        std::uniform_real_distribution<double> u01(0.0, 1.0);
        std::vector<ForestRecord> out;
        for (int k = 0; k < 80; ++k) {
            const double z    = 2.5 + 1.1 * u01(rng);
            const double ivar = std::pow(10.0, 0.6 + 2.0 * u01(rng));
            out.push_back(make_spectrum(k, z, truth, cfg, 1.0, ivar, 0.01, &rng));
        }
        return out;
    };

    auto forests = noisy_catalogue();
    ContinuumFitter first(cfg, fixed_model(cfg), truth);
    const auto& report = first.fit(forests);
    REQUIRE(report.state == FitState::Converged);
    REQUIRE(report.last_change < cfg.tolerance);

    auto again = noisy_catalogue();
    ContinuumFitter second(cfg, first.variance_model(), first.mean_continuum());
    const auto& report2 = second.fit(again);
    REQUIRE(report2.state == FitState::Converged);
    REQUIRE(report2.iterations <= 3);

    const VarianceModel& v1 = first.variance_model();
    const VarianceModel& v2 = second.variance_model();
    REQUIRE((v1.eta_values() - v2.eta_values()).cwiseAbs().maxCoeff() < 1e-3);
    REQUIRE((v1.var_lss_values() - v2.var_lss_values()).cwiseAbs().maxCoeff() < 1e-3);

    const Vector& m1 = first.mean_continuum().values();
    const Vector& m2 = second.mean_continuum().values();
    REQUIRE((m1 - m2).cwiseAbs().maxCoeff() < 1e-3);
}

TEST_CASE("a fixed group outside its limits survives the fit of the free ones") {
    ContinuumConfig cfg;
    cfg.fit_eta            = false;
    cfg.eta_value          = 2.0;                  // outside eta_limits
    cfg.eta_limits         = {0.5, 1.5};
    cfg.fit_var_lss        = true;
    cfg.var_lss_value      = 0.05;
    cfg.fit_fudge          = false;
    cfg.fudge_value        = 0.0;
    cfg.num_bins_variance  = 2;
    cfg.num_var_pipe_bins  = 20;
    cfg.min_num_qso_in_fit = 3;
    cfg.max_iterations     = 2;

    const MeanContinuum truth = true_mean_continuum(cfg);
    std::mt19937 rng(29);
    std::uniform_real_distribution<double> u01(0.0, 1.0);

    std::vector<ForestRecord> forests;
    for (int k = 0; k < 80; ++k) {
        const double z    = 2.5 + 1.1 * u01(rng);
        const double ivar = std::pow(10.0, 0.6 + 2.0 * u01(rng));
        forests.push_back(make_spectrum(k, z, truth, cfg, 1.0, ivar, 0.01, &rng));
    }

    ContinuumFitter fitter(cfg, fixed_model(cfg), truth);
    fitter.fit(forests);

    const VarianceModel& v = fitter.variance_model();
    bool var_lss_moved = false;
    for (int i = 0; i < v.num_bins(); ++i) {
        REQUIRE(v.eta_values()[i] == 2.0);
        REQUIRE(v.fudge_values()[i] == 0.0);
        REQUIRE(v.var_lss_values()[i] >= cfg.var_lss_limits[0]);
        REQUIRE(v.var_lss_values()[i] <= cfg.var_lss_limits[1]);
        if (v.var_lss_values()[i] != 0.05) var_lss_moved = true;
    }
    REQUIRE(var_lss_moved);
}

TEST_CASE("short forests are excluded from the pooled statistics") {
    const ContinuumConfig cfg = fixed_variance_config();
    const MeanContinuum   truth = true_mean_continuum(cfg);

    auto forests = noiseless_catalogue(cfg, truth, 6);
    ForestRecord short_forest = make_spectrum(999, 2.8, truth, cfg, 5.0, 1.0);
    std::vector<bool> keep(static_cast<std::size_t>(short_forest.size()), false);
    for (int i = 0; i < 20; ++i) keep[static_cast<std::size_t>(i)] = true;
    short_forest.select_pixels(keep);
    forests.push_back(short_forest);

    ContinuumFitter fitter(cfg, fixed_model(cfg), truth);
    const auto& report = fitter.fit(forests);
    REQUIRE(report.num_good == 6);
    REQUIRE(report.num_bad == 1);
    REQUIRE(forests.back().bad_continuum_reason);
    REQUIRE(*forests.back().bad_continuum_reason == "short forest");

    /* the outlier amplitude must not leak into the mean continuum */
    const Vector diff = fitter.mean_continuum().values() - truth.values();
    REQUIRE(diff.cwiseAbs().maxCoeff() < 1e-9);

    fitter.compute_deltas(forests);
    REQUIRE(forests.back().weight.isZero());

    REQUIRE(filter_bad_continuum(forests) == 1);
    REQUIRE(forests.size() == 6);
}

TEST_CASE("a continuum that cannot stay positive marks the forest bad") {
    const ContinuumConfig cfg = fixed_variance_config();
    const MeanContinuum   truth = true_mean_continuum(cfg);

    auto forests = noiseless_catalogue(cfg, truth, 3);
    forests[1].flux.setConstant(-1.0);

    ContinuumFitter fitter(cfg, fixed_model(cfg), truth);
    fitter.fit(forests);
    REQUIRE(forests[1].bad_continuum_reason);
    REQUIRE(*forests[1].bad_continuum_reason == "negative continuum");
    REQUIRE_FALSE(forests[0].bad_continuum_reason);
}

TEST_CASE("hitting the iteration limit is reported as a warning") {
    ContinuumConfig cfg = fixed_variance_config();
    cfg.max_iterations = 1;
    cfg.tolerance      = 1e-12;

    const MeanContinuum truth = true_mean_continuum(cfg);
    auto forests = noiseless_catalogue(cfg, truth, 8);

    ContinuumFitter fitter(cfg);                      // flat starting continuum
    const auto& report = fitter.fit(forests);
    REQUIRE(report.state == FitState::MaxIterationsReached);
    REQUIRE(fitter.state() == FitState::MaxIterationsReached);
    REQUIRE(report.iterations == 1);
    REQUIRE(report.last_change > cfg.tolerance);
    REQUIRE_FALSE(report.convergence_warning.empty());
}

TEST_CASE("a catalogue without usable forests is an error") {
    const ContinuumConfig cfg = fixed_variance_config();
    const MeanContinuum   truth = true_mean_continuum(cfg);

    ForestRecord f = make_spectrum(1, 2.5, truth, cfg, 1.0, 1.0);
    f.ivar.setZero();
    std::vector<ForestRecord> forests{f};

    ContinuumFitter fitter(cfg);
    REQUIRE_THROWS_AS(fitter.fit(forests), DataIntegrityError);
}
