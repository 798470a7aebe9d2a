#include "lyacorr/Config.hpp"
#include "lyacorr/Cosmology.hpp"
#include "lyacorr/Errors.hpp"
#include "lyacorr/Forest.hpp"

#include "SyntheticForests.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace lyacorr;
using lyacorr::testing::make_delta_forest;

namespace {

ForestRecord sloped_forest()
{
    const int n = 40;
    std::vector<double> r(n), d(n), w(n);
    for (int i = 0; i < n; ++i) {
        r[i] = 3500.0 + 3.0 * i;
        d[i] = 0.4 + 0.05 * i + 0.1 * std::sin(0.7 * i);
        w[i] = 0.5 + 0.025 * i;
    }
    ForestRecord f = make_delta_forest(7, 0.1, 0.2, r, d, w);
    for (int i = 0; i < n; ++i) f.log_lambda[i] = 3.58 + 1e-4 * i;
    return f;
}

} // namespace

TEST_CASE("continuum projection removes the weighted mean and slope") {
    ForestRecord f = sloped_forest();
    f.project_continuum_modes();

    const double wsum    = f.weight.sum();
    const double mean_ll = f.weight.dot(f.log_lambda) / wsum;
    const Vector dll     = f.log_lambda.array() - mean_ll;

    REQUIRE(f.weight.dot(f.delta) / wsum == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(f.weight.cwiseProduct(f.delta).dot(dll) == Catch::Approx(0.0).margin(1e-12));

    /* the oscillating part survives */
    REQUIRE(f.delta.cwiseAbs().maxCoeff() > 0.05);
}

TEST_CASE("projection of an all-masked forest is a no-op") {
    ForestRecord f = sloped_forest();
    f.weight.setZero();
    const Vector before = f.delta;
    f.project_continuum_modes();
    REQUIRE((f.delta - before).cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("redshift evolution rescales the weights") {
    ForestRecord f = make_delta_forest(1, 0.0, 0.0, {3000.0, 3100.0}, {0.1, 0.2}, {2.0, 1.0});
    f.z << 1.25, 2.25;
    f.apply_redshift_evolution(2.25, 2.9);
    REQUIRE(f.weight[0] == Catch::Approx(2.0 * std::pow(2.25 / 3.25, 1.9)));
    REQUIRE(f.weight[1] == Catch::Approx(1.0));
}

TEST_CASE("pixel geometry from the observed wavelength") {
    const Cosmology cosmo(0.315);
    ForestRecord f = make_delta_forest(1, 0.0, 0.0, {0.0, 0.0}, {0.0, 0.0}, {1.0, 1.0});
    f.log_lambda << std::log10(3.0 * kLyaRestWavelength), std::log10(3.5 * kLyaRestWavelength);
    f.assign_geometry(cosmo, kLyaRestWavelength);

    REQUIRE(f.z[0] == Catch::Approx(2.0));
    REQUIRE(f.z[1] == Catch::Approx(2.5));
    REQUIRE(f.r_comov[0] == Catch::Approx(cosmo.comoving_distance(2.0)));
    REQUIRE(f.r_comov[1] > f.r_comov[0]);
}

TEST_CASE("malformed forests fail validation") {
    ForestRecord f = sloped_forest();
    REQUIRE_NOTHROW(f.validate());

    SECTION("negative weight") {
        f.weight[3] = -0.1;
        REQUIRE_THROWS_AS(f.validate(), DataIntegrityError);
    }
    SECTION("NaN delta on a weighted pixel") {
        f.delta[5] = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(f.validate(), DataIntegrityError);
    }
    SECTION("NaN delta on a masked pixel is tolerated") {
        f.delta[5]  = std::numeric_limits<double>::quiet_NaN();
        f.weight[5] = 0.0;
        REQUIRE_NOTHROW(f.validate());
    }
    SECTION("array length mismatch") {
        f.weight.conservativeResize(f.size() - 1);
        REQUIRE_THROWS_AS(f.validate(), DataIntegrityError);
    }
    SECTION("negative inverse variance") {
        f.flux = Vector::Ones(f.size());
        f.ivar = Vector::Ones(f.size());
        REQUIRE_NOTHROW(f.validate_spectrum());
        f.ivar[0] = -1.0;
        REQUIRE_THROWS_AS(f.validate_spectrum(), DataIntegrityError);
    }
}

TEST_CASE("pixel selection keeps every per-pixel array aligned") {
    ForestRecord f = make_delta_forest(3, 0.0, 0.0,
                                       {10.0, 20.0, 30.0, 40.0},
                                       {0.1, 0.2, 0.3, 0.4},
                                       {1.0, 2.0, 3.0, 4.0});
    f.select_pixels({true, false, false, true});

    REQUIRE(f.size() == 2);
    REQUIRE(f.r_comov[1] == 40.0);
    REQUIRE(f.delta[0] == 0.1);
    REQUIRE(f.weight[1] == 4.0);
    REQUIRE(f.z.size() == 2);
    REQUIRE(f.continuum.size() == 0);

    REQUIRE_THROWS_AS(f.select_pixels({true}), DataIntegrityError);
}

TEST_CASE("angular separation of unit vectors") {
    ForestRecord a, b, c;
    b.ra  = 0.1;
    c.dec = -0.3;
    REQUIRE(angular_separation(a.unit_vector(), b.unit_vector()) == Catch::Approx(0.1));
    REQUIRE(angular_separation(a.unit_vector(), c.unit_vector()) == Catch::Approx(0.3));
    REQUIRE(angular_separation(a.unit_vector(), a.unit_vector()) == Catch::Approx(0.0).margin(1e-7));
}
