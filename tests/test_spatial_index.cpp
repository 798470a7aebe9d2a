#include "lyacorr/Errors.hpp"
#include "lyacorr/SkyPartition.hpp"
#include "lyacorr/SpatialIndex.hpp"

#include "SyntheticForests.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>
#include <stdexcept>
#include <vector>

using namespace lyacorr;

TEST_CASE("HEALPix ring numbering of known directions") {
    const HealpixRingIndex one(1);
    REQUIRE(one.num_cells() == 12);
    REQUIRE(one.ang2pix(std::numbers::pi / 2, 0.0) == 4);
    REQUIRE(one.ang2pix(0.0, 0.0) == 0);
    REQUIRE(one.ang2pix(std::numbers::pi, 0.0) == 8);

    const HealpixRingIndex sixteen(16);
    REQUIRE(sixteen.num_cells() == 3072);
    // just north of the equator at ra = 0: first pixel of ring 2n-1
    REQUIRE(sixteen.cell_of(0.0, 0.01) == 2 * 16 * (16 - 1) + (16 - 1) * 4 * 16);
    // just south: first pixel of ring 2n+1
    REQUIRE(sixteen.cell_of(0.0, -0.01) == 2 * 16 * (16 - 1) + (16 + 1) * 4 * 16);
    REQUIRE(sixteen.cell_of(0.0, std::numbers::pi / 2) < 4);
}

TEST_CASE("pixel centres map back to their pixel") {
    for (int nside : {1, 2, 4, 8, 32}) {
        const HealpixRingIndex index(nside);
        for (CellId p = 0; p < index.num_cells(); ++p) {
            double theta = 0.0, phi = 0.0;
            index.pix2ang(p, theta, phi);
            REQUIRE(index.ang2pix(theta, phi) == p);

            const Vec3 c = index.center_of(p);
            REQUIRE(c.norm() == Catch::Approx(1.0));
        }
    }
    const HealpixRingIndex index(4);
    double t, f;
    REQUIRE_THROWS_AS(index.pix2ang(-1, t, f), std::out_of_range);
    REQUIRE_THROWS_AS(index.pix2ang(index.num_cells(), t, f), std::out_of_range);
}

TEST_CASE("points lie within the maximum cell radius of their centre") {
    const HealpixRingIndex index(8);
    std::mt19937 rng(1);
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    for (int k = 0; k < 5000; ++k) {
        const double ra  = 2.0 * std::numbers::pi * u01(rng);
        const double dec = std::asin(2.0 * u01(rng) - 1.0);
        const Vec3   u{std::cos(dec) * std::cos(ra), std::cos(dec) * std::sin(ra), std::sin(dec)};
        const CellId c = index.cell_of(ra, dec);
        REQUIRE(angular_separation(u, index.center_of(c)) <= index.max_cell_radius());
    }
}

TEST_CASE("neighbour query never misses a close pair") {
    const HealpixRingIndex index(8);
    const double max_angle = 0.05;

    std::mt19937 rng(9);
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    struct Point { double ra, dec; Vec3 u; CellId cell; };
    std::vector<Point> pts;
    for (int k = 0; k < 400; ++k) {
        // patch straddling ra = 0 and reaching the polar cap boundary
        const double ra  = std::fmod(2.0 * std::numbers::pi - 0.2 + 0.4 * u01(rng), 2.0 * std::numbers::pi);
        const double dec = 0.6 + 0.4 * u01(rng);
        const Vec3   u{std::cos(dec) * std::cos(ra), std::cos(dec) * std::sin(ra), std::sin(dec)};
        pts.push_back({ra, dec, u, index.cell_of(ra, dec)});
    }

    std::size_t close_pairs = 0;
    for (std::size_t i = 0; i < pts.size(); ++i) {
        const auto near = index.cells_within(pts[i].cell, max_angle);
        REQUIRE(std::is_sorted(near.begin(), near.end()));
        REQUIRE(std::binary_search(near.begin(), near.end(), pts[i].cell));
        for (std::size_t j = 0; j < pts.size(); ++j) {
            if (angular_separation(pts[i].u, pts[j].u) >= max_angle) continue;
            ++close_pairs;
            REQUIRE(std::binary_search(near.begin(), near.end(), pts[j].cell));
        }
    }
    REQUIRE(close_pairs > pts.size());
}

TEST_CASE("a reach beyond the sphere returns every cell") {
    const HealpixRingIndex index(2);
    const auto all = index.cells_within(5, 3.0);
    REQUIRE(all.size() == static_cast<std::size_t>(index.num_cells()));
    REQUIRE_THROWS_AS(HealpixRingIndex(0), ConfigurationError);
}

TEST_CASE("sky partition groups forests by cell") {
    auto forests = lyacorr::testing::random_catalogue(50, 3, 0.5, 21);
    const HealpixRingIndex index(8);
    const SkyPartition partition(forests, index);

    REQUIRE(partition.num_forests() == forests.size());
    REQUIRE(std::is_sorted(partition.cell_ids().begin(), partition.cell_ids().end()));

    std::size_t total = 0;
    for (CellId c : partition.cell_ids()) {
        const auto& m = partition.members(c);
        REQUIRE(std::is_sorted(m.begin(), m.end()));
        for (std::size_t i : m) REQUIRE(forests[i].cell == c);
        total += m.size();
    }
    REQUIRE(total == forests.size());
    REQUIRE(partition.members(-5).empty());
    REQUIRE_FALSE(partition.contains(-5));

    /* regrouping by the stored cells gives the same partition */
    const SkyPartition again(static_cast<const std::vector<ForestRecord>&>(forests));
    REQUIRE(again.cell_ids() == partition.cell_ids());

    forests[0].cell = -1;
    REQUIRE_THROWS_AS(SkyPartition(static_cast<const std::vector<ForestRecord>&>(forests)),
                      DataIntegrityError);
}
