#include "lyacorr/SpatialIndex.hpp"
#include "lyacorr/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <stdexcept>
#include <string>

namespace lyacorr {

namespace {

constexpr double kPi      = std::numbers::pi;
constexpr double kHalfPi  = 0.5 * std::numbers::pi;

CellId isqrt(CellId v)
{
    return static_cast<CellId>(std::sqrt(static_cast<double>(v) + 0.5));
}

/* v mod m in [0, m) for doubles */
double fmodulo(double v, double m)
{
    if (v >= 0.0) return (v < m) ? v : std::fmod(v, m);
    const double r = std::fmod(v, m) + m;
    return (r == m) ? 0.0 : r;
}

Vec3 from_z_phi(double z, double phi)
{
    const double s = std::sqrt((1.0 - z) * (1.0 + z));
    return { s * std::cos(phi), s * std::sin(phi), z };
}

} // namespace

HealpixRingIndex::HealpixRingIndex(int nside)
    : nside_(nside)
{
    if (nside <= 0)
        throw ConfigurationError("HEALPix nside must be positive, got " +
                                 std::to_string(nside));

    const CellId n = nside_;
    npix_  = 12 * n * n;
    ncap_  = 2 * n * (n - 1);
    fact2_ = 4.0 / static_cast<double>(npix_);
    fact1_ = static_cast<double>(2 * n) * fact2_;

    /* corner distance of the widest pixel (polar-cap / equator junction) */
    double t1 = 1.0 - 1.0 / n;
    t1 *= t1;
    const Vec3 va = from_z_phi(2.0 / 3.0, kPi / (4.0 * n));
    const Vec3 vb = from_z_phi(1.0 - t1 / 3.0, 0.0);
    const double corner = std::acos(std::clamp(va.dot(vb), -1.0, 1.0));

    // pixel edges are curved; pad the corner distance so the bound holds inside
    max_radius_ = 1.1 * corner;
}

/* ------------------------------------------------------------------ */
/*  angle -> pixel                                                     */
/* ------------------------------------------------------------------ */
CellId HealpixRingIndex::ang2pix(double theta, double phi) const
{
    const CellId n  = nside_;
    const double z  = std::cos(theta);
    const double za = std::abs(z);
    const double tt = fmodulo(phi / kHalfPi, 4.0);       // in [0,4)

    if (za <= 2.0 / 3.0) {                               // equatorial belt
        const CellId nl4   = 4 * n;
        const double temp1 = n * (0.5 + tt);
        const double temp2 = n * z * 0.75;
        const CellId jp = static_cast<CellId>(temp1 - temp2);   // ascending edge
        const CellId jm = static_cast<CellId>(temp1 + temp2);   // descending edge
        const CellId ir = n + 1 + jp - jm;                      // 1 … 2n+1
        const CellId kshift = 1 - (ir & 1);
        const CellId t1 = jp + jm - n + kshift + 1 + nl4 + nl4;
        const CellId ip = (t1 >> 1) % nl4;
        return ncap_ + (ir - 1) * nl4 + ip;
    }

    /* polar caps */
    const double tp  = tt - static_cast<CellId>(tt);
    const double tmp = n * std::sqrt(3.0 * (1.0 - za));
    const CellId jp  = static_cast<CellId>(tp * tmp);
    const CellId jm  = static_cast<CellId>((1.0 - tp) * tmp);
    const CellId ir  = jp + jm + 1;                      // ring from the nearest pole
    const CellId ip  = std::min(static_cast<CellId>(tt * ir), 4 * ir - 1);

    return (z > 0.0) ? 2 * ir * (ir - 1) + ip
                     : npix_ - 2 * ir * (ir + 1) + ip;
}

/* ------------------------------------------------------------------ */
/*  pixel -> centre angle                                              */
/* ------------------------------------------------------------------ */
void HealpixRingIndex::pix2ang(CellId pix, double& theta, double& phi) const
{
    if (pix < 0 || pix >= npix_)
        throw std::out_of_range("HEALPix pixel " + std::to_string(pix) +
                                " outside [0, " + std::to_string(npix_) + ")");

    const CellId n = nside_;
    double z;

    if (pix < ncap_) {                                   // north cap
        const CellId iring = (1 + isqrt(1 + 2 * pix)) >> 1;
        const CellId iphi  = (pix + 1) - 2 * iring * (iring - 1);
        z   = 1.0 - static_cast<double>(iring * iring) * fact2_;
        phi = (iphi - 0.5) * kHalfPi / iring;
    }
    else if (pix < npix_ - ncap_) {                      // equatorial belt
        const CellId nl4   = 4 * n;
        const CellId ip    = pix - ncap_;
        const CellId tmp   = ip / nl4;
        const CellId iring = tmp + n;
        const CellId iphi  = ip - nl4 * tmp + 1;
        const double fodd  = ((iring + n) & 1) ? 1.0 : 0.5;
        z   = static_cast<double>(2 * n - iring) * fact1_;
        phi = (iphi - fodd) * kPi * 0.75 * fact1_;
    }
    else {                                               // south cap
        const CellId ip    = npix_ - pix;
        const CellId iring = (1 + isqrt(2 * ip - 1)) >> 1;
        const CellId iphi  = 4 * iring + 1 - (ip - 2 * iring * (iring - 1));
        z   = -1.0 + static_cast<double>(iring * iring) * fact2_;
        phi = (iphi - 0.5) * kHalfPi / iring;
    }
    theta = std::acos(std::clamp(z, -1.0, 1.0));
}

HealpixRingIndex::Ring HealpixRingIndex::ring(CellId iring) const
{
    const CellId n = nside_;
    if (iring < n) {
        return { 2 * iring * (iring - 1), 4 * iring,
                 1.0 - static_cast<double>(iring * iring) * fact2_ };
    }
    if (iring <= 3 * n) {
        return { ncap_ + (iring - n) * 4 * n, 4 * n,
                 static_cast<double>(2 * n - iring) * fact1_ };
    }
    const CellId is = 4 * n - iring;
    return { npix_ - 2 * is * (is + 1), 4 * is,
             -1.0 + static_cast<double>(is * is) * fact2_ };
}

/* ------------------------------------------------------------------ */
/*  SpatialIndex interface                                             */
/* ------------------------------------------------------------------ */
CellId HealpixRingIndex::cell_of(double ra, double dec) const
{
    return ang2pix(kHalfPi - dec, ra);
}

Vec3 HealpixRingIndex::center_of(CellId cell) const
{
    double theta = 0.0, phi = 0.0;
    pix2ang(cell, theta, phi);
    return { std::sin(theta) * std::cos(phi),
             std::sin(theta) * std::sin(phi),
             std::cos(theta) };
}

std::vector<CellId> HealpixRingIndex::cells_within(CellId cell, double max_angle) const
{
    /* two points of cells A and B that are closer than max_angle have
       centres closer than max_angle + 2 * max_radius                    */
    const double reach = max_angle + 2.0 * max_radius_;

    std::vector<CellId> out;
    if (reach >= kPi) {
        out.resize(static_cast<std::size_t>(npix_));
        std::iota(out.begin(), out.end(), CellId{0});
        return out;
    }

    const Vec3   c       = center_of(cell);
    const double theta_c = std::acos(std::clamp(c.z(), -1.0, 1.0));
    const double cos_reach = std::cos(reach);

    for (CellId iring = 1; iring < 4 * static_cast<CellId>(nside_); ++iring) {
        const Ring r = ring(iring);
        const double theta_r = std::acos(std::clamp(r.z, -1.0, 1.0));
        if (std::abs(theta_r - theta_c) > reach) continue;

        for (CellId p = r.first; p < r.first + r.count; ++p)
            if (center_of(p).dot(c) >= cos_reach) out.push_back(p);
    }
    return out;                               // ring order == ascending ids
}

} // namespace lyacorr
