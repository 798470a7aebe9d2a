#pragma once
#include "Types.hpp"
#include <vector>

namespace lyacorr {

/*
 * Coarse sky pixelisation used to bound the pair search.
 *
 * cells_within() is superset-safe: it returns every cell that may hold a
 * point closer than max_angle to any point of the query cell.  Extra cells
 * are allowed, missing ones are not.
 */
class SpatialIndex {
public:
    virtual ~SpatialIndex() = default;

    virtual CellId cell_of(double ra, double dec) const = 0;      // rad
    virtual Vec3   center_of(CellId cell) const = 0;
    virtual std::vector<CellId> cells_within(CellId cell, double max_angle) const = 0;

    // largest angular distance between a cell centre and a point of the cell
    virtual double max_cell_radius() const = 0;
    virtual CellId num_cells() const = 0;
};

/*
 * HEALPix pixelisation in RING numbering.  Pixel ids agree with
 * healpy.ang2pix(nside, pi/2 - dec, ra).
 */
class HealpixRingIndex final : public SpatialIndex {
public:
    explicit HealpixRingIndex(int nside);

    int nside() const { return nside_; }

    CellId ang2pix(double theta, double phi) const;
    void   pix2ang(CellId pix, double& theta, double& phi) const;

    CellId cell_of(double ra, double dec) const override;
    Vec3   center_of(CellId cell) const override;
    std::vector<CellId> cells_within(CellId cell, double max_angle) const override;
    double max_cell_radius() const override { return max_radius_; }
    CellId num_cells() const override { return npix_; }

private:
    struct Ring {
        CellId first;
        CellId count;
        double z;
    };
    Ring ring(CellId iring) const;               // 1 … 4*nside-1

    int    nside_;
    CellId npix_;
    CellId ncap_;
    double fact1_, fact2_;
    double max_radius_;
};

} // namespace lyacorr
