#pragma once
#include "BinnedCorrelation.hpp"
#include "Config.hpp"
#include "Forest.hpp"
#include "SkyPartition.hpp"
#include "SpatialIndex.hpp"
#include "Types.hpp"

#include <cstddef>
#include <vector>

namespace lyacorr {

class Cosmology;

/*
 * Pair counting for one spatial cell.
 *
 * A forest pair (i, j) with i < j in catalogue order is owned by the cell
 * of forest i: its task pairs i with every forest j > i found in the
 * neighbourhood.  Every unordered pair is therefore counted exactly once
 * over all cells, whatever the scheduling.
 *
 * Every forest is validated on construction, so a malformed record is
 * rejected before any task runs.  All inputs are read-only; accumulate()
 * may run concurrently for different cells.
 */
class PairAccumulator {
public:
    PairAccumulator(const std::vector<ForestRecord>& forests,
                    const SkyPartition&              partition,
                    const SpatialIndex&              index,
                    const CorrelationConfig&         config,
                    double                           ang_max);

    // largest angle at which two forests can be closer than rt_max
    static double max_angle(const CorrelationConfig& config, const Cosmology& cosmo);

    BinnedCorrelation accumulate(CellId cell) const;

    // every pixel pair of d1 and d2 separated by ang (rad)
    void accumulate_pair(const ForestRecord& d1,
                         const ForestRecord& d2,
                         double              ang,
                         BinnedCorrelation&  out) const;

    double ang_max() const { return ang_max_; }
    const CorrelationConfig& config() const { return config_; }

private:
    std::vector<std::size_t> neighbourhood(CellId cell) const;

    const std::vector<ForestRecord>& forests_;
    const SkyPartition&              partition_;
    const SpatialIndex&              index_;
    const CorrelationConfig          config_;
    const double                     ang_max_;
    std::vector<Vec3>                unit_;     // per forest
};

} // namespace lyacorr
