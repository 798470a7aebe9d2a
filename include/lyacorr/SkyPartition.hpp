#pragma once
#include "Forest.hpp"
#include "SpatialIndex.hpp"

#include <ankerl/unordered_dense.h>
#include <cstddef>
#include <vector>

namespace lyacorr {

/*
 * Grouping of forests by spatial cell.  Built once after the catalogue is
 * loaded and read-only afterwards, so it can be shared by every worker.
 */
class SkyPartition {
public:
    using Members = std::vector<std::size_t>;            // forest indices, ascending

    // assigns ForestRecord::cell and groups the forests
    SkyPartition(std::vector<ForestRecord>& forests, const SpatialIndex& index);

    // groups forests by an already assigned ForestRecord::cell
    explicit SkyPartition(const std::vector<ForestRecord>& forests);

    const Members& members(CellId cell) const;          // empty for unknown cells
    bool contains(CellId cell) const { return cells_.find(cell) != cells_.end(); }

    const std::vector<CellId>& cell_ids() const { return ids_; }  // ascending
    std::size_t num_cells() const { return ids_.size(); }
    std::size_t num_forests() const { return n_forests_; }

private:
    void build(const std::vector<ForestRecord>& forests);

    ankerl::unordered_dense::map<CellId, Members> cells_;
    std::vector<CellId> ids_;
    std::size_t         n_forests_ = 0;
};

} // namespace lyacorr
