#include "lyacorr/SkyPartition.hpp"
#include "lyacorr/Errors.hpp"

#include <algorithm>
#include <string>

namespace lyacorr {

SkyPartition::SkyPartition(std::vector<ForestRecord>& forests,
                           const SpatialIndex&        index)
{
    for (auto& f : forests) f.cell = index.cell_of(f.ra, f.dec);
    build(forests);
}

SkyPartition::SkyPartition(const std::vector<ForestRecord>& forests)
{
    build(forests);
}

void SkyPartition::build(const std::vector<ForestRecord>& forests)
{
    n_forests_ = forests.size();
    for (std::size_t i = 0; i < forests.size(); ++i) {
        const CellId cell = forests[i].cell;
        if (cell < 0)
            throw DataIntegrityError("forest " + std::to_string(forests[i].object_id) +
                                     " has no spatial cell assigned");
        cells_[cell].push_back(i);            // i ascending -> members sorted
    }

    ids_.reserve(cells_.size());
    for (const auto& [cell, members] : cells_) ids_.push_back(cell);
    std::sort(ids_.begin(), ids_.end());
}

const SkyPartition::Members& SkyPartition::members(CellId cell) const
{
    static const Members empty;
    auto it = cells_.find(cell);
    return (it == cells_.end()) ? empty : it->second;
}

} // namespace lyacorr
