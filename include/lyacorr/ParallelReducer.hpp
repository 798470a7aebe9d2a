#pragma once
#include "BinnedCorrelation.hpp"
#include "PairAccumulator.hpp"
#include "Types.hpp"

#include <map>
#include <vector>

namespace lyacorr {

/*
 * Fan-out / fan-in driver of the pair count.
 *
 * One task per cell runs PairAccumulator::accumulate on a ThreadPool; the
 * calling thread collects the partial histograms and merges them in
 * ascending cell order.  Floating-point sums are therefore formed in the
 * same order whatever the number of threads or the dispatch order.
 */
class ParallelReducer {
public:
    using Partials = std::map<CellId, BinnedCorrelation>;

    ParallelReducer(const PairAccumulator& accumulator,
                    unsigned               nthreads,
                    bool                   verbose = true);

    // throws WorkerFailure once all tasks have finished if any of them threw
    Partials accumulate_cells(const std::vector<CellId>& dispatch_order) const;

    CorrelationResult reduce(const Partials& partials) const;

    CorrelationResult run(const std::vector<CellId>& cells) const
    {
        return reduce(accumulate_cells(cells));
    }

    unsigned num_threads() const { return nthreads_; }

private:
    const PairAccumulator& acc_;
    unsigned               nthreads_;
    bool                   verbose_;
};

} // namespace lyacorr
