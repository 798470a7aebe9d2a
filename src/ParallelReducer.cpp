#include "lyacorr/ParallelReducer.hpp"
#include "lyacorr/Errors.hpp"
#include "lyacorr/ThreadPool.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace lyacorr {

ParallelReducer::ParallelReducer(const PairAccumulator& accumulator,
                                 unsigned               nthreads,
                                 bool                   verbose)
    : acc_(accumulator)
    , nthreads_(nthreads == 0 ? std::max(1u, std::thread::hardware_concurrency())
                              : nthreads)
    , verbose_(verbose)
{}

ParallelReducer::Partials
ParallelReducer::accumulate_cells(const std::vector<CellId>& dispatch_order) const
{
    Partials partials;
    if (dispatch_order.empty()) return partials;

    std::vector<std::pair<CellId, std::future<BinnedCorrelation>>> futures;
    futures.reserve(dispatch_order.size());
    {
        ThreadPool pool(nthreads_);
        for (CellId cell : dispatch_order) {
            futures.emplace_back(cell, pool.submit([this, cell] {
                return acc_.accumulate(cell);
            }));
        }

        const std::size_t n_tasks = futures.size();
        const std::size_t report  = std::max<std::size_t>(1, n_tasks / 10);

        std::optional<WorkerFailure> failure;
        std::size_t done = 0;
        for (auto& [cell, fut] : futures) {
            try {
                BinnedCorrelation part = fut.get();
                if (!failure) partials.insert_or_assign(cell, std::move(part));
            } catch (const std::exception& e) {
                if (!failure) failure.emplace(cell, e.what());
            }
            ++done;
            if (verbose_ && (done % report == 0 || done == n_tasks)) {
                std::cout << "[cf] " << done << '/' << n_tasks
                          << " cells done\n";
            }
        }

        /* every future has been waited on, nothing is still running */
        if (failure) {
            std::cerr << "[cf] " << failure->what() << '\n';
            throw *failure;
        }
    }
    return partials;
}

CorrelationResult ParallelReducer::reduce(const Partials& partials) const
{
    const CorrelationConfig& cfg = acc_.config();
    const int nb = cfg.num_bins();

    BinnedCorrelation total(cfg.np, cfg.nt);

    CorrelationResult res;
    res.np = cfg.np;
    res.nt = cfg.nt;
    res.cells.reserve(partials.size());
    res.cell_weights = Matrix::Zero(static_cast<Eigen::Index>(partials.size()), nb);
    res.cell_xi      = Matrix::Zero(static_cast<Eigen::Index>(partials.size()), nb);

    Eigen::Index row = 0;
    for (const auto& [cell, part] : partials) {        // ascending cell id
        total += part;

        res.cells.push_back(cell);
        res.cell_weights.row(row) = part.weights.transpose();
        for (int b = 0; b < nb; ++b) {
            if (part.weights[b] > 0.0)
                res.cell_xi(row, b) = part.weighted_xi[b] / part.weights[b];
        }
        ++row;
    }

    res.weights   = total.weights;
    res.num_pairs = total.num_pairs;
    res.xi        = normalise(total.weighted_xi, total.weights);
    res.rp        = normalise(total.weighted_rp, total.weights);
    res.rt        = normalise(total.weighted_rt, total.weights);
    res.z         = normalise(total.weighted_z,  total.weights);

    if (verbose_) {
        std::cout << "[cf] reduced " << partials.size() << " cells, "
                  << res.num_populated_bins() << '/' << nb
                  << " bins populated\n";
    }
    return res;
}

} // namespace lyacorr
