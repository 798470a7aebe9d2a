#include "lyacorr/Config.hpp"
#include "lyacorr/ContinuumFitter.hpp"
#include "lyacorr/FitsIO.hpp"
#include "lyacorr/ForestCatalogue.hpp"
#include "lyacorr/JsonUtils.hpp"
#include "lyacorr/SkyPartition.hpp"
#include "lyacorr/SpatialIndex.hpp"

#include <cxxopts.hpp>
#include <Eigen/Core>
#include <omp.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

using namespace lyacorr;

int main(int argc, char** argv)
{
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("lyacorr_deltas", "Continuum fitting and delta extraction");
        opts.add_options()
            ("config", "Run configuration JSON", cxxopts::value<std::string>())
            ("in-dir", "Directory with spectra", cxxopts::value<std::string>())
            ("out-dir", "Directory for the delta files", cxxopts::value<std::string>())
            ("nproc", "Number of threads or 'auto'", cxxopts::value<std::string>())
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("in-dir") || !cli.count("out-dir")) {
            std::cout << opts.help() << '\n';
            return cli.count("help") ? 0 : 1;
        }

        RunConfig rc;
        if (cli.count("config")) {
            auto j = load_json(cli["config"].as<std::string>());
            expand_env(j);
            rc = parse_run_config(j);
        }
        if (cli.count("nproc")) rc.correlation.nproc = parse_nproc_text(cli["nproc"].as<std::string>());

        const unsigned nthreads = rc.correlation.resolved_nproc();
        omp_set_num_threads(static_cast<int>(nthreads));
        Eigen::setNbThreads(1);

        const std::string out_dir = cli["out-dir"].as<std::string>();

        /* ---------------- spectra -> forests ---------------- */
        auto forests = read_forest_directory(cli["in-dir"].as<std::string>(),
                                             ForestFileKind::Spectra,
                                             static_cast<std::size_t>(rc.correlation.max_spectra));
        for (auto& f : forests) apply_wavelength_cuts(f, rc.continuum);
        const std::size_t n_short = filter_forests(forests, rc.continuum.min_num_pix);
        std::cout << "[deltas] " << forests.size() << " forests kept, "
                  << n_short << " rejected\n";

        /* ---------------- expected flux ---------------- */
        ContinuumFitter fitter(rc.continuum);
        const ContinuumFitReport& report = fitter.fit(forests);
        std::cout << "[deltas] continuum fit " << to_string(report.state) << " after "
                  << report.iterations << " iterations\n";

        fitter.compute_deltas(forests);
        const std::size_t n_bad = filter_bad_continuum(forests);
        std::cout << "[deltas] " << n_bad << " forests without a usable continuum\n";

        /* ---------------- output ---------------- */
        int nside = rc.correlation.nside;
        if (nside == 0) nside = find_nside(forests);
        const HealpixRingIndex index(nside);
        const SkyPartition     partition(forests, index);
        std::cout << "[deltas] nside " << nside << ": " << partition.num_cells()
                  << " cells\n";

        write_deltas(out_dir, forests);
        write_continuum_attributes((std::filesystem::path(out_dir) / "continuum").string(),
                                   fitter);

        std::cout << "\nDelta extraction completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    const auto duration = std::chrono::duration_cast<std::chrono::seconds>(
                              std::chrono::steady_clock::now() - start_time).count();
    std::cout << "\nTook: " << duration / 60 << "m " << duration % 60 << "s\n";
    return 0;
}
