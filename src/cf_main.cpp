#include "lyacorr/Config.hpp"
#include "lyacorr/Cosmology.hpp"
#include "lyacorr/FitsIO.hpp"
#include "lyacorr/ForestCatalogue.hpp"
#include "lyacorr/JsonUtils.hpp"
#include "lyacorr/PairAccumulator.hpp"
#include "lyacorr/ParallelReducer.hpp"
#include "lyacorr/SkyPartition.hpp"
#include "lyacorr/SpatialIndex.hpp"

#include <cxxopts.hpp>
#include <Eigen/Core>
#include <omp.h>

#include <chrono>
#include <iostream>
#include <string>

using namespace lyacorr;

namespace {

void print_elapsed(std::chrono::steady_clock::time_point start)
{
    const auto duration = std::chrono::duration_cast<std::chrono::seconds>(
                              std::chrono::steady_clock::now() - start).count();
    const long hours   = duration / 3600;
    const long minutes = (duration % 3600) / 60;
    const long seconds = duration % 60;

    std::cout << "\nTook: ";
    if (hours > 0) std::cout << hours << "h ";
    if (minutes > 0 || hours > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";
}

/* command line values win over the JSON file */
CorrelationConfig build_config(const cxxopts::ParseResult& cli)
{
    CorrelationConfig cfg;
    if (cli.count("config")) {
        auto j = load_json(cli["config"].as<std::string>());
        expand_env(j);
        cfg = parse_run_config(j).correlation;
    }

    if (cli.count("rp-max"))     cfg.rp_max     = cli["rp-max"].as<double>();
    if (cli.count("rt-max"))     cfg.rt_max     = cli["rt-max"].as<double>();
    if (cli.count("np"))         cfg.np         = cli["np"].as<int>();
    if (cli.count("nt"))         cfg.nt         = cli["nt"].as<int>();
    if (cli.count("lambda-abs")) cfg.lambda_abs = cli["lambda-abs"].as<double>();
    if (cli.count("fid-Om"))     cfg.fid_om     = cli["fid-Om"].as<double>();
    if (cli.count("nside"))      cfg.nside      = cli["nside"].as<int>();
    if (cli.count("nproc"))      cfg.nproc      = parse_nproc_text(cli["nproc"].as<std::string>());
    if (cli.count("z-ref"))      cfg.z_ref      = cli["z-ref"].as<double>();
    if (cli.count("z-evol"))     cfg.z_evol     = cli["z-evol"].as<double>();
    if (cli.count("no-project")) cfg.project    = false;
    if (cli.count("nspec"))      cfg.max_spectra = cli["nspec"].as<long>();

    cfg.validate();
    return cfg;
}

} // namespace

int main(int argc, char** argv)
{
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("lyacorr_cf", "Lyman-alpha forest auto-correlation");
        opts.add_options()
            ("config", "Run configuration JSON", cxxopts::value<std::string>())
            ("out", "Output FITS file", cxxopts::value<std::string>())
            ("in-dir", "Directory with delta files", cxxopts::value<std::string>())
            ("rp-max", "Maximum r-parallel [Mpc/h]", cxxopts::value<double>())
            ("rt-max", "Maximum r-transverse [Mpc/h]", cxxopts::value<double>())
            ("np", "Number of r-parallel bins", cxxopts::value<int>())
            ("nt", "Number of r-transverse bins", cxxopts::value<int>())
            ("lambda-abs", "Rest-frame wavelength of the absorption [A]", cxxopts::value<double>())
            ("fid-Om", "Fiducial Omega_matter", cxxopts::value<double>())
            ("nside", "HEALPix nside of the sub-samples (0 = auto)", cxxopts::value<int>())
            ("nproc", "Number of worker threads or 'auto'", cxxopts::value<std::string>())
            ("z-ref", "Reference redshift of the weights", cxxopts::value<double>())
            ("z-evol", "Redshift evolution exponent of the weights", cxxopts::value<double>())
            ("no-project", "Do not project out the continuum modes")
            ("nspec", "Maximum number of forests to read", cxxopts::value<long>())
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("in-dir") || !cli.count("out")) {
            std::cout << opts.help() << '\n';
            return cli.count("help") ? 0 : 1;
        }

        CorrelationConfig cfg = build_config(cli);

        const unsigned nthreads = cfg.resolved_nproc();
        omp_set_num_threads(static_cast<int>(nthreads));
        Eigen::setNbThreads(1);
        std::cout << "[cf] using " << nthreads << " threads\n";

        auto forests = read_forest_directory(cli["in-dir"].as<std::string>(),
                                             ForestFileKind::Deltas,
                                             static_cast<std::size_t>(cfg.max_spectra));

        const Cosmology cosmo(cfg.fid_om);
        prepare_for_correlation(forests, cosmo, cfg);

        if (cfg.nside == 0) cfg.nside = find_nside(forests);
        const HealpixRingIndex index(cfg.nside);
        const SkyPartition     partition(forests, index);
        std::cout << "[cf] " << partition.num_forests() << " forests in "
                  << partition.num_cells() << " cells\n";

        const double ang_max = PairAccumulator::max_angle(cfg, cosmo);
        std::cout << "[cf] maximum angle " << ang_max << " rad\n";

        const PairAccumulator accumulator(forests, partition, index, cfg, ang_max);
        const ParallelReducer reducer(accumulator, nthreads);
        const CorrelationResult result = reducer.run(partition.cell_ids());

        write_correlation(cli["out"].as<std::string>(), result, cfg);
        std::cout << "\nCorrelation completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    print_elapsed(start_time);
    return 0;
}
