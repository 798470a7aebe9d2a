#include "lyacorr/FitsIO.hpp"
#include "lyacorr/ContinuumFitter.hpp"
#include "lyacorr/Errors.hpp"

#include <CCfits/CCfits>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <valarray>

namespace fs = std::filesystem;

namespace lyacorr {

namespace {

Vector to_eigen(const std::vector<double>& v)
{
    return Eigen::Map<const Vector>(v.data(), static_cast<Eigen::Index>(v.size()));
}

std::vector<double> to_std(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

bool is_fits_name(const fs::path& p)
{
    const std::string name = p.filename().string();
    auto ends_with = [&](const std::string& s) {
        return name.size() >= s.size() &&
               name.compare(name.size() - s.size(), s.size(), s) == 0;
    };
    return ends_with(".fits") || ends_with(".fits.gz");
}

bool has_column(CCfits::ExtHDU& ext, const std::string& name)
{
    const auto& cols = ext.column();
    return cols.find(name) != cols.end();
}

Vector read_column(CCfits::ExtHDU& ext, const std::string& name)
{
    std::vector<double> buf;
    ext.column(name).read(buf, 1, ext.rows());
    return to_eigen(buf);
}

ForestRecord read_forest_hdu(CCfits::ExtHDU& ext, ForestFileKind kind)
{
    ForestRecord f;
    long thing_id = 0;
    ext.readKey("RA", f.ra);
    ext.readKey("DEC", f.dec);
    ext.readKey("Z", f.z_qso);
    ext.readKey("THING_ID", thing_id);
    f.object_id = thing_id;

    if (has_column(ext, "LOGLAM")) {
        f.log_lambda = read_column(ext, "LOGLAM");
    } else {
        f.log_lambda = read_column(ext, "LAMBDA").array().log10();
    }

    if (kind == ForestFileKind::Spectra) {
        f.flux = read_column(ext, "FLUX");
        f.ivar = read_column(ext, "IVAR");
        f.validate_spectrum();
    } else {
        f.delta  = read_column(ext, "DELTA");
        f.weight = read_column(ext, "WEIGHT");
        if (has_column(ext, "CONT")) f.continuum = read_column(ext, "CONT");
        if (f.delta.size() != f.size() || f.weight.size() != f.size())
            throw DataIntegrityError("forest " + std::to_string(f.object_id) +
                                     ": column lengths differ");
    }
    return f;
}

} // namespace

/* ------------------------------------------------------------------ */
/*  reading                                                            */
/* ------------------------------------------------------------------ */
std::vector<ForestRecord> read_forest_file(const std::string& path, ForestFileKind kind)
{
    std::vector<ForestRecord> out;
    try {
        CCfits::FITS file(path, CCfits::Read);

        /* HDUs in file order */
        std::vector<CCfits::ExtHDU*> hdus;
        for (const auto& [name, hdu] : file.extension()) hdus.push_back(hdu);
        std::sort(hdus.begin(), hdus.end(),
                  [](const CCfits::ExtHDU* a, const CCfits::ExtHDU* b) {
                      return a->index() < b->index();
                  });

        out.reserve(hdus.size());
        for (CCfits::ExtHDU* ext : hdus) out.push_back(read_forest_hdu(*ext, kind));
    } catch (const CCfits::FitsException& e) {
        throw IOError("cannot read '" + path + "': " + e.message());
    }
    return out;
}

std::vector<ForestRecord> read_forest_directory(const std::string& dir,
                                                ForestFileKind     kind,
                                                std::size_t        max_forests)
{
    if (!fs::is_directory(dir))
        throw IOError("input directory '" + dir + "' does not exist");

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir))
        if (entry.is_regular_file() && is_fits_name(entry.path()))
            files.push_back(entry.path());
    std::sort(files.begin(), files.end());

    if (files.empty())
        throw IOError("no FITS files in '" + dir + "'");

    std::vector<ForestRecord> forests;
    std::size_t n_files = 0;
    for (const auto& p : files) {
        auto part = read_forest_file(p.string(), kind);
        ++n_files;
        for (auto& f : part) {
            if (max_forests > 0 && forests.size() >= max_forests) break;
            forests.push_back(std::move(f));
        }
        if (max_forests > 0 && forests.size() >= max_forests) break;
    }

    std::cout << "Read " << forests.size() << " forests from " << n_files
              << " files in " << dir << '\n';
    return forests;
}

/* ------------------------------------------------------------------ */
/*  writing                                                            */
/* ------------------------------------------------------------------ */
std::size_t write_deltas(const std::string& out_dir,
                         const std::vector<ForestRecord>& forests)
{
    std::map<CellId, std::vector<const ForestRecord*>> by_cell;
    for (const auto& f : forests) {
        if (f.cell < 0)
            throw DataIntegrityError("forest " + std::to_string(f.object_id) +
                                     " has no spatial cell");
        by_cell[f.cell].push_back(&f);
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) throw IOError("cannot create '" + out_dir + "': " + ec.message());

    const std::vector<std::string> names{"LOGLAM", "DELTA", "WEIGHT", "CONT"};
    const std::vector<std::string> forms{"1D", "1D", "1D", "1D"};
    const std::vector<std::string> units{"log Angstrom", "", "", ""};

    for (const auto& [cell, members] : by_cell) {
        const std::string path =
            (fs::path(out_dir) / ("delta-" + std::to_string(cell) + ".fits.gz")).string();
        try {
            CCfits::FITS file("!" + path, CCfits::Write);
            for (const ForestRecord* f : members) {
                CCfits::Table* t = file.addTable(std::to_string(f->object_id),
                                                 static_cast<int>(f->size()),
                                                 names, forms, units);
                t->addKey("RA", f->ra, "Right ascension [rad]");
                t->addKey("DEC", f->dec, "Declination [rad]");
                t->addKey("Z", f->z_qso, "Quasar redshift");
                t->addKey("THING_ID", static_cast<long>(f->object_id), "Object id");
                t->addKey("CONTA", f->cont_amplitude, "Continuum amplitude");
                t->addKey("CONTB", f->cont_slope, "Continuum slope");
                if (f->size() == 0) continue;

                std::vector<double> col = to_std(f->log_lambda);
                t->column("LOGLAM").write(col, 1);
                col = to_std(f->delta);
                t->column("DELTA").write(col, 1);
                col = to_std(f->weight);
                t->column("WEIGHT").write(col, 1);
                col = f->continuum.size() == f->size() ? to_std(f->continuum)
                                                       : std::vector<double>(f->size(), 0.0);
                t->column("CONT").write(col, 1);
            }
        } catch (const CCfits::FitsException& e) {
            throw IOError("cannot write '" + path + "': " + e.message());
        }
    }
    std::cout << "[deltas] wrote " << by_cell.size() << " files to " << out_dir << '\n';
    return by_cell.size();
}

void write_correlation(const std::string&       path,
                       const CorrelationResult& res,
                       const CorrelationConfig& cfg)
{
    const int nb = res.np * res.nt;
    const auto n_cells = static_cast<int>(res.cells.size());
    try {
        CCfits::FITS file("!" + path, CCfits::Write);

        {
            const std::vector<std::string> names{"RP", "RT", "Z", "NB"};
            const std::vector<std::string> forms{"1D", "1D", "1D", "1D"};
            const std::vector<std::string> units{"Mpc/h", "Mpc/h", "", ""};
            CCfits::Table* t = file.addTable("ATTRI", nb, names, forms, units);
            t->addKey("RPMAX", cfg.rp_max, "Maximum r-parallel [Mpc/h]");
            t->addKey("RTMAX", cfg.rt_max, "Maximum r-transverse [Mpc/h]");
            t->addKey("NP", res.np, "Number of bins in r-parallel");
            t->addKey("NT", res.nt, "Number of bins in r-transverse");
            t->addKey("Z_REF", cfg.z_ref, "Reference redshift of the weights");
            t->addKey("Z_EVOL", cfg.z_evol, "Redshift evolution exponent");
            t->addKey("OMEGAM", cfg.fid_om, "Fiducial Omega_matter");
            t->addKey("NSIDE", cfg.nside, "HEALPix nside of the sub-samples");

            std::vector<double> col = to_std(res.rp);
            t->column("RP").write(col, 1);
            col = to_std(res.rt);
            t->column("RT").write(col, 1);
            col = to_std(res.z);
            t->column("Z").write(col, 1);
            col = to_std(res.num_pairs);
            t->column("NB").write(col, 1);
        }
        {
            const std::string vec = std::to_string(nb) + "D";
            const std::vector<std::string> names{"HEALPID", "WE", "DA"};
            const std::vector<std::string> forms{"1K", vec, vec};
            const std::vector<std::string> units{"", "", ""};
            CCfits::Table* t = file.addTable("COR", n_cells, names, forms, units);
            if (n_cells > 0) {
                std::vector<long> ids(res.cells.begin(), res.cells.end());
                t->column("HEALPID").write(ids, 1);

                std::vector<std::valarray<double>> we(n_cells), da(n_cells);
                for (int c = 0; c < n_cells; ++c) {
                    we[c].resize(nb);
                    da[c].resize(nb);
                    for (int b = 0; b < nb; ++b) {
                        we[c][b] = res.cell_weights(c, b);
                        da[c][b] = res.cell_xi(c, b);
                    }
                }
                t->column("WE").writeArrays(we, 1);
                t->column("DA").writeArrays(da, 1);
            }
        }
    } catch (const CCfits::FitsException& e) {
        throw IOError("cannot write '" + path + "': " + e.message());
    }
    std::cout << "[cf] wrote " << path << '\n';
}

void write_continuum_attributes(const std::string& prefix, const ContinuumFitter& fitter)
{
    const VarianceModel& var  = fitter.variance_model();
    const MeanContinuum& mean = fitter.mean_continuum();

    std::ofstream fv(prefix + "-variance.csv");
    if (!fv) throw IOError("cannot write '" + prefix + "-variance.csv'");
    fv << "loglam,eta,var_lss,fudge\n" << std::setprecision(10);
    for (int i = 0; i < var.num_bins(); ++i)
        fv << var.nodes()[i] << ',' << var.eta_values()[i] << ','
           << var.var_lss_values()[i] << ',' << var.fudge_values()[i] << '\n';

    std::ofstream fm(prefix + "-mean_continuum.csv");
    if (!fm) throw IOError("cannot write '" + prefix + "-mean_continuum.csv'");
    fm << "loglam_rest,mean_cont\n" << std::setprecision(10);
    for (int i = 0; i < mean.num_bins(); ++i)
        fm << mean.nodes()[i] << ',' << mean.values()[i] << '\n';
}

} // namespace lyacorr
