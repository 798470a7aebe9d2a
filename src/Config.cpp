#include "lyacorr/Config.hpp"
#include "lyacorr/Errors.hpp"

#include <cmath>
#include <exception>
#include <limits>
#include <set>
#include <string>
#include <thread>

namespace lyacorr {

namespace {

void require(bool ok, const std::string& what)
{
    if (!ok) throw ConfigurationError(what);
}

void check_keys(const nlohmann::json& j,
                const std::set<std::string>& accepted,
                const std::string& section)
{
    if (!j.is_object())
        throw ConfigurationError("section '" + section + "' must be a JSON object");
    for (const auto& [key, value] : j.items())
        if (!accepted.count(key))
            throw ConfigurationError("unknown option '" + key + "' in section '" +
                                     section + "'");
}

/* read j[key] into out if present, type errors become ConfigurationError */
template <typename T>
void read(const nlohmann::json& j, const char* key, T& out)
{
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("option '") + key + "': " + e.what());
    }
}

void read_int(const nlohmann::json& j, const char* key, int& out)
{
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if (!v.is_number_integer())
        throw ConfigurationError(std::string("option '") + key + "' must be an integer");
    constexpr long long lo = std::numeric_limits<int>::min();
    constexpr long long hi = std::numeric_limits<int>::max();
    const bool fits = v.is_number_unsigned()
        ? v.get<unsigned long long>() <= static_cast<unsigned long long>(hi)
        : v.get<long long>() >= lo && v.get<long long>() <= hi;
    if (!fits)
        throw ConfigurationError(std::string("option '") + key + "' is out of range");
    out = static_cast<int>(v.get<long long>());
}

void check_limits(const std::array<double, 2>& lim, const char* name)
{
    require(std::isfinite(lim[0]) && std::isfinite(lim[1]) && lim[0] < lim[1],
            std::string(name) + " must satisfy lower < upper");
}

} // namespace

/* ------------------------------------------------------------------ */
/*  validation                                                         */
/* ------------------------------------------------------------------ */
void CorrelationConfig::validate() const
{
    require(rp_max > 0.0,              "rp_max must be > 0");
    require(rt_max > 0.0,              "rt_max must be > 0");
    require(np > 0,                    "np must be a positive integer");
    require(nt > 0,                    "nt must be a positive integer");
    require(lambda_abs > 0.0,          "lambda_abs must be > 0");
    require(fid_om > 0.0 && fid_om < 1.0, "fid_Om must lie in (0, 1)");
    require(nside >= 0,                "nside must be a positive integer (0 = auto)");
    require(z_ref > -1.0,              "z_ref must be > -1");
    require(std::isfinite(z_evol),     "z_evol must be finite");
    require(lambda_min_obs > 0.0,      "lambda_min_obs must be > 0");
    require(z_min() > -1.0,            "lambda_min_obs / lambda_abs gives z_min <= -1");
    require(max_spectra >= 0,          "nspec must be >= 0");
}

unsigned CorrelationConfig::resolved_nproc() const
{
    if (nproc > 0) return nproc;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

void ContinuumConfig::validate() const
{
    require(lambda_min > 0.0 && lambda_min < lambda_max,
            "continuum lambda_min/lambda_max must satisfy 0 < min < max");
    require(lambda_min_rest > 0.0 && lambda_min_rest < lambda_max_rest,
            "continuum lambda_min_rest/lambda_max_rest must satisfy 0 < min < max");
    require(lambda_abs > 0.0,          "continuum lambda_abs must be > 0");
    require(num_bins_variance > 1,     "num_bins_variance must be > 1");
    require(num_var_pipe_bins > 1,     "num_var_pipe_bins must be > 1");
    require(num_bins_mean_cont > 1,    "num_bins_mean_cont must be > 1");
    require(min_num_pix > 0,           "min_num_pix must be > 0");
    require(min_num_qso_in_fit > 0,    "min_num_qso_in_fit must be > 0");
    require(max_iterations > 0,        "max_iterations must be > 0");
    require(tolerance > 0.0,           "tolerance must be > 0");
    check_limits(eta_limits,     "eta_limits");
    check_limits(var_lss_limits, "var_lss_limits");
    check_limits(fudge_limits,   "fudge_limits");
    require(std::isfinite(eta_value) && std::isfinite(var_lss_value) &&
            std::isfinite(fudge_value), "eta/var_lss/fudge values must be finite");
}

/* ------------------------------------------------------------------ */
/*  JSON                                                               */
/* ------------------------------------------------------------------ */
unsigned parse_nproc(const nlohmann::json& j)
{
    if (j.is_string()) {
        if (j.get<std::string>() == "auto") return 0;
        throw ConfigurationError("nproc must be a positive integer or \"auto\"");
    }
    if (!j.is_number_integer() || j.get<long long>() <= 0)
        throw ConfigurationError("nproc must be a positive integer or \"auto\"");
    if (j.get<unsigned long long>() > std::numeric_limits<unsigned>::max())
        throw ConfigurationError("nproc is out of range");
    return static_cast<unsigned>(j.get<long long>());
}

unsigned parse_nproc_text(const std::string& text)
{
    if (text == "auto") return 0;
    std::size_t used = 0;
    long long n = 0;
    try {
        n = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw ConfigurationError("nproc must be a positive integer or \"auto\", got '" +
                                 text + "'");
    }
    if (used != text.size() || n <= 0 ||
        static_cast<unsigned long long>(n) > std::numeric_limits<unsigned>::max())
        throw ConfigurationError("nproc must be a positive integer or \"auto\", got '" +
                                 text + "'");
    return static_cast<unsigned>(n);
}

CorrelationConfig parse_correlation_config(const nlohmann::json& j,
                                           CorrelationConfig cfg)
{
    check_keys(j, {"rp_max", "rt_max", "np", "nt", "lambda_abs", "fid_Om",
                   "nside", "nproc", "z_ref", "z_evol", "project",
                   "lambda_min_obs", "nspec"}, "correlation");

    read(j, "rp_max", cfg.rp_max);
    read(j, "rt_max", cfg.rt_max);
    read_int(j, "np", cfg.np);
    read_int(j, "nt", cfg.nt);
    read(j, "lambda_abs", cfg.lambda_abs);
    read(j, "fid_Om", cfg.fid_om);
    read_int(j, "nside", cfg.nside);
    if (j.contains("nproc")) cfg.nproc = parse_nproc(j.at("nproc"));
    read(j, "z_ref", cfg.z_ref);
    read(j, "z_evol", cfg.z_evol);
    read(j, "project", cfg.project);
    read(j, "lambda_min_obs", cfg.lambda_min_obs);
    read(j, "nspec", cfg.max_spectra);

    cfg.validate();
    return cfg;
}

ContinuumConfig parse_continuum_config(const nlohmann::json& j,
                                       ContinuumConfig cfg)
{
    check_keys(j, {"lambda_min", "lambda_max", "lambda_min_rest", "lambda_max_rest",
                   "lambda_abs", "num_bins_variance", "num_var_pipe_bins",
                   "num_bins_mean_cont", "min_num_pix", "min_num_qso_in_fit",
                   "max_iterations", "tolerance", "fit_eta", "fit_var_lss",
                   "fit_fudge", "eta_value", "var_lss_value", "fudge_value",
                   "eta_limits", "var_lss_limits", "fudge_limits", "verbose"},
               "continuum");

    read(j, "lambda_min", cfg.lambda_min);
    read(j, "lambda_max", cfg.lambda_max);
    read(j, "lambda_min_rest", cfg.lambda_min_rest);
    read(j, "lambda_max_rest", cfg.lambda_max_rest);
    read(j, "lambda_abs", cfg.lambda_abs);
    read_int(j, "num_bins_variance", cfg.num_bins_variance);
    read_int(j, "num_var_pipe_bins", cfg.num_var_pipe_bins);
    read_int(j, "num_bins_mean_cont", cfg.num_bins_mean_cont);
    read_int(j, "min_num_pix", cfg.min_num_pix);
    read_int(j, "min_num_qso_in_fit", cfg.min_num_qso_in_fit);
    read_int(j, "max_iterations", cfg.max_iterations);
    read(j, "tolerance", cfg.tolerance);
    read(j, "fit_eta", cfg.fit_eta);
    read(j, "fit_var_lss", cfg.fit_var_lss);
    read(j, "fit_fudge", cfg.fit_fudge);
    read(j, "eta_value", cfg.eta_value);
    read(j, "var_lss_value", cfg.var_lss_value);
    read(j, "fudge_value", cfg.fudge_value);
    read(j, "eta_limits", cfg.eta_limits);
    read(j, "var_lss_limits", cfg.var_lss_limits);
    read(j, "fudge_limits", cfg.fudge_limits);
    read(j, "verbose", cfg.verbose);

    cfg.validate();
    return cfg;
}

RunConfig parse_run_config(const nlohmann::json& j)
{
    check_keys(j, {"correlation", "continuum"}, "root");

    RunConfig rc;
    rc.correlation = parse_correlation_config(
        j.contains("correlation") ? j.at("correlation") : nlohmann::json::object());
    rc.continuum = parse_continuum_config(
        j.contains("continuum") ? j.at("continuum") : nlohmann::json::object());
    return rc;
}

} // namespace lyacorr
