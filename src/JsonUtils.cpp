#include "lyacorr/JsonUtils.hpp"
#include "lyacorr/Errors.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>

namespace lyacorr {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw IOError("cannot open JSON file '" + path + "'");

    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw IOError("cannot parse JSON file '" + path + "': " + e.what());
    }
}

namespace {

/* ${VAR} -> value of VAR; an unset variable is a configuration error */
std::string substitute_env(const std::string& text)
{
    static const std::regex pattern(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");

    std::string out;
    auto pos = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(pos, m[0].first);
        const std::string name = m[1];
        const char* value = std::getenv(name.c_str());
        if (!value)
            throw ConfigurationError("environment variable '" + name +
                                     "' used in the configuration is not set");
        out += value;
        pos = m[0].second;
    }
    out.append(pos, text.cend());
    return out;
}

} // namespace

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = substitute_env(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

} // namespace lyacorr
