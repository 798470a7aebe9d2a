#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace lyacorr {

// parse a JSON file; IOError if it cannot be opened or parsed
nlohmann::json load_json(const std::string& path);

// replace ${VAR} in every string value by the environment variable VAR;
// ConfigurationError if VAR is not set
void expand_env(nlohmann::json& j);

} // namespace lyacorr
