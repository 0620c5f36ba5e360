// gantry/common/yaml_json.h
#ifndef GANTRY_COMMON_YAML_JSON_H
#define GANTRY_COMMON_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace gantry {

// Converts a YAML::Node into nlohmann::json. Plain scalars that look like
// booleans or numbers become typed values; quoted scalars stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Renders a scalar json value the way it would appear in a shell command
// ("12", "true", "1.5", "text"). Throws std::runtime_error for objects/arrays.
std::string scalar_to_string(const nlohmann::json& value);

// Indented dump for files and stdout. Bytes that are not valid UTF-8
// (raw test output, artifact hunks) become U+FFFD instead of throwing.
std::string dump_json(const nlohmann::json& value);

} // namespace gantry

#endif // GANTRY_COMMON_YAML_JSON_H
