#ifndef CRUSH_JSON_FORMATTER_HPP
#define CRUSH_JSON_FORMATTER_HPP

#include "engine/engine.hpp"
#include "plugin/algorithm.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace JsonFormatter {

nlohmann::json algorithm_to_json_object(const crush::AlgorithmMetadata &meta);

nlohmann::json
plugins_to_json_array(const std::vector<crush::AlgorithmMetadata> &plugins);

nlohmann::json inspect_to_json_object(const crush::InspectResult &result,
                                      const std::string &file);

nlohmann::json
inspect_summary_to_json_object(const crush::InspectSummary &summary);

} // namespace JsonFormatter

#endif // CRUSH_JSON_FORMATTER_HPP
