#include "utils/json_formatter.hpp"

#include <cstdio>

namespace JsonFormatter {

namespace {
std::string format_crc(uint32_t crc) {
  char buffer[9];
  std::snprintf(buffer, sizeof(buffer), "%08x", crc);
  return buffer;
}

std::string format_mode(uint32_t mode) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%04o", mode & 07777);
  return buffer;
}
} // namespace

nlohmann::json algorithm_to_json_object(const crush::AlgorithmMetadata &meta) {
  nlohmann::json j;
  j["name"] = meta.name;
  j["version"] = meta.version;
  j["magic_number"] = crush::magic_to_string(meta.magic_number);
  j["throughput_mbps"] = meta.throughput_mbps;
  j["compression_ratio"] = meta.compression_ratio;
  j["description"] = meta.description;
  return j;
}

nlohmann::json
plugins_to_json_array(const std::vector<crush::AlgorithmMetadata> &plugins) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto &meta : plugins)
    arr.push_back(algorithm_to_json_object(meta));
  return arr;
}

nlohmann::json inspect_to_json_object(const crush::InspectResult &result,
                                      const std::string &file) {
  nlohmann::json j;
  j["file"] = file;
  j["algorithm"] = result.algorithm;
  j["algorithm_known"] = result.algorithm_known;
  j["magic_number"] = crush::magic_to_string(result.header.magic);
  j["original_size"] = result.header.original_size;
  j["compressed_size"] = result.compressed_size;
  j["payload_size"] = result.payload_size;
  j["ratio"] = result.ratio();
  j["flags"] = result.header.flags;
  if (result.header.has_crc32())
    j["crc32"] = format_crc(result.header.crc32);
  else
    j["crc32"] = nullptr;

  if (result.file_metadata) {
    nlohmann::json meta = nlohmann::json::object();
    if (result.file_metadata->mtime)
      meta["mtime"] = *result.file_metadata->mtime;
    if (result.file_metadata->permissions)
      meta["permissions"] = format_mode(*result.file_metadata->permissions);
    j["metadata"] = meta;
  }
  return j;
}

nlohmann::json
inspect_summary_to_json_object(const crush::InspectSummary &summary) {
  nlohmann::json j;
  j["files"] = summary.files;
  j["original_size"] = summary.original_bytes;
  j["compressed_size"] = summary.compressed_bytes;
  j["ratio"] = summary.ratio();
  j["unknown_algorithms"] = summary.unknown_algorithms;
  return j;
}

} // namespace JsonFormatter
