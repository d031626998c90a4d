#include "core/errors.hpp"
#include "core/logger.hpp"
#include "engine/engine.hpp"
#include "engine/stream_io.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <vector>

namespace crush {

double InspectResult::ratio() const {
  return Utils::calculate_ratio(header.original_size, compressed_size);
}

void InspectSummary::add(const InspectResult &result) {
  ++files;
  original_bytes += result.header.original_size;
  compressed_bytes += result.compressed_size;
  if (!result.algorithm_known)
    ++unknown_algorithms;
}

double InspectSummary::ratio() const {
  return Utils::calculate_ratio(original_bytes, compressed_bytes);
}

InspectResult CompressionEngine::inspect(std::istream &in) const {
  const CompressedHeader header = read_fixed_header(in);

  InspectResult result;
  if (AlgorithmPtr algorithm = registry_.lookup(header.magic)) {
    result.algorithm = algorithm->metadata().name;
    result.algorithm_known = true;
  } else if (header.has_crush_prefix()) {
    result.algorithm = "unknown";
    LOG(LogLevel::DEBUG, LogComponent::ENGINE_INSPECT,
        "No registered algorithm for magic " << magic_to_string(header.magic));
  } else {
    throw_unregistered_magic(header);
  }

  ParsedHeader parsed = read_metadata_block(in, header);
  result.header = parsed.header;
  result.file_metadata = parsed.metadata;

  // Count the payload without keeping it.
  std::vector<char> chunk(IO_CHUNK_SIZE);
  uint64_t payload = 0;
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    payload += static_cast<uint64_t>(in.gcount());
  }
  if (in.bad())
    throw CrushError(ErrorKind::Io, "Failed to read input stream",
                     parsed.header.diagnostics());

  result.payload_size = payload;
  result.compressed_size = parsed.encoded_size + payload;
  return result;
}

InspectResult
CompressionEngine::inspect_file(const std::filesystem::path &input) const {
  std::ifstream in(input, std::ios::binary);
  if (!in.is_open())
    throw CrushError(ErrorKind::Io, "Cannot open input file: " + input.string());
  return inspect(in);
}

InspectResult inspect(std::istream &in) {
  return CompressionEngine(global_registry()).inspect(in);
}

} // namespace crush
