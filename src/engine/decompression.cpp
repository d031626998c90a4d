#include "cancel/resource_tracker.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "engine/engine.hpp"
#include "engine/stream_io.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace crush {

CompressionStats
CompressionEngine::decompress(std::istream &in, std::ostream &out,
                              const DecompressionOptions &options) const {
  CancellationToken local_token;
  const CancellationToken &cancel =
      options.cancellation ? *options.cancellation : local_token;
  OperationStatus status;
  const auto start = std::chrono::steady_clock::now();

  try {
    check_cancelled(cancel, "decompression setup");

    // Route before parsing anything else; the registry is the authority on
    // which magic numbers are decodable.
    const CompressedHeader header = read_fixed_header(in);
    AlgorithmPtr algorithm = registry_.lookup(header.magic);
    if (!algorithm)
      throw_unregistered_magic(header);
    const std::string name = algorithm->metadata().name;
    ParsedHeader parsed = read_metadata_block(in, header);

    auto payload = std::make_shared<const std::vector<uint8_t>>(
        read_all(in, cancel));

    LOG(LogLevel::DEBUG, LogComponent::ENGINE_DECOMPRESS,
        "Decompressing " << payload->size() << " payload bytes with '" << name
                         << "', expecting " << header.original_size);

    if (header.original_size > std::numeric_limits<size_t>::max()) {
      throw CrushError(ErrorKind::Corruption,
                       "Original size " +
                           std::to_string(header.original_size) +
                           " does not fit in memory on this platform",
                       header.diagnostics());
    }

    // Decoding stops as soon as the output passes the recorded size.
    TimeoutSupervisor supervisor(options.timeout);
    std::vector<uint8_t> output;
    try {
      output = supervisor.run(algorithm, AlgorithmOperation::Decompress,
                              payload, cancel,
                              static_cast<size_t>(header.original_size));
    } catch (const CrushError &e) {
      if (e.kind() == ErrorKind::Corruption && !e.header())
        throw CrushError(e.kind(), e.what(), header.diagnostics());
      throw;
    }

    if (output.size() != header.original_size) {
      std::ostringstream oss;
      oss << "Size mismatch: header says " << header.original_size
          << " bytes, decoded " << output.size();
      throw CrushError(ErrorKind::Corruption, oss.str(), header.diagnostics());
    }

    if (header.has_crc32()) {
      uint32_t actual = compute_crc32(output);
      if (actual != header.crc32) {
        std::ostringstream oss;
        oss << "CRC32 mismatch: expected " << std::hex << header.crc32
            << ", computed " << actual;
        throw CrushError(ErrorKind::Corruption, oss.str(),
                         header.diagnostics());
      }
    }

    write_all(out, output.data(), output.size(), cancel);
    out.flush();
    if (!out)
      throw CrushError(ErrorKind::Io, "Failed to flush decompressed output");

    status.complete();

    CompressionStats stats;
    stats.algorithm = name;
    stats.operation = AlgorithmOperation::Decompress;
    stats.input_bytes = parsed.encoded_size + payload->size();
    stats.output_bytes = output.size();
    stats.elapsed = std::chrono::steady_clock::now() - start;
    stats.file_metadata = parsed.metadata;

    LOG(LogLevel::INFO, LogComponent::ENGINE_DECOMPRESS,
        "Decompressed " << stats.input_bytes << " -> " << stats.output_bytes
                        << " bytes with '" << name << "'");
    return stats;
  } catch (const CrushError &e) {
    if (e.is_cancellation() && status.begin_cancel()) {
      status.finish_cancel();
      LOG(LogLevel::INFO, LogComponent::ENGINE_DECOMPRESS,
          "Decompression cancelled: " << e.what());
    }
    throw;
  }
}

CompressionStats
CompressionEngine::decompress_file(const std::filesystem::path &input,
                                   const std::filesystem::path &output,
                                   const DecompressionOptions &options,
                                   const FileOptions &file_options) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(input, ec)) {
    throw CrushError(ErrorKind::Io,
                     "Input file not found or not a regular file: " +
                         input.string());
  }
  if (std::filesystem::exists(output, ec) && !file_options.overwrite) {
    throw CrushError(ErrorKind::Io, "Output file already exists: " +
                                        output.string() +
                                        " (use --force to overwrite)");
  }

  std::ifstream in(input, std::ios::binary);
  if (!in.is_open())
    throw CrushError(ErrorKind::Io, "Cannot open input file: " + input.string());

  ResourceTracker tracker;
  const auto partial = partial_path_for(output);
  std::ofstream &staged = tracker.create_temp_file(partial);

  CompressionStats stats = decompress(in, staged, options);
  tracker.close_handles();

  if (options.cancellation)
    check_cancelled(*options.cancellation, "finalisation");

  std::filesystem::rename(partial, output, ec);
  if (ec) {
    throw CrushError(ErrorKind::Io, "Cannot move '" + partial.string() +
                                        "' to '" + output.string() +
                                        "': " + ec.message());
  }
  tracker.register_output(output);
  tracker.mark_complete();
  tracker.cleanup_all();

  if (file_options.preserve_metadata && stats.file_metadata)
    restore_file_metadata(output, *stats.file_metadata);

  return stats;
}

CompressionStats decompress(std::istream &in, std::ostream &out,
                            const DecompressionOptions &options) {
  return CompressionEngine(global_registry()).decompress(in, out, options);
}

} // namespace crush
