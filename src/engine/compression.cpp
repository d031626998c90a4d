#include "cancel/resource_tracker.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "engine/engine.hpp"
#include "engine/stream_io.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <system_error>

namespace crush {

uint64_t CompressionStats::uncompressed_bytes() const {
  return operation == AlgorithmOperation::Compress ? input_bytes
                                                   : output_bytes;
}

uint64_t CompressionStats::compressed_bytes() const {
  return operation == AlgorithmOperation::Compress ? output_bytes
                                                   : input_bytes;
}

double CompressionStats::ratio() const {
  return Utils::calculate_ratio(uncompressed_bytes(), compressed_bytes());
}

double CompressionStats::throughput_mbps() const {
  double seconds = std::chrono::duration<double>(elapsed).count();
  return Utils::calculate_throughput_mbps(uncompressed_bytes(), seconds);
}

CompressionEngine::CompressionEngine(const PluginRegistry &registry)
    : registry_(registry) {}

CompressionStats
CompressionEngine::compress(std::istream &in, std::ostream &out,
                            const CompressionOptions &options) const {
  CancellationToken local_token;
  const CancellationToken &cancel =
      options.cancellation ? *options.cancellation : local_token;
  OperationStatus status;
  const auto start = std::chrono::steady_clock::now();

  try {
    check_cancelled(cancel, "compression setup");

    auto input = std::make_shared<const std::vector<uint8_t>>(
        read_all(in, cancel));

    PluginSelector selector(registry_,
                            options.weights.value_or(default_weights()));
    Selection selection = selector.select(options.algorithm_override);

    LOG(LogLevel::DEBUG, LogComponent::ENGINE_COMPRESS,
        "Compressing " << input->size() << " bytes with '"
                       << selection.metadata.name << "'");

    TimeoutSupervisor supervisor(options.timeout);
    auto outcome = supervisor.run_with_fallback(
        selection.algorithm, registry_.default_algorithm(),
        AlgorithmOperation::Compress, input, cancel);

    CompressedHeader header;
    header.magic = outcome.algorithm.magic_number;
    header.original_size = input->size();
    header.flags = CompressedHeader::FLAG_HAS_CRC32;
    header.crc32 = compute_crc32(*input);

    check_cancelled(cancel, "header write");
    size_t written = write_header(out, header, options.file_metadata);
    write_all(out, outcome.output.data(), outcome.output.size(), cancel);
    out.flush();
    if (!out)
      throw CrushError(ErrorKind::Io, "Failed to flush compressed output");

    status.complete();

    CompressionStats stats;
    stats.algorithm = outcome.algorithm.name;
    stats.operation = AlgorithmOperation::Compress;
    stats.input_bytes = input->size();
    stats.output_bytes = written + outcome.output.size();
    stats.elapsed = std::chrono::steady_clock::now() - start;
    stats.used_fallback = outcome.used_fallback;

    LOG(LogLevel::INFO, LogComponent::ENGINE_COMPRESS,
        "Compressed " << stats.input_bytes << " -> " << stats.output_bytes
                      << " bytes with '" << stats.algorithm << "'"
                      << (stats.used_fallback ? " (fallback)" : ""));
    return stats;
  } catch (const CrushError &e) {
    if (e.is_cancellation() && status.begin_cancel()) {
      status.finish_cancel();
      LOG(LogLevel::INFO, LogComponent::ENGINE_COMPRESS,
          "Compression cancelled: " << e.what());
    }
    throw;
  }
}

CompressionStats
CompressionEngine::compress_file(const std::filesystem::path &input,
                                 const std::filesystem::path &output,
                                 const CompressionOptions &options,
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

  CompressionOptions effective = options;
  if (file_options.preserve_metadata && !effective.file_metadata)
    effective.file_metadata = capture_file_metadata(input);

  ResourceTracker tracker;
  const auto partial = partial_path_for(output);
  std::ofstream &staged = tracker.create_temp_file(partial);

  CompressionStats stats = compress(in, staged, effective);
  tracker.close_handles();

  // Last chance to honour a cancellation that arrived after the final block.
  if (effective.cancellation)
    check_cancelled(*effective.cancellation, "finalisation");

  std::filesystem::rename(partial, output, ec);
  if (ec) {
    throw CrushError(ErrorKind::Io, "Cannot move '" + partial.string() +
                                        "' to '" + output.string() +
                                        "': " + ec.message());
  }
  tracker.register_output(output);
  tracker.mark_complete();
  tracker.cleanup_all();

  LOG(LogLevel::DEBUG, LogComponent::ENGINE_COMPRESS,
      "Wrote '" << output.string() << "'");
  return stats;
}

CompressionStats compress(std::istream &in, std::ostream &out,
                          const CompressionOptions &options) {
  return CompressionEngine(global_registry()).compress(in, out, options);
}

} // namespace crush
