#ifndef CRUSH_ENGINE_HPP
#define CRUSH_ENGINE_HPP

#include "cancel/cancellation_token.hpp"
#include "format/header.hpp"
#include "plugin/registry.hpp"
#include "plugin/selector.hpp"
#include "plugin/timeout_supervisor.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace crush {

struct CompressionOptions {
  // Explicit algorithm name; skips scoring
  std::optional<std::string> algorithm_override;
  // Falls back to default_weights() when unset
  std::optional<ScoringWeights> weights;
  // Zero disables the deadline
  std::chrono::milliseconds timeout = TimeoutSupervisor::DEFAULT_TIMEOUT;
  std::shared_ptr<CancellationToken> cancellation;
  // Stored in the header when set and non-empty
  std::optional<FileMetadata> file_metadata;
};

struct DecompressionOptions {
  std::chrono::milliseconds timeout = TimeoutSupervisor::DEFAULT_TIMEOUT;
  std::shared_ptr<CancellationToken> cancellation;
};

// File-level behaviour shared by compress_file and decompress_file.
struct FileOptions {
  bool overwrite = false;
  // Capture mtime/permissions on compression, restore them on decompression
  bool preserve_metadata = true;
};

struct CompressionStats {
  std::string algorithm;
  AlgorithmOperation operation = AlgorithmOperation::Compress;
  uint64_t input_bytes = 0;
  uint64_t output_bytes = 0;
  std::chrono::nanoseconds elapsed{0};
  bool used_fallback = false;
  // Decompression only: metadata found in the header
  std::optional<FileMetadata> file_metadata;

  uint64_t uncompressed_bytes() const;
  uint64_t compressed_bytes() const;

  // compressed/uncompressed
  double ratio() const;
  // Uncompressed bytes per second, in MB/s
  double throughput_mbps() const;
};

struct InspectResult {
  CompressedHeader header;
  // "unknown" when the magic number is not registered
  std::string algorithm;
  bool algorithm_known = false;
  // Payload bytes after the header and metadata block
  uint64_t payload_size = 0;
  // Whole file including header
  uint64_t compressed_size = 0;
  std::optional<FileMetadata> file_metadata;

  double ratio() const;
};

// Totals over several inspected files.
struct InspectSummary {
  size_t files = 0;
  uint64_t original_bytes = 0;
  uint64_t compressed_bytes = 0;
  size_t unknown_algorithms = 0;

  void add(const InspectResult &result);

  // compressed/original over all files
  double ratio() const;
};

// Ties selection, supervised execution and the header format together.
// Holds a reference to the registry; the registry must outlive the engine.
class CompressionEngine {
public:
  explicit CompressionEngine(const PluginRegistry &registry);

  // Reads all of `in`, selects an algorithm, runs it under the timeout
  // supervisor and writes header plus payload to `out`.
  CompressionStats compress(std::istream &in, std::ostream &out,
                            const CompressionOptions &options) const;

  // Routes by the header's magic number. No fallback: the payload can only
  // be decoded by the algorithm that produced it. Verifies size and CRC32.
  CompressionStats decompress(std::istream &in, std::ostream &out,
                              const DecompressionOptions &options) const;

  // Header only, the payload is never decoded.
  InspectResult inspect(std::istream &in) const;

  // Stages output in "<output>.partial" and renames it into place on
  // success. Nothing is left at either path on failure or cancellation.
  CompressionStats compress_file(const std::filesystem::path &input,
                                 const std::filesystem::path &output,
                                 const CompressionOptions &options,
                                 const FileOptions &file_options = {}) const;

  CompressionStats decompress_file(const std::filesystem::path &input,
                                   const std::filesystem::path &output,
                                   const DecompressionOptions &options,
                                   const FileOptions &file_options = {}) const;

  InspectResult inspect_file(const std::filesystem::path &input) const;

private:
  const PluginRegistry &registry_;
};

// Convenience wrappers over the global registry.
CompressionStats compress(std::istream &in, std::ostream &out,
                          const CompressionOptions &options = {});
CompressionStats decompress(std::istream &in, std::ostream &out,
                            const DecompressionOptions &options = {});
InspectResult inspect(std::istream &in);

} // namespace crush

#endif // CRUSH_ENGINE_HPP
