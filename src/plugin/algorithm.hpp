#ifndef CRUSH_ALGORITHM_HPP
#define CRUSH_ALGORITHM_HPP

#include "cancel/cancellation_token.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace crush {

using MagicNumber = std::array<uint8_t, 4>;

// Every crush magic number starts with "CR" followed by the format version.
constexpr uint8_t MAGIC_PREFIX_0 = 0x43;
constexpr uint8_t MAGIC_PREFIX_1 = 0x52;
constexpr uint8_t FORMAT_VERSION = 0x01;

// Input granularity at which algorithms poll their cancellation token.
constexpr size_t CANCEL_CHECK_BLOCK_SIZE = 128 * 1024;

// Output limit for callers that do not know the decoded size.
constexpr size_t NO_OUTPUT_LIMIT = static_cast<size_t>(-1);

struct AlgorithmMetadata {
  std::string name;
  std::string version;
  MagicNumber magic_number{};
  double throughput_mbps = 0.0;
  // Fraction of size retained, lower is better
  double compression_ratio = 1.0;
  std::string description;
};

std::string magic_to_string(const MagicNumber &magic);

// Capability surface of a compression algorithm. Implementations must be
// callable concurrently from worker threads, must not touch the filesystem or
// global state, and must poll `cancel` at least once per
// CANCEL_CHECK_BLOCK_SIZE of input, throwing CrushError(Cancelled) once it is
// observed. The in-flight block is always finished first.
//
// decompress() never produces more than `max_output` bytes: once the decoded
// data would exceed it the call throws CrushError(Corruption).
class ICompressionAlgorithm {
public:
  virtual ~ICompressionAlgorithm() = default;

  virtual std::vector<uint8_t> compress(const std::vector<uint8_t> &input,
                                        const CancellationToken &cancel) = 0;

  virtual std::vector<uint8_t> decompress(const std::vector<uint8_t> &input,
                                          size_t max_output,
                                          const CancellationToken &cancel) = 0;

  // Heuristic applicability check over the first bytes of the input.
  virtual bool detect(const uint8_t *data, size_t len) const = 0;

  virtual AlgorithmMetadata metadata() const = 0;
};

using AlgorithmPtr = std::shared_ptr<ICompressionAlgorithm>;

} // namespace crush

#endif // CRUSH_ALGORITHM_HPP
