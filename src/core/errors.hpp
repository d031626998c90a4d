#ifndef CRUSH_ERRORS_HPP
#define CRUSH_ERRORS_HPP

#include <array>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace crush {

enum class ErrorKind {
  AlgorithmNotFound,  // explicit override names an unregistered algorithm
  EmptyRegistry,      // selection with zero registered algorithms
  InvalidWeights,     // negative or all-zero scoring weights
  InvalidMetadata,    // algorithm metadata rejected at registration
  Timeout,            // deadline elapsed inside the supervisor
  WorkerCrashed,      // algorithm threw something other than CrushError
  Cancelled,          // cooperative cancellation observed
  Corruption,         // CRC32 / size mismatch or undecodable payload
  UnrecognizedFormat, // header magic not present in the registry
  InvalidHeader,      // truncated or malformed header
  Io,                 // stream or filesystem failure
  OperationFailed     // any other algorithm failure
};

const char *error_kind_to_string(ErrorKind kind);

// Header fields that were successfully read before an error was raised.
// Kept on decoding errors so callers can report what the file claimed to be.
struct HeaderDiagnostics {
  std::array<uint8_t, 4> magic{};
  uint64_t original_size = 0;
  uint32_t stored_crc32 = 0;
  bool has_crc32 = false;
};

class CrushError : public std::exception {
public:
  CrushError(ErrorKind kind, const std::string &message);
  CrushError(ErrorKind kind, const std::string &message,
             const HeaderDiagnostics &header);

  const char *what() const noexcept override;

  ErrorKind kind() const noexcept { return kind_; }
  const std::optional<HeaderDiagnostics> &header() const noexcept {
    return header_;
  }

  bool is_cancellation() const noexcept {
    return kind_ == ErrorKind::Cancelled;
  }

private:
  ErrorKind kind_;
  std::string message_;
  std::optional<HeaderDiagnostics> header_;
};

// True if `e` is a CrushError of kind Cancelled.
bool is_cancellation(const std::exception &e);

} // namespace crush

#endif // CRUSH_ERRORS_HPP
