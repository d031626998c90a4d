#include "core/errors.hpp"

namespace crush {

const char *error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::AlgorithmNotFound:
    return "AlgorithmNotFound";
  case ErrorKind::EmptyRegistry:
    return "EmptyRegistry";
  case ErrorKind::InvalidWeights:
    return "InvalidWeights";
  case ErrorKind::InvalidMetadata:
    return "InvalidMetadata";
  case ErrorKind::Timeout:
    return "Timeout";
  case ErrorKind::WorkerCrashed:
    return "WorkerCrashed";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::Corruption:
    return "Corruption";
  case ErrorKind::UnrecognizedFormat:
    return "UnrecognizedFormat";
  case ErrorKind::InvalidHeader:
    return "InvalidHeader";
  case ErrorKind::Io:
    return "Io";
  case ErrorKind::OperationFailed:
    return "OperationFailed";
  }
  return "Unknown";
}

CrushError::CrushError(ErrorKind kind, const std::string &message)
    : kind_(kind), message_(message) {}

CrushError::CrushError(ErrorKind kind, const std::string &message,
                       const HeaderDiagnostics &header)
    : kind_(kind), message_(message), header_(header) {}

const char *CrushError::what() const noexcept { return message_.c_str(); }

bool is_cancellation(const std::exception &e) {
  const auto *crush_error = dynamic_cast<const CrushError *>(&e);
  return crush_error != nullptr && crush_error->is_cancellation();
}

} // namespace crush
