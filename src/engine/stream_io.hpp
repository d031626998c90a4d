#ifndef CRUSH_STREAM_IO_HPP
#define CRUSH_STREAM_IO_HPP

#include "cancel/cancellation_token.hpp"
#include "format/header.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <vector>

namespace crush {

constexpr size_t IO_CHUNK_SIZE = 128 * 1024;

// Reads `in` to EOF in IO_CHUNK_SIZE pieces, checking `cancel` between
// pieces. Throws Cancelled or Io.
std::vector<uint8_t> read_all(std::istream &in, const CancellationToken &cancel);

// Writes in IO_CHUNK_SIZE pieces, checking `cancel` between pieces.
void write_all(std::ostream &out, const uint8_t *data, size_t len,
               const CancellationToken &cancel);

// Throws CrushError(Cancelled) if the token is set.
void check_cancelled(const CancellationToken &cancel, const char *stage);

std::filesystem::path partial_path_for(const std::filesystem::path &output);

// mtime and permission bits of `path`. Empty metadata if stat fails.
FileMetadata capture_file_metadata(const std::filesystem::path &path);

// Best-effort; failures are logged and reported through the return value.
bool restore_file_metadata(const std::filesystem::path &path,
                           const FileMetadata &metadata);

} // namespace crush

#endif // CRUSH_STREAM_IO_HPP
