#include "engine/stream_io.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#endif

namespace crush {

void check_cancelled(const CancellationToken &cancel, const char *stage) {
  if (cancel.is_cancelled())
    throw CrushError(ErrorKind::Cancelled,
                     std::string("Operation cancelled during ") + stage);
}

std::vector<uint8_t> read_all(std::istream &in,
                              const CancellationToken &cancel) {
  std::vector<uint8_t> data;
  std::vector<char> chunk(IO_CHUNK_SIZE);
  while (in) {
    check_cancelled(cancel, "input read");
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    std::streamsize got = in.gcount();
    if (got > 0)
      data.insert(data.end(), chunk.data(), chunk.data() + got);
  }
  if (in.bad())
    throw CrushError(ErrorKind::Io, "Failed to read input stream");
  return data;
}

void write_all(std::ostream &out, const uint8_t *data, size_t len,
               const CancellationToken &cancel) {
  size_t offset = 0;
  while (offset < len) {
    check_cancelled(cancel, "output write");
    size_t n = std::min(IO_CHUNK_SIZE, len - offset);
    out.write(reinterpret_cast<const char *>(data + offset),
              static_cast<std::streamsize>(n));
    if (!out)
      throw CrushError(ErrorKind::Io, "Failed to write output stream");
    offset += n;
  }
}

std::filesystem::path partial_path_for(const std::filesystem::path &output) {
  std::filesystem::path partial = output;
  partial += ".partial";
  return partial;
}

FileMetadata capture_file_metadata(const std::filesystem::path &path) {
  FileMetadata metadata;
#ifndef _WIN32
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    LOG(LogLevel::WARN, LogComponent::RESOURCES,
        "Cannot read metadata of '" << path.string()
                                    << "': " << std::strerror(errno));
    return metadata;
  }
  metadata.mtime = static_cast<int64_t>(st.st_mtime);
  metadata.permissions = static_cast<uint32_t>(st.st_mode & 07777);
#else
  (void)path;
#endif
  return metadata;
}

bool restore_file_metadata(const std::filesystem::path &path,
                           const FileMetadata &metadata) {
  bool ok = true;
#ifndef _WIN32
  if (metadata.permissions) {
    if (::chmod(path.c_str(), static_cast<mode_t>(*metadata.permissions)) !=
        0) {
      LOG(LogLevel::WARN, LogComponent::RESOURCES,
          "Failed to restore permissions on '" << path.string()
                                               << "': " << std::strerror(errno));
      ok = false;
    }
  }
  if (metadata.mtime) {
    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT; // leave atime alone
    times[1].tv_sec = static_cast<time_t>(*metadata.mtime);
    times[1].tv_nsec = 0;
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
      LOG(LogLevel::WARN, LogComponent::RESOURCES,
          "Failed to restore mtime on '" << path.string()
                                         << "': " << std::strerror(errno));
      ok = false;
    }
  }
#else
  (void)path;
  (void)metadata;
#endif
  return ok;
}

} // namespace crush
