#ifndef CRUSH_RESOURCE_TRACKER_HPP
#define CRUSH_RESOURCE_TRACKER_HPP

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace crush {

// Tracks the files an operation creates so that an incomplete operation never
// leaves partial output behind. Temp files are always removed by cleanup; the
// output file is removed only if mark_complete() was never called. Handles are
// closed before anything is deleted. If cleanup_all() has not run when the
// tracker is destroyed, the destructor runs it.
class ResourceTracker {
public:
  ResourceTracker() = default;
  ~ResourceTracker();

  ResourceTracker(const ResourceTracker &) = delete;
  ResourceTracker &operator=(const ResourceTracker &) = delete;

  void register_output(const std::filesystem::path &path);
  void register_temp_file(const std::filesystem::path &path);

  // Opens `path` for binary writing (truncating), registers it and keeps the
  // handle so cleanup can close it. Throws CrushError(Io) on failure.
  std::ofstream &create_output(const std::filesystem::path &path);
  std::ofstream &create_temp_file(const std::filesystem::path &path);

  void mark_complete() noexcept;
  bool is_complete() const noexcept;

  // Flushes and closes every handle opened through this tracker.
  void close_handles() noexcept;

  // Best-effort: closes handles, deletes temp files, then deletes the output
  // if incomplete. Failures are logged. Returns false if any deletion failed.
  // Subsequent calls are no-ops returning true.
  bool cleanup_all() noexcept;

  bool cleaned_up() const noexcept { return cleaned_up_.load(); }

  std::optional<std::filesystem::path> output_path() const;
  std::vector<std::filesystem::path> temp_files() const;

private:
  std::ofstream &open_tracked(const std::filesystem::path &path);

  mutable std::mutex mutex_;
  std::optional<std::filesystem::path> output_;
  std::vector<std::filesystem::path> temp_files_;
  std::vector<std::unique_ptr<std::ofstream>> handles_;
  std::atomic<bool> complete_{false};
  std::atomic<bool> cleaned_up_{false};
};

} // namespace crush

#endif // CRUSH_RESOURCE_TRACKER_HPP
