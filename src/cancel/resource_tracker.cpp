#include "cancel/resource_tracker.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <system_error>

namespace crush {

namespace {
bool remove_if_exists(const std::filesystem::path &path, const char *what) {
  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    LOG(LogLevel::WARN, LogComponent::RESOURCES,
        "Failed to delete " << what << " '" << path.string()
                            << "': " << ec.message());
    return false;
  }
  if (removed) {
    LOG(LogLevel::DEBUG, LogComponent::RESOURCES,
        "Deleted " << what << " '" << path.string() << "'");
  }
  return true;
}
} // namespace

ResourceTracker::~ResourceTracker() {
  if (!cleaned_up_.load())
    cleanup_all();
}

void ResourceTracker::register_output(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_ = path;
  LOG(LogLevel::TRACE, LogComponent::RESOURCES,
      "Tracking output '" << path.string() << "'");
}

void ResourceTracker::register_temp_file(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  temp_files_.push_back(path);
  LOG(LogLevel::TRACE, LogComponent::RESOURCES,
      "Tracking temp file '" << path.string() << "'");
}

std::ofstream &ResourceTracker::open_tracked(const std::filesystem::path &path) {
  auto stream = std::make_unique<std::ofstream>(
      path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!stream->is_open()) {
    throw CrushError(ErrorKind::Io,
                     "Cannot create '" + path.string() + "' for writing");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  handles_.push_back(std::move(stream));
  return *handles_.back();
}

std::ofstream &ResourceTracker::create_output(const std::filesystem::path &path) {
  // Registered before opening so a half-created file is still removed.
  register_output(path);
  return open_tracked(path);
}

std::ofstream &
ResourceTracker::create_temp_file(const std::filesystem::path &path) {
  register_temp_file(path);
  return open_tracked(path);
}

void ResourceTracker::mark_complete() noexcept { complete_.store(true); }

bool ResourceTracker::is_complete() const noexcept { return complete_.load(); }

void ResourceTracker::close_handles() noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &handle : handles_) {
    if (handle && handle->is_open()) {
      handle->flush();
      handle->close();
    }
  }
}

bool ResourceTracker::cleanup_all() noexcept {
  if (cleaned_up_.exchange(true))
    return true;

  close_handles();

  bool ok = true;
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &temp : temp_files_) {
      if (!remove_if_exists(temp, "temp file"))
        ok = false;
    }

    if (!complete_.load() && output_) {
      if (!remove_if_exists(*output_, "incomplete output"))
        ok = false;
    }
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::RESOURCES,
        "Cleanup interrupted: " << e.what());
    ok = false;
  }
  return ok;
}

std::optional<std::filesystem::path> ResourceTracker::output_path() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return output_;
}

std::vector<std::filesystem::path> ResourceTracker::temp_files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return temp_files_;
}

} // namespace crush
